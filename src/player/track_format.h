#pragma once

#include "player_types.h"
#include <QString>

namespace player
{
    /**
     * Wire payloads for the "trk" state topic.
     *
     * Both functions produce a compact JSON object
     *   {"name": ..., "artist": ..., "album": ..., "uri": ...}
     * with artists joined by ", ". An empty track or title yields "".
     */
    QString describeTrack(const TrackInfo& track);

    // Splits "Artist - Title" on the first " - "; without a separator the whole
    // title becomes the name.
    QString describeStream(const QString& title);
}
