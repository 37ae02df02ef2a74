#pragma once

#include <QString>
#include <QStringList>
#include <QMetaType>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace player
{
    enum class PlaybackState {
        Stopped = 0,
        Playing = 1,
        Paused = 2
    };

    constexpr int kVolumeMin = 0;
    constexpr int kVolumeMax = 100;

    inline int clampVolume(long long value)
    {
        return static_cast<int>(std::clamp<long long>(value, kVolumeMin, kVolumeMax));
    }

    // Wire form used on the state topic: "stopped", "playing", "paused"
    inline QString playbackStateName(PlaybackState state)
    {
        switch (state) {
            case PlaybackState::Playing:
                return QStringLiteral("playing");
            case PlaybackState::Paused:
                return QStringLiteral("paused");
            case PlaybackState::Stopped:
            default:
                return QStringLiteral("stopped");
        }
    }

    struct TrackInfo {
        QString name;        // Track title
        QString uri;         // Player-side identifier, e.g. "spotify:track:..." or a stream URL
        QStringList artists; // Artist names in player order
        QString album;       // Album name, empty if unknown
        bool operator==(const TrackInfo& other) const {
            return uri == other.uri && name == other.name;
        }
        bool isEmpty() const { return name.isEmpty() && uri.isEmpty(); }
    };

    /**
     * Thrown by IPlayerFacade implementations when a remote call fails or times out.
     * Fatal to the current dispatch only.
     */
    class PlayerError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };
}

Q_DECLARE_METATYPE(player::TrackInfo)
Q_DECLARE_METATYPE(player::PlaybackState)
