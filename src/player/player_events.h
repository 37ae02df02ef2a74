#pragma once

#include "player_types.h"
#include <QString>
#include <cstdint>

// Lifecycle notifications posted by an IPlayerFacade on its EventBus.
namespace player
{
    struct PlaybackStateChangedEvent {
        PlaybackState oldState = PlaybackState::Stopped;
        PlaybackState newState = PlaybackState::Stopped;
    };

    struct TrackPlaybackStartedEvent {
        TrackInfo track;
    };

    struct TrackPlaybackEndedEvent {
        TrackInfo track;
        int64_t timePositionMs = 0;
    };

    struct VolumeChangedEvent {
        int volume = 0;
    };

    struct StreamTitleChangedEvent {
        QString title;
    };
}
