#pragma once

#include "player_types.h"
#include <QString>
#include <memory>

class EventBus;

namespace player
{
    /**
     * @brief Control surface of the media player consumed by the bridge.
     *
     * Every call is blocking and may throw PlayerError; timeout policy belongs
     * to the implementation. Lifecycle events (see player_events.h) are posted
     * on the bus returned by events().
     */
    class IPlayerFacade
    {
    public:
        virtual ~IPlayerFacade() = default;

        // Playback control
        virtual void play() = 0;
        virtual void stop() = 0;
        virtual void pause() = 0;
        virtual void resume() = 0;
        virtual void previous() = 0;
        virtual void next() = 0;

        // Status
        virtual PlaybackState state() = 0;

        // Volume, 0 to 100
        virtual int volume() = 0;
        virtual void setVolume(int volume) = 0;

        // Queue
        virtual void addToQueue(const QString& uri) = 0;
        virtual void clearQueue() = 0;

        virtual std::shared_ptr<EventBus> events() const = 0;
    };
}
