#pragma once

#include <player/i_player_facade.h>
#include <player/player_events.h>
#include <event/event_bus.hpp>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <mutex>
#include <stdexcept>

namespace test_player {

/**
 * In-memory IPlayerFacade. Records every call as a string ("play",
 * "setVolume:42", "addToQueue:uri", ...) and can be told to fail the next
 * call with PlayerError or std::runtime_error.
 */
class FakePlayer : public player::IPlayerFacade
{
public:
    enum class FailureMode { None, PlayerError, Unexpected };

    FakePlayer() : m_events(EventBus::Create()) {}

    void play() override { record("play"); setState(player::PlaybackState::Playing); }
    void stop() override { record("stop"); setState(player::PlaybackState::Stopped); }
    void pause() override { record("pause"); setState(player::PlaybackState::Paused); }
    void resume() override { record("resume"); setState(player::PlaybackState::Playing); }
    void previous() override { record("previous"); }
    void next() override { record("next"); }

    player::PlaybackState state() override
    {
        std::scoped_lock locker(m_mutex);
        maybeFail();
        return m_state;
    }

    int volume() override
    {
        std::scoped_lock locker(m_mutex);
        maybeFail();
        return m_volume;
    }

    void setVolume(int volume) override
    {
        record(QString("setVolume:%1").arg(volume));
        std::scoped_lock locker(m_mutex);
        m_volume = volume;
    }

    void addToQueue(const QString& uri) override
    {
        record("addToQueue:" + uri);
        std::scoped_lock locker(m_mutex);
        m_queue.append(uri);
    }

    void clearQueue() override
    {
        record("clearQueue");
        std::scoped_lock locker(m_mutex);
        m_queue.clear();
    }

    std::shared_ptr<EventBus> events() const override { return m_events; }

    // Test controls
    void setState(player::PlaybackState state) { std::scoped_lock locker(m_mutex); m_state = state; }
    void setCurrentVolume(int volume) { std::scoped_lock locker(m_mutex); m_volume = volume; }
    void failNextCall(FailureMode mode) { std::scoped_lock locker(m_mutex); m_failure = mode; }

    QStringList calls() const { std::scoped_lock locker(m_mutex); return m_calls; }
    QStringList queue() const { std::scoped_lock locker(m_mutex); return m_queue; }
    int currentVolume() const { std::scoped_lock locker(m_mutex); return m_volume; }
    void clearCalls() { std::scoped_lock locker(m_mutex); m_calls.clear(); }

    // Lifecycle events, as a real player would post them
    void emitStateChanged(player::PlaybackState oldState, player::PlaybackState newState)
    {
        m_events->Post(player::PlaybackStateChangedEvent{oldState, newState});
    }
    void emitTrackStarted(const player::TrackInfo& track)
    {
        m_events->Post(player::TrackPlaybackStartedEvent{track});
    }
    void emitTrackEnded(const player::TrackInfo& track, int64_t positionMs)
    {
        m_events->Post(player::TrackPlaybackEndedEvent{track, positionMs});
    }
    void emitVolumeChanged(int volume)
    {
        m_events->Post(player::VolumeChangedEvent{volume});
    }
    void emitStreamTitleChanged(const QString& title)
    {
        m_events->Post(player::StreamTitleChangedEvent{title});
    }

private:
    void record(const QString& call)
    {
        std::scoped_lock locker(m_mutex);
        maybeFail();
        m_calls.append(call);
    }

    // Caller holds m_mutex
    void maybeFail()
    {
        FailureMode mode = m_failure;
        m_failure = FailureMode::None;
        if (mode == FailureMode::PlayerError) {
            throw player::PlayerError("player did not answer");
        }
        if (mode == FailureMode::Unexpected) {
            throw std::runtime_error("player returned garbage");
        }
    }

    mutable std::mutex m_mutex;
    std::shared_ptr<EventBus> m_events;
    player::PlaybackState m_state = player::PlaybackState::Stopped;
    int m_volume = 50;
    QStringList m_calls;
    QStringList m_queue;
    FailureMode m_failure = FailureMode::None;
};

} // namespace test_player
