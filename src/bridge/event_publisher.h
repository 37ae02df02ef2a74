#pragma once

#include <player/player_types.h>
#include <QString>
#include <cstdint>

namespace bus { class IMessageBusClient; }

namespace bridge {

struct OutboundMessage {
    QString topicSuffix;
    QString payload;
};

/**
 * EventPublisher
 * Encodes player lifecycle notifications as state messages. Each entry point
 * publishes exactly one message immediately; nothing is buffered, coalesced
 * or retried here.
 */
class EventPublisher
{
public:
    EventPublisher(bus::IMessageBusClient& bus, const QString& stateTopicPrefix, bool retain);

    void onPlaybackStateChanged(player::PlaybackState oldState, player::PlaybackState newState);
    void onTrackPlaybackStarted(const player::TrackInfo& track);
    void onTrackPlaybackEnded(const player::TrackInfo& track, int64_t timePositionMs);
    void onVolumeChanged(int volume);
    void onStreamTitleChanged(const QString& title);

    // Answers to "inf" queries
    void publishState(player::PlaybackState state);
    void publishVolume(int volume);

    QString topicFor(const QString& topicSuffix) const;

private:
    void send(const OutboundMessage& message);

    bus::IMessageBusClient& m_bus;
    QString m_stateTopicPrefix;
    bool m_retain;
};

} // namespace bridge
