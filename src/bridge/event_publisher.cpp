#include "event_publisher.h"
#include "command.h"

#include <bus/i_message_bus_client.h>
#include <log/log_manager.h>
#include <player/track_format.h>
#include <magic_enum/magic_enum.hpp>

namespace bridge {

EventPublisher::EventPublisher(bus::IMessageBusClient& bus, const QString& stateTopicPrefix, bool retain)
    : m_bus(bus)
    , m_stateTopicPrefix(stateTopicPrefix)
    , m_retain(retain)
{
    while (m_stateTopicPrefix.endsWith(QLatin1Char('/'))) {
        m_stateTopicPrefix.chop(1);
    }
}

QString EventPublisher::topicFor(const QString& topicSuffix) const
{
    return m_stateTopicPrefix + QLatin1Char('/') + topicSuffix;
}

void EventPublisher::send(const OutboundMessage& message)
{
    m_bus.publish(topicFor(message.topicSuffix), message.payload.toUtf8(), m_retain);
}

void EventPublisher::onPlaybackStateChanged(player::PlaybackState oldState, player::PlaybackState newState)
{
    LOG_DEBUG("Playback state changed: {} -> {}", magic_enum::enum_name(oldState), magic_enum::enum_name(newState));
    send({topic::PlaybackState, player::playbackStateName(newState)});
}

void EventPublisher::onTrackPlaybackStarted(const player::TrackInfo& track)
{
    LOG_DEBUG("Track started: {}", track.uri.toStdString());
    send({topic::Track, player::describeTrack(track)});
}

void EventPublisher::onTrackPlaybackEnded(const player::TrackInfo& track, int64_t timePositionMs)
{
    LOG_DEBUG("Track ended: {} at {} ms", track.name.toStdString(), timePositionMs);
    // Empty payload clears the "now playing" display
    send({topic::Track, QString()});
}

void EventPublisher::onVolumeChanged(int volume)
{
    LOG_DEBUG("Volume changed: {}", volume);
    send({topic::Volume, QString::number(volume)});
}

void EventPublisher::onStreamTitleChanged(const QString& title)
{
    LOG_DEBUG("Stream title changed: {}", title.toStdString());
    send({topic::Track, player::describeStream(title)});
}

void EventPublisher::publishState(player::PlaybackState state)
{
    send({topic::PlaybackState, player::playbackStateName(state)});
}

void EventPublisher::publishVolume(int volume)
{
    send({topic::Volume, QString::number(volume)});
}

} // namespace bridge
