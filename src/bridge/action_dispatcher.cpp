#include "action_dispatcher.h"
#include "command.h"
#include "event_publisher.h"

#include <log/log_manager.h>
#include <player/i_player_facade.h>
#include <magic_enum/magic_enum.hpp>

namespace bridge {

ActionDispatcher::ActionDispatcher(player::IPlayerFacade& player, EventPublisher& publisher)
    : m_player(player)
    , m_publisher(publisher)
{
    registerHandlers();
}

void ActionDispatcher::registerHandlers()
{
    m_handlers.insert(action::Playback, [this](const QString& v) { return onPlaybackAction(v); });
    m_handlers.insert(action::Volume, [this](const QString& v) { return onVolumeAction(v); });
    m_handlers.insert(action::Add, [this](const QString& v) { return onAddAction(v); });
    m_handlers.insert(action::Clear, [this](const QString& v) { return onClearAction(v); });
    m_handlers.insert(action::Load, [this](const QString& v) { return onLoadAction(v); });
    m_handlers.insert(action::Search, [this](const QString& v) { return onSearchAction(v); });
    m_handlers.insert(action::Info, [this](const QString& v) { return onInfoAction(v); });
    LOG_DEBUG("Registered {} action handlers", m_handlers.size());
}

DispatchResult ActionDispatcher::dispatch(const QString& topicSuffix, const QByteArray& payload)
{
    DispatchResult result = DispatchResult::Failed;
    try {
        std::optional<Command> command = Command::decode(topicSuffix, payload);
        auto handlerIt = command ? m_handlers.constFind(command->name) : m_handlers.constEnd();
        if (handlerIt == m_handlers.constEnd()) {
            LOG_WARN("Unknown action: {}", topicSuffix.toStdString());
            return DispatchResult::UnknownAction;
        }
        LOG_DEBUG("Dispatching {} '{}'", command->name.toStdString(), command->rawValue.toStdString());
        result = handlerIt.value()(command->rawValue);
    } catch (const NotImplementedError& e) {
        LOG_WARN("Action {} not implemented: {}", topicSuffix.toStdString(), e.what());
        result = DispatchResult::NotImplemented;
    } catch (const player::PlayerError& e) {
        LOG_ERROR("Player call failed during {}: {}", topicSuffix.toStdString(), e.what());
        result = DispatchResult::PlayerFailure;
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error during {}: {}", topicSuffix.toStdString(), e.what());
        result = DispatchResult::Failed;
    }
    LOG_TRACE("Dispatch of {} finished: {}", topicSuffix.toStdString(), magic_enum::enum_name(result));
    return result;
}

DispatchResult ActionDispatcher::onPlaybackAction(const QString& value)
{
    if (value == QLatin1String("play")) {
        m_player.play();
    } else if (value == QLatin1String("stop")) {
        m_player.stop();
    } else if (value == QLatin1String("pause")) {
        m_player.pause();
    } else if (value == QLatin1String("resume")) {
        m_player.resume();
    } else if (value == QLatin1String("toggle")) {
        switch (m_player.state()) {
        case player::PlaybackState::Playing:
            m_player.pause();
            break;
        case player::PlaybackState::Paused:
            m_player.resume();
            break;
        case player::PlaybackState::Stopped:
            m_player.play();
            break;
        }
    } else if (value == QLatin1String("prev")) {
        m_player.previous();
    } else if (value == QLatin1String("next")) {
        m_player.next();
    } else {
        LOG_WARN("Unknown playback control action: {}", value.toStdString());
        return DispatchResult::Rejected;
    }
    return DispatchResult::Handled;
}

DispatchResult ActionDispatcher::onVolumeAction(const QString& value)
{
    VolumeAdjustment::ParseError error = VolumeAdjustment::ParseError::TooShort;
    std::optional<VolumeAdjustment> adjustment = VolumeAdjustment::parse(value, &error);
    if (!adjustment) {
        switch (error) {
        case VolumeAdjustment::ParseError::TooShort:
            LOG_WARN("Invalid volume control parameter: {}", value.toStdString());
            break;
        case VolumeAdjustment::ParseError::InvalidAmount:
            LOG_WARN("Invalid volume setting value: {}", value.mid(1).toStdString());
            break;
        case VolumeAdjustment::ParseError::UnknownOperator:
            LOG_WARN("Unknown volume control operator: {}", value.left(1).toStdString());
            break;
        }
        return DispatchResult::Rejected;
    }

    int current = 0;
    if (adjustment->op != VolumeAdjustment::Operator::Set) {
        current = m_player.volume();
    }
    int target = adjustment->apply(current);
    LOG_DEBUG("Setting volume to {}", target);
    m_player.setVolume(target);
    return DispatchResult::Handled;
}

DispatchResult ActionDispatcher::onAddAction(const QString& value)
{
    if (value.isEmpty()) {
        LOG_WARN("Cannot add empty track to queue");
        return DispatchResult::Rejected;
    }
    m_player.addToQueue(value);
    return DispatchResult::Handled;
}

DispatchResult ActionDispatcher::onClearAction(const QString&)
{
    m_player.clearQueue();
    return DispatchResult::Handled;
}

// No playlist contract exists yet, so the queue is left untouched
DispatchResult ActionDispatcher::onLoadAction(const QString& value)
{
    if (value.isEmpty()) {
        LOG_WARN("Cannot load unnamed playlist");
        return DispatchResult::Rejected;
    }
    throw NotImplementedError("loading playlist " + value.toStdString());
}

DispatchResult ActionDispatcher::onSearchAction(const QString& value)
{
    if (value.isEmpty()) {
        LOG_WARN("Cannot search without a query");
        return DispatchResult::Rejected;
    }
    throw NotImplementedError("library search for " + value.toStdString());
}

DispatchResult ActionDispatcher::onInfoAction(const QString& value)
{
    if (value == QLatin1String("state")) {
        m_publisher.publishState(m_player.state());
        return DispatchResult::Handled;
    }
    if (value == QLatin1String("volume")) {
        m_publisher.publishVolume(m_player.volume());
        return DispatchResult::Handled;
    }
    if (value == QLatin1String("queue")) {
        throw NotImplementedError("queue information");
    }
    LOG_WARN("Unknown information request: {}", value.toStdString());
    return DispatchResult::Rejected;
}

} // namespace bridge
