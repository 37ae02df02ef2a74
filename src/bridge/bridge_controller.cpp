#include "bridge_controller.h"
#include "action_dispatcher.h"
#include "bridge_event_processor.h"
#include "event_publisher.h"

#include <event/event_bus.hpp>
#include <log/log_manager.h>
#include <player/i_player_facade.h>
#include <player/player_events.h>
#include <magic_enum/magic_enum.hpp>

namespace bridge {

namespace {
QString trimmedTopic(QString topic)
{
    while (topic.endsWith(QLatin1Char('/'))) {
        topic.chop(1);
    }
    return topic;
}
}

BridgeController::BridgeController(player::IPlayerFacade& player,
                                   bus::IMessageBusClient& bus,
                                   const BridgeSettings& settings,
                                   QObject* parent)
    : QObject(parent)
    , m_player(player)
    , m_bus(bus)
    , m_settings(settings)
    , m_eventProcessor(std::make_unique<BridgeEventProcessor>())
{
    qRegisterMetaType<bridge::BridgeState>("bridge::BridgeState");
    m_settings.commandTopic = trimmedTopic(m_settings.commandTopic);
    m_settings.stateTopic = trimmedTopic(m_settings.stateTopic);

    m_publisher = std::make_unique<EventPublisher>(m_bus, m_settings.stateTopic, m_settings.retainState);
    m_dispatcher = std::make_unique<ActionDispatcher>(m_player, *m_publisher);

    registerEventHandlers();
    // Raised on the processor thread; stop() copes with being called there
    connect(m_eventProcessor.get(), &BridgeEventProcessor::processingError,
            this, [this](const QString& error) { onFailure(error); },
            Qt::DirectConnection);
    LOG_DEBUG("BridgeController created, commands on {}, state on {}",
              m_settings.commandTopic.toStdString(), m_settings.stateTopic.toStdString());
}

BridgeController::~BridgeController()
{
    stop();
    // Joins a worker that stopped the bridge itself and may still be unwinding
    m_eventProcessor->stop();
    // Handlers reference the publisher and dispatcher
    m_eventProcessor.reset();
    LOG_DEBUG("BridgeController destroyed");
}

QString BridgeController::commandPattern() const
{
    return m_settings.commandTopic + QStringLiteral("/+");
}

bool BridgeController::start()
{
    BridgeState expected = BridgeState::Stopped;
    if (!m_state.compare_exchange_strong(expected, BridgeState::Starting)) {
        LOG_WARN("Cannot start bridge in state {}", magic_enum::enum_name(expected));
        return false;
    }
    emit stateChanged(BridgeState::Starting);
    LOG_INFO("Starting bridge");

    try {
        m_eventProcessor->start();
        m_bus.connectToBroker(m_settings.broker);
        m_bus.subscribe(commandPattern(), [this](const QString& topic, const QByteArray& payload) {
            onInboundMessage(topic, payload);
        });
        subscribePlayerEvents();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start bridge: {}", e.what());
        stop();
        return false;
    }

    expected = BridgeState::Starting;
    if (!m_state.compare_exchange_strong(expected, BridgeState::Running)) {
        // stop() was called while starting up
        LOG_WARN("Bridge stopped during startup");
        return false;
    }
    emit stateChanged(BridgeState::Running);
    LOG_INFO("Bridge running, listening on {}", commandPattern().toStdString());
    return true;
}

void BridgeController::stop()
{
    BridgeState current = m_state.load();
    do {
        if (current == BridgeState::Stopped) {
            return;
        }
        if (current == BridgeState::Stopping) {
            waitUntilStopped();
            return;
        }
    } while (!m_state.compare_exchange_weak(current, BridgeState::Stopping));
    emit stateChanged(BridgeState::Stopping);
    LOG_INFO("Stopping bridge");

    unsubscribePlayerEvents();
    try {
        m_bus.unsubscribe(commandPattern());
        m_bus.disconnectFromBroker();
    } catch (const std::exception& e) {
        LOG_WARN("Error while disconnecting from broker: {}", e.what());
    }
    m_eventProcessor->stop();

    setState(BridgeState::Stopped);
    LOG_INFO("Bridge stopped");
}

bool BridgeController::waitForIdle(std::chrono::milliseconds timeout)
{
    return m_eventProcessor->waitForIdle(timeout);
}

void BridgeController::setState(BridgeState state)
{
    {
        std::scoped_lock locker(m_stateMutex);
        m_state.store(state);
    }
    m_stoppedCondition.notify_all();
    emit stateChanged(state);
}

void BridgeController::waitUntilStopped()
{
    // The processor thread is either the one stopping or is being joined by it
    if (m_eventProcessor->isProcessorThread()) {
        return;
    }
    std::unique_lock<std::mutex> locker(m_stateMutex);
    m_stoppedCondition.wait(locker, [this] { return m_state.load() == BridgeState::Stopped; });
}

void BridgeController::registerEventHandlers()
{
    m_eventProcessor->setEventHandler(BridgeEventProcessor::INBOUND_MESSAGE,
        [this](const QVariantHash& data) { onInboundMessageEvent(data); });
    m_eventProcessor->setEventHandler(BridgeEventProcessor::PLAYBACK_STATE_CHANGED,
        [this](const QVariantHash& data) { onPlaybackStateChangedEvent(data); });
    m_eventProcessor->setEventHandler(BridgeEventProcessor::TRACK_PLAYBACK_STARTED,
        [this](const QVariantHash& data) { onTrackPlaybackStartedEvent(data); });
    m_eventProcessor->setEventHandler(BridgeEventProcessor::TRACK_PLAYBACK_ENDED,
        [this](const QVariantHash& data) { onTrackPlaybackEndedEvent(data); });
    m_eventProcessor->setEventHandler(BridgeEventProcessor::VOLUME_CHANGED,
        [this](const QVariantHash& data) { onVolumeChangedEvent(data); });
    m_eventProcessor->setEventHandler(BridgeEventProcessor::STREAM_TITLE_CHANGED,
        [this](const QVariantHash& data) { onStreamTitleChangedEvent(data); });
}

void BridgeController::subscribePlayerEvents()
{
    std::shared_ptr<EventBus> events = m_player.events();
    if (!events) {
        LOG_WARN("Player exposes no event bus, state topics will stay silent");
        return;
    }
    m_subscriptionToken = std::make_shared<int>(0);
    BridgeEventProcessor* processor = m_eventProcessor.get();

    events->Subscribe<player::PlaybackStateChangedEvent>(m_subscriptionToken,
        [this, processor](const player::PlaybackStateChangedEvent& e) {
            if (!isRunning()) return true;
            processor->postEvent(BridgeEventProcessor::PLAYBACK_STATE_CHANGED, QVariantHash{
                {"oldState", QVariant::fromValue(e.oldState)},
                {"newState", QVariant::fromValue(e.newState)}
            });
            return true;
        });
    events->Subscribe<player::TrackPlaybackStartedEvent>(m_subscriptionToken,
        [this, processor](const player::TrackPlaybackStartedEvent& e) {
            if (!isRunning()) return true;
            processor->postEvent(BridgeEventProcessor::TRACK_PLAYBACK_STARTED, QVariantHash{
                {"track", QVariant::fromValue(e.track)}
            });
            return true;
        });
    events->Subscribe<player::TrackPlaybackEndedEvent>(m_subscriptionToken,
        [this, processor](const player::TrackPlaybackEndedEvent& e) {
            if (!isRunning()) return true;
            processor->postEvent(BridgeEventProcessor::TRACK_PLAYBACK_ENDED, QVariantHash{
                {"track", QVariant::fromValue(e.track)},
                {"timePosition", QVariant::fromValue<qint64>(e.timePositionMs)}
            });
            return true;
        });
    events->Subscribe<player::VolumeChangedEvent>(m_subscriptionToken,
        [this, processor](const player::VolumeChangedEvent& e) {
            if (!isRunning()) return true;
            processor->postEvent(BridgeEventProcessor::VOLUME_CHANGED, QVariantHash{
                {"volume", e.volume}
            });
            return true;
        });
    events->Subscribe<player::StreamTitleChangedEvent>(m_subscriptionToken,
        [this, processor](const player::StreamTitleChangedEvent& e) {
            if (!isRunning()) return true;
            processor->postEvent(BridgeEventProcessor::STREAM_TITLE_CHANGED, QVariantHash{
                {"title", e.title}
            });
            return true;
        });
    LOG_DEBUG("Subscribed to player events on bus #{}", events->GetId());
}

void BridgeController::unsubscribePlayerEvents()
{
    if (!m_subscriptionToken)
        return;
    if (std::shared_ptr<EventBus> events = m_player.events()) {
        std::weak_ptr<void> token = m_subscriptionToken;
        events->Unsubscribe<player::PlaybackStateChangedEvent>(token);
        events->Unsubscribe<player::TrackPlaybackStartedEvent>(token);
        events->Unsubscribe<player::TrackPlaybackEndedEvent>(token);
        events->Unsubscribe<player::VolumeChangedEvent>(token);
        events->Unsubscribe<player::StreamTitleChangedEvent>(token);
    }
    m_subscriptionToken.reset();
}

void BridgeController::onInboundMessage(const QString& topic, const QByteArray& payload)
{
    if (!isRunning()) {
        LOG_DEBUG("Bridge not running, dropping message on {}", topic.toStdString());
        return;
    }
    m_eventProcessor->postEvent(BridgeEventProcessor::INBOUND_MESSAGE, QVariantHash{
        {"topic", topic},
        {"payload", payload}
    });
}

void BridgeController::onFailure(const QString& reason)
{
    if (state() == BridgeState::Stopped) {
        return;
    }
    LOG_ERROR("Bridge failed: {}", reason.toStdString());
    emit failed(reason);
    stop();
}

void BridgeController::onInboundMessageEvent(const QVariantHash& data)
{
    if (!isRunning()) return;
    QString topic = data.value("topic").toString();
    QByteArray payload = data.value("payload").toByteArray();

    QString prefix = m_settings.commandTopic + QLatin1Char('/');
    if (!topic.startsWith(prefix)) {
        LOG_WARN("Message on unexpected topic {}", topic.toStdString());
        return;
    }
    QString suffix = topic.mid(prefix.size());
    DispatchResult result = m_dispatcher->dispatch(suffix, payload);
    if (result == DispatchResult::Failed) {
        onFailure(QStringLiteral("unrecoverable error while handling %1").arg(topic));
    }
}

void BridgeController::onPlaybackStateChangedEvent(const QVariantHash& data)
{
    if (!isRunning()) return;
    m_publisher->onPlaybackStateChanged(data.value("oldState").value<player::PlaybackState>(),
                                        data.value("newState").value<player::PlaybackState>());
}

void BridgeController::onTrackPlaybackStartedEvent(const QVariantHash& data)
{
    if (!isRunning()) return;
    m_publisher->onTrackPlaybackStarted(data.value("track").value<player::TrackInfo>());
}

void BridgeController::onTrackPlaybackEndedEvent(const QVariantHash& data)
{
    if (!isRunning()) return;
    m_publisher->onTrackPlaybackEnded(data.value("track").value<player::TrackInfo>(),
                                      data.value("timePosition").toLongLong());
}

void BridgeController::onVolumeChangedEvent(const QVariantHash& data)
{
    if (!isRunning()) return;
    m_publisher->onVolumeChanged(data.value("volume").toInt());
}

void BridgeController::onStreamTitleChangedEvent(const QVariantHash& data)
{
    if (!isRunning()) return;
    m_publisher->onStreamTitleChanged(data.value("title").toString());
}

} // namespace bridge
