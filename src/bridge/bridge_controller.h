#pragma once

#include <bus/i_message_bus_client.h>
#include <QObject>
#include <QString>
#include <QVariantHash>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace player { class IPlayerFacade; }

namespace bridge {

class ActionDispatcher;
class BridgeEventProcessor;
class EventPublisher;

struct BridgeSettings {
    bus::BrokerSettings broker;
    QString commandTopic = QStringLiteral("mopidy/c");  // Inbound: <commandTopic>/<action code>
    QString stateTopic = QStringLiteral("mopidy/i");    // Outbound: <stateTopic>/<state code>
    bool retainState = true;
};

enum class BridgeState {
    Stopped = 0,
    Starting = 1,
    Running = 2,
    Stopping = 3
};

/**
 * BridgeController
 * Owns the bus connection for the lifetime of a run and wires both directions:
 * bus -> processor -> ActionDispatcher -> player, and
 * player events -> processor -> EventPublisher -> bus.
 *
 * The controller never restarts itself. An unrecoverable failure is reported
 * through failed() and the controller stops; whoever owns it decides what next.
 */
class BridgeController : public QObject
{
    Q_OBJECT
public:
    BridgeController(player::IPlayerFacade& player,
                     bus::IMessageBusClient& bus,
                     const BridgeSettings& settings,
                     QObject* parent = nullptr);
    ~BridgeController() override;

    // Only valid from Stopped. Returns false if the controller was not stopped
    // or if any step of the startup failed (the controller is stopped again).
    bool start();
    // Idempotent. When another thread is already stopping the bridge, waits
    // until it reaches Stopped; from the processor thread it returns at once.
    void stop();

    BridgeState state() const { return m_state.load(); }
    bool isRunning() const { return state() == BridgeState::Running; }

    const BridgeSettings& settings() const { return m_settings; }
    QString commandPattern() const;

    // Waits until all queued work has been executed
    bool waitForIdle(std::chrono::milliseconds timeout);

signals:
    void stateChanged(bridge::BridgeState state);
    void failed(const QString& reason);

private:
    void registerEventHandlers();
    void subscribePlayerEvents();
    void unsubscribePlayerEvents();
    void setState(BridgeState state);
    void waitUntilStopped();
    void onInboundMessage(const QString& topic, const QByteArray& payload);
    void onFailure(const QString& reason);

private: // Event handlers (serialized execution)
    void onInboundMessageEvent(const QVariantHash& data);
    void onPlaybackStateChangedEvent(const QVariantHash& data);
    void onTrackPlaybackStartedEvent(const QVariantHash& data);
    void onTrackPlaybackEndedEvent(const QVariantHash& data);
    void onVolumeChangedEvent(const QVariantHash& data);
    void onStreamTitleChangedEvent(const QVariantHash& data);

private:
    player::IPlayerFacade& m_player;
    bus::IMessageBusClient& m_bus;
    BridgeSettings m_settings;

    std::unique_ptr<EventPublisher> m_publisher;
    std::unique_ptr<ActionDispatcher> m_dispatcher;
    std::unique_ptr<BridgeEventProcessor> m_eventProcessor;

    // Identity token for EventBus subscriptions; reset on stop
    std::shared_ptr<int> m_subscriptionToken;

    std::atomic<BridgeState> m_state{BridgeState::Stopped};
    std::mutex m_stateMutex;
    std::condition_variable m_stoppedCondition;
};

} // namespace bridge

Q_DECLARE_METATYPE(bridge::BridgeState)
