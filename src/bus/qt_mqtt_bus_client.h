#pragma once

#include "i_message_bus_client.h"
#include <QObject>
#include <QHash>
#include <QString>
#include <functional>
#include <mutex>

class QMqttClient;
class QMqttSubscription;
class QTimer;

namespace bus
{
/**
 * IMessageBusClient on top of QMqttClient.
 * The QMqttClient lives on the thread that owns this object; calls made from
 * other threads are queued onto it.
 */
class QtMqttBusClient : public QObject, public IMessageBusClient
{
    Q_OBJECT
public:
    explicit QtMqttBusClient(QObject* parent = nullptr);
    // reconnectIntervalMs <= 0 disables automatic reconnects
    QtMqttBusClient(int reconnectIntervalMs, QObject* parent);
    ~QtMqttBusClient() override;

    void connectToBroker(const BrokerSettings& settings) override;
    void disconnectFromBroker() override;

    void subscribe(const QString& topicPattern, MessageCallback onMessage) override;
    void unsubscribe(const QString& topicPattern) override;

    void publish(const QString& topic, const QByteArray& payload, bool retain) override;

    bool isConnected() const;

signals:
    void brokerConnected();
    void brokerDisconnected();

private:
    void runOnClientThread(std::function<void()> task);
    void subscribeUnsafe(const QString& topicPattern);
    void onConnected();
    void onDisconnected();
    void onReconnectTimeout();

    QMqttClient* m_client;
    QTimer* m_reconnectTimer;
    bool m_autoReconnect;
    quint8 m_qos = 0;
    // Set between connectToBroker() and disconnectFromBroker(); client thread only
    bool m_wantConnected = false;

    // Patterns and callbacks survive reconnects; subscriptions are re-issued on connect
    mutable std::mutex m_subscriptionMutex;
    QHash<QString, MessageCallback> m_callbacks;
    QHash<QString, QMqttSubscription*> m_subscriptions;
};
}
