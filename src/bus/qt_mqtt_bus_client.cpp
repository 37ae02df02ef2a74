#include "qt_mqtt_bus_client.h"

#include <log/log_manager.h>
#include <QMqttClient>
#include <QMqttSubscription>
#include <QMqttTopicFilter>
#include <QMqttTopicName>
#include <QPointer>
#include <QThread>
#include <QTimer>
#include <magic_enum/magic_enum.hpp>
#include <algorithm>

namespace bus
{

namespace {
constexpr int kDefaultReconnectIntervalMs = 2000;
}

QtMqttBusClient::QtMqttBusClient(QObject* parent)
    : QtMqttBusClient(kDefaultReconnectIntervalMs, parent)
{
}

QtMqttBusClient::QtMqttBusClient(int reconnectIntervalMs, QObject* parent)
    : QObject(parent)
    , m_client(new QMqttClient(this))
    , m_reconnectTimer(new QTimer(this))
    , m_autoReconnect(reconnectIntervalMs > 0)
{
    m_reconnectTimer->setSingleShot(true);
    m_reconnectTimer->setInterval(std::max(reconnectIntervalMs, 0));
    connect(m_reconnectTimer, &QTimer::timeout, this, &QtMqttBusClient::onReconnectTimeout);

    connect(m_client, &QMqttClient::connected, this, &QtMqttBusClient::onConnected);
    // stateChanged also covers a failed connection attempt, which never emits disconnected()
    connect(m_client, &QMqttClient::stateChanged, this, [this](QMqttClient::ClientState state) {
        if (state == QMqttClient::Disconnected) {
            onDisconnected();
        }
    });
    connect(m_client, &QMqttClient::errorChanged, this, [](QMqttClient::ClientError error) {
        if (error != QMqttClient::NoError) {
            LOG_ERROR("MQTT client error: {}", magic_enum::enum_name(error));
        }
    });
    LOG_DEBUG("QtMqttBusClient created");
}

QtMqttBusClient::~QtMqttBusClient()
{
    m_wantConnected = false;
    m_reconnectTimer->stop();
    if (m_client->state() != QMqttClient::Disconnected) {
        m_client->disconnectFromHost();
    }
    LOG_DEBUG("QtMqttBusClient destroyed");
}

void QtMqttBusClient::runOnClientThread(std::function<void()> task)
{
    if (QThread::currentThread() == thread()) {
        task();
        return;
    }
    QPointer<QtMqttBusClient> self(this);
    QMetaObject::invokeMethod(this, [self, task]() {
        if (self) {
            task();
        }
    }, Qt::QueuedConnection);
}

void QtMqttBusClient::connectToBroker(const BrokerSettings& settings)
{
    if (settings.host.trimmed().isEmpty()) {
        throw BusError("MQTT broker host is empty");
    }
    if (settings.port == 0) {
        throw BusError("MQTT broker port is 0");
    }
    runOnClientThread([this, settings]() {
        m_qos = std::min<quint8>(settings.qos, 2);
        m_client->setHostname(settings.host);
        m_client->setPort(settings.port);
        if (!settings.clientId.isEmpty()) {
            m_client->setClientId(settings.clientId);
        }
        if (!settings.username.isEmpty()) {
            m_client->setUsername(settings.username);
            m_client->setPassword(settings.password);
        }
        LOG_INFO("Connecting to MQTT broker {}:{}", settings.host.toStdString(), settings.port);
        m_wantConnected = true;
        m_reconnectTimer->stop();
        m_client->connectToHost();
    });
}

void QtMqttBusClient::disconnectFromBroker()
{
    runOnClientThread([this]() {
        m_wantConnected = false;
        m_reconnectTimer->stop();
        if (m_client->state() == QMqttClient::Disconnected) {
            return;
        }
        LOG_INFO("Disconnecting from MQTT broker {}", m_client->hostname().toStdString());
        m_client->disconnectFromHost();
    });
}

bool QtMqttBusClient::isConnected() const
{
    return m_client->state() == QMqttClient::Connected;
}

void QtMqttBusClient::subscribe(const QString& topicPattern, MessageCallback onMessage)
{
    {
        std::scoped_lock locker(m_subscriptionMutex);
        m_callbacks.insert(topicPattern, std::move(onMessage));
    }
    runOnClientThread([this, topicPattern]() {
        if (m_client->state() == QMqttClient::Connected) {
            subscribeUnsafe(topicPattern);
        }
        // Otherwise onConnected() picks the pattern up
    });
}

void QtMqttBusClient::unsubscribe(const QString& topicPattern)
{
    {
        std::scoped_lock locker(m_subscriptionMutex);
        m_callbacks.remove(topicPattern);
    }
    runOnClientThread([this, topicPattern]() {
        QMqttSubscription* subscription = m_subscriptions.take(topicPattern);
        if (subscription) {
            subscription->disconnect(this);
        }
        if (m_client->state() == QMqttClient::Connected) {
            m_client->unsubscribe(QMqttTopicFilter(topicPattern));
            LOG_DEBUG("Unsubscribed from {}", topicPattern.toStdString());
        }
    });
}

void QtMqttBusClient::publish(const QString& topic, const QByteArray& payload, bool retain)
{
    runOnClientThread([this, topic, payload, retain]() {
        if (m_client->state() != QMqttClient::Connected) {
            LOG_WARN("Dropping message for {}: broker not connected", topic.toStdString());
            return;
        }
        qint32 id = m_client->publish(QMqttTopicName(topic), payload, m_qos, retain);
        if (id == -1) {
            LOG_WARN("Failed to publish message on {}", topic.toStdString());
            return;
        }
        LOG_TRACE("Published {} bytes on {} (retain: {})", payload.size(), topic.toStdString(), retain);
    });
}

// Must run on the client thread
void QtMqttBusClient::subscribeUnsafe(const QString& topicPattern)
{
    if (m_subscriptions.contains(topicPattern)) {
        return;
    }
    QMqttSubscription* subscription = m_client->subscribe(QMqttTopicFilter(topicPattern), m_qos);
    if (!subscription) {
        LOG_ERROR("Failed to subscribe to {}", topicPattern.toStdString());
        return;
    }
    m_subscriptions.insert(topicPattern, subscription);
    connect(subscription, &QMqttSubscription::messageReceived, this, [this, topicPattern](QMqttMessage msg) {
        MessageCallback callback;
        {
            std::scoped_lock locker(m_subscriptionMutex);
            callback = m_callbacks.value(topicPattern);
        }
        if (callback) {
            callback(msg.topic().name(), msg.payload());
        }
    });
    LOG_INFO("Subscribed to {}", topicPattern.toStdString());
}

void QtMqttBusClient::onConnected()
{
    LOG_INFO("Connected to MQTT broker {}:{}", m_client->hostname().toStdString(), m_client->port());
    m_subscriptions.clear();
    QList<QString> patterns;
    {
        std::scoped_lock locker(m_subscriptionMutex);
        patterns = m_callbacks.keys();
    }
    for (const QString& pattern : patterns) {
        subscribeUnsafe(pattern);
    }
    emit brokerConnected();
}

void QtMqttBusClient::onDisconnected()
{
    m_subscriptions.clear();
    if (!m_wantConnected) {
        LOG_INFO("Disconnected from MQTT broker {}", m_client->hostname().toStdString());
        emit brokerDisconnected();
        return;
    }
    LOG_WARN("Lost connection to MQTT broker {}", m_client->hostname().toStdString());
    emit brokerDisconnected();
    if (m_autoReconnect) {
        LOG_INFO("Reconnecting in {} ms", m_reconnectTimer->interval());
        m_reconnectTimer->start();
    }
}

void QtMqttBusClient::onReconnectTimeout()
{
    if (!m_wantConnected || m_client->state() != QMqttClient::Disconnected) {
        return;
    }
    LOG_INFO("Reconnecting to MQTT broker {}:{}", m_client->hostname().toStdString(), m_client->port());
    m_client->connectToHost();
}

} // namespace bus
