#pragma once

#include <QByteArray>
#include <QString>
#include <cstdint>
#include <functional>
#include <stdexcept>

namespace bus
{
    struct BrokerSettings {
        QString host = QStringLiteral("localhost");
        uint16_t port = 1883;
        QString username;     // Empty: anonymous
        QString password;
        QString clientId;
        quint8 qos = 0;
    };

    using MessageCallback = std::function<void(const QString& topic, const QByteArray& payload)>;

    class BusError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Publish/subscribe transport used by the bridge.
     *
     * Reconnect, QoS and TLS are the implementation's concern. Callbacks may be
     * invoked from the transport's own thread. publish() may be called from any
     * thread.
     */
    class IMessageBusClient
    {
    public:
        virtual ~IMessageBusClient() = default;

        // Throws BusError when the connection cannot be initiated
        virtual void connectToBroker(const BrokerSettings& settings) = 0;
        virtual void disconnectFromBroker() = 0;

        virtual void subscribe(const QString& topicPattern, MessageCallback onMessage) = 0;
        virtual void unsubscribe(const QString& topicPattern) = 0;

        virtual void publish(const QString& topic, const QByteArray& payload, bool retain) = 0;
    };
}
