#pragma once

#include <QObject>
#include <QString>
#include <QVariantHash>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
// magic_enum provides compile-time enum to string conversion (header-only)
#include <magic_enum/magic_enum.hpp>

namespace bridge {

/**
 * BridgeEventProcessor
 * Single worker thread that executes bridge events one at a time, in posting
 * order. Inbound bus messages and player notifications both go through it, so
 * the player is never driven by two messages concurrently.
 */
class BridgeEventProcessor : public QObject
{
    Q_OBJECT
public:
    enum BridgeEventType {
        // Inbound commands
        INBOUND_MESSAGE,

        // Player notifications
        PLAYBACK_STATE_CHANGED,
        TRACK_PLAYBACK_STARTED,
        TRACK_PLAYBACK_ENDED,
        VOLUME_CHANGED,
        STREAM_TITLE_CHANGED,
    };
public:
    explicit BridgeEventProcessor(QObject* parent = nullptr);
    ~BridgeEventProcessor();

    // Dropped with a debug line while the processor is not running
    void postEvent(BridgeEventType eventType, const QVariantHash& eventData = {});

    void setEventHandler(BridgeEventType type, std::function<void(const QVariantHash&)> handler);

    int pendingEventCount() const;
    bool isRunning() const { return m_active.load(); }
    // True when called from inside a handler
    bool isProcessorThread() const;

    // Blocks until the queue is empty and no handler is running, or the timeout expires
    bool waitForIdle(std::chrono::milliseconds timeout);

    void start();
    // Discards pending events. May be called from a handler; the worker is
    // joined later by start() or the destructor in that case.
    void stop();

signals:
    void processingError(const QString& error);

private:
    class BridgeEvent;
    void processEventUnsafe(std::unique_ptr<BridgeEvent> event);
    void processEventFunc();
    void joinWorker();

    mutable std::condition_variable m_queueCondition;
    std::condition_variable m_idleCondition;
    mutable std::mutex m_queueMutex;
    std::deque<std::unique_ptr<BridgeEvent>> m_eventQueue;
    bool m_busy = false;
    std::thread::id m_workerId;

    std::unique_ptr<std::thread> m_processingThread;
    std::unordered_map<BridgeEventType, std::function<void(const QVariantHash&)>> m_eventHandlers;

    std::atomic<bool> m_active{false};
};

class BridgeEventProcessor::BridgeEvent
{
public:
    BridgeEvent() = delete;
    BridgeEvent(const BridgeEvent&) = delete;
    BridgeEvent& operator=(const BridgeEvent&) = delete;

    explicit BridgeEvent(BridgeEventType eventType, const QVariantHash& eventData = {})
        : type(eventType), data(eventData) {}
    virtual ~BridgeEvent() = default;
    BridgeEventType getType() const { return type; }
    const QVariantHash& getData() const { return data; }
    virtual QString toString() const {
        auto name = magic_enum::enum_name(type);
        QString name_q = QString::fromUtf8(name.data(), static_cast<int>(name.size()));
        return QString("BridgeEvent(Type=%1, DataKeys=[%2])")
            .arg(name_q)
            .arg(data.keys().join(", "));
    }
private:
    BridgeEventType type;
    QVariantHash data;
};

} // namespace bridge
