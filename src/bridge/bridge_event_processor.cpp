#include "bridge_event_processor.h"
#include <log/log_manager.h>

namespace bridge {

BridgeEventProcessor::BridgeEventProcessor(QObject* parent)
    : QObject(parent)
{
    LOG_DEBUG("BridgeEventProcessor created");
}

BridgeEventProcessor::~BridgeEventProcessor()
{
    stop();
    joinWorker();
    LOG_DEBUG("BridgeEventProcessor destroyed");
}

void BridgeEventProcessor::postEvent(BridgeEventType eventType, const QVariantHash& eventData)
{
    if (!m_active.load()) {
        LOG_DEBUG("Dropped event {} while processor is stopped", magic_enum::enum_name(eventType));
        return;
    }
    std::unique_lock<std::mutex> locker(m_queueMutex);
    m_eventQueue.push_back(std::make_unique<BridgeEvent>(eventType, eventData));
    LOG_TRACE("Posted event: {} (queue size: {})", magic_enum::enum_name(eventType), m_eventQueue.size());
    m_queueCondition.notify_one();
    locker.unlock();
}

void BridgeEventProcessor::setEventHandler(BridgeEventType type, std::function<void(const QVariantHash&)> handler)
{
    m_eventHandlers[type] = std::move(handler);
    LOG_DEBUG("Event handler registered, event type: {}", magic_enum::enum_name(type));
}

int BridgeEventProcessor::pendingEventCount() const
{
    std::scoped_lock locker(m_queueMutex);
    return static_cast<int>(m_eventQueue.size());
}

bool BridgeEventProcessor::isProcessorThread() const
{
    std::scoped_lock locker(m_queueMutex);
    return m_workerId == std::this_thread::get_id();
}

bool BridgeEventProcessor::waitForIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> locker(m_queueMutex);
    return m_idleCondition.wait_for(locker, timeout, [this] {
        return m_eventQueue.empty() && !m_busy;
    });
}

void BridgeEventProcessor::start()
{
    if (m_active.load())
        return;
    // A previous stop() issued from a handler left the worker unjoined
    joinWorker();
    m_active.store(true);
    m_processingThread = std::make_unique<std::thread>(&BridgeEventProcessor::processEventFunc, this);
    LOG_INFO("BridgeEventProcessor started");
}

void BridgeEventProcessor::stop()
{
    m_active.store(false);
    int clearedEvents = 0;
    {
        std::scoped_lock locker(m_queueMutex);
        clearedEvents = static_cast<int>(m_eventQueue.size());
        m_eventQueue.clear();
        m_queueCondition.notify_all();
    }
    if (m_processingThread && m_processingThread->get_id() != std::this_thread::get_id()) {
        joinWorker();
    }
    m_idleCondition.notify_all();
    LOG_INFO("BridgeEventProcessor stopped, cleared {} pending events", clearedEvents);
}

void BridgeEventProcessor::joinWorker()
{
    if (!m_processingThread)
        return;
    if (m_processingThread->get_id() == std::this_thread::get_id()) {
        // Cannot join from inside the worker; leave it for the owner
        m_processingThread->detach();
    } else if (m_processingThread->joinable()) {
        m_processingThread->join();
    }
    m_processingThread.reset();
}

void BridgeEventProcessor::processEventUnsafe(std::unique_ptr<BridgeEvent> event)
{
    if (!event) return;

    auto handlerIt = m_eventHandlers.find(event->getType());
    if (handlerIt != m_eventHandlers.end()) {
        try {
            handlerIt->second(event->getData());
            LOG_TRACE("Processed event: {}", event->toString().toStdString());
        } catch (const std::exception& e) {
            LOG_ERROR("Error in event handler: {}", e.what());
            emit processingError(QString::fromStdString(e.what()));
        }
    } else {
        LOG_WARN("No handler for event type: {}", magic_enum::enum_name(event->getType()));
    }
}

void BridgeEventProcessor::processEventFunc()
{
    {
        std::scoped_lock locker(m_queueMutex);
        m_workerId = std::this_thread::get_id();
    }
    try {
        while (m_active.load()) {
            std::unique_ptr<BridgeEvent> event;
            {
                std::unique_lock<std::mutex> locker(m_queueMutex);
                m_queueCondition.wait(locker, [this] {
                    return !m_active.load() || !m_eventQueue.empty();
                });
                if (!m_active.load()) break;
                event = std::move(m_eventQueue.front());
                m_eventQueue.pop_front();
                m_busy = true;
            }
            processEventUnsafe(std::move(event));
            {
                std::scoped_lock locker(m_queueMutex);
                m_busy = false;
            }
            m_idleCondition.notify_all();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error processing events: {}", e.what());
        emit processingError(QString::fromStdString(e.what()));
    }
    {
        std::scoped_lock locker(m_queueMutex);
        m_busy = false;
        m_workerId = std::thread::id();
    }
    m_idleCondition.notify_all();
    LOG_DEBUG("Event processing thread exiting");
}

} // namespace bridge
