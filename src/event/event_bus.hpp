#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

/**
 * Typed in-process publish/subscribe hub.
 * Subscribers are tracked through a weak_ptr token: once the token expires the
 * record is dropped on the next Post/Unsubscribe.
 */
class EventBus : public std::enable_shared_from_this<EventBus> {
private:
    template<typename EventType>
    struct SubscribeRecord {
        std::weak_ptr<void> subscriber;
        std::function<bool(const EventType&)> handler;
    };

    template<typename EventType>
    struct Dispatcher {
        std::mutex mtx;
        // Keyed by subscription id so handlers run in subscription order
        std::map<unsigned long long, SubscribeRecord<EventType> > subscribers;
    };

    explicit EventBus(const size_t id) : m_id(id) { }

public:
    EventBus() = delete;
    EventBus(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    static std::shared_ptr<EventBus> Create()
    {
        static std::atomic<size_t> indexCounter(0);
        size_t index = indexCounter.fetch_add(1, std::memory_order_relaxed);
        return std::shared_ptr<EventBus>(new EventBus(index));
    }

    size_t GetId() const { return m_id; }

    template<typename EventType>
    bool Subscribe(const std::shared_ptr<void>& subscriber, std::function<bool(const EventType&)> handler) noexcept
    {
        if (!subscriber || !handler) {
            return false;
        }
        std::shared_ptr<Dispatcher<EventType> > dispatcher = GetDispatcher<EventType>();
        std::lock_guard<std::mutex> lock(dispatcher->mtx);
        SubscribeRecord<EventType> record;
        record.subscriber = subscriber;
        record.handler = std::move(handler);
        dispatcher->subscribers.emplace(m_nextSubscriptionId.fetch_add(1, std::memory_order_relaxed), std::move(record));
        return true;
    }

    // Removes every record of `subscriber` for EventType. Returns false if none was found.
    template<typename EventType>
    bool Unsubscribe(const std::weak_ptr<void>& subscriber) noexcept
    {
        std::shared_ptr<Dispatcher<EventType> > dispatcher = GetDispatcher<EventType>();
        std::lock_guard<std::mutex> lock(dispatcher->mtx);
        std::shared_ptr<void> target = subscriber.lock();
        bool removed = false;
        for (auto it = dispatcher->subscribers.begin(); it != dispatcher->subscribers.end(); ) {
            std::shared_ptr<void> current = it->second.subscriber.lock();
            if (!current) {
                it = dispatcher->subscribers.erase(it);
            } else if (target && current == target) {
                it = dispatcher->subscribers.erase(it);
                removed = true;
            } else {
                ++it;
            }
        }
        return removed;
    }

    // Handlers are invoked outside the dispatcher lock, so a handler may
    // subscribe or unsubscribe without deadlocking.
    template<typename EventType>
    bool Post(const EventType& evt)
    {
        std::shared_ptr<Dispatcher<EventType> > dispatcher = GetDispatcher<EventType>();
        std::vector<std::pair<std::shared_ptr<void>, std::function<bool(const EventType&)> > > live;
        {
            std::lock_guard<std::mutex> lock(dispatcher->mtx);
            for (auto it = dispatcher->subscribers.begin(); it != dispatcher->subscribers.end(); ) {
                std::shared_ptr<void> sp = it->second.subscriber.lock();
                if (!sp) {
                    it = dispatcher->subscribers.erase(it);
                    continue;
                }
                live.emplace_back(std::move(sp), it->second.handler);
                ++it;
            }
        }
        bool result = true;
        for (auto& entry : live) {
            result &= entry.second(evt);
        }
        return result;
    }

    template<typename EventType>
    size_t SubscriberCount()
    {
        std::shared_ptr<Dispatcher<EventType> > dispatcher = GetDispatcher<EventType>();
        std::lock_guard<std::mutex> lock(dispatcher->mtx);
        size_t count = 0;
        for (const auto& entry : dispatcher->subscribers) {
            if (!entry.second.subscriber.expired()) {
                ++count;
            }
        }
        return count;
    }

private:
    template<typename EventType>
    std::shared_ptr<Dispatcher<EventType> > GetDispatcher()
    {
        std::lock_guard<std::mutex> lock(m_dispatchersMutex);
        auto& slot = m_dispatchers[std::type_index(typeid(EventType))];
        if (!slot) {
            slot = std::make_shared<Dispatcher<EventType> >();
        }
        return std::static_pointer_cast<Dispatcher<EventType> >(slot);
    }

    const size_t m_id;
    std::atomic<unsigned long long> m_nextSubscriptionId{0};
    std::mutex m_dispatchersMutex;
    std::unordered_map<std::type_index, std::shared_ptr<void> > m_dispatchers;
};
