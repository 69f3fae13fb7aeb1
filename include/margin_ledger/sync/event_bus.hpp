// include/margin_ledger/sync/event_bus.hpp
#pragma once

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/types.hpp"
#include "margin_ledger/sync/sync_types.hpp"

namespace margin_ledger {

/**
 * @brief Subscriber info structure
 */
struct SubscriberInfo {
    std::string id;
    std::vector<EventType> event_types;  // Empty subscribes to every type
    std::shared_ptr<EventHandler> handler;
};

/**
 * @brief Publish/subscribe bus delivering sync events to handlers
 *
 * In asynchronous mode events are queued and delivered in order by a
 * dedicated thread; otherwise publish delivers before returning. A handler
 * that fails or throws is logged and the remaining handlers still receive
 * the event.
 */
class EventBus {
public:
    explicit EventBus(bool async = true);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to sync events
     * @param subscriber_info Subscriber configuration
     * @return INVALID_ARGUMENT for an empty id or a null handler
     */
    Result<void> subscribe(const SubscriberInfo& subscriber_info);

    /**
     * @brief Unsubscribe from sync events
     * @param subscriber_id Subscriber identifier
     * @return INVALID_ARGUMENT if the subscriber is unknown
     */
    Result<void> unsubscribe(const std::string& subscriber_id);

    /**
     * @brief Publish a sync event
     * @param event Event to publish
     */
    void publish(const SyncEvent& event);

    /**
     * @brief Wait until every queued event has been delivered
     * @param timeout Maximum time to wait
     * @return TIMEOUT_ERROR if events are still pending
     */
    Result<void> flush(Duration timeout);

    /**
     * @brief Deliver what is queued and stop the dispatch thread
     *
     * Later publishes are delivered synchronously.
     */
    void shutdown();

    size_t subscriber_count() const;

    uint64_t delivered_count() const;
    uint64_t failed_count() const;

    bool is_async() const;

private:
    void dispatch_loop();
    void deliver(const SyncEvent& event);
    bool should_notify(const SubscriberInfo& sub, const SyncEvent& event) const;

    std::map<std::string, SubscriberInfo> subscriptions_;
    std::deque<SyncEvent> queue_;
    bool async_;
    bool stopping_{false};
    bool dispatching_{false};
    uint64_t delivered_{0};
    uint64_t failed_{0};
    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::thread worker_;
};

}  // namespace margin_ledger
