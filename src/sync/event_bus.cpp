// src/sync/event_bus.cpp
#include "margin_ledger/sync/event_bus.hpp"
#include <algorithm>
#include "margin_ledger/core/logger.hpp"

namespace margin_ledger {

EventBus::EventBus(bool async) : async_(async) {
    Logger::ensure_initialized();
    if (async_) {
        worker_ = std::thread(&EventBus::dispatch_loop, this);
    }
}

EventBus::~EventBus() {
    shutdown();
}

Result<void> EventBus::subscribe(const SubscriberInfo& subscriber_info) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (subscriber_info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Subscriber ID cannot be empty",
                                "EventBus");
    }

    if (!subscriber_info.handler) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Event handler cannot be null",
                                "EventBus");
    }

    // Create or replace subscription
    subscriptions_[subscriber_info.id] = subscriber_info;

    INFO("Added subscription for " + subscriber_info.id + " (" +
         subscriber_info.handler->name() + ") with " +
         (subscriber_info.event_types.empty()
              ? std::string("all event types")
              : std::to_string(subscriber_info.event_types.size()) + " event types"));

    return Result<void>();
}

Result<void> EventBus::unsubscribe(const std::string& subscriber_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = subscriptions_.find(subscriber_id);
    if (it == subscriptions_.end()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Subscriber ID not found: " + subscriber_id, "EventBus");
    }

    subscriptions_.erase(it);
    INFO("Removed subscription for " + subscriber_id);

    return Result<void>();
}

void EventBus::publish(const SyncEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (async_ && !stopping_) {
            queue_.push_back(event);
            queue_cv_.notify_one();
            return;
        }
    }
    deliver(event);
}

Result<void> EventBus::flush(Duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool drained =
        idle_cv_.wait_for(lock, timeout, [this]() { return queue_.empty() && !dispatching_; });
    if (!drained) {
        return make_error<void>(ErrorCode::TIMEOUT_ERROR,
                                std::to_string(queue_.size()) + " events still pending",
                                "EventBus");
    }
    return Result<void>();
}

void EventBus::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();
    worker_.join();
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

uint64_t EventBus::delivered_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
}

uint64_t EventBus::failed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

bool EventBus::is_async() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return async_ && !stopping_;
}

void EventBus::dispatch_loop() {
    Logger::register_component("EventBus");

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // Stopping with nothing left to deliver
            break;
        }

        SyncEvent event = std::move(queue_.front());
        queue_.pop_front();
        dispatching_ = true;

        lock.unlock();
        deliver(event);
        lock.lock();

        dispatching_ = false;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}

void EventBus::deliver(const SyncEvent& event) {
    // Handlers run without the bus lock so they may publish or subscribe
    std::vector<std::pair<std::string, std::shared_ptr<EventHandler>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, sub] : subscriptions_) {
            if (should_notify(sub, event)) {
                targets.emplace_back(id, sub.handler);
            }
        }
    }

    uint64_t delivered = 0;
    uint64_t failed = 0;
    for (const auto& [id, handler] : targets) {
        try {
            auto handled = handler->handle_event(event);
            if (handled.is_error()) {
                ++failed;
                ERROR("Handler " << id << " failed on " << event_type_to_string(event.type)
                                 << " from " << event.bot_id << ": "
                                 << handled.error()->to_string());
                continue;
            }
            ++delivered;
        } catch (const std::exception& e) {
            ++failed;
            ERROR("Error in subscriber callback for " + id + ": " + e.what());
        } catch (...) {
            // Counted as a failure; the remaining handlers still get the event
            ++failed;
            ERROR("Unknown exception in subscriber callback for " + id);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    delivered_ += delivered;
    failed_ += failed;
}

bool EventBus::should_notify(const SubscriberInfo& sub, const SyncEvent& event) const {
    // If no event types specified, subscriber wants everything
    if (sub.event_types.empty()) {
        return true;
    }
    return std::find(sub.event_types.begin(), sub.event_types.end(), event.type) !=
           sub.event_types.end();
}

}  // namespace margin_ledger
