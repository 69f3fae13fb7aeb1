// src/storage/state_lock.cpp

#include "margin_ledger/storage/state_lock.hpp"
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include "margin_ledger/core/logger.hpp"
#include "margin_ledger/core/time_utils.hpp"

namespace margin_ledger {

namespace {

// Outcome of one background lock attempt, shared with the thread running it
struct LockAttempt {
    std::mutex mutex;
    std::condition_variable done_cv;
    std::optional<Result<void>> result;
    bool abandoned{false};
};

Result<void> try_lock(StateStore& store) {
    try {
        return store.lock();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("State lock attempt threw: ") + e.what(),
                                "StateLockGuard");
    }
}

}  // namespace

Result<std::unique_ptr<StateLockGuard>> StateLockGuard::acquire(std::shared_ptr<StateStore> store,
                                                                Duration timeout) {
    if (!store) {
        return make_error<std::unique_ptr<StateLockGuard>>(
            ErrorCode::INVALID_ARGUMENT, "State store cannot be null", "StateLockGuard");
    }

    auto attempt = std::make_shared<LockAttempt>();

    // The attempt owns the store so it may finish after the caller gave up
    std::thread([store, attempt]() {
        auto locked = try_lock(*store);

        std::unique_lock<std::mutex> lock(attempt->mutex);
        if (!attempt->abandoned) {
            attempt->result = std::move(locked);
            attempt->done_cv.notify_all();
            return;
        }
        lock.unlock();

        if (locked.is_ok()) {
            auto released = store->unlock();
            if (released.is_error()) {
                ERROR("Failed to release lock acquired after timeout: "
                      << released.error()->what());
            } else {
                WARN("Released state lock on " << store->location()
                                               << " acquired after the caller timed out");
            }
        }
    }).detach();

    std::unique_lock<std::mutex> lock(attempt->mutex);
    if (!attempt->done_cv.wait_for(lock, timeout,
                                   [&attempt]() { return attempt->result.has_value(); })) {
        attempt->abandoned = true;
        return make_error<std::unique_ptr<StateLockGuard>>(
            ErrorCode::TIMEOUT_ERROR,
            "Timed out after " + core::format_duration(timeout) + " waiting for state lock",
            "StateLockGuard");
    }

    if (attempt->result->is_error()) {
        return forward_error<std::unique_ptr<StateLockGuard>>(*attempt->result->error());
    }

    return std::unique_ptr<StateLockGuard>(new StateLockGuard(std::move(store)));
}

StateLockGuard::~StateLockGuard() {
    if (!owns_lock_) {
        return;
    }
    auto released = release();
    if (released.is_error()) {
        ERROR("Failed to release state lock: " << released.error()->what());
    }
}

Result<void> StateLockGuard::release() {
    if (!owns_lock_) {
        return Result<void>();
    }
    owns_lock_ = false;
    return store_->unlock();
}

}  // namespace margin_ledger
