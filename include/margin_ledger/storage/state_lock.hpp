// include/margin_ledger/storage/state_lock.hpp
#pragma once

#include <chrono>
#include <memory>
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/types.hpp"
#include "margin_ledger/storage/state_store.hpp"

namespace margin_ledger {

constexpr Duration kDefaultLockTimeout = std::chrono::seconds(5);

/**
 * @brief Scoped hold on a StateStore lock
 *
 * The lock is released when the guard is destroyed.
 */
class StateLockGuard {
public:
    /**
     * @brief Attempt the store lock, giving up after a timeout
     *
     * The attempt runs on its own thread and the call returns once the
     * timeout expires, whether or not the attempt has finished. An attempt
     * that succeeds after that releases the lock again. The thread shares
     * ownership of the store until it finishes.
     *
     * @param store Store to lock
     * @param timeout Maximum time to wait for the attempt
     * @return Guard owning the lock, the store's error, INVALID_ARGUMENT for a
     *         null store, or TIMEOUT_ERROR
     */
    static Result<std::unique_ptr<StateLockGuard>> acquire(
        std::shared_ptr<StateStore> store, Duration timeout = kDefaultLockTimeout);

    ~StateLockGuard();

    StateLockGuard(const StateLockGuard&) = delete;
    StateLockGuard& operator=(const StateLockGuard&) = delete;

    /**
     * @brief Release before destruction
     * @return The store's unlock result; later calls are no-ops
     */
    Result<void> release();

    bool owns_lock() const {
        return owns_lock_;
    }

private:
    explicit StateLockGuard(std::shared_ptr<StateStore> store) : store_(std::move(store)) {}

    std::shared_ptr<StateStore> store_;
    bool owns_lock_{true};
};

}  // namespace margin_ledger
