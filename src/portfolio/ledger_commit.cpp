// src/portfolio/ledger_commit.cpp

#include "margin_ledger/portfolio/ledger_commit.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include "margin_ledger/core/logger.hpp"
#include "margin_ledger/core/time_utils.hpp"
#include "margin_ledger/storage/state_lock.hpp"

namespace margin_ledger {

namespace {

// Commits on the same store location are serialized within the process
std::timed_mutex& commit_mutex_for(const std::string& location) {
    static std::mutex registry_mutex;
    static std::unordered_map<std::string, std::unique_ptr<std::timed_mutex>> registry;

    std::lock_guard<std::mutex> lock(registry_mutex);
    auto& entry = registry[location];
    if (!entry) {
        entry = std::make_unique<std::timed_mutex>();
    }
    return *entry;
}

Result<void> timed_out(const std::string& location, Duration timeout) {
    return make_error<void>(ErrorCode::TIMEOUT_ERROR,
                            "Timed out after " + core::format_duration(timeout) +
                                " waiting for in-process commit on " + location,
                            "LedgerCommit");
}

Result<SyncDiff> adopt_persisted_state(StateStore& store, AllocationManager& manager,
                                       std::optional<PortfolioConfig>* settings = nullptr) {
    auto loaded = store.load();
    if (loaded.is_error()) {
        if (loaded.error()->code() == ErrorCode::FILE_NOT_FOUND) {
            return SyncDiff{};
        }
        return forward_error<SyncDiff>(*loaded.error());
    }
    if (settings) {
        *settings = loaded.value().global_settings;
    }
    return manager.sync_from_state(loaded.value());
}

void release_guard(StateLockGuard& guard) {
    auto released = guard.release();
    if (released.is_error()) {
        ERROR("Failed to release state lock: " << released.error()->what());
    }
}

}  // namespace

Result<void> commit_ledger_change(const std::shared_ptr<StateStore>& store,
                                  AllocationManager& manager,
                                  const LedgerCommitOptions& options,
                                  const std::function<Result<void>()>& mutate) {
    if (!store) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "State store cannot be null",
                                "LedgerCommit");
    }
    std::unique_lock<std::timed_mutex> local(commit_mutex_for(store->location()),
                                             std::defer_lock);
    if (!local.try_lock_for(options.lock_timeout)) {
        return timed_out(store->location(), options.lock_timeout);
    }

    auto guard = StateLockGuard::acquire(store, options.lock_timeout);
    if (guard.is_error()) {
        WARN("Ledger commit by " << options.holder
                                 << " could not lock state: " << guard.error()->what());
        return forward_error<void>(*guard.error());
    }

    std::optional<PortfolioConfig> persisted_settings;
    auto adopted = adopt_persisted_state(*store, manager, &persisted_settings);
    if (adopted.is_error()) {
        ERROR("Ledger commit by " << options.holder
                                  << " rejected persisted state: " << adopted.error()->what());
        return forward_error<void>(*adopted.error());
    }

    LedgerCheckpoint checkpoint = manager.checkpoint();

    auto mutated = mutate();
    if (mutated.is_error()) {
        return mutated;
    }

    PortfolioState next = manager.export_state();
    // Committers without a settings snapshot keep the persisted one
    next.global_settings =
        options.global_settings ? options.global_settings : persisted_settings;
    next.lock_holder = options.holder;
    next.lock_time = std::chrono::system_clock::now();

    auto saved = store->save(next);
    if (saved.is_error()) {
        manager.rollback(checkpoint);
        WARN("State save failed, in-memory ledger rolled back: " << saved.error()->what());
        return saved;
    }

    release_guard(*guard.value());
    return Result<void>();
}

Result<SyncDiff> refresh_from_store(const std::shared_ptr<StateStore>& store,
                                    AllocationManager& manager,
                                    Duration lock_timeout) {
    if (!store) {
        return make_error<SyncDiff>(ErrorCode::INVALID_ARGUMENT, "State store cannot be null",
                                    "LedgerCommit");
    }
    std::unique_lock<std::timed_mutex> local(commit_mutex_for(store->location()),
                                             std::defer_lock);
    if (!local.try_lock_for(lock_timeout)) {
        return forward_error<SyncDiff>(*timed_out(store->location(), lock_timeout).error());
    }

    auto guard = StateLockGuard::acquire(store, lock_timeout);
    if (guard.is_error()) {
        return forward_error<SyncDiff>(*guard.error());
    }

    auto adopted = adopt_persisted_state(*store, manager);
    release_guard(*guard.value());
    return adopted;
}

}  // namespace margin_ledger
