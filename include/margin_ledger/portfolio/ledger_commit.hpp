// include/margin_ledger/portfolio/ledger_commit.hpp
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/types.hpp"
#include "margin_ledger/portfolio/allocation_manager.hpp"
#include "margin_ledger/storage/state_store.hpp"

namespace margin_ledger {

/**
 * @brief Parameters shared by every commit from one process
 */
struct LedgerCommitOptions {
    std::string holder;  // Recorded as lock_holder in the saved state
    Duration lock_timeout{std::chrono::seconds(5)};
    std::optional<PortfolioConfig> global_settings;  // Persisted settings are kept when empty
};

/**
 * @brief Apply a ledger mutation against the shared store
 *
 * Takes the store lock, adopts the persisted state into the manager (a
 * missing file keeps the local ledger), runs the mutation and saves the
 * result. If the save fails the manager, history included, is put back to
 * the state it had before the mutation. The lock is released on every path.
 *
 * @param store Shared state store
 * @param manager Local ledger
 * @param options Holder name, lock timeout and settings snapshot
 * @param mutate Mutation to apply to the manager
 * @return The first error encountered, or success once the state is persisted
 */
Result<void> commit_ledger_change(const std::shared_ptr<StateStore>& store,
                                  AllocationManager& manager,
                                  const LedgerCommitOptions& options,
                                  const std::function<Result<void>()>& mutate);

/**
 * @brief Adopt the persisted state under the store lock without writing
 * @return What changed locally, or the lock, load or integrity error
 */
Result<SyncDiff> refresh_from_store(const std::shared_ptr<StateStore>& store,
                                    AllocationManager& manager,
                                    Duration lock_timeout);

}  // namespace margin_ledger
