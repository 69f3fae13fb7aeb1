// include/margin_ledger/portfolio/allocation_manager.hpp
#pragma once

#include <deque>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/types.hpp"
#include "margin_ledger/portfolio/leverage_calculator.hpp"
#include "margin_ledger/portfolio/profit_distribution.hpp"
#include "margin_ledger/portfolio/types.hpp"

namespace margin_ledger {

constexpr size_t kDefaultHistoryCapacity = 10000;

/**
 * @brief Outcome of a drift check
 */
struct RebalanceCheck {
    bool needed{false};
    std::vector<std::string> reasons;
};

/**
 * @brief Outcome of a rebalance pass
 */
struct RebalanceReport {
    int adjustments{0};
    std::vector<std::string> actions;
    std::vector<std::string> skipped;  // Bots whose target would fall below used margin
};

/**
 * @brief Difference between the local ledger and an adopted snapshot
 */
struct SyncDiff {
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> changed;

    bool empty() const {
        return added.empty() && removed.empty() && changed.empty();
    }
};

/**
 * @brief Everything a mutation can change, including the local history
 */
struct LedgerCheckpoint {
    PortfolioState state;
    std::deque<AllocationEvent> history;
    Timestamp last_rebalance{};
};

/**
 * @brief In-process authority over the shared-balance ledger
 *
 * Mutators take an exclusive lock and readers a shared one. Public methods
 * must not be called from inside one another. Every accessor returns copies.
 */
class AllocationManager {
public:
    /**
     * @brief Constructor
     * @param total_balance Capital pool shared by all bots
     * @param strategy Profit distribution strategy
     * @param rebalance_config Rebalancing thresholds
     * @param history_capacity Maximum retained history events
     */
    AllocationManager(Amount total_balance, AllocationStrategy strategy,
                      RebalanceConfig rebalance_config = RebalanceConfig(),
                      size_t history_capacity = kDefaultHistoryCapacity);

    AllocationManager(const AllocationManager&) = delete;
    AllocationManager& operator=(const AllocationManager&) = delete;

    /**
     * @brief Carve out total_balance * allocation_percentage for a new bot
     * @return CONFIGURATION_INVALID, BOT_ALREADY_REGISTERED or EXCEEDS_ALLOCATION
     */
    Result<void> allocate_to_bot(const std::string& bot_id, const BotConfig& config);

    /**
     * @brief Remove a bot and return its final allocation
     * @return BOT_NOT_REGISTERED, or CONFIGURATION_INVALID while a position is open
     */
    Result<BotAllocation> deallocate_from_bot(const std::string& bot_id);

    /**
     * @brief Replace a bot's position and recompute its margin usage
     * @param bot_id Bot holding the position
     * @param position_value Notional value, 0 when flat
     * @param avg_price Average entry price
     * @param leverage Leverage of the position
     * @return BOT_NOT_REGISTERED, INVALID_ARGUMENT, INVALID_LEVERAGE or EXCEEDS_ALLOCATION
     */
    Result<void> update_bot_position(const std::string& bot_id, Amount position_value,
                                     Price avg_price, double leverage);

    Result<void> update_unrealized_pnl(const std::string& bot_id, Amount pnl);

    /**
     * @brief Set a bot's allocated balance directly
     * @return INSUFFICIENT_MARGIN below used margin, EXCEEDS_ALLOCATION above total balance
     */
    Result<void> set_allocated_balance(const std::string& bot_id, Amount amount);

    /**
     * @brief Book realized profit (or loss) for a bot
     * @param share_profit Redistribute a positive profit with the configured strategy
     */
    Result<void> record_profit(const std::string& bot_id, Amount profit, bool share_profit);

    RebalanceCheck check_rebalance_needed() const;

    /**
     * @brief Move every drifted bot back to total_balance * allocation_percentage
     *
     * Differences up to min_rebalance_amount are left alone. Reductions are
     * applied before increases so the ledger never exceeds the total balance.
     */
    RebalanceReport execute_rebalance();

    Result<BotAllocation> get_allocation(const std::string& bot_id) const;
    std::map<std::string, BotAllocation> get_all_allocations() const;
    PortfolioSummary get_portfolio_summary() const;

    /**
     * @brief Most recent history events, oldest first
     * @param limit Maximum events to return, 0 for all
     */
    std::vector<AllocationEvent> get_allocation_history(size_t limit = 0) const;

    /**
     * @brief Append an externally observed event to the history
     */
    void record_event(EventType type, const std::string& bot_id, Amount amount,
                      const std::string& description);

    Amount total_balance() const;
    Amount total_profit() const;
    Timestamp last_rebalance() const;
    bool has_bot(const std::string& bot_id) const;
    size_t bot_count() const;

    AllocationStrategy strategy() const {
        return distributor_->strategy();
    }

    RebalanceConfig rebalance_config() const;
    void set_rebalance_config(const RebalanceConfig& config);

    /**
     * @brief Snapshot the ledger as a persistable state
     */
    PortfolioState export_state() const;

    /**
     * @brief Put back a snapshot taken with export_state
     * @return STATE_CORRUPTED if the snapshot fails the integrity check
     */
    Result<void> restore_state(const PortfolioState& state);

    LedgerCheckpoint checkpoint() const;

    /**
     * @brief Undo everything done since the checkpoint, history included
     */
    void rollback(const LedgerCheckpoint& checkpoint);

    /**
     * @brief Adopt a state read from the shared store
     *
     * The snapshot replaces the local balance, profit and allocations. The
     * history and the last rebalance time are local and kept.
     *
     * @return Bots added, removed or changed, or STATE_CORRUPTED
     */
    Result<SyncDiff> sync_from_state(const PortfolioState& state);

private:
    Amount total_allocated_unsafe() const;
    void push_event_unsafe(AllocationEvent event);
    void adopt_unsafe(const PortfolioState& state);
    Result<void> not_registered(const std::string& bot_id) const;

    Amount total_balance_;
    Amount total_profit_{0.0};
    std::map<std::string, BotAllocation> allocations_;
    std::deque<AllocationEvent> history_;
    size_t history_capacity_;
    RebalanceConfig rebalance_config_;
    Timestamp last_rebalance_{};
    std::unique_ptr<ProfitDistributor> distributor_;
    LeverageCalculator leverage_calculator_;
    mutable std::shared_mutex mutex_;
};

}  // namespace margin_ledger
