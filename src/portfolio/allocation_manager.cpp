// src/portfolio/allocation_manager.cpp

#include "margin_ledger/portfolio/allocation_manager.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <mutex>
#include <sstream>
#include "margin_ledger/core/logger.hpp"

namespace margin_ledger {

namespace {

std::string format_amount(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    return ss.str();
}

std::string format_percent(double fraction) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return ss.str();
}

bool allocation_differs(const BotAllocation& a, const BotAllocation& b) {
    return a.symbol != b.symbol || a.allocated_balance != b.allocated_balance ||
           a.used_balance != b.used_balance || a.available_balance != b.available_balance ||
           a.current_position != b.current_position || a.average_price != b.average_price ||
           a.leverage != b.leverage || a.unrealized_pnl != b.unrealized_pnl ||
           a.realized_pnl != b.realized_pnl ||
           a.position_margin_used != b.position_margin_used ||
           a.allocation_percentage != b.allocation_percentage;
}

}  // namespace

AllocationManager::AllocationManager(Amount total_balance, AllocationStrategy strategy,
                                     RebalanceConfig rebalance_config, size_t history_capacity)
    : total_balance_(total_balance),
      history_capacity_(history_capacity == 0 ? kDefaultHistoryCapacity : history_capacity),
      rebalance_config_(std::move(rebalance_config)),
      distributor_(make_profit_distributor(strategy)) {
    if (!(total_balance > 0.0)) {
        throw PortfolioError(ErrorCode::CONFIGURATION_INVALID,
                             "Total balance must be positive, got " + format_amount(total_balance),
                             "AllocationManager");
    }
    Logger::ensure_initialized();
}

Result<void> AllocationManager::not_registered(const std::string& bot_id) const {
    return make_error<void>(ErrorCode::BOT_NOT_REGISTERED, "Bot " + bot_id + " has no allocation",
                            "AllocationManager", bot_id);
}

Result<void> AllocationManager::allocate_to_bot(const std::string& bot_id,
                                                const BotConfig& config) {
    if (bot_id.empty()) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID, "Bot ID cannot be empty",
                                "AllocationManager");
    }

    auto valid = config.validate();
    if (valid.is_error()) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID, valid.error()->what(),
                                "AllocationManager", bot_id);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (allocations_.count(bot_id)) {
        return make_error<void>(ErrorCode::BOT_ALREADY_REGISTERED,
                                "Bot " + bot_id + " already has an allocation",
                                "AllocationManager", bot_id);
    }

    Amount amount = total_balance_ * config.allocation_percentage;
    Amount allocated = total_allocated_unsafe();
    if (allocated + amount > total_balance_) {
        return make_error<void>(ErrorCode::EXCEEDS_ALLOCATION,
                                "Allocation $" + format_amount(amount) +
                                    " would exceed total balance $" +
                                    format_amount(total_balance_) + " (already allocated: $" +
                                    format_amount(allocated) + ")",
                                "AllocationManager", bot_id);
    }

    auto now = std::chrono::system_clock::now();
    BotAllocation allocation;
    allocation.bot_id = bot_id;
    allocation.symbol = config.symbol;
    allocation.allocated_balance = amount;
    allocation.available_balance = amount;
    allocation.leverage = config.leverage;
    allocation.allocation_percentage = config.allocation_percentage;
    allocation.last_updated = now;
    allocations_[bot_id] = allocation;

    AllocationEvent event;
    event.timestamp = now;
    event.type = EventType::ALLOCATE;
    event.bot_id = bot_id;
    event.amount = amount;
    event.description = "Initial allocation: " + format_percent(config.allocation_percentage) +
                        " = $" + format_amount(amount);
    event.after = allocations_;
    push_event_unsafe(std::move(event));

    INFO("Allocated $" << format_amount(amount) << " to " << bot_id << " (" << config.symbol
                       << ", " << config.leverage << "x)");
    return Result<void>();
}

Result<BotAllocation> AllocationManager::deallocate_from_bot(const std::string& bot_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = allocations_.find(bot_id);
    if (it == allocations_.end()) {
        return make_error<BotAllocation>(ErrorCode::BOT_NOT_REGISTERED,
                                         "Bot " + bot_id + " has no allocation",
                                         "AllocationManager", bot_id);
    }

    if (it->second.current_position > 0.0) {
        return make_error<BotAllocation>(ErrorCode::CONFIGURATION_INVALID,
                                         "Cannot deallocate from bot " + bot_id +
                                             " with open position: $" +
                                             format_amount(it->second.current_position),
                                         "AllocationManager", bot_id);
    }

    BotAllocation removed = it->second;
    allocations_.erase(it);

    AllocationEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.type = EventType::DEALLOCATE;
    event.bot_id = bot_id;
    event.amount = removed.allocated_balance;
    event.description = "Deallocated $" + format_amount(removed.allocated_balance);
    event.after = allocations_;
    push_event_unsafe(std::move(event));

    INFO("Deallocated $" << format_amount(removed.allocated_balance) << " from " << bot_id);
    return removed;
}

Result<void> AllocationManager::update_bot_position(const std::string& bot_id,
                                                    Amount position_value, Price avg_price,
                                                    double leverage) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = allocations_.find(bot_id);
    if (it == allocations_.end()) {
        return not_registered(bot_id);
    }

    if (position_value < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Position value cannot be negative: " +
                                    format_amount(position_value),
                                "AllocationManager", bot_id);
    }

    auto leverage_check = leverage_calculator_.validate_leverage(leverage);
    if (leverage_check.is_error()) {
        return make_error<void>(ErrorCode::INVALID_LEVERAGE, leverage_check.error()->what(),
                                "AllocationManager", bot_id);
    }

    BotAllocation& allocation = it->second;
    Amount margin = leverage_calculator_.calculate_required_margin(position_value, leverage);
    if (margin > allocation.allocated_balance) {
        return make_error<void>(ErrorCode::EXCEEDS_ALLOCATION,
                                "Margin required $" + format_amount(margin) +
                                    " exceeds allocated balance $" +
                                    format_amount(allocation.allocated_balance),
                                "AllocationManager", bot_id);
    }

    BotAllocation before = allocation;
    allocation.current_position = position_value;
    allocation.average_price = avg_price;
    allocation.leverage = leverage;
    allocation.position_margin_used = margin;
    allocation.used_balance = margin;
    allocation.available_balance = allocation.allocated_balance - margin;
    allocation.last_updated = std::chrono::system_clock::now();

    AllocationEvent event;
    event.timestamp = allocation.last_updated;
    event.type = EventType::POSITION_UPDATE;
    event.bot_id = bot_id;
    event.amount = position_value;
    event.description = "Position $" + format_amount(position_value) + " @ " +
                        format_amount(avg_price) + " with " + format_amount(leverage) +
                        "x, margin $" + format_amount(margin);
    event.before = std::map<std::string, BotAllocation>{{bot_id, before}};
    event.after = std::map<std::string, BotAllocation>{{bot_id, allocation}};
    push_event_unsafe(std::move(event));

    DEBUG("Position updated for " << bot_id << ": $" << format_amount(position_value)
                                  << ", margin $" << format_amount(margin));
    return Result<void>();
}

Result<void> AllocationManager::update_unrealized_pnl(const std::string& bot_id, Amount pnl) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = allocations_.find(bot_id);
    if (it == allocations_.end()) {
        return not_registered(bot_id);
    }

    it->second.unrealized_pnl = pnl;
    it->second.last_updated = std::chrono::system_clock::now();
    return Result<void>();
}

Result<void> AllocationManager::set_allocated_balance(const std::string& bot_id, Amount amount) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = allocations_.find(bot_id);
    if (it == allocations_.end()) {
        return not_registered(bot_id);
    }

    BotAllocation& allocation = it->second;
    if (amount < allocation.used_balance) {
        return make_error<void>(ErrorCode::INSUFFICIENT_MARGIN,
                                "Balance $" + format_amount(amount) + " is below used margin $" +
                                    format_amount(allocation.used_balance),
                                "AllocationManager", bot_id);
    }

    Amount others = total_allocated_unsafe() - allocation.allocated_balance;
    if (others + amount > total_balance_ + kBalanceTolerance) {
        return make_error<void>(ErrorCode::EXCEEDS_ALLOCATION,
                                "Balance $" + format_amount(amount) +
                                    " would exceed total balance $" +
                                    format_amount(total_balance_) + " (others hold $" +
                                    format_amount(others) + ")",
                                "AllocationManager", bot_id);
    }

    BotAllocation before = allocation;
    allocation.allocated_balance = amount;
    allocation.available_balance = amount - allocation.used_balance;
    allocation.last_updated = std::chrono::system_clock::now();

    AllocationEvent event;
    event.timestamp = allocation.last_updated;
    event.type = amount >= before.allocated_balance ? EventType::ALLOCATE : EventType::DEALLOCATE;
    event.bot_id = bot_id;
    event.amount = amount - before.allocated_balance;
    event.description = "Balance set: $" + format_amount(before.allocated_balance) + " -> $" +
                        format_amount(amount);
    event.before = std::map<std::string, BotAllocation>{{bot_id, before}};
    event.after = std::map<std::string, BotAllocation>{{bot_id, allocation}};
    push_event_unsafe(std::move(event));

    INFO("Allocated balance for " << bot_id << " set to $" << format_amount(amount));
    return Result<void>();
}

Result<void> AllocationManager::record_profit(const std::string& bot_id, Amount profit,
                                              bool share_profit) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = allocations_.find(bot_id);
    if (it == allocations_.end()) {
        return not_registered(bot_id);
    }

    auto now = std::chrono::system_clock::now();
    it->second.realized_pnl += profit;
    it->second.last_updated = now;
    total_profit_ += profit;

    AllocationEvent record;
    record.timestamp = now;
    record.type = EventType::PROFIT_RECORD;
    record.bot_id = bot_id;
    record.amount = profit;
    record.description = "Profit recorded: $" + format_amount(profit) + " (Total: $" +
                         format_amount(it->second.realized_pnl) + ")";
    push_event_unsafe(std::move(record));

    INFO("Profit recorded for " << bot_id << ": $" << format_amount(profit));

    if (!share_profit || profit <= 0.0) {
        return Result<void>();
    }

    auto shares = distributor_->distribute(bot_id, profit, allocations_);
    if (shares.empty()) {
        DEBUG("No profit redistribution for " << bot_id << " under "
                                              << allocation_strategy_to_string(strategy()));
        return Result<void>();
    }

    total_balance_ += profit;
    for (const auto& [target, amount] : shares) {
        auto target_it = allocations_.find(target);
        if (target_it == allocations_.end()) {
            continue;
        }
        target_it->second.allocated_balance += amount;
        target_it->second.available_balance += amount;
        target_it->second.last_updated = now;
    }

    AllocationEvent share;
    share.timestamp = now;
    share.type = EventType::PROFIT_SHARE;
    share.bot_id = bot_id;
    share.amount = profit;
    share.description = "Profit $" + format_amount(profit) + " redistributed (" +
                        allocation_strategy_to_string(strategy()) + ") across " +
                        std::to_string(shares.size()) + " bots";
    share.after = allocations_;
    push_event_unsafe(std::move(share));

    INFO("Profit $" << format_amount(profit) << " from " << bot_id << " shared across "
                    << shares.size() << " bots");
    return Result<void>();
}

RebalanceCheck AllocationManager::check_rebalance_needed() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    RebalanceCheck check;
    auto elapsed = std::chrono::system_clock::now() - last_rebalance_;
    if (elapsed < rebalance_config_.rebalance_interval) {
        return check;
    }

    for (const auto& [bot_id, allocation] : allocations_) {
        double current = allocation.allocated_balance / total_balance_;
        double target = allocation.allocation_percentage;
        double deviation = std::abs(current - target);
        if (deviation > rebalance_config_.rebalance_threshold) {
            check.needed = true;
            check.reasons.push_back("Bot " + bot_id + " drift: " + format_percent(current) +
                                    " vs target " + format_percent(target) + " (deviation: " +
                                    format_percent(deviation) + ")");
        }
    }
    return check;
}

RebalanceReport AllocationManager::execute_rebalance() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    RebalanceReport report;
    auto before = allocations_;
    auto now = std::chrono::system_clock::now();

    struct Adjustment {
        std::string bot_id;
        Amount target;
        Amount difference;
    };
    std::vector<Adjustment> adjustments;

    for (const auto& [bot_id, allocation] : allocations_) {
        Amount target = total_balance_ * allocation.allocation_percentage;
        Amount difference = target - allocation.allocated_balance;
        if (std::abs(difference) <= rebalance_config_.min_rebalance_amount) {
            continue;
        }
        if (target < allocation.used_balance) {
            report.skipped.push_back("Bot " + bot_id + ": target $" + format_amount(target) +
                                     " below used margin $" +
                                     format_amount(allocation.used_balance));
            continue;
        }
        adjustments.push_back({bot_id, target, difference});
    }

    // Reductions first so the ledger stays within the total balance throughout
    std::stable_sort(adjustments.begin(), adjustments.end(),
                     [](const Adjustment& a, const Adjustment& b) {
                         return a.difference < b.difference;
                     });

    for (const auto& adjustment : adjustments) {
        BotAllocation& allocation = allocations_[adjustment.bot_id];
        Amount current = allocation.allocated_balance;
        if (adjustment.difference > 0.0 &&
            total_allocated_unsafe() + adjustment.difference > total_balance_ + kBalanceTolerance) {
            report.skipped.push_back("Bot " + adjustment.bot_id + ": increase to $" +
                                     format_amount(adjustment.target) +
                                     " would exceed total balance");
            continue;
        }

        allocation.allocated_balance = adjustment.target;
        allocation.available_balance = adjustment.target - allocation.used_balance;
        allocation.last_updated = now;
        report.actions.push_back("Bot " + adjustment.bot_id + ": $" + format_amount(current) +
                                 " -> $" + format_amount(adjustment.target));
        ++report.adjustments;
    }

    for (const auto& reason : report.skipped) {
        WARN("Rebalance skipped " << reason);
    }

    if (report.adjustments == 0) {
        return report;
    }

    last_rebalance_ = now;

    AllocationEvent event;
    event.timestamp = now;
    event.type = EventType::REBALANCE;
    event.bot_id = "SYSTEM";
    event.description =
        "Portfolio rebalanced: " + std::to_string(report.adjustments) + " adjustments";
    event.before = std::move(before);
    event.after = allocations_;
    push_event_unsafe(std::move(event));

    INFO("Portfolio rebalanced: " << report.adjustments << " adjustments, "
                                  << report.skipped.size() << " skipped");
    return report;
}

Result<BotAllocation> AllocationManager::get_allocation(const std::string& bot_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = allocations_.find(bot_id);
    if (it == allocations_.end()) {
        return make_error<BotAllocation>(ErrorCode::BOT_NOT_REGISTERED,
                                         "Bot " + bot_id + " has no allocation",
                                         "AllocationManager", bot_id);
    }
    return it->second;
}

std::map<std::string, BotAllocation> AllocationManager::get_all_allocations() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return allocations_;
}

PortfolioSummary AllocationManager::get_portfolio_summary() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    PortfolioSummary summary;
    summary.total_balance = total_balance_;
    for (const auto& [_, allocation] : allocations_) {
        summary.total_allocated += allocation.allocated_balance;
        summary.total_used += allocation.used_balance;
        summary.total_available += allocation.available_balance;
        summary.total_position += allocation.current_position;
        summary.total_realized_pnl += allocation.realized_pnl;
        summary.total_unrealized_pnl += allocation.unrealized_pnl;
    }
    summary.active_bots = static_cast<int>(allocations_.size());
    summary.last_rebalance = last_rebalance_;
    summary.history_size = history_.size();

    if (total_balance_ > 0.0) {
        summary.utilization_percent = summary.total_used / total_balance_ * 100.0;
        summary.allocation_percent = summary.total_allocated / total_balance_ * 100.0;
        summary.pnl_percent =
            (summary.total_realized_pnl + summary.total_unrealized_pnl) / total_balance_ * 100.0;
    }
    return summary;
}

std::vector<AllocationEvent> AllocationManager::get_allocation_history(size_t limit) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (limit == 0 || limit > history_.size()) {
        limit = history_.size();
    }
    return std::vector<AllocationEvent>(history_.end() - static_cast<std::ptrdiff_t>(limit),
                                        history_.end());
}

void AllocationManager::record_event(EventType type, const std::string& bot_id, Amount amount,
                                     const std::string& description) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    AllocationEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.type = type;
    event.bot_id = bot_id;
    event.amount = amount;
    event.description = description;
    push_event_unsafe(std::move(event));
}

Amount AllocationManager::total_balance() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return total_balance_;
}

Amount AllocationManager::total_profit() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return total_profit_;
}

Timestamp AllocationManager::last_rebalance() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_rebalance_;
}

bool AllocationManager::has_bot(const std::string& bot_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return allocations_.count(bot_id) > 0;
}

size_t AllocationManager::bot_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return allocations_.size();
}

RebalanceConfig AllocationManager::rebalance_config() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rebalance_config_;
}

void AllocationManager::set_rebalance_config(const RebalanceConfig& config) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rebalance_config_ = config;
}

PortfolioState AllocationManager::export_state() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    PortfolioState state;
    state.total_balance = total_balance_;
    state.total_profit = total_profit_;
    state.allocations = allocations_;
    state.last_updated = std::chrono::system_clock::now();
    return state;
}

Result<void> AllocationManager::restore_state(const PortfolioState& state) {
    auto valid = validate_state_integrity(state);
    if (valid.is_error()) {
        return valid;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    adopt_unsafe(state);
    return Result<void>();
}

LedgerCheckpoint AllocationManager::checkpoint() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    LedgerCheckpoint checkpoint;
    checkpoint.state.total_balance = total_balance_;
    checkpoint.state.total_profit = total_profit_;
    checkpoint.state.allocations = allocations_;
    checkpoint.history = history_;
    checkpoint.last_rebalance = last_rebalance_;
    return checkpoint;
}

void AllocationManager::rollback(const LedgerCheckpoint& checkpoint) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    adopt_unsafe(checkpoint.state);
    history_ = checkpoint.history;
    last_rebalance_ = checkpoint.last_rebalance;
}

Result<SyncDiff> AllocationManager::sync_from_state(const PortfolioState& state) {
    auto valid = validate_state_integrity(state);
    if (valid.is_error()) {
        return forward_error<SyncDiff>(*valid.error());
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    SyncDiff diff;
    for (const auto& [bot_id, remote] : state.allocations) {
        auto local = allocations_.find(bot_id);
        if (local == allocations_.end()) {
            diff.added.push_back(bot_id);
        } else if (allocation_differs(local->second, remote)) {
            diff.changed.push_back(bot_id);
        }
    }
    for (const auto& [bot_id, _] : allocations_) {
        if (!state.allocations.count(bot_id)) {
            diff.removed.push_back(bot_id);
        }
    }

    adopt_unsafe(state);

    if (!diff.empty()) {
        DEBUG("Adopted shared state: " << diff.added.size() << " added, " << diff.removed.size()
                                       << " removed, " << diff.changed.size() << " changed");
    }
    return diff;
}

Amount AllocationManager::total_allocated_unsafe() const {
    Amount total = 0.0;
    for (const auto& [_, allocation] : allocations_) {
        total += allocation.allocated_balance;
    }
    return total;
}

void AllocationManager::push_event_unsafe(AllocationEvent event) {
    history_.push_back(std::move(event));
    while (history_.size() > history_capacity_) {
        history_.pop_front();
    }
}

void AllocationManager::adopt_unsafe(const PortfolioState& state) {
    total_balance_ = state.total_balance;
    total_profit_ = state.total_profit;
    allocations_ = state.allocations;
}

}  // namespace margin_ledger
