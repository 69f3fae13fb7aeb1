// src/portfolio/portfolio_manager.cpp

#include "margin_ledger/portfolio/portfolio_manager.hpp"
#include <unistd.h>
#include <iomanip>
#include <sstream>
#include "margin_ledger/core/logger.hpp"
#include "margin_ledger/core/time_utils.hpp"
#include "margin_ledger/storage/file_state_store.hpp"

namespace margin_ledger {

namespace {

std::string format_pct(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << "%";
    return ss.str();
}

}  // namespace

PortfolioManager::PortfolioManager(PortfolioConfig config, std::shared_ptr<StateStore> store,
                                   std::string instance_id)
    : config_(std::move(config)), store_(std::move(store)), instance_id_(std::move(instance_id)) {
    Logger::ensure_initialized();
    Logger::register_component("PortfolioManager");

    if (instance_id_.empty()) {
        instance_id_ = current_hostname() + ":" + std::to_string(::getpid());
    }
    if (!store_) {
        store_ = std::make_shared<FileStateStore>(config_.shared_state_file);
    }
}

PortfolioManager::~PortfolioManager() {
    auto closed = close();
    if (closed.is_error()) {
        ERROR("Error closing portfolio manager " << instance_id_ << ": "
                                                 << closed.error()->what());
    }
    if (registered_) {
        auto unregistered =
            StateManager::instance().unregister_component("PORTFOLIO_MANAGER_" + instance_id_);
        if (unregistered.is_error()) {
            WARN("Failed to unregister portfolio manager: " << unregistered.error()->what());
        }
    }
}

Result<void> PortfolioManager::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return Result<void>();
    }

    if (config_.normalize_exposure_limit()) {
        WARN("Max total exposure out of range, using default of " << config_.max_total_exposure
                                                                  << "x");
    }

    auto valid = config_.validate();
    if (valid.is_error()) {
        ERROR("Invalid portfolio configuration: " << valid.error()->what());
        return valid;
    }

    // validate() has already parsed both durations
    lock_timeout_ = core::parse_duration(config_.lock_timeout).value();
    RebalanceConfig rebalance;
    rebalance.rebalance_interval = core::parse_duration(config_.rebalance_frequency).value();

    auto manager = std::make_shared<AllocationManager>(config_.total_balance,
                                                       config_.allocation_strategy, rebalance);

    auto loaded = store_->load();
    if (loaded.is_ok()) {
        auto adopted = manager->sync_from_state(loaded.value());
        if (adopted.is_error()) {
            ERROR("Persisted state rejected: " << adopted.error()->what());
            return forward_error<void>(*adopted.error());
        }
        INFO("Loaded shared state from " << store_->location() << ": "
                                         << manager->bot_count() << " bots, balance $"
                                         << manager->total_balance());
    } else if (loaded.error()->code() == ErrorCode::FILE_NOT_FOUND) {
        INFO("No shared state at " << store_->location() << ", starting with balance $"
                                   << config_.total_balance);
    } else {
        ERROR("Failed to load shared state: " << loaded.error()->what());
        return forward_error<void>(*loaded.error());
    }

    allocation_manager_ = std::move(manager);
    risk_manager_ = std::make_unique<RiskManager>(config_);
    peak_value_ = current_value_unsafe();

    const std::string component_id = "PORTFOLIO_MANAGER_" + instance_id_;
    if (!registered_) {
        ComponentInfo info{ComponentType::PORTFOLIO_MANAGER,
                           ComponentState::INITIALIZED,
                           component_id,
                           "",
                           std::chrono::system_clock::now(),
                           {}};
        auto registered = StateManager::instance().register_component(info);
        if (registered.is_error()) {
            return registered;
        }
        registered_ = true;
    } else {
        auto reset = StateManager::instance().update_state(component_id,
                                                           ComponentState::INITIALIZED);
        if (reset.is_error()) {
            return reset;
        }
    }

    initialized_ = true;
    report_state(ComponentState::RUNNING);
    INFO("Portfolio manager " << instance_id_ << " initialized ("
                              << allocation_strategy_to_string(config_.allocation_strategy)
                              << ", max exposure " << config_.max_total_exposure << "x)");
    return Result<void>();
}

Result<void> PortfolioManager::check_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "Portfolio manager is not initialized", "PortfolioManager");
    }
    return Result<void>();
}

LedgerCommitOptions PortfolioManager::commit_options() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerCommitOptions options;
    options.holder = instance_id_;
    options.lock_timeout = lock_timeout_;
    options.global_settings = config_;
    return options;
}

Result<void> PortfolioManager::commit(const std::function<Result<void>()>& mutate) {
    auto ready = check_initialized();
    if (ready.is_error()) {
        return ready;
    }
    return commit_ledger_change(store_, *allocation_manager_, commit_options(), mutate);
}

Result<void> PortfolioManager::register_bot(const std::string& bot_id, const BotConfig& config) {
    auto result = commit([&]() { return allocation_manager_->allocate_to_bot(bot_id, config); });
    if (result.is_error()) {
        WARN("Failed to register bot " << bot_id << ": " << result.error()->to_string());
        return result;
    }
    INFO("Bot " << bot_id << " registered for " << config.symbol);
    return result;
}

Result<void> PortfolioManager::unregister_bot(const std::string& bot_id) {
    auto result = commit([&]() -> Result<void> {
        auto removed = allocation_manager_->deallocate_from_bot(bot_id);
        if (removed.is_error()) {
            return forward_error<void>(*removed.error());
        }
        return Result<void>();
    });
    if (result.is_error()) {
        WARN("Failed to unregister bot " << bot_id << ": " << result.error()->to_string());
        return result;
    }
    INFO("Bot " << bot_id << " unregistered");
    return result;
}

Result<Amount> PortfolioManager::get_available_balance(const std::string& bot_id) const {
    auto allocation = get_bot_allocation(bot_id);
    if (allocation.is_error()) {
        return forward_error<Amount>(*allocation.error());
    }
    return allocation.value().available_balance;
}

Result<Amount> PortfolioManager::get_required_margin(const std::string& bot_id,
                                                     Amount position_value) const {
    auto allocation = get_bot_allocation(bot_id);
    if (allocation.is_error()) {
        return forward_error<Amount>(*allocation.error());
    }
    return leverage_calculator_.calculate_required_margin(position_value,
                                                          allocation.value().leverage);
}

Result<void> PortfolioManager::update_bot_balance(const std::string& bot_id, Amount new_balance) {
    auto result = commit(
        [&]() { return allocation_manager_->set_allocated_balance(bot_id, new_balance); });
    if (result.is_ok()) {
        INFO("Balance updated for " << bot_id << ": $" << new_balance);
    }
    return result;
}

Result<void> PortfolioManager::update_position(const std::string& bot_id, Amount position_value,
                                               Price avg_price, double leverage) {
    auto ready = check_initialized();
    if (ready.is_error()) {
        return ready;
    }

    // A zero value closes the position and is never gated
    if (position_value > 0.0) {
        auto allowed = risk_manager_->validate_new_position(bot_id, position_value, leverage);
        if (allowed.is_error()) {
            WARN("Position rejected for " << bot_id << ": " << allowed.error()->what());
            return allowed;
        }
    }

    auto result = commit([&]() -> Result<void> {
        auto allocations = allocation_manager_->get_all_allocations();
        auto it = allocations.find(bot_id);
        if (it == allocations.end()) {
            return make_error<void>(ErrorCode::BOT_NOT_REGISTERED,
                                    "Bot " + bot_id + " is not registered", "PortfolioManager",
                                    bot_id);
        }

        Amount exposure = position_value - it->second.current_position;
        for (const auto& [_, allocation] : allocations) {
            exposure += allocation.current_position;
        }
        if (position_value > 0.0 &&
            !risk_manager_->is_within_risk_limits(exposure,
                                                  allocation_manager_->total_balance())) {
            return make_error<void>(ErrorCode::EXCEEDS_RISK_LIMIT,
                                    "Total exposure $" + std::to_string(exposure) +
                                        " would exceed the portfolio limit",
                                    "PortfolioManager", bot_id);
        }

        return allocation_manager_->update_bot_position(bot_id, position_value, avg_price,
                                                        leverage);
    });

    if (result.is_error()) {
        WARN("Position update failed for " << bot_id << ": " << result.error()->to_string());
        return result;
    }

    update_peak_value();
    INFO("Position updated for " << bot_id << ": $" << position_value << " @ " << avg_price
                                 << " (" << leverage << "x)");
    return result;
}

Result<void> PortfolioManager::update_unrealized_pnl(const std::string& bot_id, Amount pnl) {
    auto result =
        commit([&]() { return allocation_manager_->update_unrealized_pnl(bot_id, pnl); });
    if (result.is_ok()) {
        update_peak_value();
    }
    return result;
}

Result<Amount> PortfolioManager::get_total_portfolio_value() const {
    auto ready = check_initialized();
    if (ready.is_error()) {
        return forward_error<Amount>(*ready.error());
    }
    return current_value_unsafe();
}

Result<BotAllocation> PortfolioManager::get_bot_allocation(const std::string& bot_id) const {
    auto ready = check_initialized();
    if (ready.is_error()) {
        return forward_error<BotAllocation>(*ready.error());
    }
    return allocation_manager_->get_allocation(bot_id);
}

Result<void> PortfolioManager::record_profit(const std::string& bot_id, Amount profit) {
    bool share = get_config().profit_sharing_enabled;
    auto result =
        commit([&]() { return allocation_manager_->record_profit(bot_id, profit, share); });
    if (result.is_error()) {
        WARN("Failed to record profit for " << bot_id << ": " << result.error()->to_string());
        return result;
    }
    update_peak_value();
    return result;
}

Result<Amount> PortfolioManager::get_total_profit() const {
    auto ready = check_initialized();
    if (ready.is_error()) {
        return forward_error<Amount>(*ready.error());
    }
    return allocation_manager_->total_profit();
}

Result<void> PortfolioManager::save_state() {
    return commit([]() { return Result<void>(); });
}

Result<void> PortfolioManager::load_state() {
    auto ready = check_initialized();
    if (ready.is_error()) {
        return ready;
    }

    auto refreshed =
        refresh_from_store(store_, *allocation_manager_, commit_options().lock_timeout);
    if (refreshed.is_error()) {
        return forward_error<void>(*refreshed.error());
    }
    update_peak_value();
    return Result<void>();
}

Result<RiskMetrics> PortfolioManager::get_risk_metrics() const {
    auto ready = check_initialized();
    if (ready.is_error()) {
        return forward_error<RiskMetrics>(*ready.error());
    }

    Amount peak = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        peak = peak_value_;
    }
    auto allocations = allocation_manager_->get_all_allocations();
    Amount total_balance = allocation_manager_->total_balance();
    Amount current = portfolio_value(total_balance, allocation_manager_->total_profit(),
                                     allocations);
    return risk_manager_->get_risk_metrics(allocations, total_balance, current, peak);
}

Result<PortfolioHealth> PortfolioManager::get_portfolio_health() const {
    auto ready = check_initialized();
    if (ready.is_error()) {
        return forward_error<PortfolioHealth>(*ready.error());
    }

    PortfolioConfig config = get_config();
    auto allocations = allocation_manager_->get_all_allocations();
    Amount total_balance = allocation_manager_->total_balance();

    PortfolioHealth health;
    health.last_check = std::chrono::system_clock::now();
    health.active_bots = static_cast<int>(allocations.size());
    health.total_value = current_value_unsafe();
    health.total_pnl = allocation_manager_->total_profit();

    for (const auto& [_, allocation] : allocations) {
        health.total_exposure += allocation.current_position;
    }
    if (total_balance > 0.0) {
        health.pnl_percent = health.total_pnl / total_balance * 100.0;
        health.exposure_percent = health.total_exposure / total_balance * 100.0;
    }

    if (health.exposure_percent > config.max_total_exposure * 100.0) {
        health.status = HealthStatus::CRITICAL;
        health.errors.push_back("Total exposure " + format_pct(health.exposure_percent) +
                                " exceeds limit " +
                                format_pct(config.max_total_exposure * 100.0));
    } else if (health.exposure_percent > config.max_total_exposure * 80.0) {
        health.status = HealthStatus::WARNING;
        health.warnings.push_back("High exposure: " + format_pct(health.exposure_percent));
    }

    if (config.max_drawdown_percent > 0.0 && health.pnl_percent < -config.max_drawdown_percent) {
        health.status = HealthStatus::CRITICAL;
        health.errors.push_back("Drawdown " + format_pct(-health.pnl_percent) + " exceeds limit " +
                                format_pct(config.max_drawdown_percent));
    }

    for (const auto& [bot_id, allocation] : allocations) {
        if (allocation.allocated_balance > 0.0 &&
            allocation.position_margin_used > allocation.allocated_balance * 0.9) {
            if (health.status == HealthStatus::HEALTHY) {
                health.status = HealthStatus::WARNING;
            }
            health.warnings.push_back(
                "Bot " + bot_id + " using high margin: " +
                format_pct(allocation.position_margin_used / allocation.allocated_balance * 100.0));
        }
    }

    if (health.status == HealthStatus::CRITICAL && config.emergency_stop_enabled) {
        health.emergency_stop = true;
        ERROR("Emergency stop triggered: " << health.errors.front());
    }

    return health;
}

bool PortfolioManager::is_healthy() const {
    auto health = get_portfolio_health();
    return health.is_ok() && health.value().status == HealthStatus::HEALTHY;
}

Result<void> PortfolioManager::reconfigure(const PortfolioConfig& config) {
    auto ready = check_initialized();
    if (ready.is_error()) {
        return ready;
    }

    PortfolioConfig next = config;
    if (next.normalize_exposure_limit()) {
        WARN("Max total exposure out of range, using default of " << next.max_total_exposure
                                                                  << "x");
    }
    auto valid = next.validate();
    if (valid.is_error()) {
        return valid;
    }

    auto risk_updated = risk_manager_->update_config(next);
    if (risk_updated.is_error()) {
        return risk_updated;
    }

    RebalanceConfig rebalance = allocation_manager_->rebalance_config();
    rebalance.rebalance_interval = core::parse_duration(next.rebalance_frequency).value();
    allocation_manager_->set_rebalance_config(rebalance);

    std::lock_guard<std::mutex> lock(mutex_);
    lock_timeout_ = core::parse_duration(next.lock_timeout).value();
    config_ = next;
    INFO("Portfolio manager " << instance_id_ << " reconfigured");
    return Result<void>();
}

Result<void> PortfolioManager::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) {
            return Result<void>();
        }
    }

    auto saved = save_state();
    if (saved.is_error()) {
        WARN("Failed to save final state: " << saved.error()->what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        initialized_ = false;
    }
    report_state(ComponentState::STOPPED);
    INFO("Portfolio manager " << instance_id_ << " closed");
    return Result<void>();
}

bool PortfolioManager::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

PortfolioConfig PortfolioManager::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

Amount PortfolioManager::current_value_unsafe() const {
    return portfolio_value(allocation_manager_->total_balance(),
                           allocation_manager_->total_profit(),
                           allocation_manager_->get_all_allocations());
}

void PortfolioManager::update_peak_value() {
    Amount value = current_value_unsafe();
    std::lock_guard<std::mutex> lock(mutex_);
    if (value > peak_value_) {
        peak_value_ = value;
    }
}

void PortfolioManager::report_state(ComponentState state, const std::string& message) {
    if (!registered_) {
        return;
    }
    auto updated =
        StateManager::instance().update_state("PORTFOLIO_MANAGER_" + instance_id_, state, message);
    if (updated.is_error()) {
        WARN("Failed to report state: " << updated.error()->what());
    }
}

}  // namespace margin_ledger
