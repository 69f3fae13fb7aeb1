// src/portfolio/risk_manager.cpp

#include "margin_ledger/portfolio/risk_manager.hpp"
#include <algorithm>
#include "margin_ledger/core/logger.hpp"

namespace margin_ledger {

namespace {

double drawdown_percent(Amount current_value, Amount peak_value) {
    if (peak_value <= 0.0 || current_value >= peak_value) {
        return 0.0;
    }
    return (peak_value - current_value) / peak_value * 100.0;
}

}  // namespace

Amount portfolio_value(Amount total_balance, Amount total_profit,
                       const std::map<std::string, BotAllocation>& allocations) {
    Amount value = total_balance + total_profit;
    for (const auto& [_, allocation] : allocations) {
        value += allocation.unrealized_pnl;
    }
    return value;
}

RiskManager::RiskManager(PortfolioConfig config) : config_(std::move(config)) {
    Logger::ensure_initialized();
}

Result<void> RiskManager::validate_new_position(const std::string& bot_id,
                                                Amount position_value, double leverage) const {
    if (!(position_value > 0.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "Position value must be greater than 0", "RiskManager", bot_id);
    }
    if (leverage > kMaxLeverage) {
        return make_error<void>(ErrorCode::INVALID_LEVERAGE,
                                "Leverage " + std::to_string(leverage) +
                                    "x exceeds maximum allowed 125x",
                                "RiskManager", bot_id);
    }
    return Result<void>();
}

bool RiskManager::is_within_risk_limits(Amount total_exposure, Amount available_balance) const {
    if (available_balance <= 0.0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return total_exposure / available_balance <= config_.max_total_exposure;
}

Result<void> RiskManager::check_portfolio_limits(
    const std::map<std::string, BotAllocation>& allocations, Amount total_balance,
    Amount current_value, Amount peak_value) const {
    if (!(total_balance > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Total balance must be positive",
                                "RiskManager");
    }

    Amount exposure = 0.0;
    for (const auto& [_, allocation] : allocations) {
        exposure += allocation.current_position;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    double ratio = exposure / total_balance;
    if (ratio > config_.max_total_exposure) {
        return make_error<void>(ErrorCode::EXCEEDS_RISK_LIMIT,
                                "Total exposure " + std::to_string(ratio) +
                                    "x exceeds limit " +
                                    std::to_string(config_.max_total_exposure) + "x",
                                "RiskManager");
    }

    double drawdown = drawdown_percent(current_value, peak_value);
    if (drawdown > config_.max_drawdown_percent) {
        return make_error<void>(ErrorCode::EXCEEDS_RISK_LIMIT,
                                "Drawdown " + std::to_string(drawdown) + "% exceeds limit " +
                                    std::to_string(config_.max_drawdown_percent) + "%",
                                "RiskManager");
    }

    return Result<void>();
}

Result<RiskMetrics> RiskManager::get_risk_metrics(
    const std::map<std::string, BotAllocation>& allocations, Amount total_balance,
    Amount current_value, Amount peak_value) const {
    if (!(total_balance > 0.0)) {
        return make_error<RiskMetrics>(ErrorCode::INVALID_ARGUMENT,
                                       "Total balance must be positive", "RiskManager");
    }

    RiskMetrics metrics;
    Amount leveraged_exposure = 0.0;
    Amount largest_position = 0.0;
    Amount total_margin = 0.0;
    Amount total_allocated = 0.0;

    for (const auto& [_, allocation] : allocations) {
        metrics.total_exposure += allocation.current_position;
        metrics.exposure_by_symbol[allocation.symbol] += allocation.current_position;
        leveraged_exposure += allocation.current_position * allocation.leverage;
        largest_position = std::max(largest_position, allocation.current_position);
        total_margin += allocation.position_margin_used;
        total_allocated += allocation.allocated_balance;
    }

    if (metrics.total_exposure > 0.0) {
        metrics.weighted_leverage = leveraged_exposure / metrics.total_exposure;
        metrics.concentration_risk = largest_position / metrics.total_exposure;
    } else {
        metrics.weighted_leverage = 1.0;
    }

    if (total_allocated > 0.0) {
        metrics.margin_utilization = total_margin / total_allocated;
    }

    metrics.drawdown_from_peak = drawdown_percent(current_value, peak_value);

    // A full liquidation loses the posted margin
    metrics.worst_case_drawdown = total_margin / total_balance * 100.0;

    return metrics;
}

Result<void> RiskManager::update_config(const PortfolioConfig& config) {
    auto valid = config.validate();
    if (valid.is_error()) {
        return valid;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    INFO("Risk limits updated: max exposure " << config_.max_total_exposure
                                              << "x, max drawdown "
                                              << config_.max_drawdown_percent << "%");
    return Result<void>();
}

}  // namespace margin_ledger
