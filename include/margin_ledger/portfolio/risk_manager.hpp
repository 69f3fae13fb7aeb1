// include/margin_ledger/portfolio/risk_manager.hpp
#pragma once

#include <map>
#include <mutex>
#include <string>
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/types.hpp"
#include "margin_ledger/portfolio/types.hpp"

namespace margin_ledger {

/**
 * @brief Capital plus realized profit plus open mark-to-market PnL
 *
 * Realized profit comes from the ledger total, so it stays in the value
 * after the bot that earned it is unregistered.
 */
Amount portfolio_value(Amount total_balance, Amount total_profit,
                       const std::map<std::string, BotAllocation>& allocations);

/**
 * @brief Policy checks against portfolio-wide limits
 *
 * Holds no ledger state of its own; every check works on the allocations
 * handed in by the caller.
 */
class RiskManager {
public:
    explicit RiskManager(PortfolioConfig config);

    /**
     * @brief Gate a new or resized position
     * @param bot_id Bot opening the position
     * @param position_value Notional value, must be positive
     * @param leverage Requested leverage, at most 125x
     * @return CONFIGURATION_INVALID or INVALID_LEVERAGE on rejection
     */
    Result<void> validate_new_position(const std::string& bot_id, Amount position_value,
                                       double leverage) const;

    /**
     * @brief Check an exposure figure against max_total_exposure
     * @return false if the balance is non-positive or the ratio is over the limit
     */
    bool is_within_risk_limits(Amount total_exposure, Amount available_balance) const;

    /**
     * @brief Check aggregate exposure and drawdown from peak
     * @param allocations Current ledger
     * @param total_balance Portfolio capital
     * @param current_value Portfolio value as given by portfolio_value
     * @param peak_value Highest portfolio value observed so far
     * @return EXCEEDS_RISK_LIMIT if either limit is breached
     */
    Result<void> check_portfolio_limits(const std::map<std::string, BotAllocation>& allocations,
                                        Amount total_balance, Amount current_value,
                                        Amount peak_value) const;

    /**
     * @brief Aggregate risk figures from the ledger
     * @return Metrics, or INVALID_ARGUMENT for a non-positive balance
     */
    Result<RiskMetrics> get_risk_metrics(const std::map<std::string, BotAllocation>& allocations,
                                         Amount total_balance, Amount current_value,
                                         Amount peak_value) const;

    Result<void> update_config(const PortfolioConfig& config);

    PortfolioConfig get_config() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_;
    }

private:
    PortfolioConfig config_;
    mutable std::mutex mutex_;
};

}  // namespace margin_ledger
