// include/margin_ledger/portfolio/portfolio_manager.hpp
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/state_manager.hpp"
#include "margin_ledger/core/types.hpp"
#include "margin_ledger/portfolio/allocation_manager.hpp"
#include "margin_ledger/portfolio/ledger_commit.hpp"
#include "margin_ledger/portfolio/leverage_calculator.hpp"
#include "margin_ledger/portfolio/risk_manager.hpp"
#include "margin_ledger/portfolio/types.hpp"
#include "margin_ledger/storage/state_store.hpp"

namespace margin_ledger {

/**
 * @brief Entry point for one bot process into the shared portfolio
 *
 * Every mutation runs as a ledger commit against the shared store, so the
 * local ledger always reflects the persisted state it was applied to.
 */
class PortfolioManager {
public:
    /**
     * @brief Constructor
     * @param config Portfolio configuration
     * @param store State store; a FileStateStore on config.shared_state_file when null
     * @param instance_id Name used as lock holder and component id; derived from the pid when empty
     */
    explicit PortfolioManager(PortfolioConfig config, std::shared_ptr<StateStore> store = nullptr,
                              std::string instance_id = "");

    ~PortfolioManager();

    PortfolioManager(const PortfolioManager&) = delete;
    PortfolioManager& operator=(const PortfolioManager&) = delete;

    /**
     * @brief Validate configuration and load or start the shared state
     *
     * A missing state file starts a fresh ledger. A corrupted one fails
     * initialization and is left untouched.
     *
     * @return CONFIGURATION_INVALID, STATE_CORRUPTED or a storage error on failure
     */
    Result<void> initialize();

    Result<void> register_bot(const std::string& bot_id, const BotConfig& config);
    Result<void> unregister_bot(const std::string& bot_id);

    Result<Amount> get_available_balance(const std::string& bot_id) const;

    /**
     * @brief Margin a position would need at the bot's configured leverage
     */
    Result<Amount> get_required_margin(const std::string& bot_id, Amount position_value) const;

    /**
     * @brief Set a bot's allocated balance
     * @return INSUFFICIENT_MARGIN below used margin, EXCEEDS_ALLOCATION above total balance
     */
    Result<void> update_bot_balance(const std::string& bot_id, Amount new_balance);

    /**
     * @brief Report a bot's current position
     *
     * Positions with a positive value pass the risk gate first, and the
     * resulting portfolio exposure must stay within max_total_exposure.
     *
     * @return Risk, leverage or allocation errors; nothing is changed on failure
     */
    Result<void> update_position(const std::string& bot_id, Amount position_value,
                                 Price avg_price, double leverage);

    Result<void> update_unrealized_pnl(const std::string& bot_id, Amount pnl);

    // total balance + total profit + unrealized PnL
    Result<Amount> get_total_portfolio_value() const;

    Result<BotAllocation> get_bot_allocation(const std::string& bot_id) const;

    /**
     * @brief Book profit for a bot, shared across bots when profit sharing is enabled
     */
    Result<void> record_profit(const std::string& bot_id, Amount profit);

    Result<Amount> get_total_profit() const;

    Result<void> save_state();
    Result<void> load_state();

    Result<RiskMetrics> get_risk_metrics() const;
    Result<PortfolioHealth> get_portfolio_health() const;
    bool is_healthy() const;

    /**
     * @brief Swap in a new configuration
     *
     * The capital pool and strategy live in the shared state and are not
     * changed; risk limits, rebalance frequency and lock timeout are.
     */
    Result<void> reconfigure(const PortfolioConfig& config);

    /**
     * @brief Save a final state and stop accepting operations
     *
     * A failed final save is logged. Calling close twice is a no-op.
     */
    Result<void> close();

    bool is_initialized() const;

    PortfolioConfig get_config() const;

    std::shared_ptr<AllocationManager> allocation_manager() const {
        return allocation_manager_;
    }

    std::shared_ptr<StateStore> state_store() const {
        return store_;
    }

    const std::string& instance_id() const {
        return instance_id_;
    }

private:
    Result<void> check_initialized() const;
    Result<void> commit(const std::function<Result<void>()>& mutate);
    LedgerCommitOptions commit_options() const;
    Amount current_value_unsafe() const;
    void update_peak_value();
    void report_state(ComponentState state, const std::string& message = "");

    PortfolioConfig config_;
    std::shared_ptr<StateStore> store_;
    std::shared_ptr<AllocationManager> allocation_manager_;
    std::unique_ptr<RiskManager> risk_manager_;
    LeverageCalculator leverage_calculator_;
    std::string instance_id_;
    Duration lock_timeout_{std::chrono::seconds(5)};
    Amount peak_value_{0.0};
    bool initialized_{false};
    bool registered_{false};
    mutable std::mutex mutex_;
};

}  // namespace margin_ledger
