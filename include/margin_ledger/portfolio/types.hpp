// include/margin_ledger/portfolio/types.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "margin_ledger/core/config_base.hpp"
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/time_utils.hpp"
#include "margin_ledger/core/types.hpp"

namespace margin_ledger {

/**
 * @brief Hard leverage bounds shared by every component
 */
constexpr double kMinLeverage = 1.0;
constexpr double kMaxLeverage = 125.0;

/**
 * @brief How capital and shared profit are spread across bots
 */
enum class AllocationStrategy { EQUAL_WEIGHT, PERFORMANCE_BASED, CUSTOM };

std::string allocation_strategy_to_string(AllocationStrategy strategy);

/**
 * @brief Parse "equal_weight", "performance_based" or "custom"
 * @return Parsed strategy or CONFIGURATION_INVALID
 */
Result<AllocationStrategy> allocation_strategy_from_string(const std::string& name);

/**
 * @brief Kinds of entries in the allocation history
 */
enum class EventType {
    ALLOCATE,
    DEALLOCATE,
    PROFIT_RECORD,
    PROFIT_SHARE,
    REBALANCE,
    REGISTER,
    UNREGISTER,
    POSITION_UPDATE,
    HEARTBEAT
};

std::string event_type_to_string(EventType type);
Result<EventType> event_type_from_string(const std::string& name);

/**
 * @brief Per-bot configuration supplied at registration
 */
struct BotConfig : public ConfigBase {
    std::string symbol;
    double leverage{1.0};
    double allocation_percentage{0.0};  // Fraction of total balance, (0, 1]
    double max_position_size{0.0};      // 0 means unlimited
    std::string category{"linear"};     // linear, spot or inverse

    /**
     * @brief Check registration constraints
     * @return CONFIGURATION_INVALID describing the first violated constraint
     */
    Result<void> validate() const;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["symbol"] = symbol;
        j["leverage"] = leverage;
        j["allocation_percentage"] = allocation_percentage;
        j["max_position_size"] = max_position_size;
        j["category"] = category;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("symbol"))
            symbol = j.at("symbol").get<std::string>();
        if (j.contains("leverage"))
            leverage = j.at("leverage").get<double>();
        if (j.contains("allocation_percentage"))
            allocation_percentage = j.at("allocation_percentage").get<double>();
        if (j.contains("max_position_size"))
            max_position_size = j.at("max_position_size").get<double>();
        if (j.contains("category"))
            category = j.at("category").get<std::string>();
    }
};

/**
 * @brief Ledger entry for one bot
 *
 * Invariants: used_balance == position_margin_used,
 * available_balance == allocated_balance - used_balance and
 * position_margin_used <= allocated_balance.
 */
struct BotAllocation {
    std::string bot_id;
    std::string symbol;
    Amount allocated_balance{0.0};
    Amount used_balance{0.0};
    Amount available_balance{0.0};
    Amount current_position{0.0};  // Notional value
    Price average_price{0.0};
    double leverage{1.0};
    Amount unrealized_pnl{0.0};
    Amount realized_pnl{0.0};
    Amount position_margin_used{0.0};
    double allocation_percentage{0.0};
    Timestamp last_updated{};

    nlohmann::json to_json() const;

    /**
     * @brief Populate from JSON
     * @throws nlohmann::json::exception on missing or mistyped fields
     * @throws PortfolioError on an unparseable timestamp
     */
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Rebalancing thresholds
 */
struct RebalanceConfig : public ConfigBase {
    Amount min_rebalance_amount{10.0};
    double rebalance_threshold{0.1};  // Allowed drift of allocated/total from target
    Duration rebalance_interval{std::chrono::hours(1)};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["min_rebalance_amount"] = min_rebalance_amount;
        j["rebalance_threshold"] = rebalance_threshold;
        j["rebalance_interval"] = core::format_duration(rebalance_interval);
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_rebalance_amount"))
            min_rebalance_amount = j.at("min_rebalance_amount").get<double>();
        if (j.contains("rebalance_threshold"))
            rebalance_threshold = j.at("rebalance_threshold").get<double>();
        if (j.contains("rebalance_interval")) {
            auto parsed = core::parse_duration(j.at("rebalance_interval").get<std::string>());
            rebalance_interval = parsed.value();
        }
    }
};

/**
 * @brief Portfolio-wide configuration
 */
struct PortfolioConfig : public ConfigBase {
    Amount total_balance{1000.0};
    AllocationStrategy allocation_strategy{AllocationStrategy::EQUAL_WEIGHT};
    std::string shared_state_file{"portfolio_state.json"};
    double max_total_exposure{3.0};     // Multiple of total balance
    double max_drawdown_percent{25.0};  // Percent of total balance
    std::string rebalance_frequency{"1h"};
    double risk_limit_per_bot{0.2};
    bool emergency_stop_enabled{true};
    bool profit_sharing_enabled{false};
    std::string lock_timeout{"5s"};

    /**
     * @brief Validate the configuration
     * @return CONFIGURATION_INVALID describing the first violated constraint
     */
    Result<void> validate() const;

    /**
     * @brief Replace an out-of-range exposure limit with the 3x default
     * @return true if the value was replaced
     */
    bool normalize_exposure_limit();

    nlohmann::json to_json() const override;

    /**
     * @throws PortfolioError CONFIGURATION_INVALID on an unknown allocation strategy
     */
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief The unit of cross-process exchange, persisted by the state store
 */
struct PortfolioState {
    Amount total_balance{0.0};
    Amount total_profit{0.0};
    Timestamp last_updated{};
    std::map<std::string, BotAllocation> allocations;
    std::optional<PortfolioConfig> global_settings;
    std::string version{"1.0"};
    std::optional<std::string> lock_holder;
    std::optional<Timestamp> lock_time;

    nlohmann::json to_json() const;

    /**
     * @brief Populate from JSON
     * @throws nlohmann::json::exception on missing or mistyped fields
     * @throws PortfolioError STATE_CORRUPTED on structural violations
     */
    void from_json(const nlohmann::json& j);

    Amount total_allocated() const;
};

/**
 * @brief Check the structural invariants of a state snapshot
 *
 * Positive total balance, non-negative balances, positive leverage, keys
 * matching bot ids and total allocation within total balance + 0.01.
 *
 * @param state Snapshot to validate
 * @return STATE_CORRUPTED describing the first violation
 */
Result<void> validate_state_integrity(const PortfolioState& state);

enum class HealthStatus { HEALTHY, WARNING, CRITICAL };

std::string health_status_to_string(HealthStatus status);

struct PortfolioHealth {
    HealthStatus status{HealthStatus::HEALTHY};
    Amount total_value{0.0};
    Amount total_exposure{0.0};
    double exposure_percent{0.0};
    Amount total_pnl{0.0};
    double pnl_percent{0.0};
    int active_bots{0};
    Timestamp last_check{};
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    bool emergency_stop{false};

    nlohmann::json to_json() const;
};

struct RiskMetrics {
    Amount total_exposure{0.0};
    std::unordered_map<std::string, Amount> exposure_by_symbol;
    double weighted_leverage{0.0};
    double concentration_risk{0.0};  // Largest single-bot share of exposure
    double margin_utilization{0.0};  // Used margin over allocated balance
    double drawdown_from_peak{0.0};  // Percent
    double worst_case_drawdown{0.0};  // Percent of balance lost if every position is liquidated

    nlohmann::json to_json() const;
};

struct PortfolioSummary {
    Amount total_balance{0.0};
    Amount total_allocated{0.0};
    Amount total_used{0.0};
    Amount total_available{0.0};
    Amount total_position{0.0};
    Amount total_realized_pnl{0.0};
    Amount total_unrealized_pnl{0.0};
    double utilization_percent{0.0};
    double allocation_percent{0.0};
    double pnl_percent{0.0};
    int active_bots{0};
    Timestamp last_rebalance{};
    size_t history_size{0};

    nlohmann::json to_json() const;
};

/**
 * @brief Entry in the in-memory allocation history
 */
struct AllocationEvent {
    Timestamp timestamp{};
    EventType type{EventType::ALLOCATE};
    std::string bot_id;
    Amount amount{0.0};
    std::string description;
    std::optional<std::map<std::string, BotAllocation>> before;
    std::optional<std::map<std::string, BotAllocation>> after;

    nlohmann::json to_json() const;
};

}  // namespace margin_ledger
