// include/margin_ledger/portfolio/leverage_calculator.hpp
#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/types.hpp"
#include "margin_ledger/portfolio/types.hpp"

namespace margin_ledger {

/**
 * @brief Margin and position sizing math for leveraged positions
 *
 * Leverage arguments are clamped to [min_leverage, max_leverage] before use.
 */
class LeverageCalculator {
public:
    explicit LeverageCalculator(double min_leverage = kMinLeverage,
                                double max_leverage = kMaxLeverage);

    /**
     * @brief Margin needed to hold a position, position_value / leverage
     * @param position_value Notional value of the position
     * @param leverage Requested leverage; a non-positive value requires the full notional
     * @return Required margin
     */
    Amount calculate_required_margin(Amount position_value, double leverage) const;

    /**
     * @brief Largest notional that fits in a margin budget, available_margin * leverage
     * @return 0 if either input is non-positive
     */
    Amount calculate_max_position_size(Amount available_margin, double leverage) const;

    /**
     * @brief Check a leverage value against the configured bounds
     * @return INVALID_LEVERAGE if non-positive or outside the bounds
     */
    Result<void> validate_leverage(double leverage) const;

    /**
     * @brief Leverage actually carried, position_value / margin_used
     * @return 1.0 if no margin is used
     */
    double get_effective_leverage(Amount position_value, Amount margin_used) const;

    double clamp_leverage(double leverage) const;

    double min_leverage() const {
        return min_leverage_;
    }

    double max_leverage() const {
        return max_leverage_;
    }

private:
    double min_leverage_;
    double max_leverage_;
};

enum class RiskLevel { LOW, MEDIUM, HIGH, CRITICAL };

std::string risk_level_to_string(RiskLevel level);

/**
 * @brief Safety assessment of a prospective leveraged position
 */
struct PositionSafety {
    bool is_valid{true};
    Amount required_margin{0.0};
    Amount available_margin{0.0};
    double margin_utilization{0.0};       // Fraction of available margin consumed
    double effective_leverage{0.0};
    Price liquidation_price{0.0};
    double distance_to_liquidation{0.0};  // Fractional price move to liquidation
    RiskLevel risk_level{RiskLevel::LOW};
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    nlohmann::json to_json() const;
};

/**
 * @brief Conversions and safety checks layered on a LeverageCalculator
 */
class LeverageHelper {
public:
    explicit LeverageHelper(LeverageCalculator calculator = LeverageCalculator());

    // 10x leverage -> 0.1 margin
    double calculate_margin_percent(double leverage) const;

    // 0.1 margin -> 10x leverage
    double calculate_leverage_from_margin(double margin_percent) const;

    /**
     * @brief Estimated liquidation price
     *
     * entry * (1 - 0.9 / leverage) for longs, entry * (1 + 0.9 / leverage) for
     * shorts. The 0.9 factor leaves room for fees.
     *
     * @return 0 if leverage is 1x or less
     */
    Price calculate_liquidation_price(Price entry_price, double leverage, bool is_long) const;

    /**
     * @brief Maximum position size scaled down by a safety factor
     * @param safety_factor Fraction in (0, 1]; anything else uses 0.8
     */
    Amount calculate_max_safe_position_size(Amount available_margin, double leverage,
                                            double safety_factor = 0.8) const;

    PositionSafety validate_position_safety(Amount position_value, Price entry_price,
                                            double leverage, Amount available_margin,
                                            bool is_long) const;

    const LeverageCalculator& calculator() const {
        return calculator_;
    }

private:
    RiskLevel determine_risk_level(const PositionSafety& safety) const;
    void add_risk_warnings(PositionSafety& safety) const;

    LeverageCalculator calculator_;
};

}  // namespace margin_ledger
