// src/portfolio/leverage_calculator.cpp

#include "margin_ledger/portfolio/leverage_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace margin_ledger {

namespace {

std::string format_fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

}  // namespace

LeverageCalculator::LeverageCalculator(double min_leverage, double max_leverage)
    : min_leverage_(min_leverage), max_leverage_(max_leverage) {
    if (min_leverage_ <= 0.0 || max_leverage_ < min_leverage_) {
        throw PortfolioError(ErrorCode::INVALID_ARGUMENT,
                             "Invalid leverage bounds [" + format_fixed(min_leverage, 2) + ", " +
                                 format_fixed(max_leverage, 2) + "]",
                             "LeverageCalculator");
    }
}

double LeverageCalculator::clamp_leverage(double leverage) const {
    return std::clamp(leverage, min_leverage_, max_leverage_);
}

Amount LeverageCalculator::calculate_required_margin(Amount position_value,
                                                     double leverage) const {
    if (leverage <= 0.0) {
        return position_value;
    }
    return position_value / clamp_leverage(leverage);
}

Amount LeverageCalculator::calculate_max_position_size(Amount available_margin,
                                                       double leverage) const {
    if (available_margin <= 0.0 || leverage <= 0.0) {
        return 0.0;
    }
    return available_margin * clamp_leverage(leverage);
}

Result<void> LeverageCalculator::validate_leverage(double leverage) const {
    if (!(leverage > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_LEVERAGE,
                                "Leverage must be greater than 0, got " +
                                    format_fixed(leverage, 2),
                                "LeverageCalculator");
    }
    if (leverage < min_leverage_) {
        return make_error<void>(ErrorCode::INVALID_LEVERAGE,
                                "Leverage " + format_fixed(leverage, 2) +
                                    " is below minimum allowed " + format_fixed(min_leverage_, 2),
                                "LeverageCalculator");
    }
    if (leverage > max_leverage_) {
        return make_error<void>(ErrorCode::INVALID_LEVERAGE,
                                "Leverage " + format_fixed(leverage, 2) +
                                    " exceeds maximum allowed " + format_fixed(max_leverage_, 2),
                                "LeverageCalculator");
    }
    return Result<void>();
}

double LeverageCalculator::get_effective_leverage(Amount position_value,
                                                  Amount margin_used) const {
    if (margin_used <= 0.0) {
        return 1.0;
    }
    return position_value / margin_used;
}

std::string risk_level_to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW:
            return "LOW";
        case RiskLevel::MEDIUM:
            return "MEDIUM";
        case RiskLevel::HIGH:
            return "HIGH";
        case RiskLevel::CRITICAL:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

nlohmann::json PositionSafety::to_json() const {
    nlohmann::json j;
    j["is_valid"] = is_valid;
    j["required_margin"] = required_margin;
    j["available_margin"] = available_margin;
    j["margin_utilization"] = margin_utilization;
    j["effective_leverage"] = effective_leverage;
    j["liquidation_price"] = liquidation_price;
    j["distance_to_liquidation"] = distance_to_liquidation;
    j["risk_level"] = risk_level_to_string(risk_level);
    j["warnings"] = warnings;
    j["errors"] = errors;
    return j;
}

LeverageHelper::LeverageHelper(LeverageCalculator calculator) : calculator_(calculator) {}

double LeverageHelper::calculate_margin_percent(double leverage) const {
    if (leverage <= 0.0) {
        return 1.0;
    }
    return 1.0 / leverage;
}

double LeverageHelper::calculate_leverage_from_margin(double margin_percent) const {
    if (margin_percent <= 0.0 || margin_percent > 1.0) {
        return 1.0;
    }
    return 1.0 / margin_percent;
}

Price LeverageHelper::calculate_liquidation_price(Price entry_price, double leverage,
                                                  bool is_long) const {
    if (leverage <= 1.0) {
        return 0.0;
    }

    double liquidation_factor = calculate_margin_percent(leverage) * 0.9;
    if (is_long) {
        return entry_price * (1.0 - liquidation_factor);
    }
    return entry_price * (1.0 + liquidation_factor);
}

Amount LeverageHelper::calculate_max_safe_position_size(Amount available_margin,
                                                        double leverage,
                                                        double safety_factor) const {
    if (safety_factor <= 0.0 || safety_factor > 1.0) {
        safety_factor = 0.8;
    }
    return calculator_.calculate_max_position_size(available_margin, leverage) * safety_factor;
}

PositionSafety LeverageHelper::validate_position_safety(Amount position_value,
                                                        Price entry_price, double leverage,
                                                        Amount available_margin,
                                                        bool is_long) const {
    PositionSafety safety;
    safety.required_margin = calculator_.calculate_required_margin(position_value, leverage);
    safety.available_margin = available_margin;

    if (safety.required_margin > available_margin) {
        safety.is_valid = false;
        safety.errors.push_back("Insufficient margin: need $" +
                                format_fixed(safety.required_margin, 2) + ", have $" +
                                format_fixed(available_margin, 2));
    }

    if (available_margin > 0.0) {
        safety.margin_utilization = safety.required_margin / available_margin;
    }

    safety.effective_leverage =
        calculator_.get_effective_leverage(position_value, safety.required_margin);

    safety.liquidation_price = calculate_liquidation_price(entry_price, leverage, is_long);
    if (safety.liquidation_price > 0.0 && entry_price > 0.0) {
        safety.distance_to_liquidation =
            std::abs(safety.liquidation_price - entry_price) / entry_price;
    }

    safety.risk_level = determine_risk_level(safety);
    add_risk_warnings(safety);
    return safety;
}

RiskLevel LeverageHelper::determine_risk_level(const PositionSafety& safety) const {
    if (!safety.is_valid) {
        return RiskLevel::CRITICAL;
    }
    if (safety.margin_utilization > 0.9 || safety.effective_leverage > 50.0 ||
        safety.distance_to_liquidation < 0.1) {
        return RiskLevel::HIGH;
    }
    if (safety.margin_utilization > 0.7 || safety.effective_leverage > 20.0 ||
        safety.distance_to_liquidation < 0.2) {
        return RiskLevel::MEDIUM;
    }
    return RiskLevel::LOW;
}

void LeverageHelper::add_risk_warnings(PositionSafety& safety) const {
    if (safety.margin_utilization > 0.8) {
        safety.warnings.push_back("High margin utilization: " +
                                  format_fixed(safety.margin_utilization * 100.0, 1) + "%");
    }
    if (safety.effective_leverage > 25.0) {
        safety.warnings.push_back("High leverage: " + format_fixed(safety.effective_leverage, 1) +
                                  "x");
    }
    if (safety.distance_to_liquidation < 0.15) {
        safety.warnings.push_back("Close to liquidation: " +
                                  format_fixed(safety.distance_to_liquidation * 100.0, 1) +
                                  "% price move");
    }
}

}  // namespace margin_ledger
