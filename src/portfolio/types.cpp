// src/portfolio/types.cpp

#include "margin_ledger/portfolio/types.hpp"

namespace margin_ledger {

namespace {

Timestamp timestamp_from_json(const nlohmann::json& j, const std::string& key) {
    auto parsed = core::parse_timestamp(j.at(key).get<std::string>());
    if (parsed.is_error()) {
        throw PortfolioError(ErrorCode::STATE_CORRUPTED,
                             "Field '" + key + "': " + std::string(parsed.error()->what()),
                             "PortfolioState");
    }
    return parsed.value();
}

Result<void> corrupted(const std::string& message, const std::string& bot_id = "") {
    return make_error<void>(ErrorCode::STATE_CORRUPTED, message, "PortfolioState", bot_id);
}

}  // namespace

std::string allocation_strategy_to_string(AllocationStrategy strategy) {
    switch (strategy) {
        case AllocationStrategy::EQUAL_WEIGHT:
            return "equal_weight";
        case AllocationStrategy::PERFORMANCE_BASED:
            return "performance_based";
        case AllocationStrategy::CUSTOM:
            return "custom";
    }
    return "unknown";
}

Result<AllocationStrategy> allocation_strategy_from_string(const std::string& name) {
    if (name == "equal_weight")
        return AllocationStrategy::EQUAL_WEIGHT;
    if (name == "performance_based")
        return AllocationStrategy::PERFORMANCE_BASED;
    if (name == "custom")
        return AllocationStrategy::CUSTOM;
    return make_error<AllocationStrategy>(ErrorCode::CONFIGURATION_INVALID,
                                          "Unknown allocation strategy: '" + name + "'",
                                          "PortfolioConfig");
}

std::string event_type_to_string(EventType type) {
    switch (type) {
        case EventType::ALLOCATE:
            return "ALLOCATE";
        case EventType::DEALLOCATE:
            return "DEALLOCATE";
        case EventType::PROFIT_RECORD:
            return "PROFIT_RECORD";
        case EventType::PROFIT_SHARE:
            return "PROFIT_SHARE";
        case EventType::REBALANCE:
            return "REBALANCE";
        case EventType::REGISTER:
            return "REGISTER";
        case EventType::UNREGISTER:
            return "UNREGISTER";
        case EventType::POSITION_UPDATE:
            return "POSITION_UPDATE";
        case EventType::HEARTBEAT:
            return "HEARTBEAT";
    }
    return "UNKNOWN";
}

Result<EventType> event_type_from_string(const std::string& name) {
    static const std::unordered_map<std::string, EventType> kTypes = {
        {"ALLOCATE", EventType::ALLOCATE},
        {"DEALLOCATE", EventType::DEALLOCATE},
        {"PROFIT_RECORD", EventType::PROFIT_RECORD},
        {"PROFIT_SHARE", EventType::PROFIT_SHARE},
        {"REBALANCE", EventType::REBALANCE},
        {"REGISTER", EventType::REGISTER},
        {"UNREGISTER", EventType::UNREGISTER},
        {"POSITION_UPDATE", EventType::POSITION_UPDATE},
        {"HEARTBEAT", EventType::HEARTBEAT}};

    auto it = kTypes.find(name);
    if (it == kTypes.end()) {
        return make_error<EventType>(ErrorCode::INVALID_ARGUMENT,
                                     "Unknown event type: '" + name + "'", "EventType");
    }
    return it->second;
}

std::string health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY:
            return "healthy";
        case HealthStatus::WARNING:
            return "warning";
        case HealthStatus::CRITICAL:
            return "critical";
    }
    return "unknown";
}

//===== BotConfig =====

Result<void> BotConfig::validate() const {
    if (symbol.empty()) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID, "Bot symbol cannot be empty",
                                "BotConfig");
    }
    if (!(leverage > 0.0) || leverage > kMaxLeverage) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "Leverage must be in (0, " + std::to_string(kMaxLeverage) +
                                    "], got " + std::to_string(leverage),
                                "BotConfig");
    }
    if (!(allocation_percentage > 0.0) || allocation_percentage > 1.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "Allocation percentage must be in (0, 1], got " +
                                    std::to_string(allocation_percentage),
                                "BotConfig");
    }
    if (max_position_size < 0.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "Max position size cannot be negative", "BotConfig");
    }
    if (category != "linear" && category != "spot" && category != "inverse") {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "Unknown category: '" + category + "'", "BotConfig");
    }
    return Result<void>();
}

//===== BotAllocation =====

nlohmann::json BotAllocation::to_json() const {
    nlohmann::json j;
    j["bot_id"] = bot_id;
    j["symbol"] = symbol;
    j["allocated_balance"] = allocated_balance;
    j["used_balance"] = used_balance;
    j["available_balance"] = available_balance;
    j["current_position"] = current_position;
    j["average_price"] = average_price;
    j["leverage"] = leverage;
    j["unrealized_pnl"] = unrealized_pnl;
    j["realized_pnl"] = realized_pnl;
    j["position_margin_used"] = position_margin_used;
    j["allocation_percentage"] = allocation_percentage;
    j["last_updated"] = core::format_timestamp(last_updated);
    return j;
}

void BotAllocation::from_json(const nlohmann::json& j) {
    bot_id = j.at("bot_id").get<std::string>();
    symbol = j.at("symbol").get<std::string>();
    allocated_balance = j.at("allocated_balance").get<double>();
    used_balance = j.at("used_balance").get<double>();
    available_balance = j.at("available_balance").get<double>();
    leverage = j.at("leverage").get<double>();

    if (j.contains("current_position"))
        current_position = j.at("current_position").get<double>();
    if (j.contains("average_price"))
        average_price = j.at("average_price").get<double>();
    if (j.contains("unrealized_pnl"))
        unrealized_pnl = j.at("unrealized_pnl").get<double>();
    if (j.contains("realized_pnl"))
        realized_pnl = j.at("realized_pnl").get<double>();
    if (j.contains("position_margin_used"))
        position_margin_used = j.at("position_margin_used").get<double>();
    if (j.contains("allocation_percentage"))
        allocation_percentage = j.at("allocation_percentage").get<double>();
    if (j.contains("last_updated"))
        last_updated = timestamp_from_json(j, "last_updated");
}

//===== PortfolioConfig =====

Result<void> PortfolioConfig::validate() const {
    if (!(total_balance > 0.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "Total balance must be positive", "PortfolioConfig");
    }
    if (shared_state_file.empty()) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "Shared state file cannot be empty", "PortfolioConfig");
    }
    if (!(max_drawdown_percent > 0.0) || max_drawdown_percent > 100.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "Max drawdown percent must be in (0, 100]", "PortfolioConfig");
    }
    if (!(risk_limit_per_bot > 0.0) || risk_limit_per_bot > 1.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "Risk limit per bot must be in (0, 1]", "PortfolioConfig");
    }

    auto frequency = core::parse_duration(rebalance_frequency);
    if (frequency.is_error()) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "Invalid rebalance frequency: " +
                                    std::string(frequency.error()->what()),
                                "PortfolioConfig");
    }

    auto timeout = core::parse_duration(lock_timeout);
    if (timeout.is_error()) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "Invalid lock timeout: " + std::string(timeout.error()->what()),
                                "PortfolioConfig");
    }
    if (timeout.value().count() <= 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "Lock timeout must be positive", "PortfolioConfig");
    }

    return Result<void>();
}

bool PortfolioConfig::normalize_exposure_limit() {
    if (max_total_exposure <= 0.0 || max_total_exposure > 10.0) {
        max_total_exposure = 3.0;
        return true;
    }
    return false;
}

nlohmann::json PortfolioConfig::to_json() const {
    nlohmann::json j;
    j["total_balance"] = total_balance;
    j["allocation_strategy"] = allocation_strategy_to_string(allocation_strategy);
    j["shared_state_file"] = shared_state_file;
    j["max_total_exposure"] = max_total_exposure;
    j["max_drawdown_percent"] = max_drawdown_percent;
    j["rebalance_frequency"] = rebalance_frequency;
    j["risk_limit_per_bot"] = risk_limit_per_bot;
    j["emergency_stop_enabled"] = emergency_stop_enabled;
    j["profit_sharing_enabled"] = profit_sharing_enabled;
    j["lock_timeout"] = lock_timeout;
    return j;
}

void PortfolioConfig::from_json(const nlohmann::json& j) {
    if (j.contains("total_balance"))
        total_balance = j.at("total_balance").get<double>();
    if (j.contains("allocation_strategy")) {
        auto strategy =
            allocation_strategy_from_string(j.at("allocation_strategy").get<std::string>());
        allocation_strategy = strategy.value();
    }
    if (j.contains("shared_state_file"))
        shared_state_file = j.at("shared_state_file").get<std::string>();
    if (j.contains("max_total_exposure"))
        max_total_exposure = j.at("max_total_exposure").get<double>();
    if (j.contains("max_drawdown_percent"))
        max_drawdown_percent = j.at("max_drawdown_percent").get<double>();
    if (j.contains("rebalance_frequency"))
        rebalance_frequency = j.at("rebalance_frequency").get<std::string>();
    if (j.contains("risk_limit_per_bot"))
        risk_limit_per_bot = j.at("risk_limit_per_bot").get<double>();
    if (j.contains("emergency_stop_enabled"))
        emergency_stop_enabled = j.at("emergency_stop_enabled").get<bool>();
    if (j.contains("profit_sharing_enabled"))
        profit_sharing_enabled = j.at("profit_sharing_enabled").get<bool>();
    if (j.contains("lock_timeout"))
        lock_timeout = j.at("lock_timeout").get<std::string>();
}

//===== PortfolioState =====

nlohmann::json PortfolioState::to_json() const {
    nlohmann::json j;
    j["total_balance"] = total_balance;
    j["total_profit"] = total_profit;
    j["last_updated"] = core::format_timestamp(last_updated);
    j["version"] = version;

    nlohmann::json allocs = nlohmann::json::object();
    for (const auto& [bot_id, allocation] : allocations) {
        allocs[bot_id] = allocation.to_json();
    }
    j["allocations"] = allocs;

    if (global_settings) {
        j["global_settings"] = global_settings->to_json();
    }
    if (lock_holder) {
        j["lock_holder"] = *lock_holder;
    }
    if (lock_time) {
        j["lock_time"] = core::format_timestamp(*lock_time);
    }
    return j;
}

void PortfolioState::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw PortfolioError(ErrorCode::STATE_CORRUPTED, "State document is not an object",
                             "PortfolioState");
    }

    total_balance = j.at("total_balance").get<double>();
    total_profit = j.contains("total_profit") ? j.at("total_profit").get<double>() : 0.0;
    last_updated = j.contains("last_updated") ? timestamp_from_json(j, "last_updated")
                                              : Timestamp{};
    version = j.contains("version") ? j.at("version").get<std::string>() : "1.0";

    if (!j.contains("allocations") || !j.at("allocations").is_object()) {
        throw PortfolioError(ErrorCode::STATE_CORRUPTED, "Allocations map is missing or null",
                             "PortfolioState");
    }

    allocations.clear();
    for (const auto& [key, value] : j.at("allocations").items()) {
        BotAllocation allocation;
        allocation.from_json(value);
        allocations.emplace(key, std::move(allocation));
    }

    global_settings.reset();
    if (j.contains("global_settings") && !j.at("global_settings").is_null()) {
        PortfolioConfig settings;
        settings.from_json(j.at("global_settings"));
        global_settings = settings;
    }

    lock_holder.reset();
    if (j.contains("lock_holder") && !j.at("lock_holder").is_null()) {
        lock_holder = j.at("lock_holder").get<std::string>();
    }

    lock_time.reset();
    if (j.contains("lock_time") && !j.at("lock_time").is_null()) {
        lock_time = timestamp_from_json(j, "lock_time");
    }
}

Amount PortfolioState::total_allocated() const {
    Amount total = 0.0;
    for (const auto& [_, allocation] : allocations) {
        total += allocation.allocated_balance;
    }
    return total;
}

Result<void> validate_state_integrity(const PortfolioState& state) {
    if (!(state.total_balance > 0.0)) {
        return corrupted("Total balance must be positive, got " +
                         std::to_string(state.total_balance));
    }

    for (const auto& [key, allocation] : state.allocations) {
        if (key != allocation.bot_id) {
            return corrupted("Allocation key '" + key + "' does not match bot id '" +
                                 allocation.bot_id + "'",
                             key);
        }
        if (allocation.allocated_balance < 0.0 || allocation.used_balance < 0.0 ||
            allocation.position_margin_used < 0.0) {
            return corrupted("Negative balance for bot " + key, key);
        }
        if (!(allocation.leverage > 0.0)) {
            return corrupted("Non-positive leverage for bot " + key, key);
        }
        if (allocation.position_margin_used > allocation.allocated_balance + kBalanceTolerance) {
            return corrupted("Margin used exceeds allocation for bot " + key, key);
        }
    }

    Amount allocated = state.total_allocated();
    if (allocated > state.total_balance + kBalanceTolerance) {
        return corrupted("Total allocated " + std::to_string(allocated) +
                         " exceeds total balance " + std::to_string(state.total_balance));
    }

    return Result<void>();
}

//===== Reports =====

nlohmann::json PortfolioHealth::to_json() const {
    nlohmann::json j;
    j["status"] = health_status_to_string(status);
    j["total_value"] = total_value;
    j["total_exposure"] = total_exposure;
    j["exposure_percent"] = exposure_percent;
    j["total_pnl"] = total_pnl;
    j["pnl_percent"] = pnl_percent;
    j["active_bots"] = active_bots;
    j["last_check"] = core::format_timestamp(last_check);
    j["warnings"] = warnings;
    j["errors"] = errors;
    j["emergency_stop"] = emergency_stop;
    return j;
}

nlohmann::json RiskMetrics::to_json() const {
    nlohmann::json j;
    j["total_exposure"] = total_exposure;
    j["exposure_by_symbol"] = exposure_by_symbol;
    j["weighted_leverage"] = weighted_leverage;
    j["concentration_risk"] = concentration_risk;
    j["margin_utilization"] = margin_utilization;
    j["drawdown_from_peak"] = drawdown_from_peak;
    j["worst_case_drawdown"] = worst_case_drawdown;
    return j;
}

nlohmann::json PortfolioSummary::to_json() const {
    nlohmann::json j;
    j["total_balance"] = total_balance;
    j["total_allocated"] = total_allocated;
    j["total_used"] = total_used;
    j["total_available"] = total_available;
    j["total_position"] = total_position;
    j["total_realized_pnl"] = total_realized_pnl;
    j["total_unrealized_pnl"] = total_unrealized_pnl;
    j["utilization_percent"] = utilization_percent;
    j["allocation_percent"] = allocation_percent;
    j["pnl_percent"] = pnl_percent;
    j["active_bots"] = active_bots;
    j["last_rebalance"] = core::format_timestamp(last_rebalance);
    j["history_size"] = history_size;
    return j;
}

nlohmann::json AllocationEvent::to_json() const {
    nlohmann::json j;
    j["timestamp"] = core::format_timestamp(timestamp);
    j["type"] = event_type_to_string(type);
    j["bot_id"] = bot_id;
    j["amount"] = amount;
    j["description"] = description;
    auto snapshot_json = [](const std::map<std::string, BotAllocation>& snapshot) {
        nlohmann::json out = nlohmann::json::object();
        for (const auto& [bot_id, allocation] : snapshot) {
            out[bot_id] = allocation.to_json();
        }
        return out;
    };
    if (before) {
        j["before"] = snapshot_json(*before);
    }
    if (after) {
        j["after"] = snapshot_json(*after);
    }
    return j;
}

}  // namespace margin_ledger
