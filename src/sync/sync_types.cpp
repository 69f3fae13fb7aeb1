// src/sync/sync_types.cpp

#include "margin_ledger/sync/sync_types.hpp"
#include "margin_ledger/core/logger.hpp"
#include "margin_ledger/core/time_utils.hpp"

namespace margin_ledger {

nlohmann::json SyncEvent::to_json() const {
    nlohmann::json j;
    j["type"] = event_type_to_string(type);
    j["bot_id"] = bot_id;
    j["timestamp"] = core::format_timestamp(timestamp);
    j["requires_ack"] = requires_ack;

    nlohmann::json data = nlohmann::json::object();
    for (const auto& [key, value] : numeric_fields) {
        data[key] = value;
    }
    for (const auto& [key, value] : string_fields) {
        data[key] = value;
    }
    j["data"] = data;
    return j;
}

std::string heartbeat_status_to_string(HeartbeatStatus status) {
    switch (status) {
        case HeartbeatStatus::ACTIVE:
            return "ACTIVE";
        case HeartbeatStatus::INACTIVE:
            return "INACTIVE";
        case HeartbeatStatus::DEAD:
            return "DEAD";
    }
    return "UNKNOWN";
}

Result<HeartbeatStatus> heartbeat_status_from_string(const std::string& name) {
    if (name == "ACTIVE")
        return HeartbeatStatus::ACTIVE;
    if (name == "INACTIVE")
        return HeartbeatStatus::INACTIVE;
    if (name == "DEAD")
        return HeartbeatStatus::DEAD;
    return make_error<HeartbeatStatus>(ErrorCode::JSON_PARSE_ERROR,
                                       "Unknown heartbeat status: " + name, "HeartbeatInfo");
}

//===== HeartbeatInfo =====

nlohmann::json HeartbeatInfo::to_json() const {
    nlohmann::json j;
    j["bot_id"] = bot_id;
    j["last_seen"] = core::format_timestamp(last_seen);
    j["status"] = heartbeat_status_to_string(status);
    j["version"] = version;
    j["pid"] = process_id;
    j["hostname"] = hostname;
    return j;
}

void HeartbeatInfo::from_json(const nlohmann::json& j) {
    bot_id = j.at("bot_id").get<std::string>();

    auto seen = core::parse_timestamp(j.at("last_seen").get<std::string>());
    if (seen.is_error()) {
        throw PortfolioError(ErrorCode::JSON_PARSE_ERROR, seen.error()->what(), "HeartbeatInfo",
                             bot_id);
    }
    last_seen = seen.value();

    if (j.contains("status")) {
        status = heartbeat_status_from_string(j.at("status").get<std::string>()).value();
    }
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
    if (j.contains("pid"))
        process_id = j.at("pid").get<int>();
    if (j.contains("hostname"))
        hostname = j.at("hostname").get<std::string>();
}

nlohmann::json SyncStats::to_json() const {
    nlohmann::json j;
    j["last_sync"] = core::format_timestamp(last_sync);
    j["sync_count"] = sync_count;
    j["successful_syncs"] = successful_syncs;
    j["failed_syncs"] = failed_syncs;
    j["average_sync_ms"] = average_sync_ms;
    j["conflict_count"] = conflict_count;
    j["last_conflict"] = core::format_timestamp(last_conflict);
    j["lock_contentions"] = lock_contentions;
    j["state_corruptions"] = state_corruptions;
    j["active_bots"] = active_bots;
    j["dead_bots"] = dead_bots;
    return j;
}

//===== SyncConfig =====

Result<void> SyncConfig::validate() const {
    if (bot_id.empty()) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID, "Bot ID cannot be empty",
                                "SyncConfig");
    }

    const std::pair<const char*, const std::string*> durations[] = {
        {"heartbeat_interval", &heartbeat_interval}, {"sync_interval", &sync_interval},
        {"lock_timeout", &lock_timeout},             {"max_sync_age", &max_sync_age},
        {"inactive_after", &inactive_after},         {"dead_after", &dead_after}};

    for (const auto& [field, text] : durations) {
        auto parsed = core::parse_duration(*text);
        if (parsed.is_error()) {
            return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                    std::string("Invalid ") + field + ": " +
                                        parsed.error()->what(),
                                    "SyncConfig", bot_id);
        }
        if (parsed.value().count() <= 0) {
            return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                    std::string(field) + " must be positive", "SyncConfig",
                                    bot_id);
        }
    }

    if (core::parse_duration(dead_after).value() < core::parse_duration(inactive_after).value()) {
        return make_error<void>(ErrorCode::CONFIGURATION_INVALID,
                                "dead_after must not be shorter than inactive_after", "SyncConfig",
                                bot_id);
    }

    return Result<void>();
}

nlohmann::json SyncConfig::to_json() const {
    nlohmann::json j;
    j["bot_id"] = bot_id;
    j["heartbeat_interval"] = heartbeat_interval;
    j["sync_interval"] = sync_interval;
    j["lock_timeout"] = lock_timeout;
    j["max_sync_age"] = max_sync_age;
    j["inactive_after"] = inactive_after;
    j["dead_after"] = dead_after;
    j["async_events"] = async_events;
    return j;
}

void SyncConfig::from_json(const nlohmann::json& j) {
    if (j.contains("bot_id"))
        bot_id = j.at("bot_id").get<std::string>();
    if (j.contains("heartbeat_interval"))
        heartbeat_interval = j.at("heartbeat_interval").get<std::string>();
    if (j.contains("sync_interval"))
        sync_interval = j.at("sync_interval").get<std::string>();
    if (j.contains("lock_timeout"))
        lock_timeout = j.at("lock_timeout").get<std::string>();
    if (j.contains("max_sync_age"))
        max_sync_age = j.at("max_sync_age").get<std::string>();
    if (j.contains("inactive_after"))
        inactive_after = j.at("inactive_after").get<std::string>();
    if (j.contains("dead_after"))
        dead_after = j.at("dead_after").get<std::string>();
    if (j.contains("async_events"))
        async_events = j.at("async_events").get<bool>();
}

Result<void> LoggingEventHandler::handle_event(const SyncEvent& event) {
    INFO("Sync event " << event_type_to_string(event.type) << " from " << event.bot_id << ": "
                       << event.to_json().dump());
    return Result<void>();
}

}  // namespace margin_ledger
