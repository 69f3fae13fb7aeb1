// include/margin_ledger/sync/sync_types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include "margin_ledger/core/config_base.hpp"
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/types.hpp"
#include "margin_ledger/portfolio/types.hpp"

namespace margin_ledger {

/**
 * @brief Notification broadcast between bot processes
 */
struct SyncEvent {
    EventType type{EventType::HEARTBEAT};
    std::string bot_id;
    Timestamp timestamp{};
    std::unordered_map<std::string, double> numeric_fields;
    std::unordered_map<std::string, std::string> string_fields;
    bool requires_ack{false};

    nlohmann::json to_json() const;
};

/**
 * @brief Liveness of a bot as judged from its last heartbeat
 */
enum class HeartbeatStatus { ACTIVE, INACTIVE, DEAD };

std::string heartbeat_status_to_string(HeartbeatStatus status);
Result<HeartbeatStatus> heartbeat_status_from_string(const std::string& name);

constexpr const char* kHeartbeatVersion = "2.0.0";

/**
 * @brief Heartbeat record written by each running bot
 */
struct HeartbeatInfo {
    std::string bot_id;
    Timestamp last_seen{};
    HeartbeatStatus status{HeartbeatStatus::ACTIVE};
    std::string version{kHeartbeatVersion};
    int process_id{0};
    std::string hostname;

    nlohmann::json to_json() const;

    /**
     * @throws nlohmann::json::exception on missing keys
     * @throws PortfolioError on malformed timestamps or status names
     */
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Counters kept by the synchronization manager
 */
struct SyncStats {
    Timestamp last_sync{};
    int64_t sync_count{0};
    int64_t successful_syncs{0};
    int64_t failed_syncs{0};
    double average_sync_ms{0.0};    // Mean duration of successful syncs
    int64_t conflict_count{0};      // Syncs that adopted changes made by another process
    Timestamp last_conflict{};
    int64_t lock_contentions{0};
    int64_t state_corruptions{0};
    int active_bots{0};
    int dead_bots{0};

    nlohmann::json to_json() const;
};

/**
 * @brief Synchronization manager configuration
 */
struct SyncConfig : public ConfigBase {
    std::string bot_id;
    std::string heartbeat_interval{"30s"};
    std::string sync_interval{"5s"};
    std::string lock_timeout{"5s"};
    std::string max_sync_age{"60s"};    // Older last successful sync means unhealthy
    std::string inactive_after{"90s"};  // Heartbeat age after which a bot is INACTIVE
    std::string dead_after{"5m"};       // Heartbeat age after which a bot is DEAD
    bool async_events{true};            // Dispatch events on the bus thread

    /**
     * @brief Check the bot id and that every duration parses
     * @return CONFIGURATION_INVALID on the first failing field
     */
    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Receiver of sync events
 */
class EventHandler {
public:
    virtual ~EventHandler() = default;

    /**
     * @brief Handle one event
     * @return An error is logged by the dispatcher and does not stop delivery
     */
    virtual Result<void> handle_event(const SyncEvent& event) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Handler that writes every event to the log
 */
class LoggingEventHandler : public EventHandler {
public:
    Result<void> handle_event(const SyncEvent& event) override;

    std::string name() const override {
        return "LoggingEventHandler";
    }
};

}  // namespace margin_ledger
