// include/margin_ledger/sync/sync_manager.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/state_manager.hpp"
#include "margin_ledger/core/types.hpp"
#include "margin_ledger/portfolio/allocation_manager.hpp"
#include "margin_ledger/storage/state_store.hpp"
#include "margin_ledger/sync/event_bus.hpp"
#include "margin_ledger/sync/sync_types.hpp"

namespace margin_ledger {

/**
 * @brief Keeps one bot's ledger in step with the shared state
 *
 * Runs a heartbeat loop and a sync loop on their own threads. Ledger
 * mutations made through the manager are committed under the store lock
 * and then broadcast on the event bus.
 */
class SyncManager {
public:
    /**
     * @brief Constructor
     * @param config Sync configuration, validated here
     * @param store Shared state store
     * @param allocation_manager Local ledger, usually the portfolio manager's
     * @throws PortfolioError CONFIGURATION_INVALID for an invalid config or null dependencies
     */
    SyncManager(SyncConfig config, std::shared_ptr<StateStore> store,
                std::shared_ptr<AllocationManager> allocation_manager);

    ~SyncManager();

    SyncManager(const SyncManager&) = delete;
    SyncManager& operator=(const SyncManager&) = delete;

    /**
     * @brief Start the heartbeat and sync loops and broadcast REGISTER
     * @return INVALID_ARGUMENT if already running
     */
    Result<void> start();

    /**
     * @brief Broadcast UNREGISTER, stop both loops and remove this bot's heartbeat
     *
     * Stopping a manager that is not running is a no-op.
     */
    Result<void> stop();

    /**
     * @brief Adopt the shared state into the local ledger under the store lock
     * @return Lock, load or integrity errors; statistics are updated either way
     */
    Result<void> sync_state();

    /**
     * @brief Commit this bot's position and broadcast POSITION_UPDATE
     */
    Result<void> update_position(Amount position_value, Price avg_price, double leverage);

    /**
     * @brief Commit this bot's profit and broadcast PROFIT_RECORD
     */
    Result<void> record_profit(Amount profit, bool share_profit);

    /**
     * @brief Rebalance the shared ledger and broadcast REBALANCE
     * @return What the rebalance changed
     */
    Result<RebalanceReport> trigger_rebalance();

    /**
     * @brief Add a handler receiving every event this manager broadcasts
     * @return INVALID_ARGUMENT for a null handler
     */
    Result<void> add_event_handler(std::shared_ptr<EventHandler> handler);

    /**
     * @brief Write this bot's heartbeat file and broadcast HEARTBEAT
     */
    Result<void> send_heartbeat();

    /**
     * @brief Heartbeats of every bot sharing the state, keyed by bot id
     *
     * The status of each entry is derived from the age of its last_seen.
     * Unreadable heartbeat files are skipped.
     */
    Result<std::map<std::string, HeartbeatInfo>> get_active_heartbeats() const;

    SyncStats get_sync_stats() const;

    /**
     * @brief Block until a sync completes after this call
     * @return TIMEOUT_ERROR if none completes in time
     */
    Result<void> wait_for_sync(Duration timeout) const;

    /**
     * @brief Wait for every broadcast event to reach the handlers
     */
    Result<void> flush_events(Duration timeout);

    /**
     * @brief Running, with a successful sync no older than max_sync_age
     */
    bool is_healthy() const;

    bool is_running() const;

    const std::string& bot_id() const {
        return config_.bot_id;
    }

    const std::string& heartbeat_dir() const {
        return heartbeat_dir_;
    }

private:
    void heartbeat_loop();
    void sync_loop();
    void broadcast(EventType type, std::unordered_map<std::string, double> numeric_fields,
                   std::unordered_map<std::string, std::string> string_fields, bool requires_ack);
    Result<void> commit(const std::function<Result<void>()>& mutate);
    void record_sync_failure_unsafe(const PortfolioError& error);
    void report_state(ComponentState state, const std::string& message = "");

    SyncConfig config_;
    std::shared_ptr<StateStore> store_;
    std::shared_ptr<AllocationManager> allocation_manager_;
    std::unique_ptr<EventBus> event_bus_;
    std::string heartbeat_dir_;
    std::string component_id_;

    Duration heartbeat_interval_;
    Duration sync_interval_;
    Duration lock_timeout_;
    Duration max_sync_age_;
    Duration inactive_after_;
    Duration dead_after_;

    SyncStats stats_;
    Timestamp last_successful_sync_{};
    uint64_t handler_count_{0};

    bool running_{false};
    bool registered_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread heartbeat_thread_;
    std::thread sync_thread_;

    mutable std::mutex mutex_;
    mutable std::condition_variable sync_cv_;
    std::mutex control_mutex_;  // Serializes start and stop
    std::mutex lifecycle_mutex_;
    std::condition_variable stop_cv_;
};

}  // namespace margin_ledger
