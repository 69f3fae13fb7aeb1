// src/sync/sync_manager.cpp

#include "margin_ledger/sync/sync_manager.hpp"
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include "margin_ledger/core/logger.hpp"
#include "margin_ledger/core/time_utils.hpp"
#include "margin_ledger/portfolio/ledger_commit.hpp"
#include "margin_ledger/storage/file_state_store.hpp"

namespace fs = std::filesystem;

namespace margin_ledger {

namespace {

Duration parsed_duration(const std::string& text) {
    // SyncConfig::validate has already accepted every duration
    return core::parse_duration(text).value();
}

}  // namespace

SyncManager::SyncManager(SyncConfig config, std::shared_ptr<StateStore> store,
                         std::shared_ptr<AllocationManager> allocation_manager)
    : config_(std::move(config)),
      store_(std::move(store)),
      allocation_manager_(std::move(allocation_manager)) {
    Logger::ensure_initialized();

    if (!store_ || !allocation_manager_) {
        throw PortfolioError(ErrorCode::CONFIGURATION_INVALID,
                             "Sync manager needs a state store and an allocation manager",
                             "SyncManager", config_.bot_id);
    }
    config_.validate().value();

    heartbeat_interval_ = parsed_duration(config_.heartbeat_interval);
    sync_interval_ = parsed_duration(config_.sync_interval);
    lock_timeout_ = parsed_duration(config_.lock_timeout);
    max_sync_age_ = parsed_duration(config_.max_sync_age);
    inactive_after_ = parsed_duration(config_.inactive_after);
    dead_after_ = parsed_duration(config_.dead_after);

    heartbeat_dir_ = store_->location() + ".heartbeats";
    component_id_ = "SYNC_" + config_.bot_id;

    event_bus_ = std::make_unique<EventBus>(config_.async_events);
    auto subscribed = event_bus_->subscribe(
        SubscriberInfo{"default_logger", {}, std::make_shared<LoggingEventHandler>()});
    if (subscribed.is_error()) {
        WARN("Default event handler not installed: " << subscribed.error()->what());
    }

    ComponentInfo info{ComponentType::SYNC_MANAGER,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Sync manager for " << config_.bot_id
                                 << " not registered: " << registered.error()->what());
    } else {
        registered_ = true;
    }
}

SyncManager::~SyncManager() {
    auto stopped = stop();
    if (stopped.is_error()) {
        ERROR("Error stopping sync manager for " << config_.bot_id << ": "
                                                 << stopped.error()->what());
    }
    if (registered_) {
        auto unregistered = StateManager::instance().unregister_component(component_id_);
        if (unregistered.is_error()) {
            WARN("Failed to unregister " << component_id_ << ": "
                                         << unregistered.error()->what());
        }
    }
}

Result<void> SyncManager::start() {
    std::lock_guard<std::mutex> control(control_mutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Sync manager is already running", "SyncManager",
                                    config_.bot_id);
        }
        running_ = true;
        // A fresh start counts as synced until the first cycle runs
        stats_.last_sync = std::chrono::system_clock::now();
        last_successful_sync_ = stats_.last_sync;
    }

    if (registered_) {
        auto info = StateManager::instance().get_state(component_id_);
        if (info.is_ok() && info.value().state == ComponentState::STOPPED) {
            report_state(ComponentState::INITIALIZED);
        }
    }

    stop_requested_ = false;
    heartbeat_thread_ = std::thread(&SyncManager::heartbeat_loop, this);
    sync_thread_ = std::thread(&SyncManager::sync_loop, this);

    broadcast(EventType::REGISTER, {}, {{"startup", "true"}}, false);
    report_state(ComponentState::RUNNING);

    INFO("Sync manager started for " << config_.bot_id << " (heartbeat "
                                     << config_.heartbeat_interval << ", sync "
                                     << config_.sync_interval << ")");
    return Result<void>();
}

Result<void> SyncManager::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return Result<void>();
        }
        running_ = false;
    }

    broadcast(EventType::UNREGISTER, {}, {{"shutdown", "true"}}, false);

    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();

    if (heartbeat_thread_.joinable()) {
        heartbeat_thread_.join();
    }
    if (sync_thread_.joinable()) {
        sync_thread_.join();
    }

    std::error_code ec;
    fs::remove(fs::path(heartbeat_dir_) / (config_.bot_id + ".json"), ec);
    if (ec) {
        WARN("Failed to remove heartbeat for " << config_.bot_id << ": " << ec.message());
    }

    report_state(ComponentState::STOPPED);
    INFO("Sync manager stopped for " << config_.bot_id);
    return Result<void>();
}

Result<void> SyncManager::sync_state() {
    auto started = std::chrono::steady_clock::now();
    auto diff = refresh_from_store(store_, *allocation_manager_, lock_timeout_);
    double elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
            .count();

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.sync_count++;

    if (diff.is_error()) {
        record_sync_failure_unsafe(*diff.error());
        sync_cv_.notify_all();
        return forward_error<void>(*diff.error());
    }

    auto now = std::chrono::system_clock::now();
    stats_.successful_syncs++;
    stats_.average_sync_ms +=
        (elapsed_ms - stats_.average_sync_ms) / static_cast<double>(stats_.successful_syncs);
    stats_.last_sync = now;
    last_successful_sync_ = now;

    const SyncDiff& changes = diff.value();
    if (!changes.empty()) {
        stats_.conflict_count++;
        stats_.last_conflict = now;
        INFO("Adopted shared state for " << config_.bot_id << ": " << changes.added.size()
                                         << " added, " << changes.removed.size() << " removed, "
                                         << changes.changed.size() << " changed");
    }

    DEBUG("State sync completed for " << config_.bot_id << " in " << elapsed_ms << "ms");
    sync_cv_.notify_all();
    return Result<void>();
}

void SyncManager::record_sync_failure_unsafe(const PortfolioError& error) {
    stats_.failed_syncs++;
    switch (error.code()) {
        case ErrorCode::PORTFOLIO_LOCKED:
        case ErrorCode::TIMEOUT_ERROR:
            stats_.lock_contentions++;
            break;
        case ErrorCode::STATE_CORRUPTED:
            stats_.state_corruptions++;
            break;
        default:
            break;
    }
    WARN("State sync failed for " << config_.bot_id << ": " << error.to_string());
}

Result<void> SyncManager::commit(const std::function<Result<void>()>& mutate) {
    LedgerCommitOptions options;
    options.holder = config_.bot_id;
    options.lock_timeout = lock_timeout_;
    return commit_ledger_change(store_, *allocation_manager_, options, mutate);
}

Result<void> SyncManager::update_position(Amount position_value, Price avg_price,
                                          double leverage) {
    auto result = commit([&]() {
        return allocation_manager_->update_bot_position(config_.bot_id, position_value, avg_price,
                                                        leverage);
    });
    if (result.is_error()) {
        return result;
    }

    broadcast(EventType::POSITION_UPDATE,
              {{"position_value", position_value}, {"avg_price", avg_price}, {"leverage", leverage}},
              {}, true);
    return result;
}

Result<void> SyncManager::record_profit(Amount profit, bool share_profit) {
    auto result = commit([&]() {
        return allocation_manager_->record_profit(config_.bot_id, profit, share_profit);
    });
    if (result.is_error()) {
        return result;
    }

    broadcast(EventType::PROFIT_RECORD, {{"profit", profit}},
              {{"share_profit", share_profit ? "true" : "false"}}, share_profit);
    return result;
}

Result<RebalanceReport> SyncManager::trigger_rebalance() {
    RebalanceReport report;
    auto result = commit([&]() {
        report = allocation_manager_->execute_rebalance();
        return Result<void>();
    });
    if (result.is_error()) {
        return forward_error<RebalanceReport>(*result.error());
    }

    broadcast(EventType::REBALANCE, {{"adjustments", static_cast<double>(report.adjustments)}},
              {{"trigger", "manual"}}, true);
    return report;
}

Result<void> SyncManager::add_event_handler(std::shared_ptr<EventHandler> handler) {
    if (!handler) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Event handler cannot be null",
                                "SyncManager", config_.bot_id);
    }

    uint64_t index = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        index = ++handler_count_;
    }
    return event_bus_->subscribe(
        SubscriberInfo{"handler_" + std::to_string(index) + "_" + handler->name(), {}, handler});
}

Result<void> SyncManager::send_heartbeat() {
    HeartbeatInfo heartbeat;
    heartbeat.bot_id = config_.bot_id;
    heartbeat.last_seen = std::chrono::system_clock::now();
    heartbeat.status = HeartbeatStatus::ACTIVE;
    heartbeat.process_id = static_cast<int>(::getpid());
    heartbeat.hostname = current_hostname();

    auto path = fs::path(heartbeat_dir_) / (config_.bot_id + ".json");
    auto written = write_file_atomically(path.string(), heartbeat.to_json().dump(4));
    if (written.is_error()) {
        WARN("Failed to write heartbeat for " << config_.bot_id << ": "
                                              << written.error()->what());
        return written;
    }

    broadcast(EventType::HEARTBEAT, {{"pid", static_cast<double>(heartbeat.process_id)}},
              {{"hostname", heartbeat.hostname}}, false);
    return Result<void>();
}

Result<std::map<std::string, HeartbeatInfo>> SyncManager::get_active_heartbeats() const {
    std::map<std::string, HeartbeatInfo> heartbeats;

    std::error_code ec;
    if (!fs::exists(heartbeat_dir_, ec)) {
        return heartbeats;
    }

    fs::directory_iterator it(heartbeat_dir_, ec);
    if (ec) {
        return make_error<std::map<std::string, HeartbeatInfo>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to read heartbeat directory " + heartbeat_dir_ + ": " + ec.message(),
            "SyncManager", config_.bot_id);
    }

    auto now = std::chrono::system_clock::now();
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") {
            continue;
        }

        std::ifstream file(entry.path());
        if (!file.is_open()) {
            continue;
        }

        HeartbeatInfo heartbeat;
        try {
            heartbeat.from_json(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            WARN("Skipping unreadable heartbeat " << entry.path().string() << ": " << e.what());
            continue;
        } catch (const PortfolioError& e) {
            WARN("Skipping unreadable heartbeat " << entry.path().string() << ": " << e.what());
            continue;
        }

        auto age = now - heartbeat.last_seen;
        if (age <= inactive_after_) {
            heartbeat.status = HeartbeatStatus::ACTIVE;
        } else if (age <= dead_after_) {
            heartbeat.status = HeartbeatStatus::INACTIVE;
        } else {
            heartbeat.status = HeartbeatStatus::DEAD;
        }
        heartbeats[heartbeat.bot_id] = heartbeat;
    }

    return heartbeats;
}

SyncStats SyncManager::get_sync_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

Result<void> SyncManager::wait_for_sync(Duration timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    int64_t seen = stats_.successful_syncs;
    bool synced =
        sync_cv_.wait_for(lock, timeout, [&]() { return stats_.successful_syncs != seen; });
    if (!synced) {
        return make_error<void>(ErrorCode::TIMEOUT_ERROR,
                                "No sync completed within " + core::format_duration(timeout),
                                "SyncManager", config_.bot_id);
    }
    return Result<void>();
}

Result<void> SyncManager::flush_events(Duration timeout) {
    return event_bus_->flush(timeout);
}

bool SyncManager::is_healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return false;
    }
    return std::chrono::system_clock::now() - last_successful_sync_ <= max_sync_age_;
}

bool SyncManager::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void SyncManager::heartbeat_loop() {
    Logger::register_component("SyncManager");

    while (!stop_requested_) {
        auto sent = send_heartbeat();
        if (sent.is_ok()) {
            auto heartbeats = get_active_heartbeats();
            if (heartbeats.is_ok()) {
                int active = 0;
                int dead = 0;
                for (const auto& [_, heartbeat] : heartbeats.value()) {
                    if (heartbeat.status == HeartbeatStatus::ACTIVE) {
                        ++active;
                    } else if (heartbeat.status == HeartbeatStatus::DEAD) {
                        ++dead;
                    }
                }
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.active_bots = active;
                stats_.dead_bots = dead;
            }
        }

        std::unique_lock<std::mutex> lock(lifecycle_mutex_);
        stop_cv_.wait_for(lock, heartbeat_interval_, [this]() { return stop_requested_.load(); });
    }
}

void SyncManager::sync_loop() {
    Logger::register_component("SyncManager");

    bool degraded = false;
    while (true) {
        {
            std::unique_lock<std::mutex> lock(lifecycle_mutex_);
            if (stop_cv_.wait_for(lock, sync_interval_,
                                  [this]() { return stop_requested_.load(); })) {
                break;
            }
        }

        // Failures are counted and logged by sync_state
        auto synced = sync_state();
        if (synced.is_error() && synced.error()->code() == ErrorCode::STATE_CORRUPTED) {
            if (!degraded) {
                report_state(ComponentState::ERR_STATE, synced.error()->what());
                degraded = true;
            }
        } else if (synced.is_ok() && degraded) {
            report_state(ComponentState::RUNNING);
            degraded = false;
        }
    }
}

void SyncManager::broadcast(EventType type,
                            std::unordered_map<std::string, double> numeric_fields,
                            std::unordered_map<std::string, std::string> string_fields,
                            bool requires_ack) {
    SyncEvent event;
    event.type = type;
    event.bot_id = config_.bot_id;
    event.timestamp = std::chrono::system_clock::now();
    event.numeric_fields = std::move(numeric_fields);
    event.string_fields = std::move(string_fields);
    event.requires_ack = requires_ack;
    event_bus_->publish(event);
}

void SyncManager::report_state(ComponentState state, const std::string& message) {
    if (!registered_) {
        return;
    }
    auto updated = StateManager::instance().update_state(component_id_, state, message);
    if (updated.is_error()) {
        WARN("Failed to report state for " << component_id_ << ": "
                                           << updated.error()->what());
    }
}

}  // namespace margin_ledger
