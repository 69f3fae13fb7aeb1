#include <gtest/gtest.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <thread>
#include "../core/test_base.hpp"
#include "margin_ledger/core/time_utils.hpp"
#include "margin_ledger/portfolio/ledger_commit.hpp"
#include "margin_ledger/storage/file_state_store.hpp"
#include "margin_ledger/sync/sync_manager.hpp"
#include "recording_handler.hpp"

using namespace margin_ledger;
using namespace margin_ledger::testing;

namespace fs = std::filesystem;

class SyncManagerTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        state_path_ = path_in_temp("portfolio_state.json");
        store_ = std::make_shared<FileStateStore>(state_path_);
        ledger_ = std::make_shared<AllocationManager>(1000.0, AllocationStrategy::EQUAL_WEIGHT);

        config_.bot_id = "bot_a";
        config_.heartbeat_interval = "50ms";
        config_.sync_interval = "50ms";
        config_.lock_timeout = "1s";
        config_.max_sync_age = "5s";
        config_.async_events = false;

        register_remote_bot("bot_a", 0.5);
        recorder_ = std::make_shared<RecordingHandler>();
    }

    void TearDown() override {
        managers_.clear();
        TempDirTest::TearDown();
    }

    SyncManager& create_manager() {
        managers_.push_back(std::make_unique<SyncManager>(config_, store_, ledger_));
        auto added = managers_.back()->add_event_handler(recorder_);
        EXPECT_TRUE(added.is_ok());
        return *managers_.back();
    }

    // Commit a bot through a separate ledger, the way another process would
    void register_remote_bot(const std::string& bot_id, double percentage) {
        auto remote_store = std::make_shared<FileStateStore>(state_path_);
        AllocationManager remote(1000.0, AllocationStrategy::EQUAL_WEIGHT);
        LedgerCommitOptions options;
        options.holder = "remote";
        auto committed = commit_ledger_change(remote_store, remote, options, [&]() {
            BotConfig config;
            config.symbol = "BTCUSDT";
            config.leverage = 10.0;
            config.allocation_percentage = percentage;
            return remote.allocate_to_bot(bot_id, config);
        });
        ASSERT_TRUE(committed.is_ok()) << committed.error()->to_string();
    }

    void write_heartbeat(const std::string& bot_id, Duration age) {
        HeartbeatInfo heartbeat;
        heartbeat.bot_id = bot_id;
        heartbeat.last_seen = std::chrono::system_clock::now() - age;
        heartbeat.process_id = 1;
        heartbeat.hostname = "elsewhere";
        fs::create_directories(state_path_ + ".heartbeats");
        std::ofstream out(state_path_ + ".heartbeats/" + bot_id + ".json");
        out << heartbeat.to_json().dump();
    }

    template <typename Predicate>
    bool eventually(Predicate predicate,
                    std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return predicate();
    }

    std::string state_path_;
    std::shared_ptr<FileStateStore> store_;
    std::shared_ptr<AllocationManager> ledger_;
    std::shared_ptr<RecordingHandler> recorder_;
    SyncConfig config_;
    std::vector<std::unique_ptr<SyncManager>> managers_;
};

TEST_F(SyncManagerTest, ConstructionValidates) {
    EXPECT_THROW((SyncManager{config_, nullptr, ledger_}), PortfolioError);
    EXPECT_THROW((SyncManager{config_, store_, nullptr}), PortfolioError);

    SyncConfig invalid = config_;
    invalid.bot_id.clear();
    EXPECT_THROW((SyncManager{invalid, store_, ledger_}), PortfolioError);

    auto& manager = create_manager();
    EXPECT_EQ(manager.bot_id(), "bot_a");
    EXPECT_EQ(manager.heartbeat_dir(), state_path_ + ".heartbeats");
    EXPECT_FALSE(manager.is_running());
    EXPECT_FALSE(manager.is_healthy());

    auto component = StateManager::instance().get_state("SYNC_bot_a");
    ASSERT_TRUE(component.is_ok());
    EXPECT_EQ(component.value().state, ComponentState::INITIALIZED);
    EXPECT_EQ(component.value().type, ComponentType::SYNC_MANAGER);
}

TEST_F(SyncManagerTest, NullHandlerIsRejected) {
    auto& manager = create_manager();
    auto result = manager.add_event_handler(nullptr);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(SyncManagerTest, StartAndStop) {
    auto& manager = create_manager();

    ASSERT_TRUE(manager.start().is_ok());
    EXPECT_TRUE(manager.is_running());
    EXPECT_TRUE(manager.is_healthy());
    EXPECT_EQ(StateManager::instance().get_state("SYNC_bot_a").value().state,
              ComponentState::RUNNING);

    auto twice = manager.start();
    ASSERT_TRUE(twice.is_error());
    EXPECT_EQ(twice.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto registered = recorder_->events_of(EventType::REGISTER);
    ASSERT_EQ(registered.size(), 1u);
    EXPECT_EQ(registered[0].bot_id, "bot_a");
    EXPECT_EQ(registered[0].string_fields.at("startup"), "true");

    const fs::path heartbeat_file = fs::path(manager.heartbeat_dir()) / "bot_a.json";
    EXPECT_TRUE(eventually([&]() { return fs::exists(heartbeat_file); }));

    ASSERT_TRUE(manager.stop().is_ok());
    EXPECT_FALSE(manager.is_running());
    EXPECT_FALSE(manager.is_healthy());
    EXPECT_FALSE(fs::exists(heartbeat_file));
    EXPECT_EQ(StateManager::instance().get_state("SYNC_bot_a").value().state,
              ComponentState::STOPPED);

    auto unregistered = recorder_->events_of(EventType::UNREGISTER);
    ASSERT_EQ(unregistered.size(), 1u);
    EXPECT_EQ(unregistered[0].string_fields.at("shutdown"), "true");

    EXPECT_TRUE(manager.stop().is_ok());

    // A stopped manager can be started again
    ASSERT_TRUE(manager.start().is_ok());
    EXPECT_EQ(StateManager::instance().get_state("SYNC_bot_a").value().state,
              ComponentState::RUNNING);
}

TEST_F(SyncManagerTest, HeartbeatIsWrittenAndClassified) {
    auto& manager = create_manager();
    ASSERT_TRUE(manager.send_heartbeat().is_ok());

    std::ifstream in(fs::path(manager.heartbeat_dir()) / "bot_a.json");
    auto written = nlohmann::json::parse(in);
    EXPECT_EQ(written["bot_id"], "bot_a");
    EXPECT_EQ(written["version"], "2.0.0");
    EXPECT_EQ(written["pid"].get<int>(), static_cast<int>(::getpid()));
    EXPECT_EQ(written["hostname"].get<std::string>(), current_hostname());

    write_heartbeat("bot_quiet", std::chrono::minutes(2));
    write_heartbeat("bot_gone", std::chrono::minutes(10));
    {
        std::ofstream junk(manager.heartbeat_dir() + "/broken.json");
        junk << "not a heartbeat";
        std::ofstream other(manager.heartbeat_dir() + "/notes.txt");
        other << "ignored";
    }

    auto heartbeats = manager.get_active_heartbeats();
    ASSERT_TRUE(heartbeats.is_ok());
    const auto& found = heartbeats.value();
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found.at("bot_a").status, HeartbeatStatus::ACTIVE);
    EXPECT_EQ(found.at("bot_quiet").status, HeartbeatStatus::INACTIVE);
    EXPECT_EQ(found.at("bot_gone").status, HeartbeatStatus::DEAD);

    auto events = recorder_->events_of(EventType::HEARTBEAT);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].string_fields.at("hostname"), current_hostname());
    EXPECT_FALSE(events[0].requires_ack);
}

TEST_F(SyncManagerTest, NoHeartbeatDirectoryMeansNoBots) {
    auto& manager = create_manager();
    auto heartbeats = manager.get_active_heartbeats();
    ASSERT_TRUE(heartbeats.is_ok());
    EXPECT_TRUE(heartbeats.value().empty());
}

TEST_F(SyncManagerTest, HeartbeatLoopCountsBots) {
    write_heartbeat("bot_gone", std::chrono::minutes(10));
    auto& manager = create_manager();
    ASSERT_TRUE(manager.start().is_ok());

    EXPECT_TRUE(eventually([&]() {
        auto stats = manager.get_sync_stats();
        return stats.active_bots == 1 && stats.dead_bots == 1;
    }));
}

TEST_F(SyncManagerTest, SyncAdoptsRemoteChanges) {
    auto& manager = create_manager();

    ASSERT_TRUE(manager.sync_state().is_ok());
    EXPECT_TRUE(ledger_->has_bot("bot_a"));

    register_remote_bot("bot_b", 0.3);
    ASSERT_TRUE(manager.sync_state().is_ok());
    EXPECT_TRUE(ledger_->has_bot("bot_b"));

    // Nothing new to adopt
    ASSERT_TRUE(manager.sync_state().is_ok());

    auto stats = manager.get_sync_stats();
    EXPECT_EQ(stats.sync_count, 3);
    EXPECT_EQ(stats.successful_syncs, 3);
    EXPECT_EQ(stats.failed_syncs, 0);
    EXPECT_EQ(stats.conflict_count, 2);
    EXPECT_GE(stats.average_sync_ms, 0.0);
    EXPECT_NE(stats.last_conflict, Timestamp{});
    EXPECT_FALSE(store_->is_locked());
}

TEST_F(SyncManagerTest, SyncFailuresAreCounted) {
    auto& manager = create_manager();

    FileStateStore other_process(state_path_);
    ASSERT_TRUE(other_process.lock().is_ok());
    auto locked = manager.sync_state();
    ASSERT_TRUE(locked.is_error());
    EXPECT_EQ(locked.error()->code(), ErrorCode::PORTFOLIO_LOCKED);
    ASSERT_TRUE(other_process.unlock().is_ok());

    {
        std::ofstream out(state_path_);
        out << "garbage";
    }
    auto corrupted = manager.sync_state();
    ASSERT_TRUE(corrupted.is_error());
    EXPECT_EQ(corrupted.error()->code(), ErrorCode::STATE_CORRUPTED);

    auto stats = manager.get_sync_stats();
    EXPECT_EQ(stats.sync_count, 2);
    EXPECT_EQ(stats.successful_syncs, 0);
    EXPECT_EQ(stats.failed_syncs, 2);
    EXPECT_EQ(stats.lock_contentions, 1);
    EXPECT_EQ(stats.state_corruptions, 1);
}

TEST_F(SyncManagerTest, WaitForSync) {
    auto& manager = create_manager();

    auto idle = manager.wait_for_sync(std::chrono::milliseconds(50));
    ASSERT_TRUE(idle.is_error());
    EXPECT_EQ(idle.error()->code(), ErrorCode::TIMEOUT_ERROR);

    ASSERT_TRUE(manager.start().is_ok());
    EXPECT_TRUE(manager.wait_for_sync(std::chrono::seconds(3)).is_ok());
    EXPECT_GE(manager.get_sync_stats().successful_syncs, 1);
}

TEST_F(SyncManagerTest, CorruptedStateMakesManagerUnhealthy) {
    config_.max_sync_age = "200ms";
    auto& manager = create_manager();
    {
        std::ofstream out(state_path_);
        out << "{";
    }

    ASSERT_TRUE(manager.start().is_ok());
    EXPECT_TRUE(manager.is_healthy());

    EXPECT_TRUE(eventually([&]() {
        return StateManager::instance().get_state("SYNC_bot_a").value().state ==
               ComponentState::ERR_STATE;
    }));
    EXPECT_TRUE(eventually([&]() { return !manager.is_healthy(); }));
    EXPECT_GE(manager.get_sync_stats().state_corruptions, 1);

    // Recovers once the shared state is readable again
    fs::remove(state_path_);
    register_remote_bot("bot_a", 0.5);
    EXPECT_TRUE(eventually([&]() { return manager.is_healthy(); }));
    EXPECT_TRUE(eventually([&]() {
        return StateManager::instance().get_state("SYNC_bot_a").value().state ==
               ComponentState::RUNNING;
    }));
}

TEST_F(SyncManagerTest, UpdatePositionCommitsAndBroadcasts) {
    auto& manager = create_manager();
    ASSERT_TRUE(manager.update_position(1000.0, 50000.0, 10.0).is_ok());

    FileStateStore reader(state_path_);
    auto persisted = reader.load();
    ASSERT_TRUE(persisted.is_ok());
    EXPECT_DOUBLE_EQ(persisted.value().allocations.at("bot_a").current_position, 1000.0);
    ASSERT_TRUE(persisted.value().lock_holder.has_value());
    EXPECT_EQ(*persisted.value().lock_holder, "bot_a");

    auto events = recorder_->events_of(EventType::POSITION_UPDATE);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].requires_ack);
    EXPECT_DOUBLE_EQ(events[0].numeric_fields.at("position_value"), 1000.0);
    EXPECT_DOUBLE_EQ(events[0].numeric_fields.at("avg_price"), 50000.0);
    EXPECT_DOUBLE_EQ(events[0].numeric_fields.at("leverage"), 10.0);

    auto rejected = manager.update_position(100000.0, 50000.0, 1.0);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error()->code(), ErrorCode::EXCEEDS_ALLOCATION);
    EXPECT_EQ(recorder_->events_of(EventType::POSITION_UPDATE).size(), 1u);
}

TEST_F(SyncManagerTest, RecordProfitBroadcasts) {
    register_remote_bot("bot_b", 0.5);
    auto& manager = create_manager();

    ASSERT_TRUE(manager.record_profit(40.0, false).is_ok());
    ASSERT_TRUE(manager.record_profit(100.0, true).is_ok());

    EXPECT_DOUBLE_EQ(ledger_->total_profit(), 140.0);
    EXPECT_DOUBLE_EQ(ledger_->get_allocation("bot_b").value().allocated_balance, 550.0);

    auto events = recorder_->events_of(EventType::PROFIT_RECORD);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_FALSE(events[0].requires_ack);
    EXPECT_EQ(events[0].string_fields.at("share_profit"), "false");
    EXPECT_TRUE(events[1].requires_ack);
    EXPECT_EQ(events[1].string_fields.at("share_profit"), "true");
    EXPECT_DOUBLE_EQ(events[1].numeric_fields.at("profit"), 100.0);
}

TEST_F(SyncManagerTest, TriggerRebalance) {
    register_remote_bot("bot_b", 0.3);
    auto& manager = create_manager();
    ASSERT_TRUE(manager.sync_state().is_ok());
    ASSERT_TRUE(ledger_->set_allocated_balance("bot_a", 200.0).is_ok());

    // The local change is overwritten by the shared state on commit
    auto report = manager.trigger_rebalance();
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value().adjustments, 0);

    auto events = recorder_->events_of(EventType::REBALANCE);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].requires_ack);
    EXPECT_EQ(events[0].string_fields.at("trigger"), "manual");
    EXPECT_DOUBLE_EQ(events[0].numeric_fields.at("adjustments"), 0.0);
}

TEST_F(SyncManagerTest, RebalanceFixesPersistedDrift) {
    auto remote_store = std::make_shared<FileStateStore>(state_path_);
    AllocationManager remote(1000.0, AllocationStrategy::EQUAL_WEIGHT);
    LedgerCommitOptions options;
    options.holder = "remote";
    ASSERT_TRUE(commit_ledger_change(remote_store, remote, options, [&]() {
                    return remote.set_allocated_balance("bot_a", 200.0);
                }).is_ok());

    auto& manager = create_manager();
    auto report = manager.trigger_rebalance();
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value().adjustments, 1);
    EXPECT_DOUBLE_EQ(ledger_->get_allocation("bot_a").value().allocated_balance, 500.0);

    FileStateStore reader(state_path_);
    EXPECT_DOUBLE_EQ(reader.load().value().allocations.at("bot_a").allocated_balance, 500.0);
}

TEST_F(SyncManagerTest, CommitsKeepPersistedSettings) {
    PortfolioConfig settings;
    settings.total_balance = 1000.0;
    settings.max_total_exposure = 2.0;
    settings.shared_state_file = state_path_;

    auto remote_store = std::make_shared<FileStateStore>(state_path_);
    AllocationManager remote(1000.0, AllocationStrategy::EQUAL_WEIGHT);
    LedgerCommitOptions options;
    options.holder = "portfolio";
    options.global_settings = settings;
    ASSERT_TRUE(
        commit_ledger_change(remote_store, remote, options, []() { return Result<void>(); })
            .is_ok());

    auto& manager = create_manager();
    ASSERT_TRUE(manager.update_position(500.0, 100.0, 5.0).is_ok());

    FileStateStore reader(state_path_);
    auto persisted = reader.load().value();
    ASSERT_TRUE(persisted.global_settings.has_value());
    EXPECT_DOUBLE_EQ(persisted.global_settings->max_total_exposure, 2.0);
}

TEST_F(SyncManagerTest, AsynchronousEventsAreFlushed) {
    config_.async_events = true;
    auto& manager = create_manager();

    ASSERT_TRUE(manager.update_position(1000.0, 100.0, 10.0).is_ok());
    ASSERT_TRUE(manager.record_profit(5.0, false).is_ok());
    ASSERT_TRUE(manager.flush_events(std::chrono::seconds(3)).is_ok());

    auto events = recorder_->events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, EventType::POSITION_UPDATE);
    EXPECT_EQ(events[1].type, EventType::PROFIT_RECORD);
}
