#include <gtest/gtest.h>
#include <unistd.h>
#include <filesystem>
#include <iterator>
#include <fstream>
#include <memory>
#include <thread>
#include "../core/test_base.hpp"
#include "margin_ledger/core/time_utils.hpp"
#include "margin_ledger/storage/file_state_store.hpp"
#include "margin_ledger/storage/state_lock.hpp"

using namespace margin_ledger;
using namespace margin_ledger::testing;

namespace fs = std::filesystem;

class FileStateStoreTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        state_path_ = path_in_temp("portfolio_state.json");
    }

    PortfolioState create_test_state() {
        PortfolioState state;
        state.total_balance = 1000.0;
        state.total_profit = 25.0;

        BotAllocation allocation;
        allocation.bot_id = "bot_a";
        allocation.symbol = "BTCUSDT";
        allocation.allocated_balance = 500.0;
        allocation.current_position = 1000.0;
        allocation.average_price = 50000.0;
        allocation.leverage = 10.0;
        allocation.position_margin_used = 100.0;
        allocation.used_balance = 100.0;
        allocation.available_balance = 400.0;
        allocation.realized_pnl = 25.0;
        allocation.allocation_percentage = 0.5;
        state.allocations["bot_a"] = allocation;

        PortfolioConfig settings;
        settings.total_balance = 1000.0;
        settings.shared_state_file = state_path_;
        state.global_settings = settings;
        state.lock_holder = "test_holder";
        state.lock_time = std::chrono::system_clock::now();
        return state;
    }

    void write_raw(const std::string& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    std::string read_raw(const std::string& path) {
        std::ifstream in(path);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::string state_path_;
};

TEST_F(FileStateStoreTest, SaveAndLoad) {
    FileStateStore store(state_path_);
    PortfolioState state = create_test_state();

    auto before = std::chrono::system_clock::now();
    ASSERT_TRUE(store.save(state).is_ok());
    EXPECT_GE(state.last_updated, before);
    EXPECT_TRUE(fs::exists(state_path_));
    EXPECT_FALSE(fs::exists(state_path_ + ".tmp"));

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok());
    const auto& restored = loaded.value();
    EXPECT_DOUBLE_EQ(restored.total_balance, 1000.0);
    EXPECT_DOUBLE_EQ(restored.total_profit, 25.0);
    EXPECT_EQ(restored.last_updated, state.last_updated);
    EXPECT_EQ(restored.version, "1.0");
    ASSERT_EQ(restored.allocations.size(), 1u);

    const auto& allocation = restored.allocations.at("bot_a");
    EXPECT_EQ(allocation.symbol, "BTCUSDT");
    EXPECT_DOUBLE_EQ(allocation.current_position, 1000.0);
    EXPECT_DOUBLE_EQ(allocation.position_margin_used, 100.0);
    EXPECT_DOUBLE_EQ(allocation.available_balance, 400.0);
    EXPECT_DOUBLE_EQ(allocation.leverage, 10.0);

    ASSERT_TRUE(restored.global_settings.has_value());
    EXPECT_EQ(restored.global_settings->shared_state_file, state_path_);
    ASSERT_TRUE(restored.lock_holder.has_value());
    EXPECT_EQ(*restored.lock_holder, "test_holder");
    ASSERT_TRUE(restored.lock_time.has_value());
    EXPECT_EQ(*restored.lock_time, *state.lock_time);
}

TEST_F(FileStateStoreTest, LoadMissingFile) {
    FileStateStore store(state_path_);
    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(FileStateStoreTest, SaveCreatesParentDirectories) {
    FileStateStore store(path_in_temp("nested/deeper/state.json"));
    PortfolioState state = create_test_state();
    ASSERT_TRUE(store.save(state).is_ok());
    EXPECT_TRUE(fs::exists(path_in_temp("nested/deeper/state.json")));
}

TEST_F(FileStateStoreTest, CorruptedFileIsReportedAndKept) {
    write_raw(state_path_, "{ this is not json");
    FileStateStore store(state_path_);

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error()->code(), ErrorCode::STATE_CORRUPTED);
    EXPECT_EQ(read_raw(state_path_), "{ this is not json");
}

TEST_F(FileStateStoreTest, StructurallyInvalidStatesAreCorrupted) {
    FileStateStore store(state_path_);

    PortfolioState zero_balance = create_test_state();
    zero_balance.total_balance = 0.0;
    write_raw(state_path_, zero_balance.to_json().dump());
    auto first = store.load();
    ASSERT_TRUE(first.is_error());
    EXPECT_EQ(first.error()->code(), ErrorCode::STATE_CORRUPTED);

    PortfolioState mismatched = create_test_state();
    mismatched.allocations["bot_a"].bot_id = "bot_b";
    write_raw(state_path_, mismatched.to_json().dump());
    auto second = store.load();
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error()->code(), ErrorCode::STATE_CORRUPTED);

    PortfolioState bad_leverage = create_test_state();
    bad_leverage.allocations["bot_a"].leverage = 0.0;
    write_raw(state_path_, bad_leverage.to_json().dump());
    auto third = store.load();
    ASSERT_TRUE(third.is_error());
    EXPECT_EQ(third.error()->code(), ErrorCode::STATE_CORRUPTED);
}

TEST_F(FileStateStoreTest, LockAndUnlock) {
    FileStateStore store(state_path_);

    ASSERT_TRUE(store.lock().is_ok());
    EXPECT_TRUE(store.is_locked());
    EXPECT_TRUE(fs::exists(store.lock_path()));

    auto info = store.read_lock_info();
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().process_id, static_cast<int>(::getpid()));
    EXPECT_EQ(info.value().hostname, current_hostname());

    auto relock = store.lock();
    ASSERT_TRUE(relock.is_error());
    EXPECT_EQ(relock.error()->code(), ErrorCode::PORTFOLIO_LOCKED);

    ASSERT_TRUE(store.unlock().is_ok());
    EXPECT_FALSE(store.is_locked());
    EXPECT_FALSE(fs::exists(store.lock_path()));

    // Unlocking without holding the lock is a no-op
    EXPECT_TRUE(store.unlock().is_ok());
}

TEST_F(FileStateStoreTest, LockContention) {
    FileStateStore first(state_path_);
    FileStateStore second(state_path_);

    ASSERT_TRUE(first.lock().is_ok());
    auto blocked = second.lock();
    ASSERT_TRUE(blocked.is_error());
    EXPECT_EQ(blocked.error()->code(), ErrorCode::PORTFOLIO_LOCKED);
    EXPECT_FALSE(second.is_locked());

    // A store that does not hold the lock leaves the marker alone
    ASSERT_TRUE(second.unlock().is_ok());
    EXPECT_TRUE(fs::exists(first.lock_path()));

    ASSERT_TRUE(first.unlock().is_ok());
    EXPECT_TRUE(second.lock().is_ok());
}

TEST_F(FileStateStoreTest, StaleLockIsTakenOver) {
    FileStateStore abandoned(state_path_);
    FileStateStore impatient(state_path_, std::chrono::milliseconds(50));

    ASSERT_TRUE(abandoned.lock().is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(120));

    ASSERT_TRUE(impatient.lock().is_ok());
    EXPECT_TRUE(impatient.is_locked());

    // The original holder must not remove the new owner's marker
    ASSERT_TRUE(abandoned.unlock().is_ok());
    EXPECT_FALSE(abandoned.is_locked());
    EXPECT_TRUE(fs::exists(impatient.lock_path()));

    ASSERT_TRUE(impatient.unlock().is_ok());
    EXPECT_FALSE(fs::exists(impatient.lock_path()));
}

TEST_F(FileStateStoreTest, UnreadableStaleMarkerIsRemoved) {
    FileStateStore store(state_path_, std::chrono::milliseconds(50));
    write_raw(store.lock_path(), "garbage");
    std::this_thread::sleep_for(std::chrono::milliseconds(120));

    ASSERT_TRUE(store.lock().is_ok());
    auto info = store.read_lock_info();
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().process_id, static_cast<int>(::getpid()));
}

TEST_F(FileStateStoreTest, TakeoverAfterStaleCheckKeepsNewHolder) {
    FileStateStore contender(state_path_);

    LockInfo abandoned;
    abandoned.timestamp = std::chrono::system_clock::now() - std::chrono::minutes(10);
    abandoned.process_id = 1;
    abandoned.hostname = "crashed-host";
    write_raw(contender.lock_path(), abandoned.to_json().dump());

    // The contender sees a stale marker
    auto observed = contender.read_lock_info();
    ASSERT_TRUE(observed.is_ok());
    EXPECT_EQ(observed.value(), abandoned);

    // Another process takes the lock over before the contender removes the marker
    FileStateStore new_holder(state_path_);
    ASSERT_TRUE(new_holder.lock().is_ok());
    auto held = new_holder.read_lock_info();
    ASSERT_TRUE(held.is_ok());

    auto discarded = discard_stale_lock_marker(contender.lock_path(), kDefaultStaleLockAge);
    ASSERT_TRUE(discarded.is_ok());
    EXPECT_FALSE(discarded.value());

    auto current = contender.read_lock_info();
    ASSERT_TRUE(current.is_ok());
    EXPECT_EQ(current.value(), held.value());

    auto locked = contender.lock();
    ASSERT_TRUE(locked.is_error());
    EXPECT_EQ(locked.error()->code(), ErrorCode::PORTFOLIO_LOCKED);

    // Ownership survived: the new holder's unlock still removes its marker
    ASSERT_TRUE(new_holder.unlock().is_ok());
    EXPECT_FALSE(fs::exists(new_holder.lock_path()));
    EXPECT_EQ(std::distance(fs::directory_iterator(temp_dir_), fs::directory_iterator{}), 0);
}

TEST_F(FileStateStoreTest, DiscardRemovesOnlyStaleMarkers) {
    FileStateStore store(state_path_);

    auto missing = discard_stale_lock_marker(store.lock_path(), kDefaultStaleLockAge);
    ASSERT_TRUE(missing.is_ok());
    EXPECT_TRUE(missing.value());

    LockInfo stale;
    stale.timestamp = std::chrono::system_clock::now() - std::chrono::minutes(6);
    stale.process_id = 1;
    stale.hostname = "crashed-host";
    write_raw(store.lock_path(), stale.to_json().dump());

    auto removed = discard_stale_lock_marker(store.lock_path(), kDefaultStaleLockAge);
    ASSERT_TRUE(removed.is_ok());
    EXPECT_TRUE(removed.value());
    EXPECT_FALSE(fs::exists(store.lock_path()));

    // A marker still being written is young by its modification time
    write_raw(store.lock_path(), "");
    auto kept = discard_stale_lock_marker(store.lock_path(), kDefaultStaleLockAge);
    ASSERT_TRUE(kept.is_ok());
    EXPECT_FALSE(kept.value());
    EXPECT_TRUE(fs::exists(store.lock_path()));
    EXPECT_EQ(std::distance(fs::directory_iterator(temp_dir_), fs::directory_iterator{}), 1);
}

TEST_F(FileStateStoreTest, DestructorReleasesLock) {
    std::string lock_path;
    {
        FileStateStore store(state_path_);
        ASSERT_TRUE(store.lock().is_ok());
        lock_path = store.lock_path();
        EXPECT_TRUE(fs::exists(lock_path));
    }
    EXPECT_FALSE(fs::exists(lock_path));
}

TEST_F(FileStateStoreTest, BackupAndRestore) {
    FileStateStore store(state_path_);

    auto missing = store.backup_state();
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::FILE_NOT_FOUND);

    PortfolioState original = create_test_state();
    ASSERT_TRUE(store.save(original).is_ok());

    auto backup = store.backup_state();
    ASSERT_TRUE(backup.is_ok());
    EXPECT_EQ(backup.value().rfind(state_path_ + ".backup_", 0), 0u);
    EXPECT_TRUE(fs::exists(backup.value()));

    PortfolioState changed = create_test_state();
    changed.total_profit = 999.0;
    ASSERT_TRUE(store.save(changed).is_ok());

    ASSERT_TRUE(store.restore_from_backup(backup.value()).is_ok());
    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_DOUBLE_EQ(loaded.value().total_profit, 25.0);

    // Restoring kept a safety copy of the replaced state
    int backups = 0;
    for (const auto& entry : fs::directory_iterator(temp_dir_)) {
        if (entry.path().filename().string().find(".backup_") != std::string::npos) {
            ++backups;
        }
    }
    EXPECT_EQ(backups, 2);
}

TEST_F(FileStateStoreTest, RestoreRejectsInvalidBackups) {
    FileStateStore store(state_path_);
    PortfolioState state = create_test_state();
    ASSERT_TRUE(store.save(state).is_ok());
    const std::string before = read_raw(state_path_);

    auto missing = store.restore_from_backup(path_in_temp("no_such_backup"));
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::FILE_NOT_FOUND);

    const std::string broken = path_in_temp("broken_backup");
    write_raw(broken, "[1, 2, 3]");
    auto corrupted = store.restore_from_backup(broken);
    ASSERT_TRUE(corrupted.is_error());
    EXPECT_EQ(corrupted.error()->code(), ErrorCode::STATE_CORRUPTED);

    EXPECT_EQ(read_raw(state_path_), before);
}

TEST_F(FileStateStoreTest, StateFileInfo) {
    FileStateStore store(state_path_);

    auto absent = store.get_state_file_info();
    ASSERT_TRUE(absent.is_ok());
    EXPECT_FALSE(absent.value()["exists"].get<bool>());
    EXPECT_EQ(absent.value()["path"].get<std::string>(), state_path_);

    PortfolioState state = create_test_state();
    ASSERT_TRUE(store.save(state).is_ok());
    ASSERT_TRUE(store.lock().is_ok());

    auto info = store.get_state_file_info();
    ASSERT_TRUE(info.is_ok());
    EXPECT_TRUE(info.value()["exists"].get<bool>());
    EXPECT_GT(info.value()["size"].get<uint64_t>(), 0u);
    EXPECT_TRUE(core::parse_timestamp(info.value()["modified"].get<std::string>()).is_ok());
    EXPECT_TRUE(info.value()["locked"].get<bool>());
    EXPECT_EQ(info.value()["lock_info"]["process_id"].get<int>(), static_cast<int>(::getpid()));
}

TEST_F(FileStateStoreTest, EmptyPathIsRejected) {
    EXPECT_THROW(FileStateStore(""), PortfolioError);
}

TEST_F(FileStateStoreTest, LockGuardReleasesOnScopeExit) {
    auto store = std::make_shared<FileStateStore>(state_path_);
    {
        auto guard = StateLockGuard::acquire(store, std::chrono::seconds(1));
        ASSERT_TRUE(guard.is_ok());
        EXPECT_TRUE(guard.value()->owns_lock());
        EXPECT_TRUE(store->is_locked());
    }
    EXPECT_FALSE(store->is_locked());
    EXPECT_FALSE(fs::exists(store->lock_path()));
}

TEST_F(FileStateStoreTest, LockGuardExplicitRelease) {
    auto store = std::make_shared<FileStateStore>(state_path_);
    auto guard = StateLockGuard::acquire(store);
    ASSERT_TRUE(guard.is_ok());

    ASSERT_TRUE(guard.value()->release().is_ok());
    EXPECT_FALSE(guard.value()->owns_lock());
    EXPECT_FALSE(store->is_locked());
    EXPECT_TRUE(guard.value()->release().is_ok());
}

TEST_F(FileStateStoreTest, LockGuardForwardsContention) {
    FileStateStore holder(state_path_);
    auto contender = std::make_shared<FileStateStore>(state_path_);
    ASSERT_TRUE(holder.lock().is_ok());

    auto guard = StateLockGuard::acquire(contender, std::chrono::milliseconds(500));
    ASSERT_TRUE(guard.is_error());
    EXPECT_EQ(guard.error()->code(), ErrorCode::PORTFOLIO_LOCKED);
}
