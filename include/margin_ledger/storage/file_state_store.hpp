// include/margin_ledger/storage/file_state_store.hpp
#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/types.hpp"
#include "margin_ledger/storage/state_store.hpp"

namespace margin_ledger {

constexpr Duration kDefaultStaleLockAge = std::chrono::minutes(5);

/**
 * @brief Contents of a lock marker file
 */
struct LockInfo {
    Timestamp timestamp{};
    int process_id{0};
    std::string hostname;

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);

    bool operator==(const LockInfo& other) const {
        return timestamp == other.timestamp && process_id == other.process_id &&
               hostname == other.hostname;
    }
};

/**
 * @brief JSON file backed state store
 *
 * The state lives in one file written through a temp file and rename. The
 * lock is a sibling "<path>.lock" marker created exclusively; markers older
 * than the stale age are treated as abandoned.
 */
class FileStateStore : public StateStore {
public:
    /**
     * @brief Constructor
     * @param file_path Path of the state file
     * @param stale_lock_age Age after which a foreign lock marker is removed
     */
    explicit FileStateStore(std::string file_path, Duration stale_lock_age = kDefaultStaleLockAge);

    /**
     * @brief Releases a lock still held by this store
     */
    ~FileStateStore() override;

    FileStateStore(const FileStateStore&) = delete;
    FileStateStore& operator=(const FileStateStore&) = delete;

    Result<void> save(PortfolioState& state) override;
    Result<PortfolioState> load() override;
    Result<void> lock() override;
    Result<void> unlock() override;
    bool is_locked() const override;

    std::string location() const override {
        return file_path_;
    }

    /**
     * @brief Copy the state file to "<path>.backup_<YYYYMMDDHHMMSS>"
     * @return Path of the backup, FILE_NOT_FOUND when there is no state file
     */
    Result<std::string> backup_state();

    /**
     * @brief Replace the state file with a validated backup
     *
     * The current state file, if any, is backed up first.
     *
     * @param backup_path Backup to restore
     * @return FILE_NOT_FOUND, STATE_CORRUPTED or FILE_IO_ERROR on failure
     */
    Result<void> restore_from_backup(const std::string& backup_path);

    /**
     * @brief Describe the state file
     * @return JSON with exists, size, modified, path, locked and lock_info
     */
    Result<nlohmann::json> get_state_file_info() const;

    /**
     * @brief Read the current lock marker, whoever wrote it
     */
    Result<LockInfo> read_lock_info() const;

    const std::string& lock_path() const {
        return lock_path_;
    }

private:
    Result<void> create_lock_marker();
    Result<bool> remove_if_stale();
    Result<PortfolioState> read_state(const std::string& path) const;
    Result<std::string> backup_state_unsafe();

    std::string file_path_;
    std::string lock_path_;
    Duration stale_lock_age_;
    std::optional<LockInfo> held_lock_;
    mutable std::mutex mutex_;
};

/**
 * @brief Write a file through "<path>.tmp" and an atomic rename
 * @return FILE_IO_ERROR on failure; the temp file is removed
 */
Result<void> write_file_atomically(const std::string& path, const std::string& content);

/**
 * @brief Remove a lock marker only if it is still stale once moved aside
 *
 * The marker is renamed to a private name before its age is checked. A
 * marker that turns out to be live is linked back into place, so a takeover
 * by another process between a staleness check and the removal survives.
 *
 * @return true if the marker is gone, false if a live marker was kept
 */
Result<bool> discard_stale_lock_marker(const std::string& lock_path, Duration stale_age);

// Host name of this machine, "unknown" if it cannot be read
std::string current_hostname();

}  // namespace margin_ledger
