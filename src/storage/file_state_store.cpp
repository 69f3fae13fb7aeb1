// src/storage/file_state_store.cpp

#include "margin_ledger/storage/file_state_store.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "margin_ledger/core/logger.hpp"
#include "margin_ledger/core/time_utils.hpp"

namespace fs = std::filesystem;

namespace margin_ledger {

namespace {

Timestamp to_system_time(fs::file_time_type file_time) {
    return std::chrono::time_point_cast<Timestamp::duration>(
        file_time - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

Result<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<std::string>(ErrorCode::FILE_IO_ERROR,
                                       "Failed to open file for reading: " + path,
                                       "FileStateStore");
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// Structural checks applied to every state read from disk
Result<void> validate_structure(const PortfolioState& state) {
    if (!(state.total_balance > 0.0)) {
        return make_error<void>(ErrorCode::STATE_CORRUPTED,
                                "Invalid total balance: " + std::to_string(state.total_balance),
                                "FileStateStore");
    }
    for (const auto& [bot_id, allocation] : state.allocations) {
        if (allocation.bot_id != bot_id) {
            return make_error<void>(ErrorCode::STATE_CORRUPTED,
                                    "Bot ID mismatch: expected " + bot_id + ", got " +
                                        allocation.bot_id,
                                    "FileStateStore", bot_id);
        }
        if (allocation.allocated_balance < 0.0 || allocation.used_balance < 0.0) {
            return make_error<void>(ErrorCode::STATE_CORRUPTED,
                                    "Negative balance for bot " + bot_id, "FileStateStore",
                                    bot_id);
        }
        if (!(allocation.leverage > 0.0)) {
            return make_error<void>(ErrorCode::STATE_CORRUPTED,
                                    "Invalid leverage for bot " + bot_id + ": " +
                                        std::to_string(allocation.leverage),
                                    "FileStateStore", bot_id);
        }
    }
    return Result<void>();
}

Result<LockInfo> read_lock_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return make_error<LockInfo>(ErrorCode::FILE_NOT_FOUND, "Lock file not found: " + path,
                                    "FileStateStore");
    }

    auto content = read_file(path);
    if (content.is_error()) {
        return forward_error<LockInfo>(*content.error());
    }

    LockInfo info;
    try {
        info.from_json(nlohmann::json::parse(content.value()));
    } catch (const nlohmann::json::exception& e) {
        return make_error<LockInfo>(ErrorCode::JSON_PARSE_ERROR,
                                    "Invalid lock file " + path + ": " + e.what(),
                                    "FileStateStore");
    } catch (const PortfolioError& e) {
        return make_error<LockInfo>(ErrorCode::JSON_PARSE_ERROR,
                                    "Invalid lock file " + path + ": " + e.what(),
                                    "FileStateStore");
    }
    return info;
}

// Age from the marker's timestamp; unreadable markers are aged by mtime
Result<Duration> marker_age(const std::string& path) {
    auto info = read_lock_file(path);
    if (info.is_ok()) {
        return std::chrono::duration_cast<Duration>(std::chrono::system_clock::now() -
                                                    info.value().timestamp);
    }
    if (info.error()->code() == ErrorCode::FILE_NOT_FOUND) {
        return forward_error<Duration>(*info.error());
    }

    std::error_code ec;
    auto modified = fs::last_write_time(path, ec);
    if (ec) {
        std::error_code exists_ec;
        if (!fs::exists(path, exists_ec)) {
            return make_error<Duration>(ErrorCode::FILE_NOT_FOUND,
                                        "Lock file not found: " + path, "FileStateStore");
        }
        return make_error<Duration>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to stat lock file " + path + ": " + ec.message(),
                                    "FileStateStore");
    }
    return std::chrono::duration_cast<Duration>(fs::file_time_type::clock::now() - modified);
}

std::atomic<unsigned> stale_marker_sequence{0};

}  // namespace

std::string current_hostname() {
    char buffer[256];
    if (::gethostname(buffer, sizeof(buffer)) != 0) {
        return "unknown";
    }
    buffer[sizeof(buffer) - 1] = '\0';
    return std::string(buffer);
}

Result<void> write_file_atomically(const std::string& path, const std::string& content) {
    const std::string temp_path = path + ".tmp";
    std::error_code ec;

    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to create directory " + parent.string() + ": " +
                                        ec.message(),
                                    "FileStateStore");
        }
    }

    {
        std::ofstream out(temp_path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open temp file: " + temp_path, "FileStateStore");
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp_path, ec);
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to write temp file: " + temp_path, "FileStateStore");
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to move " + temp_path + " into place: " + ec.message(),
                                "FileStateStore");
    }
    return Result<void>();
}

nlohmann::json LockInfo::to_json() const {
    nlohmann::json j;
    j["timestamp"] = core::format_timestamp(timestamp);
    j["process_id"] = process_id;
    j["hostname"] = hostname;
    return j;
}

void LockInfo::from_json(const nlohmann::json& j) {
    auto parsed = core::parse_timestamp(j.at("timestamp").get<std::string>());
    timestamp = parsed.value();
    process_id = j.at("process_id").get<int>();
    hostname = j.at("hostname").get<std::string>();
}

FileStateStore::FileStateStore(std::string file_path, Duration stale_lock_age)
    : file_path_(std::move(file_path)),
      lock_path_(file_path_ + ".lock"),
      stale_lock_age_(stale_lock_age) {
    if (file_path_.empty()) {
        throw PortfolioError(ErrorCode::CONFIGURATION_INVALID, "State file path cannot be empty",
                             "FileStateStore");
    }
    Logger::ensure_initialized();
}

FileStateStore::~FileStateStore() {
    if (is_locked()) {
        auto result = unlock();
        if (result.is_error()) {
            WARN("Failed to release lock on destruction: " << result.error()->what());
        }
    }
}

Result<void> FileStateStore::save(PortfolioState& state) {
    std::lock_guard<std::mutex> lock(mutex_);

    state.last_updated = std::chrono::system_clock::now();

    std::string content;
    try {
        content = state.to_json().dump(4);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Failed to serialize state: ") + e.what(),
                                "FileStateStore");
    }

    auto written = write_file_atomically(file_path_, content);
    if (written.is_error()) {
        ERROR("Failed to save state to " << file_path_ << ": " << written.error()->what());
        return written;
    }

    DEBUG("State saved to " << file_path_ << " (" << state.allocations.size() << " bots)");
    return Result<void>();
}

Result<PortfolioState> FileStateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_state(file_path_);
}

Result<PortfolioState> FileStateStore::read_state(const std::string& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return make_error<PortfolioState>(ErrorCode::FILE_NOT_FOUND,
                                          "State file not found: " + path, "FileStateStore");
    }

    auto content = read_file(path);
    if (content.is_error()) {
        return forward_error<PortfolioState>(*content.error());
    }

    PortfolioState state;
    try {
        state.from_json(nlohmann::json::parse(content.value()));
    } catch (const nlohmann::json::exception& e) {
        return make_error<PortfolioState>(ErrorCode::STATE_CORRUPTED,
                                          "Failed to parse state file " + path + ": " + e.what(),
                                          "FileStateStore");
    } catch (const PortfolioError& e) {
        return make_error<PortfolioState>(ErrorCode::STATE_CORRUPTED,
                                          "Invalid state file " + path + ": " + e.what(),
                                          "FileStateStore");
    }

    auto valid = validate_structure(state);
    if (valid.is_error()) {
        return forward_error<PortfolioState>(*valid.error());
    }
    return state;
}

Result<void> FileStateStore::lock() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (held_lock_) {
        return make_error<void>(ErrorCode::PORTFOLIO_LOCKED, "Storage is already locked",
                                "FileStateStore");
    }

    auto created = create_lock_marker();
    if (created.is_ok() || created.error()->code() != ErrorCode::PORTFOLIO_LOCKED) {
        return created;
    }

    auto stale = remove_if_stale();
    if (stale.is_error()) {
        return forward_error<void>(*stale.error());
    }
    if (!stale.value()) {
        return created;
    }

    return create_lock_marker();
}

Result<void> FileStateStore::create_lock_marker() {
    LockInfo info;
    info.timestamp = std::chrono::system_clock::now();
    info.process_id = static_cast<int>(::getpid());
    info.hostname = current_hostname();
    const std::string content = info.to_json().dump();

    int fd = ::open(lock_path_.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return make_error<void>(ErrorCode::PORTFOLIO_LOCKED,
                                    "Portfolio storage is locked by another process",
                                    "FileStateStore");
        }
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to create lock file " + lock_path_ + ": " +
                                    std::strerror(errno),
                                "FileStateStore");
    }

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR)
                continue;
            std::string reason = std::strerror(errno);
            ::close(fd);
            ::unlink(lock_path_.c_str());
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to write lock file " + lock_path_ + ": " + reason,
                                    "FileStateStore");
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    ::close(fd);

    held_lock_ = info;
    DEBUG("Lock acquired: " << lock_path_);
    return Result<void>();
}

Result<bool> FileStateStore::remove_if_stale() {
    auto age = marker_age(lock_path_);
    if (age.is_error()) {
        if (age.error()->code() == ErrorCode::FILE_NOT_FOUND) {
            // Released between our attempt and this check
            return true;
        }
        return forward_error<bool>(*age.error());
    }

    if (age.value() <= stale_lock_age_) {
        return false;
    }

    WARN("Removing stale lock file " << lock_path_
                                     << " (age: " << core::format_duration(age.value()) << ")");
    return discard_stale_lock_marker(lock_path_, stale_lock_age_);
}

Result<void> FileStateStore::unlock() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!held_lock_) {
        return Result<void>();
    }

    auto current = read_lock_info();
    if (current.is_error()) {
        if (current.error()->code() != ErrorCode::FILE_NOT_FOUND) {
            WARN("Lock marker " << lock_path_ << " is unreadable, leaving it in place");
        }
        held_lock_.reset();
        return Result<void>();
    }

    if (!(current.value() == *held_lock_)) {
        WARN("Lock marker " << lock_path_ << " now belongs to pid "
                            << current.value().process_id << ", leaving it in place");
        held_lock_.reset();
        return Result<void>();
    }

    std::error_code ec;
    fs::remove(lock_path_, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to remove lock file " + lock_path_ + ": " + ec.message(),
                                "FileStateStore");
    }

    held_lock_.reset();
    DEBUG("Lock released: " << lock_path_);
    return Result<void>();
}

bool FileStateStore::is_locked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_lock_.has_value();
}

Result<LockInfo> FileStateStore::read_lock_info() const {
    return read_lock_file(lock_path_);
}

Result<std::string> FileStateStore::backup_state() {
    std::lock_guard<std::mutex> lock(mutex_);
    return backup_state_unsafe();
}

Result<std::string> FileStateStore::backup_state_unsafe() {
    std::error_code ec;
    if (!fs::exists(file_path_, ec)) {
        return make_error<std::string>(ErrorCode::FILE_NOT_FOUND, "No state file to back up",
                                       "FileStateStore");
    }

    const std::string base = file_path_ + ".backup_" + core::get_formatted_time("%Y%m%d%H%M%S");
    std::string backup_path = base;
    for (int suffix = 1; fs::exists(backup_path, ec); ++suffix) {
        backup_path = base + "_" + std::to_string(suffix);
    }

    fs::copy_file(file_path_, backup_path, fs::copy_options::none, ec);
    if (ec) {
        return make_error<std::string>(ErrorCode::FILE_IO_ERROR,
                                       "Failed to create backup " + backup_path + ": " +
                                           ec.message(),
                                       "FileStateStore");
    }

    INFO("Portfolio state backed up to " << backup_path);
    return backup_path;
}

Result<void> FileStateStore::restore_from_backup(const std::string& backup_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!fs::exists(backup_path, ec)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Backup file does not exist: " + backup_path, "FileStateStore");
    }

    auto state = read_state(backup_path);
    if (state.is_error()) {
        return make_error<void>(ErrorCode::STATE_CORRUPTED,
                                "Invalid backup state: " + std::string(state.error()->what()),
                                "FileStateStore");
    }

    auto content = read_file(backup_path);
    if (content.is_error()) {
        return forward_error<void>(*content.error());
    }

    if (fs::exists(file_path_, ec)) {
        auto safety_copy = backup_state_unsafe();
        if (safety_copy.is_error()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Could not back up current state before restore: " +
                                        std::string(safety_copy.error()->what()),
                                    "FileStateStore");
        }
    }

    auto written = write_file_atomically(file_path_, content.value());
    if (written.is_error()) {
        return written;
    }

    INFO("Portfolio state restored from " << backup_path);
    return Result<void>();
}

Result<nlohmann::json> FileStateStore::get_state_file_info() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json info;
    info["path"] = file_path_;

    std::error_code ec;
    if (!fs::exists(file_path_, ec)) {
        info["exists"] = false;
        return info;
    }

    auto size = fs::file_size(file_path_, ec);
    if (ec) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Failed to get file info: " + ec.message(),
                                          "FileStateStore");
    }
    auto modified = fs::last_write_time(file_path_, ec);
    if (ec) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Failed to get file info: " + ec.message(),
                                          "FileStateStore");
    }

    info["exists"] = true;
    info["size"] = size;
    info["modified"] = core::format_timestamp(to_system_time(modified));

    bool locked = fs::exists(lock_path_, ec);
    info["locked"] = locked;
    if (locked) {
        auto lock_info = read_lock_info();
        if (lock_info.is_ok()) {
            info["lock_info"] = lock_info.value().to_json();
        }
    }
    return info;
}

Result<bool> discard_stale_lock_marker(const std::string& lock_path, Duration stale_age) {
    // Move the marker out of the way first so a fresh one created meanwhile is never deleted
    const std::string aside = lock_path + ".stale." + std::to_string(::getpid()) + "." +
                              std::to_string(++stale_marker_sequence);
    if (::rename(lock_path.c_str(), aside.c_str()) != 0) {
        if (errno == ENOENT) {
            return true;
        }
        return make_error<bool>(ErrorCode::FILE_IO_ERROR,
                                "Failed to move stale lock " + lock_path + ": " +
                                    std::strerror(errno),
                                "FileStateStore");
    }

    auto age = marker_age(aside);
    if (age.is_ok() && age.value() > stale_age) {
        std::error_code ec;
        fs::remove(aside, ec);
        if (ec) {
            return make_error<bool>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to remove stale lock " + aside + ": " + ec.message(),
                                    "FileStateStore");
        }
        return true;
    }

    // Another process took the lock over before the move; hand its marker back
    if (::link(aside.c_str(), lock_path.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        ERROR("Could not restore live lock marker " << lock_path << ": " << reason);
        ::unlink(aside.c_str());
        return make_error<bool>(ErrorCode::FILE_IO_ERROR,
                                "Failed to restore live lock " + lock_path + ": " + reason,
                                "FileStateStore");
    }
    ::unlink(aside.c_str());

    if (age.is_error()) {
        return forward_error<bool>(*age.error());
    }
    DEBUG("Lock " << lock_path << " was taken over by another process, left in place");
    return false;
}

}  // namespace margin_ledger
