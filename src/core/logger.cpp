// src/core/logger.cpp

#include "margin_ledger/core/logger.hpp"
#include <algorithm>
#include <array>
#include <iostream>
#include <vector>
#include "margin_ledger/core/time_utils.hpp"

namespace margin_ledger {

thread_local std::string Logger::current_component_;

namespace {

const std::array<std::pair<LogLevel, const char*>, 6> kLevelNames = {{
    {LogLevel::TRACE, "TRACE"},
    {LogLevel::DEBUG, "DEBUG"},
    {LogLevel::INFO, "INFO"},
    {LogLevel::WARNING, "WARNING"},
    {LogLevel::ERR, "ERROR"},
    {LogLevel::FATAL, "FATAL"},
}};

const std::array<std::pair<LogDestination, const char*>, 3> kDestinationNames = {{
    {LogDestination::CONSOLE, "CONSOLE"},
    {LogDestination::FILE, "FILE"},
    {LogDestination::BOTH, "BOTH"},
}};

std::string generate_session_timestamp() {
    return core::get_formatted_time("%Y%m%d_%H%M%S");
}

}  // namespace

std::string level_to_string(LogLevel level) {
    for (const auto& [value, name] : kLevelNames) {
        if (value == level) {
            return name;
        }
    }
    return "UNKNOWN";
}

LogLevel level_from_string(const std::string& level, LogLevel fallback) {
    for (const auto& [value, name] : kLevelNames) {
        if (level == name) {
            return value;
        }
    }
    return fallback;
}

std::string log_destination_to_string(LogDestination dest) {
    for (const auto& [value, name] : kDestinationNames) {
        if (value == dest) {
            return name;
        }
    }
    return "UNKNOWN";
}

nlohmann::json LoggerConfig::to_json() const {
    return nlohmann::json{{"min_level", level_to_string(min_level)},
                          {"destination", log_destination_to_string(destination)},
                          {"log_directory", log_directory},
                          {"filename_prefix", filename_prefix},
                          {"include_timestamp", include_timestamp},
                          {"include_level", include_level},
                          {"max_file_size", max_file_size},
                          {"max_files", max_files},
                          {"version", version}};
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    min_level = level_from_string(j.value("min_level", level_to_string(min_level)), min_level);
    if (j.contains("destination")) {
        const auto dest = j.at("destination").get<std::string>();
        for (const auto& [value, name] : kDestinationNames) {
            if (dest == name) {
                destination = value;
            }
        }
    }
    log_directory = j.value("log_directory", log_directory);
    filename_prefix = j.value("filename_prefix", filename_prefix);
    include_timestamp = j.value("include_timestamp", include_timestamp);
    include_level = j.value("include_level", include_level);
    max_file_size = j.value("max_file_size", max_file_size);
    max_files = j.value("max_files", max_files);
    version = j.value("version", version);
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::ensure_initialized() {
    if (instance().is_initialized()) {
        return;
    }
    LoggerConfig config;
    config.destination = LogDestination::CONSOLE;
    instance().initialize(config);
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        // Make room before the new file so the total never exceeds max_files
        enforce_retention(log_dir);

        current_session_timestamp_ = generate_session_timestamp();
        current_part_number_ = 1;

        std::filesystem::path log_path = current_log_path(log_dir);
        log_file_.open(log_path, std::ios::app);
        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file: " + log_path.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string formatted_message = format_message(level, message);

    if (config_.destination == LogDestination::CONSOLE ||
        config_.destination == LogDestination::BOTH) {
        write_to_console_unsafe(formatted_message);
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        write_to_file_unsafe(formatted_message);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S") << " ";
    }

    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }

    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }

    ss << message;
    return ss.str();
}

void Logger::write_to_console_unsafe(const std::string& message) {
    // Assumes mutex is already held
    std::cout << message << std::endl;
}

void Logger::write_to_file_unsafe(const std::string& message) {
    // Assumes mutex is already held
    if (!log_file_.is_open()) {
        return;
    }

    log_file_ << message << std::endl;
    log_file_.flush();

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        rotate_log_files();
    }
}

void Logger::enforce_retention(const std::filesystem::path& log_dir) {
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log") {
            log_files.push_back(entry.path());
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::error_code ec;
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

std::filesystem::path Logger::current_log_path(const std::filesystem::path& log_dir) const {
    // prefix_YYYYMMDD_HHMMSS_partN.log
    return log_dir / (config_.filename_prefix + "_" + current_session_timestamp_ + "_part" +
                      std::to_string(current_part_number_) + ".log");
}

void Logger::rotate_log_files() {
    log_file_.close();

    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    enforce_retention(log_dir);

    current_part_number_++;
    log_file_.open(current_log_path(log_dir), std::ios::app);
}

}  // namespace margin_ledger
