// include/margin_ledger/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace margin_ledger {

/**
 * @brief Error codes for the portfolio coordination layer
 * Defines all possible error conditions that can occur
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Balance and allocation errors
    INSUFFICIENT_BALANCE = 4,
    INSUFFICIENT_MARGIN = 5,
    EXCEEDS_ALLOCATION = 6,
    EXCEEDS_RISK_LIMIT = 7,

    // Registration errors
    BOT_NOT_REGISTERED = 8,
    BOT_ALREADY_REGISTERED = 9,

    // Configuration errors
    INVALID_LEVERAGE = 10,
    CONFIGURATION_INVALID = 11,

    // Shared state errors
    PORTFOLIO_LOCKED = 12,
    STATE_CORRUPTED = 13,

    // System errors
    TIMEOUT_ERROR = 14,

    // File and I/O errors
    FILE_NOT_FOUND = 15,
    FILE_IO_ERROR = 16,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 17,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Get the canonical name of an error code
 * @param code The error code
 * @return Upper-case name, e.g. "EXCEEDS_ALLOCATION"
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::INSUFFICIENT_BALANCE:
            return "INSUFFICIENT_BALANCE";
        case ErrorCode::INSUFFICIENT_MARGIN:
            return "INSUFFICIENT_MARGIN";
        case ErrorCode::EXCEEDS_ALLOCATION:
            return "EXCEEDS_ALLOCATION";
        case ErrorCode::EXCEEDS_RISK_LIMIT:
            return "EXCEEDS_RISK_LIMIT";
        case ErrorCode::BOT_NOT_REGISTERED:
            return "BOT_NOT_REGISTERED";
        case ErrorCode::BOT_ALREADY_REGISTERED:
            return "BOT_ALREADY_REGISTERED";
        case ErrorCode::INVALID_LEVERAGE:
            return "INVALID_LEVERAGE";
        case ErrorCode::CONFIGURATION_INVALID:
            return "CONFIGURATION_INVALID";
        case ErrorCode::PORTFOLIO_LOCKED:
            return "PORTFOLIO_LOCKED";
        case ErrorCode::STATE_CORRUPTED:
            return "STATE_CORRUPTED";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "CUSTOM_ERROR";
    }
}

/**
 * @brief Error raised by portfolio components
 */
class PortfolioError : public std::runtime_error {
public:
    /**
     * @brief Constructor for PortfolioError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     * @param bot_id Bot the failing operation acted on, if any
     */
    PortfolioError(ErrorCode code, const std::string& message, const std::string& component = "",
                   const std::string& bot_id = "")
        : std::runtime_error(message), code_(code), component_(component), bot_id_(bot_id) {}

    /**
     * @brief Get the error code
     * @return ErrorCode representing the type of error
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component where error occurred
     * @return String identifying the component
     */
    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Get the bot the error is attached to
     * @return Bot identifier, empty for portfolio-wide errors
     */
    const std::string& bot_id() const noexcept {
        return bot_id_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        std::string out = error_code_to_string(code_);
        if (!bot_id_.empty()) {
            out += " [" + bot_id_ + "]";
        }
        out += ": " + std::string(what());
        if (!component_.empty()) {
            out += " (in " + component_ + ")";
        }
        return out;
    }

private:
    ErrorCode code_;
    std::string component_;
    std::string bot_id_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     * @tparam U The type of the successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<PortfolioError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    /**
     * @brief Check if result represents success
     * @return true if operation was successful
     */
    bool is_ok() const {
        return error_ == nullptr;
    }

    /**
     * @brief Check if result represents error
     * @return true if operation failed
     */
    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws PortfolioError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const PortfolioError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<PortfolioError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<PortfolioError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const PortfolioError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<PortfolioError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @param bot_id The bot the operation acted on
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "", const std::string& bot_id = "") {
    return Result<T>(std::make_unique<PortfolioError>(code, message, component, bot_id));
}

/**
 * @brief Re-wrap an existing error into a result of another type
 * @tparam T The type of the new result
 * @param error The error to copy
 * @return Result carrying a copy of the error
 */
template <typename T>
Result<T> forward_error(const PortfolioError& error) {
    return Result<T>(std::make_unique<PortfolioError>(error));
}

}  // namespace margin_ledger
