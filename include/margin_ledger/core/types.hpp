// include/margin_ledger/core/types.hpp

#pragma once

#include <chrono>
#include <string>

namespace margin_ledger {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Duration type used for intervals, timeouts and staleness windows
 */
using Duration = std::chrono::milliseconds;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Monetary amount in quote currency (USD)
 */
using Amount = double;

/**
 * @brief Tolerance used when comparing summed balances
 */
constexpr double kBalanceTolerance = 0.01;

}  // namespace margin_ledger
