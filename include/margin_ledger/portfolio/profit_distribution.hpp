// include/margin_ledger/portfolio/profit_distribution.hpp
#pragma once

#include <map>
#include <memory>
#include <string>
#include "margin_ledger/core/types.hpp"
#include "margin_ledger/portfolio/types.hpp"

namespace margin_ledger {

/**
 * @brief Strategy deciding how a shared profit is split across bots
 */
class ProfitDistributor {
public:
    virtual ~ProfitDistributor() = default;

    /**
     * @brief Compute each bot's share of a profit
     * @param source_bot_id Bot that realized the profit
     * @param profit Positive profit to distribute
     * @param allocations Current ledger
     * @return Amount to add to each bot's allocation; empty when nothing is shared
     */
    virtual std::map<std::string, Amount> distribute(
        const std::string& source_bot_id, Amount profit,
        const std::map<std::string, BotAllocation>& allocations) const = 0;

    virtual AllocationStrategy strategy() const = 0;
};

/**
 * @brief Splits evenly across every bot, the source included
 *
 * A lone bot has nobody to share with, so nothing is distributed.
 */
class EqualWeightDistributor : public ProfitDistributor {
public:
    std::map<std::string, Amount> distribute(
        const std::string& source_bot_id, Amount profit,
        const std::map<std::string, BotAllocation>& allocations) const override;

    AllocationStrategy strategy() const override {
        return AllocationStrategy::EQUAL_WEIGHT;
    }
};

/**
 * @brief Splits in proportion to positive realized PnL
 *
 * Falls back to equal weight when no bot is in profit.
 */
class PerformanceBasedDistributor : public ProfitDistributor {
public:
    std::map<std::string, Amount> distribute(
        const std::string& source_bot_id, Amount profit,
        const std::map<std::string, BotAllocation>& allocations) const override;

    AllocationStrategy strategy() const override {
        return AllocationStrategy::PERFORMANCE_BASED;
    }

private:
    EqualWeightDistributor fallback_;
};

// Keeps profit with the bot that earned it
class CustomDistributor : public ProfitDistributor {
public:
    std::map<std::string, Amount> distribute(
        const std::string&, Amount,
        const std::map<std::string, BotAllocation>&) const override {
        return {};
    }

    AllocationStrategy strategy() const override {
        return AllocationStrategy::CUSTOM;
    }
};

std::unique_ptr<ProfitDistributor> make_profit_distributor(AllocationStrategy strategy);

}  // namespace margin_ledger
