// src/portfolio/profit_distribution.cpp

#include "margin_ledger/portfolio/profit_distribution.hpp"

namespace margin_ledger {

std::map<std::string, Amount> EqualWeightDistributor::distribute(
    const std::string&, Amount profit,
    const std::map<std::string, BotAllocation>& allocations) const {
    std::map<std::string, Amount> shares;
    if (allocations.size() <= 1 || profit <= 0.0) {
        return shares;
    }

    Amount share_per_bot = profit / static_cast<double>(allocations.size());
    for (const auto& [bot_id, _] : allocations) {
        shares[bot_id] = share_per_bot;
    }
    return shares;
}

std::map<std::string, Amount> PerformanceBasedDistributor::distribute(
    const std::string& source_bot_id, Amount profit,
    const std::map<std::string, BotAllocation>& allocations) const {
    if (profit <= 0.0) {
        return {};
    }

    Amount total_pnl = 0.0;
    for (const auto& [_, allocation] : allocations) {
        if (allocation.realized_pnl > 0.0) {
            total_pnl += allocation.realized_pnl;
        }
    }

    if (total_pnl <= 0.0) {
        return fallback_.distribute(source_bot_id, profit, allocations);
    }

    std::map<std::string, Amount> shares;
    for (const auto& [bot_id, allocation] : allocations) {
        if (allocation.realized_pnl > 0.0) {
            shares[bot_id] = profit * (allocation.realized_pnl / total_pnl);
        }
    }
    return shares;
}

std::unique_ptr<ProfitDistributor> make_profit_distributor(AllocationStrategy strategy) {
    switch (strategy) {
        case AllocationStrategy::EQUAL_WEIGHT:
            return std::make_unique<EqualWeightDistributor>();
        case AllocationStrategy::PERFORMANCE_BASED:
            return std::make_unique<PerformanceBasedDistributor>();
        case AllocationStrategy::CUSTOM:
            return std::make_unique<CustomDistributor>();
    }
    return std::make_unique<CustomDistributor>();
}

}  // namespace margin_ledger
