#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <string>
#include "../core/test_base.hpp"
#include "margin_ledger/portfolio/risk_manager.hpp"

using namespace margin_ledger;
using namespace margin_ledger::testing;

class RiskManagerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        config_.total_balance = 1000.0;
        config_.max_total_exposure = 3.0;    // 3x total balance
        config_.max_drawdown_percent = 25.0;  // 25% from peak
        risk_manager_ = std::make_unique<RiskManager>(config_);
    }

    BotAllocation create_allocation(const std::string& bot_id, const std::string& symbol,
                                    Amount allocated, Amount position, double leverage) {
        BotAllocation allocation;
        allocation.bot_id = bot_id;
        allocation.symbol = symbol;
        allocation.allocated_balance = allocated;
        allocation.current_position = position;
        allocation.leverage = leverage;
        allocation.position_margin_used = position / leverage;
        allocation.used_balance = allocation.position_margin_used;
        allocation.available_balance = allocated - allocation.used_balance;
        return allocation;
    }

    PortfolioConfig config_;
    std::unique_ptr<RiskManager> risk_manager_;
};

TEST_F(RiskManagerTest, ValidateNewPosition) {
    EXPECT_TRUE(risk_manager_->validate_new_position("bot_a", 1000.0, 10.0).is_ok());
    EXPECT_TRUE(risk_manager_->validate_new_position("bot_a", 1000.0, 125.0).is_ok());

    auto zero = risk_manager_->validate_new_position("bot_a", 0.0, 10.0);
    ASSERT_TRUE(zero.is_error());
    EXPECT_EQ(zero.error()->code(), ErrorCode::CONFIGURATION_INVALID);
    EXPECT_EQ(zero.error()->bot_id(), "bot_a");

    auto negative = risk_manager_->validate_new_position("bot_a", -50.0, 10.0);
    ASSERT_TRUE(negative.is_error());
    EXPECT_EQ(negative.error()->code(), ErrorCode::CONFIGURATION_INVALID);

    auto leverage = risk_manager_->validate_new_position("bot_a", 1000.0, 126.0);
    ASSERT_TRUE(leverage.is_error());
    EXPECT_EQ(leverage.error()->code(), ErrorCode::INVALID_LEVERAGE);
}

TEST_F(RiskManagerTest, ExposureLimits) {
    EXPECT_TRUE(risk_manager_->is_within_risk_limits(2999.0, 1000.0));
    EXPECT_TRUE(risk_manager_->is_within_risk_limits(3000.0, 1000.0));
    EXPECT_FALSE(risk_manager_->is_within_risk_limits(3001.0, 1000.0));

    // No capital means nothing is within limits
    EXPECT_FALSE(risk_manager_->is_within_risk_limits(0.0, 0.0));
    EXPECT_FALSE(risk_manager_->is_within_risk_limits(10.0, -5.0));
}

TEST_F(RiskManagerTest, PortfolioLimitsExposure) {
    std::map<std::string, BotAllocation> allocations;
    allocations["bot_a"] = create_allocation("bot_a", "BTCUSDT", 500.0, 2000.0, 10.0);
    allocations["bot_b"] = create_allocation("bot_b", "ETHUSDT", 500.0, 900.0, 10.0);

    EXPECT_TRUE(
        risk_manager_->check_portfolio_limits(allocations, 1000.0, 1000.0, 1000.0).is_ok());

    allocations["bot_b"] = create_allocation("bot_b", "ETHUSDT", 500.0, 1500.0, 10.0);
    auto result = risk_manager_->check_portfolio_limits(allocations, 1000.0, 1000.0, 1000.0);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::EXCEEDS_RISK_LIMIT);
}

TEST_F(RiskManagerTest, PortfolioLimitsDrawdown) {
    std::map<std::string, BotAllocation> allocations;
    allocations["bot_a"] = create_allocation("bot_a", "BTCUSDT", 500.0, 0.0, 10.0);
    allocations["bot_a"].realized_pnl = -100.0;

    // 900 against a peak of 1000 is a 10% drawdown
    Amount value = portfolio_value(1000.0, -100.0, allocations);
    EXPECT_TRUE(risk_manager_->check_portfolio_limits(allocations, 1000.0, value, 1000.0).is_ok());

    allocations["bot_a"].unrealized_pnl = -200.0;
    value = portfolio_value(1000.0, -100.0, allocations);
    EXPECT_DOUBLE_EQ(value, 700.0);
    auto result = risk_manager_->check_portfolio_limits(allocations, 1000.0, value, 1000.0);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::EXCEEDS_RISK_LIMIT);
}

TEST_F(RiskManagerTest, PortfolioLimitsInvalidBalance) {
    auto result = risk_manager_->check_portfolio_limits({}, 0.0, 0.0, 0.0);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(RiskManagerTest, RiskMetrics) {
    std::map<std::string, BotAllocation> allocations;
    allocations["bot_a"] = create_allocation("bot_a", "BTCUSDT", 500.0, 1500.0, 10.0);
    allocations["bot_b"] = create_allocation("bot_b", "BTCUSDT", 250.0, 500.0, 5.0);
    allocations["bot_c"] = create_allocation("bot_c", "ETHUSDT", 250.0, 0.0, 1.0);

    auto result = risk_manager_->get_risk_metrics(allocations, 1000.0, 1000.0, 1000.0);
    ASSERT_TRUE(result.is_ok());
    const auto& metrics = result.value();

    EXPECT_DOUBLE_EQ(metrics.total_exposure, 2000.0);
    EXPECT_DOUBLE_EQ(metrics.exposure_by_symbol.at("BTCUSDT"), 2000.0);
    EXPECT_DOUBLE_EQ(metrics.exposure_by_symbol.at("ETHUSDT"), 0.0);
    // (1500 * 10 + 500 * 5) / 2000
    EXPECT_DOUBLE_EQ(metrics.weighted_leverage, 8.75);
    EXPECT_DOUBLE_EQ(metrics.concentration_risk, 0.75);
    // (150 + 100) / 1000
    EXPECT_DOUBLE_EQ(metrics.margin_utilization, 0.25);
    EXPECT_DOUBLE_EQ(metrics.worst_case_drawdown, 25.0);
    EXPECT_DOUBLE_EQ(metrics.drawdown_from_peak, 0.0);
}

TEST_F(RiskManagerTest, RiskMetricsWithoutPositions) {
    std::map<std::string, BotAllocation> allocations;
    allocations["bot_a"] = create_allocation("bot_a", "BTCUSDT", 500.0, 0.0, 10.0);
    allocations["bot_a"].realized_pnl = -50.0;

    Amount value = portfolio_value(1000.0, -50.0, allocations);
    auto result = risk_manager_->get_risk_metrics(allocations, 1000.0, value, 1200.0);
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().total_exposure, 0.0);
    EXPECT_DOUBLE_EQ(result.value().weighted_leverage, 1.0);
    EXPECT_DOUBLE_EQ(result.value().concentration_risk, 0.0);
    // 950 against a peak of 1200
    EXPECT_NEAR(result.value().drawdown_from_peak, 250.0 / 1200.0 * 100.0, 1e-9);

    auto invalid = risk_manager_->get_risk_metrics(allocations, 0.0, 0.0, 0.0);
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(RiskManagerTest, PortfolioValueKeepsProfitOfRemovedBots) {
    std::map<std::string, BotAllocation> allocations;
    allocations["bot_a"] = create_allocation("bot_a", "BTCUSDT", 500.0, 0.0, 10.0);
    allocations["bot_a"].realized_pnl = 40.0;
    allocations["bot_b"] = create_allocation("bot_b", "ETHUSDT", 300.0, 0.0, 10.0);
    allocations["bot_b"].unrealized_pnl = -10.0;

    EXPECT_DOUBLE_EQ(portfolio_value(1000.0, 40.0, allocations), 1030.0);

    allocations.erase("bot_a");
    Amount value = portfolio_value(1000.0, 40.0, allocations);
    EXPECT_DOUBLE_EQ(value, 1030.0);

    auto metrics = risk_manager_->get_risk_metrics(allocations, 1000.0, value, 1030.0);
    ASSERT_TRUE(metrics.is_ok());
    EXPECT_DOUBLE_EQ(metrics.value().drawdown_from_peak, 0.0);
}

TEST_F(RiskManagerTest, UpdateConfig) {
    PortfolioConfig tighter = config_;
    tighter.max_total_exposure = 1.0;
    ASSERT_TRUE(risk_manager_->update_config(tighter).is_ok());
    EXPECT_DOUBLE_EQ(risk_manager_->get_config().max_total_exposure, 1.0);
    EXPECT_FALSE(risk_manager_->is_within_risk_limits(1500.0, 1000.0));

    PortfolioConfig invalid = config_;
    invalid.max_drawdown_percent = 150.0;
    auto result = risk_manager_->update_config(invalid);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIGURATION_INVALID);
    EXPECT_DOUBLE_EQ(risk_manager_->get_config().max_total_exposure, 1.0);
}
