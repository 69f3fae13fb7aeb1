// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "margin_ledger/core/config_base.hpp"
#include "margin_ledger/portfolio/types.hpp"

using namespace margin_ledger;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "margin_ledger_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void write_file(const std::filesystem::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path test_dir;
};

// Test concrete implementation of ConfigBase
class TestConfig : public ConfigBase {
public:
    std::string name = "default";
    int value = 42;
    double ratio = 0.5;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["value"] = value;
        j["ratio"] = ratio;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name"))
            name = j["name"].get<std::string>();
        if (j.contains("value"))
            value = j["value"].get<int>();
        if (j.contains("ratio"))
            ratio = j["ratio"].get<double>();
    }
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    TestConfig config;
    config.name = "test";
    config.value = 100;
    config.ratio = 1.5;

    std::filesystem::path file_path = test_dir / "test_config.json";

    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok())
        << "Failed to save config: "
        << (save_result.error() ? save_result.error()->what() : "unknown error");
    ASSERT_TRUE(std::filesystem::exists(file_path));

    TestConfig loaded_config;
    auto load_result = loaded_config.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok())
        << "Failed to load config: "
        << (load_result.error() ? load_result.error()->what() : "unknown error");

    EXPECT_EQ(loaded_config.name, "test");
    EXPECT_EQ(loaded_config.value, 100);
    EXPECT_DOUBLE_EQ(loaded_config.ratio, 1.5);
}

TEST_F(ConfigBaseTest, LoadMissingFile) {
    TestConfig config;
    auto result = config.load_from_file((test_dir / "missing.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, LoadInvalidJson) {
    auto path = test_dir / "broken.json";
    write_file(path, "{ \"name\": ");

    TestConfig config;
    auto result = config.load_from_file(path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
    EXPECT_EQ(config.name, "default");
}

TEST_F(ConfigBaseTest, PartialPortfolioConfigKeepsDefaults) {
    auto path = test_dir / "portfolio.json";
    write_file(path, R"({"total_balance": 5000, "allocation_strategy": "performance_based"})");

    PortfolioConfig config;
    ASSERT_TRUE(config.load_from_file(path.string()).is_ok());

    EXPECT_DOUBLE_EQ(config.total_balance, 5000.0);
    EXPECT_EQ(config.allocation_strategy, AllocationStrategy::PERFORMANCE_BASED);
    EXPECT_EQ(config.shared_state_file, "portfolio_state.json");
    EXPECT_DOUBLE_EQ(config.max_total_exposure, 3.0);
    EXPECT_DOUBLE_EQ(config.max_drawdown_percent, 25.0);
    EXPECT_EQ(config.rebalance_frequency, "1h");
    EXPECT_DOUBLE_EQ(config.risk_limit_per_bot, 0.2);
    EXPECT_TRUE(config.emergency_stop_enabled);
    EXPECT_EQ(config.lock_timeout, "5s");
}

TEST_F(ConfigBaseTest, UnknownStrategyIsConfigurationError) {
    auto path = test_dir / "portfolio.json";
    write_file(path, R"({"allocation_strategy": "round_robin"})");

    PortfolioConfig config;
    auto result = config.load_from_file(path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIGURATION_INVALID);
}

TEST_F(ConfigBaseTest, BotConfigRoundTrip) {
    BotConfig config;
    config.symbol = "BTCUSDT";
    config.leverage = 10.0;
    config.allocation_percentage = 0.5;
    config.max_position_size = 2500.0;
    config.category = "inverse";

    auto path = test_dir / "bot.json";
    ASSERT_TRUE(config.save_to_file(path.string()).is_ok());

    BotConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(path.string()).is_ok());
    EXPECT_EQ(loaded.symbol, "BTCUSDT");
    EXPECT_DOUBLE_EQ(loaded.leverage, 10.0);
    EXPECT_DOUBLE_EQ(loaded.allocation_percentage, 0.5);
    EXPECT_DOUBLE_EQ(loaded.max_position_size, 2500.0);
    EXPECT_EQ(loaded.category, "inverse");
    EXPECT_TRUE(loaded.validate().is_ok());
}
