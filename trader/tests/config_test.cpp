#include "config.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

class ConfigTest : public ::testing::Test {
protected:
    void set_env(const std::string& name, const std::string& value) {
        ::setenv(name.c_str(), value.c_str(), 1);
        touched_.push_back(name);
    }

    void TearDown() override {
        for (const auto& name : touched_) {
            ::unsetenv(name.c_str());
        }
        if (!json_path_.empty()) {
            std::remove(json_path_.c_str());
        }
    }

    std::string write_json(const std::string& body) {
        json_path_ = "/tmp/speedscout_config_" + std::to_string(::getpid()) + ".json";
        std::ofstream out(json_path_);
        out << body;
        return json_path_;
    }

    std::vector<std::string> touched_;
    std::string json_path_;
};

TEST_F(ConfigTest, DefaultsAreValidPaperConfig) {
    Config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_FALSE(config.is_live());
    EXPECT_DOUBLE_EQ(config.max_bet_pct, 20.0);
    EXPECT_EQ(config.max_concurrent_positions, 10);
    EXPECT_DOUBLE_EQ(config.min_edge_pct, 2.0);
    EXPECT_EQ(config.max_latency_ms, 100);
    EXPECT_DOUBLE_EQ(config.initial_capital, 100.0);
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
    set_env("TRADING_MODE", "PAPER");
    set_env("MAX_BET_PCT", "5");
    set_env("MIN_EDGE_PCT", "3.5");
    set_env("SYMBOL", "ETHUSDT");
    set_env("SETTLEMENT_ORACLE", "Simulated");

    Config config = Config::from_env();
    EXPECT_NO_THROW(config.validate());
    EXPECT_DOUBLE_EQ(config.max_bet_pct, 5.0);
    EXPECT_DOUBLE_EQ(config.min_edge_pct, 3.5);
    EXPECT_EQ(config.symbol, "ethusdt");
    EXPECT_EQ(config.settlement_oracle, "simulated");
}

TEST_F(ConfigTest, NonNumericValueNamesTheVariable) {
    set_env("MAX_LATENCY_MS", "fast");
    try {
        Config::from_env();
        FAIL() << "expected a runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("MAX_LATENCY_MS"), std::string::npos);
    }
}

TEST_F(ConfigTest, UnknownModeIsRejected) {
    set_env("TRADING_MODE", "yolo");
    EXPECT_THROW(Config::from_env(), std::runtime_error);
}

TEST_F(ConfigTest, LiveModeRequiresApiKey) {
    Config config;
    config.mode = TradingMode::Live;
    try {
        config.validate();
        FAIL() << "expected a runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("POLYMARKET_API_KEY"), std::string::npos);
    }

    config.polymarket_api_key = "key";
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, ValidationRejectsOutOfRangeValues) {
    Config config;
    config.max_bet_pct = 0.0;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.max_concurrent_positions = 0;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.min_edge_pct = 25.0;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.settlement_oracle = "coin_flip";
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.initial_capital = -1.0;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST_F(ConfigTest, ValidationRejectsNonPositiveLoopTimings) {
    Config config;
    config.decision_budget_ms = 0;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.summary_interval_sec = 0;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.alert_interval_sec = -5;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.reconnect_delay_ms = 0;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.settlement_grace_sec = -1;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST_F(ConfigTest, PatternFilterSettings) {
    set_env("MIN_PATTERN_SAMPLES", "0");
    set_env("MIN_PATTERN_WIN_RATE", "0.55");
    auto config = Config::from_env();
    EXPECT_EQ(config.min_pattern_samples, 0);
    EXPECT_DOUBLE_EQ(config.min_pattern_win_rate, 0.55);
    EXPECT_NO_THROW(config.validate());

    config.min_pattern_win_rate = 1.5;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST_F(ConfigTest, JsonFileAppliesBeforeEnvironment) {
    auto path = write_json(R"({"max_bet_pct": 7.5, "max_concurrent_positions": 4, "mode": "paper"})");
    set_env("MAX_CONCURRENT_POSITIONS", "6");

    Config config = Config::load(path);
    EXPECT_DOUBLE_EQ(config.max_bet_pct, 7.5);
    EXPECT_EQ(config.max_concurrent_positions, 6);
}

TEST_F(ConfigTest, JsonFileWithWrongTypeIsRejected) {
    auto path = write_json(R"({"max_bet_pct": "lots"})");
    EXPECT_THROW(Config::load(path), std::runtime_error);
}

TEST_F(ConfigTest, MissingFileIsRejected) {
    EXPECT_THROW(Config::load("/nonexistent/speedscout.json"), std::runtime_error);
}

TEST_F(ConfigTest, VenueRateLimitMustBePositive) {
    Config config;
    config.venue_rate_per_sec = 0.0;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.venue_rate_burst = 0;
    EXPECT_THROW(config.validate(), std::runtime_error);
}
