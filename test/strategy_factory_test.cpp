#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

#include "macd_crossover.hpp"
#include "strategy/strategy_factory.hpp"
#include "test_helpers.hpp"
#include "trend_filtered_rsi.hpp"

TEST(StrategyFactoryTest, BuiltinsAreRegistered) {
    const auto names = StrategyFactory::names();
    for (const char* name : {"macd_crossover", "rsi_mean_reversion", "trend_filtered_rsi"}) {
        EXPECT_TRUE(StrategyFactory::has(name)) << name;
        EXPECT_NE(std::find(names.begin(), names.end(), name), names.end()) << name;
    }
    EXPECT_FALSE(StrategyFactory::has("buy_and_hold"));
}

TEST(StrategyFactoryTest, MissingParametersTakeDefaults) {
    const auto macd = StrategyFactory::create("macd_crossover");
    ASSERT_NE(macd, nullptr);
    EXPECT_EQ(macd->name(), "MACD Crossover (12/26/9)");

    const auto rsi = StrategyFactory::create("rsi_mean_reversion", nlohmann::json::object());
    EXPECT_EQ(rsi->warmupPeriod(), 14u);

    const auto trend = StrategyFactory::create("trend_filtered_rsi");
    EXPECT_EQ(trend->warmupPeriod(), 200u);
}

TEST(StrategyFactoryTest, ParametersAreApplied) {
    const auto rsi = StrategyFactory::create("rsi_mean_reversion", {{"period", 7}, {"oversold", 20.0}});
    EXPECT_EQ(rsi->warmupPeriod(), 7u);

    const auto trend = StrategyFactory::create("trend_filtered_rsi", {{"ema_period", 50}, {"stop_multiplier", 3.0}});
    const auto* typed = dynamic_cast<const TrendFilteredRsi*>(trend.get());
    ASSERT_NE(typed, nullptr);
    EXPECT_EQ(typed->params().emaPeriod, 50u);
    EXPECT_DOUBLE_EQ(typed->params().stopMultiplier, 3.0);
    EXPECT_EQ(typed->params().rsiPeriod, 14u);
}

TEST(StrategyFactoryTest, UnknownNameThrows) {
    EXPECT_THROW(static_cast<void>(StrategyFactory::create("does_not_exist")), std::invalid_argument);
}

TEST(StrategyFactoryTest, InvalidParametersThrow) {
    EXPECT_THROW(static_cast<void>(StrategyFactory::create("macd_crossover", {{"fast_period", 30}})),
                 std::invalid_argument);
    EXPECT_THROW(static_cast<void>(StrategyFactory::create("rsi_mean_reversion", {{"period", -3}})),
                 std::invalid_argument);
    EXPECT_THROW(static_cast<void>(StrategyFactory::create("rsi_mean_reversion", {{"period", "fourteen"}})),
                 std::invalid_argument);
    EXPECT_THROW(static_cast<void>(StrategyFactory::create("rsi_mean_reversion", nlohmann::json::array())),
                 std::invalid_argument);
}

TEST(StrategyFactoryTest, CustomCreatorCanBeAdded) {
    StrategyFactory::add("scripted_idle", [](const nlohmann::json& /* params */) -> std::unique_ptr<IStrategy> {
        return std::make_unique<test_helpers::ScriptedStrategy>(test_helpers::Script{}, 5);
    });

    ASSERT_TRUE(StrategyFactory::has("scripted_idle"));
    const auto strategy = StrategyFactory::create("scripted_idle");
    EXPECT_EQ(strategy->warmupPeriod(), 5u);
}
