#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "backtester.hpp"
#include "compiler.hpp"
#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

using Catch::Approx;
using json = nlohmann::json;

TEST_CASE("Missing sections and keys fall back to defaults", "[config]") {
    json document = json::parse(R"({"backtest": {"initial_capital": 5000}})");

    REQUIRE(core::config::section(document, "indicators").is_null());
    REQUIRE(core::config::readInt(core::config::section(document, "indicators"), "sma_period", 20, "indicators") == 20);
    REQUIRE(core::config::readDouble(core::config::section(document, "backtest"), "initial_capital", 1.0, "backtest")
            == Approx(5000.0));
    REQUIRE(core::config::section(json(), "logging").is_null());
}

TEST_CASE("Wrongly typed values throw ConfigException", "[config]") {
    json section = json::parse(R"({"sma_period": "twenty", "ratio": true, "name": 3})");
    REQUIRE_THROWS_AS(core::config::readInt(section, "sma_period", 20, "indicators"), core::ConfigException);
    REQUIRE_THROWS_AS(core::config::readDouble(section, "ratio", 1.0, "test"), core::ConfigException);
    REQUIRE_THROWS_AS(core::config::readString(section, "name", "", "test"), core::ConfigException);
    REQUIRE_THROWS_AS(core::config::section(json::array(), "logging"), core::ConfigException);
}

TEST_CASE("Integers outside the int range throw ConfigException", "[config]") {
    json section = json::parse(R"({"too_big": 4294967297, "too_small": -3000000000, "edge": 2147483647})");
    REQUIRE_THROWS_AS(core::config::readInt(section, "too_big", 20, "indicators"), core::ConfigException);
    REQUIRE_THROWS_AS(core::config::readInt(section, "too_small", 20, "indicators"), core::ConfigException);
    REQUIRE(core::config::readInt(section, "edge", 20, "indicators") == 2147483647);

    REQUIRE_THROWS_AS(strategy_engine::IndicatorDefaults::fromJson(json::parse(R"({"sma_period": 4294967297})")),
                      core::ConfigException);
}

TEST_CASE("Unreadable configuration files throw ConfigException", "[config]") {
    REQUIRE_THROWS_AS(core::config::loadJsonFile("definitely/not/here.json"), core::ConfigException);
}

TEST_CASE("IndicatorDefaults reads the indicators section", "[config][compiler]") {
    auto defaults = strategy_engine::IndicatorDefaults::fromJson(json::parse(R"({"sma_period": 50, "rsi_period": 7})"));
    REQUIRE(defaults.sma_period == 50);
    REQUIRE(defaults.ema_period == 20);
    REQUIRE(defaults.rsi_period == 7);
    REQUIRE(defaults.periodFor(strategy_engine::IndicatorKind::Rsi) == 7);

    REQUIRE_THROWS_AS(strategy_engine::IndicatorDefaults::fromJson(json::parse(R"({"ema_period": 0})")),
                      core::ConfigException);
}

TEST_CASE("BacktestSettings reads the backtest section", "[config][backtester]") {
    auto defaults = backtester::BacktestSettings::fromJson(json());
    REQUIRE(defaults.initial_capital == Approx(100000.0));
    REQUIRE(defaults.annualization_factor == Approx(252.0));
    REQUIRE(defaults.price_field == strategy_engine::PriceField::Close);
    REQUIRE(defaults.open_position_policy == backtester::OpenPositionPolicy::Exclude);

    auto settings = backtester::BacktestSettings::fromJson(json::parse(
        R"({"initial_capital": 2500.5, "annualization_factor": 52, "price_field": "open",
            "open_position_policy": "force_close"})"));
    REQUIRE(settings.initial_capital == Approx(2500.5));
    REQUIRE(settings.annualization_factor == Approx(52.0));
    REQUIRE(settings.price_field == strategy_engine::PriceField::Open);
    REQUIRE(settings.open_position_policy == backtester::OpenPositionPolicy::ForceClose);

    REQUIRE_THROWS_AS(backtester::BacktestSettings::fromJson(json::parse(R"({"open_position_policy": "keep"})")),
                      core::ConfigException);
    REQUIRE_THROWS_AS(backtester::BacktestSettings::fromJson(json::parse(R"({"price_field": "volume"})")),
                      core::ConfigException);
    REQUIRE_THROWS_AS(backtester::BacktestSettings::fromJson(json::parse(R"({"initial_capital": -1})")),
                      core::ConfigException);
}

TEST_CASE("LogSettings reads the logging section", "[config][logging]") {
    auto settings = core::logging::LogSettings::fromJson(
        json::parse(R"({"console_level": "warn", "file_level": "trace", "file": "custom"})"));
    REQUIRE(settings.console_level == spdlog::level::warn);
    REQUIRE(settings.file_level == spdlog::level::trace);
    REQUIRE(settings.base_log_filename == "custom");

    REQUIRE_THROWS_AS(core::logging::LogSettings::fromJson(json::parse(R"({"file": ""})")), core::ConfigException);
}

TEST_CASE("getLogger works before initialize", "[logging]") {
    auto& logger = core::logging::getLogger();
    REQUIRE(logger != nullptr);
    REQUIRE_NOTHROW(logger->debug("logger available without initialize"));
}
