#include <catch2/catch_test_macros.hpp>

#include "dsl_generator.hpp"
#include "exceptions.hpp"
#include "parser.hpp"

using json = nlohmann::json;
using strategy_engine::DslGenerator;

TEST_CASE("Condition lists are joined with AND", "[dsl_generator]") {
    json rules = json::parse(R"({
        "entry": [
            {"left": "close", "operator": ">", "right": {"indicator": "sma", "series": "close", "period": 20}},
            {"left": "volume", "operator": ">", "right": 1000000}
        ],
        "exit": [
            {"left": {"indicator": "rsi", "series": "close"}, "operator": "<", "right": 30}
        ]
    })");

    REQUIRE(DslGenerator::generate(rules) ==
            "ENTRY:\nclose > sma(close, 20) AND volume > 1000000\n\nEXIT:\nrsi(close) < 30\n");
}

TEST_CASE("Generated text parses back to the built tree", "[dsl_generator]") {
    json rules = json::parse(R"({
        "entry": [
            {"left": "close", "operator": "crosses_above", "right": {"indicator": "ema", "series": "close", "period": 9}},
            {"connector": "OR", "conditions": [
                {"left": {"function": "percent_change", "series": "volume", "n": 7}, "operator": ">", "right": {"percent": 30}},
                {"left": "close", "operator": ">=", "right": {"function": "n_days_ago", "series": "high", "n": 3}}
            ]}
        ],
        "exit": {"connector": "OR", "conditions": [
            {"left": "close", "operator": "crosses_below", "right": {"indicator": "sma", "series": "close"}},
            {"left": {"function": "change", "series": "close", "n": 1}, "operator": "<", "right": -2.5}
        ]}
    })");

    std::string dsl = DslGenerator::generate(rules);
    REQUIRE(dsl ==
            "ENTRY:\n"
            "crosses_above(close, ema(close, 9)) AND "
            "(percent_change(volume, 7) > 30% OR close >= n_days_ago(high, 3))\n"
            "\n"
            "EXIT:\n"
            "crosses_below(close, sma(close)) OR change(close, 1) < -2.5\n");

    strategy_engine::Parser parser;
    REQUIRE(parser.parse(dsl) == DslGenerator::buildStrategy(rules));
}

TEST_CASE("A single section is enough", "[dsl_generator]") {
    json rules = json::parse(R"({"exit": [{"left": "close", "operator": "<", "right": {"function": "yesterday", "series": "low"}}]})");
    REQUIRE(DslGenerator::generate(rules) == "EXIT:\nclose < yesterday(low)\n");
}

TEST_CASE("Documents outside the schema are rejected", "[dsl_generator][errors]") {
    auto rejects = [](const char* text) {
        REQUIRE_THROWS_AS(DslGenerator::generate(json::parse(text)), core::ConfigException);
    };
    rejects(R"([])");
    rejects(R"({})");
    rejects(R"({"entry": []})");
    rejects(R"({"entry": [{"left": "price", "operator": ">", "right": 1}]})");
    rejects(R"({"entry": [{"left": "close", "operator": "=>", "right": 1}]})");
    rejects(R"({"entry": [{"left": "close", "operator": ">"}]})");
    rejects(R"({"entry": [{"left": "close", "operator": ">", "right": {"indicator": "macd", "series": "close"}}]})");
    rejects(R"({"entry": [{"left": "close", "operator": ">", "right": {"indicator": "sma", "series": "close", "period": 0}}]})");
    rejects(R"({"entry": [{"left": "close", "operator": ">", "right": {"indicator": "sma", "series": "close", "period": 2.5}}]})");
    rejects(R"({"entry": [{"left": "close", "operator": ">", "right": {"function": "n_days_ago", "series": "close"}}]})");
    rejects(R"({"entry": {"connector": "XOR", "conditions": [{"left": "close", "operator": ">", "right": 1}]}})");
    rejects(R"({"entry": {"connector": "OR", "conditions": []}})");
    rejects(R"({"entry": "close > 1"})");
}
