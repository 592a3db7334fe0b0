#include <catch2/catch_test_macros.hpp>

#include <memory>

#include "compiler.hpp"
#include "exceptions.hpp"
#include "parser.hpp"
#include "test_helpers.hpp"

using namespace strategy_engine;
using test_helpers::makeTable;

namespace {

    Evaluator compileText(const std::string& text, IndicatorDefaults defaults = IndicatorDefaults{}) {
        Parser parser;
        Compiler compiler(defaults);
        return compiler.compile(parser.parse(text));
    }

    // 100, 101, ... 124 then down by 2 per row
    std::vector<double> riseThenFall() {
        std::vector<double> closes;
        for (int i = 0; i < 40; ++i) {
            closes.push_back(i < 25 ? 100.0 + i : 124.0 - 2.0 * (i - 24));
        }
        return closes;
    }

} // namespace

TEST_CASE("Price above its moving average", "[compiler]") {
    auto evaluator = compileText("ENTRY: close > sma(close, 20)\nEXIT: close < sma(close, 20)");
    auto table = makeTable(riseThenFall());
    SignalFrame signals = evaluator(table);

    REQUIRE(signals.size() == table.size());
    for (std::size_t i = 0; i < table.size(); ++i) {
        INFO("row " << i);
        REQUIRE(signals.entry[i] == (i >= 19 && i <= 27));
        REQUIRE(signals.exit[i] == (i >= 28));
    }
}

TEST_CASE("Volume spike against last week", "[compiler]") {
    std::vector<double> closes(20, 50.0);
    std::vector<long long> volumes;
    for (int i = 0; i < 20; ++i) {
        volumes.push_back(i < 10 ? 1000 : 1400);
    }
    auto evaluator = compileText("ENTRY: percent_change(volume, 7) > 30");
    auto signals = evaluator(makeTable(closes, volumes));
    for (std::size_t i = 0; i < 20; ++i) {
        INFO("row " << i);
        REQUIRE(signals.entry[i] == (i >= 10 && i <= 16));
        REQUIRE_FALSE(signals.exit[i]);
    }
}

TEST_CASE("Crossing a constant level", "[compiler][crosses]") {
    auto evaluator = compileText("ENTRY: crosses_above(close, 10)\nEXIT: close crosses_below 10");
    auto signals = evaluator(makeTable({9, 11, 9, 11}));
    REQUIRE(signals.entry == std::vector<bool>{false, true, false, true});
    REQUIRE(signals.exit == std::vector<bool>{false, false, true, false});
}

TEST_CASE("Warm-up rows are undefined and never signal", "[compiler]") {
    auto evaluator = compileText("ENTRY: close > sma(close, 3)");
    auto table = makeTable({1, 2, 3, 4, 5});

    LogicalFrame logical = evaluator.evaluateLogical(table);
    REQUIRE_FALSE(logical.entry[0].has_value());
    REQUIRE_FALSE(logical.entry[1].has_value());
    REQUIRE(logical.entry[2] == true);
    // Absent section: false everywhere, not undefined
    for (const auto& value : logical.exit) {
        REQUIRE(value == false);
    }

    SignalFrame signals = evaluator(table);
    REQUIRE(signals.entry == std::vector<bool>{false, false, true, true, true});
}

TEST_CASE("AND and OR treat undefined rows three-valued", "[compiler]") {
    auto table = makeTable({1, 2, 3, 4, 5});

    auto and_true = compileText("ENTRY: close > sma(close, 3) AND close > 0").evaluateLogical(table);
    REQUIRE_FALSE(and_true.entry[0].has_value());
    REQUIRE(and_true.entry[2] == true);

    auto and_false = compileText("ENTRY: close > sma(close, 3) AND close < 0").evaluateLogical(table);
    REQUIRE(and_false.entry[0] == false);

    auto or_true = compileText("ENTRY: close > sma(close, 3) OR close > 0").evaluateLogical(table);
    REQUIRE(or_true.entry[0] == true);

    auto or_false = compileText("ENTRY: close > sma(close, 3) OR close < 0").evaluateLogical(table);
    REQUIRE(or_false.entry[0] == false);

    auto or_undefined = compileText("ENTRY: close > sma(close, 3) OR close > yesterday(close)").evaluateLogical(table);
    REQUIRE_FALSE(or_undefined.entry[0].has_value());
    REQUIRE(or_undefined.entry[1] == true);
}

TEST_CASE("Equality uses a small tolerance", "[compiler]") {
    auto table = makeTable({10, 10.5});
    auto eq = compileText("ENTRY: close == 10.0000000001\nEXIT: close != 10.0000000001")(table);
    REQUIRE(eq.entry == std::vector<bool>{true, false});
    REQUIRE(eq.exit == std::vector<bool>{false, true});
}

TEST_CASE("Percent literals compare as their written number", "[compiler]") {
    auto signals = compileText("ENTRY: close > 5%")(makeTable({4, 6}));
    REQUIRE(signals.entry == std::vector<bool>{false, true});
}

TEST_CASE("Time functions look back whole rows", "[compiler]") {
    auto signals = compileText(
        "ENTRY: close > yesterday(close)\nEXIT: close < n_days_ago(close, 2)")(makeTable({5, 6, 4, 7}));
    REQUIRE(signals.entry == std::vector<bool>{false, true, false, true});
    REQUIRE(signals.exit == std::vector<bool>{false, false, true, false});

    auto weekly = compileText("ENTRY: close > last_week(close)")(makeTable({1, 1, 1, 1, 1, 1, 1, 2}));
    REQUIRE(weekly.entry == std::vector<bool>{false, false, false, false, false, false, false, true});
}

TEST_CASE("Omitted periods come from the defaults", "[compiler]") {
    IndicatorDefaults defaults;
    defaults.sma_period = 3;
    auto evaluator = compileText("ENTRY: close > sma(close)", defaults);
    REQUIRE(evaluator.defaults().sma_period == 3);

    auto logical = evaluator.evaluateLogical(makeTable({1, 2, 3, 4, 5}));
    REQUIRE_FALSE(logical.entry[1].has_value());
    REQUIRE(logical.entry[2] == true);

    // Explicit periods win over the defaults
    auto explicit_period = compileText("ENTRY: close > sma(close, 2)", defaults).evaluateLogical(makeTable({1, 2, 3}));
    REQUIRE(explicit_period.entry[1] == true);
}

TEST_CASE("Trees that cannot be grounded fail to compile", "[compiler][errors]") {
    Compiler compiler;

    REQUIRE_THROWS_AS(compiler.compile(ast::Strategy{}), core::CompileError);

    ast::Strategy value_as_rule{ast::series(PriceField::Close), nullptr};
    REQUIRE_THROWS_AS(compiler.compile(value_as_rule), core::CompileError);

    ast::NodePtr rule = ast::compare(ComparisonOp::GT, ast::series(PriceField::Close), ast::number(1));
    ast::Strategy rule_as_value{ast::compare(ComparisonOp::GT, rule, ast::number(1)), nullptr};
    REQUIRE_THROWS_AS(compiler.compile(rule_as_value), core::CompileError);

    ast::Strategy zero_period{
        ast::compare(ComparisonOp::GT, ast::series(PriceField::Close),
                     ast::indicator(IndicatorKind::Sma, ast::series(PriceField::Close), 0)),
        nullptr};
    REQUIRE_THROWS_AS(compiler.compile(zero_period), core::CompileError);

    ast::Strategy zero_lag{
        ast::compare(ComparisonOp::GT, ast::series(PriceField::Close),
                     ast::nDaysAgo(ast::series(PriceField::Close), 0)),
        nullptr};
    REQUIRE_THROWS_AS(compiler.compile(zero_lag), core::CompileError);
}

TEST_CASE("Evaluation validates the table", "[compiler]") {
    auto evaluator = compileText("ENTRY: close > 1");

    auto unsorted = makeTable({1, 2, 3});
    std::swap(unsorted[0], unsorted[2]);
    REQUIRE_THROWS_AS(evaluator(unsorted), core::DataLoadException);

    SignalFrame empty = evaluator(core::PriceTable{});
    REQUIRE(empty.size() == 0);
    REQUIRE(empty.exit.empty());
}

TEST_CASE("An evaluator can be reused across tables", "[compiler]") {
    auto evaluator = compileText("ENTRY: close > sma(close, 2)");
    auto first = evaluator(makeTable({1, 2, 3}));
    auto second = evaluator(makeTable({3, 2, 1, 5}));
    auto again = evaluator(makeTable({1, 2, 3}));

    REQUIRE(first.entry == again.entry);
    REQUIRE(second.entry == std::vector<bool>{false, false, false, true});
    REQUIRE(ast::toDsl(evaluator.strategy()) == "ENTRY:\nclose > sma(close, 2)\n");
}

TEST_CASE("Tables shorter than the warm-up give no signals", "[compiler]") {
    auto evaluator = compileText("ENTRY: close > sma(close, 20)\nEXIT: close < sma(close, 20)");
    SignalFrame signals;
    REQUIRE_NOTHROW(signals = evaluator(makeTable({1, 2, 3, 4, 5})));
    REQUIRE(signals.entry == std::vector<bool>(5, false));
    REQUIRE(signals.exit == std::vector<bool>(5, false));
}
