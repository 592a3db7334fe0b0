#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "backtester.hpp"
#include "compiler.hpp"
#include "exceptions.hpp"
#include "parser.hpp"
#include "test_helpers.hpp"

using Catch::Approx;
using backtester::BacktestSettings;
using backtester::Backtester;
using backtester::OpenPositionPolicy;
using strategy_engine::SignalFrame;
using test_helpers::makeTable;

namespace {

    SignalFrame signalsFrom(std::vector<bool> entry, std::vector<bool> exit) {
        SignalFrame frame;
        frame.entry = std::move(entry);
        frame.exit = std::move(exit);
        return frame;
    }

    BacktestSettings withPolicy(OpenPositionPolicy policy) {
        BacktestSettings settings;
        settings.open_position_policy = policy;
        return settings;
    }

    backtester::PortfolioState point(double equity) {
        backtester::PortfolioState state;
        state.cash = equity;
        state.total_equity = equity;
        return state;
    }

    // Enter on row 0, exit on row 2, enter again on row 3 and hold
    const std::vector<double> kCloses = {10, 11, 12, 11, 13, 14};
    SignalFrame roundTripThenHold() {
        return signalsFrom({true, false, false, true, false, false},
                           {false, false, true, false, false, false});
    }

} // namespace

TEST_CASE("Open position is reported separately by default", "[backtester]") {
    Backtester bt(withPolicy(OpenPositionPolicy::Exclude));
    auto result = bt.run(makeTable(kCloses), roundTripThenHold());

    REQUIRE(result.trades.size() == 1);
    REQUIRE(result.trades[0].entry_index == 0);
    REQUIRE(*result.trades[0].exit_index == 2);
    REQUIRE(result.trades[0].return_fraction == Approx(0.2));

    REQUIRE(result.final_equity == Approx(120000.0));
    REQUIRE(result.open_position.has_value());
    REQUIRE(result.open_position->entry_index == 3);
    REQUIRE(result.open_position->entry_price == Approx(11.0));
    REQUIRE(result.open_position->last_price == Approx(14.0));
    REQUIRE(result.open_position->unrealized_return == Approx(3.0 / 11.0));

    REQUIRE(result.metrics.num_trades == 1);
    REQUIRE(result.metrics.win_rate == Approx(1.0));
    REQUIRE(result.metrics.total_return == Approx(20000.0));
    REQUIRE(result.metrics.total_return_pct == Approx(20.0));

    // Curve is marked to market on every row
    REQUIRE(result.equity_curve.size() == kCloses.size());
    REQUIRE(result.equity_curve.back().total_equity == Approx(120000.0 * 14.0 / 11.0));
}

TEST_CASE("ForceClose books the last position at the final row", "[backtester]") {
    Backtester bt(withPolicy(OpenPositionPolicy::ForceClose));
    auto result = bt.run(makeTable(kCloses), roundTripThenHold());

    REQUIRE(result.trades.size() == 2);
    REQUIRE_FALSE(result.open_position.has_value());
    REQUIRE(*result.trades[1].exit_index == 5);
    REQUIRE(*result.trades[1].exit_price == Approx(14.0));
    REQUIRE(result.final_equity == Approx(120000.0 * 14.0 / 11.0));
    REQUIRE(result.metrics.num_trades == 2);
    REQUIRE(result.metrics.avg_return == Approx((0.2 + 3.0 / 11.0) / 2.0));
}

TEST_CASE("A row with both signals exits and re-enters", "[backtester]") {
    Backtester bt;
    // Flat on row 0: enter only. Long afterwards: close, then reopen at the same price.
    auto result = bt.run(makeTable({10, 11, 12, 13, 14}),
                         signalsFrom({true, true, true, true, true}, {true, true, true, true, true}));
    REQUIRE(result.trades.size() == 4);
    for (std::size_t i = 0; i < result.trades.size(); ++i) {
        REQUIRE(result.trades[i].entry_index == i);
        REQUIRE(*result.trades[i].exit_index == i + 1);
    }
    REQUIRE(result.trades[1].entry_price == Approx(*result.trades[0].exit_price));
    REQUIRE(result.open_position->entry_index == 4);
    REQUIRE(result.final_equity == Approx(140000.0));
}

TEST_CASE("Exit and re-entry on the same row under ForceClose", "[backtester]") {
    Backtester bt(withPolicy(OpenPositionPolicy::ForceClose));
    auto result = bt.run(makeTable({10, 11, 12, 13}),
                         signalsFrom({true, true, true, true}, {false, false, true, false}));
    REQUIRE(result.trades.size() == 2);
    REQUIRE(result.trades[0].entry_index == 0);
    REQUIRE(*result.trades[0].exit_index == 2);
    REQUIRE(result.trades[1].entry_index == 2);
    REQUIRE(*result.trades[1].exit_index == 3);
    REQUIRE(result.final_equity == Approx(130000.0));
    REQUIRE(bt.getPortfolio().getTotalExecutions() == 4);
}

TEST_CASE("Exit signals while flat and entry signals while long are ignored", "[backtester]") {
    Backtester bt;
    auto result = bt.run(makeTable({10, 11, 12, 13}),
                         signalsFrom({false, true, true, false}, {true, false, false, true}));
    REQUIRE(result.trades.size() == 1);
    REQUIRE(result.trades[0].entry_index == 1);
    REQUIRE(*result.trades[0].exit_index == 3);
    REQUIRE(bt.getPortfolio().getTotalExecutions() == 2);
}

TEST_CASE("Trades never overlap", "[backtester]") {
    Backtester bt(withPolicy(OpenPositionPolicy::ForceClose));
    auto result = bt.run(makeTable({5, 6, 7, 6, 5, 6, 7, 8}),
                         signalsFrom({true, false, true, true, false, true, false, true},
                                     {false, true, true, false, true, false, true, false}));
    for (std::size_t i = 0; i < result.trades.size(); ++i) {
        REQUIRE(result.trades[i].entry_index <= *result.trades[i].exit_index);
        if (i > 0) {
            // [entry, exit) ranges: the next trade may open on the previous exit row
            REQUIRE(result.trades[i].entry_index >= *result.trades[i - 1].exit_index);
        }
    }
    REQUIRE(result.metrics.win_rate >= 0.0);
    REQUIRE(result.metrics.win_rate <= 1.0);
}

TEST_CASE("Signal lengths must match the table", "[backtester]") {
    Backtester bt;
    REQUIRE_THROWS_AS(bt.run(makeTable({1, 2, 3}), signalsFrom({true, false}, {false, false})),
                      core::BacktestException);
}

TEST_CASE("No signals leave the capital untouched", "[backtester]") {
    Backtester bt;
    auto result = bt.run(makeTable({10, 20, 5, 30}), signalsFrom({false, false, false, false}, {false, false, false, false}));
    REQUIRE(result.trades.empty());
    REQUIRE_FALSE(result.open_position.has_value());
    REQUIRE(result.final_equity == Approx(100000.0));
    REQUIRE(result.metrics.max_drawdown == Approx(0.0));
    REQUIRE(result.metrics.max_drawdown_amount == Approx(0.0));
    REQUIRE(result.metrics.sharpe_ratio == Approx(0.0));
    REQUIRE(result.metrics.win_rate == Approx(0.0));
}

TEST_CASE("Drawdown and Sharpe from the equity curve", "[backtester][metrics]") {
    std::vector<backtester::PortfolioState> curve = {point(100), point(120), point(90), point(130)};
    REQUIRE(backtester::maxDrawdown(curve) == Approx(0.25));
    REQUIRE(backtester::maxDrawdown({}) == Approx(0.0));
    REQUIRE(backtester::maxDrawdownAmount(curve) == Approx(30.0));
    REQUIRE(backtester::maxDrawdownAmount({}) == Approx(0.0));

    // Halving from 100 is the deepest fall in percent, 200 -> 140 the largest in currency
    std::vector<backtester::PortfolioState> uneven = {point(100), point(50), point(200), point(140)};
    REQUIRE(backtester::maxDrawdown(uneven) == Approx(0.5));
    REQUIRE(backtester::maxDrawdownAmount(uneven) == Approx(60.0));

    std::vector<backtester::PortfolioState> steady = {point(100), point(110), point(121)};
    REQUIRE(backtester::sharpeRatio(steady, 252.0) == Approx(0.0));
    REQUIRE(backtester::sharpeRatio({point(100), point(110)}, 252.0) == Approx(0.0));

    // Returns +10% and -10%: mean 0
    std::vector<backtester::PortfolioState> zigzag = {point(100), point(110), point(99)};
    REQUIRE(backtester::sharpeRatio(zigzag, 252.0) == Approx(0.0).margin(1e-12));

    // Returns +20% and 0%: mean 0.1, stdev 0.1
    std::vector<backtester::PortfolioState> rising = {point(100), point(120), point(120)};
    REQUIRE(backtester::sharpeRatio(rising, 4.0) == Approx(2.0));
}

TEST_CASE("Trades fill at the configured price field", "[backtester]") {
    auto table = makeTable({10, 12});
    table[0].open = 8.0;
    table[1].open = 16.0;

    BacktestSettings settings;
    settings.price_field = strategy_engine::PriceField::Open;
    Backtester bt(settings);
    auto result = bt.run(table, signalsFrom({true, false}, {false, true}));
    REQUIRE(result.trades.size() == 1);
    REQUIRE(result.trades[0].entry_price == Approx(8.0));
    REQUIRE(*result.trades[0].exit_price == Approx(16.0));
    REQUIRE(result.final_equity == Approx(200000.0));
}

TEST_CASE("An ENTRY-only strategy holds until the end", "[backtester]") {
    strategy_engine::Parser parser;
    strategy_engine::Compiler compiler;
    auto evaluator = compiler.compile(parser.parse("ENTRY: close > 10"));
    auto table = makeTable({9, 11, 12, 15});

    auto excluded = Backtester(withPolicy(OpenPositionPolicy::Exclude)).run(table, evaluator);
    REQUIRE(excluded.trades.empty());
    REQUIRE(excluded.final_equity == Approx(100000.0));
    REQUIRE(excluded.open_position->entry_index == 1);
    REQUIRE(excluded.open_position->unrealized_return == Approx(4.0 / 11.0));

    auto closed = Backtester(withPolicy(OpenPositionPolicy::ForceClose)).run(table, evaluator);
    REQUIRE(closed.trades.size() == 1);
    REQUIRE(closed.final_equity == Approx(100000.0 * 15.0 / 11.0));
}

TEST_CASE("Moving average strategy end to end", "[backtester]") {
    std::vector<double> closes;
    for (int i = 0; i < 40; ++i) {
        closes.push_back(i < 25 ? 100.0 + i : 124.0 - 2.0 * (i - 24));
    }
    strategy_engine::Parser parser;
    strategy_engine::Compiler compiler;
    auto evaluator = compiler.compile(parser.parse("ENTRY: close > sma(close, 20)\nEXIT: close < sma(close, 20)"));

    Backtester bt;
    auto result = bt.run(makeTable(closes), evaluator);
    REQUIRE(result.trades.size() == 1);
    REQUIRE(result.trades[0].entry_index == 19);
    REQUIRE(result.trades[0].entry_price == Approx(119.0));
    REQUIRE(*result.trades[0].exit_index == 28);
    REQUIRE(*result.trades[0].exit_price == Approx(116.0));
    REQUIRE(result.trades[0].return_fraction == Approx(-3.0 / 119.0));
    REQUIRE_FALSE(result.open_position.has_value());
    REQUIRE(result.final_equity == Approx(100000.0 * 116.0 / 119.0));
    REQUIRE(result.metrics.win_rate == Approx(0.0));
    REQUIRE(result.metrics.max_drawdown > 0.0);
}

TEST_CASE("Report JSON layout", "[backtester]") {
    Backtester bt;
    auto report = backtester::toJson(bt.run(makeTable(kCloses), roundTripThenHold()));

    REQUIRE(report["initial_capital"].get<double>() == Approx(100000.0));
    REQUIRE(report["final_equity"].get<double>() == Approx(120000.0));
    for (const char* key : {"total_return", "total_return_pct", "max_drawdown", "max_drawdown_amount",
                            "win_rate", "avg_return", "sharpe_ratio", "num_trades"}) {
        REQUIRE(report["metrics"].contains(key));
    }
    REQUIRE(report["trades"].size() == 1);
    REQUIRE(report["trades"][0]["entry_date"] == "2023-01-02T00:00:00Z");
    REQUIRE(report["trades"][0]["exit_date"] == "2023-01-04T00:00:00Z");
    REQUIRE(report["trades"][0]["return"].get<double>() == Approx(0.2));
    REQUIRE(report["open_position"]["entry_index"] == 3);

    auto flat = backtester::toJson(bt.run(makeTable({1, 2}), signalsFrom({false, false}, {false, false})));
    REQUIRE(flat["open_position"].is_null());
    REQUIRE(flat["trades"].empty());
}
