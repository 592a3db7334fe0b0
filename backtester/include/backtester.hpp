#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp> // For settings and the result report

// Required project headers (use short paths)
#include "datatypes.hpp"
#include "common_types.hpp" // PriceField
#include "compiler.hpp"     // SignalFrame, Evaluator
#include "metrics.hpp"
#include "portfolio.hpp"

namespace backtester {

    using json = nlohmann::json;

    // What happens to a position still open on the last row
    enum class OpenPositionPolicy {
        Exclude,    // Report it as open_position, leave it out of trade metrics
        ForceClose  // Close it at the last row's price and count it
    };

    struct BacktestSettings {
        double initial_capital = 100000.0;
        double annualization_factor = 252.0;
        strategy_engine::PriceField price_field = strategy_engine::PriceField::Close;
        OpenPositionPolicy open_position_policy = OpenPositionPolicy::Exclude;

        // Reads the "backtest" section; missing keys keep the defaults.
        // Throws core::ConfigException on wrong types or unknown names.
        static BacktestSettings fromJson(const json& section);
    };

    // A position left open at the end of the data (Exclude policy)
    struct OpenPosition {
        core::Timestamp entry_time;
        std::size_t entry_index = 0;
        double entry_price = 0.0;
        double units = 0.0;
        double last_price = 0.0;
        double unrealized_return = 0.0; // (last - entry) / entry
    };

    struct BacktestResult {
        double initial_capital = 0.0;
        double final_equity = 0.0;
        std::vector<core::Trade> trades;        // Completed trades, in order
        std::optional<OpenPosition> open_position;
        std::vector<PortfolioState> equity_curve;
        BacktestMetrics metrics;
    };

    class Backtester {
    public:
        explicit Backtester(BacktestSettings settings = BacktestSettings{});

        // Runs the FLAT/LONG state machine over the table. On each row an exit
        // is handled before an entry, so one row can close a trade and open
        // the next. Throws core::BacktestException if the signal lengths
        // differ from the table.
        BacktestResult run(const core::PriceTable& table, const strategy_engine::SignalFrame& signals);

        // Evaluates the strategy on the table, then runs it.
        BacktestResult run(const core::PriceTable& table, const strategy_engine::Evaluator& evaluator);

        const BacktestSettings& getSettings() const { return settings_; }
        // Portfolio of the most recent run
        const Portfolio& getPortfolio() const;

    private:
        double referencePrice(const core::Candle& candle) const;
        BacktestResult buildResult(const core::PriceTable& table) const;

        BacktestSettings settings_;
        std::unique_ptr<Portfolio> portfolio_;
    };

    std::string toString(OpenPositionPolicy policy);

    // {initial_capital, final_equity, metrics{...}, trades[...], open_position}
    json toJson(const BacktestResult& result);

} // namespace backtester
