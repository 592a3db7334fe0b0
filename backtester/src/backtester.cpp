#include "backtester.hpp"
#include "config.hpp"
#include "logging.hpp"          // <<< USE SHORT PATH
#include "utils.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

namespace backtester {

    BacktestSettings BacktestSettings::fromJson(const json& section) {
        BacktestSettings settings;
        settings.initial_capital = core::config::readDouble(section, "initial_capital", settings.initial_capital, "backtest");
        settings.annualization_factor =
            core::config::readDouble(section, "annualization_factor", settings.annualization_factor, "backtest");

        if (!(settings.initial_capital > 0.0)) {
            throw core::ConfigException(fmt::format("backtest: initial_capital must be positive, got {}",
                                                    settings.initial_capital));
        }
        if (!(settings.annualization_factor > 0.0)) {
            throw core::ConfigException(fmt::format("backtest: annualization_factor must be positive, got {}",
                                                    settings.annualization_factor));
        }

        std::string field = core::config::readString(section, "price_field", "close", "backtest");
        auto price_field = strategy_engine::priceFieldFromString(field);
        if (!price_field || *price_field == strategy_engine::PriceField::Volume) {
            throw core::ConfigException(fmt::format(
                "backtest: price_field must be one of open, high, low, close; got '{}'", field));
        }
        settings.price_field = *price_field;

        std::string policy = core::config::readString(section, "open_position_policy", "exclude", "backtest");
        if (policy == "exclude") {
            settings.open_position_policy = OpenPositionPolicy::Exclude;
        } else if (policy == "force_close") {
            settings.open_position_policy = OpenPositionPolicy::ForceClose;
        } else {
            throw core::ConfigException(fmt::format(
                "backtest: open_position_policy must be 'exclude' or 'force_close'; got '{}'", policy));
        }
        return settings;
    }

    Backtester::Backtester(BacktestSettings settings)
        : settings_(settings)
    {
        portfolio_ = std::make_unique<Portfolio>(settings_.initial_capital);
        core::logging::getLogger()->debug("Backtester initialized with capital: {}", settings_.initial_capital);
    }

    const Portfolio& Backtester::getPortfolio() const {
        return *portfolio_;
    }

    double Backtester::referencePrice(const core::Candle& candle) const {
        switch (settings_.price_field) {
            case strategy_engine::PriceField::Open:  return candle.open;
            case strategy_engine::PriceField::High:  return candle.high;
            case strategy_engine::PriceField::Low:   return candle.low;
            case strategy_engine::PriceField::Close: return candle.close;
            case strategy_engine::PriceField::Volume: break;
        }
        return candle.close;
    }

    BacktestResult Backtester::run(const core::PriceTable& table, const strategy_engine::Evaluator& evaluator) {
        return run(table, evaluator(table));
    }

    BacktestResult Backtester::run(const core::PriceTable& table, const strategy_engine::SignalFrame& signals) {
        auto logger = core::logging::getLogger();

        if (signals.entry.size() != table.size() || signals.exit.size() != table.size()) {
            throw core::BacktestException(fmt::format(
                "Signal length mismatch: table has {} rows, entry {} and exit {}",
                table.size(), signals.entry.size(), signals.exit.size()));
        }

        logger->info("========================================================");
        logger->info("Starting Backtest Run");
        logger->info("========================================================");
        logger->info("Rows: {}, Capital: {:.2f}, Price Field: {}, Open Position Policy: {}",
                     table.size(), settings_.initial_capital,
                     strategy_engine::toString(settings_.price_field),
                     toString(settings_.open_position_policy));
        if (!table.empty()) {
            logger->info("Period: {} to {}", core::utils::timestampToDate(table.front().timestamp),
                         core::utils::timestampToDate(table.back().timestamp));
        }

        // Reset portfolio for new run
        portfolio_ = std::make_unique<Portfolio>(settings_.initial_capital);

        // --- Main Event Loop ---
        for (std::size_t i = 0; i < table.size(); ++i) {
            const core::Candle& current_candle = table[i];
            double price = referencePrice(current_candle);

            // Exit first, then entry: a row with both signals closes the
            // open trade and opens the next one at the same price.
            if (portfolio_->getState() == core::PositionState::Long && signals.exit[i]) {
                logger->debug("Row {} ({}): exit signal while LONG", i,
                              core::utils::timestampToString(current_candle.timestamp));
                portfolio_->closeLong(current_candle.timestamp, i, price);
            }
            if (portfolio_->getState() == core::PositionState::Flat && signals.entry[i]) {
                logger->debug("Row {} ({}): entry signal while FLAT", i,
                              core::utils::timestampToString(current_candle.timestamp));
                portfolio_->openLong(current_candle.timestamp, i, price);
            }

            portfolio_->recordTimestampValue(current_candle.timestamp, price);
        }

        if (portfolio_->getState() == core::PositionState::Long &&
            settings_.open_position_policy == OpenPositionPolicy::ForceClose) {
            const core::Candle& last = table.back();
            logger->info("Closing position still open at end of data ({})",
                         core::utils::timestampToString(last.timestamp));
            portfolio_->closeLong(last.timestamp, table.size() - 1, referencePrice(last));
        }

        BacktestResult result = buildResult(table);

        logger->info("========================================================");
        logger->info("Backtest Run Completed: Final Equity {:.2f}", result.final_equity);
        logger->info("========================================================");
        result.metrics.logMetrics();
        if (result.open_position) {
            logger->info("Position still open since {} (entry {:.4f}, unrealized {:.2f}%)",
                         core::utils::timestampToDate(result.open_position->entry_time),
                         result.open_position->entry_price,
                         result.open_position->unrealized_return * 100.0);
        }
        return result;
    }

    BacktestResult Backtester::buildResult(const core::PriceTable& table) const {
        BacktestResult result;
        result.initial_capital = settings_.initial_capital;
        result.trades = portfolio_->getTradeLog();
        result.equity_curve = portfolio_->getEquityCurve();
        result.final_equity = portfolio_->getRealizedEquity();

        const auto& open_trade = portfolio_->getOpenTrade();
        if (open_trade && !table.empty()) {
            OpenPosition open;
            open.entry_time = open_trade->entry_time;
            open.entry_index = open_trade->entry_index;
            open.entry_price = open_trade->entry_price;
            open.units = open_trade->units;
            open.last_price = referencePrice(table.back());
            open.unrealized_return = (open.last_price - open.entry_price) / open.entry_price;
            result.open_position = open;
        }

        result.metrics = calculateMetrics(result.trades, result.equity_curve, result.initial_capital,
                                          result.final_equity, settings_.annualization_factor);
        return result;
    }

    std::string toString(OpenPositionPolicy policy) {
        return policy == OpenPositionPolicy::Exclude ? "exclude" : "force_close";
    }

    namespace {

        json tradeToJson(const core::Trade& trade) {
            json j;
            j["entry_date"] = core::utils::timestampToString(trade.entry_time);
            j["entry_index"] = trade.entry_index;
            j["entry_price"] = trade.entry_price;
            j["units"] = trade.units;
            j["exit_date"] = trade.exit_time ? json(core::utils::timestampToString(*trade.exit_time)) : json(nullptr);
            j["exit_index"] = trade.exit_index ? json(*trade.exit_index) : json(nullptr);
            j["exit_price"] = trade.exit_price ? json(*trade.exit_price) : json(nullptr);
            j["pnl"] = trade.pnl;
            j["return"] = trade.return_fraction;
            return j;
        }

    } // namespace

    json toJson(const BacktestResult& result) {
        json report;
        report["initial_capital"] = result.initial_capital;
        report["final_equity"] = result.final_equity;

        const auto& m = result.metrics;
        report["metrics"] = {
            {"total_return", m.total_return},
            {"total_return_pct", m.total_return_pct},
            {"max_drawdown", m.max_drawdown},
            {"max_drawdown_amount", m.max_drawdown_amount},
            {"win_rate", m.win_rate},
            {"avg_return", m.avg_return},
            {"sharpe_ratio", m.sharpe_ratio},
            {"num_trades", m.num_trades}
        };

        report["trades"] = json::array();
        for (const auto& trade : result.trades) {
            report["trades"].push_back(tradeToJson(trade));
        }

        if (result.open_position) {
            const auto& open = *result.open_position;
            report["open_position"] = {
                {"entry_date", core::utils::timestampToString(open.entry_time)},
                {"entry_index", open.entry_index},
                {"entry_price", open.entry_price},
                {"units", open.units},
                {"last_price", open.last_price},
                {"unrealized_return", open.unrealized_return}
            };
        } else {
            report["open_position"] = nullptr;
        }
        return report;
    }

} // namespace backtester
