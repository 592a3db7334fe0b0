#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace backtester {

    Portfolio::Portfolio(double initial_capital)
        : cash_(initial_capital) {
        if (!(initial_capital > 0.0)) {
            throw core::BacktestException(fmt::format("Initial capital must be positive, got {}.", initial_capital));
        }
    }

    double Portfolio::getCash() const {
        return cash_;
    }

    core::PositionState Portfolio::getState() const {
        return open_trade_ ? core::PositionState::Long : core::PositionState::Flat;
    }

    const std::optional<core::Trade>& Portfolio::getOpenTrade() const {
        return open_trade_;
    }

    double Portfolio::getCurrentEquity(double mark_price) const {
        if (!open_trade_) {
            return cash_;
        }
        return cash_ + open_trade_->units * mark_price;
    }

    double Portfolio::getRealizedEquity() const {
        if (!open_trade_) {
            return cash_;
        }
        return cash_ + open_trade_->units * open_trade_->entry_price;
    }

    const std::vector<PortfolioState>& Portfolio::getEquityCurve() const {
        return equity_curve_;
    }

    const std::vector<core::Trade>& Portfolio::getTradeLog() const {
        return trade_log_;
    }

    bool Portfolio::openLong(core::Timestamp timestamp, std::size_t row, double price) {
        auto logger = core::logging::getLogger();
        if (open_trade_) {
            logger->warn("Cannot EnterLong at row {}: already long since row {}. Ignoring.", row, open_trade_->entry_index);
            return false;
        }
        if (!(price > 0.0)) {
            logger->warn("Cannot EnterLong at row {} with non-positive price {:.4f}. Ignoring.", row, price);
            return false;
        }

        core::Trade trade;
        trade.entry_time = timestamp;
        trade.entry_index = row;
        trade.entry_price = price;
        trade.units = cash_ / price; // Full equity, fractional units
        cash_ = 0.0;
        open_trade_ = trade;
        execution_count_++;

        logger->info("Trade Executed: Time={}, Action=EnterLong, Row={}, Units={:.6f}, Price={:.4f}",
                     core::utils::timestampToString(timestamp), row, trade.units, price);
        return true;
    }

    bool Portfolio::closeLong(core::Timestamp timestamp, std::size_t row, double price) {
        auto logger = core::logging::getLogger();
        if (!open_trade_) {
            logger->warn("Cannot ExitLong at row {}: no open position. Ignoring.", row);
            return false;
        }
        if (price < 0.0) {
            logger->warn("Cannot ExitLong at row {} with negative price {:.4f}. Ignoring.", row, price);
            return false;
        }

        core::Trade trade = *open_trade_;
        trade.exit_time = timestamp;
        trade.exit_index = row;
        trade.exit_price = price;
        trade.pnl = (price - trade.entry_price) * trade.units;
        trade.return_fraction = (price - trade.entry_price) / trade.entry_price;

        cash_ += trade.units * price;
        open_trade_.reset();
        execution_count_++;
        trade_log_.push_back(trade);

        logger->info("Trade Executed: Time={}, Action=ExitLong, Row={}, Price={:.4f}, PnL={:.2f}, Return={:.2f}%, NewCash={:.2f}",
                     core::utils::timestampToString(timestamp), row, price, trade.pnl, trade.return_fraction * 100.0, cash_);
        return true;
    }

    void Portfolio::recordTimestampValue(core::Timestamp timestamp, double mark_price) {
        PortfolioState current_state;
        current_state.timestamp = timestamp;
        current_state.cash = cash_;
        current_state.position_value = open_trade_ ? open_trade_->units * mark_price : 0.0;
        current_state.total_equity = current_state.cash + current_state.position_value;
        equity_curve_.push_back(current_state);
    }

} // namespace backtester
