// backtester/include/portfolio.hpp
#pragma once

#include <optional>
#include <vector>

// Use short paths
#include "datatypes.hpp" // Provides core::Timestamp, core::PositionState, core::Trade

namespace backtester {

    // --- Portfolio State Struct (for equity curve) ---
    struct PortfolioState {
        core::Timestamp timestamp;
        double cash = 0.0;
        double position_value = 0.0; // Units held * mark price
        double total_equity = 0.0;   // cash + position_value
    };

    // --- Portfolio Class Definition ---
    // Book for a single instrument and at most one long position. Entries
    // invest the whole equity in fractional units; exits return it to cash.
    class Portfolio {
    public:
        // Throws core::BacktestException if initial_capital is not positive.
        explicit Portfolio(double initial_capital);

        // --- Getters ---
        double getCash() const;
        core::PositionState getState() const;
        const std::optional<core::Trade>& getOpenTrade() const;
        // Cash plus the open position at `mark_price`
        double getCurrentEquity(double mark_price) const;
        // Cash plus the open position at its entry price
        double getRealizedEquity() const;
        const std::vector<PortfolioState>& getEquityCurve() const;
        int getTotalExecutions() const { return execution_count_; }
        const std::vector<core::Trade>& getTradeLog() const; // Completed trades only

        // --- Modifiers ---
        // Both return false (and log a warning) when the transition is not
        // allowed: entering while long, exiting while flat, non-positive price.
        bool openLong(core::Timestamp timestamp, std::size_t row, double price);
        bool closeLong(core::Timestamp timestamp, std::size_t row, double price);

        // Appends one equity curve point valued at `mark_price`
        void recordTimestampValue(core::Timestamp timestamp, double mark_price);

    private:
        double cash_;
        std::optional<core::Trade> open_trade_;
        std::vector<PortfolioState> equity_curve_;
        int execution_count_ = 0;
        std::vector<core::Trade> trade_log_;
    };

} // namespace backtester
