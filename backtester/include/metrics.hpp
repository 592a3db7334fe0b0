#pragma once

#include <vector>

#include "datatypes.hpp"
#include "portfolio.hpp" // PortfolioState

namespace backtester {

    // --- Backtest Metrics Struct ---
    struct BacktestMetrics {
        double total_return = 0.0;      // final_equity - initial_capital
        double total_return_pct = 0.0;  // In percent
        double max_drawdown = 0.0;      // Fraction of the running peak, 0..1
        double max_drawdown_amount = 0.0; // Largest peak - equity, in currency
        double win_rate = 0.0;          // Winners / completed trades, 0..1
        double avg_return = 0.0;        // Mean trade return fraction
        double sharpe_ratio = 0.0;      // Annualized, from per-row equity returns
        int num_trades = 0;             // Completed trades

        // Helper method to log calculated metrics
        void logMetrics() const;
    };

    // Largest (peak - equity) / peak over the curve
    double maxDrawdown(const std::vector<PortfolioState>& equity_curve);

    // Largest peak - equity over the curve. Measured on its own, so its
    // trough need not match the one behind maxDrawdown.
    double maxDrawdownAmount(const std::vector<PortfolioState>& equity_curve);

    // mean / population stdev of row-to-row equity returns, times
    // sqrt(annualization_factor). 0 for fewer than two returns or a flat curve.
    double sharpeRatio(const std::vector<PortfolioState>& equity_curve, double annualization_factor);

    BacktestMetrics calculateMetrics(const std::vector<core::Trade>& trades,
                                     const std::vector<PortfolioState>& equity_curve,
                                     double initial_capital,
                                     double final_equity,
                                     double annualization_factor);

} // namespace backtester
