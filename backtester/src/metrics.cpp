#include "metrics.hpp"
#include "logging.hpp"

#include <algorithm> // For std::max
#include <cmath>   // For std::sqrt
#include <numeric> // For std::accumulate

namespace backtester {

void BacktestMetrics::logMetrics() const {
    auto logger = core::logging::getLogger();
    logger->info("--- Backtest Metrics ---");
    logger->info("Total Return: {:.2f} ({:.2f}%)", total_return, total_return_pct);
    logger->info("Max Drawdown: {:.2f}% ({:.2f})", max_drawdown * 100.0, max_drawdown_amount);
    logger->info("Completed Trades: {}", num_trades);
    logger->info("Win Rate: {:.2f}%", win_rate * 100.0);
    logger->info("Avg Trade Return: {:.2f}%", avg_return * 100.0);
    logger->info("Sharpe Ratio: {:.3f}", sharpe_ratio);
    logger->info("------------------------");
}

double maxDrawdown(const std::vector<PortfolioState>& equity_curve) {
    double peak = 0.0;
    double max_dd = 0.0;
    for (const auto& state : equity_curve) {
        if (state.total_equity > peak) {
            peak = state.total_equity;
        }
        if (peak > 0.0) {
            double drawdown = (peak - state.total_equity) / peak;
            if (drawdown > max_dd) {
                max_dd = drawdown;
            }
        }
    }
    return max_dd;
}

double maxDrawdownAmount(const std::vector<PortfolioState>& equity_curve) {
    double max_dd = 0.0;
    if (equity_curve.empty()) {
        return max_dd;
    }
    double peak = equity_curve.front().total_equity;
    for (const auto& state : equity_curve) {
        peak = std::max(peak, state.total_equity);
        max_dd = std::max(max_dd, peak - state.total_equity);
    }
    return max_dd;
}

double sharpeRatio(const std::vector<PortfolioState>& equity_curve, double annualization_factor) {
    std::vector<double> returns;
    for (std::size_t i = 1; i < equity_curve.size(); ++i) {
        double previous = equity_curve[i - 1].total_equity;
        if (previous != 0.0) {
            returns.push_back(equity_curve[i].total_equity / previous - 1.0);
        }
    }
    if (returns.size() < 2) {
        return 0.0;
    }

    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(returns.size());
    double sq_sum = 0.0;
    for (double r : returns) {
        sq_sum += (r - mean) * (r - mean);
    }
    double stdev = std::sqrt(sq_sum / static_cast<double>(returns.size()));
    if (stdev < 1e-12) {
        return 0.0;
    }
    return mean / stdev * std::sqrt(annualization_factor);
}

BacktestMetrics calculateMetrics(const std::vector<core::Trade>& trades,
                                 const std::vector<PortfolioState>& equity_curve,
                                 double initial_capital,
                                 double final_equity,
                                 double annualization_factor) {
    BacktestMetrics metrics;
    metrics.total_return = final_equity - initial_capital;
    metrics.total_return_pct = metrics.total_return / initial_capital * 100.0;
    metrics.num_trades = static_cast<int>(trades.size());

    if (!trades.empty()) {
        int winners = 0;
        double return_sum = 0.0;
        for (const auto& trade : trades) {
            if (trade.return_fraction > 0.0) {
                winners++;
            }
            return_sum += trade.return_fraction;
        }
        metrics.win_rate = static_cast<double>(winners) / static_cast<double>(trades.size());
        metrics.avg_return = return_sum / static_cast<double>(trades.size());
    }

    metrics.max_drawdown = maxDrawdown(equity_curve);
    metrics.max_drawdown_amount = maxDrawdownAmount(equity_curve);
    metrics.sharpe_ratio = sharpeRatio(equity_curve, annualization_factor);
    return metrics;
}

} // namespace backtester
