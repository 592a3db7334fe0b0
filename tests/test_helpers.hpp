#pragma once

#include <chrono>
#include <vector>

#include "datatypes.hpp"
#include "utils.hpp"

namespace test_helpers {

    // Daily candles starting 2023-01-02 with open = high = low = close.
    inline core::PriceTable makeTable(const std::vector<double>& closes,
                                      const std::vector<long long>& volumes = {}) {
        core::PriceTable table;
        core::Timestamp start = core::utils::stringToTimestamp("2023-01-02");
        for (std::size_t i = 0; i < closes.size(); ++i) {
            core::Candle candle;
            candle.timestamp = start + std::chrono::hours(24 * static_cast<long>(i));
            candle.open = closes[i];
            candle.high = closes[i];
            candle.low = closes[i];
            candle.close = closes[i];
            candle.volume = volumes.empty() ? 1000 : volumes[i];
            table.push_back(candle);
        }
        return table;
    }

    inline core::NumericSeries series(const std::vector<double>& values) {
        return core::NumericSeries(values.begin(), values.end());
    }

    inline std::size_t countUndefined(const core::NumericSeries& s) {
        std::size_t n = 0;
        for (const auto& v : s) {
            n += v ? 0 : 1;
        }
        return n;
    }

} // namespace test_helpers
