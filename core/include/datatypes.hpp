#pragma once

#include <string>
#include <vector>
#include <chrono>   // For timestamps
#include <optional> // For undefined (warm-up) values and open trades

namespace core {

    // Using system_clock for time points; all conversions to text are UTC
    using Timestamp = std::chrono::system_clock::time_point;


    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes
    };

    // Represents the current state of the single simulated position
    enum class PositionState {
        Flat,  // No position
        Long   // Holding a long position
    };

    // One round trip (or an entry still waiting for its exit).
    // Exit fields stay empty until the position is closed.
    struct Trade {
        Timestamp entry_time;
        std::size_t entry_index = 0;  // Row of the price table where the entry happened
        double entry_price = 0.0;
        double units = 0.0;           // Fractional units bought with the available equity

        std::optional<Timestamp> exit_time;
        std::optional<std::size_t> exit_index;
        std::optional<double> exit_price;

        double pnl = 0.0;             // (exit - entry) * units, 0 while open
        double return_fraction = 0.0; // (exit - entry) / entry, 0.05 for +5%; 0 while open

        bool isClosed() const { return exit_price.has_value(); }
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    // An ordered OHLCV table, strictly increasing by timestamp
    using PriceTable = TimeSeries<Candle>;

    // Numeric series aligned with a price table. std::nullopt marks rows without
    // enough history (indicator warm-up, lookback before the first row, ...).
    using NumericSeries = TimeSeries<std::optional<double>>;

    // Tri-state logical series: true, false or undefined (std::nullopt)
    using LogicalSeries = TimeSeries<std::optional<bool>>;

} // namespace core
