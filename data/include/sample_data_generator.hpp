#pragma once

#include <string>

#include "datatypes.hpp"

namespace data {

    struct SampleDataOptions {
        std::string start_date = "2023-01-01"; // YYYY-MM-DD, inclusive
        std::string end_date = "2023-12-31";   // YYYY-MM-DD, inclusive
        double initial_price = 100.0;
        unsigned int seed = 42;
    };

    // Synthetic daily OHLCV table: one row per business day (Mon-Fri, UTC
    // midnight), close prices from a drifting random walk with two volatility
    // regimes, high/low around the close and open clamped into [low, high].
    // The same options always give the same table.
    class SampleDataGenerator {
    public:
        explicit SampleDataGenerator(SampleDataOptions options = SampleDataOptions{});

        // Throws core::DataLoadException for unreadable dates, end before
        // start, or a non-positive initial price.
        core::PriceTable generate() const;

    private:
        SampleDataOptions options_;
    };

} // namespace data
