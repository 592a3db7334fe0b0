#include "sample_data_generator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm> // For std::min, std::max
#include <chrono>
#include <cmath>     // For std::round, std::fabs
#include <ctime>
#include <random>
#include <utility>
#include <vector>

namespace data {

    namespace {

        constexpr long long kBaseVolume = 1000000;

        bool isBusinessDay(const core::Timestamp& ts) {
            std::time_t tt = std::chrono::system_clock::to_time_t(ts);
            std::tm tm{};
            gmtime_r(&tt, &tm);
            return tm.tm_wday != 0 && tm.tm_wday != 6;
        }

        double roundCents(double value) {
            return std::round(value * 100.0) / 100.0;
        }

    } // namespace

SampleDataGenerator::SampleDataGenerator(SampleDataOptions options) : options_(std::move(options)) {}

core::PriceTable SampleDataGenerator::generate() const {
    auto logger = core::logging::getLogger();

    core::Timestamp start = core::utils::stringToTimestamp(options_.start_date);
    core::Timestamp end = core::utils::stringToTimestamp(options_.end_date);
    if (end < start) {
        throw core::DataLoadException(fmt::format(
            "Sample data end date {} is before start date {}", options_.end_date, options_.start_date));
    }
    if (!(options_.initial_price > 0.0)) {
        throw core::DataLoadException(fmt::format(
            "Sample data initial price must be positive, got {}", options_.initial_price));
    }

    std::vector<core::Timestamp> days;
    for (core::Timestamp day = start; day <= end; day += std::chrono::hours(24)) {
        if (isBusinessDay(day)) {
            days.push_back(day);
        }
    }

    std::mt19937 rng(options_.seed);
    std::normal_distribution<double> return_dist(0.0005, 0.02);
    std::bernoulli_distribution high_vol_regime(0.5);
    std::uniform_real_distribution<double> range_dist(0.01, 0.03);
    std::uniform_real_distribution<double> first_open_dist(0.99, 1.01);
    std::uniform_real_distribution<double> gap_dist(-0.005, 0.005);
    std::uniform_real_distribution<double> volume_noise(0.7, 1.3);

    const std::size_t n = days.size();
    std::vector<double> returns(n);
    for (std::size_t i = 0; i < n; ++i) {
        double volatility = high_vol_regime(rng) ? 0.025 : 0.015;
        double trend = n > 1 ? 0.001 * static_cast<double>(i) / static_cast<double>(n - 1) : 0.0;
        returns[i] = return_dist(rng) * (volatility / 0.02) + trend;
    }

    std::vector<double> closes(n);
    for (std::size_t i = 0; i < n; ++i) {
        closes[i] = (i == 0) ? options_.initial_price : closes[i - 1] * (1.0 + returns[i]);
    }

    core::PriceTable table;
    table.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        double close = closes[i];
        double range = range_dist(rng);
        double high = close * (1.0 + range / 2.0);
        double low = close * (1.0 - range / 2.0);

        double open = (i == 0) ? close * first_open_dist(rng) : closes[i - 1] * (1.0 + gap_dist(rng));
        open = std::max(low, std::min(high, open));

        double multiplier = 1.0 + std::fabs(returns[i]) * 10.0;

        core::Candle candle;
        candle.timestamp = days[i];
        candle.open = roundCents(open);
        candle.high = roundCents(high);
        candle.low = roundCents(low);
        candle.close = roundCents(close);
        candle.volume = static_cast<long long>(static_cast<double>(kBaseVolume) * multiplier * volume_noise(rng));
        table.push_back(candle);
    }

    logger->info("Generated {} business days of sample data ({} to {}, seed {})",
                 table.size(), options_.start_date, options_.end_date, options_.seed);
    return table;
}

} // namespace data
