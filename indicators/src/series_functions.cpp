#include "series_functions.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

namespace indicators {

namespace {

    enum class CrossType {
        CrossesAbove,
        CrossesBelow
    };

    core::LogicalSeries crosses(const core::NumericSeries& a, const core::NumericSeries& b, CrossType type) {
        if (a.size() != b.size()) {
            throw core::IndicatorCalculationException(fmt::format(
                "Cross detection needs series of equal length ({} vs {})", a.size(), b.size()));
        }
        core::LogicalSeries result(a.size());
        for (std::size_t i = 1; i < a.size(); ++i) {
            if (!a[i - 1] || !b[i - 1] || !a[i] || !b[i]) {
                continue; // Not enough history
            }
            double prev_a = *a[i - 1];
            double prev_b = *b[i - 1];
            double now_a = *a[i];
            double now_b = *b[i];
            if (type == CrossType::CrossesAbove) {
                result[i] = (prev_a <= prev_b) && (now_a > now_b);
            } else {
                result[i] = (prev_a >= prev_b) && (now_a < now_b);
            }
        }
        return result;
    }

} // namespace

core::NumericSeries shift(const core::NumericSeries& input, std::size_t lag) {
    core::NumericSeries result(input.size());
    for (std::size_t i = lag; i < input.size(); ++i) {
        result[i] = input[i - lag];
    }
    return result;
}

core::NumericSeries change(const core::NumericSeries& input, std::size_t lag) {
    core::NumericSeries result(input.size());
    for (std::size_t i = lag; i < input.size(); ++i) {
        if (input[i] && input[i - lag]) {
            result[i] = *input[i] - *input[i - lag];
        }
    }
    return result;
}

core::NumericSeries percentChange(const core::NumericSeries& input, std::size_t lag) {
    core::NumericSeries result(input.size());
    for (std::size_t i = lag; i < input.size(); ++i) {
        if (input[i] && input[i - lag] && *input[i - lag] != 0.0) {
            double base = *input[i - lag];
            result[i] = (*input[i] - base) / base * 100.0;
        }
    }
    return result;
}

core::LogicalSeries crossesAbove(const core::NumericSeries& a, const core::NumericSeries& b) {
    return crosses(a, b, CrossType::CrossesAbove);
}

core::LogicalSeries crossesBelow(const core::NumericSeries& a, const core::NumericSeries& b) {
    return crosses(a, b, CrossType::CrossesBelow);
}

} // namespace indicators
