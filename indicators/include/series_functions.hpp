#pragma once

#include "datatypes.hpp"
#include <cstddef>

namespace indicators {

    // Value from `lag` rows earlier; the first `lag` rows are undefined.
    core::NumericSeries shift(const core::NumericSeries& input, std::size_t lag);

    // x[i] - x[i - lag]
    core::NumericSeries change(const core::NumericSeries& input, std::size_t lag);

    // (x[i] - x[i - lag]) / x[i - lag] * 100; undefined when the base is zero.
    core::NumericSeries percentChange(const core::NumericSeries& input, std::size_t lag);

    // Row i (i >= 1) is true when a was at or below b on row i-1 and is
    // strictly above it on row i. Row 0 and rows touching undefined input
    // are undefined. Inputs must have equal length.
    core::LogicalSeries crossesAbove(const core::NumericSeries& a, const core::NumericSeries& b);

    // Mirror of crossesAbove: at or above on row i-1, strictly below on row i.
    core::LogicalSeries crossesBelow(const core::NumericSeries& a, const core::NumericSeries& b);

} // namespace indicators
