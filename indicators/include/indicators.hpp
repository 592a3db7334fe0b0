#pragma once

#include "datatypes.hpp" // Needs NumericSeries
#include <functional>
#include <string>
#include <vector>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "SMA(20)", "RSI(14)")
    virtual std::string getName() const = 0;

    // Number of leading input rows consumed before the first defined output.
    virtual int getLookback() const = 0;

    // Calculate the indicator over an input series and store the result.
    // Undefined input rows split the input into independent runs; every run
    // pays its own lookback.
    virtual void calculate(const core::NumericSeries& input) = 0;

    // Result aligned with the last input: same length, std::nullopt for
    // warm-up rows.
    virtual const core::NumericSeries& getResult() const = 0;
};

// Computes the defined outputs for one contiguous run of input values.
// Must return exactly (run.size() - lookback) values, or an empty vector
// when the run is not longer than the lookback.
using RunCalculator = std::function<std::vector<double>(const std::vector<double>& run)>;

// Splits `input` into maximal runs of defined values, calls `calculator` on each
// run and scatters the outputs back so they line up with the input rows.
core::NumericSeries applyOverDefinedRuns(const core::NumericSeries& input,
                                         int lookback,
                                         const RunCalculator& calculator);

} // namespace indicators
