#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Exponential moving average, alpha = 2 / (period + 1), seeded with the SMA
// of the first `period` values of each run.
class EmaIndicator : public IIndicator {
public:
    explicit EmaIndicator(int period);

    ~EmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::NumericSeries& input) override;
    const core::NumericSeries& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::NumericSeries results_;
};

} // namespace indicators
