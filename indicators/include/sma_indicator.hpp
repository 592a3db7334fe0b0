#pragma once

#include "indicators.hpp" // Base interface
#include <string>

namespace indicators {

class SmaIndicator : public IIndicator {
public:
    // Constructor: Requires the period for the SMA
    explicit SmaIndicator(int period);

    ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::NumericSeries& input) override;
    const core::NumericSeries& getResult() const override;

private:
    const int period_;          // SMA period (e.g., 20, 50)
    int lookback_;              // TA-Lib lookback (period - 1)
    std::string name_;          // Indicator name (e.g., "SMA(20)")
    core::NumericSeries results_;
};

} // namespace indicators
