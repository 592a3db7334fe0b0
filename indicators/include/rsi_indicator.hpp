#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Wilder's RSI. Defined from row `period` of each run; 100 whenever the
// smoothed average loss is zero.
class RsiIndicator : public IIndicator {
public:
    explicit RsiIndicator(int period);

    ~RsiIndicator() override = default;

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
