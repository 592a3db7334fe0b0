#include "ema_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>
#include <vector>

namespace indicators {

EmaIndicator::EmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw core::IndicatorCalculationException(fmt::format("EMA period must be positive, got {}.", period_));
    }

    // TA_EMA accepts periods from 2; EMA(1) has alpha 1 and is the input itself.
    lookback_ = (period_ == 1) ? 0 : TA_EMA_Lookback(period_);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_EMA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("EMA({})", period_);
    core::logging::getLogger()->debug("EmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string EmaIndicator::getName() const {
    return name_;
}

int EmaIndicator::getLookback() const {
    return lookback_;
}

const core::NumericSeries& EmaIndicator::getResult() const {
    return results_;
}

void EmaIndicator::calculate(const core::NumericSeries& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {} over {} rows...", name_, input.size());

    if (period_ == 1) {
        results_ = input;
        return;
    }

    results_ = applyOverDefinedRuns(input, lookback_, [this, &logger](const std::vector<double>& run) {
        std::vector<double> out(run.size() - static_cast<std::size_t>(lookback_));
        int out_begin_idx = 0;
        int out_nb_element = 0;

        TA_RetCode ret_code = TA_EMA(
            0,
            static_cast<int>(run.size()) - 1,
            run.data(),
            period_,
            &out_begin_idx,
            &out_nb_element,
            out.data()
        );

        if (ret_code != TA_SUCCESS) {
            throw core::IndicatorCalculationException(fmt::format(
                "TA-Lib TA_EMA calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code)));
        }
        if (out_begin_idx != lookback_) {
            logger->warn("TA_EMA out_begin_idx ({}) does not match lookback ({}) for {}.", out_begin_idx, lookback_, name_);
        }
        out.resize(static_cast<std::size_t>(out_nb_element));
        return out;
    });

    logger->trace("Successfully calculated {}", name_);
}

} // namespace indicators
