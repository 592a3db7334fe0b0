#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <vector>

namespace indicators {

SmaIndicator::SmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw core::IndicatorCalculationException(fmt::format("SMA period must be positive, got {}.", period_));
    }

    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("SMA({})", period_);
    core::logging::getLogger()->debug("SmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const core::NumericSeries& SmaIndicator::getResult() const {
    return results_;
}

void SmaIndicator::calculate(const core::NumericSeries& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {} over {} rows...", name_, input.size());

    results_ = applyOverDefinedRuns(input, lookback_, [this, &logger](const std::vector<double>& run) {
        std::vector<double> out(run.size() - static_cast<std::size_t>(lookback_));
        int out_begin_idx = 0;
        int out_nb_element = 0;

        TA_RetCode ret_code = TA_MA(
            0,                                  // startIdx
            static_cast<int>(run.size()) - 1,   // endIdx
            run.data(),                         // inReal
            period_,                            // optInTimePeriod
            TA_MAType_SMA,                      // optInMAType
            &out_begin_idx,                     // outBegIdx
            &out_nb_element,                    // outNbElement
            out.data()                          // outReal
        );

        if (ret_code != TA_SUCCESS) {
            throw core::IndicatorCalculationException(fmt::format(
                "TA-Lib TA_MA calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code)));
        }
        if (out_begin_idx != lookback_) {
            logger->warn("TA_MA out_begin_idx ({}) does not match lookback ({}) for {}.", out_begin_idx, lookback_, name_);
        }
        out.resize(static_cast<std::size_t>(out_nb_element));
        return out;
    });

    logger->trace("Successfully calculated {}", name_);
}

} // namespace indicators
