#include "rsi_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <vector>

namespace indicators {

namespace {

    // RSI(1): the smoothed averages are just the latest gain and loss.
    std::vector<double> singlePeriodRsi(const std::vector<double>& run) {
        std::vector<double> out;
        out.reserve(run.size() - 1);
        for (std::size_t i = 1; i < run.size(); ++i) {
            out.push_back(run[i] < run[i - 1] ? 0.0 : 100.0);
        }
        return out;
    }

} // namespace

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw core::IndicatorCalculationException(fmt::format("RSI period must be positive, got {}.", period_));
    }

    lookback_ = (period_ == 1) ? 1 : TA_RSI_Lookback(period_);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_RSI_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->debug("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::NumericSeries& RsiIndicator::getResult() const {
    return results_;
}

void RsiIndicator::calculate(const core::NumericSeries& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {} over {} rows...", name_, input.size());

    results_ = applyOverDefinedRuns(input, lookback_, [this, &logger](const std::vector<double>& run) {
        if (period_ == 1) {
            return singlePeriodRsi(run);
        }

        std::vector<double> out(run.size() - static_cast<std::size_t>(lookback_));
        int out_begin_idx = 0;
        int out_nb_element = 0;

        TA_RetCode ret_code = TA_RSI(
            0,                                  // startIdx
            static_cast<int>(run.size()) - 1,   // endIdx
            run.data(),                         // inReal
            period_,                            // optInTimePeriod
            &out_begin_idx,                     // outBegIdx
            &out_nb_element,                    // outNbElement
            out.data()                          // outReal
        );

        if (ret_code != TA_SUCCESS) {
            throw core::IndicatorCalculationException(fmt::format(
                "TA-Lib TA_RSI calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code)));
        }
        if (out_begin_idx != lookback_) {
            logger->warn("TA_RSI out_begin_idx ({}) does not match lookback ({}) for {}.", out_begin_idx, lookback_, name_);
        }
        out.resize(static_cast<std::size_t>(out_nb_element));

        // Wilder's average loss stays zero until the first down move. TA-Lib
        // reports 0 when gains and losses are both zero; that row is 100 here.
        bool seen_loss = false;
        for (std::size_t i = 1; i < run.size(); ++i) {
            seen_loss = seen_loss || run[i] < run[i - 1];
            if (seen_loss) {
                break;
            }
            if (i >= static_cast<std::size_t>(lookback_) && i - static_cast<std::size_t>(lookback_) < out.size()) {
                out[i - static_cast<std::size_t>(lookback_)] = 100.0;
            }
        }
        return out;
    });

    logger->trace("Successfully calculated {}", name_);
}

} // namespace indicators
