#include "indicators.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace indicators {

core::NumericSeries applyOverDefinedRuns(const core::NumericSeries& input,
                                         int lookback,
                                         const RunCalculator& calculator) {
    core::NumericSeries output(input.size());
    const std::size_t skip = static_cast<std::size_t>(lookback);

    std::size_t i = 0;
    while (i < input.size()) {
        if (!input[i]) {
            ++i;
            continue;
        }
        std::size_t run_start = i;
        std::vector<double> run;
        while (i < input.size() && input[i]) {
            run.push_back(*input[i]);
            ++i;
        }

        if (run.size() <= skip) {
            core::logging::getLogger()->trace("Run of {} values at row {} is within lookback {}; left undefined.",
                                              run.size(), run_start, lookback);
            continue;
        }

        std::vector<double> values = calculator(run);
        if (values.size() != run.size() - skip) {
            throw core::IndicatorCalculationException(fmt::format(
                "Indicator produced {} values for a run of {} (lookback {})", values.size(), run.size(), lookback));
        }
        for (std::size_t k = 0; k < values.size(); ++k) {
            output[run_start + skip + k] = values[k];
        }
    }
    return output;
}

} // namespace indicators
