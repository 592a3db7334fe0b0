#pragma once

#include "datatypes.hpp"
#include <optional>
#include <string>

namespace strategy_engine {

    // Enum to specify which candle field a series refers to
    enum class PriceField {
        Open,
        High,
        Low,
        Close,
        Volume
    };

    // Enum for comparison types
    enum class ComparisonOp {
        GT,  // Greater Than (>)
        LT,  // Less Than (<)
        GTE, // Greater Than or Equal To (>=)
        LTE, // Less Than or Equal To (<=)
        EQ,  // Equal To (==)
        NE   // Not Equal To (!=)
    };

    enum class BoolOp {
        And,
        Or
    };

    enum class IndicatorKind {
        Sma,
        Ema,
        Rsi
    };

    enum class TimeFunctionKind {
        Yesterday,  // lag 1
        LastWeek,   // lag 7
        NDaysAgo    // explicit lag
    };

    enum class CrossType {
        CrossesAbove,
        CrossesBelow
    };

    enum class ChangeKind {
        Absolute,   // change(series, n)
        Percent     // percent_change(series, n)
    };

    // DSL spellings. The *FromString helpers return std::nullopt for names
    // outside the closed vocabularies (names are case-sensitive).
    std::optional<PriceField> priceFieldFromString(const std::string& name);
    std::optional<IndicatorKind> indicatorFromString(const std::string& name);
    std::optional<ComparisonOp> comparisonFromString(const std::string& symbol);

    std::string toString(PriceField field);
    std::string toString(ComparisonOp op);
    std::string toString(BoolOp op);
    std::string toString(IndicatorKind kind);
    std::string toString(TimeFunctionKind kind);
    std::string toString(CrossType type);
    std::string toString(ChangeKind kind);

    // Column projection of a price table (volume converted to double)
    core::NumericSeries extractColumn(const core::PriceTable& table, PriceField field);

} // namespace strategy_engine
