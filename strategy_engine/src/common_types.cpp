#include "common_types.hpp"

namespace strategy_engine {

std::optional<PriceField> priceFieldFromString(const std::string& name) {
    if (name == "open") return PriceField::Open;
    if (name == "high") return PriceField::High;
    if (name == "low") return PriceField::Low;
    if (name == "close") return PriceField::Close;
    if (name == "volume") return PriceField::Volume;
    return std::nullopt;
}

std::optional<IndicatorKind> indicatorFromString(const std::string& name) {
    if (name == "sma") return IndicatorKind::Sma;
    if (name == "ema") return IndicatorKind::Ema;
    if (name == "rsi") return IndicatorKind::Rsi;
    return std::nullopt;
}

std::optional<ComparisonOp> comparisonFromString(const std::string& symbol) {
    if (symbol == ">") return ComparisonOp::GT;
    if (symbol == "<") return ComparisonOp::LT;
    if (symbol == ">=") return ComparisonOp::GTE;
    if (symbol == "<=") return ComparisonOp::LTE;
    if (symbol == "==") return ComparisonOp::EQ;
    if (symbol == "!=") return ComparisonOp::NE;
    return std::nullopt;
}

std::string toString(PriceField field) {
    switch (field) {
        case PriceField::Open:   return "open";
        case PriceField::High:   return "high";
        case PriceField::Low:    return "low";
        case PriceField::Close:  return "close";
        case PriceField::Volume: return "volume";
    }
    return "invalid_field";
}

std::string toString(ComparisonOp op) {
    switch (op) {
        case ComparisonOp::GT:  return ">";
        case ComparisonOp::LT:  return "<";
        case ComparisonOp::GTE: return ">=";
        case ComparisonOp::LTE: return "<=";
        case ComparisonOp::EQ:  return "==";
        case ComparisonOp::NE:  return "!=";
    }
    return "invalid_op";
}

std::string toString(BoolOp op) {
    return op == BoolOp::And ? "AND" : "OR";
}

std::string toString(IndicatorKind kind) {
    switch (kind) {
        case IndicatorKind::Sma: return "sma";
        case IndicatorKind::Ema: return "ema";
        case IndicatorKind::Rsi: return "rsi";
    }
    return "invalid_indicator";
}

std::string toString(TimeFunctionKind kind) {
    switch (kind) {
        case TimeFunctionKind::Yesterday: return "yesterday";
        case TimeFunctionKind::LastWeek:  return "last_week";
        case TimeFunctionKind::NDaysAgo:  return "n_days_ago";
    }
    return "invalid_time_function";
}

std::string toString(CrossType type) {
    return type == CrossType::CrossesAbove ? "crosses_above" : "crosses_below";
}

std::string toString(ChangeKind kind) {
    return kind == ChangeKind::Absolute ? "change" : "percent_change";
}

core::NumericSeries extractColumn(const core::PriceTable& table, PriceField field) {
    core::NumericSeries column;
    column.reserve(table.size());
    for (const auto& candle : table) {
        switch (field) {
            case PriceField::Open:   column.emplace_back(candle.open); break;
            case PriceField::High:   column.emplace_back(candle.high); break;
            case PriceField::Low:    column.emplace_back(candle.low); break;
            case PriceField::Close:  column.emplace_back(candle.close); break;
            case PriceField::Volume: column.emplace_back(static_cast<double>(candle.volume)); break;
        }
    }
    return column;
}

} // namespace strategy_engine
