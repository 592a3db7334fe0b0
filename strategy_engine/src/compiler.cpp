#include "compiler.hpp"
#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "series_functions.hpp"
#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include <spdlog/fmt/fmt.h>

#include <cmath>   // For std::fabs
#include <utility>

namespace strategy_engine {

    namespace {

        template <class... Ts>
        struct overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        constexpr double kEqualityTolerance = 1e-9;

        std::unique_ptr<indicators::IIndicator> makeIndicator(IndicatorKind kind, int period) {
            switch (kind) {
                case IndicatorKind::Sma: return std::make_unique<indicators::SmaIndicator>(period);
                case IndicatorKind::Ema: return std::make_unique<indicators::EmaIndicator>(period);
                case IndicatorKind::Rsi: return std::make_unique<indicators::RsiIndicator>(period);
            }
            throw core::CompileError("Unknown indicator kind");
        }

        bool compareValues(ComparisonOp op, double lhs, double rhs) {
            switch (op) {
                case ComparisonOp::GT:  return lhs > rhs;
                case ComparisonOp::LT:  return lhs < rhs;
                case ComparisonOp::GTE: return lhs >= rhs;
                case ComparisonOp::LTE: return lhs <= rhs;
                case ComparisonOp::EQ:  return std::fabs(lhs - rhs) < kEqualityTolerance;
                case ComparisonOp::NE:  return std::fabs(lhs - rhs) >= kEqualityTolerance;
            }
            return false;
        }

        std::optional<bool> foldAnd(const std::optional<bool>& a, const std::optional<bool>& b) {
            if ((a && !*a) || (b && !*b)) return false;
            if (!a || !b) return std::nullopt;
            return true;
        }

        std::optional<bool> foldOr(const std::optional<bool>& a, const std::optional<bool>& b) {
            if ((a && *a) || (b && *b)) return true;
            if (!a && !b) return std::nullopt;
            return false;
        }

        void requirePositive(int value, const std::string& what, const ast::Node& node) {
            if (value <= 0) {
                throw core::CompileError(fmt::format(
                    "{} must be positive, got {} (line {}, column {})",
                    what, value, node.position.line, node.position.column));
            }
        }

        std::vector<bool> collapse(const core::LogicalSeries& series) {
            std::vector<bool> signals;
            signals.reserve(series.size());
            for (const auto& value : series) {
                signals.push_back(value.value_or(false));
            }
            return signals;
        }

    } // namespace

int IndicatorDefaults::periodFor(IndicatorKind kind) const {
    switch (kind) {
        case IndicatorKind::Sma: return sma_period;
        case IndicatorKind::Ema: return ema_period;
        case IndicatorKind::Rsi: return rsi_period;
    }
    return sma_period;
}

IndicatorDefaults IndicatorDefaults::fromJson(const nlohmann::json& section) {
    IndicatorDefaults defaults;
    defaults.sma_period = core::config::readInt(section, "sma_period", defaults.sma_period, "indicators");
    defaults.ema_period = core::config::readInt(section, "ema_period", defaults.ema_period, "indicators");
    defaults.rsi_period = core::config::readInt(section, "rsi_period", defaults.rsi_period, "indicators");
    for (int period : {defaults.sma_period, defaults.ema_period, defaults.rsi_period}) {
        if (period <= 0) {
            throw core::ConfigException(fmt::format("indicators: periods must be positive, got {}", period));
        }
    }
    return defaults;
}

// --- Evaluator ---

Evaluator::Evaluator(std::shared_ptr<const ast::Strategy> strategy,
                     IndicatorDefaults defaults,
                     LogicalProgram entry,
                     LogicalProgram exit)
    : strategy_(std::move(strategy)),
      defaults_(defaults),
      entry_(std::move(entry)),
      exit_(std::move(exit))
{}

LogicalFrame Evaluator::evaluateLogical(const core::PriceTable& table) const {
    core::utils::validatePriceTable(table);

    LogicalFrame frame;
    frame.entry = entry_ ? entry_(table) : core::LogicalSeries(table.size(), false);
    frame.exit = exit_ ? exit_(table) : core::LogicalSeries(table.size(), false);
    return frame;
}

SignalFrame Evaluator::operator()(const core::PriceTable& table) const {
    auto logger = core::logging::getLogger();
    LogicalFrame logical = evaluateLogical(table);

    SignalFrame signals;
    signals.entry = collapse(logical.entry);
    signals.exit = collapse(logical.exit);

    if (logger->should_log(spdlog::level::debug)) {
        std::size_t entries = 0;
        std::size_t exits = 0;
        for (std::size_t i = 0; i < signals.size(); ++i) {
            entries += signals.entry[i] ? 1 : 0;
            exits += signals.exit[i] ? 1 : 0;
        }
        logger->debug("Evaluated {} rows: {} entry signals, {} exit signals", table.size(), entries, exits);
    }
    return signals;
}

// --- Compiler ---

Compiler::Compiler(IndicatorDefaults defaults) : defaults_(defaults) {}

Evaluator Compiler::compile(const ast::Strategy& strategy) const {
    return compile(std::make_shared<const ast::Strategy>(strategy));
}

Evaluator Compiler::compile(std::shared_ptr<const ast::Strategy> strategy) const {
    if (!strategy || (!strategy->entry && !strategy->exit)) {
        throw core::CompileError("Strategy has neither an ENTRY nor an EXIT section");
    }

    LogicalProgram entry;
    LogicalProgram exit;
    if (strategy->entry) {
        entry = compileLogical(strategy->entry);
    }
    if (strategy->exit) {
        exit = compileLogical(strategy->exit);
    }

    core::logging::getLogger()->debug("Compiled strategy:\n{}", ast::toDsl(*strategy));
    return Evaluator(std::move(strategy), defaults_, std::move(entry), std::move(exit));
}

NumericProgram Compiler::compileNumeric(const ast::NodePtr& node) const {
    if (!node) {
        throw core::CompileError("Missing operand in expression");
    }
    const ast::Node& current = *node;

    auto rejectRule = [&current](const char* what) -> NumericProgram {
        throw core::CompileError(fmt::format(
            "{} '{}' is a rule and cannot be used as a value (line {}, column {})",
            what, ast::toDsl(current), current.position.line, current.position.column));
    };

    return std::visit(overloaded{
        [](const ast::SeriesRef& n) -> NumericProgram {
            PriceField field = n.field;
            return [field](const core::PriceTable& table) { return extractColumn(table, field); };
        },
        [](const ast::NumberLiteral& n) -> NumericProgram {
            double value = n.value;
            return [value](const core::PriceTable& table) {
                return core::NumericSeries(table.size(), value);
            };
        },
        [](const ast::PercentageLiteral& n) -> NumericProgram {
            double value = n.value;
            return [value](const core::PriceTable& table) {
                return core::NumericSeries(table.size(), value);
            };
        },
        [this, &current](const ast::IndicatorCall& n) -> NumericProgram {
            int period = n.period ? *n.period : defaults_.periodFor(n.kind);
            requirePositive(period, toString(n.kind) + " period", current);
            NumericProgram input = compileNumeric(n.input);
            IndicatorKind kind = n.kind;
            return [input, kind, period](const core::PriceTable& table) {
                auto indicator = makeIndicator(kind, period);
                indicator->calculate(input(table));
                return indicator->getResult();
            };
        },
        [this, &current](const ast::TimeShift& n) -> NumericProgram {
            requirePositive(n.lag, toString(n.kind) + " lag", current);
            NumericProgram input = compileNumeric(n.input);
            std::size_t lag = static_cast<std::size_t>(n.lag);
            return [input, lag](const core::PriceTable& table) {
                return indicators::shift(input(table), lag);
            };
        },
        [this, &current](const ast::ChangeCall& n) -> NumericProgram {
            requirePositive(n.lag, toString(n.kind) + " period", current);
            NumericProgram input = compileNumeric(n.input);
            std::size_t lag = static_cast<std::size_t>(n.lag);
            if (n.kind == ChangeKind::Absolute) {
                return [input, lag](const core::PriceTable& table) {
                    return indicators::change(input(table), lag);
                };
            }
            return [input, lag](const core::PriceTable& table) {
                return indicators::percentChange(input(table), lag);
            };
        },
        [&rejectRule](const ast::CrossCall&) -> NumericProgram { return rejectRule("Cross"); },
        [&rejectRule](const ast::Comparison&) -> NumericProgram { return rejectRule("Comparison"); },
        [&rejectRule](const ast::BooleanExpr&) -> NumericProgram { return rejectRule("Boolean expression"); }
    }, current.value);
}

LogicalProgram Compiler::compileLogical(const ast::NodePtr& node) const {
    if (!node) {
        throw core::CompileError("Missing rule in expression");
    }
    const ast::Node& current = *node;

    auto rejectValue = [&current]() -> LogicalProgram {
        throw core::CompileError(fmt::format(
            "'{}' is a value, a rule (comparison or cross) is required here (line {}, column {})",
            ast::toDsl(current), current.position.line, current.position.column));
    };

    return std::visit(overloaded{
        [&rejectValue](const ast::SeriesRef&) -> LogicalProgram { return rejectValue(); },
        [&rejectValue](const ast::NumberLiteral&) -> LogicalProgram { return rejectValue(); },
        [&rejectValue](const ast::PercentageLiteral&) -> LogicalProgram { return rejectValue(); },
        [&rejectValue](const ast::IndicatorCall&) -> LogicalProgram { return rejectValue(); },
        [&rejectValue](const ast::TimeShift&) -> LogicalProgram { return rejectValue(); },
        [&rejectValue](const ast::ChangeCall&) -> LogicalProgram { return rejectValue(); },
        [this](const ast::CrossCall& n) -> LogicalProgram {
            NumericProgram left = compileNumeric(n.left);
            NumericProgram right = compileNumeric(n.right);
            if (n.type == CrossType::CrossesAbove) {
                return [left, right](const core::PriceTable& table) {
                    return indicators::crossesAbove(left(table), right(table));
                };
            }
            return [left, right](const core::PriceTable& table) {
                return indicators::crossesBelow(left(table), right(table));
            };
        },
        [this](const ast::Comparison& n) -> LogicalProgram {
            NumericProgram left = compileNumeric(n.left);
            NumericProgram right = compileNumeric(n.right);
            ComparisonOp op = n.op;
            return [left, right, op](const core::PriceTable& table) {
                core::NumericSeries lhs = left(table);
                core::NumericSeries rhs = right(table);
                core::LogicalSeries result(table.size());
                for (std::size_t i = 0; i < result.size(); ++i) {
                    if (lhs[i] && rhs[i]) {
                        result[i] = compareValues(op, *lhs[i], *rhs[i]);
                    }
                }
                return result;
            };
        },
        [this](const ast::BooleanExpr& n) -> LogicalProgram {
            LogicalProgram left = compileLogical(n.left);
            LogicalProgram right = compileLogical(n.right);
            BoolOp op = n.op;
            return [left, right, op](const core::PriceTable& table) {
                core::LogicalSeries lhs = left(table);
                core::LogicalSeries rhs = right(table);
                core::LogicalSeries result(table.size());
                for (std::size_t i = 0; i < result.size(); ++i) {
                    result[i] = (op == BoolOp::And) ? foldAnd(lhs[i], rhs[i]) : foldOr(lhs[i], rhs[i]);
                }
                return result;
            };
        }
    }, current.value);
}

} // namespace strategy_engine
