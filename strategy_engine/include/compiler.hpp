#pragma once

#include "ast.hpp"
#include "datatypes.hpp"
#include <nlohmann/json_fwd.hpp>
#include <functional>
#include <memory>
#include <vector>

namespace strategy_engine {

    // Periods used when an indicator call omits one.
    struct IndicatorDefaults {
        int sma_period = 20;
        int ema_period = 20;
        int rsi_period = 14;

        int periodFor(IndicatorKind kind) const;

        // Reads the "indicators" section; missing keys keep the defaults.
        // Throws core::ConfigException on wrong types or non-positive periods.
        static IndicatorDefaults fromJson(const nlohmann::json& section);
    };

    // Per-row signals, undefined rows collapsed to false.
    struct SignalFrame {
        std::vector<bool> entry;
        std::vector<bool> exit;

        std::size_t size() const { return entry.size(); }
    };

    // Tri-state view of the same signals, for diagnostics.
    struct LogicalFrame {
        core::LogicalSeries entry;
        core::LogicalSeries exit;
    };

    using NumericProgram = std::function<core::NumericSeries(const core::PriceTable&)>;
    using LogicalProgram = std::function<core::LogicalSeries(const core::PriceTable&)>;

    // Compiled strategy. Immutable; can be applied to any number of tables.
    class Evaluator {
    public:
        Evaluator(std::shared_ptr<const ast::Strategy> strategy,
                  IndicatorDefaults defaults,
                  LogicalProgram entry,
                  LogicalProgram exit);

        // Throws core::DataLoadException if timestamps are not strictly increasing.
        SignalFrame operator()(const core::PriceTable& table) const;
        LogicalFrame evaluateLogical(const core::PriceTable& table) const;

        const ast::Strategy& strategy() const { return *strategy_; }
        const IndicatorDefaults& defaults() const { return defaults_; }

    private:
        std::shared_ptr<const ast::Strategy> strategy_;
        IndicatorDefaults defaults_;
        LogicalProgram entry_;  // Empty when the section is absent
        LogicalProgram exit_;
    };

    // Turns an AST into an Evaluator. Throws core::CompileError for trees it
    // cannot ground: no sections, non-positive periods/lags, value nodes in rule
    // position or rule nodes in value position.
    class Compiler {
    public:
        explicit Compiler(IndicatorDefaults defaults = IndicatorDefaults{});

        Evaluator compile(const ast::Strategy& strategy) const;
        Evaluator compile(std::shared_ptr<const ast::Strategy> strategy) const;

        const IndicatorDefaults& defaults() const { return defaults_; }

    private:
        NumericProgram compileNumeric(const ast::NodePtr& node) const;
        LogicalProgram compileLogical(const ast::NodePtr& node) const;

        IndicatorDefaults defaults_;
    };

} // namespace strategy_engine
