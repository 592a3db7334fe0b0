#pragma once

#include "common_types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace strategy_engine {
namespace ast {

    // 1-based source position; {0, 0} for nodes built programmatically.
    struct SourcePosition {
        int line = 0;
        int column = 0;
    };

    struct Node;
    using NodePtr = std::shared_ptr<const Node>;

    // --- Numeric expressions ---

    struct SeriesRef {
        PriceField field;
    };

    struct NumberLiteral {
        double value;
    };

    // Written as "5%"; holds 5.
    struct PercentageLiteral {
        double value;
    };

    struct IndicatorCall {
        IndicatorKind kind;
        NodePtr input;
        std::optional<int> period; // Absent: compiler default applies
    };

    struct TimeShift {
        TimeFunctionKind kind;
        NodePtr input;
        int lag; // 1 for yesterday, 7 for last_week
    };

    struct ChangeCall {
        ChangeKind kind;
        NodePtr input;
        int lag;
    };

    // --- Logical expressions ---

    struct CrossCall {
        CrossType type;
        NodePtr left;
        NodePtr right;
    };

    struct Comparison {
        ComparisonOp op;
        NodePtr left;
        NodePtr right;
    };

    // Chains are left-nested: a AND b OR c == ((a AND b) OR c)
    struct BooleanExpr {
        BoolOp op;
        NodePtr left;
        NodePtr right;
    };

    using NodeVariant = std::variant<SeriesRef,
                                     NumberLiteral,
                                     PercentageLiteral,
                                     IndicatorCall,
                                     TimeShift,
                                     ChangeCall,
                                     CrossCall,
                                     Comparison,
                                     BooleanExpr>;

    struct Node {
        NodeVariant value;
        SourcePosition position;
    };

    // A null section means the section was not written.
    struct Strategy {
        NodePtr entry;
        NodePtr exit;
    };

    // Structural equality; source positions are ignored.
    bool sameTree(const NodePtr& a, const NodePtr& b);

    bool operator==(const SeriesRef& a, const SeriesRef& b);
    bool operator==(const NumberLiteral& a, const NumberLiteral& b);
    bool operator==(const PercentageLiteral& a, const PercentageLiteral& b);
    bool operator==(const IndicatorCall& a, const IndicatorCall& b);
    bool operator==(const TimeShift& a, const TimeShift& b);
    bool operator==(const ChangeCall& a, const ChangeCall& b);
    bool operator==(const CrossCall& a, const CrossCall& b);
    bool operator==(const Comparison& a, const Comparison& b);
    bool operator==(const BooleanExpr& a, const BooleanExpr& b);
    bool operator==(const Node& a, const Node& b);
    bool operator!=(const Node& a, const Node& b);
    bool operator==(const Strategy& a, const Strategy& b);
    bool operator!=(const Strategy& a, const Strategy& b);

    // --- Factory helpers ---
    NodePtr makeNode(NodeVariant value, SourcePosition position = {});
    NodePtr series(PriceField field, SourcePosition position = {});
    NodePtr number(double value, SourcePosition position = {});
    NodePtr percentage(double value, SourcePosition position = {});
    NodePtr indicator(IndicatorKind kind, NodePtr input, std::optional<int> period = std::nullopt,
                      SourcePosition position = {});
    NodePtr yesterday(NodePtr input, SourcePosition position = {});
    NodePtr lastWeek(NodePtr input, SourcePosition position = {});
    NodePtr nDaysAgo(NodePtr input, int lag, SourcePosition position = {});
    NodePtr change(ChangeKind kind, NodePtr input, int lag, SourcePosition position = {});
    NodePtr cross(CrossType type, NodePtr left, NodePtr right, SourcePosition position = {});
    NodePtr compare(ComparisonOp op, NodePtr left, NodePtr right, SourcePosition position = {});
    NodePtr combine(BoolOp op, NodePtr left, NodePtr right, SourcePosition position = {});

    // Numeric nodes produce value series, logical nodes produce rule series.
    bool isNumeric(const Node& node);
    bool isLogical(const Node& node);

    // Canonical DSL text. Crosses print in function-call form, periods only
    // when present, and a boolean expression on the right of a chain is
    // parenthesized.
    std::string toDsl(const Node& node);
    std::string toDsl(const Strategy& strategy);

    // Formats a literal the way toDsl prints it ("20", "0.5", "-3.25").
    std::string formatNumber(double value);

} // namespace ast
} // namespace strategy_engine
