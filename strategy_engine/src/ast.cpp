#include "ast.hpp"
#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <utility>

namespace strategy_engine {
namespace ast {

    namespace {

        template <class... Ts>
        struct overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        std::string toDslOperand(const NodePtr& node) {
            return node ? toDsl(*node) : std::string("<missing>");
        }

        // Right-hand boolean operands get parentheses so the left fold re-parses
        // into the same shape.
        std::string toDslRightOperand(const NodePtr& node) {
            if (node && std::holds_alternative<BooleanExpr>(node->value)) {
                return "(" + toDsl(*node) + ")";
            }
            return toDslOperand(node);
        }

    } // namespace

bool sameTree(const NodePtr& a, const NodePtr& b) {
    if (!a || !b) {
        return !a && !b;
    }
    return *a == *b;
}

bool operator==(const SeriesRef& a, const SeriesRef& b) { return a.field == b.field; }
bool operator==(const NumberLiteral& a, const NumberLiteral& b) { return a.value == b.value; }
bool operator==(const PercentageLiteral& a, const PercentageLiteral& b) { return a.value == b.value; }

bool operator==(const IndicatorCall& a, const IndicatorCall& b) {
    return a.kind == b.kind && a.period == b.period && sameTree(a.input, b.input);
}

bool operator==(const TimeShift& a, const TimeShift& b) {
    return a.kind == b.kind && a.lag == b.lag && sameTree(a.input, b.input);
}

bool operator==(const ChangeCall& a, const ChangeCall& b) {
    return a.kind == b.kind && a.lag == b.lag && sameTree(a.input, b.input);
}

bool operator==(const CrossCall& a, const CrossCall& b) {
    return a.type == b.type && sameTree(a.left, b.left) && sameTree(a.right, b.right);
}

bool operator==(const Comparison& a, const Comparison& b) {
    return a.op == b.op && sameTree(a.left, b.left) && sameTree(a.right, b.right);
}

bool operator==(const BooleanExpr& a, const BooleanExpr& b) {
    return a.op == b.op && sameTree(a.left, b.left) && sameTree(a.right, b.right);
}

bool operator==(const Node& a, const Node& b) { return a.value == b.value; }
bool operator!=(const Node& a, const Node& b) { return !(a == b); }

bool operator==(const Strategy& a, const Strategy& b) {
    return sameTree(a.entry, b.entry) && sameTree(a.exit, b.exit);
}
bool operator!=(const Strategy& a, const Strategy& b) { return !(a == b); }

NodePtr makeNode(NodeVariant value, SourcePosition position) {
    return std::make_shared<const Node>(Node{std::move(value), position});
}

NodePtr series(PriceField field, SourcePosition position) {
    return makeNode(SeriesRef{field}, position);
}

NodePtr number(double value, SourcePosition position) {
    return makeNode(NumberLiteral{value}, position);
}

NodePtr percentage(double value, SourcePosition position) {
    return makeNode(PercentageLiteral{value}, position);
}

NodePtr indicator(IndicatorKind kind, NodePtr input, std::optional<int> period, SourcePosition position) {
    return makeNode(IndicatorCall{kind, std::move(input), period}, position);
}

NodePtr yesterday(NodePtr input, SourcePosition position) {
    return makeNode(TimeShift{TimeFunctionKind::Yesterday, std::move(input), 1}, position);
}

NodePtr lastWeek(NodePtr input, SourcePosition position) {
    return makeNode(TimeShift{TimeFunctionKind::LastWeek, std::move(input), 7}, position);
}

NodePtr nDaysAgo(NodePtr input, int lag, SourcePosition position) {
    return makeNode(TimeShift{TimeFunctionKind::NDaysAgo, std::move(input), lag}, position);
}

NodePtr change(ChangeKind kind, NodePtr input, int lag, SourcePosition position) {
    return makeNode(ChangeCall{kind, std::move(input), lag}, position);
}

NodePtr cross(CrossType type, NodePtr left, NodePtr right, SourcePosition position) {
    return makeNode(CrossCall{type, std::move(left), std::move(right)}, position);
}

NodePtr compare(ComparisonOp op, NodePtr left, NodePtr right, SourcePosition position) {
    return makeNode(Comparison{op, std::move(left), std::move(right)}, position);
}

NodePtr combine(BoolOp op, NodePtr left, NodePtr right, SourcePosition position) {
    return makeNode(BooleanExpr{op, std::move(left), std::move(right)}, position);
}

bool isLogical(const Node& node) {
    return std::holds_alternative<CrossCall>(node.value) ||
           std::holds_alternative<Comparison>(node.value) ||
           std::holds_alternative<BooleanExpr>(node.value);
}

bool isNumeric(const Node& node) {
    return !isLogical(node);
}

std::string formatNumber(double value) {
    if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e15) {
        return fmt::format("{}", static_cast<long long>(value));
    }
    std::string text = fmt::format("{}", value);
    if (text.find('e') == std::string::npos) {
        return text;
    }
    // The DSL has no exponent notation: move the decimal point of the
    // shortest representation instead of printing more digits.
    std::size_t e_pos = text.find('e');
    int exponent = std::stoi(text.substr(e_pos + 1));
    std::string mantissa = text.substr(0, e_pos);
    std::string sign;
    if (mantissa[0] == '-') {
        sign = "-";
        mantissa.erase(0, 1);
    }
    std::size_t dot = mantissa.find('.');
    int int_digits = static_cast<int>(dot == std::string::npos ? mantissa.size() : dot);
    if (dot != std::string::npos) {
        mantissa.erase(dot, 1);
    }
    int point = int_digits + exponent;
    if (point <= 0) {
        return sign + "0." + std::string(static_cast<std::size_t>(-point), '0') + mantissa;
    }
    if (point >= static_cast<int>(mantissa.size())) {
        return sign + mantissa + std::string(static_cast<std::size_t>(point) - mantissa.size(), '0');
    }
    return sign + mantissa.substr(0, static_cast<std::size_t>(point)) + "." +
           mantissa.substr(static_cast<std::size_t>(point));
}

std::string toDsl(const Node& node) {
    return std::visit(overloaded{
        [](const SeriesRef& n) { return toString(n.field); },
        [](const NumberLiteral& n) { return formatNumber(n.value); },
        [](const PercentageLiteral& n) { return formatNumber(n.value) + "%"; },
        [](const IndicatorCall& n) {
            std::string text = toString(n.kind) + "(" + toDslOperand(n.input);
            if (n.period) {
                text += ", " + std::to_string(*n.period);
            }
            return text + ")";
        },
        [](const TimeShift& n) {
            if (n.kind == TimeFunctionKind::NDaysAgo) {
                return fmt::format("n_days_ago({}, {})", toDslOperand(n.input), n.lag);
            }
            return toString(n.kind) + "(" + toDslOperand(n.input) + ")";
        },
        [](const ChangeCall& n) {
            return fmt::format("{}({}, {})", toString(n.kind), toDslOperand(n.input), n.lag);
        },
        [](const CrossCall& n) {
            return fmt::format("{}({}, {})", toString(n.type), toDslOperand(n.left), toDslOperand(n.right));
        },
        [](const Comparison& n) {
            return fmt::format("{} {} {}", toDslOperand(n.left), toString(n.op), toDslOperand(n.right));
        },
        [](const BooleanExpr& n) {
            return fmt::format("{} {} {}", toDslOperand(n.left), toString(n.op), toDslRightOperand(n.right));
        }
    }, node.value);
}

std::string toDsl(const Strategy& strategy) {
    std::string text;
    if (strategy.entry) {
        text += "ENTRY:\n" + toDsl(*strategy.entry) + "\n";
    }
    if (strategy.exit) {
        if (!text.empty()) {
            text += "\n";
        }
        text += "EXIT:\n" + toDsl(*strategy.exit) + "\n";
    }
    return text;
}

} // namespace ast
} // namespace strategy_engine
