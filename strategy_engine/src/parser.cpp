#include "parser.hpp"
#include "lexer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

#include <climits> // For INT_MAX
#include <utility>
#include <cmath>   // For std::floor
#include <vector>

namespace strategy_engine {

    namespace {

        bool isCrossName(const std::string& name) {
            return name == "crosses_above" || name == "crosses_below";
        }

        CrossType crossFromName(const std::string& name) {
            return name == "crosses_above" ? CrossType::CrossesAbove : CrossType::CrossesBelow;
        }

        ast::SourcePosition positionOf(const Token& token) {
            return ast::SourcePosition{token.line, token.column};
        }

        std::string describe(const Token& token) {
            if (token.kind == TokenKind::End) {
                return "end of input";
            }
            return fmt::format("'{}'", token.text);
        }

        // One parse over a token vector. Holds the cursor; discarded afterwards.
        class ParseState {
        public:
            explicit ParseState(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

            ast::Strategy parseStrategy() {
                ast::Strategy strategy;

                if (peek().kind == TokenKind::End) {
                    fail(peek(), "empty strategy: expected 'ENTRY:' or 'EXIT:'");
                }

                if (peek().is(TokenKind::Keyword, "ENTRY")) {
                    advance();
                    expectPunctuation(":", "after 'ENTRY'");
                    strategy.entry = parseRuleList();
                }

                if (peek().is(TokenKind::Keyword, "EXIT")) {
                    advance();
                    expectPunctuation(":", "after 'EXIT'");
                    strategy.exit = parseRuleList();
                }

                const Token& trailing = peek();
                if (trailing.kind != TokenKind::End) {
                    if (trailing.is(TokenKind::Keyword, "ENTRY") || trailing.is(TokenKind::Keyword, "EXIT")) {
                        fail(trailing, fmt::format(
                            "unexpected '{}': each section may appear once, ENTRY before EXIT", trailing.text));
                    }
                    if (!strategy.entry && !strategy.exit) {
                        fail(trailing, fmt::format("expected 'ENTRY:' or 'EXIT:' but found {}", describe(trailing)));
                    }
                    fail(trailing, fmt::format("unexpected {} after rule", describe(trailing)));
                }
                return strategy;
            }

        private:
            const Token& peek(std::size_t ahead = 0) const {
                std::size_t idx = pos_ + ahead;
                return idx < tokens_.size() ? tokens_[idx] : tokens_.back();
            }

            const Token& advance() {
                const Token& token = tokens_[pos_];
                if (pos_ + 1 < tokens_.size()) {
                    ++pos_;
                }
                return token;
            }

            [[noreturn]] void fail(const Token& token, const std::string& message) const {
                throw core::SyntaxError(token.line, token.column, message);
            }

            const Token& expectPunctuation(const std::string& symbol, const std::string& context) {
                const Token& token = peek();
                if (!token.is(TokenKind::Punctuation, symbol)) {
                    fail(token, fmt::format("expected '{}' {} but found {}", symbol, context, describe(token)));
                }
                return advance();
            }

            bool atComparisonOperator() const {
                return peek().kind == TokenKind::Operator;
            }

            bool atInfixCross() const {
                return peek().kind == TokenKind::Identifier && isCrossName(peek().text);
            }

            // Index of the ')' matching the '(' at `open`, or npos.
            std::size_t findMatchingParen(std::size_t open) const {
                int depth = 0;
                for (std::size_t i = open; i < tokens_.size(); ++i) {
                    const Token& token = tokens_[i];
                    if (token.is(TokenKind::Punctuation, "(")) {
                        ++depth;
                    } else if (token.is(TokenKind::Punctuation, ")")) {
                        if (--depth == 0) {
                            return i;
                        }
                    }
                }
                return std::string::npos;
            }

            ast::NodePtr parseRuleList() {
                ast::NodePtr left = parseRule();
                while (peek().is(TokenKind::Keyword, "AND") || peek().is(TokenKind::Keyword, "OR")) {
                    const Token& op_token = advance();
                    BoolOp op = op_token.text == "AND" ? BoolOp::And : BoolOp::Or;
                    ast::NodePtr right = parseRule();
                    left = ast::combine(op, left, right, positionOf(op_token));
                }
                return left;
            }

            ast::NodePtr parseRule() {
                const Token& first = peek();

                if (first.is(TokenKind::Punctuation, "(")) {
                    std::size_t close = findMatchingParen(pos_);
                    if (close == std::string::npos) {
                        fail(first, "unmatched '('");
                    }
                    const Token& after = close + 1 < tokens_.size() ? tokens_[close + 1] : tokens_.back();
                    bool opens_operand = after.kind == TokenKind::Operator ||
                                         (after.kind == TokenKind::Identifier && isCrossName(after.text));
                    if (!opens_operand) {
                        advance();
                        ast::NodePtr grouped = parseRuleList();
                        expectPunctuation(")", "to close grouped rules");
                        return grouped;
                    }
                    return parseComparison();
                }

                if (first.kind == TokenKind::Identifier && isCrossName(first.text) &&
                    peek(1).is(TokenKind::Punctuation, "(")) {
                    ast::NodePtr signal = parseCrossCall();
                    if (atComparisonOperator() || atInfixCross()) {
                        fail(peek(), fmt::format(
                            "{}(...) is a signal, not a value, and cannot be compared", first.text));
                    }
                    return signal;
                }

                return parseComparison();
            }

            ast::NodePtr parseComparison() {
                ast::NodePtr left = parseExpr();
                const Token& op_token = peek();

                if (op_token.kind == TokenKind::Operator) {
                    advance();
                    auto op = comparisonFromString(op_token.text);
                    if (!op) {
                        fail(op_token, fmt::format("unknown comparison operator '{}'", op_token.text));
                    }
                    ast::NodePtr right = parseExpr();
                    return ast::compare(*op, left, right, positionOf(op_token));
                }

                if (op_token.kind == TokenKind::Identifier && isCrossName(op_token.text)) {
                    advance();
                    ast::NodePtr right = parseExpr();
                    return ast::cross(crossFromName(op_token.text), left, right, positionOf(op_token));
                }

                fail(op_token, fmt::format(
                    "expected a comparison operator or crosses_above/crosses_below but found {}",
                    describe(op_token)));
            }

            ast::NodePtr parseExpr() {
                const Token& token = peek();
                switch (token.kind) {
                    case TokenKind::Number:
                        advance();
                        return ast::number(token.value, positionOf(token));
                    case TokenKind::Percentage:
                        advance();
                        return ast::percentage(token.value, positionOf(token));
                    case TokenKind::Punctuation:
                        if (token.text == "(") {
                            advance();
                            ast::NodePtr inner = parseExpr();
                            expectPunctuation(")", "to close expression");
                            return inner;
                        }
                        break;
                    case TokenKind::Identifier:
                        return parseNamedExpr();
                    case TokenKind::Keyword:
                        fail(token, fmt::format("unexpected keyword '{}', expected an expression", token.text));
                    case TokenKind::End:
                        fail(token, "unexpected end of input, expected an expression");
                    case TokenKind::Operator:
                        break;
                }
                fail(token, fmt::format("expected an expression but found {}", describe(token)));
            }

            ast::NodePtr parseNamedExpr() {
                const Token& name = peek();

                if (auto field = priceFieldFromString(name.text)) {
                    advance();
                    return ast::series(*field, positionOf(name));
                }
                if (auto kind = indicatorFromString(name.text)) {
                    return parseIndicator(*kind);
                }
                if (name.text == "yesterday" || name.text == "last_week" || name.text == "n_days_ago") {
                    return parseTimeFunction();
                }
                if (name.text == "change" || name.text == "percent_change") {
                    return parseChangeFunction();
                }
                if (isCrossName(name.text)) {
                    fail(name, fmt::format(
                        "{} is a signal, not a value, and cannot be used as a comparison operand", name.text));
                }
                fail(name, fmt::format("unknown series or function '{}'", name.text));
            }

            ast::NodePtr parseIndicator(IndicatorKind kind) {
                const Token& name = advance();
                expectPunctuation("(", fmt::format("after '{}'", name.text));
                ast::NodePtr input = parseExpr();
                std::optional<int> period;
                if (peek().is(TokenKind::Punctuation, ",")) {
                    advance();
                    period = parsePositiveInt(fmt::format("{} period", name.text));
                }
                expectPunctuation(")", fmt::format("to close '{}('", name.text));
                return ast::indicator(kind, input, period, positionOf(name));
            }

            ast::NodePtr parseTimeFunction() {
                const Token& name = advance();
                expectPunctuation("(", fmt::format("after '{}'", name.text));
                ast::NodePtr input = parseSeriesArgument(name.text);

                ast::NodePtr node;
                if (name.text == "n_days_ago") {
                    expectPunctuation(",", "between series and day count in 'n_days_ago'");
                    int lag = parsePositiveInt("n_days_ago day count");
                    node = ast::nDaysAgo(input, lag, positionOf(name));
                } else if (name.text == "yesterday") {
                    node = ast::yesterday(input, positionOf(name));
                } else {
                    node = ast::lastWeek(input, positionOf(name));
                }
                expectPunctuation(")", fmt::format("to close '{}('", name.text));
                return node;
            }

            ast::NodePtr parseChangeFunction() {
                const Token& name = advance();
                ChangeKind kind = name.text == "change" ? ChangeKind::Absolute : ChangeKind::Percent;
                expectPunctuation("(", fmt::format("after '{}'", name.text));
                ast::NodePtr input = parseSeriesArgument(name.text);
                expectPunctuation(",", fmt::format("between series and period in '{}'", name.text));
                int lag = parsePositiveInt(fmt::format("{} period", name.text));
                expectPunctuation(")", fmt::format("to close '{}('", name.text));
                return ast::change(kind, input, lag, positionOf(name));
            }

            ast::NodePtr parseCrossCall() {
                const Token& name = advance();
                expectPunctuation("(", fmt::format("after '{}'", name.text));
                ast::NodePtr left = parseExpr();
                expectPunctuation(",", fmt::format("between the arguments of '{}'", name.text));
                ast::NodePtr right = parseExpr();
                expectPunctuation(")", fmt::format("to close '{}('", name.text));
                return ast::cross(crossFromName(name.text), left, right, positionOf(name));
            }

            ast::NodePtr parseSeriesArgument(const std::string& function) {
                const Token& token = peek();
                if (token.kind == TokenKind::Identifier) {
                    if (auto field = priceFieldFromString(token.text)) {
                        advance();
                        return ast::series(*field, positionOf(token));
                    }
                }
                fail(token, fmt::format(
                    "{} expects a price series (open, high, low, close, volume) but found {}",
                    function, describe(token)));
            }

            int parsePositiveInt(const std::string& what) {
                const Token& token = peek();
                if (token.kind != TokenKind::Number) {
                    fail(token, fmt::format("{} must be a positive integer but found {}", what, describe(token)));
                }
                if (token.value <= 0.0 || token.value != std::floor(token.value) ||
                    token.value > static_cast<double>(INT_MAX)) {
                    fail(token, fmt::format("{} must be a positive integer but found {}", what, token.text));
                }
                advance();
                return static_cast<int>(token.value);
            }

            std::vector<Token> tokens_;
            std::size_t pos_ = 0;
        };

    } // namespace

ast::Strategy Parser::parse(const std::string& text) const {
    auto logger = core::logging::getLogger();
    Lexer lexer(text);
    ParseState state(lexer.tokenize());
    ast::Strategy strategy = state.parseStrategy();
    logger->debug("Parsed strategy (entry: {}, exit: {})",
                  strategy.entry ? "yes" : "no", strategy.exit ? "yes" : "no");
    return strategy;
}

bool Parser::validate(const std::string& text) const {
    try {
        parse(text);
        return true;
    } catch (const core::SyntaxError& e) {
        core::logging::getLogger()->debug("Strategy text rejected: {}", e.what());
        return false;
    }
}

} // namespace strategy_engine
