#include "lexer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>   // For std::isdigit, std::isalpha
#include <cstdlib>  // For std::strtod
#include <utility>

namespace strategy_engine {

    namespace {

        bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
        bool isWordStart(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; }
        bool isWordChar(char c) { return isWordStart(c) || isDigit(c); }

        std::string toUpper(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }

        bool isKeyword(const std::string& upper) {
            return upper == "ENTRY" || upper == "EXIT" || upper == "AND" || upper == "OR";
        }

    } // namespace

Lexer::Lexer(std::string source) : source_(std::move(source)) {}

char Lexer::peek(std::size_t ahead) const {
    std::size_t idx = pos_ + ahead;
    return idx < source_.size() ? source_[idx] : '\0';
}

char Lexer::advance() {
    char c = source_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

bool Lexer::atEnd() const {
    return pos_ >= source_.size();
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        while (!atEnd() && std::isspace(static_cast<unsigned char>(peek())) != 0) {
            advance();
        }
        if (atEnd()) {
            break;
        }

        char c = peek();
        bool signed_number = (c == '+' || c == '-') &&
                             (isDigit(peek(1)) || (peek(1) == '.' && isDigit(peek(2))));
        if (isDigit(c) || (c == '.' && isDigit(peek(1))) || signed_number) {
            tokens.push_back(lexNumber());
        } else if (isWordStart(c)) {
            tokens.push_back(lexWord());
        } else {
            tokens.push_back(lexSymbol());
        }
    }

    Token end;
    end.kind = TokenKind::End;
    end.line = line_;
    end.column = column_;
    tokens.push_back(end);

    core::logging::getLogger()->trace("Lexer produced {} tokens", tokens.size());
    return tokens;
}

Token Lexer::lexNumber() {
    Token token;
    token.kind = TokenKind::Number;
    token.line = line_;
    token.column = column_;

    std::string spelling; // As written, separators included
    std::string digits;   // Separators stripped, fed to strtod

    if (peek() == '+' || peek() == '-') {
        char sign = advance();
        spelling += sign;
        digits += sign;
    }

    std::size_t leading_digits = 0;
    while (isDigit(peek())) {
        char d = advance();
        spelling += d;
        digits += d;
        ++leading_digits;
    }

    // Thousands separators: ",ddd" not followed by another digit, only after a
    // leading group of one to three digits.
    if (leading_digits > 0 && leading_digits <= 3) {
        while (peek() == ',' && isDigit(peek(1)) && isDigit(peek(2)) && isDigit(peek(3)) &&
               !isDigit(peek(4))) {
            spelling += advance(); // ','
            for (int i = 0; i < 3; ++i) {
                char d = advance();
                spelling += d;
                digits += d;
            }
        }
    }

    if (peek() == '.' && isDigit(peek(1))) {
        spelling += advance();
        digits += '.';
        while (isDigit(peek())) {
            char d = advance();
            spelling += d;
            digits += d;
        }
    }

    token.value = std::strtod(digits.c_str(), nullptr);

    if (peek() == '%') {
        spelling += advance();
        token.kind = TokenKind::Percentage;
    }

    if (isWordStart(peek())) {
        throw core::SyntaxError(line_, column_,
            fmt::format("unexpected character '{}' after number '{}'", peek(), spelling));
    }

    token.text = spelling;
    return token;
}

Token Lexer::lexWord() {
    Token token;
    token.line = line_;
    token.column = column_;

    std::string word;
    while (isWordChar(peek())) {
        word += advance();
    }

    std::string upper = toUpper(word);
    if (isKeyword(upper)) {
        token.kind = TokenKind::Keyword;
        token.text = upper;
    } else {
        token.kind = TokenKind::Identifier;
        token.text = word;
    }
    return token;
}

Token Lexer::lexSymbol() {
    Token token;
    token.line = line_;
    token.column = column_;

    char c = advance();
    switch (c) {
        case '(':
        case ')':
        case ',':
        case ':':
            token.kind = TokenKind::Punctuation;
            token.text = std::string(1, c);
            return token;
        case '>':
        case '<':
            token.kind = TokenKind::Operator;
            token.text = std::string(1, c);
            if (peek() == '=') {
                token.text += advance();
            }
            return token;
        case '=':
        case '!':
            if (peek() == '=') {
                advance();
                token.kind = TokenKind::Operator;
                token.text = std::string(1, c) + "=";
                return token;
            }
            throw core::SyntaxError(token.line, token.column,
                fmt::format("unexpected character '{}' (did you mean '{}='?)", c, c));
        default:
            throw core::SyntaxError(token.line, token.column,
                fmt::format("unexpected character '{}'", c));
    }
}

std::string toString(TokenKind kind) {
    switch (kind) {
        case TokenKind::Keyword:     return "keyword";
        case TokenKind::Identifier:  return "identifier";
        case TokenKind::Operator:    return "operator";
        case TokenKind::Number:      return "number";
        case TokenKind::Percentage:  return "percentage";
        case TokenKind::Punctuation: return "punctuation";
        case TokenKind::End:         return "end of input";
    }
    return "unknown";
}

} // namespace strategy_engine
