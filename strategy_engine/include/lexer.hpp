#pragma once

#include <string>
#include <vector>

namespace strategy_engine {

    enum class TokenKind {
        Keyword,      // ENTRY, EXIT, AND, OR (text normalized to upper case)
        Identifier,   // series, indicator and function names
        Operator,     // > < >= <= == !=
        Number,
        Percentage,   // number followed by '%'
        Punctuation,  // ( ) , :
        End
    };

    struct Token {
        TokenKind kind = TokenKind::End;
        std::string text;   // Source spelling (keywords upper-cased)
        double value = 0.0; // Numeric value for Number/Percentage tokens
        int line = 1;       // 1-based
        int column = 1;     // 1-based

        bool is(TokenKind k, const std::string& t) const { return kind == k && text == t; }
    };

    // Splits DSL text into tokens. The returned vector always ends with an End
    // token. Throws core::SyntaxError on characters outside the DSL alphabet.
    class Lexer {
    public:
        explicit Lexer(std::string source);

        std::vector<Token> tokenize();

    private:
        char peek(std::size_t ahead = 0) const;
        char advance();
        bool atEnd() const;

        Token lexNumber();
        Token lexWord();
        Token lexSymbol();

        std::string source_;
        std::size_t pos_ = 0;
        int line_ = 1;
        int column_ = 1;
    };

    std::string toString(TokenKind kind);

} // namespace strategy_engine
