#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class StrategyDslException : public std::runtime_error {
    public:
        explicit StrategyDslException(const std::string& message)
            : std::runtime_error(message) {}

        explicit StrategyDslException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public StrategyDslException {
    public: using StrategyDslException::StrategyDslException; };

    class DataLoadException : public StrategyDslException {
    public: using StrategyDslException::StrategyDslException; };

    class IndicatorCalculationException : public StrategyDslException {
    public: using StrategyDslException::StrategyDslException; };

    class CompileError : public StrategyDslException {
    public: using StrategyDslException::StrategyDslException; };

    class BacktestException : public StrategyDslException {
    public: using StrategyDslException::StrategyDslException; };

    // Raised by the DSL lexer/parser. Always carries the 1-based source position
    // of the offending token.
    class SyntaxError : public StrategyDslException {
    public:
        SyntaxError(int line, int column, const std::string& message)
            : StrategyDslException("line " + std::to_string(line) + ", column " +
                                   std::to_string(column) + ": " + message),
              line_(line), column_(column), message_(message) {}

        int line() const { return line_; }
        int column() const { return column_; }
        // Message without the position prefix
        const std::string& message() const { return message_; }

    private:
        int line_;
        int column_;
        std::string message_;
    };

} // namespace core
