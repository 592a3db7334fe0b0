#pragma once

#include "ast.hpp"
#include <string>

namespace strategy_engine {

    // Recursive-descent parser for the strategy DSL:
    //
    //   strategy  := ("ENTRY" ":" rule_list)? ("EXIT" ":" rule_list)?
    //   rule_list := rule (("AND"|"OR") rule)*
    //   rule      := comparison | cross_call | "(" rule_list ")"
    //
    // AND/OR share one precedence level and fold left to right.
    class Parser {
    public:
        // Throws core::SyntaxError with the position of the offending token.
        // Nothing is returned on failure.
        ast::Strategy parse(const std::string& text) const;

        // True when parse() would succeed; the failure is logged at debug level.
        bool validate(const std::string& text) const;
    };

} // namespace strategy_engine
