#pragma once

#include "ast.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace strategy_engine {

    // Converts a structured-rule document into DSL text:
    //
    //   { "entry": [ {"left": "close", "operator": ">", "right": {"indicator": "sma", "series": "close", "period": 20}} ],
    //     "exit":  { "connector": "OR", "conditions": [ ... ] } }
    //
    // A section is either a list of conditions (joined with AND) or a
    // {"connector", "conditions"} group; groups nest. The output always
    // re-parses to the tree built here.
    class DslGenerator {
    public:
        // Throws core::ConfigException for documents outside the schema
        // (unknown names, non-positive periods, empty sections, wrong types).
        static ast::Strategy buildStrategy(const nlohmann::json& rules);

        static std::string generate(const nlohmann::json& rules);
    };

} // namespace strategy_engine
