#include "dsl_generator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

#include <limits>
#include <vector>

namespace strategy_engine {

    using json = nlohmann::json; // Alias

    namespace {

        [[noreturn]] void reject(const std::string& message, const json& fragment) {
            throw core::ConfigException(fmt::format("Invalid rule document: {} (at {})", message, fragment.dump()));
        }

        BoolOp connectorFrom(const json& group) {
            if (!group.contains("connector")) {
                return BoolOp::And;
            }
            const json& connector = group["connector"];
            if (connector.is_string()) {
                const std::string text = connector.get<std::string>();
                if (text == "AND" || text == "and") return BoolOp::And;
                if (text == "OR" || text == "or") return BoolOp::Or;
            }
            reject("'connector' must be \"AND\" or \"OR\"", group);
        }

        int positiveInt(const json& object, const std::string& key) {
            if (!object.contains(key)) {
                reject(fmt::format("missing '{}'", key), object);
            }
            const json& value = object[key];
            if (!value.is_number_integer() || value.get<long long>() <= 0 ||
                value.get<long long>() > std::numeric_limits<int>::max()) {
                reject(fmt::format("'{}' must be a positive integer", key), object);
            }
            return value.get<int>();
        }

        ast::NodePtr seriesOperand(const json& object, const std::string& function) {
            if (!object.contains("series") || !object["series"].is_string()) {
                reject(fmt::format("'{}' needs a \"series\" name", function), object);
            }
            const std::string name = object["series"].get<std::string>();
            auto field = priceFieldFromString(name);
            if (!field) {
                reject(fmt::format("unknown series '{}'", name), object);
            }
            return ast::series(*field);
        }

        ast::NodePtr buildOperand(const json& operand);

        ast::NodePtr buildIndicator(const json& operand) {
            const json& name_json = operand["indicator"];
            if (!name_json.is_string()) {
                reject("'indicator' must be a string", operand);
            }
            auto kind = indicatorFromString(name_json.get<std::string>());
            if (!kind) {
                reject(fmt::format("unknown indicator '{}'", name_json.get<std::string>()), operand);
            }
            if (!operand.contains("series")) {
                reject("indicator needs a \"series\" operand", operand);
            }
            ast::NodePtr input = buildOperand(operand["series"]);
            std::optional<int> period;
            if (operand.contains("period") && !operand["period"].is_null()) {
                period = positiveInt(operand, "period");
            }
            return ast::indicator(*kind, input, period);
        }

        ast::NodePtr buildFunction(const json& operand) {
            const json& name_json = operand["function"];
            if (!name_json.is_string()) {
                reject("'function' must be a string", operand);
            }
            const std::string name = name_json.get<std::string>();
            if (name == "yesterday") return ast::yesterday(seriesOperand(operand, name));
            if (name == "last_week") return ast::lastWeek(seriesOperand(operand, name));
            if (name == "n_days_ago") return ast::nDaysAgo(seriesOperand(operand, name), positiveInt(operand, "n"));
            if (name == "change") {
                return ast::change(ChangeKind::Absolute, seriesOperand(operand, name), positiveInt(operand, "n"));
            }
            if (name == "percent_change") {
                return ast::change(ChangeKind::Percent, seriesOperand(operand, name), positiveInt(operand, "n"));
            }
            reject(fmt::format("unknown function '{}'", name), operand);
        }

        ast::NodePtr buildOperand(const json& operand) {
            if (operand.is_number()) {
                return ast::number(operand.get<double>());
            }
            if (operand.is_string()) {
                const std::string name = operand.get<std::string>();
                auto field = priceFieldFromString(name);
                if (!field) {
                    reject(fmt::format("unknown series '{}'", name), operand);
                }
                return ast::series(*field);
            }
            if (operand.is_object()) {
                if (operand.contains("indicator")) return buildIndicator(operand);
                if (operand.contains("function")) return buildFunction(operand);
                if (operand.contains("percent")) {
                    if (!operand["percent"].is_number()) {
                        reject("'percent' must be a number", operand);
                    }
                    return ast::percentage(operand["percent"].get<double>());
                }
            }
            reject("operand must be a number, a series name, or an indicator/function/percent object", operand);
        }

        ast::NodePtr buildCondition(const json& condition);

        ast::NodePtr buildConditionList(const json& conditions, BoolOp op, const json& context) {
            if (!conditions.is_array() || conditions.empty()) {
                reject("'conditions' must be a non-empty list", context);
            }
            ast::NodePtr folded;
            for (const auto& condition : conditions) {
                ast::NodePtr node = buildCondition(condition);
                folded = folded ? ast::combine(op, folded, node) : node;
            }
            return folded;
        }

        ast::NodePtr buildCondition(const json& condition) {
            if (!condition.is_object()) {
                reject("condition must be an object", condition);
            }
            if (condition.contains("conditions") || condition.contains("connector")) {
                if (!condition.contains("conditions")) {
                    reject("group needs 'conditions'", condition);
                }
                return buildConditionList(condition["conditions"], connectorFrom(condition), condition);
            }
            if (!condition.contains("left") || !condition.contains("operator") || !condition.contains("right")) {
                reject("condition needs 'left', 'operator' and 'right'", condition);
            }
            if (!condition["operator"].is_string()) {
                reject("'operator' must be a string", condition);
            }
            const std::string op = condition["operator"].get<std::string>();
            ast::NodePtr left = buildOperand(condition["left"]);
            ast::NodePtr right = buildOperand(condition["right"]);

            if (op == "crosses_above") return ast::cross(CrossType::CrossesAbove, left, right);
            if (op == "crosses_below") return ast::cross(CrossType::CrossesBelow, left, right);
            auto comparison = comparisonFromString(op);
            if (!comparison) {
                reject(fmt::format("unknown operator '{}'", op), condition);
            }
            return ast::compare(*comparison, left, right);
        }

        ast::NodePtr buildSection(const json& section) {
            if (section.is_array()) {
                return buildConditionList(section, BoolOp::And, section);
            }
            if (section.is_object()) {
                return buildCondition(section);
            }
            reject("section must be a list of conditions or a group object", section);
        }

    } // namespace

ast::Strategy DslGenerator::buildStrategy(const json& rules) {
    if (!rules.is_object()) {
        throw core::ConfigException("Invalid rule document: top level must be an object");
    }

    ast::Strategy strategy;
    if (rules.contains("entry") && !rules["entry"].is_null()) {
        strategy.entry = buildSection(rules["entry"]);
    }
    if (rules.contains("exit") && !rules["exit"].is_null()) {
        strategy.exit = buildSection(rules["exit"]);
    }
    if (!strategy.entry && !strategy.exit) {
        throw core::ConfigException("Invalid rule document: needs an 'entry' or 'exit' section");
    }
    return strategy;
}

std::string DslGenerator::generate(const json& rules) {
    std::string dsl = ast::toDsl(buildStrategy(rules));
    core::logging::getLogger()->debug("Generated DSL from rule document:\n{}", dsl);
    return dsl;
}

} // namespace strategy_engine
