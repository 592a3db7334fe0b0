// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>      // Needed for std::string path
#include <map>         // Option table
#include <exception>   // Needed for std::exception
#include <fstream>     // For std::ifstream / std::ofstream
#include <sstream>     // For reading whole files
#include <memory>      // For std::shared_ptr

// Project includes
#include "logging.hpp"        // For logging functionality
#include "exceptions.hpp"     // For custom exception types
#include "config.hpp"         // For the engine configuration file
#include "datatypes.hpp"      // For core::PriceTable
#include "utils.hpp"          // For timestampToString/stringToTimestamp helpers
#include "database_manager.hpp"
#include "sample_data_generator.hpp"
#include "parser.hpp"
#include "compiler.hpp"
#include "dsl_generator.hpp"
#include "backtester.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>  // For json parsing

namespace {

    using json = nlohmann::json; // Alias for convenience

    const char* kUsage =
        "Usage: strategy_dsl_cli <command> [options]\n"
        "\n"
        "Commands:\n"
        "  run              --db <path> --instrument <key> (--dsl <file> | --rules <json>)\n"
        "                   [--interval day] [--from YYYY-MM-DD] [--to YYYY-MM-DD]\n"
        "                   [--config <json>] [--report <json out>]\n"
        "  generate-sample  --db <path> --instrument <key> [--interval day]\n"
        "                   [--from YYYY-MM-DD] [--to YYYY-MM-DD] [--seed N] [--price P]\n"
        "                   [--config <json>]\n"
        "  dsl              --rules <json> [--config <json>]\n"
        "  check            --dsl <file> [--config <json>]\n";

    // "--key value" pairs following the command name
    class CommandLine {
    public:
        CommandLine(int argc, char* argv[]) {
            if (argc < 2) {
                throw core::ConfigException("No command given.");
            }
            command_ = argv[1];
            for (int i = 2; i < argc; ++i) {
                std::string key = argv[i];
                if (key.size() < 3 || key.compare(0, 2, "--") != 0) {
                    throw core::ConfigException(fmt::format("Unexpected argument '{}'", key));
                }
                if (i + 1 >= argc) {
                    throw core::ConfigException(fmt::format("Option '{}' needs a value", key));
                }
                options_[key.substr(2)] = argv[++i];
            }
        }

        const std::string& command() const { return command_; }

        bool has(const std::string& key) const { return options_.count(key) > 0; }

        std::string get(const std::string& key, const std::string& fallback) const {
            auto it = options_.find(key);
            return it != options_.end() ? it->second : fallback;
        }

        std::string require(const std::string& key) const {
            auto it = options_.find(key);
            if (it == options_.end()) {
                throw core::ConfigException(fmt::format("'{}' needs --{}", command_, key));
            }
            return it->second;
        }

    private:
        std::string command_;
        std::map<std::string, std::string> options_;
    };

    std::string readTextFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::DataLoadException(fmt::format("Failed to open file: {}", path));
        }
        std::ostringstream buffer;
        buffer << ifs.rdbuf();
        return buffer.str();
    }

    // DSL text from --dsl, or generated from the structured rules in --rules
    std::string loadStrategyText(const CommandLine& cli) {
        auto logger = core::logging::getLogger();
        if (cli.has("dsl")) {
            std::string path = cli.require("dsl");
            logger->info("Loading strategy DSL from: {}", path);
            return readTextFile(path);
        }
        if (cli.has("rules")) {
            std::string path = cli.require("rules");
            logger->info("Generating strategy DSL from rule document: {}", path);
            return strategy_engine::DslGenerator::generate(core::config::loadJsonFile(path));
        }
        throw core::ConfigException(fmt::format("'{}' needs --dsl or --rules", cli.command()));
    }

    int runBacktest(const CommandLine& cli, const json& config) {
        auto logger = core::logging::getLogger();

        // 1. Strategy
        std::string text = loadStrategyText(cli);
        strategy_engine::Parser parser;
        auto strategy = std::make_shared<const strategy_engine::ast::Strategy>(parser.parse(text));
        logger->info("Strategy:\n{}", strategy_engine::ast::toDsl(*strategy));

        auto defaults = strategy_engine::IndicatorDefaults::fromJson(core::config::section(config, "indicators"));
        strategy_engine::Compiler compiler(defaults);
        strategy_engine::Evaluator evaluator = compiler.compile(strategy);

        // 2. Data
        std::string db_path = cli.require("db");
        std::string instrument = cli.require("instrument");
        std::string interval = cli.get("interval", "day");
        core::Timestamp start_ts = core::utils::stringToTimestamp(cli.get("from", "1900-01-01"));
        core::Timestamp end_ts = core::utils::stringToTimestamp(cli.get("to", "2100-12-31") + "T23:59:59Z");

        data::DatabaseManager db_manager(db_path);
        if (!db_manager.connect()) {
            throw core::DataLoadException(fmt::format("Cannot open database '{}'", db_path));
        }
        core::PriceTable table = db_manager.queryCandles(instrument, interval, start_ts, end_ts);
        db_manager.disconnect();
        if (table.empty()) {
            throw core::DataLoadException(fmt::format(
                "No candles for {} ({}) in the requested range", instrument, interval));
        }
        logger->info("Loaded {} candles for {} ({}).", table.size(), instrument, interval);

        // 3. Simulate
        auto settings = backtester::BacktestSettings::fromJson(core::config::section(config, "backtest"));
        backtester::Backtester the_backtester(settings);
        backtester::BacktestResult result = the_backtester.run(table, evaluator);

        json report = backtester::toJson(result);
        std::cout << report.dump(2) << std::endl;

        if (cli.has("report")) {
            std::string report_path = cli.require("report");
            std::ofstream ofs(report_path);
            if (!ofs.is_open()) {
                throw core::ConfigException(fmt::format("Failed to open report file for writing: {}", report_path));
            }
            ofs << report.dump(2) << std::endl;
            logger->info("Report written to {}", report_path);
        }
        return 0;
    }

    int generateSample(const CommandLine& cli) {
        auto logger = core::logging::getLogger();

        data::SampleDataOptions options;
        options.start_date = cli.get("from", options.start_date);
        options.end_date = cli.get("to", options.end_date);
        try {
            options.seed = static_cast<unsigned int>(std::stoul(cli.get("seed", std::to_string(options.seed))));
            options.initial_price = std::stod(cli.get("price", std::to_string(options.initial_price)));
        } catch (const std::logic_error& e) { // invalid_argument / out_of_range
            throw core::ConfigException(fmt::format("Invalid --seed or --price value: {}", e.what()));
        }

        core::PriceTable table = data::SampleDataGenerator(options).generate();

        std::string db_path = cli.require("db");
        std::string instrument = cli.require("instrument");
        std::string interval = cli.get("interval", "day");

        data::DatabaseManager db_manager(db_path);
        if (!db_manager.connect() || !db_manager.initializeSchema()) {
            logger->error("Database '{}' is not usable.", db_path);
            return 1;
        }
        bool saved = db_manager.saveCandles(table, instrument, interval);
        db_manager.disconnect();
        if (!saved) {
            logger->error("Failed to save sample candles.");
            return 1;
        }
        std::cout << fmt::format("Saved {} candles for {} ({}) to {}", table.size(), instrument, interval, db_path)
                  << std::endl;
        return 0;
    }

    int printGeneratedDsl(const CommandLine& cli) {
        json rules = core::config::loadJsonFile(cli.require("rules"));
        std::cout << strategy_engine::DslGenerator::generate(rules);
        return 0;
    }

    int checkDsl(const CommandLine& cli) {
        std::string text = readTextFile(cli.require("dsl"));
        strategy_engine::Parser parser;
        std::cout << strategy_engine::ast::toDsl(parser.parse(text));
        return 0;
    }

} // namespace

int main(int argc, char* argv[]) {
    // Define logger pointer early in the main scope
    std::shared_ptr<spdlog::logger> logger = nullptr;

    // Main try block for exception handling
    try {
        CommandLine cli(argc, argv);

        // --- Configuration ---
        json config;
        if (cli.has("config")) {
            config = core::config::loadJsonFile(cli.require("config"));
        }

        // --- Initialize Logging ---
        core::logging::initialize(core::logging::LogSettings::fromJson(core::config::section(config, "logging")));
        logger = core::logging::getLogger(); // Assign the initialized logger
        logger->info("Strategy DSL CLI starting: {}", cli.command());

        int status = 1;
        if (cli.command() == "run") {
            status = runBacktest(cli, config);
        } else if (cli.command() == "generate-sample") {
            status = generateSample(cli);
        } else if (cli.command() == "dsl") {
            status = printGeneratedDsl(cli);
        } else if (cli.command() == "check") {
            status = checkDsl(cli);
        } else {
            std::cerr << "Unknown command '" << cli.command() << "'\n\n" << kUsage;
            return 1;
        }

        logger->info("Strategy DSL CLI finished with status {}.", status);
        return status;

    // --- Exception Handling ---
    } catch (const core::SyntaxError& ex) {
        std::cerr << "Syntax Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Syntax Error: {}", ex.what());
        return 1;
    } catch (const core::ConfigException& ex) {
        std::cerr << "Configuration Error: " << ex.what() << "\n\n" << kUsage;
        if (logger) logger->critical("Configuration Error: {}", ex.what());
        return 1;
    } catch (const core::StrategyDslException& ex) {
        std::cerr << "Strategy DSL Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Strategy DSL Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }
}
