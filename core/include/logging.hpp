#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Logging section of the engine configuration file
    struct LogSettings {
        std::string base_log_filename = "strategy_dsl";
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::debug;

        // Reads {"console_level", "file_level", "file"}; missing keys keep defaults.
        static LogSettings fromJson(const nlohmann::json& section);
    };

    // Call this once at the beginning of your application (e.g., in main())
    void initialize(const std::string& base_log_filename = "strategy_dsl",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    void initialize(const LogSettings& settings);

    // Get the globally configured logger. Library code may run before
    // initialize() (unit tests, embedding); a stderr logger at warn level is
    // created on first use in that case.
    std::shared_ptr<spdlog::logger>& getLogger();

    // Helper function to set log level from string (useful for env vars/args)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
