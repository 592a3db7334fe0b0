#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream> // For std::ifstream
#include <limits>  // For std::numeric_limits

namespace core {
namespace config {

    json loadJsonFile(const std::string& path) {
        auto logger = core::logging::getLogger();
        logger->debug("Loading JSON document from: {}", path);

        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open JSON file: {}", path));
        }
        try {
            json document = json::parse(ifs);
            logger->debug("JSON document '{}' loaded.", path);
            return document;
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Invalid JSON in '{}': {}", path, e.what()));
        }
    }

    const json& section(const json& document, const std::string& key) {
        static const json empty_section;
        if (document.is_null()) {
            return empty_section;
        }
        if (!document.is_object()) {
            throw ConfigException("Configuration document must be a JSON object.");
        }
        auto it = document.find(key);
        return it != document.end() ? *it : empty_section;
    }

    int readInt(const json& section, const std::string& key, int fallback, const std::string& context) {
        if (section.is_null() || !section.contains(key)) {
            return fallback;
        }
        const json& value = section[key];
        if (!value.is_number_integer()) {
            throw ConfigException(fmt::format("{}.{} must be an integer", context, key));
        }
        bool in_range = value.is_number_unsigned()
            ? value.get<unsigned long long>() <= static_cast<unsigned long long>(std::numeric_limits<int>::max())
            : value.get<long long>() >= std::numeric_limits<int>::min() &&
              value.get<long long>() <= std::numeric_limits<int>::max();
        if (!in_range) {
            throw ConfigException(fmt::format("{}.{} is out of range: {}", context, key, value.dump()));
        }
        return value.get<int>();
    }

    double readDouble(const json& section, const std::string& key, double fallback, const std::string& context) {
        if (section.is_null() || !section.contains(key)) {
            return fallback;
        }
        const json& value = section[key];
        if (!value.is_number()) {
            throw ConfigException(fmt::format("{}.{} must be a number", context, key));
        }
        return value.get<double>();
    }

    std::string readString(const json& section, const std::string& key, const std::string& fallback,
                           const std::string& context) {
        if (section.is_null() || !section.contains(key)) {
            return fallback;
        }
        const json& value = section[key];
        if (!value.is_string()) {
            throw ConfigException(fmt::format("{}.{} must be a string", context, key));
        }
        return value.get<std::string>();
    }

} // namespace config
} // namespace core
