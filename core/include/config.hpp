#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace core {
namespace config {

    using json = nlohmann::json;

    // Reads and parses a JSON document. Throws ConfigException if the file
    // cannot be opened or is not valid JSON.
    json loadJsonFile(const std::string& path);

    // Returns section[key] or an empty (null) json if the key is absent.
    // Throws ConfigException if the document is not an object.
    const json& section(const json& document, const std::string& key);

    // Typed field readers: missing key -> fallback, wrong type -> ConfigException.
    // `context` names the section in error messages (e.g. "backtest").
    int readInt(const json& section, const std::string& key, int fallback, const std::string& context);
    double readDouble(const json& section, const std::string& key, double fallback, const std::string& context);
    std::string readString(const json& section, const std::string& key, const std::string& fallback,
                           const std::string& context);

} // namespace config
} // namespace core
