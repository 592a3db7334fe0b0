#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Convert Timestamp to ISO 8601 UTC string, e.g. 2023-01-02T00:00:00Z
    std::string timestampToString(const Timestamp& ts);

    // Date part only (UTC), e.g. 2023-01-02
    std::string timestampToDate(const Timestamp& ts);

    // Parse "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]".
    // A missing offset means UTC. Throws DataLoadException on malformed input.
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Throws DataLoadException unless timestamps are strictly increasing.
    void validatePriceTable(const PriceTable& table);

} // namespace utils
} // namespace core
