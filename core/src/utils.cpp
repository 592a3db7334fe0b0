#include "utils.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <iomanip> // For std::put_time, std::get_time
#include <sstream> // For string streams
#include <string>
#include <cmath>   // For std::pow
#include <cctype>  // For std::isdigit
#include <ctime>

namespace core {
namespace utils {

    namespace {

        std::tm toUtcTm(const Timestamp& ts) {
            auto tt = std::chrono::system_clock::to_time_t(ts);
            std::tm time_tm{};
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }

    } // namespace

    std::string timestampToString(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    std::string timestampToDate(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Date part
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw DataLoadException(fmt::format("Failed to parse timestamp (date part): '{}'", iso_string));
        }

        // 2. Optional time part
        double fractional_seconds = 0.0;
        std::chrono::seconds offset_duration{0};
        if (ss.peek() == 'T' || ss.peek() == ' ') {
            ss.ignore();
            ss >> std::get_time(&tm, "%H:%M:%S");
            if (ss.fail()) {
                throw DataLoadException(fmt::format("Failed to parse timestamp (time part): '{}'", iso_string));
            }

            // Optional fractional seconds
            if (ss.peek() == '.') {
                ss.ignore();
                std::string digits;
                while (std::isdigit(ss.peek())) {
                    digits += static_cast<char>(ss.get());
                }
                if (!digits.empty()) {
                    fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.size()));
                }
            }

            // Optional timezone: Z, +HH:MM or -HH:MM
            char sign_or_z = 0;
            if (ss >> sign_or_z) {
                if (sign_or_z == '+' || sign_or_z == '-') {
                    int offset_h = 0;
                    int offset_m = 0;
                    char colon = ' ';
                    if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                        throw DataLoadException(fmt::format("Failed to parse timestamp (timezone offset HH:MM): '{}'", iso_string));
                    }
                    offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                    if (sign_or_z == '-') {
                        offset_duration *= -1;
                    }
                } else if (sign_or_z != 'Z') {
                    throw DataLoadException(fmt::format("Invalid timezone indicator '{}' in timestamp: '{}'", sign_or_z, iso_string));
                }
            }
        }

        char trailing = 0;
        if (ss >> trailing) {
            throw DataLoadException(fmt::format("Unexpected trailing characters in timestamp: '{}'", iso_string));
        }

        // timegm interprets struct tm as UTC
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == static_cast<time_t>(-1)) {
            throw DataLoadException(fmt::format("Failed to convert parsed date/time to UTC epoch seconds: '{}'", iso_string));
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    void validatePriceTable(const PriceTable& table) {
        for (std::size_t i = 1; i < table.size(); ++i) {
            if (!(table[i - 1].timestamp < table[i].timestamp)) {
                throw DataLoadException(fmt::format(
                    "Price table must be strictly increasing by timestamp: row {} ({}) does not follow row {} ({})",
                    i, timestampToString(table[i].timestamp),
                    i - 1, timestampToString(table[i - 1].timestamp)));
            }
        }
    }

} // namespace utils
} // namespace core
