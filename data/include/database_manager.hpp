#pragma once

#include <string>
#include <vector>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp" // Keep core types

namespace data {

// Candle store backed by one SQLite file (":memory:" works too). Failures are
// logged and reported through the boolean / empty return values.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Owns the sqlite3 handle; not copyable or movable
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates historical_candles (keyed by instrument, interval, timestamp)
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // Transactional INSERT OR IGNORE; rows already present are kept as they are.
    bool saveCandles(const core::PriceTable& candles,
                     const std::string& instrument_key,
                     const std::string& interval);

    // Candles with start_time <= timestamp <= end_time, ascending.
    core::PriceTable queryCandles(const std::string& instrument_key,
                                  const std::string& interval,
                                  core::Timestamp start_time,
                                  core::Timestamp end_time);

    // Number of stored candles for an instrument/interval, -1 on error.
    long long countCandles(const std::string& instrument_key, const std::string& interval);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data
