#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp

namespace data
{

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        auto logger = core::logging::getLogger();
        if (connected_)
        {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        logger->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open SQLite database '{}': {}", database_path_,
                          db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        logger->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        auto logger = core::logging::getLogger();
        logger->info("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Happens when prepared statements are still alive
            logger->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        logger->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            logger->error("SQL error: {}", error_msg ? error_msg : sqlite3_errstr(rc));
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        logger->info("Initializing SQLite database schema if needed...");

        // Timestamps are UTC ISO-8601 text, so text order is time order
        const std::string create_candles_sql = R"(
        CREATE TABLE IF NOT EXISTS historical_candles (
            instrument_key TEXT NOT NULL,
            interval TEXT NOT NULL,
            timestamp TEXT NOT NULL,
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume INTEGER,
            PRIMARY KEY (instrument_key, interval, timestamp)
        );
    )";

        bool success = executeSQL(create_candles_sql);
        if (success)
        {
            logger->info("SQLite database schema initialization check complete.");
        }
        else
        {
            logger->error("SQLite database schema initialization failed.");
        }
        return success;
    }

    core::PriceTable DatabaseManager::queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        core::PriceTable candles;
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot query candles: Not connected to database.");
            return candles; // Return empty vector
        }

        std::string start_str = core::utils::timestampToString(start_time);
        std::string end_str = core::utils::timestampToString(end_time);

        logger->debug("Querying candles for {} ({}) between '{}' and '{}'",
                      instrument_key, interval, start_str, end_str);

        const char* sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE instrument_key = ?
              AND interval = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        sqlite3_stmt *stmt = nullptr; // Prepared statement handle
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            logger->error("Failed to prepare candle query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt); // Finalize even if prepare failed
            return candles;
        }

        // Index is 1-based
        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        int row_count = 0;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            row_count++;
            const unsigned char *ts_text = sqlite3_column_text(stmt, 0);
            if (!ts_text) {
                logger->warn("NULL timestamp found in query result (row {}), skipping row.", row_count);
                continue;
            }

            try {
                core::Candle candle;
                candle.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char*>(ts_text));
                candle.open = sqlite3_column_double(stmt, 1);
                candle.high = sqlite3_column_double(stmt, 2);
                candle.low = sqlite3_column_double(stmt, 3);
                candle.close = sqlite3_column_double(stmt, 4);
                candle.volume = sqlite3_column_int64(stmt, 5);
                candles.push_back(candle);
            } catch (const core::DataLoadException& e) {
                logger->warn("Skipping row {} with unreadable timestamp: {}", row_count, e.what());
            }
        }

        if (rc != SQLITE_DONE) {
            logger->error("Error stepping through query results [{}]: {}", rc, sqlite3_errmsg(db_));
        } else {
            logger->debug("Loaded {} candles for {} ({}).", candles.size(), instrument_key, interval);
        }

        sqlite3_finalize(stmt);
        return candles;
    }

    long long DatabaseManager::countCandles(const std::string& instrument_key, const std::string& interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot count candles: Not connected to database.");
            return -1;
        }

        const char* sql = "SELECT COUNT(*) FROM historical_candles WHERE instrument_key = ? AND interval = ?;";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            logger->error("Failed to prepare count query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return -1;
        }
        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);

        long long count = -1;
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            count = sqlite3_column_int64(stmt, 0);
        } else {
            logger->error("Count query failed [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return count;
    }

    bool DatabaseManager::saveCandles(const core::PriceTable &candles,
                                      const std::string &instrument_key,
                                      const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            logger->debug("No candles provided to save for {} ({}).", instrument_key, interval);
            return true; // Nothing to do, report success
        }

        logger->debug("Attempting to save/ignore {} candles for {} ({})", candles.size(), instrument_key, interval);

        // Duplicates on (instrument_key, interval, timestamp) are ignored
        const char *sql = R"(
INSERT OR IGNORE INTO historical_candles
(instrument_key, interval, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt); // Safe if stmt is null
            return false;
        }

        // Begin transaction for efficiency
        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving candles.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &candle : candles)
        {
            std::string timestamp_str = core::utils::timestampToString(candle.timestamp);

            // Indexes are 1-based
            sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, candle.open);
            sqlite3_bind_double(stmt, 5, candle.high);
            sqlite3_bind_double(stmt, 6, candle.low);
            sqlite3_bind_double(stmt, 7, candle.close);
            sqlite3_bind_int64(stmt, 8, candle.volume);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break; // Exit loop on first error
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize the statement BEFORE commit/rollback
        sqlite3_finalize(stmt);

        if (success)
        {
            if (!executeSQL("COMMIT;"))
            {
                logger->error("Failed to COMMIT transaction for saving candles.");
                if (!executeSQL("ROLLBACK;"))
                {
                    logger->error("ROLLBACK after failed COMMIT also failed.");
                }
                return false;
            }
            logger->info("Successfully saved {} new candles (duplicates ignored) for {} ({}).",
                         saved_count, instrument_key, interval);
            return true;
        }

        if (!executeSQL("ROLLBACK;"))
        {
            logger->error("Failed to ROLLBACK transaction for saving candles.");
        }
        logger->warn("Transaction rolled back due to error during candle save for {} ({}).", instrument_key, interval);
        return false;
    }

} // namespace data
