#pragma once

#include "open_options.hpp"
#include <devledger/ledger/key_value_ledger.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace devledger::storage {

    // ===========================================
    // SqliteStore - world state in a SQLite table
    // ===========================================

    class SqliteStore : public ledger::KeyValueLedger {
      public:
        SqliteStore();
        ~SqliteStore() override;

        // Non-copyable, non-movable (the mutex pins it)
        SqliteStore(const SqliteStore &) = delete;
        SqliteStore &operator=(const SqliteStore &) = delete;

        /// Open or create database at given path
        /// @param path Database file path (e.g. "data/devledger.db")
        /// @param opts Configuration options
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        /// Check if database is open
        bool isOpen() const;

        // ===========================================
        // KeyValueLedger
        // ===========================================

        dp::Result<std::optional<ledger::Bytes>, dp::Error> getState(const std::string &key) override;

        dp::Result<void, dp::Error> putState(const std::string &key, const ledger::Bytes &value) override;

        dp::Result<std::vector<ledger::StateEntry>, dp::Error> getStateByRange(const std::string &start_key,
                                                                                const std::string &end_key) override;

        // ===========================================
        // Statistics & Diagnostics
        // ===========================================

        /// Number of keys holding a value
        int64_t getKeyCount();

        /// Current schema version (0 before initialization)
        int32_t getSchemaVersion();

        /// Run SQLite integrity check
        /// @return true if database is healthy, false on corruption
        bool quickCheck();

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;
        mutable std::recursive_mutex mutex_;

        void applyPragmas(const OpenOptions &opts);
        bool initializeSchema();
        bool executeSql(const std::string &sql);
        bool setSchemaVersion(int32_t version);
        int32_t currentSchemaVersion();
        dp::Error lastError(const std::string &context) const;

        // Schema SQL definitions (inline, no separate files)
        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        // Keys are BLOBs: composite keys embed 0x00 and range scans need memcmp order
        static constexpr const char *WORLD_STATE_TABLE = R"(
            CREATE TABLE IF NOT EXISTS world_state (
                key BLOB PRIMARY KEY,
                value BLOB NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )";
    };

} // namespace devledger::storage
