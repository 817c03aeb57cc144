#include <devledger/common/error.hpp>
#include <devledger/storage/sqlite_store.hpp>

#include <chrono>
#include <sqlite3.h>

namespace devledger::storage {

    namespace {

        int64_t nowSeconds() {
            return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        void bindBytes(sqlite3_stmt *stmt, int index, const void *data, size_t size) {
            // A zero-length blob with a null pointer would bind as NULL
            if (size == 0) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, data, static_cast<int>(size), SQLITE_TRANSIENT);
            }
        }

        std::string columnString(sqlite3_stmt *stmt, int col) {
            auto data = static_cast<const char *>(sqlite3_column_blob(stmt, col));
            int size = sqlite3_column_bytes(stmt, col);
            return data ? std::string(data, static_cast<size_t>(size)) : std::string();
        }

        ledger::Bytes columnBytes(sqlite3_stmt *stmt, int col) {
            auto data = static_cast<const uint8_t *>(sqlite3_column_blob(stmt, col));
            int size = sqlite3_column_bytes(stmt, col);
            return data ? ledger::Bytes(data, data + size) : ledger::Bytes();
        }

        // Finalizes on scope exit
        struct Statement {
            sqlite3_stmt *stmt = nullptr;
            ~Statement() {
                if (stmt)
                    sqlite3_finalize(stmt);
            }
        };

    } // namespace

    SqliteStore::SqliteStore() : db_(nullptr), is_open_(false) {}

    SqliteStore::~SqliteStore() { close(); }

    dp::Result<void, dp::Error> SqliteStore::open(const std::string &path, const OpenOptions &opts) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }

        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            auto error = lastError("cannot open " + path);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(error);
        }

        db_path_ = path;
        is_open_ = true;
        applyPragmas(opts);

        if (!initializeSchema()) {
            auto error = lastError("cannot initialize schema in " + path);
            close();
            return dp::Result<void, dp::Error>::err(error);
        }
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteStore::close() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }
    }

    bool SqliteStore::isOpen() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return is_open_;
    }

    void SqliteStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        std::string busy_timeout = "PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";";
        sqlite3_exec(db_, busy_timeout.c_str(), nullptr, nullptr, nullptr);

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        sqlite3_exec(db_, cache_size.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db_, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    bool SqliteStore::initializeSchema() {
        if (!executeSql(SCHEMA_MIGRATIONS_TABLE))
            return false;

        if (currentSchemaVersion() < 1) {
            if (!executeSql("BEGIN"))
                return false;
            if (!executeSql(WORLD_STATE_TABLE) || !setSchemaVersion(1)) {
                executeSql("ROLLBACK");
                return false;
            }
            if (!executeSql("COMMIT"))
                return false;
        }
        return true;
    }

    bool SqliteStore::executeSql(const std::string &sql) {
        if (!db_)
            return false;
        return sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK;
    }

    bool SqliteStore::setSchemaVersion(int32_t version) {
        Statement st;
        const char *sql = "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)";
        if (sqlite3_prepare_v2(db_, sql, -1, &st.stmt, nullptr) != SQLITE_OK)
            return false;

        sqlite3_bind_int(st.stmt, 1, version);
        sqlite3_bind_int64(st.stmt, 2, nowSeconds());
        return sqlite3_step(st.stmt) == SQLITE_DONE;
    }

    int32_t SqliteStore::currentSchemaVersion() {
        Statement st;
        const char *sql = "SELECT MAX(version) FROM schema_migrations";
        if (sqlite3_prepare_v2(db_, sql, -1, &st.stmt, nullptr) != SQLITE_OK)
            return 0;

        int32_t version = 0;
        if (sqlite3_step(st.stmt) == SQLITE_ROW && sqlite3_column_type(st.stmt, 0) != SQLITE_NULL) {
            version = sqlite3_column_int(st.stmt, 0);
        }
        return version;
    }

    dp::Error SqliteStore::lastError(const std::string &context) const {
        std::string detail = db_ ? sqlite3_errmsg(db_) : "no database handle";
        return ledger_io(context + ": " + detail);
    }

    // ===========================================
    // KeyValueLedger
    // ===========================================

    dp::Result<std::optional<ledger::Bytes>, dp::Error> SqliteStore::getState(const std::string &key) {
        using GetResult = dp::Result<std::optional<ledger::Bytes>, dp::Error>;
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!is_open_)
            return GetResult::err(store_not_open());

        Statement st;
        const char *sql = "SELECT value FROM world_state WHERE key = ?";
        if (sqlite3_prepare_v2(db_, sql, -1, &st.stmt, nullptr) != SQLITE_OK)
            return GetResult::err(lastError("prepare get"));

        bindBytes(st.stmt, 1, key.data(), key.size());

        int rc = sqlite3_step(st.stmt);
        if (rc == SQLITE_DONE)
            return GetResult::ok(std::nullopt);
        if (rc != SQLITE_ROW)
            return GetResult::err(lastError("read state"));

        return GetResult::ok(columnBytes(st.stmt, 0));
    }

    dp::Result<void, dp::Error> SqliteStore::putState(const std::string &key, const ledger::Bytes &value) {
        auto valid = ledger::validateKey(key);
        if (valid.is_err())
            return valid;

        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        Statement st;
        const char *sql = "INSERT OR REPLACE INTO world_state (key, value, updated_at) VALUES (?, ?, ?)";
        if (sqlite3_prepare_v2(db_, sql, -1, &st.stmt, nullptr) != SQLITE_OK)
            return dp::Result<void, dp::Error>::err(lastError("prepare put"));

        bindBytes(st.stmt, 1, key.data(), key.size());
        bindBytes(st.stmt, 2, value.data(), value.size());
        sqlite3_bind_int64(st.stmt, 3, nowSeconds());

        if (sqlite3_step(st.stmt) != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(lastError("write state"));

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::vector<ledger::StateEntry>, dp::Error> SqliteStore::getStateByRange(const std::string &start_key,
                                                                                         const std::string &end_key) {
        using RangeResult = dp::Result<std::vector<ledger::StateEntry>, dp::Error>;
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!is_open_)
            return RangeResult::err(store_not_open());

        Statement st;
        const char *sql = end_key.empty() ? "SELECT key, value FROM world_state WHERE key >= ? ORDER BY key"
                                          : "SELECT key, value FROM world_state WHERE key >= ? AND key < ? ORDER BY key";
        if (sqlite3_prepare_v2(db_, sql, -1, &st.stmt, nullptr) != SQLITE_OK)
            return RangeResult::err(lastError("prepare range"));

        bindBytes(st.stmt, 1, start_key.data(), start_key.size());
        if (!end_key.empty()) {
            bindBytes(st.stmt, 2, end_key.data(), end_key.size());
        }

        std::vector<ledger::StateEntry> entries;
        int rc;
        while ((rc = sqlite3_step(st.stmt)) == SQLITE_ROW) {
            entries.push_back(ledger::StateEntry{columnString(st.stmt, 0), columnBytes(st.stmt, 1)});
        }
        if (rc != SQLITE_DONE)
            return RangeResult::err(lastError("range scan"));

        return RangeResult::ok(std::move(entries));
    }

    // ===========================================
    // Statistics & Diagnostics
    // ===========================================

    int64_t SqliteStore::getKeyCount() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!is_open_)
            return 0;

        Statement st;
        if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM world_state", -1, &st.stmt, nullptr) != SQLITE_OK)
            return 0;

        return sqlite3_step(st.stmt) == SQLITE_ROW ? sqlite3_column_int64(st.stmt, 0) : 0;
    }

    int32_t SqliteStore::getSchemaVersion() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!is_open_)
            return 0;
        return currentSchemaVersion();
    }

    bool SqliteStore::quickCheck() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!is_open_)
            return false;

        Statement st;
        if (sqlite3_prepare_v2(db_, "PRAGMA quick_check", -1, &st.stmt, nullptr) != SQLITE_OK)
            return false;

        if (sqlite3_step(st.stmt) != SQLITE_ROW)
            return false;

        auto text = reinterpret_cast<const char *>(sqlite3_column_text(st.stmt, 0));
        return text && std::string(text) == "ok";
    }

} // namespace devledger::storage
