#include <chrono>
#include <credo/storage/sqlite_document_store.hpp>
#include <iostream>
#include <sqlite3.h>

namespace credo {

    namespace {
        int64_t currentTimestamp() {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        /// Finalizes a prepared statement when leaving scope
        struct Statement {
            sqlite3_stmt *stmt = nullptr;
            ~Statement() {
                if (stmt) {
                    sqlite3_finalize(stmt);
                }
            }
        };
    } // namespace

    SqliteDocumentStore::SqliteDocumentStore()
        : db_(nullptr), is_open_(false), mutex_(std::make_unique<std::mutex>()) {}

    SqliteDocumentStore::~SqliteDocumentStore() { close(); }

    SqliteDocumentStore::SqliteDocumentStore(SqliteDocumentStore &&other) noexcept
        : db_(other.db_), db_path_(std::move(other.db_path_)), is_open_(other.is_open_),
          mutex_(std::move(other.mutex_)) {
        other.db_ = nullptr;
        other.is_open_ = false;
        other.mutex_ = std::make_unique<std::mutex>();
    }

    SqliteDocumentStore &SqliteDocumentStore::operator=(SqliteDocumentStore &&other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            db_path_ = std::move(other.db_path_);
            is_open_ = other.is_open_;
            mutex_ = std::move(other.mutex_);
            other.db_ = nullptr;
            other.is_open_ = false;
            other.mutex_ = std::make_unique<std::mutex>();
        }
        return *this;
    }

    dp::Result<void, dp::Error> SqliteDocumentStore::open(const std::string &path, const SqliteOptions &opts) {
        close();
        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(storage_failed("Cannot open " + path + ": " + reason));
        }

        db_path_ = path;
        is_open_ = true;
        applyPragmas(opts);

        auto schema = initializeSchema();
        if (schema.is_err()) {
            close();
            return schema;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteDocumentStore::close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }
    }

    bool SqliteDocumentStore::isOpen() const { return is_open_; }

    void SqliteDocumentStore::applyPragmas(const SqliteOptions &opts) {
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
        case SqliteOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case SqliteOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case SqliteOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db_, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    dp::Result<void, dp::Error> SqliteDocumentStore::initializeSchema() {
        TxGuard tx(db_);
        if (!tx.active()) {
            return dp::Result<void, dp::Error>::err(lastError("begin schema transaction"));
        }

        if (!executeSql(SCHEMA_MIGRATIONS_TABLE)) {
            return dp::Result<void, dp::Error>::err(lastError("create schema_migrations"));
        }

        if (getCurrentSchemaVersion() < 1) {
            if (!executeSql(DOCUMENTS_TABLE) || !executeSql(IDX_DOCUMENTS_CONTROLLER)) {
                return dp::Result<void, dp::Error>::err(lastError("create identity_documents"));
            }

            Statement st;
            const char *sql = "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (1, ?)";
            if (sqlite3_prepare_v2(db_, sql, -1, &st.stmt, nullptr) != SQLITE_OK) {
                return dp::Result<void, dp::Error>::err(lastError("record schema version"));
            }
            sqlite3_bind_int64(st.stmt, 1, currentTimestamp());
            if (sqlite3_step(st.stmt) != SQLITE_DONE) {
                return dp::Result<void, dp::Error>::err(lastError("record schema version"));
            }
        }

        if (!tx.commit()) {
            return dp::Result<void, dp::Error>::err(lastError("commit schema"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    bool SqliteDocumentStore::executeSql(const char *sql) {
        char *err_msg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::cout << "SQL error: " << (err_msg ? err_msg : "unknown") << std::endl;
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    int32_t SqliteDocumentStore::getCurrentSchemaVersion() {
        Statement st;
        if (sqlite3_prepare_v2(db_, "SELECT MAX(version) FROM schema_migrations", -1, &st.stmt, nullptr) !=
            SQLITE_OK) {
            return 0;
        }
        int32_t version = 0;
        if (sqlite3_step(st.stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(st.stmt, 0);
        }
        return version;
    }

    dp::Error SqliteDocumentStore::lastError(const std::string &context) const {
        std::string reason = db_ ? sqlite3_errmsg(db_) : "database not open";
        return storage_failed(context + ": " + reason);
    }

    dp::Result<std::optional<IdentityDocumentRecord>, dp::Error> SqliteDocumentStore::get(const std::string &id) const {
        using R = dp::Result<std::optional<IdentityDocumentRecord>, dp::Error>;
        std::lock_guard<std::mutex> lock(*mutex_);
        if (!db_ || !is_open_) {
            return R::err(storage_failed("Document store is not open"));
        }

        Statement st;
        const char *sql = "SELECT record FROM identity_documents WHERE id = ?";
        if (sqlite3_prepare_v2(db_, sql, -1, &st.stmt, nullptr) != SQLITE_OK) {
            return R::err(lastError("prepare get"));
        }
        sqlite3_bind_text(st.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(st.stmt);
        if (rc == SQLITE_DONE) {
            return R::ok(std::nullopt);
        }
        if (rc != SQLITE_ROW) {
            return R::err(lastError("get " + id));
        }

        const void *blob = sqlite3_column_blob(st.stmt, 0);
        int size = sqlite3_column_bytes(st.stmt, 0);
        auto record = IdentityDocumentRecord::deserialize(static_cast<const dp::u8 *>(blob),
                                                          static_cast<dp::usize>(size));
        if (record.is_err()) {
            return R::err(record.error());
        }
        return R::ok(std::optional<IdentityDocumentRecord>(std::move(record.value())));
    }

    dp::Result<dp::u64, dp::Error> SqliteDocumentStore::set(const IdentityDocumentRecord &record,
                                                            dp::u64 expected_version) {
        using R = dp::Result<dp::u64, dp::Error>;
        std::string id = record.getId();
        if (id.empty()) {
            return R::err(validation("Document record id must not be empty"));
        }

        std::lock_guard<std::mutex> lock(*mutex_);
        if (!db_ || !is_open_) {
            return R::err(storage_failed("Document store is not open"));
        }

        TxGuard tx(db_);
        if (!tx.active()) {
            return R::err(lastError("begin set"));
        }

        dp::u64 current = 0;
        {
            Statement st;
            if (sqlite3_prepare_v2(db_, "SELECT version FROM identity_documents WHERE id = ?", -1, &st.stmt,
                                   nullptr) != SQLITE_OK) {
                return R::err(lastError("prepare version lookup"));
            }
            sqlite3_bind_text(st.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
            int rc = sqlite3_step(st.stmt);
            if (rc == SQLITE_ROW) {
                current = static_cast<dp::u64>(sqlite3_column_int64(st.stmt, 0));
            } else if (rc != SQLITE_DONE) {
                return R::err(lastError("version lookup " + id));
            }
        }

        if (current != expected_version) {
            std::cout << "Version conflict on " << id << ": expected " << expected_version << ", stored " << current
                      << std::endl;
            return R::err(version_conflict(id));
        }

        IdentityDocumentRecord stored = record;
        stored.version = expected_version + 1;
        auto blob = stored.serialize();

        {
            Statement st;
            const char *sql = "INSERT OR REPLACE INTO identity_documents (id, controller, version, record, updated_at) "
                              "VALUES (?, ?, ?, ?, ?)";
            if (sqlite3_prepare_v2(db_, sql, -1, &st.stmt, nullptr) != SQLITE_OK) {
                return R::err(lastError("prepare set"));
            }
            sqlite3_bind_text(st.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(st.stmt, 2, stored.getController().c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(st.stmt, 3, static_cast<int64_t>(stored.version));
            sqlite3_bind_blob(st.stmt, 4, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
            sqlite3_bind_int64(st.stmt, 5, currentTimestamp());
            if (sqlite3_step(st.stmt) != SQLITE_DONE) {
                return R::err(lastError("set " + id));
            }
        }

        if (!tx.commit()) {
            return R::err(lastError("commit set"));
        }
        return R::ok(stored.version);
    }

    dp::Result<int64_t, dp::Error> SqliteDocumentStore::count() const {
        std::lock_guard<std::mutex> lock(*mutex_);
        if (!db_ || !is_open_) {
            return dp::Result<int64_t, dp::Error>::err(storage_failed("Document store is not open"));
        }
        Statement st;
        if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM identity_documents", -1, &st.stmt, nullptr) != SQLITE_OK) {
            return dp::Result<int64_t, dp::Error>::err(lastError("prepare count"));
        }
        int64_t total = 0;
        if (sqlite3_step(st.stmt) == SQLITE_ROW) {
            total = sqlite3_column_int64(st.stmt, 0);
        }
        return dp::Result<int64_t, dp::Error>::ok(total);
    }

    dp::Result<std::vector<std::string>, dp::Error> SqliteDocumentStore::ids() const {
        using R = dp::Result<std::vector<std::string>, dp::Error>;
        std::lock_guard<std::mutex> lock(*mutex_);
        if (!db_ || !is_open_) {
            return R::err(storage_failed("Document store is not open"));
        }
        Statement st;
        if (sqlite3_prepare_v2(db_, "SELECT id FROM identity_documents ORDER BY id", -1, &st.stmt, nullptr) !=
            SQLITE_OK) {
            return R::err(lastError("prepare ids"));
        }
        std::vector<std::string> result;
        while (sqlite3_step(st.stmt) == SQLITE_ROW) {
            result.emplace_back(reinterpret_cast<const char *>(sqlite3_column_text(st.stmt, 0)));
        }
        return R::ok(std::move(result));
    }

    bool SqliteDocumentStore::quickCheck() const {
        std::lock_guard<std::mutex> lock(*mutex_);
        if (!db_ || !is_open_)
            return false;

        Statement st;
        if (sqlite3_prepare_v2(db_, "PRAGMA quick_check", -1, &st.stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        bool ok = false;
        if (sqlite3_step(st.stmt) == SQLITE_ROW) {
            const char *result = reinterpret_cast<const char *>(sqlite3_column_text(st.stmt, 0));
            ok = result && std::string(result) == "ok";
        }
        return ok;
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    SqliteDocumentStore::TxGuard::TxGuard(sqlite3 *db) : db_(db), active_(false) {
        if (db_) {
            active_ = (sqlite3_exec(db_, "BEGIN IMMEDIATE TRANSACTION", nullptr, nullptr, nullptr) == SQLITE_OK);
        }
    }

    SqliteDocumentStore::TxGuard::~TxGuard() {
        if (active_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    bool SqliteDocumentStore::TxGuard::commit() {
        if (!active_) {
            return false;
        }
        bool ok = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK;
        if (ok) {
            active_ = false;
        }
        return ok;
    }

} // namespace credo
