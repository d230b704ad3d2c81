#pragma once

#include "document_store.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward declaration for sqlite3 C API
struct sqlite3;

namespace credo {

    /// SQLite database configuration
    struct SqliteOptions {
        bool enable_wal = true;
        int32_t busy_timeout_ms = 5000;
        int32_t cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        SqliteOptions() = default;
    };

    /// Document store persisted in a SQLite database.
    /// Each record is stored as a datapod-serialized blob next to its id, controller and version.
    class SqliteDocumentStore : public DocumentStore {
      public:
        SqliteDocumentStore();
        ~SqliteDocumentStore() override;

        // Non-copyable, movable
        SqliteDocumentStore(const SqliteDocumentStore &) = delete;
        SqliteDocumentStore &operator=(const SqliteDocumentStore &) = delete;
        SqliteDocumentStore(SqliteDocumentStore &&) noexcept;
        SqliteDocumentStore &operator=(SqliteDocumentStore &&) noexcept;

        /// Open or create the database and make sure the schema exists
        /// @param path Database file path (":memory:" for a private in-memory database)
        dp::Result<void, dp::Error> open(const std::string &path, const SqliteOptions &opts = SqliteOptions{});

        void close();

        bool isOpen() const;

        dp::Result<std::optional<IdentityDocumentRecord>, dp::Error> get(const std::string &id) const override;

        dp::Result<dp::u64, dp::Error> set(const IdentityDocumentRecord &record, dp::u64 expected_version) override;

        /// Number of stored documents
        dp::Result<int64_t, dp::Error> count() const;

        /// Ids of all stored documents, ordered
        dp::Result<std::vector<std::string>, dp::Error> ids() const;

        /// Run SQLite integrity check
        bool quickCheck() const;

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class TxGuard {
          public:
            explicit TxGuard(sqlite3 *db);
            ~TxGuard();

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            bool active() const { return active_; }
            bool commit();

          private:
            sqlite3 *db_;
            bool active_;
        };

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;
        mutable std::unique_ptr<std::mutex> mutex_;

        void applyPragmas(const SqliteOptions &opts);
        dp::Result<void, dp::Error> initializeSchema();
        bool executeSql(const char *sql);
        int32_t getCurrentSchemaVersion();
        dp::Error lastError(const std::string &context) const;

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *DOCUMENTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS identity_documents (
                id TEXT PRIMARY KEY,
                controller TEXT NOT NULL,
                version INTEGER NOT NULL,
                record BLOB NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *IDX_DOCUMENTS_CONTROLLER =
            "CREATE INDEX IF NOT EXISTS idx_identity_documents_controller ON identity_documents(controller)";
    };

} // namespace credo
