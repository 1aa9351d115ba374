#include "store/sqlite_block_store.hpp"

#include <stdexcept>
#include <string>

#include <sqlite3.h>

#include "common/logging.hpp"

namespace scrollkeep {

namespace {

constexpr const char *kCreateBlocksTable =
    "CREATE TABLE IF NOT EXISTS resume_blocks ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    const int size = sqlite3_column_bytes(stmt, index);
    return std::string(reinterpret_cast<const char *>(text), static_cast<size_t>(size));
}

class SqliteTransaction : public BlockTransaction {
public:
    SqliteTransaction(sqlite3 *db, TransactionMode mode)
        : db(db)
        , mode(mode)
    {
        execOrThrow(db, mode == TransactionMode::ReadWrite ? "BEGIN IMMEDIATE;" : "BEGIN;");
        active = true;
    }

    ~SqliteTransaction() override
    {
        if (!active) {
            return;
        }
        char *error = nullptr;
        if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, &error) != SQLITE_OK) {
            SKLOG_WARN("SqliteBlockStore",
                       "rollback",
                       "rollback_failed",
                       "transaction_dropped",
                       "sqlite3_exec",
                       "",
                       "",
                       (nlohmann::json{{"error", error ? error : "unknown"}}));
        }
        sqlite3_free(error);
    }

    std::optional<nlohmann::json> get(const std::string &key) override
    {
        Statement stmt(db, "SELECT value FROM resume_blocks WHERE key = ?;");
        bindText(stmt.get(), 1, key);
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            throw std::runtime_error(std::string("sqlite read failed: ") + sqlite3_errmsg(db));
        }
        const std::string text = columnText(stmt.get(), 0);
        try {
            return nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error &) {
            // Treat an undecodable block as absent; the codec reports corruption.
            return std::nullopt;
        }
    }

    void put(const std::string &key, const nlohmann::json &value) override
    {
        requireWritable();
        Statement stmt(db, "INSERT OR REPLACE INTO resume_blocks (key, value) VALUES (?, ?);");
        bindText(stmt.get(), 1, key);
        bindText(stmt.get(), 2, value.dump(-1, ' ', false,
                                           nlohmann::json::error_handler_t::replace));
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw std::runtime_error(std::string("sqlite write failed: ") + sqlite3_errmsg(db));
        }
    }

    void remove(const std::string &key) override
    {
        requireWritable();
        Statement stmt(db, "DELETE FROM resume_blocks WHERE key = ?;");
        bindText(stmt.get(), 1, key);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw std::runtime_error(std::string("sqlite delete failed: ") + sqlite3_errmsg(db));
        }
    }

    void clear() override
    {
        requireWritable();
        execOrThrow(db, "DELETE FROM resume_blocks;");
    }

    void commit() override
    {
        if (!active) {
            throw std::runtime_error("transaction already finished");
        }
        execOrThrow(db, "COMMIT;");
        active = false;
    }

private:
    void requireWritable() const
    {
        if (mode != TransactionMode::ReadWrite) {
            throw std::runtime_error("write attempted in read-only transaction");
        }
    }

    sqlite3 *db = nullptr;
    TransactionMode mode = TransactionMode::ReadOnly;
    bool active = false;
};

} // namespace

struct SqliteBlockStore::Impl {
    std::filesystem::path dbPath;
    sqlite3 *db = nullptr;

    void ensureOpen()
    {
        if (db) {
            return;
        }
        std::error_code ec;
        std::filesystem::create_directories(dbPath.parent_path(), ec);
        if (sqlite3_open(dbPath.string().c_str(), &db) != SQLITE_OK) {
            std::string message = db ? sqlite3_errmsg(db) : "out of memory";
            sqlite3_close(db);
            db = nullptr;
            throw std::runtime_error("failed to open resume database: " + message);
        }
        sqlite3_busy_timeout(db, 2000);
        try {
            execOrThrow(db, kCreateBlocksTable);
        } catch (const std::runtime_error &) {
            sqlite3_close(db);
            db = nullptr;
            throw;
        }
    }
};

SqliteBlockStore::SqliteBlockStore(std::filesystem::path dbPath)
    : impl(std::make_unique<Impl>())
{
    impl->dbPath = std::move(dbPath);
}

SqliteBlockStore::~SqliteBlockStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
    }
}

std::unique_ptr<BlockTransaction> SqliteBlockStore::openTransaction(TransactionMode mode)
{
    impl->ensureOpen();
    return std::make_unique<SqliteTransaction>(impl->db, mode);
}

const std::filesystem::path &SqliteBlockStore::path() const
{
    return impl->dbPath;
}

} // namespace scrollkeep
