#include <tessera/content_store.hpp>
#include <tessera/log.hpp>
#include <sqlite3.h>

#include <chrono>
#include <climits>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace tessera {

static TesseraError missing_blob(const Fingerprint& fp) {
    return TesseraError(TesseraError::ContentUnavailable,
        "no content stored for fingerprint " + fp.hex());
}

// ---------------------------------------------------------------------------
// MemoryContentStore
// ---------------------------------------------------------------------------

Result<Fingerprint> MemoryContentStore::store(const std::string& bytes) {
    Fingerprint fp = Fingerprint::of(bytes);
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_.emplace(fp, bytes);
    return Result<Fingerprint>::ok(fp);
}

Result<std::string> MemoryContentStore::load(const Fingerprint& fp) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(fp);
    if (it == blobs_.end()) return missing_blob(fp);
    return Result<std::string>::ok(it->second);
}

Result<bool> MemoryContentStore::contains(const Fingerprint& fp) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<bool>::ok(blobs_.count(fp) > 0);
}

Status MemoryContentStore::evict(const Fingerprint& fp) {
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_.erase(fp);
    return ok_status();
}

Result<uint64_t> MemoryContentStore::blob_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<uint64_t>::ok(blobs_.size());
}

// ---------------------------------------------------------------------------
// SqliteContentStore pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";
static constexpr int BUSY_TIMEOUT_MS = 5000;

// Only these mean the file itself is unusable; anything else (a lock held
// by another process, I/O trouble) leaves the database alone.
static bool is_damaged(int rc) {
    int primary = rc & 0xff;
    return primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB;
}

struct SqliteContentStore::Impl {
    sqlite3* db = nullptr;
    std::mutex mutex;
    int last_rc = SQLITE_OK;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_insert = nullptr;
    sqlite3_stmt* stmt_load = nullptr;
    sqlite3_stmt* stmt_contains = nullptr;
    sqlite3_stmt* stmt_evict = nullptr;
    sqlite3_stmt* stmt_count = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_insert);
        fin(stmt_load);
        fin(stmt_contains);
        fin(stmt_evict);
        fin(stmt_count);
    }

    Status require_open() const {
        if (!db) {
            return TesseraError(TesseraError::IO, "content store is not open");
        }
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) {
            sqlite3_reset(out);
            sqlite3_clear_bindings(out);
            return ok_status();
        }
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        last_rc = rc;
        if (rc != SQLITE_OK) {
            return TesseraError(TesseraError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        last_rc = rc;
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return TesseraError(TesseraError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    // Caller holds `mutex`.
    Status remove(const std::string& key) {
        TESSERA_TRY(prepare("DELETE FROM blob WHERE fingerprint=?", stmt_evict));
        int rc = sqlite3_bind_text(stmt_evict, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        if (rc == SQLITE_OK) rc = sqlite3_step(stmt_evict);
        sqlite3_reset(stmt_evict);
        if (rc != SQLITE_DONE) {
            return TesseraError(TesseraError::IO,
                "failed to remove blob " + key + ": " + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status init_schema() {
        TESSERA_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS blob ("
            "  fingerprint TEXT PRIMARY KEY,"
            "  size INTEGER,"
            "  data BLOB,"
            "  created_at INTEGER"
            ");"
        ));

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        last_rc = rc;
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return TesseraError(TesseraError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }

        bool current = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* ver = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            current = ver && std::string(ver) == SCHEMA_VERSION;
            if (!current) {
                log::warn("content store schema changed, discarding stored blobs");
                sqlite3_finalize(stmt);
                stmt = nullptr;
                TESSERA_TRY(exec("DELETE FROM blob;"));
            }
        }
        if (stmt) sqlite3_finalize(stmt);

        if (!current) {
            std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
                "VALUES ('version', '" + SCHEMA_VERSION + "');";
            TESSERA_TRY(exec(ver_sql.c_str()));
        }
        return ok_status();
    }

    Status setup() {
        sqlite3_busy_timeout(db, BUSY_TIMEOUT_MS);
        TESSERA_TRY(exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        return init_schema();
    }
};

// ---------------------------------------------------------------------------
// SqliteContentStore public interface
// ---------------------------------------------------------------------------

SqliteContentStore::SqliteContentStore() : impl_(std::make_unique<Impl>()) {}
SqliteContentStore::~SqliteContentStore() = default;
SqliteContentStore::SqliteContentStore(SqliteContentStore&&) noexcept = default;
SqliteContentStore& SqliteContentStore::operator=(SqliteContentStore&&) noexcept = default;

std::string SqliteContentStore::default_store_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.tessera/store/blobs.db";
}

Status SqliteContentStore::open(const std::string& db_path) {
    close();
    std::lock_guard<std::mutex> lock(impl_->mutex);

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return TesseraError(TesseraError::IO,
                "failed to create store directory: " + parent.string(), "", db_path);
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return TesseraError(TesseraError::IO,
            "failed to open content store: " + msg, "", db_path);
    }

    auto first = impl_->setup();
    if (first.is_ok()) {
        log::debug("opened content store %s", db_path.c_str());
        return ok_status();
    }

    int failed_rc = impl_->last_rc;
    impl_->finalize_all();
    sqlite3_close(impl_->db);
    impl_->db = nullptr;

    if (!is_damaged(failed_rc)) {
        return TesseraError(TesseraError::IO,
            "cannot open content store: " + first.error().message,
            "another process may hold a lock on the store; retry later", db_path);
    }

    // Not a database, or a damaged one: start over once.
    log::warn("content store %s is damaged (%s), recreating",
              db_path.c_str(), first.error().message.c_str());
    std::error_code ec;
    fs::remove(db_path, ec);
    fs::remove(db_path + "-wal", ec);
    fs::remove(db_path + "-shm", ec);

    rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return TesseraError(TesseraError::IO,
            "failed to recreate content store: " + msg, "", db_path);
    }
    auto again = impl_->setup();
    if (again.is_err()) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return std::move(again).error();
    }
    return ok_status();
}

void SqliteContentStore::close() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool SqliteContentStore::is_open() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->db != nullptr;
}

Result<uint64_t> SqliteContentStore::set_max_blob_size(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    TESSERA_TRY(impl_->require_open());
    // SQLite never raises the limit past its compile-time maximum.
    int cap = bytes > static_cast<uint64_t>(INT_MAX) ? INT_MAX : static_cast<int>(bytes);
    int previous = sqlite3_limit(impl_->db, SQLITE_LIMIT_LENGTH, cap);
    return Result<uint64_t>::ok(static_cast<uint64_t>(previous));
}

Result<Fingerprint> SqliteContentStore::store(const std::string& bytes) {
    Fingerprint fp = Fingerprint::of(bytes);
    std::string key = fp.hex();

    std::lock_guard<std::mutex> lock(impl_->mutex);
    TESSERA_TRY(impl_->require_open());
    TESSERA_TRY(impl_->prepare(
        "INSERT OR IGNORE INTO blob (fingerprint, size, data, created_at) "
        "VALUES (?, ?, ?, ?)",
        impl_->stmt_insert));

    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    sqlite3_stmt* stmt = impl_->stmt_insert;
    int rc = sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (rc == SQLITE_OK) {
        rc = sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(bytes.size()));
    }
    if (rc == SQLITE_OK) {
        rc = sqlite3_bind_blob64(stmt, 3, bytes.data(),
                                 static_cast<sqlite3_uint64>(bytes.size()), SQLITE_TRANSIENT);
    }
    if (rc == SQLITE_OK) {
        rc = sqlite3_bind_int64(stmt, 4, static_cast<int64_t>(now));
    }
    if (rc != SQLITE_OK) {
        std::string msg = rc == SQLITE_TOOBIG
            ? "blob of " + std::to_string(bytes.size()) + " bytes exceeds the store's size limit"
            : std::string(sqlite3_errmsg(impl_->db));
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        return TesseraError(TesseraError::IO, "failed to store blob " + key + ": " + msg);
    }

    rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        return TesseraError(TesseraError::IO,
            std::string("failed to store blob: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<Fingerprint>::ok(fp);
}

Result<std::string> SqliteContentStore::load(const Fingerprint& fp) const {
    std::string key = fp.hex();

    std::lock_guard<std::mutex> lock(impl_->mutex);
    TESSERA_TRY(impl_->require_open());
    TESSERA_TRY(impl_->prepare(
        "SELECT data FROM blob WHERE fingerprint=?",
        impl_->stmt_load));

    sqlite3_stmt* stmt = impl_->stmt_load;
    int rc = sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (rc == SQLITE_OK) rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_reset(stmt);
        if (rc == SQLITE_DONE) return missing_blob(fp);
        return TesseraError(TesseraError::IO,
            std::string("failed to load blob: ") + sqlite3_errmsg(impl_->db));
    }

    bool is_null = sqlite3_column_type(stmt, 0) == SQLITE_NULL;
    const void* data = sqlite3_column_blob(stmt, 0);
    int len = sqlite3_column_bytes(stmt, 0);
    std::string bytes;
    if (data && len > 0) {
        bytes.assign(static_cast<const char*>(data), static_cast<size_t>(len));
    }
    sqlite3_reset(stmt);

    if (is_null || Fingerprint::of(bytes) != fp) {
        // Drop the bad row so storing the same content again repairs it.
        auto dropped = impl_->remove(key);
        if (dropped.is_err()) {
            log::warn("could not drop corrupt blob %s: %s",
                      key.c_str(), dropped.error().message.c_str());
        }
        return TesseraError(TesseraError::Corrupt,
            is_null ? "stored blob " + key + " has no data"
                    : "stored blob does not match its fingerprint " + key,
            "store the content again to repair it");
    }
    return Result<std::string>::ok(std::move(bytes));
}

Result<bool> SqliteContentStore::contains(const Fingerprint& fp) const {
    std::string key = fp.hex();

    std::lock_guard<std::mutex> lock(impl_->mutex);
    TESSERA_TRY(impl_->require_open());
    TESSERA_TRY(impl_->prepare(
        "SELECT 1 FROM blob WHERE fingerprint=?",
        impl_->stmt_contains));

    sqlite3_stmt* stmt = impl_->stmt_contains;
    int rc = sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (rc == SQLITE_OK) rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return TesseraError(TesseraError::IO,
            std::string("failed to query blob: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<bool>::ok(rc == SQLITE_ROW);
}

Status SqliteContentStore::evict(const Fingerprint& fp) {
    std::string key = fp.hex();

    std::lock_guard<std::mutex> lock(impl_->mutex);
    TESSERA_TRY(impl_->require_open());
    return impl_->remove(key);
}

Result<uint64_t> SqliteContentStore::blob_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    TESSERA_TRY(impl_->require_open());
    TESSERA_TRY(impl_->prepare("SELECT COUNT(*) FROM blob", impl_->stmt_count));

    sqlite3_stmt* stmt = impl_->stmt_count;
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_reset(stmt);
        return TesseraError(TesseraError::IO,
            std::string("failed to count blobs: ") + sqlite3_errmsg(impl_->db));
    }
    auto count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    sqlite3_reset(stmt);
    return Result<uint64_t>::ok(count);
}

} // namespace tessera
