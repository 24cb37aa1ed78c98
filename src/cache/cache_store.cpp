#include "rarity/cache/cache_store.hpp"

#include <sqlite3.h>

#include <climits>
#include <cstdlib>
#include <ctime>
#include <string>

namespace rarity::cache {

using namespace rarity::core;

namespace {
    constexpr const char* kCreateSQL =
        "CREATE TABLE IF NOT EXISTS RarityCache ("
        "  key BLOB PRIMARY KEY,"
        "  value BLOB NOT NULL,"
        "  stored_at INTEGER NOT NULL"
        ") WITHOUT ROWID";

    constexpr const char* kGetSQL = "SELECT value, stored_at FROM RarityCache WHERE key = ?";
    constexpr const char* kPutSQL = "INSERT OR REPLACE INTO RarityCache (key, value, stored_at) VALUES (?, ?, ?)";
    constexpr const char* kCountSQL = "SELECT COUNT(*) FROM RarityCache";
    constexpr const char* kExistsSQL = "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ? LIMIT 1";

    [[nodiscard]] Status store_error(int rc) noexcept {
        return make_status(StatusDomain::Cache, StatusCode::Io, static_cast<u32>(rc));
    }

    Timestamp system_clock() noexcept {
        return static_cast<Timestamp>(std::time(nullptr));
    }

    // Finalizes on scope exit.
    struct Statement {
        sqlite3_stmt* stmt{nullptr};
        ~Statement() {
            if (stmt) sqlite3_finalize(stmt);
        }
    };
} // namespace

CacheStore::CacheStore() noexcept = default;

CacheStore::~CacheStore() noexcept {
    (void)close();
}

Status CacheStore::open(const CacheConfig& cfg) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_ != nullptr) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }
    if (cfg.path.empty() || cfg.max_age_seconds < 0) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(cfg.path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return store_error(rc);
    }

    // WAL lets readers proceed while another request writes (configurable).
    const char* journal_mode = std::getenv("RARITYMON_DB_JOURNAL_MODE");
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    char* err_msg = nullptr;
    rc = sqlite3_exec(db_, journal_sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        sqlite3_free(err_msg);
        // In-memory databases reject WAL; keep going.
    }

    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 5000);

    cfg_ = cfg;
    if (cfg_.clock == nullptr) {
        cfg_.clock = &system_clock;
    }

    bool exists = false;
    const Status s = namespace_exists_locked(&exists);
    if (!is_ok(s)) {
        sqlite3_close(db_);
        db_ = nullptr;
        return s;
    }
    namespace_ready_ = exists;
    return ok_status();
}

Status CacheStore::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_ == nullptr) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }

    const int rc = sqlite3_close(db_);
    db_ = nullptr;
    namespace_ready_ = false;
    if (rc != SQLITE_OK) {
        return store_error(rc);
    }
    return ok_status();
}

bool CacheStore::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

Timestamp CacheStore::now() const noexcept {
    return cfg_.clock ? cfg_.clock() : system_clock();
}

Status CacheStore::namespace_exists_locked(bool* exists) noexcept {
    Statement st;
    int rc = sqlite3_prepare_v2(db_, kExistsSQL, -1, &st.stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_error(rc);
    }
    sqlite3_bind_text(st.stmt, 1, kCacheNamespace, -1, SQLITE_STATIC);

    rc = sqlite3_step(st.stmt);
    if (rc == SQLITE_ROW) {
        *exists = true;
        return ok_status();
    }
    if (rc == SQLITE_DONE) {
        *exists = false;
        return ok_status();
    }
    return store_error(rc);
}

Status CacheStore::ensure_namespace_locked() noexcept {
    if (namespace_ready_) {
        return ok_status();
    }

    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db_, kCreateSQL, nullptr, nullptr, &err_msg);
    if (err_msg) {
        sqlite3_free(err_msg);
    }
    if (rc != SQLITE_OK) {
        return store_error(rc);
    }
    namespace_ready_ = true;
    return ok_status();
}

Status CacheStore::get(const Fingerprint& key, std::string* out, bool* found) noexcept {
    if (out == nullptr || found == nullptr) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }
    *found = false;

    std::lock_guard<std::mutex> lock(mutex_);

    if (db_ == nullptr) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }

    if (!namespace_ready_) {
        // Another connection may have created it since open().
        bool exists = false;
        const Status s = namespace_exists_locked(&exists);
        if (!is_ok(s)) {
            return s;
        }
        if (!exists) {
            return ok_status();
        }
        namespace_ready_ = true;
    }

    Statement st;
    int rc = sqlite3_prepare_v2(db_, kGetSQL, -1, &st.stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_error(rc);
    }
    sqlite3_bind_blob(st.stmt, 1, key.b.data(), static_cast<int>(key.b.size()), SQLITE_STATIC);

    rc = sqlite3_step(st.stmt);
    if (rc == SQLITE_DONE) {
        return ok_status();
    }
    if (rc != SQLITE_ROW) {
        return store_error(rc);
    }

    if (cfg_.max_age_seconds > 0) {
        const Timestamp stored_at = sqlite3_column_int64(st.stmt, 1);
        if (now() - stored_at > cfg_.max_age_seconds) {
            return ok_status();
        }
    }

    const void* blob = sqlite3_column_blob(st.stmt, 0);
    const int len = sqlite3_column_bytes(st.stmt, 0);
    if (blob != nullptr && len > 0) {
        out->assign(static_cast<const char*>(blob), static_cast<size_t>(len));
    } else {
        out->clear();
    }
    *found = true;
    return ok_status();
}

Status CacheStore::put(const Fingerprint& key, std::string_view value) noexcept {
    if (value.size() > static_cast<size_t>(INT_MAX)) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (db_ == nullptr) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }

    Status s = ensure_namespace_locked();
    if (!is_ok(s)) {
        return s;
    }

    Statement st;
    int rc = sqlite3_prepare_v2(db_, kPutSQL, -1, &st.stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_error(rc);
    }
    sqlite3_bind_blob(st.stmt, 1, key.b.data(), static_cast<int>(key.b.size()), SQLITE_STATIC);
    // Empty blobs need a non-null pointer or SQLite stores NULL.
    static const char kEmpty = '\0';
    sqlite3_bind_blob(st.stmt, 2, value.empty() ? &kEmpty : value.data(),
                      static_cast<int>(value.size()), SQLITE_STATIC);
    sqlite3_bind_int64(st.stmt, 3, now());

    rc = sqlite3_step(st.stmt);
    if (rc != SQLITE_DONE) {
        return store_error(rc);
    }
    return ok_status();
}

Status CacheStore::count(u64* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }
    *out = 0;

    std::lock_guard<std::mutex> lock(mutex_);

    if (db_ == nullptr) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }
    if (!namespace_ready_) {
        bool exists = false;
        const Status s = namespace_exists_locked(&exists);
        if (!is_ok(s) || !exists) {
            return s;
        }
        namespace_ready_ = true;
    }

    Statement st;
    int rc = sqlite3_prepare_v2(db_, kCountSQL, -1, &st.stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_error(rc);
    }
    rc = sqlite3_step(st.stmt);
    if (rc != SQLITE_ROW) {
        return store_error(rc);
    }
    *out = static_cast<u64>(sqlite3_column_int64(st.stmt, 0));
    return ok_status();
}

} // namespace rarity::cache
