#include <pinion/hash_cache.hpp>
#include <pinion/log.hpp>
#include <sqlite3.h>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace pinion {

namespace {

std::string join_lines(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += '\n';
        out += items[i];
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";

struct HashCache::Impl {
    sqlite3* db = nullptr;

    sqlite3_stmt* stmt_lookup = nullptr;
    sqlite3_stmt* stmt_store = nullptr;
    sqlite3_stmt* stmt_remove = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_lookup);
        fin(stmt_store);
        fin(stmt_remove);
    }

    Status require_open() const {
        if (!db) return PinionError(PinionError::IO, "hash cache is not open");
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return PinionError(PinionError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return PinionError(PinionError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status write_version() {
        std::string sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(sql.c_str());
    }

    Status init_schema() {
        PINION_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS artifact_hashes ("
            "  cache_key TEXT PRIMARY KEY,"
            "  hashes TEXT,"
            "  created_at INTEGER"
            ");"
        ));

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return PinionError(PinionError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            return write_version();
        }

        const char* ver = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        bool stale = !ver || std::string(ver) != SCHEMA_VERSION;
        sqlite3_finalize(stmt);
        if (stale) {
            log::debug("hash cache schema changed, dropping old entries");
            PINION_TRY(exec("DELETE FROM artifact_hashes;"));
            PINION_TRY(write_version());
        }
        return ok_status();
    }
};

// ---------------------------------------------------------------------------
// HashCache public interface
// ---------------------------------------------------------------------------

HashCache::HashCache() : impl_(std::make_unique<Impl>()) {}
HashCache::~HashCache() = default;
HashCache::HashCache(HashCache&&) noexcept = default;
HashCache& HashCache::operator=(HashCache&&) noexcept = default;

std::string HashCache::default_cache_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.pinion/cache/hashes.db";
}

std::string HashCache::package_key(const std::string& name, const std::string& version) {
    return name + "==" + version;
}

Status HashCache::open(const std::string& db_path) {
    close();

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return PinionError(PinionError::IO,
                "Failed to create cache directory: " + parent.string());
        }
    }

    auto remove_files = [&]() {
        std::error_code ec;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
    };

    auto connect = [&]() -> Status {
        int rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            std::string msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return PinionError(PinionError::IO,
                "Failed to open hash cache: " + msg, "", db_path, 0);
        }
        PINION_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
            "PRAGMA cache_size=10000;"
        ));
        return impl_->init_schema();
    };

    auto first = connect();
    if (first.is_ok()) return ok_status();

    log::warn("hash cache at %s is unusable (%s), recreating",
              db_path.c_str(), first.error().message.c_str());
    close();
    remove_files();
    auto second = connect();
    if (second.is_err()) {
        close();
        return second;
    }
    return ok_status();
}

void HashCache::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool HashCache::is_open() const {
    return impl_->db != nullptr;
}

Result<std::vector<std::string>> HashCache::lookup(const std::string& key) {
    PINION_TRY(impl_->require_open());
    PINION_TRY(impl_->prepare(
        "SELECT hashes FROM artifact_hashes WHERE cache_key=?",
        impl_->stmt_lookup));

    sqlite3_reset(impl_->stmt_lookup);
    sqlite3_bind_text(impl_->stmt_lookup, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(impl_->stmt_lookup);
    if (rc == SQLITE_ROW) {
        const char* text = reinterpret_cast<const char*>(
            sqlite3_column_text(impl_->stmt_lookup, 0));
        return Result<std::vector<std::string>>::ok(split_lines(text ? text : ""));
    }
    if (rc != SQLITE_DONE) {
        return PinionError(PinionError::IO,
            std::string("Failed to read hash cache: ") + sqlite3_errmsg(impl_->db));
    }
    return PinionError(PinionError::NotFound, "No cached hashes for: " + key);
}

Status HashCache::store(const std::string& key, const std::vector<std::string>& hashes) {
    PINION_TRY(impl_->require_open());
    PINION_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO artifact_hashes (cache_key, hashes, created_at) "
        "VALUES (?, ?, strftime('%s','now'))",
        impl_->stmt_store));

    std::string joined = join_lines(hashes);
    sqlite3_reset(impl_->stmt_store);
    sqlite3_bind_text(impl_->stmt_store, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(impl_->stmt_store, 2, joined.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(impl_->stmt_store);
    if (rc != SQLITE_DONE) {
        return PinionError(PinionError::IO,
            std::string("Failed to store hashes: ") + sqlite3_errmsg(impl_->db));
    }
    return ok_status();
}

Status HashCache::remove(const std::string& key) {
    PINION_TRY(impl_->require_open());
    PINION_TRY(impl_->prepare(
        "DELETE FROM artifact_hashes WHERE cache_key=?",
        impl_->stmt_remove));

    sqlite3_reset(impl_->stmt_remove);
    sqlite3_bind_text(impl_->stmt_remove, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(impl_->stmt_remove) != SQLITE_DONE) {
        return PinionError(PinionError::IO,
            std::string("Failed to remove hashes: ") + sqlite3_errmsg(impl_->db));
    }
    return ok_status();
}

Status HashCache::clear() {
    PINION_TRY(impl_->require_open());
    return impl_->exec("DELETE FROM artifact_hashes;");
}

Result<int64_t> HashCache::count() {
    PINION_TRY(impl_->require_open());
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db,
        "SELECT COUNT(*) FROM artifact_hashes", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return PinionError(PinionError::IO, "Failed to count cached hashes");
    }
    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return Result<int64_t>::ok(n);
}

} // namespace pinion
