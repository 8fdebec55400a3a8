#include <adocref/descriptor_cache.hpp>
#include <sqlite3.h>

#include <cerrno>
#include <mutex>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace adocref {

// ---------------------------------------------------------------------------
// FileStamp
// ---------------------------------------------------------------------------

Result<FileStamp> FileStamp::of(const fs::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return RefError::io("stat file", path, std::error_code(errno, std::generic_category()));
    }
    FileStamp s;
    s.inode = static_cast<uint64_t>(st.st_ino);
    s.mtime_sec = static_cast<int64_t>(st.st_mtim.tv_sec);
    s.mtime_nsec = static_cast<int64_t>(st.st_mtim.tv_nsec);
    s.size = static_cast<int64_t>(st.st_size);
    return Result<FileStamp>::ok(s);
}

bool FileStamp::operator==(const FileStamp& o) const {
    return inode == o.inode && mtime_sec == o.mtime_sec &&
           mtime_nsec == o.mtime_nsec && size == o.size;
}

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

struct DescriptorCache::Impl {
    sqlite3* db = nullptr;
    // Lookups happen under the index's shared lock, possibly from several
    // readers at once
    std::mutex mutex;

    sqlite3_stmt* stmt_lookup = nullptr;
    sqlite3_stmt* stmt_lookup_attrs = nullptr;
    sqlite3_stmt* stmt_store = nullptr;
    sqlite3_stmt* stmt_del_attrs = nullptr;
    sqlite3_stmt* stmt_insert_attr = nullptr;
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
        fin(stmt_lookup_attrs);
        fin(stmt_store);
        fin(stmt_del_attrs);
        fin(stmt_insert_attr);
        fin(stmt_remove);
    }

    Status require_open() const {
        if (!db) return RefError(RefError::Cache, "descriptor cache is not open");
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return RefError::cache("SQLite prepare failed", sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return RefError::cache("SQLite exec failed", msg);
        }
        return ok_status();
    }

    Status init_schema() {
        ADOCREF_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS descriptor ("
            "  path TEXT PRIMARY KEY,"
            "  inode INTEGER,"
            "  mtime_sec INTEGER,"
            "  mtime_nsec INTEGER,"
            "  size INTEGER,"
            "  name TEXT,"
            "  version TEXT,"
            "  title TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS descriptor_attr ("
            "  path TEXT,"
            "  ord INTEGER,"
            "  key TEXT,"
            "  value TEXT,"
            "  PRIMARY KEY (path, ord)"
            ");"
        ));

        std::string version;
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            version = column_text(stmt, 0);
        }
        if (stmt) sqlite3_finalize(stmt);

        if (version == SCHEMA_VERSION) return ok_status();

        // Missing or stale schema: start over
        ADOCREF_TRY(exec(
            "DELETE FROM descriptor;"
            "DELETE FROM descriptor_attr;"
        ));
        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(ver_sql.c_str());
    }
};

// ---------------------------------------------------------------------------
// DescriptorCache public interface
// ---------------------------------------------------------------------------

DescriptorCache::DescriptorCache() : impl_(std::make_unique<Impl>()) {}
DescriptorCache::~DescriptorCache() = default;
DescriptorCache::DescriptorCache(DescriptorCache&&) noexcept = default;
DescriptorCache& DescriptorCache::operator=(DescriptorCache&&) noexcept = default;

Status DescriptorCache::open(const std::string& db_path) {
    close();

    if (db_path != ":memory:") {
        fs::path parent = fs::path(db_path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return RefError::io("create cache directory", parent, ec);
            }
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return RefError::cache("failed to open descriptor cache", err_msg).at(db_path);
    }

    auto setup = impl_->init_schema();
    if (setup.is_err() && db_path != ":memory:") {
        // Corrupt database: delete and retry once
        close();
        std::error_code ec;
        fs::remove(db_path, ec);
        rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return RefError::cache("failed to recreate descriptor cache",
                                   sqlite3_errstr(rc)).at(db_path);
        }
        setup = impl_->init_schema();
    }
    return setup;
}

void DescriptorCache::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool DescriptorCache::is_open() const {
    return impl_->db != nullptr;
}

Result<ModuleDescriptor> DescriptorCache::lookup(const fs::path& file,
                                                 const FileStamp& stamp) {
    std::lock_guard<std::mutex> guard(impl_->mutex);
    ADOCREF_TRY(impl_->require_open());
    ADOCREF_TRY(impl_->prepare(
        "SELECT inode, mtime_sec, mtime_nsec, size, name, version, title "
        "FROM descriptor WHERE path=?",
        impl_->stmt_lookup));

    std::string key = file.string();
    sqlite3_stmt* stmt = impl_->stmt_lookup;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_reset(stmt);
        return RefError(RefError::NotFound, "no cached descriptor for: " + key);
    }

    FileStamp cached;
    cached.inode = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    cached.mtime_sec = sqlite3_column_int64(stmt, 1);
    cached.mtime_nsec = sqlite3_column_int64(stmt, 2);
    cached.size = sqlite3_column_int64(stmt, 3);
    if (cached != stamp) {
        sqlite3_reset(stmt);
        return RefError(RefError::NotFound, "stale cached descriptor for: " + key);
    }

    ModuleDescriptor d;
    d.declaring_file = file;
    d.root_dir = file.parent_path();
    d.component_name = column_text(stmt, 4);
    d.component_version = column_text(stmt, 5);
    d.title = column_text(stmt, 6);
    sqlite3_reset(stmt);

    ADOCREF_TRY(impl_->prepare(
        "SELECT key, value FROM descriptor_attr WHERE path=? ORDER BY ord",
        impl_->stmt_lookup_attrs));
    sqlite3_stmt* attrs = impl_->stmt_lookup_attrs;
    sqlite3_reset(attrs);
    sqlite3_bind_text(attrs, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(attrs) == SQLITE_ROW) {
        d.attributes.emplace_back(column_text(attrs, 0), column_text(attrs, 1));
    }
    sqlite3_reset(attrs);

    return Result<ModuleDescriptor>::ok(std::move(d));
}

Status DescriptorCache::store(const ModuleDescriptor& descriptor,
                              const FileStamp& stamp) {
    std::lock_guard<std::mutex> guard(impl_->mutex);
    ADOCREF_TRY(impl_->require_open());
    ADOCREF_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO descriptor "
        "(path, inode, mtime_sec, mtime_nsec, size, name, version, title) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
        impl_->stmt_store));
    ADOCREF_TRY(impl_->prepare(
        "DELETE FROM descriptor_attr WHERE path=?",
        impl_->stmt_del_attrs));
    ADOCREF_TRY(impl_->prepare(
        "INSERT INTO descriptor_attr (path, ord, key, value) VALUES (?, ?, ?, ?)",
        impl_->stmt_insert_attr));

    std::string key = descriptor.declaring_file.string();

    ADOCREF_TRY(impl_->exec("BEGIN"));

    sqlite3_stmt* stmt = impl_->stmt_store;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(stamp.inode));
    sqlite3_bind_int64(stmt, 3, stamp.mtime_sec);
    sqlite3_bind_int64(stmt, 4, stamp.mtime_nsec);
    sqlite3_bind_int64(stmt, 5, stamp.size);
    sqlite3_bind_text(stmt, 6, descriptor.component_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, descriptor.component_version.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, descriptor.title.c_str(), -1, SQLITE_TRANSIENT);
    bool ok = sqlite3_step(stmt) == SQLITE_DONE;

    if (ok) {
        sqlite3_reset(impl_->stmt_del_attrs);
        sqlite3_bind_text(impl_->stmt_del_attrs, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        ok = sqlite3_step(impl_->stmt_del_attrs) == SQLITE_DONE;
    }

    int ord = 0;
    for (const auto& [k, v] : descriptor.attributes) {
        if (!ok) break;
        sqlite3_stmt* ins = impl_->stmt_insert_attr;
        sqlite3_reset(ins);
        sqlite3_bind_text(ins, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(ins, 2, ord++);
        sqlite3_bind_text(ins, 3, k.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(ins, 4, v.c_str(), -1, SQLITE_TRANSIENT);
        ok = sqlite3_step(ins) == SQLITE_DONE;
    }

    if (!ok) {
        std::string msg = sqlite3_errmsg(impl_->db);
        ADOCREF_TRY(impl_->exec("ROLLBACK"));
        return RefError::cache("failed to store descriptor", msg).at(key);
    }
    return impl_->exec("COMMIT");
}

Status DescriptorCache::remove(const fs::path& file) {
    std::lock_guard<std::mutex> guard(impl_->mutex);
    ADOCREF_TRY(impl_->require_open());
    ADOCREF_TRY(impl_->prepare(
        "DELETE FROM descriptor WHERE path=?",
        impl_->stmt_remove));
    ADOCREF_TRY(impl_->prepare(
        "DELETE FROM descriptor_attr WHERE path=?",
        impl_->stmt_del_attrs));

    std::string key = file.string();
    for (sqlite3_stmt* stmt : {impl_->stmt_remove, impl_->stmt_del_attrs}) {
        sqlite3_reset(stmt);
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            return RefError::cache("failed to remove descriptor", sqlite3_errmsg(impl_->db))
                .at(key);
        }
    }
    return ok_status();
}

Status DescriptorCache::clear() {
    std::lock_guard<std::mutex> guard(impl_->mutex);
    ADOCREF_TRY(impl_->require_open());
    return impl_->exec(
        "DELETE FROM descriptor;"
        "DELETE FROM descriptor_attr;"
    );
}

Result<int64_t> DescriptorCache::count() {
    std::lock_guard<std::mutex> guard(impl_->mutex);
    ADOCREF_TRY(impl_->require_open());

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, "SELECT COUNT(*) FROM descriptor",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return RefError::cache("failed to count descriptors", sqlite3_errstr(rc));
    }
    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return Result<int64_t>::ok(n);
}

} // namespace adocref
