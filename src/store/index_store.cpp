#include <folio/index_store.hpp>
#include <folio/log.hpp>
#include <folio/uuid.hpp>
#include <sqlite3.h>

#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

namespace folio {

static const std::string SCHEMA_VERSION = "3";

static const char* SCHEMA_SQL =
    "CREATE TABLE IF NOT EXISTS schema_info ("
    "  key TEXT PRIMARY KEY,"
    "  value TEXT"
    ");"
    "CREATE TABLE IF NOT EXISTS repositories ("
    "  id TEXT PRIMARY KEY,"
    "  project_id TEXT NOT NULL UNIQUE,"
    "  path TEXT NOT NULL,"
    "  default_branch_id TEXT,"
    "  initialized INTEGER NOT NULL DEFAULT 0,"
    "  created_at TEXT NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS branches ("
    "  id TEXT PRIMARY KEY,"
    "  project_id TEXT NOT NULL,"
    "  name TEXT NOT NULL,"
    "  description TEXT,"
    "  source_branch_id TEXT,"
    "  head_commit TEXT,"
    "  is_default INTEGER NOT NULL DEFAULT 0,"
    "  is_protected INTEGER NOT NULL DEFAULT 0,"
    "  status TEXT NOT NULL DEFAULT 'active',"
    "  created_by TEXT,"
    "  created_at TEXT NOT NULL,"
    "  updated_at TEXT NOT NULL"
    ");"
    // Names are reusable once a branch is soft-deleted
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_branches_live_name "
    "  ON branches(project_id, name) WHERE status != 'deleted';"
    "CREATE TABLE IF NOT EXISTS files ("
    "  id TEXT PRIMARY KEY,"
    "  project_id TEXT NOT NULL,"
    "  branch_id TEXT NOT NULL,"
    "  path TEXT NOT NULL,"
    "  name TEXT NOT NULL,"
    "  type TEXT NOT NULL DEFAULT 'tex',"
    "  size INTEGER NOT NULL DEFAULT 0,"
    "  encoding TEXT NOT NULL DEFAULT 'utf-8',"
    "  created_by TEXT,"
    "  last_modified_by TEXT,"
    "  created_at TEXT NOT NULL,"
    "  updated_at TEXT NOT NULL,"
    "  deleted_at TEXT"
    ");"
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_files_live_path "
    "  ON files(branch_id, path) WHERE deleted_at IS NULL;"
    "CREATE TABLE IF NOT EXISTS branch_permissions ("
    "  branch_id TEXT NOT NULL,"
    "  user_id TEXT NOT NULL,"
    "  can_read INTEGER NOT NULL DEFAULT 0,"
    "  can_write INTEGER NOT NULL DEFAULT 0,"
    "  can_admin INTEGER NOT NULL DEFAULT 0,"
    "  granted_by TEXT,"
    "  granted_at TEXT NOT NULL,"
    "  PRIMARY KEY (branch_id, user_id)"
    ");";

static std::string col_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* p = sqlite3_column_text(stmt, col);
    return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
}

static void bind_text(sqlite3_stmt* stmt, int idx, const std::string& s) {
    sqlite3_bind_text(stmt, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL for optional foreign keys
static void bind_optional(sqlite3_stmt* stmt, int idx, const std::string& s) {
    if (s.empty()) {
        sqlite3_bind_null(stmt, idx);
    } else {
        sqlite3_bind_text(stmt, idx, s.c_str(), -1, SQLITE_TRANSIENT);
    }
}

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

struct IndexStore::Impl {
    sqlite3* db = nullptr;
    std::recursive_mutex mutex;
    int tx_depth = 0;

    // Prepared statements, keyed by SQL text
    std::unordered_map<std::string, sqlite3_stmt*> stmts;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        for (auto& [sql, stmt] : stmts) {
            sqlite3_finalize(stmt);
        }
        stmts.clear();
    }

    FolioError db_error(const std::string& what) const {
        int ext = db ? sqlite3_extended_errcode(db) : 0;
        std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : "database not open");
        if (ext == SQLITE_CONSTRAINT_UNIQUE || ext == SQLITE_CONSTRAINT_PRIMARYKEY) {
            return FolioError(FolioError::Conflict, msg);
        }
        return FolioError(FolioError::Database, msg);
    }

    // Cached statement, reset and with bindings cleared
    Result<sqlite3_stmt*> prepare(const char* sql) {
        if (!db) {
            return FolioError(FolioError::Database, "index database is not open",
                              "call IndexStore::open() first");
        }
        auto it = stmts.find(sql);
        if (it != stmts.end()) {
            sqlite3_reset(it->second);
            sqlite3_clear_bindings(it->second);
            return Result<sqlite3_stmt*>::ok(it->second);
        }
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return db_error("SQLite prepare failed");
        }
        stmts.emplace(sql, stmt);
        return Result<sqlite3_stmt*>::ok(stmt);
    }

    Status exec(const std::string& sql) {
        if (!db) {
            return FolioError(FolioError::Database, "index database is not open");
        }
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return FolioError(FolioError::Database, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    // Step a write statement to completion
    Status step_done(sqlite3_stmt* stmt, const char* what) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            FolioError err = db_error(what);
            sqlite3_reset(stmt);
            return err;
        }
        sqlite3_reset(stmt);
        return ok_status();
    }

    Status init_schema() {
        FOLIO_TRY(exec(SCHEMA_SQL));

        auto stmt = prepare("SELECT value FROM schema_info WHERE key='version'");
        if (stmt.is_err()) return std::move(stmt).error();
        sqlite3_stmt* s = stmt.value();

        int rc = sqlite3_step(s);
        if (rc == SQLITE_ROW) {
            std::string ver = col_text(s, 0);
            sqlite3_reset(s);
            if (ver != SCHEMA_VERSION) {
                // The index is a source of truth, never wiped on mismatch
                return FolioError(FolioError::Database,
                    "index schema version " + ver + " does not match " + SCHEMA_VERSION,
                    "migrate or move the database aside");
            }
            return ok_status();
        }
        sqlite3_reset(s);
        if (rc != SQLITE_DONE) return db_error("failed to read schema version");

        return exec("INSERT OR REPLACE INTO schema_info (key, value) "
                    "VALUES ('version', '" + SCHEMA_VERSION + "');");
    }
};

// ---------------------------------------------------------------------------
// Row readers
// ---------------------------------------------------------------------------

#define REPO_COLS \
    "id, project_id, path, default_branch_id, initialized, created_at"

static Repository read_repository(sqlite3_stmt* s) {
    Repository r;
    r.id = col_text(s, 0);
    r.project_id = col_text(s, 1);
    r.path = col_text(s, 2);
    r.default_branch_id = col_text(s, 3);
    r.initialized = sqlite3_column_int(s, 4) != 0;
    r.created_at = col_text(s, 5);
    return r;
}

#define BRANCH_COLS \
    "id, project_id, name, description, source_branch_id, head_commit, " \
    "is_default, is_protected, status, created_by, created_at, updated_at"

static Branch read_branch(sqlite3_stmt* s) {
    Branch b;
    b.id = col_text(s, 0);
    b.project_id = col_text(s, 1);
    b.name = col_text(s, 2);
    b.description = col_text(s, 3);
    b.source_branch_id = col_text(s, 4);
    b.head_commit = col_text(s, 5);
    b.is_default = sqlite3_column_int(s, 6) != 0;
    b.is_protected = sqlite3_column_int(s, 7) != 0;
    if (!parse_branch_status(col_text(s, 8), b.status)) {
        log::warn("branch %s has unknown status '%s', treating as active",
                  b.id.c_str(), col_text(s, 8).c_str());
        b.status = BranchStatus::Active;
    }
    b.created_by = col_text(s, 9);
    b.created_at = col_text(s, 10);
    b.updated_at = col_text(s, 11);
    return b;
}

#define FILE_COLS \
    "id, project_id, branch_id, path, name, type, size, encoding, " \
    "created_by, last_modified_by, created_at, updated_at, deleted_at"

static FileRecord read_file(sqlite3_stmt* s) {
    FileRecord f;
    f.id = col_text(s, 0);
    f.project_id = col_text(s, 1);
    f.branch_id = col_text(s, 2);
    f.path = col_text(s, 3);
    f.name = col_text(s, 4);
    f.type = col_text(s, 5);
    f.size = sqlite3_column_int64(s, 6);
    f.encoding = col_text(s, 7);
    f.created_by = col_text(s, 8);
    f.last_modified_by = col_text(s, 9);
    f.created_at = col_text(s, 10);
    f.updated_at = col_text(s, 11);
    if (sqlite3_column_type(s, 12) != SQLITE_NULL) {
        f.deleted_at = col_text(s, 12);
    }
    return f;
}

static BranchPermission read_permission(sqlite3_stmt* s) {
    BranchPermission p;
    p.branch_id = col_text(s, 0);
    p.user_id = col_text(s, 1);
    p.flags.can_read = sqlite3_column_int(s, 2) != 0;
    p.flags.can_write = sqlite3_column_int(s, 3) != 0;
    p.flags.can_admin = sqlite3_column_int(s, 4) != 0;
    p.granted_by = col_text(s, 5);
    p.granted_at = col_text(s, 6);
    return p;
}

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

IndexStore::Transaction::Transaction(Impl* impl,
                                     std::unique_lock<std::recursive_mutex> lock,
                                     std::string savepoint)
    : impl_(impl), lock_(std::move(lock)), savepoint_(std::move(savepoint)),
      active_(true) {}

IndexStore::Transaction::Transaction(Transaction&& other) noexcept
    : impl_(other.impl_), lock_(std::move(other.lock_)),
      savepoint_(std::move(other.savepoint_)), active_(other.active_) {
    other.active_ = false;
    other.impl_ = nullptr;
}

IndexStore::Transaction::~Transaction() {
    if (active_) {
        auto r = rollback();
        if (r.is_err()) {
            log::error("index rollback failed: %s", r.error().message.c_str());
        }
    }
}

Status IndexStore::Transaction::commit() {
    if (!active_) {
        return FolioError(FolioError::InvalidArg, "transaction is no longer active");
    }
    auto r = impl_->exec("RELEASE SAVEPOINT " + savepoint_);
    if (r.is_err()) return r;
    active_ = false;
    impl_->tx_depth--;
    return ok_status();
}

Status IndexStore::Transaction::rollback() {
    if (!active_) return ok_status();
    active_ = false;
    impl_->tx_depth--;
    FOLIO_TRY(impl_->exec("ROLLBACK TO SAVEPOINT " + savepoint_));
    FOLIO_TRY(impl_->exec("RELEASE SAVEPOINT " + savepoint_));
    return ok_status();
}

// ---------------------------------------------------------------------------
// IndexStore lifecycle
// ---------------------------------------------------------------------------

IndexStore::IndexStore() : impl_(std::make_unique<Impl>()) {}
IndexStore::~IndexStore() = default;
IndexStore::IndexStore(IndexStore&&) noexcept = default;
IndexStore& IndexStore::operator=(IndexStore&&) noexcept = default;

Status IndexStore::open(const std::string& db_path) {
    close();
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);

    bool in_memory = db_path == ":memory:";
    if (!in_memory) {
        fs::path parent = fs::path(db_path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return FolioError(FolioError::IO,
                    "failed to create index directory: " + parent.string());
            }
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return FolioError(FolioError::Database,
            "failed to open index database " + db_path + ": " + err_msg);
    }
    sqlite3_busy_timeout(impl_->db, 5000);

    auto setup = [&]() -> Status {
        if (!in_memory) {
            FOLIO_TRY(impl_->exec("PRAGMA journal_mode=WAL;"));
        }
        FOLIO_TRY(impl_->exec("PRAGMA synchronous=NORMAL;"));
        FOLIO_TRY(impl_->init_schema());
        return ok_status();
    };

    auto setup_result = setup();
    if (setup_result.is_err()) {
        close();
        return setup_result;
    }

    log::debug("index database open: %s", db_path.c_str());
    return ok_status();
}

void IndexStore::close() {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        impl_->tx_depth = 0;
    }
}

bool IndexStore::is_open() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    return impl_->db != nullptr;
}

Result<IndexStore::Transaction> IndexStore::begin() {
    std::unique_lock<std::recursive_mutex> lock(impl_->mutex);
    std::string name = "folio_tx_" + std::to_string(impl_->tx_depth + 1);
    FOLIO_TRY(impl_->exec("SAVEPOINT " + name));
    impl_->tx_depth++;
    return Result<Transaction>::ok(Transaction(impl_.get(), std::move(lock), name));
}

Status IndexStore::execute(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    return impl_->exec(sql);
}

// ---------------------------------------------------------------------------
// Repositories
// ---------------------------------------------------------------------------

Result<Repository> IndexStore::get_repository(const std::string& project_id) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "SELECT " REPO_COLS " FROM repositories WHERE project_id=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, project_id);
    int rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        Repository r = read_repository(s);
        sqlite3_reset(s);
        return Result<Repository>::ok(std::move(r));
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) return impl_->db_error("failed to read repository");
    return FolioError(FolioError::NotFound,
        "no repository for project " + project_id,
        "initialize the repository first");
}

Status IndexStore::insert_repository(const Repository& repo) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "INSERT INTO repositories "
        "(id, project_id, path, default_branch_id, initialized, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?)");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, repo.id);
    bind_text(s, 2, repo.project_id);
    bind_text(s, 3, repo.path);
    bind_optional(s, 4, repo.default_branch_id);
    sqlite3_bind_int(s, 5, repo.initialized ? 1 : 0);
    bind_text(s, 6, repo.created_at.empty() ? utc_timestamp() : repo.created_at);
    return impl_->step_done(s, "failed to insert repository");
}

Status IndexStore::update_repository(const Repository& repo) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "UPDATE repositories SET path=?, default_branch_id=?, initialized=? "
        "WHERE id=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, repo.path);
    bind_optional(s, 2, repo.default_branch_id);
    sqlite3_bind_int(s, 3, repo.initialized ? 1 : 0);
    bind_text(s, 4, repo.id);
    return impl_->step_done(s, "failed to update repository");
}

// ---------------------------------------------------------------------------
// Branches
// ---------------------------------------------------------------------------

Result<Branch> IndexStore::get_branch(const std::string& branch_id) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare("SELECT " BRANCH_COLS " FROM branches WHERE id=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, branch_id);
    int rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        Branch b = read_branch(s);
        sqlite3_reset(s);
        return Result<Branch>::ok(std::move(b));
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) return impl_->db_error("failed to read branch");
    return FolioError(FolioError::NotFound, "branch " + branch_id + " not found");
}

Result<Branch> IndexStore::find_branch(const std::string& project_id,
                                       const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "SELECT " BRANCH_COLS " FROM branches "
        "WHERE project_id=? AND name=? AND status != 'deleted'");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, project_id);
    bind_text(s, 2, name);
    int rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        Branch b = read_branch(s);
        sqlite3_reset(s);
        return Result<Branch>::ok(std::move(b));
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) return impl_->db_error("failed to read branch");
    return FolioError(FolioError::NotFound,
        "branch '" + name + "' not found in project " + project_id);
}

Status IndexStore::insert_branch(const Branch& b) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "INSERT INTO branches (" BRANCH_COLS ") "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    std::string now = utc_timestamp();
    bind_text(s, 1, b.id);
    bind_text(s, 2, b.project_id);
    bind_text(s, 3, b.name);
    bind_text(s, 4, b.description);
    bind_optional(s, 5, b.source_branch_id);
    bind_text(s, 6, b.head_commit);
    sqlite3_bind_int(s, 7, b.is_default ? 1 : 0);
    sqlite3_bind_int(s, 8, b.is_protected ? 1 : 0);
    bind_text(s, 9, branch_status_name(b.status));
    bind_text(s, 10, b.created_by);
    bind_text(s, 11, b.created_at.empty() ? now : b.created_at);
    bind_text(s, 12, b.updated_at.empty() ? now : b.updated_at);

    auto r = impl_->step_done(s, "failed to insert branch");
    if (r.has_code(FolioError::Conflict)) {
        return FolioError(FolioError::Conflict,
            "branch '" + b.name + "' already exists");
    }
    return r;
}

Status IndexStore::update_branch(const Branch& b) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "UPDATE branches SET description=?, head_commit=?, is_protected=?, "
        "status=?, updated_at=? WHERE id=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, b.description);
    bind_text(s, 2, b.head_commit);
    sqlite3_bind_int(s, 3, b.is_protected ? 1 : 0);
    bind_text(s, 4, branch_status_name(b.status));
    bind_text(s, 5, utc_timestamp());
    bind_text(s, 6, b.id);
    return impl_->step_done(s, "failed to update branch");
}

Status IndexStore::update_branch_head(const std::string& branch_id,
                                      const std::string& commit) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "UPDATE branches SET head_commit=?, updated_at=? WHERE id=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, commit);
    bind_text(s, 2, utc_timestamp());
    bind_text(s, 3, branch_id);
    return impl_->step_done(s, "failed to update branch head");
}

Result<std::vector<Branch>> IndexStore::list_branches(const std::string& project_id,
                                                      int offset, int limit) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "SELECT " BRANCH_COLS " FROM branches "
        "WHERE project_id=? AND status != 'deleted' "
        "ORDER BY is_default DESC, created_at ASC, name ASC "
        "LIMIT ? OFFSET ?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, project_id);
    sqlite3_bind_int(s, 2, limit);
    sqlite3_bind_int(s, 3, offset);

    std::vector<Branch> out;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        out.push_back(read_branch(s));
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) return impl_->db_error("failed to list branches");
    return Result<std::vector<Branch>>::ok(std::move(out));
}

Result<int64_t> IndexStore::count_branches(const std::string& project_id) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "SELECT COUNT(*) FROM branches WHERE project_id=? AND status != 'deleted'");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, project_id);
    int rc = sqlite3_step(s);
    int64_t n = rc == SQLITE_ROW ? sqlite3_column_int64(s, 0) : 0;
    sqlite3_reset(s);
    if (rc != SQLITE_ROW) return impl_->db_error("failed to count branches");
    return Result<int64_t>::ok(n);
}

// ---------------------------------------------------------------------------
// File records
// ---------------------------------------------------------------------------

Result<FileRecord> IndexStore::find_file(const std::string& branch_id,
                                         const std::string& path) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "SELECT " FILE_COLS " FROM files "
        "WHERE branch_id=? AND path=? AND deleted_at IS NULL");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, branch_id);
    bind_text(s, 2, path);
    int rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        FileRecord f = read_file(s);
        sqlite3_reset(s);
        return Result<FileRecord>::ok(std::move(f));
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) return impl_->db_error("failed to read file record");
    return FolioError(FolioError::NotFound, "no file record for " + path);
}

Result<std::vector<FileRecord>> IndexStore::list_files(const std::string& branch_id) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "SELECT " FILE_COLS " FROM files "
        "WHERE branch_id=? AND deleted_at IS NULL ORDER BY path");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, branch_id);
    std::vector<FileRecord> out;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        out.push_back(read_file(s));
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) return impl_->db_error("failed to list file records");
    return Result<std::vector<FileRecord>>::ok(std::move(out));
}

Result<int64_t> IndexStore::count_files(const std::string& branch_id) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "SELECT COUNT(*) FROM files WHERE branch_id=? AND deleted_at IS NULL");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, branch_id);
    int rc = sqlite3_step(s);
    int64_t n = rc == SQLITE_ROW ? sqlite3_column_int64(s, 0) : 0;
    sqlite3_reset(s);
    if (rc != SQLITE_ROW) return impl_->db_error("failed to count file records");
    return Result<int64_t>::ok(n);
}

Result<FileRecord> IndexStore::upsert_file(const FileRecord& record) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    std::string now = utc_timestamp();

    // Latest record for the path, live or soft-deleted
    auto find = impl_->prepare(
        "SELECT " FILE_COLS " FROM files WHERE branch_id=? AND path=? "
        "ORDER BY (deleted_at IS NULL) DESC, updated_at DESC LIMIT 1");
    if (find.is_err()) return std::move(find).error();
    sqlite3_stmt* q = find.value();
    bind_text(q, 1, record.branch_id);
    bind_text(q, 2, record.path);
    int rc = sqlite3_step(q);
    std::optional<FileRecord> existing;
    if (rc == SQLITE_ROW) existing = read_file(q);
    sqlite3_reset(q);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return impl_->db_error("failed to look up file record");
    }

    if (existing) {
        auto stmt = impl_->prepare(
            "UPDATE files SET size=?, type=?, last_modified_by=?, updated_at=?, "
            "deleted_at=NULL WHERE id=?");
        if (stmt.is_err()) return std::move(stmt).error();
        sqlite3_stmt* s = stmt.value();
        sqlite3_bind_int64(s, 1, record.size);
        bind_text(s, 2, record.type);
        bind_text(s, 3, record.last_modified_by);
        bind_text(s, 4, now);
        bind_text(s, 5, existing->id);
        FOLIO_TRY(impl_->step_done(s, "failed to update file record"));

        FileRecord out = *existing;
        out.size = record.size;
        out.type = record.type;
        out.last_modified_by = record.last_modified_by;
        out.updated_at = now;
        out.deleted_at.reset();
        return Result<FileRecord>::ok(std::move(out));
    }

    FileRecord out = record;
    if (out.id.empty()) out.id = new_id();
    out.created_at = now;
    out.updated_at = now;
    out.deleted_at.reset();

    auto stmt = impl_->prepare(
        "INSERT INTO files (" FILE_COLS ") "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, NULL)");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    bind_text(s, 1, out.id);
    bind_text(s, 2, out.project_id);
    bind_text(s, 3, out.branch_id);
    bind_text(s, 4, out.path);
    bind_text(s, 5, out.name);
    bind_text(s, 6, out.type);
    sqlite3_bind_int64(s, 7, out.size);
    bind_text(s, 8, out.encoding);
    bind_text(s, 9, out.created_by);
    bind_text(s, 10, out.last_modified_by);
    bind_text(s, 11, out.created_at);
    bind_text(s, 12, out.updated_at);
    FOLIO_TRY(impl_->step_done(s, "failed to insert file record"));
    return Result<FileRecord>::ok(std::move(out));
}

Status IndexStore::update_file_size(const std::string& file_id, int64_t size) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare("UPDATE files SET size=?, updated_at=? WHERE id=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    sqlite3_bind_int64(s, 1, size);
    bind_text(s, 2, utc_timestamp());
    bind_text(s, 3, file_id);
    return impl_->step_done(s, "failed to update file size");
}

Result<bool> IndexStore::soft_delete_file(const std::string& branch_id,
                                          const std::string& path,
                                          const std::string& actor_id) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "UPDATE files SET deleted_at=?, last_modified_by=?, updated_at=? "
        "WHERE branch_id=? AND path=? AND deleted_at IS NULL");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    std::string now = utc_timestamp();
    bind_text(s, 1, now);
    bind_text(s, 2, actor_id);
    bind_text(s, 3, now);
    bind_text(s, 4, branch_id);
    bind_text(s, 5, path);
    FOLIO_TRY(impl_->step_done(s, "failed to soft-delete file record"));
    return Result<bool>::ok(sqlite3_changes(impl_->db) > 0);
}

// ---------------------------------------------------------------------------
// Branch permissions
// ---------------------------------------------------------------------------

Result<std::optional<BranchPermission>> IndexStore::get_permission(
    const std::string& branch_id, const std::string& user_id) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "SELECT branch_id, user_id, can_read, can_write, can_admin, granted_by, "
        "granted_at FROM branch_permissions WHERE branch_id=? AND user_id=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, branch_id);
    bind_text(s, 2, user_id);
    int rc = sqlite3_step(s);
    std::optional<BranchPermission> out;
    if (rc == SQLITE_ROW) out = read_permission(s);
    sqlite3_reset(s);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return impl_->db_error("failed to read permission");
    }
    return Result<std::optional<BranchPermission>>::ok(std::move(out));
}

Status IndexStore::upsert_permission(const BranchPermission& p) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "INSERT INTO branch_permissions "
        "(branch_id, user_id, can_read, can_write, can_admin, granted_by, granted_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(branch_id, user_id) DO UPDATE SET "
        "can_read=excluded.can_read, can_write=excluded.can_write, "
        "can_admin=excluded.can_admin, granted_by=excluded.granted_by, "
        "granted_at=excluded.granted_at");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, p.branch_id);
    bind_text(s, 2, p.user_id);
    sqlite3_bind_int(s, 3, p.flags.can_read ? 1 : 0);
    sqlite3_bind_int(s, 4, p.flags.can_write ? 1 : 0);
    sqlite3_bind_int(s, 5, p.flags.can_admin ? 1 : 0);
    bind_text(s, 6, p.granted_by);
    bind_text(s, 7, p.granted_at.empty() ? utc_timestamp() : p.granted_at);
    return impl_->step_done(s, "failed to store permission");
}

Status IndexStore::delete_permission(const std::string& branch_id,
                                     const std::string& user_id) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "DELETE FROM branch_permissions WHERE branch_id=? AND user_id=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, branch_id);
    bind_text(s, 2, user_id);
    return impl_->step_done(s, "failed to delete permission");
}

Result<std::vector<BranchPermission>> IndexStore::list_permissions(
    const std::string& branch_id) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto stmt = impl_->prepare(
        "SELECT branch_id, user_id, can_read, can_write, can_admin, granted_by, "
        "granted_at FROM branch_permissions WHERE branch_id=? ORDER BY user_id");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    bind_text(s, 1, branch_id);
    std::vector<BranchPermission> out;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        out.push_back(read_permission(s));
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) return impl_->db_error("failed to list permissions");
    return Result<std::vector<BranchPermission>>::ok(std::move(out));
}

} // namespace folio
