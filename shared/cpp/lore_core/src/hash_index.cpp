#include "../include/hash_index.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <set>

using json = nlohmann::json;

namespace {

struct Statement {
    sqlite3_stmt* st{nullptr};
    Statement(sqlite3* db, const std::string& sql) {
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr);
        if (rc != SQLITE_OK) {
            throw StorageError(std::string("prepare failed: ") + sqlite3_errmsg(db), rc);
        }
    }
    ~Statement() { if (st) sqlite3_finalize(st); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
};

void check_bind(sqlite3_stmt* st, int rc) {
    if (rc != SQLITE_OK) {
        throw StorageError(std::string("bind failed: ") + sqlite3_errmsg(sqlite3_db_handle(st)), rc);
    }
}

void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    check_bind(st, sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT));
}

void bind_int(sqlite3_stmt* st, int idx, int v) {
    check_bind(st, sqlite3_bind_int(st, idx, v));
}

void bind_int64(sqlite3_stmt* st, int idx, sqlite3_int64 v) {
    check_bind(st, sqlite3_bind_int64(st, idx, v));
}

void step_done(sqlite3_stmt* st, const char* what) {
    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE) {
        throw StorageError(std::string(what) + ": " + sqlite3_errmsg(sqlite3_db_handle(st)), rc);
    }
}

// SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws.
bool step_row(sqlite3_stmt* st, const char* what) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StorageError(std::string(what) + ": " + sqlite3_errmsg(sqlite3_db_handle(st)), rc);
}

std::string column_string(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    if (!t) return {};
    return std::string(reinterpret_cast<const char*>(t), (size_t)sqlite3_column_bytes(st, col));
}

std::optional<std::vector<std::string>> decode_history(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_array()) return std::nullopt;
    std::vector<std::string> out;
    for (const auto& v : j) {
        if (!v.is_string()) return std::nullopt;
        out.push_back(v.get<std::string>());
    }
    return out;
}

std::optional<DescriptionRecord> read_record(sqlite3_stmt* st) {
    DescriptionRecord r;
    r.fingerprint = column_string(st, 0);
    r.description = column_string(st, 1);
    r.stale = sqlite3_column_int(st, 2) != 0;
    r.created_at = column_string(st, 3);
    r.updated_at = column_string(st, 4);
    auto history = decode_history(column_string(st, 5));
    if (!history) {
        std::cerr << "[index] corrupt fingerprint_history for " << r.fingerprint
                  << ", treating record as absent" << std::endl;
        return std::nullopt;
    }
    r.fingerprint_history = std::move(*history);
    return r;
}

const std::string kSelectRecord =
    "SELECT fingerprint, description, stale, created_at, updated_at, fingerprint_history "
    "FROM descriptions";

std::optional<std::string> select_current(sqlite3* db, const std::string& identity) {
    Statement s(db, "SELECT fingerprint FROM bindings WHERE identity = ? ORDER BY seq DESC LIMIT 1;");
    bind_text(s.st, 1, identity);
    if (!step_row(s.st, "select binding failed")) return std::nullopt;
    return column_string(s.st, 0);
}

} // namespace

StorageError::StorageError(const std::string& what, int code)
    : std::runtime_error(what), code_(code) {}

bool StorageError::retryable() const {
    switch (code_ & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_PROTOCOL:
            return true;
        default:
            return false;
    }
}

HashIndex::HashIndex(const std::string& db_path) : path_(db_path) {
    auto parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
    int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open SQLite DB: " + db_path + ": " + msg, rc);
    }
    sqlite3_busy_timeout(db_, 5000);
    try {
        init();
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

HashIndex::~HashIndex() {
    if (db_) sqlite3_close(db_);
}

void HashIndex::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=FULL;");
    exec("CREATE TABLE IF NOT EXISTS descriptions (\n"
         "  fingerprint TEXT PRIMARY KEY,\n"
         "  description TEXT NOT NULL,\n"
         "  stale INTEGER NOT NULL DEFAULT 0,\n"
         "  created_at TEXT NOT NULL,\n"
         "  updated_at TEXT NOT NULL,\n"
         "  fingerprint_history TEXT NOT NULL DEFAULT '[]'\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_descriptions_stale ON descriptions(stale);");
    exec("CREATE TABLE IF NOT EXISTS bindings (\n"
         "  seq INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  identity TEXT NOT NULL,\n"
         "  fingerprint TEXT NOT NULL,\n"
         "  bound_at TEXT NOT NULL\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_bindings_identity ON bindings(identity, seq);");
}

void HashIndex::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StorageError("SQLite error: " + msg, rc);
    }
}

void HashIndex::begin() { exec("BEGIN IMMEDIATE;"); }

void HashIndex::commit() { exec("COMMIT;"); }

void HashIndex::rollback() noexcept {
    char* err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[index] rollback failed: " << (err ? err : "unknown") << std::endl;
    }
    sqlite3_free(err);
}

void HashIndex::write_record(const std::string& fingerprint,
                             const std::string& description,
                             bool stale,
                             const std::vector<std::string>& history,
                             const std::string& now) {
    Statement s(db_,
        "INSERT INTO descriptions "
        "(fingerprint, description, stale, created_at, updated_at, fingerprint_history) "
        "VALUES (?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(fingerprint) DO UPDATE SET "
        "description = excluded.description, stale = excluded.stale, "
        "updated_at = excluded.updated_at, fingerprint_history = excluded.fingerprint_history;");
    bind_text(s.st, 1, fingerprint);
    bind_text(s.st, 2, description);
    bind_int(s.st, 3, stale ? 1 : 0);
    bind_text(s.st, 4, now);
    bind_text(s.st, 5, now);
    bind_text(s.st, 6, json(history).dump());
    step_done(s.st, "write record failed");
}

void HashIndex::write_binding(const std::string& identity,
                              const std::string& fingerprint,
                              const std::string& now) {
    auto current = select_current(db_, identity);
    if (current && *current == fingerprint) return;
    Statement s(db_, "INSERT INTO bindings (identity, fingerprint, bound_at) VALUES (?, ?, ?);");
    bind_text(s.st, 1, identity);
    bind_text(s.st, 2, fingerprint);
    bind_text(s.st, 3, now);
    step_done(s.st, "write binding failed");
}

void HashIndex::prune_bindings(const std::string& identity, const std::vector<std::string>& keep) {
    std::vector<sqlite3_int64> drop;
    {
        Statement s(db_, "SELECT seq, fingerprint FROM bindings WHERE identity = ? ORDER BY seq DESC;");
        bind_text(s.st, 1, identity);
        std::set<std::string> kept;
        while (step_row(s.st, "select bindings failed")) {
            auto fp = column_string(s.st, 1);
            bool wanted = std::find(keep.begin(), keep.end(), fp) != keep.end();
            if (!wanted || !kept.insert(fp).second) drop.push_back(sqlite3_column_int64(s.st, 0));
        }
    }
    for (auto seq : drop) {
        Statement d(db_, "DELETE FROM bindings WHERE seq = ?;");
        bind_int64(d.st, 1, seq);
        step_done(d.st, "prune bindings failed");
    }
}

std::optional<DescriptionRecord> HashIndex::get(const std::string& fingerprint) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    Statement s(db_, kSelectRecord + " WHERE fingerprint = ?;");
    bind_text(s.st, 1, fingerprint);
    if (!step_row(s.st, "get failed")) return std::nullopt;
    return read_record(s.st);
}

void HashIndex::set(const std::string& fingerprint,
                    const std::string& description,
                    bool stale,
                    const std::vector<std::string>& history) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    write_record(fingerprint, description, stale, history, utc_timestamp());
}

bool HashIndex::set_stale_flag(const std::string& fingerprint, bool stale) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    Statement s(db_, "UPDATE descriptions SET stale = ?, updated_at = ? WHERE fingerprint = ?;");
    bind_int(s.st, 1, stale ? 1 : 0);
    bind_text(s.st, 2, utc_timestamp());
    bind_text(s.st, 3, fingerprint);
    step_done(s.st, "update stale flag failed");
    return sqlite3_changes(db_) > 0;
}

bool HashIndex::mark_stale(const std::string& fingerprint) {
    return set_stale_flag(fingerprint, true);
}

bool HashIndex::mark_fresh(const std::string& fingerprint) {
    return set_stale_flag(fingerprint, false);
}

std::vector<DescriptionRecord> HashIndex::select_records(const char* where) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    Statement s(db_, kSelectRecord + where);
    std::vector<DescriptionRecord> out;
    while (step_row(s.st, "select records failed")) {
        if (auto r = read_record(s.st)) out.push_back(std::move(*r));
    }
    return out;
}

std::vector<DescriptionRecord> HashIndex::list_stale() const {
    return select_records(" WHERE stale = 1 ORDER BY updated_at, fingerprint;");
}

std::vector<DescriptionRecord> HashIndex::list_all() const {
    return select_records(" ORDER BY fingerprint;");
}

bool HashIndex::remove(const std::string& fingerprint) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    Statement s(db_, "DELETE FROM descriptions WHERE fingerprint = ?;");
    bind_text(s.st, 1, fingerprint);
    step_done(s.st, "delete failed");
    return sqlite3_changes(db_) > 0;
}

void HashIndex::reset() {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    begin();
    try {
        exec("DELETE FROM descriptions;");
        exec("DELETE FROM bindings;");
        commit();
    } catch (const StorageError&) {
        rollback();
        throw;
    }
}

std::size_t HashIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    Statement s(db_, "SELECT COUNT(*) FROM descriptions;");
    if (!step_row(s.st, "count failed")) return 0;
    return (std::size_t)sqlite3_column_int64(s.st, 0);
}

std::optional<std::string> HashIndex::current_fingerprint(const std::string& identity) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return select_current(db_, identity);
}

std::vector<std::string> HashIndex::fingerprints_for(const std::string& identity) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    Statement s(db_,
        "SELECT fingerprint, MAX(seq) AS last FROM bindings WHERE identity = ? "
        "GROUP BY fingerprint ORDER BY last DESC;");
    bind_text(s.st, 1, identity);
    std::vector<std::string> out;
    while (step_row(s.st, "select bindings failed")) out.push_back(column_string(s.st, 0));
    return out;
}

void HashIndex::bind(const std::string& identity, const std::string& fingerprint) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    write_binding(identity, fingerprint, utc_timestamp());
}

void HashIndex::commit_generation(const std::string& identity,
                                  const std::string& fingerprint,
                                  const std::string& description,
                                  const std::vector<std::string>& history) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    auto now = utc_timestamp();
    begin();
    try {
        write_record(fingerprint, description, false, history, now);
        write_binding(identity, fingerprint, now);
        std::vector<std::string> keep{fingerprint};
        keep.insert(keep.end(), history.begin(), history.end());
        prune_bindings(identity, keep);
        commit();
    } catch (const StorageError&) {
        rollback();
        throw;
    }
}
