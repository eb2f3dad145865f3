#include "guard_audit.h"

#include "util.h"

#include <sqlite3.h>

using nlohmann::json;

namespace {

struct Stmt {
    sqlite3_stmt* stmt = nullptr;
    ~Stmt() {
        if (stmt) sqlite3_finalize(stmt);
    }
};

std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* v = sqlite3_column_text(stmt, col);
    return v ? reinterpret_cast<const char*>(v) : "";
}

} // namespace

GuardAuditLog::GuardAuditLog() = default;

GuardAuditLog::~GuardAuditLog() {
    if (db_) sqlite3_close(db_);
}

bool GuardAuditLog::open(const std::string& path, std::string* err) {
    std::lock_guard<std::mutex> lock(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        if (err) *err = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    if (!ensure_schema(err)) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    return true;
}

bool GuardAuditLog::exec(const std::string& sql, std::string* err) const {
    char* errmsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        if (err) *err = errmsg ? errmsg : "sqlite exec failed";
        sqlite3_free(errmsg);
        return false;
    }
    return true;
}

bool GuardAuditLog::ensure_schema(std::string* err) {
    if (!exec("PRAGMA journal_mode=WAL;", err)) return false;
    if (!exec("CREATE TABLE IF NOT EXISTS guard_events("
              "id INTEGER PRIMARY KEY AUTOINCREMENT,"
              "ts_ms INTEGER,"
              "request_id TEXT,"
              "stage TEXT,"
              "category TEXT,"
              "detail TEXT);", err)) return false;
    if (!exec("CREATE INDEX IF NOT EXISTS idx_guard_events_stage ON guard_events(stage);", err)) return false;
    return true;
}

void GuardAuditLog::record(const GuardEvent& ev) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return;

    const char* sql =
        "INSERT INTO guard_events(ts_ms, request_id, stage, category, detail) VALUES(?, ?, ?, ?, ?);";
    Stmt stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt.stmt, nullptr) != SQLITE_OK) {
        log_event("audit.error", std::string("prepare: ") + sqlite3_errmsg(db_));
        return;
    }
    const int64_t ts = ev.ts_ms > 0 ? ev.ts_ms : now_ms_epoch();
    sqlite3_bind_int64(stmt.stmt, 1, static_cast<sqlite3_int64>(ts));
    sqlite3_bind_text(stmt.stmt, 2, ev.request_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.stmt, 3, ev.stage.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.stmt, 4, ev.category.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.stmt, 5, ev.detail.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.stmt) != SQLITE_DONE) {
        log_event("audit.error", std::string("insert: ") + sqlite3_errmsg(db_) +
                                     " stage=" + ev.stage + " request_id=" + ev.request_id);
    }
}

std::vector<GuardEvent> GuardAuditLog::recent(size_t limit, size_t offset) const {
    std::vector<GuardEvent> out;
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_ || limit == 0) return out;

    const char* sql =
        "SELECT id, ts_ms, request_id, stage, category, detail "
        "FROM guard_events "
        "ORDER BY id DESC "
        "LIMIT ? OFFSET ?;";
    Stmt stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt.stmt, nullptr) != SQLITE_OK) {
        log_event("audit.error", std::string("prepare: ") + sqlite3_errmsg(db_));
        return out;
    }
    sqlite3_bind_int64(stmt.stmt, 1, static_cast<sqlite3_int64>(limit));
    sqlite3_bind_int64(stmt.stmt, 2, static_cast<sqlite3_int64>(offset));

    while (sqlite3_step(stmt.stmt) == SQLITE_ROW) {
        GuardEvent ev;
        ev.id = static_cast<int64_t>(sqlite3_column_int64(stmt.stmt, 0));
        ev.ts_ms = static_cast<int64_t>(sqlite3_column_int64(stmt.stmt, 1));
        ev.request_id = column_string(stmt.stmt, 2);
        ev.stage = column_string(stmt.stmt, 3);
        ev.category = column_string(stmt.stmt, 4);
        ev.detail = column_string(stmt.stmt, 5);
        out.push_back(std::move(ev));
    }
    return out;
}

size_t GuardAuditLog::count() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return 0;
    Stmt stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM guard_events;", -1, &stmt.stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    if (sqlite3_step(stmt.stmt) != SQLITE_ROW) return 0;
    sqlite3_int64 n = sqlite3_column_int64(stmt.stmt, 0);
    return n > 0 ? static_cast<size_t>(n) : 0;
}

json guard_event_to_json(const GuardEvent& ev) {
    return {
        {"id", ev.id},
        {"ts_ms", ev.ts_ms},
        {"request_id", ev.request_id},
        {"stage", ev.stage},
        {"category", ev.category},
        {"detail", ev.detail}
    };
}
