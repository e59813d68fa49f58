#include "reminder_store.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <stdexcept>

namespace chime {

namespace {

struct StmtGuard {
    sqlite3_stmt* stmt;
    ~StmtGuard() { sqlite3_finalize(stmt); }
};

void exec_or_throw(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw StoreError(std::string("sqlite: ") + msg + " (" + sql + ")");
    }
}

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        exec_or_throw(db_, "BEGIN IMMEDIATE");
    }
    ~Transaction() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    void commit() {
        exec_or_throw(db_, "COMMIT");
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

// A row whose recurrence or status column cannot be decoded is reported as a
// StoreError; parse errors never leak out of the store.
Reminder row_to_reminder(sqlite3_stmt* stmt) {
    Reminder r;
    r.id = sqlite3_column_int64(stmt, 0);
    r.message = column_text(stmt, 1);
    r.fire_at = sqlite3_column_int64(stmt, 2);
    try {
        r.recurrence = Recurrence::from_string(column_text(stmt, 3));
        r.status = parse_status(column_text(stmt, 4));
    } catch (const ParseError& e) {
        throw StoreError("Corrupt reminder row id=" + std::to_string(r.id) + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw StoreError("Corrupt reminder row id=" + std::to_string(r.id) + ": " + e.what());
    }
    r.created_at = sqlite3_column_int64(stmt, 5);
    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
        r.last_fired_at = sqlite3_column_int64(stmt, 6);
    }
    return r;
}

const char* kSelectColumns =
    "SELECT id, message, fire_at, recurrence, status, created_at, last_fired_at FROM reminders";

} // namespace

ReminderStore::ReminderStore(const std::string& db_path) : db_path_(db_path) {
    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) throw StoreError("Failed to create " + parent.string() + ": " + ec.message());
    }
    int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open reminder DB: " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    init_db();
}

ReminderStore::~ReminderStore() {
    if (db_) sqlite3_close(db_);
}

void ReminderStore::exec(const char* sql) {
    exec_or_throw(db_, sql);
}

sqlite3_stmt* ReminderStore::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
    }
    return stmt;
}

void ReminderStore::init_db() {
    try {
        exec("PRAGMA journal_mode=WAL");
        exec(R"(
            CREATE TABLE IF NOT EXISTS reminders (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                message TEXT NOT NULL,
                fire_at INTEGER NOT NULL,
                recurrence TEXT NOT NULL DEFAULT 'none',
                status TEXT NOT NULL DEFAULT 'pending',
                created_at INTEGER NOT NULL,
                last_fired_at INTEGER
            );
            CREATE INDEX IF NOT EXISTS idx_reminders_due
                ON reminders (status, fire_at, id);
        )");
    } catch (const StoreError& e) {
        throw StoreError(std::string("Failed to init reminder DB: ") + e.what());
    }
}

int64_t ReminderStore::create(const std::string& message, int64_t fire_at,
                              const Recurrence& recurrence, int64_t created_at) {
    if (created_at == 0) created_at = epoch_now();

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    StmtGuard g{prepare("INSERT INTO reminders (message, fire_at, recurrence, status, created_at) "
                        "VALUES (?, ?, ?, 'pending', ?)")};
    std::string rec = recurrence.to_string();
    sqlite3_bind_text(g.stmt, 1, message.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 2, fire_at);
    sqlite3_bind_text(g.stmt, 3, rec.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 4, created_at);

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw StoreError(std::string("Failed to create reminder: ") + sqlite3_errmsg(db_));
    }
    int64_t id = sqlite3_last_insert_rowid(db_);
    tx.commit();
    return id;
}

std::optional<Reminder> ReminderStore::load(int64_t id) {
    std::string sql = std::string(kSelectColumns) + " WHERE id = ?";
    StmtGuard g{prepare(sql.c_str())};
    sqlite3_bind_int64(g.stmt, 1, id);
    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return row_to_reminder(g.stmt);
    if (rc == SQLITE_DONE) return std::nullopt;
    throw StoreError(std::string("Failed to read reminder: ") + sqlite3_errmsg(db_));
}

Reminder ReminderStore::get(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = load(id);
    if (!r) throw NotFound(id);
    return *r;
}

std::vector<Reminder> ReminderStore::list(const ReminderFilter& filter) {
    std::string sql = kSelectColumns;
    std::string where;
    if (filter.status) where += "status = ?";
    if (filter.due_at_or_before) {
        if (!where.empty()) where += " AND ";
        where += "fire_at <= ?";
    }
    if (!where.empty()) sql += " WHERE " + where;
    sql += " ORDER BY fire_at ASC, id ASC";

    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g{prepare(sql.c_str())};
    int idx = 1;
    std::string status;
    if (filter.status) {
        status = status_name(*filter.status);
        sqlite3_bind_text(g.stmt, idx++, status.c_str(), -1, SQLITE_TRANSIENT);
    }
    if (filter.due_at_or_before) {
        sqlite3_bind_int64(g.stmt, idx++, *filter.due_at_or_before);
    }

    std::vector<Reminder> out;
    int rc;
    while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW) {
        out.push_back(row_to_reminder(g.stmt));
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("Failed to list reminders: ") + sqlite3_errmsg(db_));
    }
    return out;
}

std::vector<Reminder> ReminderStore::due(int64_t now) {
    ReminderFilter f;
    f.status = ReminderStatus::pending;
    f.due_at_or_before = now;
    return list(f);
}

void ReminderStore::write_state(int64_t id, ReminderStatus status, int64_t fire_at,
                                std::optional<int64_t> last_fired_at) {
    StmtGuard g{prepare("UPDATE reminders SET status = ?, fire_at = ?, last_fired_at = ? WHERE id = ?")};
    std::string s = status_name(status);
    sqlite3_bind_text(g.stmt, 1, s.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 2, fire_at);
    if (last_fired_at) {
        sqlite3_bind_int64(g.stmt, 3, *last_fired_at);
    } else {
        sqlite3_bind_null(g.stmt, 3);
    }
    sqlite3_bind_int64(g.stmt, 4, id);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw StoreError(std::string("Failed to update reminder: ") + sqlite3_errmsg(db_));
    }
}

void ReminderStore::update_status(int64_t id, ReminderStatus next,
                                  std::optional<int64_t> new_fire_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    auto cur = load(id);
    if (!cur) throw NotFound(id);
    if (!transition_allowed(cur->status, next, cur->recurrence)) {
        throw InvalidTransition(id, status_name(cur->status), status_name(next));
    }

    int64_t fire_at = cur->fire_at;
    std::optional<int64_t> last_fired = cur->last_fired_at;

    if (next == ReminderStatus::fired) {
        last_fired = epoch_now();
    } else if (next == ReminderStatus::pending) {
        // Re-arming: the new occurrence must lie after the firing that produced it.
        int64_t floor = last_fired.value_or(cur->fire_at);
        if (!new_fire_at || *new_fire_at <= floor) {
            throw InvalidTransition(id, status_name(cur->status),
                                    "pending (fire_at must be after " + format_utc(floor) + ")");
        }
        fire_at = *new_fire_at;
    }

    write_state(id, next, fire_at, last_fired);
    tx.commit();
}

void ReminderStore::cancel(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    auto cur = load(id);
    if (!cur) throw NotFound(id);
    if (cur->status == ReminderStatus::cancelled) return;
    if (!transition_allowed(cur->status, ReminderStatus::cancelled, cur->recurrence)) {
        throw InvalidTransition(id, status_name(cur->status), "cancelled");
    }
    write_state(id, ReminderStatus::cancelled, cur->fire_at, cur->last_fired_at);
    tx.commit();
}

bool ReminderStore::remove(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g{prepare("DELETE FROM reminders WHERE id = ?")};
    sqlite3_bind_int64(g.stmt, 1, id);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw StoreError(std::string("Failed to delete reminder: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

FiringOutcome ReminderStore::record_firing(int64_t id, int64_t expected_fire_at, int64_t fired_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    auto cur = load(id);
    if (!cur || cur->status != ReminderStatus::pending || cur->fire_at != expected_fire_at) {
        return FiringOutcome::stale;
    }

    if (!cur->recurrence.recurring()) {
        write_state(id, ReminderStatus::fired, cur->fire_at, fired_at);
        tx.commit();
        return FiringOutcome::fired;
    }

    int64_t next = 0;
    try {
        next = next_occurrence(cur->fire_at, cur->recurrence, fired_at);
    } catch (const std::overflow_error& e) {
        throw InvalidTransition(id, "pending", std::string("pending (") + e.what() + ")");
    }
    write_state(id, ReminderStatus::pending, next, fired_at);
    tx.commit();
    return FiringOutcome::rearmed;
}

int ReminderStore::purge(int64_t cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g{prepare("DELETE FROM reminders WHERE "
                        "(status = 'fired' AND last_fired_at < ?) OR "
                        "(status = 'cancelled' AND created_at < ?)")};
    sqlite3_bind_int64(g.stmt, 1, cutoff);
    sqlite3_bind_int64(g.stmt, 2, cutoff);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw StoreError(std::string("Failed to purge reminders: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_);
}

std::map<ReminderStatus, int> ReminderStore::counts() {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g{prepare("SELECT status, COUNT(*) FROM reminders GROUP BY status")};
    std::map<ReminderStatus, int> out{
        {ReminderStatus::pending, 0}, {ReminderStatus::fired, 0}, {ReminderStatus::cancelled, 0}};
    int rc;
    while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW) {
        std::string status = column_text(g.stmt, 0);
        try {
            out[parse_status(status)] = sqlite3_column_int(g.stmt, 1);
        } catch (const std::invalid_argument& e) {
            throw StoreError(std::string("Corrupt reminder status: ") + e.what());
        }
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("Failed to count reminders: ") + sqlite3_errmsg(db_));
    }
    return out;
}

} // namespace chime
