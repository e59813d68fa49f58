#pragma once
#include "reminder.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <cstdint>
#include <sqlite3.h>

namespace chime {

struct ReminderFilter {
    std::optional<ReminderStatus> status;   // nullopt = any status
    std::optional<int64_t> due_at_or_before;
};

enum class FiringOutcome {
    fired,    // non-recurring reminder is now terminal
    rearmed,  // recurring reminder is pending again with a later fire_at
    stale,    // record changed since it was read (cancelled, deleted, already fired)
};

// SQLite-backed reminder table. Every public call is serialized on one
// mutex and runs inside its own transaction, so read-modify-write on a
// record never interleaves with another writer.
class ReminderStore {
public:
    explicit ReminderStore(const std::string& db_path);
    ~ReminderStore();

    ReminderStore(const ReminderStore&) = delete;
    ReminderStore& operator=(const ReminderStore&) = delete;

    int64_t create(const std::string& message, int64_t fire_at,
                   const Recurrence& recurrence, int64_t created_at = 0);
    Reminder get(int64_t id);

    // Ordered by fire_at ascending, ties by id.
    std::vector<Reminder> list(const ReminderFilter& filter = {});
    std::vector<Reminder> due(int64_t now);

    void update_status(int64_t id, ReminderStatus next,
                       std::optional<int64_t> new_fire_at = std::nullopt);
    void cancel(int64_t id);
    bool remove(int64_t id);

    // Commits one delivered occurrence: pending -> fired, and for recurring
    // reminders straight back to pending at the next future occurrence.
    // Only applies if the record is still pending at `expected_fire_at`.
    FiringOutcome record_firing(int64_t id, int64_t expected_fire_at, int64_t fired_at);

    // Deletes fired one-shot reminders and cancelled reminders older than `cutoff`.
    int purge(int64_t cutoff);

    std::map<ReminderStatus, int> counts();

    const std::string& path() const { return db_path_; }

private:
    std::string db_path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    void init_db();
    void exec(const char* sql);
    sqlite3_stmt* prepare(const char* sql);
    std::optional<Reminder> load(int64_t id);
    void write_state(int64_t id, ReminderStatus status, int64_t fire_at,
                     std::optional<int64_t> last_fired_at);
};

} // namespace chime
