#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace chime {

enum class ReminderStatus {
    pending,
    fired,
    cancelled,
};

enum class RecurrenceKind {
    none,
    daily,
    weekly,
    interval,
};

struct Recurrence {
    // Longest accepted interval: 3650 days.
    static constexpr int64_t kMaxIntervalSeconds = 3650LL * 86400;

    RecurrenceKind kind = RecurrenceKind::none;
    int64_t interval_seconds = 0;

    static Recurrence none() { return {}; }
    static Recurrence daily() { return {RecurrenceKind::daily, 86400}; }
    static Recurrence weekly() { return {RecurrenceKind::weekly, 7 * 86400}; }
    static Recurrence every(int64_t seconds);

    bool recurring() const { return kind != RecurrenceKind::none; }

    // Persisted form: "none", "daily", "weekly" or "every:<seconds>".
    std::string to_string() const;
    static Recurrence from_string(const std::string& s);

    bool operator==(const Recurrence& o) const {
        return kind == o.kind && interval_seconds == o.interval_seconds;
    }
    bool operator!=(const Recurrence& o) const { return !(*this == o); }
};

// Parses user recurrence text ("daily", "every day", "every 2 hours", ...).
// Throws ParseError on anything it does not recognize.
Recurrence parse_recurrence(const std::string& text);

struct Reminder {
    int64_t id = 0;
    std::string message;
    int64_t fire_at = 0;
    Recurrence recurrence;
    ReminderStatus status = ReminderStatus::pending;
    int64_t created_at = 0;
    std::optional<int64_t> last_fired_at;

    bool due(int64_t now) const {
        return status == ReminderStatus::pending && now >= fire_at;
    }

    nlohmann::json to_json() const;
};

std::string status_name(ReminderStatus s);
ReminderStatus parse_status(const std::string& s);

// Legal moves: pending->fired, pending->cancelled, cancelled->cancelled,
// and fired->pending for a recurring reminder being re-armed.
bool transition_allowed(ReminderStatus from, ReminderStatus to, const Recurrence& rec);

// First occurrence of the schedule strictly after `now`, stepping from
// `fire_at` by whole intervals. Never returns a value <= now; throws
// std::overflow_error when that occurrence is not representable.
int64_t next_occurrence(int64_t fire_at, const Recurrence& rec, int64_t now);

} // namespace chime
