#include "reminder.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chime {

Recurrence Recurrence::every(int64_t seconds) {
    if (seconds <= 0) {
        throw ParseError(std::to_string(seconds), "recurrence interval must be positive");
    }
    if (seconds > kMaxIntervalSeconds) {
        throw ParseError(std::to_string(seconds), "recurrence interval is longer than 3650 days");
    }
    return {RecurrenceKind::interval, seconds};
}

std::string Recurrence::to_string() const {
    switch (kind) {
        case RecurrenceKind::none: return "none";
        case RecurrenceKind::daily: return "daily";
        case RecurrenceKind::weekly: return "weekly";
        case RecurrenceKind::interval: return "every:" + std::to_string(interval_seconds);
    }
    return "none";
}

Recurrence Recurrence::from_string(const std::string& s) {
    if (s == "none" || s.empty()) return none();
    if (s == "daily") return daily();
    if (s == "weekly") return weekly();
    if (s.rfind("every:", 0) == 0) {
        try {
            return every(std::stoll(s.substr(6)));
        } catch (const std::logic_error&) {
            // fall through to the ParseError below
        }
    }
    throw ParseError(s, "unknown recurrence");
}

static int64_t unit_seconds(const std::string& unit) {
    static const struct { const char* name; int64_t secs; } units[] = {
        {"second", 1}, {"seconds", 1}, {"sec", 1}, {"secs", 1},
        {"minute", 60}, {"minutes", 60}, {"min", 60}, {"mins", 60},
        {"hour", 3600}, {"hours", 3600}, {"hr", 3600}, {"hrs", 3600},
        {"day", 86400}, {"days", 86400},
        {"week", 7 * 86400}, {"weeks", 7 * 86400},
    };
    for (const auto& u : units) {
        if (unit == u.name) return u.secs;
    }
    return 0;
}

Recurrence parse_recurrence(const std::string& text) {
    std::string s = to_lower(trim(text));
    if (s.empty() || s == "none" || s == "once" || s == "never") return Recurrence::none();
    if (s == "daily" || s == "every day" || s == "each day") return Recurrence::daily();
    if (s == "weekly" || s == "every week" || s == "each week") return Recurrence::weekly();
    if (s == "hourly" || s == "every hour") return Recurrence::every(3600);
    if (s.rfind("every:", 0) == 0) return Recurrence::from_string(s);

    std::istringstream iss(s);
    std::vector<std::string> words;
    std::string w;
    while (iss >> w) words.push_back(w);

    if (words.size() == 3 && words[0] == "every") {
        int64_t n = 0;
        try {
            size_t used = 0;
            n = std::stoll(words[1], &used);
            if (used != words[1].size()) n = 0;
        } catch (const std::logic_error&) {
            n = 0;
        }
        int64_t unit = unit_seconds(words[2]);
        if (n > 0 && unit > 0) {
            if (n > Recurrence::kMaxIntervalSeconds / unit) {
                throw ParseError(text, "recurrence interval is longer than 3650 days");
            }
            return Recurrence::every(n * unit);
        }
    }
    throw ParseError(text, "unrecognized recurrence");
}

std::string status_name(ReminderStatus s) {
    switch (s) {
        case ReminderStatus::pending: return "pending";
        case ReminderStatus::fired: return "fired";
        case ReminderStatus::cancelled: return "cancelled";
    }
    return "pending";
}

ReminderStatus parse_status(const std::string& s) {
    if (s == "pending") return ReminderStatus::pending;
    if (s == "fired") return ReminderStatus::fired;
    if (s == "cancelled") return ReminderStatus::cancelled;
    throw std::invalid_argument("unknown reminder status: " + s);
}

bool transition_allowed(ReminderStatus from, ReminderStatus to, const Recurrence& rec) {
    switch (from) {
        case ReminderStatus::pending:
            return to == ReminderStatus::fired || to == ReminderStatus::cancelled;
        case ReminderStatus::fired:
            return to == ReminderStatus::pending && rec.recurring();
        case ReminderStatus::cancelled:
            return to == ReminderStatus::cancelled;
    }
    return false;
}

int64_t next_occurrence(int64_t fire_at, const Recurrence& rec, int64_t now) {
    int64_t step = rec.interval_seconds;
    if (!rec.recurring() || step <= 0) {
        throw std::invalid_argument("next_occurrence on a non-recurring reminder");
    }
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();

    // Whole steps needed to land strictly after now; skips any occurrences
    // missed while we were not polling.
    int64_t k = 1;
    if (now >= fire_at) {
        if (fire_at < 0 && now > kMax + fire_at) {
            throw std::overflow_error("next_occurrence: now - fire_at overflows");
        }
        k = (now - fire_at) / step + 1;
    }
    if (k > (kMax - (fire_at > 0 ? fire_at : 0)) / step) {
        throw std::overflow_error("next_occurrence: next fire time overflows");
    }
    return fire_at + k * step;
}

nlohmann::json Reminder::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["message"] = message;
    j["fire_at"] = fire_at;
    j["fire_at_iso"] = format_utc(fire_at);
    j["recurrence"] = recurrence.to_string();
    j["status"] = status_name(status);
    j["created_at"] = created_at;
    if (last_fired_at) {
        j["last_fired_at"] = *last_fired_at;
    } else {
        j["last_fired_at"] = nullptr;
    }
    return j;
}

} // namespace chime
