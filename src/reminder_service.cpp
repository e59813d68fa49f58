#include "reminder_service.hpp"
#include "time_parser.hpp"
#include "errors.hpp"
#include <iostream>
#include <regex>
#include <sstream>

namespace chime {

namespace {

struct Split {
    std::string time_text;
    std::string message;
};

bool parses(const std::string& time_text) {
    return !std::holds_alternative<ParseFailure>(classify(time_text));
}

std::string collapse_spaces(const std::string& s) {
    std::istringstream iss(s);
    std::string word, out;
    while (iss >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

// "at 4pm to water the plants": the time comes before the first keyword that
// leaves a parseable time on its left.
std::optional<Split> split_time_first(const std::string& s) {
    static const char* keywords[] = {" to ", " about ", " that "};
    std::string lower = to_lower(s);
    for (size_t i = 0; i < lower.size(); ++i) {
        for (const char* kw : keywords) {
            std::string k = kw;
            if (lower.compare(i, k.size(), k) != 0) continue;
            std::string time_text = trim(s.substr(0, i));
            std::string message = trim(s.substr(i + k.size()));
            if (!message.empty() && parses(time_text)) return Split{time_text, message};
        }
    }
    return std::nullopt;
}

// "water the plants at 4pm": the time is the first suffix starting at a time
// keyword that parses as a whole.
std::optional<Split> split_task_first(const std::string& s) {
    static const struct { const char* kw; size_t skip; } keywords[] = {
        {" at ", 1}, {" in ", 1}, {" tomorrow ", 1}, {" today ", 1}, {" by ", 4},
    };
    std::string lower = to_lower(s) + " ";
    for (size_t i = 0; i < s.size(); ++i) {
        for (const auto& k : keywords) {
            std::string kw = k.kw;
            if (lower.compare(i, kw.size(), kw) != 0) continue;
            std::string time_text = trim(s.substr(i + k.skip));
            std::string message = trim(s.substr(0, i));
            if (!message.empty() && parses(time_text)) return Split{time_text, message};
        }
    }
    return std::nullopt;
}

std::string strip_leading_word(const std::string& s, const char* word) {
    std::string w = std::string(word) + " ";
    if (to_lower(s).compare(0, w.size(), w) == 0) return trim(s.substr(w.size()));
    return s;
}

const std::regex& create_re() {
    static const std::regex re(
        R"(^\s*(?:please\s+)?(?:remind\s+me|(?:set|add|create)\s+(?:a\s+)?reminder)\b[\s,:]*(.*)$)",
        std::regex::icase);
    return re;
}

const std::regex& recurrence_re() {
    static const std::regex re(
        R"(\b(every\s+(?:day|week|hour|\d+\s+(?:seconds?|secs?|minutes?|mins?|hours?|hrs?|days?|weeks?))|daily|weekly|hourly)\b)",
        std::regex::icase);
    return re;
}

const std::regex& cancel_id_re() {
    static const std::regex re(
        R"(^\s*(?:cancel|delete|remove)\s+(?:the\s+)?reminder\s+(?:#|number\s+)?(\d+)\s*$)",
        std::regex::icase);
    return re;
}

const std::regex& cancel_text_re() {
    static const std::regex re(
        R"(^\s*(?:cancel|delete|remove)\s+(?:the\s+|my\s+)?reminder\s+(?:about|to|for)\s+(.+?)\s*$)",
        std::regex::icase);
    return re;
}

const std::regex& list_re() {
    static const std::regex re(
        R"(\b(?:list|show)\b.*\breminders?\b|\bmy\s+reminders\b|\bwhat\s+reminders\b)",
        std::regex::icase);
    return re;
}

const std::regex& help_re() {
    static const std::regex re(R"(^\s*(?:help|what\s+can\s+you\s+do)\b)", std::regex::icase);
    return re;
}

} // namespace

ReminderService::ReminderService(ReminderStore& store, std::optional<int> utc_offset_minutes,
                                 Clock clock)
    : store_(store), utc_offset_minutes_(utc_offset_minutes), clock_(std::move(clock)) {}

int64_t ReminderService::utc_offset() const {
    if (utc_offset_minutes_) return int64_t(*utc_offset_minutes_) * 60;
    return host_utc_offset(clock_());
}

int64_t ReminderService::create_reminder(const std::string& message, const std::string& time_text,
                                         const std::string& recurrence_text) {
    std::string msg = trim(message);
    if (msg.empty()) throw std::invalid_argument("reminder message is empty");

    int64_t now = clock_();
    int64_t offset = utc_offset_minutes_ ? int64_t(*utc_offset_minutes_) * 60 : host_utc_offset(now);
    int64_t fire_at = parse_time(time_text, now, offset);
    Recurrence rec = parse_recurrence(recurrence_text);

    int64_t id = store_.create(msg, fire_at, rec, now);
    std::cerr << "[reminders] Created #" << id << " at " << format_utc(fire_at)
              << " (" << rec.to_string() << ")\n";
    changed();
    return id;
}

std::vector<Reminder> ReminderService::list_reminders(const ReminderFilter& filter) {
    return store_.list(filter);
}

void ReminderService::cancel_reminder(int64_t id) {
    store_.cancel(id);
    std::cerr << "[reminders] Cancelled #" << id << "\n";
    changed();
}

int ReminderService::cancel_by_message(const std::string& text) {
    std::string needle = to_lower(trim(text));
    ReminderFilter f;
    f.status = ReminderStatus::pending;
    int n = 0;
    for (auto& r : store_.list(f)) {
        if (to_lower(trim(r.message)) != needle) continue;
        try {
            store_.cancel(r.id);
            ++n;
        } catch (const InvalidTransition& e) {
            // fired between the list and the cancel
            std::cerr << "[reminders] " << e.what() << "\n";
        }
    }
    if (n > 0) changed();
    return n;
}

std::string ReminderService::describe(const Reminder& r) const {
    std::string s = "#" + std::to_string(r.id) + " " + r.message + " at " +
                    format_local(r.fire_at, utc_offset());
    if (r.recurrence.recurring()) s += " (" + r.recurrence.to_string() + ")";
    if (r.status != ReminderStatus::pending) s += " [" + status_name(r.status) + "]";
    return s;
}

const char* ReminderService::help_text() {
    return "I can help you with reminders:\n"
           "  - \"remind me at 4pm to water the plants\"\n"
           "  - \"remind me in 20 minutes to stretch\"\n"
           "  - \"remind me to call mom tomorrow at 6:30 pm\"\n"
           "  - \"remind me every day at 9am to take my pills\"\n"
           "  - \"list reminders\"\n"
           "  - \"cancel reminder 3\" or \"cancel reminder about water the plants\"\n"
           "Supported times: 4pm, 4:30 pm, 16:00, noon, in 20 minutes, tomorrow 9:00.\n"
           "Say \"exit\" or \"quit\" to end the session.";
}

std::string ReminderService::handle_command(const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) return "I didn't catch that.";
    if (t.size() > kMaxUtteranceLength) {
        return "That's too long for me. Please keep commands under " +
               std::to_string(kMaxUtteranceLength) + " characters.";
    }

    std::smatch m;
    try {
        if (std::regex_search(t, help_re())) return help_text();
        if (std::regex_match(t, m, cancel_id_re())) return handle_cancel(m[1].str());
        if (std::regex_match(t, m, cancel_text_re())) {
            std::string target = m[1].str();
            int n = cancel_by_message(target);
            if (n == 0) return "I couldn't find a pending reminder about " + target + ".";
            return "Cancelled " + std::to_string(n) + (n == 1 ? " reminder" : " reminders") +
                   " about " + target + ".";
        }
        if (std::regex_match(t, m, create_re())) return handle_create(m[1].str());
        if (std::regex_search(t, list_re())) return handle_list();
    } catch (const StoreError& e) {
        std::cerr << "[reminders] Store error: " << e.what() << "\n";
        return "I couldn't save that change right now. Please try again.";
    }
    return "I'm sorry, I didn't understand that command.";
}

std::string ReminderService::handle_create(const std::string& rest_in) {
    std::string rest = rest_in;

    std::string rec_text = "none";
    std::smatch rm;
    if (std::regex_search(rest, rm, recurrence_re())) {
        rec_text = rm[1].str();
        rest = rest.substr(0, rm.position(0)) + " " + rest.substr(rm.position(0) + rm.length(0));
    }
    rest = collapse_spaces(rest);
    rest = strip_leading_word(rest, "for");

    std::optional<Split> split;
    std::string lower = to_lower(rest);
    if (lower.rfind("to ", 0) == 0 || lower.rfind("about ", 0) == 0 || lower.rfind("that ", 0) == 0) {
        split = split_task_first(rest.substr(rest.find(' ') + 1));
    } else {
        split = split_time_first(rest);
    }
    // "every day at 9am" with nothing after the recurrence but a time
    if (!split && rec_text != "none") split = split_task_first(rest);

    if (!split) {
        return "I couldn't understand the reminder command. Please try again with a format "
               "like 'remind me at 4pm to water the plants'.";
    }

    try {
        int64_t id = create_reminder(split->message, split->time_text, rec_text);
        Reminder r = store_.get(id);
        std::string reply = "I'll remind you to " + r.message + " at " +
                            format_local(r.fire_at, utc_offset());
        if (r.recurrence.recurring()) reply += ", repeating " + r.recurrence.to_string();
        return reply + ". (#" + std::to_string(id) + ")";
    } catch (const ParseError& e) {
        std::cerr << "[reminders] " << e.what() << "\n";
        return "I couldn't set that reminder: " + std::string(e.what()) +
               ". Try a time like '4pm' or '2:30 pm'.";
    }
}

std::string ReminderService::handle_list() {
    ReminderFilter f;
    f.status = ReminderStatus::pending;
    auto reminders = store_.list(f);
    if (reminders.empty()) return "You don't have any reminders set.";

    std::string reply = "Here are your reminders:";
    for (auto& r : reminders) {
        reply += "\n" + describe(r);
    }
    return reply;
}

std::string ReminderService::handle_cancel(const std::string& target) {
    int64_t id = 0;
    try {
        id = std::stoll(target);
    } catch (const std::logic_error&) {
        return "That doesn't look like a reminder number: " + target;
    }
    try {
        cancel_reminder(id);
        return "Cancelled reminder #" + std::to_string(id) + ".";
    } catch (const NotFound&) {
        return "I couldn't find reminder #" + std::to_string(id) + ".";
    } catch (const InvalidTransition&) {
        return "Reminder #" + std::to_string(id) + " has already fired.";
    }
}

} // namespace chime
