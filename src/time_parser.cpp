#include "time_parser.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <sstream>
#include <vector>

namespace chime {

namespace {

constexpr int64_t kDay = 86400;

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Parses "4pm", "4:30 p.m.", "16:00", "noon". Sets `reason` on failure.
bool parse_clock(std::string s, int& hour, int& minute, std::string& reason) {
    s = trim(s);
    if (starts_with(s, "at ")) s = trim(s.substr(3));

    if (s == "noon") { hour = 12; minute = 0; return true; }
    if (s == "midnight") { hour = 0; minute = 0; return true; }

    int meridiem = 0;  // 0 = none, 1 = am, 2 = pm
    static const struct { const char* suffix; int value; } markers[] = {
        {"a.m.", 1}, {"p.m.", 2}, {"am", 1}, {"pm", 2},
    };
    for (const auto& mk : markers) {
        if (ends_with(s, mk.suffix)) {
            meridiem = mk.value;
            s = trim(s.substr(0, s.size() - std::string(mk.suffix).size()));
            break;
        }
    }

    std::string h_str = s, m_str;
    size_t colon = s.find(':');
    if (colon != std::string::npos) {
        h_str = s.substr(0, colon);
        m_str = s.substr(colon + 1);
        if (m_str.size() != 2 || !all_digits(m_str)) {
            reason = "minutes must be two digits";
            return false;
        }
    }
    if (!all_digits(h_str) || h_str.size() > 2) {
        reason = "unrecognized time";
        return false;
    }

    int h = std::stoi(h_str);
    int m = m_str.empty() ? 0 : std::stoi(m_str);
    if (m > 59) {
        reason = "minute out of range";
        return false;
    }

    if (meridiem != 0) {
        if (h < 1 || h > 12) {
            reason = "hour out of range for 12-hour clock";
            return false;
        }
        h %= 12;
        if (meridiem == 2) h += 12;
    } else if (h > 23) {
        reason = "hour out of range";
        return false;
    }

    hour = h;
    minute = m;
    return true;
}

int64_t unit_seconds(const std::string& unit) {
    static const struct { const char* name; int64_t secs; } units[] = {
        {"second", 1}, {"seconds", 1}, {"sec", 1}, {"secs", 1},
        {"minute", 60}, {"minutes", 60}, {"min", 60}, {"mins", 60},
        {"hour", 3600}, {"hours", 3600}, {"hr", 3600}, {"hrs", 3600},
        {"day", kDay}, {"days", kDay},
    };
    for (const auto& u : units) {
        if (unit == u.name) return u.secs;
    }
    return 0;
}

// "in 20 minutes", "in an hour", "in half an hour". `s` has "in " stripped.
ParsedTime parse_relative(const std::string& original, const std::string& s) {
    if (s == "half an hour") return ParsedRelative{1800};

    std::istringstream iss(s);
    std::vector<std::string> words;
    std::string w;
    while (iss >> w) words.push_back(w);

    if (words.size() != 2) {
        return ParseFailure{original, "expected \"in <number> <unit>\""};
    }

    int64_t unit = unit_seconds(words[1]);
    if (unit == 0) return ParseFailure{original, "unknown time unit"};

    int64_t n = 0;
    if (words[0] == "a" || words[0] == "an" || words[0] == "one") {
        n = 1;
    } else if (all_digits(words[0]) && words[0].size() <= 6) {
        n = std::stoll(words[0]);
    } else {
        return ParseFailure{original, "amount must be a positive whole number"};
    }
    if (n <= 0) return ParseFailure{original, "amount must be a positive whole number"};

    return ParsedRelative{n * unit};
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

ParsedTime classify(const std::string& text) {
    std::string s = to_lower(trim(text));
    if (s.empty()) return ParseFailure{text, "empty time"};

    if (starts_with(s, "in ")) return parse_relative(text, trim(s.substr(3)));

    DayHint day = DayHint::unspecified;
    if (starts_with(s, "tomorrow ")) {
        day = DayHint::tomorrow;
        s = s.substr(9);
    } else if (starts_with(s, "today ")) {
        day = DayHint::today;
        s = s.substr(6);
    } else if (ends_with(s, " tomorrow")) {
        day = DayHint::tomorrow;
        s = s.substr(0, s.size() - 9);
    } else if (ends_with(s, " today")) {
        day = DayHint::today;
        s = s.substr(0, s.size() - 6);
    }

    ParsedAbsolute abs;
    abs.day = day;
    abs.text = text;
    std::string reason;
    if (!parse_clock(s, abs.hour, abs.minute, reason)) {
        return ParseFailure{text, reason};
    }
    return abs;
}

int64_t resolve(const ParsedTime& parsed, int64_t reference, int64_t utc_offset) {
    if (auto* fail = std::get_if<ParseFailure>(&parsed)) {
        throw ParseError(fail->text, fail->reason);
    }
    if (auto* rel = std::get_if<ParsedRelative>(&parsed)) {
        return reference + rel->seconds;
    }

    const auto& abs = std::get<ParsedAbsolute>(parsed);
    int64_t local_now = reference + utc_offset;
    int64_t midnight = floor_div(local_now, kDay) * kDay;
    int64_t candidate = midnight + abs.hour * 3600 + abs.minute * 60;

    switch (abs.day) {
        case DayHint::unspecified:
            if (candidate <= local_now) candidate += kDay;
            break;
        case DayHint::today:
            if (candidate <= local_now) {
                throw ParseError(abs.text, "time has already passed today");
            }
            break;
        case DayHint::tomorrow:
            candidate += kDay;
            break;
    }
    return candidate - utc_offset;
}

int64_t parse_time(const std::string& text, int64_t reference, int64_t utc_offset) {
    return resolve(classify(text), reference, utc_offset);
}

} // namespace chime
