#pragma once
#include <string>
#include <cstdint>
#include <variant>

namespace chime {

enum class DayHint {
    unspecified,  // clock time only: roll forward to the next occurrence
    today,
    tomorrow,
};

// A wall-clock time of day, optionally pinned to today or tomorrow.
struct ParsedAbsolute {
    int hour = 0;
    int minute = 0;
    DayHint day = DayHint::unspecified;
    std::string text;
};

// An offset from the reference time ("in 20 minutes").
struct ParsedRelative {
    int64_t seconds = 0;
};

struct ParseFailure {
    std::string text;
    std::string reason;
};

using ParsedTime = std::variant<ParsedAbsolute, ParsedRelative, ParseFailure>;

// Grammar only: never looks at a clock.
ParsedTime classify(const std::string& text);

// Applies the roll-forward policy. `reference` and the result are epoch
// seconds (UTC); `utc_offset` is the local zone's offset in seconds and
// defines what "today" and "4pm" mean. Throws ParseError for a ParseFailure
// or for a "today" time that is not in the future.
int64_t resolve(const ParsedTime& parsed, int64_t reference, int64_t utc_offset);

// classify() followed by resolve().
int64_t parse_time(const std::string& text, int64_t reference, int64_t utc_offset);

} // namespace chime
