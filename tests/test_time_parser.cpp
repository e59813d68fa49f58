#include <doctest/doctest.h>
#include "time_parser.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <vector>

using namespace chime;
using namespace chime::testing;

TEST_CASE("Clock time later today resolves to today") {
    CHECK(parse_time("4pm", at(0, 15), 0) == at(0, 16));
    CHECK(parse_time("4:30 pm", at(0, 15), 0) == at(0, 16, 30));
    CHECK(parse_time("16:00", at(0, 15), 0) == at(0, 16));
}

TEST_CASE("Clock time already passed rolls forward to tomorrow") {
    CHECK(parse_time("4pm", at(0, 16, 30), 0) == at(1, 16));
    CHECK(parse_time("2:30 pm", at(0, 16, 30), 0) == at(1, 14, 30));
}

TEST_CASE("Clock time equal to the reference time rolls forward") {
    CHECK(parse_time("4pm", at(0, 16), 0) == at(1, 16));
    CHECK(parse_time("16:00", at(0, 16), 0) == at(1, 16));
}

TEST_CASE("Every 12-hour time earlier than the reference lands on the next day") {
    const int64_t ref = at(0, 13, 37);
    const int64_t ref_tod = 13 * kHour + 37 * 60;
    for (int h = 1; h <= 12; ++h) {
        for (int m : {0, 15, 30, 45}) {
            for (bool pm : {false, true}) {
                std::string mm = m < 10 ? "0" + std::to_string(m) : std::to_string(m);
                std::string text = std::to_string(h) + ":" + mm + (pm ? " pm" : "am");
                int hour24 = (h % 12) + (pm ? 12 : 0);
                int64_t tod = hour24 * kHour + m * 60;
                int64_t expected = tod <= ref_tod ? kJan1 + kDay + tod : kJan1 + tod;
                CAPTURE(text);
                CHECK(parse_time(text, ref, 0) == expected);
            }
        }
    }
}

TEST_CASE("Accepted 12-hour spellings") {
    const int64_t ref = at(0, 8);
    CHECK(parse_time("4 PM", ref, 0) == at(0, 16));
    CHECK(parse_time("4PM", ref, 0) == at(0, 16));
    CHECK(parse_time("at 4pm", ref, 0) == at(0, 16));
    CHECK(parse_time("4:30 p.m.", ref, 0) == at(0, 16, 30));
    CHECK(parse_time("  9:15am ", ref, 0) == at(0, 9, 15));
    CHECK(parse_time("12pm", ref, 0) == at(0, 12));
    CHECK(parse_time("12am", ref, 0) == at(1, 0));
    CHECK(parse_time("noon", ref, 0) == at(0, 12));
    CHECK(parse_time("midnight", ref, 0) == at(1, 0));
}

TEST_CASE("Bare hours without a meridiem read as a 24-hour clock") {
    CHECK(parse_time("16", at(0, 8), 0) == at(0, 16));
    CHECK(parse_time("4", at(0, 8), 0) == at(1, 4));
    CHECK(parse_time("7:05", at(0, 6), 0) == at(0, 7, 5));
    CHECK(parse_time("0:00", at(0, 6), 0) == at(1, 0));
}

TEST_CASE("Relative minutes resolve to exactly reference plus duration") {
    const int64_t ref = at(0, 15, 7) + 23;  // seconds are kept, not rounded
    for (int n : {1, 5, 20, 59, 120, 1440}) {
        std::string text = "in " + std::to_string(n) + " minutes";
        CAPTURE(text);
        CHECK(parse_time(text, ref, 0) == ref + n * 60);
    }
    CHECK(parse_time("in 1 minute", ref, 0) == ref + 60);
    CHECK(parse_time("in 2 hours", ref, 0) == ref + 2 * kHour);
    CHECK(parse_time("in an hour", ref, 0) == ref + kHour);
    CHECK(parse_time("in half an hour", ref, 0) == ref + 1800);
    CHECK(parse_time("in 3 days", ref, 0) == ref + 3 * kDay);
    CHECK(parse_time("In 10 Mins", ref, 0) == ref + 600);
}

TEST_CASE("Relative time crossing midnight is not rolled forward again") {
    const int64_t ref = at(0, 23, 50);
    CHECK(parse_time("in 20 minutes", ref, 0) == ref + 1200);
}

TEST_CASE("Day-qualified times") {
    const int64_t ref = at(0, 15);
    CHECK(parse_time("tomorrow 9:00", ref, 0) == at(1, 9));
    CHECK(parse_time("tomorrow at 4pm", ref, 0) == at(1, 16));
    CHECK(parse_time("9am tomorrow", ref, 0) == at(1, 9));
    // tomorrow never rolls further, even for a later time of day
    CHECK(parse_time("tomorrow 5pm", ref, 0) == at(1, 17));
    CHECK(parse_time("today 5pm", ref, 0) == at(0, 17));
}

TEST_CASE("A time already passed today is rejected, not moved") {
    CHECK_THROWS_AS(parse_time("today 2pm", at(0, 15), 0), ParseError);
    CHECK_THROWS_AS(parse_time("today 3pm", at(0, 15), 0), ParseError);
}

TEST_CASE("The UTC offset defines local time of day") {
    // UTC+2: 13:00Z is 15:00 local, so 4pm local is 14:00Z the same day.
    CHECK(parse_time("4pm", at(0, 13), 2 * kHour) == at(0, 14));
    // UTC-5: 03:00Z on Jan 1 is 22:00 on Dec 31 local; 9pm has passed locally.
    CHECK(parse_time("9pm", at(0, 3), -5 * kHour) == at(1, 2));
    // Relative input ignores the offset.
    CHECK(parse_time("in 5 minutes", at(0, 3), -5 * kHour) == at(0, 3, 5));
}

TEST_CASE("Malformed input fails with ParseError carrying the text") {
    const std::vector<std::string> bad = {
        "", "   ", "banana", "25:00", "24:00", "13pm", "0am", "4:75", "4:5",
        "16:00:00", "4pmx", "tomorrow", "in", "in -5 minutes", "in 0 minutes",
        "in five minutes", "in 20 parsecs", "in 20", "16:00 pm", "at", "4 o'clock",
    };
    for (const auto& text : bad) {
        CAPTURE(text);
        CHECK_THROWS_AS(parse_time(text, at(0, 15), 0), ParseError);
        try {
            parse_time(text, at(0, 15), 0);
        } catch (const ParseError& e) {
            CHECK(e.text() == text);
        }
    }
}

TEST_CASE("classify produces the tagged variant without consulting a clock") {
    auto rel = classify("in 5 minutes");
    REQUIRE(std::holds_alternative<ParsedRelative>(rel));
    CHECK(std::get<ParsedRelative>(rel).seconds == 300);

    auto abs = classify("tomorrow 4:30pm");
    REQUIRE(std::holds_alternative<ParsedAbsolute>(abs));
    CHECK(std::get<ParsedAbsolute>(abs).hour == 16);
    CHECK(std::get<ParsedAbsolute>(abs).minute == 30);
    CHECK(std::get<ParsedAbsolute>(abs).day == DayHint::tomorrow);

    auto fail = classify("whenever");
    REQUIRE(std::holds_alternative<ParseFailure>(fail));
    CHECK(std::get<ParseFailure>(fail).text == "whenever");
    CHECK_THROWS_AS(resolve(fail, at(0, 15), 0), ParseError);
}

TEST_CASE("Parsing is deterministic for a fixed reference") {
    for (const char* text : {"4pm", "in 20 minutes", "tomorrow 9:00", "noon"}) {
        CHECK(parse_time(text, at(0, 15), 0) == parse_time(text, at(0, 15), 0));
    }
}
