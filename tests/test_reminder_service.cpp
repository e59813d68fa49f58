#include <doctest/doctest.h>
#include "reminder_service.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace chime;
using namespace chime::testing;

namespace {

struct ServiceFixture {
    TempDb tmp;
    ReminderStore store{tmp.path};
    int64_t now = at(0, 15);
    ReminderService service{store, 0, [this] { return now; }};
};

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

TEST_CASE_FIXTURE(ServiceFixture, "Time-first reminder phrases") {
    CHECK(service.handle_command("remind me at 4pm to water the plants") ==
          "I'll remind you to water the plants at 2024-01-01 04:00 PM. (#1)");
    CHECK(service.handle_command("Remind me in 20 minutes to stretch") ==
          "I'll remind you to stretch at 2024-01-01 03:20 PM. (#2)");
    CHECK(service.handle_command("set a reminder for 5pm to call the bank") ==
          "I'll remind you to call the bank at 2024-01-01 05:00 PM. (#3)");

    Reminder r = store.get(1);
    CHECK(r.message == "water the plants");
    CHECK(r.fire_at == at(0, 16));
    CHECK(r.created_at == at(0, 15));
    CHECK(store.get(2).fire_at == at(0, 15, 20));
}

TEST_CASE_FIXTURE(ServiceFixture, "Task-first reminder phrases") {
    service.handle_command("remind me to call mom tomorrow at 6:30 pm");
    service.handle_command("remind me to stretch in 20 minutes");
    service.handle_command("remind me to water the plants at 2pm");

    CHECK(store.get(1).message == "call mom");
    CHECK(store.get(1).fire_at == at(1, 18, 30));
    CHECK(store.get(2).message == "stretch");
    CHECK(store.get(2).fire_at == at(0, 15, 20));
    // 2pm has passed at 3pm, so it means tomorrow.
    CHECK(store.get(3).message == "water the plants");
    CHECK(store.get(3).fire_at == at(1, 14));
}

TEST_CASE_FIXTURE(ServiceFixture, "Recurring reminder phrases") {
    CHECK(service.handle_command("remind me every day at 9am to take my pills") ==
          "I'll remind you to take my pills at 2024-01-02 09:00 AM, repeating daily. (#1)");
    service.handle_command("remind me to drink water every 2 hours in 1 hour");

    CHECK(store.get(1).recurrence == Recurrence::daily());
    Reminder water = store.get(2);
    CHECK(water.message == "drink water");
    CHECK(water.recurrence == Recurrence::every(7200));
    CHECK(water.fire_at == at(0, 16));
}

TEST_CASE_FIXTURE(ServiceFixture, "Unusable reminder commands store nothing") {
    CHECK(starts_with(service.handle_command("remind me at 25:00 to dance"),
                      "I couldn't understand the reminder command"));
    CHECK(starts_with(service.handle_command("remind me"),
                      "I couldn't understand the reminder command"));
    CHECK(starts_with(service.handle_command("remind me today at 2pm to dance"),
                      "I couldn't set that reminder"));
    CHECK(store.list().empty());
}

TEST_CASE_FIXTURE(ServiceFixture, "Listing reminders") {
    CHECK(service.handle_command("list reminders") == "You don't have any reminders set.");

    service.handle_command("remind me at 4pm to water the plants");
    service.handle_command("remind me every day at 9am to take my pills");
    int64_t gone = store.create("gone", at(0, 17), Recurrence::none(), at(0, 15));
    store.cancel(gone);

    CHECK(service.handle_command("what are my reminders") ==
          "Here are your reminders:\n"
          "#1 water the plants at 2024-01-01 04:00 PM\n"
          "#2 take my pills at 2024-01-02 09:00 AM (daily)");
    CHECK(service.handle_command("show me all reminders") ==
          service.handle_command("list reminders"));
}

TEST_CASE_FIXTURE(ServiceFixture, "Cancelling by number") {
    service.handle_command("remind me at 4pm to water the plants");

    CHECK(service.handle_command("cancel reminder 1") == "Cancelled reminder #1.");
    CHECK(store.get(1).status == ReminderStatus::cancelled);
    CHECK(service.handle_command("cancel reminder #1") == "Cancelled reminder #1.");
    CHECK(service.handle_command("delete reminder number 99") == "I couldn't find reminder #99.");

    int64_t fired = store.create("done", at(0, 14), Recurrence::none(), at(0, 13));
    store.record_firing(fired, at(0, 14), at(0, 14));
    CHECK(service.handle_command("cancel reminder " + std::to_string(fired)) ==
          "Reminder #" + std::to_string(fired) + " has already fired.");
}

TEST_CASE_FIXTURE(ServiceFixture, "Cancelling by message") {
    service.handle_command("remind me at 4pm to water the plants");
    service.handle_command("remind me at 6pm to Water the Plants");
    service.handle_command("remind me at 5pm to feed the cat");

    CHECK(service.handle_command("cancel reminder about water the plants") ==
          "Cancelled 2 reminders about water the plants.");
    CHECK(store.get(1).status == ReminderStatus::cancelled);
    CHECK(store.get(2).status == ReminderStatus::cancelled);
    CHECK(store.get(3).status == ReminderStatus::pending);

    CHECK(service.handle_command("remove my reminder to walk the dog") ==
          "I couldn't find a pending reminder about walk the dog.");
}

TEST_CASE_FIXTURE(ServiceFixture, "Help, empty and unknown input") {
    CHECK(service.handle_command("help") == ReminderService::help_text());
    CHECK(service.handle_command("What can you do?") == ReminderService::help_text());
    CHECK(service.handle_command("   ") == "I didn't catch that.");
    CHECK(service.handle_command("what's the weather") ==
          "I'm sorry, I didn't understand that command.");
}

TEST_CASE_FIXTURE(ServiceFixture, "Direct API errors propagate") {
    CHECK_THROWS_AS(service.create_reminder("   ", "4pm"), std::invalid_argument);
    CHECK_THROWS_AS(service.create_reminder("dance", "25:00"), ParseError);
    CHECK_THROWS_AS(service.create_reminder("dance", "4pm", "fortnightly"), ParseError);
    CHECK(store.list().empty());

    CHECK_THROWS_AS(service.cancel_reminder(5), NotFound);
    CHECK_THROWS_AS(service.get_reminder(5), NotFound);

    int64_t id = service.create_reminder("  dance  ", "4pm", "weekly");
    Reminder r = service.get_reminder(id);
    CHECK(r.message == "dance");
    CHECK(r.recurrence == Recurrence::weekly());
}

TEST_CASE_FIXTURE(ServiceFixture, "Change callback fires on create and cancel") {
    int changes = 0;
    service.set_on_change([&] { ++changes; });

    int64_t id = service.create_reminder("stretch", "in 5 minutes");
    CHECK(changes == 1);
    service.cancel_reminder(id);
    CHECK(changes == 2);
    service.handle_command("list reminders");
    service.handle_command("remind me at 25:00 to dance");
    CHECK(changes == 2);
}

TEST_CASE("A configured offset shifts clock times") {
    TempDb tmp;
    ReminderStore store(tmp.path);
    // UTC+2 at 13:00Z is 15:00 local.
    ReminderService service(store, 120, [] { return at(0, 13); });
    CHECK(service.utc_offset() == 2 * kHour);

    CHECK(service.handle_command("remind me at 4pm to water the plants") ==
          "I'll remind you to water the plants at 2024-01-01 04:00 PM. (#1)");
    CHECK(store.get(1).fire_at == at(0, 14));
}

TEST_CASE_FIXTURE(ServiceFixture, "Overlong utterances are refused before parsing") {
    std::string huge = "remind me " + std::string(200000, 'a');
    CHECK(starts_with(service.handle_command(huge), "That's too long"));
    CHECK(starts_with(service.handle_command("list my reminders " + std::string(5000, 'x')),
                      "That's too long"));
    CHECK(store.list({}).empty());

    std::string longest = "remind me in 5 minutes to " +
                          std::string(ReminderService::kMaxUtteranceLength - 26, 'b');
    CHECK(longest.size() == ReminderService::kMaxUtteranceLength);
    CHECK(starts_with(service.handle_command(longest), "I'll remind you to"));
    CHECK(store.list({}).size() == 1);
}

TEST_CASE_FIXTURE(ServiceFixture, "Oversized recurrence intervals are rejected") {
    CHECK_THROWS_AS(service.create_reminder("stretch", "4pm", "every:9223372036854775807"),
                    ParseError);
    CHECK_THROWS_AS(service.create_reminder("stretch", "4pm", "every 99999999999999 weeks"),
                    ParseError);
    CHECK(store.list({}).empty());
    CHECK(starts_with(service.handle_command("remind me every 99999999999999 weeks at 4pm to stretch"),
                      "I couldn't set that reminder"));
    CHECK(store.list({}).empty());
}
