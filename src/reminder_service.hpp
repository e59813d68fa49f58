#pragma once
#include "reminder_store.hpp"
#include "utils.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chime {

// Command surface shared by the voice loop, the web UI and the CLI.
// Errors from user-initiated calls propagate: ParseError, StoreError,
// NotFound, InvalidTransition. handle_command() turns them into replies.
class ReminderService {
public:
    using Clock = std::function<int64_t()>;

    ReminderService(ReminderStore& store, std::optional<int> utc_offset_minutes,
                    Clock clock = epoch_now);

    int64_t create_reminder(const std::string& message, const std::string& time_text,
                            const std::string& recurrence_text = "none");
    std::vector<Reminder> list_reminders(const ReminderFilter& filter = {});
    Reminder get_reminder(int64_t id) { return store_.get(id); }
    void cancel_reminder(int64_t id);

    // Cancels pending reminders whose message equals `text` ignoring case.
    int cancel_by_message(const std::string& text);

    // Interprets one spoken/typed sentence and returns the reply to speak.
    // Utterances longer than this are refused before any pattern matching.
    static constexpr size_t kMaxUtteranceLength = 1000;

    std::string handle_command(const std::string& text);

    std::string describe(const Reminder& r) const;
    int64_t utc_offset() const;

    // Called after every successful create/cancel (used to wake the scheduler).
    void set_on_change(std::function<void()> cb) { on_change_ = std::move(cb); }

    static const char* help_text();

private:
    ReminderStore& store_;
    std::optional<int> utc_offset_minutes_;
    Clock clock_;
    std::function<void()> on_change_;

    std::string handle_create(const std::string& rest);
    std::string handle_list();
    std::string handle_cancel(const std::string& target);
    void changed() { if (on_change_) on_change_(); }
};

} // namespace chime
