#pragma once
#include "notification_sink.hpp"

namespace chime {

// Speaks a reminder through an external text-to-speech command such as
// `espeak {message}`. `{message}` is replaced by the reminder text quoted as a
// single shell word; without a placeholder the text is appended.
class SpeechSink : public NotificationSink {
public:
    explicit SpeechSink(std::string command_template, int timeout_sec = 30)
        : template_(std::move(command_template)), timeout_sec_(timeout_sec) {}

    std::string name() const override { return "speech"; }
    void deliver(const Reminder& reminder) override;

    std::string build_command(const std::string& text) const;

private:
    std::string template_;
    int timeout_sec_;
};

std::string shell_quote(const std::string& s);

} // namespace chime
