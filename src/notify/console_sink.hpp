#pragma once
#include "notification_sink.hpp"
#include <ostream>
#include <mutex>

namespace chime {

class ConsoleSink : public NotificationSink {
public:
    explicit ConsoleSink(std::ostream& out) : out_(out) {}

    std::string name() const override { return "console"; }

    void deliver(const Reminder& reminder) override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "\n[reminder] #" << reminder.id << " " << reminder.message << std::endl;
        if (!out_) throw TransientError("console stream is not writable");
    }

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace chime
