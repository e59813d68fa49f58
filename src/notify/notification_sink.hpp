#pragma once
#include "../reminder.hpp"
#include "../errors.hpp"
#include <string>
#include <vector>
#include <memory>
#include <iostream>

namespace chime {

// Delivers a fired reminder to the user. deliver() returns on success and
// throws TransientError when the reminder should be retried on a later poll.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual std::string name() const = 0;
    virtual void deliver(const Reminder& reminder) = 0;
};

// Delivers to every child sink. A failure in any child fails the whole
// delivery after the others have been attempted, so the occurrence is retried.
class FanoutSink : public NotificationSink {
public:
    void add(std::unique_ptr<NotificationSink> sink) {
        sinks_.push_back(std::move(sink));
    }

    bool empty() const { return sinks_.empty(); }
    size_t size() const { return sinks_.size(); }

    std::string name() const override {
        std::string n;
        for (auto& s : sinks_) {
            if (!n.empty()) n += "+";
            n += s->name();
        }
        return n.empty() ? "none" : n;
    }

    void deliver(const Reminder& reminder) override {
        std::string failures;
        for (auto& s : sinks_) {
            try {
                s->deliver(reminder);
            } catch (const std::exception& e) {
                std::cerr << "[notify] " << s->name() << " failed for #" << reminder.id
                          << ": " << e.what() << "\n";
                if (!failures.empty()) failures += "; ";
                failures += s->name() + ": " + e.what();
            }
        }
        if (!failures.empty()) throw TransientError(failures);
    }

private:
    std::vector<std::unique_ptr<NotificationSink>> sinks_;
};

} // namespace chime
