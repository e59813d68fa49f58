#pragma once
#include "reminder_store.hpp"
#include "notify/notification_sink.hpp"
#include "utils.hpp"
#include <functional>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <cstdint>

namespace chime {

struct PollReport {
    int due = 0;        // reminders the cycle looked at
    int delivered = 0;  // sink accepted and the firing was committed
    int failed = 0;     // sink or store error; still pending, retried next cycle
    int skipped = 0;    // cancelled, deleted or already fired since the scan
    int purged = 0;
};

// Background poller that fires due reminders. Delivery happens before the
// firing is committed, so a failed delivery leaves the reminder pending
// (at-least-once). Only one Scheduler may drive a given database.
class Scheduler {
public:
    using Clock = std::function<int64_t()>;

    struct Options {
        int poll_interval_seconds = 5;
        int retention_days = 0;  // 0 = keep fired/cancelled reminders forever
    };

    Scheduler(ReminderStore& store, NotificationSink& sink, Options opts, Clock clock = epoch_now);
    Scheduler(ReminderStore& store, NotificationSink& sink)
        : Scheduler(store, sink, Options{}) {}
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void start();
    void stop();
    bool running() const { return running_; }

    // Skips the rest of the current wait and polls now.
    void wake();

    // One synchronous poll cycle. Never throws for a single reminder's failure.
    PollReport poll_once();
    PollReport poll_once(int64_t now);

    uint64_t cycles() const { return cycles_; }

private:
    ReminderStore& store_;
    NotificationSink& sink_;
    Options opts_;
    Clock clock_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> cycles_{0};
    std::thread thread_;

    std::mutex wait_mutex_;
    std::condition_variable wake_cv_;
    bool stop_requested_ = false;
    bool wake_requested_ = false;

    std::mutex cycle_mutex_;

    void run_loop();
    void fire_one(const Reminder& seen, int64_t now, PollReport& report);
};

} // namespace chime
