#include "scheduler.hpp"
#include "errors.hpp"
#include <iostream>
#include <set>
#include <chrono>

namespace chime {

Scheduler::Scheduler(ReminderStore& store, NotificationSink& sink, Options opts, Clock clock)
    : store_(store), sink_(sink), opts_(opts), clock_(std::move(clock)) {
    if (opts_.poll_interval_seconds < 1) opts_.poll_interval_seconds = 1;
}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    if (running_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lk(wait_mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&Scheduler::run_loop, this);
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lk(wait_mutex_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

void Scheduler::wake() {
    {
        std::lock_guard<std::mutex> lk(wait_mutex_);
        wake_requested_ = true;
    }
    wake_cv_.notify_all();
}

void Scheduler::run_loop() {
    std::cerr << "[scheduler] Started (interval=" << opts_.poll_interval_seconds << "s)\n";
    std::unique_lock<std::mutex> lk(wait_mutex_);
    while (!stop_requested_) {
        wake_requested_ = false;
        lk.unlock();
        try {
            PollReport r = poll_once();
            if (r.delivered || r.failed) {
                std::cerr << "[scheduler] Cycle: delivered=" << r.delivered
                          << " failed=" << r.failed << " skipped=" << r.skipped << "\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "[scheduler] Cycle error: " << e.what() << "\n";
        }
        lk.lock();
        wake_cv_.wait_for(lk, std::chrono::seconds(opts_.poll_interval_seconds),
                          [this] { return stop_requested_ || wake_requested_; });
    }
    std::cerr << "[scheduler] Stopped\n";
}

PollReport Scheduler::poll_once() {
    return poll_once(clock_());
}

PollReport Scheduler::poll_once(int64_t now) {
    std::lock_guard<std::mutex> cycle(cycle_mutex_);
    PollReport report;

    std::vector<Reminder> due;
    try {
        due = store_.due(now);
    } catch (const std::exception& e) {
        std::cerr << "[scheduler] Failed to scan for due reminders: " << e.what() << "\n";
        ++cycles_;
        return report;
    }

    // `due` is already ordered by fire_at, then id.
    std::set<int64_t> handled;
    for (const auto& r : due) {
        if (!handled.insert(r.id).second) continue;
        ++report.due;
        try {
            fire_one(r, now, report);
        } catch (const TransientError& e) {
            ++report.failed;
            std::cerr << "[scheduler] Delivery of #" << r.id << " failed, will retry: "
                      << e.what() << "\n";
        } catch (const std::exception& e) {
            ++report.failed;
            std::cerr << "[scheduler] Error firing #" << r.id << ": " << e.what() << "\n";
        }
    }

    if (opts_.retention_days > 0) {
        try {
            report.purged = store_.purge(now - int64_t(opts_.retention_days) * 86400);
            if (report.purged > 0) {
                std::cerr << "[scheduler] Purged " << report.purged << " old reminders\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "[scheduler] Purge failed: " << e.what() << "\n";
        }
    }

    ++cycles_;
    return report;
}

void Scheduler::fire_one(const Reminder& seen, int64_t now, PollReport& report) {
    // Re-read so a cancel issued since the scan suppresses this firing.
    Reminder cur;
    try {
        cur = store_.get(seen.id);
    } catch (const NotFound&) {
        ++report.skipped;
        return;
    }
    if (!cur.due(now) || cur.fire_at != seen.fire_at) {
        ++report.skipped;
        return;
    }

    sink_.deliver(cur);

    FiringOutcome outcome = store_.record_firing(cur.id, cur.fire_at, now);
    switch (outcome) {
        case FiringOutcome::fired:
            std::cerr << "[scheduler] Fired #" << cur.id << "\n";
            break;
        case FiringOutcome::rearmed:
            std::cerr << "[scheduler] Fired #" << cur.id << ", re-armed ("
                      << cur.recurrence.to_string() << ")\n";
            break;
        case FiringOutcome::stale:
            // Cancelled or deleted while the delivery was underway.
            std::cerr << "[scheduler] #" << cur.id << " changed during delivery\n";
            break;
    }
    ++report.delivered;
}

} // namespace chime
