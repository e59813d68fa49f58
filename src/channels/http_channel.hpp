#pragma once
#include "channel.hpp"
#include "../config.hpp"
#include "../rate_limiter.hpp"
#include "../reminder_service.hpp"
#include <httplib.h>
#include <thread>

namespace chime {

// Web UI plus a small JSON API over the reminder service:
//   GET  /                      web page
//   GET  /health
//   GET  /reminders[?status=pending|fired|cancelled|all]
//   POST /reminders             {"message", "when", "recurrence"?}
//   GET  /reminders/{id}
//   DELETE /reminders/{id}      cancels
//   POST /chat                  {"text"} -> {"reply"}
class HTTPChannel : public Channel {
public:
    HTTPChannel(const std::string& host, int port, const HTTPChannelConfig& cfg,
                ReminderService& service)
        : host_(host), port_(port), config_(cfg), service_(service),
          rate_limiter_(cfg.rate_limit_rpm) {}

    std::string name() const override { return "http"; }
    bool enabled() const override { return config_.enabled; }

    // Request bodies above this size are rejected with 413.
    static constexpr size_t kMaxPayloadBytes = 64 * 1024;

    void start(CommandHandler handler) override;
    void stop() override;

private:
    std::string host_;
    int port_;
    HTTPChannelConfig config_;
    ReminderService& service_;
    CommandHandler handler_;
    httplib::Server server_;
    std::thread thread_;
    RateLimiter rate_limiter_;

    void register_routes();
    bool check_auth(const httplib::Request& req, httplib::Response& res);
    bool check_rate_limit(httplib::Response& res);
};

} // namespace chime
