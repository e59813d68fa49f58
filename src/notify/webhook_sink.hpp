#pragma once
#include "notification_sink.hpp"

namespace chime {

// POSTs {"id", "message", "fire_at", ...} to an http:// URL. Transport errors
// and non-2xx responses are reported as TransientError.
class WebhookSink : public NotificationSink {
public:
    explicit WebhookSink(const std::string& url, int timeout_sec = 10);

    std::string name() const override { return "webhook"; }
    void deliver(const Reminder& reminder) override;

    const std::string& host() const { return host_; }
    int port() const { return port_; }
    const std::string& path() const { return path_; }

private:
    std::string host_;
    int port_ = 80;
    std::string path_ = "/";
    int timeout_sec_;
};

} // namespace chime
