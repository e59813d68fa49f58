#include "webhook_sink.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace chime {

WebhookSink::WebhookSink(const std::string& url, int timeout_sec)
    : timeout_sec_(timeout_sec) {
    size_t pos = 0;
    if (url.compare(0, 7, "http://") == 0) {
        pos = 7;
    } else if (url.compare(0, 8, "https://") == 0) {
        throw std::invalid_argument("webhook sink supports http:// URLs only: " + url);
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) path_ = url.substr(slash);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        host_ = host_port.substr(0, colon);
        try {
            port_ = std::stoi(host_port.substr(colon + 1));
        } catch (const std::logic_error&) {
            throw std::invalid_argument("bad port in webhook URL: " + url);
        }
    } else {
        host_ = host_port;
    }
    if (host_.empty()) throw std::invalid_argument("missing host in webhook URL: " + url);
}

void WebhookSink::deliver(const Reminder& reminder) {
    httplib::Client cli(host_, port_);
    cli.set_connection_timeout(timeout_sec_);
    cli.set_read_timeout(timeout_sec_);

    nlohmann::json body = reminder.to_json();
    body["event"] = "reminder.fired";

    auto res = cli.Post(path_, body.dump(), "application/json");
    if (!res) {
        throw TransientError("webhook POST to " + host_ + ":" + std::to_string(port_) + path_ +
                             " failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw TransientError("webhook returned HTTP " + std::to_string(res->status));
    }
}

} // namespace chime
