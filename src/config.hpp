#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace chime {

struct NotifyConfig {
    bool console = true;
    std::string speech_command;  // e.g. "espeak {message}"; empty = off
    std::string webhook_url;     // http:// only; empty = off
    int webhook_timeout = 10;    // seconds
};

struct HTTPChannelConfig {
    bool enabled = true;
    std::string api_key;       // Optional Bearer token auth
    int rate_limit_rpm = 0;    // 0 = unlimited
};

struct Config {
    std::string workspace = "~/.chime/workspace";
    int poll_interval_seconds = 5;
    int retention_days = 0;                    // 0 = keep forever
    std::optional<int> utc_offset_minutes;     // unset = host time zone
    bool voice_enabled = true;                 // interactive command loop in `serve`

    NotifyConfig notify;
    HTTPChannelConfig http_channel;

    std::string workspace_path() const {
        return expand_path(workspace);
    }

    std::string db_path() const {
        return workspace_path() + "/reminders.db";
    }

    // Seconds east of UTC used to interpret clock times.
    int64_t utc_offset_at(int64_t at) const {
        if (utc_offset_minutes) return int64_t(*utc_offset_minutes) * 60;
        return host_utc_offset(at);
    }

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace chime
