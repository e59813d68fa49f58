#include "config.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace chime {

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    j["workspace"] = workspace;
    j["poll_interval_seconds"] = poll_interval_seconds;
    j["retention_days"] = retention_days;
    if (utc_offset_minutes) {
        j["utc_offset_minutes"] = *utc_offset_minutes;
    } else {
        j["utc_offset_minutes"] = nullptr;
    }
    j["voice_enabled"] = voice_enabled;

    // Notification sinks
    auto& n = j["notify"];
    n["console"] = notify.console;
    n["speech_command"] = notify.speech_command;
    n["webhook_url"] = notify.webhook_url;
    if (notify.webhook_timeout != 10) n["webhook_timeout"] = notify.webhook_timeout;

    // Channels
    auto& hc = j["channels"]["http"];
    hc["enabled"] = http_channel.enabled;
    if (!http_channel.api_key.empty()) hc["api_key"] = http_channel.api_key;
    if (http_channel.rate_limit_rpm > 0) hc["rate_limit_rpm"] = http_channel.rate_limit_rpm;

    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    c.workspace = j.value("workspace", c.workspace);
    c.poll_interval_seconds = j.value("poll_interval_seconds", c.poll_interval_seconds);
    c.retention_days = j.value("retention_days", c.retention_days);
    c.voice_enabled = j.value("voice_enabled", c.voice_enabled);
    if (j.contains("utc_offset_minutes") && j["utc_offset_minutes"].is_number_integer()) {
        c.utc_offset_minutes = j["utc_offset_minutes"].get<int>();
    }

    if (c.poll_interval_seconds < 1) {
        std::cerr << "[config] poll_interval_seconds must be >= 1, using 1\n";
        c.poll_interval_seconds = 1;
    }
    if (c.retention_days < 0) c.retention_days = 0;

    if (j.contains("notify")) {
        auto& n = j["notify"];
        c.notify.console = n.value("console", c.notify.console);
        c.notify.speech_command = n.value("speech_command", "");
        c.notify.webhook_url = n.value("webhook_url", "");
        c.notify.webhook_timeout = n.value("webhook_timeout", c.notify.webhook_timeout);
    }

    if (j.contains("channels") && j["channels"].contains("http")) {
        auto& hc = j["channels"]["http"];
        c.http_channel.enabled = hc.value("enabled", true);
        c.http_channel.api_key = hc.value("api_key", "");
        c.http_channel.rate_limit_rpm = hc.value("rate_limit_rpm", 0);
    }

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path);
    if (!f) throw std::runtime_error("Cannot write config: " + path);
    f << to_json().dump(2) << std::endl;
}

} // namespace chime
