#include "status.hpp"
#include "config.hpp"
#include "reminder_store.hpp"
#include "errors.hpp"
#include <iostream>
#include <cstdlib>

namespace chime {

int cmd_status() {
    std::string cfg_path = default_config_path();
    Config cfg = Config::load(cfg_path);

    std::cout << "=== chime status ===\n";
    std::cout << "Config path  : " << cfg_path << "\n";
    std::cout << "Workspace    : " << cfg.workspace_path() << "\n";
    std::cout << "Database     : " << cfg.db_path() << "\n";
    std::cout << "Poll every   : " << cfg.poll_interval_seconds << "s\n";
    std::cout << "Retention    : "
              << (cfg.retention_days > 0 ? std::to_string(cfg.retention_days) + " days" : "forever") << "\n";

    int64_t offset = cfg.utc_offset_at(epoch_now());
    std::cout << "UTC offset   : " << (offset >= 0 ? "+" : "-")
              << std::abs(offset) / 3600 << "h" << (std::abs(offset) % 3600) / 60 << "m"
              << (cfg.utc_offset_minutes ? " (config)" : " (host)") << "\n";

    std::cout << "Sinks        : ";
    bool first = true;
    if (cfg.notify.console) { std::cout << "console"; first = false; }
    if (!cfg.notify.speech_command.empty()) {
        if (!first) std::cout << ", ";
        std::cout << "speech (" << cfg.notify.speech_command << ")";
        first = false;
    }
    if (!cfg.notify.webhook_url.empty()) {
        if (!first) std::cout << ", ";
        std::cout << "webhook (" << cfg.notify.webhook_url << ")";
        first = false;
    }
    if (first) std::cout << "(none)";
    std::cout << "\n";

    std::cout << "Channels     : " << (cfg.voice_enabled ? "voice" : "");
    if (cfg.http_channel.enabled) std::cout << (cfg.voice_enabled ? ", " : "") << "http";
    std::cout << "\n";
    if (!cfg.http_channel.api_key.empty()) {
        std::cout << "HTTP Auth    : Bearer token enabled\n";
    }
    if (cfg.http_channel.rate_limit_rpm > 0) {
        std::cout << "Rate Limit   : " << cfg.http_channel.rate_limit_rpm << " req/min\n";
    }

    try {
        ReminderStore store(cfg.db_path());
        auto counts = store.counts();
        std::cout << "Reminders    : " << counts[ReminderStatus::pending] << " pending, "
                  << counts[ReminderStatus::fired] << " fired, "
                  << counts[ReminderStatus::cancelled] << " cancelled\n";
        ReminderFilter f;
        f.status = ReminderStatus::pending;
        auto pending = store.list(f);
        if (!pending.empty()) {
            std::cout << "Next         : #" << pending.front().id << " at "
                      << format_utc(pending.front().fire_at) << " \""
                      << pending.front().message << "\"\n";
        }
    } catch (const StoreError& e) {
        std::cout << "Reminders    : unavailable (" << e.what() << ")\n";
        return 1;
    }
    return 0;
}

} // namespace chime
