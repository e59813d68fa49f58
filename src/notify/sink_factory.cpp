#include "sink_factory.hpp"
#include "console_sink.hpp"
#include "speech_sink.hpp"
#include "webhook_sink.hpp"
#include <iostream>

namespace chime {

std::unique_ptr<FanoutSink> make_sinks(const NotifyConfig& cfg, std::ostream& console) {
    auto fanout = std::make_unique<FanoutSink>();

    if (cfg.console) {
        fanout->add(std::make_unique<ConsoleSink>(console));
    }
    if (!cfg.speech_command.empty()) {
        fanout->add(std::make_unique<SpeechSink>(cfg.speech_command));
    }
    if (!cfg.webhook_url.empty()) {
        try {
            fanout->add(std::make_unique<WebhookSink>(cfg.webhook_url, cfg.webhook_timeout));
        } catch (const std::invalid_argument& e) {
            std::cerr << "[notify] Webhook sink disabled: " << e.what() << "\n";
        }
    }

    if (fanout->empty()) {
        std::cerr << "[warn] No notification sinks enabled; reminders will fire silently\n";
    } else {
        std::cerr << "[notify] Sinks: " << fanout->name() << "\n";
    }
    return fanout;
}

} // namespace chime
