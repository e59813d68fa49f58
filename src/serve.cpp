#include "serve.hpp"
#include "config.hpp"
#include "reminder_store.hpp"
#include "reminder_service.hpp"
#include "scheduler.hpp"
#include "notify/sink_factory.hpp"
#include "channels/http_channel.hpp"
#include "channels/cli_channel.hpp"
#include "errors.hpp"
#include <iostream>
#include <csignal>
#ifndef _WIN32
#include <signal.h>
#endif
#include <atomic>
#include <thread>
#include <chrono>

namespace chime {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

// Without SA_RESTART a blocked read on stdin returns on Ctrl+C, so the
// voice loop sees end of input and exits.
static void install_signal_handlers() {
#ifdef _WIN32
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#else
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
#endif
}

int cmd_serve(const std::string& host, int port) {
    Config cfg = Config::load(default_config_path());

    std::unique_ptr<ReminderStore> store;
    try {
        store = std::make_unique<ReminderStore>(cfg.db_path());
    } catch (const StoreError& e) {
        std::cerr << "[serve] " << e.what() << "\n";
        return 1;
    }
    std::cerr << "[serve] Reminder DB: " << store->path() << "\n";

    ReminderService service(*store, cfg.utc_offset_minutes);

    auto sinks = make_sinks(cfg.notify, std::cout);
    Scheduler::Options opts;
    opts.poll_interval_seconds = cfg.poll_interval_seconds;
    opts.retention_days = cfg.retention_days;
    Scheduler scheduler(*store, *sinks, opts);
    service.set_on_change([&scheduler]() { scheduler.wake(); });
    scheduler.start();
    std::cerr << "[serve] Scheduler started\n";

    auto handle_message = [&](const Utterance& msg) -> std::string {
        return service.handle_command(msg.text);
    };

    HTTPChannel http_ch(host, port, cfg.http_channel, service);
    if (http_ch.enabled()) {
        http_ch.start(handle_message);
        std::cerr << "[serve] HTTP channel started on " << host << ":" << port << "\n";
    }

    install_signal_handlers();

    if (cfg.voice_enabled) {
        std::cerr << "[serve] Ready. Say a command (\"help\" for examples) or Ctrl+C to quit.\n";
        CLIChannel cli_ch(std::cin, std::cout);
        cli_ch.start(handle_message);
        std::cout << "Hello! I'm your reminder assistant. How can I help you today?\n";
        std::thread watcher([&cli_ch]() {
            while (g_running) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            cli_ch.stop();
        });
        cli_ch.run();
        g_running = false;
        watcher.join();
    } else {
        std::cerr << "[serve] Ready. Ctrl+C to quit.\n";
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    std::cerr << "[serve] Shutting down...\n";
    http_ch.stop();
    scheduler.stop();
    std::cerr << "[serve] Done.\n";
    return 0;
}

} // namespace chime
