#include "onboard.hpp"
#include "config.hpp"
#include "reminder_store.hpp"
#include "errors.hpp"
#include <iostream>

namespace chime {

int cmd_onboard() {
    std::string config_path = default_config_path();

    // Create config if not exists
    if (!fs::exists(config_path)) {
        Config cfg = Config::make_default();
        try {
            cfg.save(config_path);
        } catch (const std::exception& e) {
            std::cerr << "[onboard] " << e.what() << "\n";
            return 1;
        }
        std::cout << "[onboard] Created config: " << config_path << "\n";
    } else {
        std::cout << "[onboard] Config already exists: " << config_path << "\n";
    }

    Config cfg = Config::load(config_path);
    fs::create_directories(cfg.workspace_path());
    std::cout << "[onboard] Workspace: " << cfg.workspace_path() << "\n";

    // Opening the store creates the schema.
    try {
        ReminderStore store(cfg.db_path());
        std::cout << "[onboard] Reminder DB: " << store.path() << "\n";
    } catch (const StoreError& e) {
        std::cerr << "[onboard] " << e.what() << "\n";
        return 1;
    }

    std::cout << "[onboard] Done. Run 'chime serve' to start the assistant.\n";
    return 0;
}

} // namespace chime
