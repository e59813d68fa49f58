#include "remind_cmd.hpp"
#include "reminder_service.hpp"
#include "reminder_store.hpp"
#include "scheduler.hpp"
#include "notify/sink_factory.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>

namespace chime {

static void print_reminder(const ReminderService& svc, const Reminder& r) {
    std::cout << "id=" << r.id << " status=" << status_name(r.status)
              << " at=" << format_utc(r.fire_at)
              << " (" << format_local(r.fire_at, svc.utc_offset()) << ")";
    if (r.recurrence.recurring()) std::cout << " every=" << r.recurrence.to_string();
    std::cout << " message=\"" << r.message << "\"\n";
}

static int parse_id(const std::string& s, int64_t& id) {
    try {
        size_t used = 0;
        id = std::stoll(s, &used);
        if (used == s.size()) return 0;
    } catch (const std::logic_error&) {
    }
    std::cerr << "Not a reminder id: " << s << "\n";
    return 1;
}

int cmd_remind(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: chime remind <add|list|cancel|delete|run-once> [options]\n";
        return 1;
    }

    Config cfg = Config::load(default_config_path());

    try {
        ReminderStore store(cfg.db_path());
        ReminderService svc(store, cfg.utc_offset_minutes);

        std::string subcmd = args[0];

        if (subcmd == "add") {
            std::string message, when, every = "none";
            for (size_t i = 1; i < args.size(); i++) {
                if ((args[i] == "--message" || args[i] == "-m") && i + 1 < args.size()) {
                    message = args[++i];
                } else if (args[i] == "--when" && i + 1 < args.size()) {
                    when = args[++i];
                } else if (args[i] == "--every" && i + 1 < args.size()) {
                    every = args[++i];
                }
            }
            if (message.empty() || when.empty()) {
                std::cerr << "Usage: chime remind add --message M --when T [--every daily|weekly|\"N minutes\"]\n";
                return 1;
            }
            if (every != "none" && to_lower(every).rfind("every", 0) != 0 &&
                every != "daily" && every != "weekly" && every != "hourly") {
                every = "every " + every;
            }

            int64_t id = svc.create_reminder(message, when, every);
            std::cout << "Added reminder: ";
            print_reminder(svc, store.get(id));
            return 0;
        }
        else if (subcmd == "list") {
            ReminderFilter filter;
            filter.status = ReminderStatus::pending;
            for (size_t i = 1; i < args.size(); i++) {
                if (args[i] == "--all") {
                    filter.status.reset();
                } else if (args[i] == "--status" && i + 1 < args.size()) {
                    filter.status = parse_status(args[++i]);
                }
            }
            auto reminders = svc.list_reminders(filter);
            if (reminders.empty()) {
                std::cout << "No reminders.\n";
                return 0;
            }
            for (auto& r : reminders) print_reminder(svc, r);
            return 0;
        }
        else if (subcmd == "cancel" || subcmd == "delete") {
            if (args.size() < 2) {
                std::cerr << "Usage: chime remind " << subcmd << " <id>\n";
                return 1;
            }
            int64_t id = 0;
            if (parse_id(args[1], id) != 0) return 1;
            if (subcmd == "cancel") {
                svc.cancel_reminder(id);
                std::cout << "Cancelled reminder: id=" << id << "\n";
            } else if (store.remove(id)) {
                std::cout << "Deleted reminder: id=" << id << "\n";
            } else {
                std::cerr << "Reminder not found: id=" << id << "\n";
                return 1;
            }
            return 0;
        }
        else if (subcmd == "run-once") {
            auto sinks = make_sinks(cfg.notify, std::cout);
            Scheduler::Options opts;
            opts.poll_interval_seconds = cfg.poll_interval_seconds;
            opts.retention_days = cfg.retention_days;
            Scheduler scheduler(store, *sinks, opts);
            PollReport r = scheduler.poll_once();
            std::cout << "due=" << r.due << " delivered=" << r.delivered
                      << " failed=" << r.failed << " skipped=" << r.skipped
                      << " purged=" << r.purged << "\n";
            return r.failed > 0 ? 2 : 0;
        }

        std::cerr << "Unknown remind subcommand: " << subcmd << "\n";
        return 1;
    } catch (const ParseError& e) {
        std::cerr << "Could not understand the time: " << e.what() << "\n";
    } catch (const NotFound& e) {
        std::cerr << e.what() << "\n";
    } catch (const InvalidTransition& e) {
        std::cerr << e.what() << "\n";
    } catch (const StoreError& e) {
        std::cerr << "[store] " << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
    }
    return 1;
}

} // namespace chime
