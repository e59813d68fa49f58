#include <iostream>
#include <string>
#include <vector>
#include "onboard.hpp"
#include "serve.hpp"
#include "status.hpp"
#include "remind_cmd.hpp"

static void print_usage() {
    std::cout << "Usage: chime <command> [options]\n\n"
              << "Commands:\n"
              << "  onboard                     Initialize ~/.chime\n"
              << "  serve [--host H] [--port P] Run the scheduler, web UI and voice loop\n"
              << "  remind add --message M --when T [--every R]\n"
              << "  remind list [--all | --status S]\n"
              << "  remind cancel <id>          Cancel a pending reminder\n"
              << "  remind delete <id>          Delete a reminder record\n"
              << "  remind run-once             Fire everything due now and exit\n"
              << "  status                      Show configuration and reminder counts\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (cmd == "onboard") {
        return chime::cmd_onboard();
    }
    else if (cmd == "serve") {
        std::string host = "127.0.0.1";
        int port = 18791;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--host" && i + 1 < args.size()) {
                host = args[++i];
            } else if (args[i] == "--port" && i + 1 < args.size()) {
                try {
                    port = std::stoi(args[++i]);
                } catch (const std::logic_error&) {
                    std::cerr << "Invalid port: " << args[i] << "\n";
                    return 1;
                }
            }
        }
        return chime::cmd_serve(host, port);
    }
    else if (cmd == "status") {
        return chime::cmd_status();
    }
    else if (cmd == "remind") {
        return chime::cmd_remind(args);
    }
    else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
