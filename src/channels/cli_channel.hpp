#pragma once
#include "channel.hpp"
#include <iostream>
#include <atomic>

namespace chime {

// Text-mode stand-in for the spoken command loop: each line is one utterance.
class CLIChannel : public Channel {
public:
    CLIChannel(std::istream& in, std::ostream& out, bool enabled_flag = true)
        : in_(in), out_(out), enabled_(enabled_flag) {}

    std::string name() const override { return "cli"; }
    bool enabled() const override { return enabled_; }
    void start(CommandHandler handler) override {
        handler_ = std::move(handler);
    }
    void stop() override { stopped_ = true; }

    std::string handle_line(const std::string& speaker, const std::string& text) {
        if (handler_) {
            return handler_(Utterance{"cli", speaker, text});
        }
        return "[error] No handler";
    }

    // Reads utterances until EOF, an exit word, or stop(). Returns the number handled.
    int run(const std::string& prompt = "chime> ") {
        int handled = 0;
        std::string line;
        while (!stopped_) {
            out_ << prompt << std::flush;
            if (!std::getline(in_, line) || stopped_) break;
            if (line.empty()) continue;
            if (is_exit_word(line)) {
                out_ << "Goodbye! Have a great day!\n";
                break;
            }
            out_ << handle_line("local", line) << "\n";
            ++handled;
        }
        return handled;
    }

    static bool is_exit_word(const std::string& line) {
        return line == "exit" || line == "quit" || line == "stop" ||
               line == "goodbye" || line == ":q";
    }

private:
    std::istream& in_;
    std::ostream& out_;
    bool enabled_;
    std::atomic<bool> stopped_{false};
    CommandHandler handler_;
};

} // namespace chime
