#pragma once
#include <string>
#include <functional>

namespace chime {

// One spoken or typed command as it reached the assistant.
struct Utterance {
    std::string channel;  // "cli", "http"
    std::string speaker;
    std::string text;
};

// Turns an utterance into the reply that is spoken or shown back.
using CommandHandler = std::function<std::string(const Utterance&)>;

// A surface that accepts reminder commands. start() installs the handler
// and begins accepting input; stop() must be safe to call more than once.
class Channel {
public:
    virtual ~Channel() = default;
    virtual std::string name() const = 0;
    virtual bool enabled() const = 0;
    virtual void start(CommandHandler handler) = 0;
    virtual void stop() = 0;
};

} // namespace chime
