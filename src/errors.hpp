#pragma once
#include <stdexcept>
#include <string>
#include <cstdint>

namespace chime {

// Time text could not be turned into a fire time. Nothing was written.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& text, const std::string& reason = "unrecognized time")
        : std::runtime_error(reason + ": \"" + text + "\""), text_(text) {}

    const std::string& text() const { return text_; }

private:
    std::string text_;
};

// Persistence layer unavailable or a write failed.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

class NotFound : public std::runtime_error {
public:
    explicit NotFound(int64_t id)
        : std::runtime_error("reminder not found: id=" + std::to_string(id)), id_(id) {}

    int64_t id() const { return id_; }

private:
    int64_t id_;
};

class InvalidTransition : public std::runtime_error {
public:
    InvalidTransition(int64_t id, const std::string& from, const std::string& to)
        : std::runtime_error("invalid transition for id=" + std::to_string(id) +
                             ": " + from + " -> " + to)
        , from_(from), to_(to) {}

    const std::string& from() const { return from_; }
    const std::string& to() const { return to_; }

private:
    std::string from_;
    std::string to_;
};

// Raised by a notification sink when delivery failed and should be retried.
class TransientError : public std::runtime_error {
public:
    explicit TransientError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace chime
