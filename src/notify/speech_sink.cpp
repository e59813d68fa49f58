#include "speech_sink.hpp"
#include <cstdio>

#ifdef _WIN32
#define popen _popen
#define pclose _pclose
#else
#include <sys/wait.h>
#endif

namespace chime {

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string SpeechSink::build_command(const std::string& text) const {
    std::string quoted = shell_quote(text);
    std::string cmd = template_;
    size_t pos = cmd.find("{message}");
    if (pos == std::string::npos) return cmd + " " + quoted;
    while (pos != std::string::npos) {
        cmd.replace(pos, 9, quoted);
        pos = cmd.find("{message}", pos + quoted.size());
    }
    return cmd;
}

void SpeechSink::deliver(const Reminder& reminder) {
    std::string cmd = build_command("Reminder: " + reminder.message);
#ifndef _WIN32
    if (timeout_sec_ > 0) {
        cmd = "timeout " + std::to_string(timeout_sec_) + " sh -c " + shell_quote(cmd);
    }
#endif
    cmd += " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) throw TransientError("failed to start speech command");

    std::string output;
    char buffer[512];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        if (output.size() < 2048) output += buffer;
    }
    int status = pclose(pipe);
#ifndef _WIN32
    if (WIFEXITED(status)) status = WEXITSTATUS(status);
#endif
    if (status != 0) {
        throw TransientError("speech command exited with " + std::to_string(status) +
                             (output.empty() ? "" : ": " + output));
    }
}

} // namespace chime
