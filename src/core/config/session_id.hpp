#pragma once
#include <atomic>
#include <string>
#include <unistd.h>

namespace mcpbridge::core::config {

    // "<server>-<pid>-<n>": basename of the server command, this bridge's
    // pid, and a per-process sequence number.
    inline std::string generate_session_id(const std::string& command) {
        static std::atomic<unsigned> sequence{0};

        const auto slash = command.find_last_of('/');
        std::string server = slash == std::string::npos ? command : command.substr(slash + 1);
        if (server.empty()) {
            server = "bridge";
        }
        return server + "-" + std::to_string(getpid()) + "-" + std::to_string(++sequence);
    }

} // namespace mcpbridge::core::config
