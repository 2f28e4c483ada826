#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <thread>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace mcpbridge::process {

enum class ProcessState {
    Starting,
    Ready,
    Degraded,
    Terminated
};

std::string to_string(ProcessState state);

// Owns one child process and its three pipes.
//
// stdout bytes are handed to the chunk handler in arrival order from a
// single reader thread. stderr is logged line by line. The exit handler
// runs exactly once, on the reader thread, after the child is reaped; it
// must not call terminate() on this supervisor.
class ProcessSupervisor {
public:
    using ChunkHandler = std::function<void(std::string_view chunk)>;
    using ExitHandler = std::function<void(int exit_code)>;

    explicit ProcessSupervisor(std::uint32_t terminate_grace_ms = 2000);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    core::errors::Status start(const std::string& command,
                               const std::vector<std::string>& args,
                               ChunkHandler on_chunk, ExitHandler on_exit);

    using Deadline = std::chrono::steady_clock::time_point;

    // Writes line + '\n' as one unit. Concurrent callers never interleave.
    // A server that stops reading makes the call fail with RequestTimeout
    // at the deadline, or with ProcessTerminated once terminate() starts.
    // A line cut short that way is completed before the next one is sent.
    core::errors::Status write(const std::string& line,
                               std::optional<Deadline> deadline = std::nullopt);

    // Close stdin, SIGTERM, SIGKILL after the grace period. Idempotent.
    void terminate();

    void mark_degraded();

    ProcessState state() const;
    pid_t pid() const;
    std::optional<int> exit_code() const;

private:
    void reader_loop();
    void report_exit(int exit_code);
    bool wait_for_exit(std::chrono::milliseconds timeout);
    void close_stdin();
    core::errors::Status flush_pending_locked(const std::optional<Deadline>& deadline);

    const std::uint32_t terminate_grace_ms_;

    mutable std::mutex state_mutex_;
    std::condition_variable exited_cv_;
    ProcessState state_ = ProcessState::Starting;
    std::optional<int> exit_code_;
    bool started_ = false;
    pid_t pid_ = -1;

    std::mutex write_mutex_;
    std::atomic_bool stdin_closing_{false};
    std::string unflushed_;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    ChunkHandler on_chunk_;
    ExitHandler on_exit_;

    std::mutex terminate_mutex_;
    std::atomic_bool stop_requested_{false};
    std::atomic_bool exit_reported_{false};
    std::thread reader_;
};

}  // namespace mcpbridge::process
