#include "process/process_supervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace mcpbridge::process {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

constexpr int kPollIntervalMs = 50;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

// Reads everything currently available. Marks the pipe closed on EOF or
// a hard error.
template <typename Sink>
void drain_pipe(int& fd, bool& is_open, Sink&& sink) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            sink(std::string_view(buffer, static_cast<std::size_t>(n)));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        is_open = false;
        close_fd(fd);
        return;
    }
}

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

int decode_wait_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

std::string to_string(const ProcessState state) {
    switch (state) {
        case ProcessState::Starting:
            return "starting";
        case ProcessState::Ready:
            return "ready";
        case ProcessState::Degraded:
            return "degraded";
        case ProcessState::Terminated:
            return "terminated";
        default:
            return "unknown";
    }
}

ProcessSupervisor::ProcessSupervisor(const std::uint32_t terminate_grace_ms)
    : terminate_grace_ms_(terminate_grace_ms) {}

ProcessSupervisor::~ProcessSupervisor() {
    terminate();
    if (reader_.joinable()) {
        reader_.join();
    }
}

core::errors::Status ProcessSupervisor::start(const std::string& command,
                                              const std::vector<std::string>& args,
                                              ChunkHandler on_chunk,
                                              ExitHandler on_exit) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (started_) {
            return BridgeError{ErrorCategory::InvalidState,
                               "Process supervisor was already started.",
                               "already_started",
                               "Construct a new supervisor to restart the server."};
        }
        started_ = true;
    }

    if (command.empty()) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ProcessState::Terminated;
        return BridgeError{ErrorCategory::ProcessSpawn, "No server command configured.",
                           "empty_command"};
    }

    ignore_sigpipe();
    on_chunk_ = std::move(on_chunk);
    on_exit_ = std::move(on_exit);

    // argv is built before fork; the child only calls async-signal-safe functions.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(command.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_status_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(exec_status_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_status_pipe);
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ProcessState::Terminated;
        return BridgeError{ErrorCategory::ProcessSpawn,
                           "Failed to create process pipes: " + reason,
                           "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_status_pipe);
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ProcessState::Terminated;
        return BridgeError{ErrorCategory::ProcessSpawn, "Failed to fork process: " + reason,
                           "fork_failed"};
    }

    if (pid == 0) {
        // Signal mask and ignored dispositions survive exec.
        sigset_t none;
        sigemptyset(&none);
        static_cast<void>(sigprocmask(SIG_SETMASK, &none, nullptr));
        static_cast<void>(std::signal(SIGPIPE, SIG_DFL));
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execvp(argv[0], argv.data());
        const int exec_errno = errno;
        static_cast<void>(::write(exec_status_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_status_pipe[1]);

    // EOF on the status pipe means exec succeeded and closed it.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_status_pipe[0]);

    if (n > 0) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ProcessState::Terminated;
        exit_code_ = decode_wait_status(status);
        return BridgeError{ErrorCategory::ProcessSpawn,
                           "Failed to execute '" + command + "': " +
                               std::strerror(exec_errno),
                           "exec_failed", "Check that the server command is on PATH."};
    }

    set_nonblocking(stdin_pipe[1]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        stdin_fd_ = stdin_pipe[1];
    }
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pid_ = pid;
        state_ = ProcessState::Ready;
    }

    LOG_INFO("ProcessSupervisor: started '" + command + "' pid=" + std::to_string(pid));
    reader_ = std::thread([this] { reader_loop(); });
    return core::errors::ok();
}

core::errors::Status ProcessSupervisor::write(const std::string& line,
                                              std::optional<Deadline> deadline) {
    if (line.find('\n') != std::string::npos) {
        return BridgeError{ErrorCategory::Input,
                           "Outbound line contains a raw newline.", "embedded_newline"};
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0 || stdin_closing_.load() || state() == ProcessState::Terminated) {
        return BridgeError{ErrorCategory::ProcessTerminated,
                           "Tool server process is not running.", "process_terminated"};
    }

    // Finish the tail of a line an earlier writer gave up on, or the server
    // would read two requests glued together.
    if (!unflushed_.empty()) {
        auto flushed = flush_pending_locked(deadline);
        if (core::errors::is_error(flushed)) {
            return flushed;
        }
    }

    unflushed_ = line + "\n";
    const std::size_t framed_size = unflushed_.size();
    auto flushed = flush_pending_locked(deadline);
    if (core::errors::is_error(flushed) && unflushed_.size() == framed_size) {
        // Nothing reached the pipe, so the line can simply be dropped.
        unflushed_.clear();
    }
    return flushed;
}

core::errors::Status ProcessSupervisor::flush_pending_locked(
    const std::optional<Deadline>& deadline) {
    std::size_t written = 0;
    while (written < unflushed_.size()) {
        const ssize_t n =
            ::write(stdin_fd_, unflushed_.data() + written, unflushed_.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            unflushed_.erase(0, written);
            written = 0;
            if (stdin_closing_.load()) {
                return BridgeError{ErrorCategory::ProcessTerminated,
                                   "Tool server is shutting down.", "process_terminated"};
            }

            int wait_ms = kPollIntervalMs;
            if (deadline.has_value()) {
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                           *deadline - std::chrono::steady_clock::now())
                                           .count();
                if (remaining <= 0) {
                    LOG_WARN("ProcessSupervisor: tool server stopped reading stdin, " +
                             std::to_string(unflushed_.size()) + " bytes still queued");
                    return BridgeError{ErrorCategory::RequestTimeout,
                                       "Tool server did not accept the request in time.",
                                       "write_timeout"};
                }
                wait_ms = static_cast<int>(
                    std::min<long long>(wait_ms, static_cast<long long>(remaining)));
            }

            pollfd fd{stdin_fd_, POLLOUT, 0};
            if (poll(&fd, 1, wait_ms) < 0 && errno != EINTR) {
                const std::string reason = std::strerror(errno);
                unflushed_.clear();
                return BridgeError{ErrorCategory::Internal,
                                   "Failed to wait on tool server stdin: " + reason,
                                   "write_failed"};
            }
            continue;
        }

        const int write_errno = errno;
        unflushed_.clear();
        if (n < 0 && write_errno == EPIPE) {
            return BridgeError{ErrorCategory::ProcessTerminated,
                               "Tool server closed its stdin.", "broken_pipe"};
        }
        return BridgeError{ErrorCategory::Internal,
                           std::string("Failed to write to tool server: ") +
                               std::strerror(write_errno),
                           "write_failed"};
    }
    unflushed_.clear();
    return core::errors::ok();
}

void ProcessSupervisor::reader_loop() {
    bool stdout_open = stdout_fd_ >= 0;
    bool stderr_open = stderr_fd_ >= 0;
    bool child_exited = false;
    int status = 0;
    std::string stderr_pending;

    auto on_stdout = [this](std::string_view chunk) {
        if (on_chunk_) {
            on_chunk_(chunk);
        }
    };
    auto on_stderr = [&stderr_pending](std::string_view chunk) {
        stderr_pending.append(chunk);
        std::size_t newline = 0;
        while ((newline = stderr_pending.find('\n')) != std::string::npos) {
            const std::string line = stderr_pending.substr(0, newline);
            stderr_pending.erase(0, newline + 1);
            if (!line.empty()) {
                LOG_WARN("tool server stderr: " + line);
            }
        }
    };

    while (!stop_requested_.load()) {
        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_fd_;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_fd_;
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            if (poll(fds, nfds, kPollIntervalMs) < 0 && errno != EINTR) {
                LOG_ERROR(std::string("ProcessSupervisor: poll failed: ") +
                          std::strerror(errno));
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
        }

        drain_pipe(stdout_fd_, stdout_open, on_stdout);
        drain_pipe(stderr_fd_, stderr_open, on_stderr);

        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            child_exited = true;
            // Bytes written just before exit are still delivered.
            drain_pipe(stdout_fd_, stdout_open, on_stdout);
            drain_pipe(stderr_fd_, stderr_open, on_stderr);
            break;
        }
    }

    if (!child_exited) {
        static_cast<void>(waitpid(pid_, &status, 0));
    }
    if (!stderr_pending.empty()) {
        LOG_WARN("tool server stderr: " + stderr_pending);
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);

    report_exit(decode_wait_status(status));
}

void ProcessSupervisor::report_exit(const int exit_code) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ProcessState::Terminated;
        exit_code_ = exit_code;
    }
    exited_cv_.notify_all();

    if (exit_reported_.exchange(true)) {
        return;
    }
    LOG_INFO("ProcessSupervisor: tool server exited with code " +
             std::to_string(exit_code));
    close_stdin();
    if (on_exit_) {
        on_exit_(exit_code);
    }
}

bool ProcessSupervisor::wait_for_exit(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return exited_cv_.wait_for(lock, timeout, [this] { return exit_code_.has_value(); });
}

void ProcessSupervisor::close_stdin() {
    // A writer waiting on a full pipe sees the flag and gives up the mutex.
    stdin_closing_.store(true);
    std::lock_guard<std::mutex> lock(write_mutex_);
    unflushed_.clear();
    close_fd(stdin_fd_);
}

void ProcessSupervisor::terminate() {
    std::lock_guard<std::mutex> terminate_lock(terminate_mutex_);

    pid_t pid = -1;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (pid_ < 0) {
            return;
        }
        pid = pid_;
    }

    // EOF on stdin is the polite shutdown request for stdio servers.
    close_stdin();

    const bool on_reader_thread = std::this_thread::get_id() == reader_.get_id();
    if (!on_reader_thread) {
        if (!wait_for_exit(std::chrono::milliseconds(100))) {
            static_cast<void>(kill(pid, SIGTERM));
            if (!wait_for_exit(std::chrono::milliseconds(terminate_grace_ms_))) {
                LOG_WARN("ProcessSupervisor: pid " + std::to_string(pid) +
                         " ignored SIGTERM, sending SIGKILL");
                static_cast<void>(kill(pid, SIGKILL));
                static_cast<void>(wait_for_exit(std::chrono::milliseconds(5000)));
            }
        }
        stop_requested_.store(true);
        if (reader_.joinable()) {
            reader_.join();
        }
    } else {
        // The reader reaps the child once it notices; it cannot join itself.
        if (!exit_code().has_value()) {
            static_cast<void>(kill(pid, SIGTERM));
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = ProcessState::Terminated;
}

void ProcessSupervisor::mark_degraded() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == ProcessState::Ready) {
        state_ = ProcessState::Degraded;
        LOG_WARN("ProcessSupervisor: transport degraded by an unreadable line");
    }
}

ProcessState ProcessSupervisor::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

pid_t ProcessSupervisor::pid() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pid_;
}

std::optional<int> ProcessSupervisor::exit_code() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_code_;
}

}  // namespace mcpbridge::process
