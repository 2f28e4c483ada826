#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/message_contract.hpp"

namespace mcpbridge::rpc {

using Completion = std::future<core::errors::Result<nlohmann::json>>;

// Handle returned to the caller of issue(). The future is satisfied exactly
// once: by the response, a timeout, cancel() or process termination.
struct PendingCall {
    std::int64_t id = 0;
    std::string method;
    Completion completion;
};

// Matches responses on a shared stream to the requests that asked for them.
//
// All table mutations go through one mutex and every completion path uses
// the same remove-then-complete step, so a response racing its own timeout
// completes the caller once and the loser is a no-op. Promises are always
// fulfilled after the lock is released.
class RequestCorrelator {
public:
    // Sends one line. The deadline bounds how long the writer may wait for
    // the server to accept it.
    using LineWriter = std::function<core::errors::Status(
        const std::string& line, std::chrono::steady_clock::time_point deadline)>;

    explicit RequestCorrelator(
        LineWriter writer,
        std::chrono::milliseconds default_timeout = std::chrono::milliseconds(30000));
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    core::errors::Result<PendingCall> issue(
        const std::string& method, const nlohmann::json& params,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    core::errors::Status notify(const std::string& method,
                                const nlohmann::json& params = nlohmann::json());

    void on_message(const protocol::Message& message);
    bool on_timeout(std::int64_t id);
    bool cancel(std::int64_t id);
    void on_process_terminated(const std::string& reason);

    std::size_t pending_count() const;
    bool terminated() const;

private:
    struct PendingRequest {
        std::int64_t id = 0;
        std::string method;
        std::chrono::steady_clock::time_point issued_at;
        std::chrono::steady_clock::time_point deadline;
        std::promise<core::errors::Result<nlohmann::json>> completion;
    };

    std::optional<PendingRequest> take(std::int64_t id);
    void timer_loop();

    LineWriter writer_;
    const std::chrono::milliseconds default_timeout_;
    std::atomic<std::int64_t> next_id_{1};

    mutable std::mutex mutex_;
    std::condition_variable timer_cv_;
    std::unordered_map<std::int64_t, PendingRequest> pending_;
    bool terminated_ = false;
    std::string termination_reason_;
    bool stopping_ = false;
    std::thread timer_thread_;
};

}  // namespace mcpbridge::rpc
