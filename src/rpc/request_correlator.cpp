#include "rpc/request_correlator.hpp"

#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace mcpbridge::rpc {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::string describe(const std::int64_t id, const std::string& method) {
    return "request " + std::to_string(id) + " (" + method + ")";
}

}  // namespace

RequestCorrelator::RequestCorrelator(LineWriter writer,
                                     const std::chrono::milliseconds default_timeout)
    : writer_(std::move(writer)), default_timeout_(default_timeout) {
    timer_thread_ = std::thread([this] { timer_loop(); });
}

RequestCorrelator::~RequestCorrelator() {
    on_process_terminated("request correlator destroyed");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    timer_cv_.notify_all();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

core::errors::Result<PendingCall> RequestCorrelator::issue(
    const std::string& method, const json& params,
    const std::optional<std::chrono::milliseconds> timeout) {
    const std::int64_t id = next_id_.fetch_add(1);
    const auto now = std::chrono::steady_clock::now();
    const auto limit = timeout.value_or(default_timeout_);
    const auto deadline = now + limit;

    // Serialized before registering so a bad argument leaves no entry behind.
    auto line = protocol::to_line(protocol::make_request(id, method, params));
    if (core::errors::is_error(line)) {
        LOG_WARN("RequestCorrelator: cannot send " + describe(id, method) + ": " +
                 core::errors::get_error(line).message);
        return core::errors::get_error(line);
    }

    PendingCall call;
    call.id = id;
    call.method = method;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminated_) {
            return BridgeError{ErrorCategory::ProcessTerminated,
                               "Tool server is gone: " + termination_reason_,
                               "process_terminated"};
        }

        PendingRequest entry;
        entry.id = id;
        entry.method = method;
        entry.issued_at = now;
        entry.deadline = deadline;
        call.completion = entry.completion.get_future();
        pending_.emplace(id, std::move(entry));
    }
    timer_cv_.notify_all();

    // Registered before writing so a fast response always finds its entry.
    const auto written = writer_(core::errors::get_value(line), deadline);
    if (core::errors::is_error(written)) {
        static_cast<void>(take(id));
        LOG_WARN("RequestCorrelator: failed to send " + describe(id, method) + ": " +
                 core::errors::get_error(written).message);
        return core::errors::get_error(written);
    }

    LOG_DEBUG("RequestCorrelator: sent " + describe(id, method));
    return call;
}

core::errors::Status RequestCorrelator::notify(const std::string& method,
                                               const json& params) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminated_) {
            return BridgeError{ErrorCategory::ProcessTerminated,
                               "Tool server is gone: " + termination_reason_,
                               "process_terminated"};
        }
    }
    auto line = protocol::to_line(protocol::make_notification(method, params));
    if (core::errors::is_error(line)) {
        return core::errors::get_error(line);
    }
    return writer_(core::errors::get_value(line),
                   std::chrono::steady_clock::now() + default_timeout_);
}

std::optional<RequestCorrelator::PendingRequest> RequestCorrelator::take(
    const std::int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    PendingRequest entry = std::move(it->second);
    pending_.erase(it);
    return entry;
}

void RequestCorrelator::on_message(const protocol::Message& message) {
    if (!message.is_response()) {
        LOG_DEBUG("RequestCorrelator: ignoring server message " +
                  message.method.value_or(""));
        return;
    }

    const std::int64_t id = message.id.value_or(0);
    auto entry = take(id);
    if (!entry.has_value()) {
        LOG_DEBUG("RequestCorrelator: no matching pending request for id " +
                  std::to_string(id) + ", dropping response");
        return;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - entry->issued_at)
                             .count();

    if (message.error.has_value()) {
        const auto& rpc_error = message.error.value();
        BridgeError error{ErrorCategory::Rpc, rpc_error.message, "rpc_error"};
        error.rpc_code = rpc_error.code;
        if (rpc_error.data.has_value()) {
            error.rpc_data = rpc_error.data->dump();
        }
        LOG_DEBUG("RequestCorrelator: " + describe(id, entry->method) +
                  " failed remotely with code " + std::to_string(rpc_error.code) +
                  " after " + std::to_string(elapsed) + " ms");
        entry->completion.set_value(std::move(error));
        return;
    }

    LOG_DEBUG("RequestCorrelator: " + describe(id, entry->method) + " completed after " +
              std::to_string(elapsed) + " ms");
    entry->completion.set_value(message.result.value_or(json()));
}

bool RequestCorrelator::on_timeout(const std::int64_t id) {
    auto entry = take(id);
    if (!entry.has_value()) {
        return false;
    }

    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                            entry->deadline - entry->issued_at)
                            .count();
    LOG_WARN("RequestCorrelator: " + describe(id, entry->method) + " timed out after " +
             std::to_string(waited) + " ms");
    entry->completion.set_value(BridgeError{
        ErrorCategory::RequestTimeout,
        "Request " + std::to_string(id) + " (" + entry->method + ") timed out after " +
            std::to_string(waited) + " ms",
        "request_timeout", "Retry with a fresh call."});
    return true;
}

bool RequestCorrelator::cancel(const std::int64_t id) {
    auto entry = take(id);
    if (!entry.has_value()) {
        return false;
    }
    timer_cv_.notify_all();

    LOG_INFO("RequestCorrelator: " + describe(id, entry->method) + " cancelled by caller");
    entry->completion.set_value(BridgeError{ErrorCategory::Cancelled,
                                            "Request " + std::to_string(id) +
                                                " was cancelled.",
                                            "cancelled"});
    return true;
}

void RequestCorrelator::on_process_terminated(const std::string& reason) {
    std::unordered_map<std::int64_t, PendingRequest> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!terminated_) {
            terminated_ = true;
            termination_reason_ = reason;
        }
        drained.swap(pending_);
    }
    timer_cv_.notify_all();

    if (!drained.empty()) {
        LOG_WARN("RequestCorrelator: failing " + std::to_string(drained.size()) +
                 " pending request(s): " + reason);
    }
    for (auto& [id, entry] : drained) {
        entry.completion.set_value(BridgeError{
            ErrorCategory::ProcessTerminated,
            "Tool server terminated before answering " + describe(id, entry.method) +
                ": " + reason,
            "process_terminated"});
    }
}

std::size_t RequestCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool RequestCorrelator::terminated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminated_;
}

void RequestCorrelator::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (pending_.empty()) {
            timer_cv_.wait(lock);
            continue;
        }

        auto earliest = std::chrono::steady_clock::time_point::max();
        for (const auto& [id, entry] : pending_) {
            if (entry.deadline < earliest) {
                earliest = entry.deadline;
            }
        }

        if (std::chrono::steady_clock::now() < earliest) {
            timer_cv_.wait_until(lock, earliest);
            continue;
        }

        const auto now = std::chrono::steady_clock::now();
        std::vector<std::int64_t> expired;
        for (const auto& [id, entry] : pending_) {
            if (entry.deadline <= now) {
                expired.push_back(id);
            }
        }

        lock.unlock();
        for (const auto id : expired) {
            static_cast<void>(on_timeout(id));
        }
        lock.lock();
    }
}

}  // namespace mcpbridge::rpc
