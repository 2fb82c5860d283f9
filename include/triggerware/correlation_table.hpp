#pragma once
#include "json_rpc.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace triggerware {

struct PendingCall {
    std::string method;
    std::chrono::steady_clock::time_point created_at;
    std::promise<JsonRpcResponse> promise;
};

/// Outbound call id -> the caller waiting for its reply.
///
/// Each call gets its own promise, so a reply wakes exactly one waiter and
/// never contends with other pending calls beyond the short table lock.
class CorrelationTable {
public:
    /// Allocate the next id and register a waiter for it.
    /// Ids start at 0 and increase by one for the life of the table.
    /// Throws TwTransportError once the table is closed.
    [[nodiscard]] std::pair<int64_t, std::future<JsonRpcResponse>> open(const std::string& method);

    /// Deliver a reply. Returns false if no call is waiting on that id
    /// (never issued, already answered, or abandoned after a timeout).
    bool complete(int64_t id, JsonRpcResponse resp);

    /// Fail one pending call with the given exception.
    bool fail(int64_t id, std::exception_ptr ex);

    /// Drop a pending call without completing it; a late reply is then
    /// reported by complete() as unmatched.
    void abandon(int64_t id);

    /// Fail every pending call with TwTransportError(reason) and refuse new
    /// ones. Idempotent.
    void close(const std::string& reason);

    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] size_t pending_count() const;
    [[nodiscard]] bool has_pending(int64_t id) const;

private:
    mutable std::mutex mutex_;
    std::map<int64_t, PendingCall> pending_;
    int64_t next_id_{0};
    bool closed_{false};
};

} // namespace triggerware
