#include "triggerware/correlation_table.hpp"
#include "triggerware/error.hpp"
#include "triggerware/log.hpp"

namespace triggerware {

std::pair<int64_t, std::future<JsonRpcResponse>>
CorrelationTable::open(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw TwTransportError("Connection closed");
    }
    int64_t id = next_id_++;
    PendingCall call;
    call.method = method;
    call.created_at = std::chrono::steady_clock::now();
    auto fut = call.promise.get_future();
    pending_.emplace(id, std::move(call));
    return {id, std::move(fut)};
}

bool CorrelationTable::complete(int64_t id, JsonRpcResponse resp) {
    std::promise<JsonRpcResponse> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return false;
        promise = std::move(it->second.promise);
        pending_.erase(it);
    }
    promise.set_value(std::move(resp));
    return true;
}

bool CorrelationTable::fail(int64_t id, std::exception_ptr ex) {
    std::promise<JsonRpcResponse> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return false;
        promise = std::move(it->second.promise);
        pending_.erase(it);
    }
    promise.set_exception(std::move(ex));
    return true;
}

void CorrelationTable::abandon(int64_t id) {
    PendingCall call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return;
        call = std::move(it->second);
        pending_.erase(it);
    }
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - call.created_at);
    log::logger()->debug("abandoned call {} to '{}' after {}ms; a late reply will be dropped",
                         id, call.method, waited.count());
}

void CorrelationTable::close(const std::string& reason) {
    std::map<int64_t, PendingCall> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        orphaned.swap(pending_);
    }
    auto ex = std::make_exception_ptr(TwTransportError(reason));
    for (auto& entry : orphaned) {
        log::logger()->debug("failing call {} to '{}': {}", entry.first, entry.second.method, reason);
        entry.second.promise.set_exception(ex);
    }
}

bool CorrelationTable::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t CorrelationTable::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool CorrelationTable::has_pending(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) > 0;
}

} // namespace triggerware
