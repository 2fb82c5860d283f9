#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <string>
#include <mutex>
#include <variant>

namespace triggerware {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using ExecuteHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotifyHandler = std::function<void(const nlohmann::json& params)>;

/// The pair of callbacks registered under one inbound method name:
/// `execute` answers server-to-client calls, `notify` consumes notifications.
/// Either may be empty.
struct MethodHandler {
    ExecuteHandler execute;
    NotifyHandler notify;
};

/// Inbound method name -> handlers. Protocol objects add and remove their
/// per-instance names at runtime, so every operation takes the table's own
/// lock; handlers always run with the lock released.
class DispatchTable {
public:
    /// Register (or replace) the handlers for a method name.
    void add_method(const std::string& name, MethodHandler handler);

    /// Returns false if nothing was registered under that name.
    bool remove_method(const std::string& name);

    [[nodiscard]] bool has_method(const std::string& name) const;
    [[nodiscard]] size_t size() const;

    /// Dispatch an inbound call or notification.
    /// Calls always produce a response (MethodNotFound when unregistered or
    /// registered without an execute handler); notifications never do and
    /// unknown ones are ignored. Responses are not routed here.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, MethodHandler> methods_;
};

} // namespace triggerware
