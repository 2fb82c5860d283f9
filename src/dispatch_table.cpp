#include "triggerware/dispatch_table.hpp"
#include "triggerware/error.hpp"
#include "triggerware/log.hpp"

namespace triggerware {

void DispatchTable::add_method(const std::string& name, MethodHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    methods_[name] = std::move(handler);
}

bool DispatchTable::remove_method(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return methods_.erase(name) > 0;
}

bool DispatchTable::has_method(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return methods_.count(name) > 0;
}

size_t DispatchTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return methods_.size();
}

std::optional<JsonRpcMessage> DispatchTable::dispatch(const JsonRpcMessage& msg) const {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        ExecuteHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = methods_.find(req->method);
            if (it != methods_.end()) handler = it->second.execute;
        }

        JsonRpcResponse resp;
        resp.id = req->id;
        if (!handler) {
            resp.error = JsonRpcError{
                error::MethodNotFound,
                "Method '" + req->method + "' not found",
                std::nullopt
            };
            return resp;
        }

        nlohmann::json params = req->params ? *req->params : nlohmann::json::object();
        try {
            auto result = handler(params);
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                resp.result = std::move(*ok);
            } else if (auto* err = std::get_if<JsonRpcError>(&result)) {
                resp.error = std::move(*err);
            }
        } catch (const TwProtocolError& e) {
            resp.error = JsonRpcError{e.code, e.what(), std::nullopt};
        } catch (const std::exception& e) {
            log::logger()->error("handler for '{}' threw: {}", req->method, e.what());
            resp.error = JsonRpcError{error::InternalError, e.what(), std::nullopt};
        }
        return resp;
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        NotifyHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = methods_.find(notif->method);
            if (it != methods_.end()) handler = it->second.notify;
        }
        if (!handler) {
            log::logger()->debug("ignoring notification for unregistered method '{}'",
                                 notif->method);
            return std::nullopt;
        }

        nlohmann::json params = notif->params ? *notif->params : nlohmann::json::object();
        try {
            handler(params);
        } catch (const std::exception& e) {
            log::logger()->error("notification handler for '{}' threw: {}",
                                 notif->method, e.what());
        }
        return std::nullopt;
    }

    return std::nullopt;
}

} // namespace triggerware
