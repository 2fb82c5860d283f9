#include "triggerware/json_rpc.hpp"
#include "triggerware/version.hpp"

namespace triggerware {

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = r.method;
    j["params"] = r.params ? *r.params : nlohmann::json::object();
    j["id"] = id_j;
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.error) {
        j["error"] = *r.error;
    } else {
        // A success reply must carry "result" even when there is nothing to say.
        j["result"] = r.result ? *r.result : nlohmann::json(nullptr);
    }
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    j["params"] = n.params ? *n.params : nlohmann::json::object();
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace triggerware
