#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace triggerware {

class Codec {
public:
    /// Decode exactly one JSON text.
    /// Throws TwParseError if the bytes are not valid JSON.
    [[nodiscard]] static nlohmann::json decode(std::string_view raw);

    /// Classify a decoded value by the presence of "id" and "method".
    /// Throws TwProtocolError (InvalidRequest) when the value is not a
    /// JSON-RPC 2.0 envelope: not an object, wrong or missing "jsonrpc",
    /// or neither "id" nor "method".
    [[nodiscard]] static JsonRpcMessage to_message(const nlohmann::json& j);

    /// decode() followed by to_message().
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to its compact JSON text (no trailing separator).
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);
};

} // namespace triggerware
