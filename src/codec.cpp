#include "triggerware/codec.hpp"
#include "triggerware/error.hpp"
#include "triggerware/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace triggerware {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Row tuples mix integers and reals; keep integers exact.
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

// get_value() refuses scalar documents; read them straight off the document.
nlohmann::json scalar_document_to_nlohmann(simdjson::ondemand::document& doc,
                                           simdjson::ondemand::json_type type) {
    switch (type) {
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            int64_t i = 0;
            if (doc.get_int64().get(i) == simdjson::SUCCESS) return nlohmann::json(i);
            uint64_t u = 0;
            if (doc.get_uint64().get(u) == simdjson::SUCCESS) return nlohmann::json(u);
            return nlohmann::json(double(doc.get_double()));
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(bool(doc.get_bool()));
        case simdjson::ondemand::json_type::null:
            if (!doc.is_null()) throw TwParseError("JSON parse error: invalid literal");
            return nlohmann::json(nullptr);
        default:
            throw TwParseError("JSON parse error: unexpected value");
    }
}

} // anonymous namespace

nlohmann::json Codec::decode(std::string_view raw) {
    if (raw.empty()) {
        throw TwParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw TwParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    try {
        simdjson::ondemand::json_type type;
        if (auto type_error = doc.type().get(type)) {
            throw TwParseError(std::string("JSON parse error: ") +
                               simdjson::error_message(type_error));
        }
        if (type != simdjson::ondemand::json_type::object
            && type != simdjson::ondemand::json_type::array) {
            return scalar_document_to_nlohmann(doc, type);
        }

        auto val = doc.get_value();
        if (val.error()) {
            throw TwParseError(std::string("JSON parse error: ") +
                               simdjson::error_message(val.error()));
        }
        nlohmann::json j = simdjson_to_nlohmann(val.value());
        if (!doc.at_end()) {
            throw TwParseError("Trailing content after JSON value");
        }
        return j;
    } catch (const TwParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw TwParseError(std::string("JSON conversion error: ") + e.what());
    }
}

JsonRpcMessage Codec::to_message(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw TwProtocolError(error::InvalidRequest, "Message must be a JSON object");
    }
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw TwProtocolError(error::InvalidRequest, "Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw TwProtocolError(error::InvalidRequest,
                              "Invalid jsonrpc version, expected '2.0'");
    }

    bool has_id = j.contains("id") && !j.at("id").is_null();
    bool has_method = j.contains("method");

    try {
        if (has_method && has_id) {
            JsonRpcRequest req;
            from_json(j.at("id"), req.id);
            req.method = j.at("method").get<std::string>();
            if (j.contains("params")) req.params = j.at("params");
            return req;
        }
        if (has_method) {
            JsonRpcNotification notif;
            notif.method = j.at("method").get<std::string>();
            if (j.contains("params")) notif.params = j.at("params");
            return notif;
        }
        if (has_id) {
            // Whether result/error is present is checked by the caller that
            // owns the id, so it can fail that call rather than drop it.
            JsonRpcResponse resp;
            from_json(j.at("id"), resp.id);
            if (j.contains("result")) resp.result = j.at("result");
            if (j.contains("error")) resp.error = j.at("error").get<JsonRpcError>();
            return resp;
        }
    } catch (const nlohmann::json::exception& e) {
        throw TwProtocolError(error::InvalidRequest,
                              std::string("Malformed envelope: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw TwProtocolError(error::InvalidRequest,
                              std::string("Malformed envelope: ") + e.what());
    }
    throw TwProtocolError(error::InvalidRequest,
                          "Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    return to_message(decode(raw));
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace triggerware
