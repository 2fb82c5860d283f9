#include "triggerware/queries.hpp"
#include "triggerware/client.hpp"
#include "triggerware/error.hpp"
#include "triggerware/log.hpp"
#include <algorithm>

namespace triggerware {

nlohmann::json query_parameters(const Query& query,
                                const std::optional<QueryRestriction>& restriction) {
    nlohmann::json params = query;
    if (restriction) {
        if (restriction->row_limit) params["limit"] = *restriction->row_limit;
        if (restriction->timeout) params["timelimit"] = *restriction->timeout;
    }
    return params;
}

// ---------- View ----------

View::View(TriggerwareClient& client, Query query, std::optional<QueryRestriction> restriction)
    : client_(&client),
      query_(std::move(query)),
      restriction_(std::move(restriction)),
      base_parameters_(query_parameters(query_, restriction_)) {
    client_->validate_query(query_);
}

ResultSet View::execute(const std::optional<QueryRestriction>& restriction) {
    nlohmann::json params = base_parameters_;
    if (restriction) {
        if (restriction->row_limit) params["limit"] = *restriction->row_limit;
        if (restriction->timeout) params["timelimit"] = *restriction->timeout;
    }
    const auto& limits = restriction ? restriction : restriction_;

    nlohmann::json eq_result;
    try {
        eq_result = client_->connection().call("execute-query", params);
    } catch (const TwProtocolError& e) {
        rethrow_as<InvalidQueryError>(e);
    }
    if (!limits) return ResultSet(*client_, eq_result);
    return ResultSet(*client_, eq_result, limits->row_limit, limits->timeout);
}

// ---------- PreparedQuery ----------

PreparedQuery::PreparedQuery(TriggerwareClient& client, Query query,
                             std::optional<QueryRestriction> restriction)
    : client_(&client), query_(std::move(query)), restriction_(std::move(restriction)) {
    nlohmann::json registration;
    try {
        registration = client_->connection().call("prepare-query",
                                                  query_parameters(query_, restriction_));
    } catch (const TwProtocolError& e) {
        rethrow_as<InvalidQueryError>(e);
    }

    try {
        handle_ = registration.at("handle").get<int64_t>();
        uses_named_params_ = registration.value("usesNamedParameters", false);
        for (const auto& input : registration.at("inputSignature")) {
            input_names_.push_back(input.at("attribute").get<std::string>());
            input_types_.push_back(input.at("type").get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw TwTransportError(std::string("Malformed prepare-query reply: ") + e.what());
    }
    params_.assign(input_names_.size(), nlohmann::json(nullptr));
    client_->register_handle(handle_);
}

bool PreparedQuery::matches_type(const std::string& type, const nlohmann::json& value) {
    if (type == "double") return value.is_number_float();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "stringcase" || type == "stringnocase" || type == "stringagnostic"
        || type == "date" || type == "time" || type == "timestamp" || type == "interval") {
        return value.is_string();
    }
    return false;
}

size_t PreparedQuery::index_of(size_t position) const {
    if (uses_named_params_) {
        throw PreparedQueryError("This query uses named parameters.");
    }
    if (position >= input_names_.size()) {
        throw PreparedQueryError("Invalid parameter name or position.");
    }
    return position;
}

size_t PreparedQuery::index_of(const std::string& name) const {
    if (!uses_named_params_) {
        throw PreparedQueryError("This query uses positional parameters.");
    }
    auto it = std::find(input_names_.begin(), input_names_.end(), name);
    if (it == input_names_.end()) {
        throw PreparedQueryError("Invalid parameter name or position.");
    }
    return static_cast<size_t>(it - input_names_.begin());
}

void PreparedQuery::assign(size_t index, nlohmann::json value) {
    const std::string& expected = input_types_[index];
    if (query_.language == "sql" && !matches_type(expected, value)) {
        throw PreparedQueryError("Expected type " + expected + ", got " + value.type_name());
    }
    params_[index] = std::move(value);
}

void PreparedQuery::set_parameter(size_t position, nlohmann::json value) {
    assign(index_of(position), std::move(value));
}

void PreparedQuery::set_parameter(const std::string& name, nlohmann::json value) {
    assign(index_of(name), std::move(value));
}

const nlohmann::json& PreparedQuery::get_parameter(size_t position) const {
    return params_[index_of(position)];
}

const nlohmann::json& PreparedQuery::get_parameter(const std::string& name) const {
    return params_[index_of(name)];
}

PreparedQuery PreparedQuery::clone() const {
    PreparedQuery copy(*client_, query_, restriction_);
    if (copy.params_.size() != params_.size()) {
        throw PreparedQueryError("Server changed the input signature of the cloned query.");
    }
    copy.params_ = params_;
    return copy;
}

ResultSet PreparedQuery::execute(const std::optional<QueryRestriction>& restriction) {
    nlohmann::json params = {{"handle", handle_}, {"inputs", params_}};
    const auto& limits = restriction ? restriction : restriction_;
    if (limits) {
        if (limits->row_limit) params["limit"] = *limits->row_limit;
        if (limits->timeout) params["timelimit"] = *limits->timeout;
    }

    nlohmann::json eq_result;
    try {
        eq_result = client_->connection().call("create-resultset", params);
    } catch (const TwProtocolError& e) {
        rethrow_as<PreparedQueryError>(e, "create-resultset failed");
    }
    if (!limits) return ResultSet(*client_, eq_result);
    return ResultSet(*client_, eq_result, limits->row_limit, limits->timeout);
}

} // namespace triggerware
