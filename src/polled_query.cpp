#include "triggerware/polled_query.hpp"
#include "triggerware/client.hpp"
#include "triggerware/queries.hpp"
#include "triggerware/error.hpp"
#include "triggerware/log.hpp"

namespace triggerware {

namespace {

void check_controls(const PolledQueryControlParameters& controls) {
    const auto& initial = controls.report_initial;
    if (initial != "none" && initial != "with delta" && initial != "without delta") {
        throw PolledQueryError("Invalid report-initial value: " + initial);
    }
}

PollError to_poll_error(const nlohmann::json& error) {
    PollError e;
    e.details = error;
    if (error.is_string()) {
        e.message = error.get<std::string>();
    } else if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        e.message = error["message"].get<std::string>();
    } else {
        e.message = error.dump();
    }
    return e;
}

} // anonymous namespace

PolledQuery::PolledQuery(TriggerwareClient& client, Query query, DeltaHandler on_delta,
                         std::optional<QueryRestriction> restriction,
                         std::optional<PolledQueryControlParameters> controls,
                         std::optional<PolledQuerySchedule> schedule,
                         PollErrorHandler on_error)
    : client_(&client), query_(std::move(query)), restriction_(std::move(restriction)) {
    if (controls) check_controls(*controls);
    if (schedule) schedule->validate();

    Connection& conn = client_->connection();
    method_name_ = conn.allocate_name("poll");

    parameters_ = query_parameters(query_, restriction_);
    parameters_["method"] = method_name_;
    if (schedule) parameters_["schedule"] = *schedule;
    if (controls) parameters_.update(nlohmann::json(*controls));

    const std::string name = method_name_;
    MethodHandler handler;
    handler.execute = [](const nlohmann::json&) -> HandlerResult { return nlohmann::json::object(); };
    handler.notify = [name, on_delta, on_error](const nlohmann::json& params) {
        if (params.contains("delta")) {
            const auto& delta = params["delta"];
            nlohmann::json added = delta.value("added", nlohmann::json::array());
            nlohmann::json deleted = delta.value("deleted", nlohmann::json::array());
            if (on_delta) on_delta(added, deleted);
        } else if (params.contains("error")) {
            PollError error = to_poll_error(params["error"]);
            log::logger()->warn("Polled query {} skipped a poll: {}", name, error.message);
            if (on_error) on_error(error);
        } else {
            log::logger()->debug("Polled query {} ignored notification {}", name, params.dump());
        }
    };
    // Registered before creation: the server may report the initial state
    // before its reply to create-polled-query arrives.
    conn.add_method(method_name_, std::move(handler));

    nlohmann::json registration;
    try {
        registration = conn.call("create-polled-query", parameters_);
    } catch (const TwProtocolError& e) {
        conn.remove_method(method_name_);
        rethrow_as<PolledQueryError>(e, "create-polled-query failed");
    } catch (...) {
        conn.remove_method(method_name_);
        throw;
    }

    if (!registration.is_object() || !registration.contains("handle")
        || !registration["handle"].is_number_integer()) {
        conn.remove_method(method_name_);
        throw TwTransportError("Server sent no handle for polled query " + method_name_);
    }
    handle_ = registration["handle"].get<int64_t>();
    if (registration.contains("signature")) signature_ = registration["signature"];
    client_->register_handle(handle_);
    log::logger()->debug("Polled query {} created with handle {}", method_name_, handle_);
}

PolledQuery::~PolledQuery() {
    client_->connection().remove_method(method_name_);
}

void PolledQuery::poll_now() {
    nlohmann::json params = {{"handle", handle_}};
    if (restriction_ && restriction_->timeout) params["timelimit"] = *restriction_->timeout;
    try {
        (void)client_->connection().call("poll-now", params);
    } catch (const TwProtocolError& e) {
        rethrow_as<PolledQueryError>(e, "poll-now failed");
    }
}

} // namespace triggerware
