#pragma once
#include "types.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace triggerware {

class TriggerwareClient;

/// A poll that the server could not complete, most often because it came
/// due while the previous poll of the same query was still running.
struct PollError {
    std::string message;
    nlohmann::json details;
};

/// Rows added and rows deleted since the previous poll.
using DeltaHandler = std::function<void(const nlohmann::json& added, const nlohmann::json& deleted)>;
using PollErrorHandler = std::function<void(const PollError& error)>;

/// A query the server re-evaluates on a schedule, reporting each change of
/// its answer as a delta notification.
///
/// Handlers run on the connection's dispatch thread. A PollError is not
/// fatal: polling continues on schedule.
class PolledQuery {
public:
    /// Validates the configuration, registers the notification method and
    /// creates the polled query on the server.
    /// Throws PolledQueryError for an invalid schedule or control value, or
    /// when the server rejects the query.
    PolledQuery(TriggerwareClient& client, Query query, DeltaHandler on_delta,
                std::optional<QueryRestriction> restriction = std::nullopt,
                std::optional<PolledQueryControlParameters> controls = std::nullopt,
                std::optional<PolledQuerySchedule> schedule = std::nullopt,
                PollErrorHandler on_error = nullptr);

    /// Stops local delivery. Nothing is sent to the server.
    ~PolledQuery();

    PolledQuery(const PolledQuery&) = delete;
    PolledQuery& operator=(const PolledQuery&) = delete;

    /// Ask for an evaluation now, outside the schedule. The result arrives
    /// as a delta (or error) notification.
    void poll_now();

    [[nodiscard]] int64_t handle() const { return handle_; }
    [[nodiscard]] const std::string& method_name() const { return method_name_; }
    [[nodiscard]] const nlohmann::json& signature() const { return signature_; }
    [[nodiscard]] const nlohmann::json& parameters() const { return parameters_; }

private:
    TriggerwareClient* client_;
    Query query_;
    std::optional<QueryRestriction> restriction_;
    std::string method_name_;
    nlohmann::json parameters_;
    int64_t handle_{0};
    nlohmann::json signature_ = nlohmann::json::array();
};

} // namespace triggerware
