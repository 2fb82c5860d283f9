#pragma once
#include "types.hpp"
#include "result_set.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace triggerware {

class TriggerwareClient;

/// {query, language, namespace, limit?, timelimit?}: the parameters every
/// query-bearing request starts from.
[[nodiscard]] nlohmann::json query_parameters(const Query& query,
                                              const std::optional<QueryRestriction>& restriction);

/// A query kept on the client and executed any number of times. Views have
/// no server-side handle.
class View {
public:
    /// Validates the query with the server; throws InvalidQueryError.
    View(TriggerwareClient& client, Query query,
         std::optional<QueryRestriction> restriction = std::nullopt);

    /// Run the query. A restriction given here overrides the view's own.
    /// Throws InvalidQueryError if the server rejects it.
    [[nodiscard]] ResultSet execute(const std::optional<QueryRestriction>& restriction = std::nullopt);

    [[nodiscard]] const Query& query() const { return query_; }
    [[nodiscard]] const nlohmann::json& base_parameters() const { return base_parameters_; }

private:
    TriggerwareClient* client_;
    Query query_;
    std::optional<QueryRestriction> restriction_;
    nlohmann::json base_parameters_;
};

/// A query registered with the server once and executed with different
/// input values. Inputs are addressed by name or by position depending on
/// how the query was written.
class PreparedQuery {
public:
    /// Registers the query with prepare-query; throws InvalidQueryError.
    PreparedQuery(TriggerwareClient& client, Query query,
                  std::optional<QueryRestriction> restriction = std::nullopt);

    /// Bind an input. Throws PreparedQueryError for a name/position that does
    /// not exist or addressing style the query does not use, and, for SQL
    /// queries, a value whose JSON type does not match the declared type.
    void set_parameter(size_t position, nlohmann::json value);
    void set_parameter(const std::string& name, nlohmann::json value);

    [[nodiscard]] const nlohmann::json& get_parameter(size_t position) const;
    [[nodiscard]] const nlohmann::json& get_parameter(const std::string& name) const;

    /// Register the same query again and copy the bound inputs.
    [[nodiscard]] PreparedQuery clone() const;

    /// create-resultset with the bound inputs.
    [[nodiscard]] ResultSet execute(const std::optional<QueryRestriction>& restriction = std::nullopt);

    [[nodiscard]] int64_t handle() const { return handle_; }
    [[nodiscard]] bool uses_named_parameters() const { return uses_named_params_; }
    [[nodiscard]] const std::vector<std::string>& input_names() const { return input_names_; }
    [[nodiscard]] const std::vector<std::string>& input_types() const { return input_types_; }
    [[nodiscard]] const std::vector<nlohmann::json>& parameters() const { return params_; }
    [[nodiscard]] const Query& query() const { return query_; }

    /// Whether `value` is acceptable for a SQL input of `type`.
    [[nodiscard]] static bool matches_type(const std::string& type, const nlohmann::json& value);

private:
    size_t index_of(size_t position) const;
    size_t index_of(const std::string& name) const;
    void assign(size_t index, nlohmann::json value);

    TriggerwareClient* client_;
    Query query_;
    std::optional<QueryRestriction> restriction_;
    int64_t handle_{0};
    bool uses_named_params_{false};
    std::vector<std::string> input_names_;
    std::vector<std::string> input_types_;
    std::vector<nlohmann::json> params_;
};

} // namespace triggerware
