#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace triggerware {

class TriggerwareClient;

/// One result row: a JSON array laid out as the query's signature.
using Row = nlohmann::json;

/// Forward-only cursor over the rows of an executed query.
///
/// The first batch comes with the execution result. Further batches are
/// fetched on demand with next-resultset-batch, one blocking call at a time,
/// until the server reports the cursor exhausted. Not thread-safe.
class ResultSet {
public:
    /// `eq_result` is the reply of execute-query or create-resultset:
    /// {handle?, signature?, batch?: {tuples, exhausted}}.
    /// Unset limits fall back to the client's defaults.
    ResultSet(TriggerwareClient& client, const nlohmann::json& eq_result,
              std::optional<int64_t> row_limit = std::nullopt,
              std::optional<double> timeout = std::nullopt);

    /// The next row, or std::nullopt at the end of the sequence.
    [[nodiscard]] std::optional<Row> next();

    /// Up to n rows; fewer once the sequence ends.
    [[nodiscard]] std::vector<Row> pull(size_t n);

    /// True once the server has no more rows to send. Rows may still be
    /// cached locally.
    [[nodiscard]] bool exhausted() const { return exhausted_; }

    [[nodiscard]] const std::optional<int64_t>& handle() const { return handle_; }
    [[nodiscard]] const nlohmann::json& signature() const { return signature_; }
    [[nodiscard]] size_t cached_rows() const { return cache_.size() - cache_pos_; }
    [[nodiscard]] std::optional<int64_t> row_limit() const { return row_limit_; }
    [[nodiscard]] std::optional<double> timeout() const { return timeout_; }

private:
    TriggerwareClient* client_;
    std::optional<int64_t> handle_;
    std::optional<int64_t> row_limit_;
    std::optional<double> timeout_;
    nlohmann::json signature_ = nlohmann::json::array();
    std::vector<Row> cache_;
    size_t cache_pos_{0};
    bool exhausted_{false};
};

} // namespace triggerware
