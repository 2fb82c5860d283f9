#include "triggerware/result_set.hpp"
#include "triggerware/client.hpp"
#include "triggerware/error.hpp"
#include <algorithm>
#include <string>

namespace triggerware {

namespace {

nlohmann::json optional_json(const std::optional<int64_t>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

nlohmann::json optional_json(const std::optional<double>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

} // anonymous namespace

ResultSet::ResultSet(TriggerwareClient& client, const nlohmann::json& eq_result,
                     std::optional<int64_t> row_limit, std::optional<double> timeout)
    : client_(&client),
      row_limit_(row_limit ? row_limit : client.options().default_fetch_size),
      timeout_(timeout ? timeout : client.options().default_timeout) {
    if (!eq_result.is_object()) {
        throw TwTransportError("Execution result is not an object");
    }
    auto handle = eq_result.find("handle");
    if (handle != eq_result.end() && handle->is_number_integer()) {
        handle_ = handle->get<int64_t>();
    }
    if (eq_result.contains("signature")) {
        signature_ = eq_result.at("signature");
    }
    // Without a handle there is nothing to fetch beyond the first batch.
    exhausted_ = !handle_;
    auto batch = eq_result.find("batch");
    if (batch != eq_result.end() && batch->is_object()) {
        try {
            if (batch->contains("tuples")) cache_ = batch->at("tuples").get<std::vector<Row>>();
            if (batch->value("exhausted", false)) exhausted_ = true;
        } catch (const nlohmann::json::exception& e) {
            throw TwTransportError(std::string("Malformed result batch: ") + e.what());
        }
    }
}

std::optional<Row> ResultSet::next() {
    if (cache_pos_ >= cache_.size()) {
        if (exhausted_) return std::nullopt;

        nlohmann::json result = client_->connection().call(
            "next-resultset-batch",
            nlohmann::json::array({*handle_, optional_json(row_limit_), optional_json(timeout_)}));

        try {
            const auto& batch = result.at("batch");
            cache_ = batch.at("tuples").get<std::vector<Row>>();
            cache_pos_ = 0;
            if (batch.value("exhausted", false)) exhausted_ = true;
        } catch (const nlohmann::json::exception& e) {
            throw TwTransportError(std::string("Malformed result batch: ") + e.what());
        }

        if (cache_.empty()) return std::nullopt;
    }
    return std::move(cache_[cache_pos_++]);
}

std::vector<Row> ResultSet::pull(size_t n) {
    std::vector<Row> rows;
    rows.reserve(std::min(n, cached_rows()));
    for (size_t i = 0; i < n; ++i) {
        auto row = next();
        if (!row) break;
        rows.push_back(std::move(*row));
    }
    return rows;
}

} // namespace triggerware
