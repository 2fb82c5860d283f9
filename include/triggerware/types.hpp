#pragma once
#include "version.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace triggerware {

// ---------- Queries ----------

/// Query text together with its language ("fol" or "sql") and namespace.
struct Query {
    std::string text;
    std::string language;
    std::string ns;

    bool operator==(const Query& o) const {
        return text == o.text && language == o.language && ns == o.ns;
    }
};

[[nodiscard]] Query fol_query(std::string text, std::string ns = std::string(DEFAULT_NAMESPACE));
[[nodiscard]] Query sql_query(std::string text, std::string ns = std::string(DEFAULT_NAMESPACE));

/// Resource limits for executing a query. `timeout` is in seconds and is
/// enforced by the server.
struct QueryRestriction {
    std::optional<int64_t> row_limit;
    std::optional<double> timeout;

    bool operator==(const QueryRestriction& o) const {
        return row_limit == o.row_limit && timeout == o.timeout;
    }
};

// ---------- Polled query configuration ----------

struct PolledQueryControlParameters {
    bool report_unchanged = false;
    std::string report_initial = "none";  // "none", "with delta", "without delta"
    bool delay = false;

    bool operator==(const PolledQueryControlParameters& o) const {
        return report_unchanged == o.report_unchanged
               && report_initial == o.report_initial && delay == o.delay;
    }
};

/// Cron-like schedule. Each field is "*" or a comma-separated list of
/// values and "lo-hi" ranges.
struct CalendarSchedule {
    std::string days = "*";
    std::string hours = "*";
    std::string minutes = "*";
    std::string months = "*";
    std::string timezone = "UTC";
    std::string weekdays = "*";

    /// Throws PolledQueryError on a malformed or out-of-range field.
    void validate() const;

    bool operator==(const CalendarSchedule& o) const {
        return days == o.days && hours == o.hours && minutes == o.minutes
               && months == o.months && timezone == o.timezone && weekdays == o.weekdays;
    }
};

/// A single trigger instant (integer time), a calendar schedule, or a list
/// mixing both.
struct PolledQuerySchedule {
    std::variant<int64_t, CalendarSchedule, std::vector<PolledQuerySchedule>> value;

    PolledQuerySchedule() : value(std::vector<PolledQuerySchedule>{}) {}
    PolledQuerySchedule(int64_t instant) : value(instant) {}
    PolledQuerySchedule(CalendarSchedule calendar) : value(std::move(calendar)) {}
    PolledQuerySchedule(std::vector<PolledQuerySchedule> list) : value(std::move(list)) {}

    /// Validates every calendar entry, recursively.
    void validate() const;

    bool operator==(const PolledQuerySchedule& o) const { return value == o.value; }
};

// ---------- Reflection ----------

struct RelDataElement {
    std::string name;
    std::vector<std::string> signature_names;
    std::vector<std::string> signature_types;
    std::string usage;
    nlohmann::json no_idea;
    std::string description;

    bool operator==(const RelDataElement& o) const {
        return name == o.name && signature_names == o.signature_names
               && signature_types == o.signature_types && usage == o.usage
               && no_idea == o.no_idea && description == o.description;
    }
};

struct RelDataGroup {
    std::string name;
    std::string symbol;
    std::vector<RelDataElement> elements;

    bool operator==(const RelDataGroup& o) const {
        return name == o.name && symbol == o.symbol && elements == o.elements;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const Query& q);
void from_json(const nlohmann::json& j, Query& q);

void to_json(nlohmann::json& j, const CalendarSchedule& s);
void from_json(const nlohmann::json& j, CalendarSchedule& s);

void to_json(nlohmann::json& j, const PolledQuerySchedule& s);

void to_json(nlohmann::json& j, const PolledQueryControlParameters& c);

/// Groups and elements arrive as positional arrays:
/// group = [name, symbol, element...], element = [name, names, types, usage, ?, description].
void from_json(const nlohmann::json& j, RelDataElement& e);
void from_json(const nlohmann::json& j, RelDataGroup& g);

} // namespace triggerware
