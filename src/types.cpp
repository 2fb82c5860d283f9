#include "triggerware/types.hpp"
#include "triggerware/error.hpp"
#include <cctype>
#include <regex>

namespace triggerware {

namespace {

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t next = s.find(sep, start);
        parts.push_back(s.substr(start, next - start));
        if (next == std::string::npos) break;
        start = next + 1;
    }
    return parts;
}

void validate_field(const char* unit, const std::string& value, int min, int max) {
    if (value == "*") return;

    for (const auto& item : split(value, ',')) {
        for (const auto& part : split(item, '-')) {
            bool digits = !part.empty() && part.size() <= 4;
            for (char c : part) {
                if (!std::isdigit(static_cast<unsigned char>(c))) digits = false;
            }
            if (!digits) {
                throw PolledQueryError(std::string("Invalid ") + unit + " value: " + part);
            }
            int parsed = std::stoi(part);
            if (parsed < min || parsed > max) {
                throw PolledQueryError(std::string(unit) + " value out of range: " + part);
            }
        }
    }
}

} // anonymous namespace

// ---------- Query ----------

Query fol_query(std::string text, std::string ns) {
    return Query{std::move(text), "fol", std::move(ns)};
}

Query sql_query(std::string text, std::string ns) {
    return Query{std::move(text), "sql", std::move(ns)};
}

void to_json(nlohmann::json& j, const Query& q) {
    j = {{"query", q.text}, {"language", q.language}, {"namespace", q.ns}};
}

void from_json(const nlohmann::json& j, Query& q) {
    q.text = j.at("query").get<std::string>();
    q.language = j.at("language").get<std::string>();
    q.ns = j.at("namespace").get<std::string>();
}

// ---------- CalendarSchedule ----------

void CalendarSchedule::validate() const {
    static const std::regex timezone_re(
        "^[A-Za-z]+(?:_[A-Za-z]+)*(?:/[A-Za-z]+(?:_[A-Za-z]+)*)*$");

    validate_field("day", days, 1, 31);
    validate_field("hour", hours, 0, 23);
    validate_field("minute", minutes, 0, 59);
    validate_field("month", months, 1, 12);
    validate_field("weekday", weekdays, 0, 6);
    if (!std::regex_match(timezone, timezone_re)) {
        throw PolledQueryError("Invalid timezone format");
    }
}

void to_json(nlohmann::json& j, const CalendarSchedule& s) {
    j = {
        {"days", s.days},
        {"hours", s.hours},
        {"minutes", s.minutes},
        {"months", s.months},
        {"timezone", s.timezone},
        {"weekdays", s.weekdays}
    };
}

void from_json(const nlohmann::json& j, CalendarSchedule& s) {
    s.days = j.value("days", "*");
    s.hours = j.value("hours", "*");
    s.minutes = j.value("minutes", "*");
    s.months = j.value("months", "*");
    s.timezone = j.value("timezone", "UTC");
    s.weekdays = j.value("weekdays", "*");
}

// ---------- PolledQuerySchedule ----------

void PolledQuerySchedule::validate() const {
    if (const auto* calendar = std::get_if<CalendarSchedule>(&value)) {
        calendar->validate();
    } else if (const auto* list = std::get_if<std::vector<PolledQuerySchedule>>(&value)) {
        for (const auto& entry : *list) entry.validate();
    }
}

void to_json(nlohmann::json& j, const PolledQuerySchedule& s) {
    if (const auto* instant = std::get_if<int64_t>(&s.value)) {
        j = *instant;
    } else if (const auto* calendar = std::get_if<CalendarSchedule>(&s.value)) {
        to_json(j, *calendar);
    } else {
        j = nlohmann::json::array();
        for (const auto& entry : std::get<std::vector<PolledQuerySchedule>>(s.value)) {
            nlohmann::json e;
            to_json(e, entry);
            j.push_back(std::move(e));
        }
    }
}

// ---------- PolledQueryControlParameters ----------

void to_json(nlohmann::json& j, const PolledQueryControlParameters& c) {
    j = {
        {"report-initial", c.report_initial},
        {"report-unchanged", c.report_unchanged},
        {"delay", c.delay}
    };
}

// ---------- RelData ----------

void from_json(const nlohmann::json& j, RelDataElement& e) {
    e.name = j.at(0).get<std::string>();
    e.signature_names = j.at(1).get<std::vector<std::string>>();
    e.signature_types = j.at(2).get<std::vector<std::string>>();
    e.usage = j.at(3).is_string() ? j.at(3).get<std::string>() : j.at(3).dump();
    e.no_idea = j.at(4);
    e.description = j.at(5).is_string() ? j.at(5).get<std::string>() : std::string{};
}

void from_json(const nlohmann::json& j, RelDataGroup& g) {
    g.name = j.at(0).get<std::string>();
    g.symbol = j.at(1).get<std::string>();
    g.elements.clear();
    for (size_t i = 2; i < j.size(); ++i) {
        g.elements.push_back(j.at(i).get<RelDataElement>());
    }
}

} // namespace triggerware
