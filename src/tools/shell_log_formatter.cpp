#include "minipg/tools/shell_log_formatter.hpp"

#include "minipg/storage/json_codec.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace minipg::tools {

namespace {

using storage::Json;

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

[[nodiscard]] Json timestamp_json(std::chrono::system_clock::time_point tp)
{
    auto text = format_timestamp_iso(tp);
    if (text.empty()) {
        return Json(nullptr);
    }
    return Json(std::move(text));
}

}  // namespace

std::string format_query_log_json(const engine::QueryResult& result)
{
    auto diagnostics = Json::array();
    for (const auto& diagnostic : result.diagnostics) {
        auto entry = Json::object();
        entry["severity"] = std::string{severity_to_string(diagnostic.severity)};
        entry["component"] = diagnostic.component;
        entry["message"] = diagnostic.message;
        if (!diagnostic.statement.empty()) {
            entry["statement"] = diagnostic.statement;
        }
        diagnostics.push_back(std::move(entry));
    }

    auto json = Json::object();
    json["correlation_id"] = result.correlation_id;
    json["category"] = result.command_category;
    json["sql"] = result.command_text;
    json["status"] = result.status;
    json["success"] = result.success;
    if (result.error) {
        json["error_code"] = result.error.value();
        json["error_category"] = result.error.category().name();
    }
    json["duration_ms"] = result.duration_ms;
    json["rows_touched"] = result.rows_touched;
    json["row_count"] = result.rows ? Json(result.rows->size()) : Json(nullptr);
    json["started_at"] = timestamp_json(result.started_at);
    json["finished_at"] = timestamp_json(result.finished_at);
    json["diagnostics"] = std::move(diagnostics);
    return json.dump();
}

std::string format_row_json(const storage::Row& row)
{
    return storage::row_to_json(row).dump();
}

std::string format_statistics_json(const planner::TableStatistics& statistics)
{
    return planner::statistics_to_json(statistics).dump(2);
}

std::string format_refresh_report(const planner::StatsRefreshReport& report)
{
    std::ostringstream stream;
    for (const auto& outcome : report.outcomes) {
        stream << (outcome.success() ? "  ok    " : "  error ") << outcome.table;
        if (!outcome.success()) {
            stream << ": " << outcome.message;
        }
        stream << '\n';
    }
    stream << report.outcomes.size() << " tables analyzed, " << report.failure_count() << " failed";
    return stream.str();
}

}  // namespace minipg::tools
