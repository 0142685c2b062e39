#include "minipg/common/errors.hpp"
#include "minipg/tools/shell_log_formatter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

using minipg::engine::QueryResult;
using minipg::storage::Row;
using minipg::storage::Value;

TEST_CASE("Query log entries carry the result summary", "[shell][log]")
{
    QueryResult result{};
    result.success = true;
    result.status = "Query OK, 1 rows returned";
    result.command_text = "SELECT * FROM users LIMIT 1";
    result.command_category = "SELECT";
    result.correlation_id = 7U;
    result.rows_touched = 1U;
    result.duration_ms = 1.5;
    result.rows = std::vector<Row>{Row{{"id", Value{1}}}};
    result.started_at = std::chrono::system_clock::time_point{std::chrono::seconds{86400} + std::chrono::microseconds{42}};
    result.diagnostics.push_back(
        minipg::Diagnostic{minipg::Severity::Warning, "planner", "join without ON", "SELECT * FROM a JOIN b"});

    const auto json = nlohmann::json::parse(minipg::tools::format_query_log_json(result));
    CHECK(json["correlation_id"] == 7);
    CHECK(json["category"] == "SELECT");
    CHECK(json["sql"] == "SELECT * FROM users LIMIT 1");
    CHECK(json["status"] == "Query OK, 1 rows returned");
    CHECK(json["success"] == true);
    CHECK_FALSE(json.contains("error_code"));
    CHECK(json["duration_ms"] == 1.5);
    CHECK(json["rows_touched"] == 1);
    CHECK(json["row_count"] == 1);
    CHECK(json["started_at"] == "1970-01-02T00:00:00.000042Z");
    CHECK(json["finished_at"].is_null());

    REQUIRE(json["diagnostics"].size() == 1U);
    const auto& diagnostic = json["diagnostics"][0];
    CHECK(diagnostic["severity"] == "warning");
    CHECK(diagnostic["component"] == "planner");
    CHECK(diagnostic["message"] == "join without ON");
    CHECK(diagnostic["statement"] == "SELECT * FROM a JOIN b");
}

TEST_CASE("Failed queries log their error code", "[shell][log]")
{
    QueryResult result{};
    result.status = "Error: Table 'x' not found in catalog";
    result.error = minipg::EngineErrc::TableNotFound;

    const auto json = nlohmann::json::parse(minipg::tools::format_query_log_json(result));
    CHECK(json["success"] == false);
    CHECK(json["error_code"] == static_cast<int>(minipg::EngineErrc::TableNotFound));
    CHECK(json["error_category"] == "minipg.engine");
    CHECK(json["row_count"].is_null());
    CHECK(json["diagnostics"].empty());
}

TEST_CASE("Rows print as compact JSON in column order", "[shell][log]")
{
    const Row row{{"name", Value{"Ann"}}, {"id", Value{3}}, {"score", Value{}}};
    CHECK(minipg::tools::format_row_json(row) == R"({"name":"Ann","id":3,"score":null})");
}

TEST_CASE("Refresh reports list each table then a summary", "[shell][log]")
{
    minipg::planner::StatsRefreshReport report{};
    report.outcomes.push_back(minipg::planner::TableStatsOutcome{"users", {}, {}});
    report.outcomes.push_back(minipg::planner::TableStatsOutcome{
        "orders", make_error_code(minipg::EngineErrc::PerTableStatsFailure), "table file missing"});

    CHECK(minipg::tools::format_refresh_report(report)
          == "  ok    users\n  error orders: table file missing\n2 tables analyzed, 1 failed");
}

TEST_CASE("Statistics print as an indented document", "[shell][log]")
{
    minipg::planner::TableStatistics statistics;
    statistics.set_row_count(0U);
    CHECK(minipg::tools::format_statistics_json(statistics) == "{\n  \"row_count\": 0,\n  \"column_stats\": {}\n}");
}
