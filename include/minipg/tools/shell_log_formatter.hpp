#pragma once

#include "minipg/engine/query_result.hpp"
#include "minipg/planner/statistics_manager.hpp"

#include <string>

namespace minipg::tools {

// One compact JSON object per query, suitable for JSON Lines logs.
[[nodiscard]] std::string format_query_log_json(const engine::QueryResult& result);

// Compact JSON for a result row, keys in row order.
[[nodiscard]] std::string format_row_json(const storage::Row& row);

[[nodiscard]] std::string format_statistics_json(const planner::TableStatistics& statistics);

[[nodiscard]] std::string format_refresh_report(const planner::StatsRefreshReport& report);

}  // namespace minipg::tools
