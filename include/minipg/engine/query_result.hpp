#pragma once

#include "minipg/common/diagnostics.hpp"
#include "minipg/storage/value.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace minipg::engine {

struct QueryResult final {
    bool success = false;
    // "Query OK, 2 rows returned" or "Error: <message>".
    std::string status{};
    // Rows for SELECT, an empty sequence for INSERT, nothing for CREATE TABLE and errors.
    std::optional<std::vector<storage::Row>> rows{};
    std::error_code error{};
    std::vector<Diagnostic> diagnostics{};

    std::string command_text{};
    std::string command_category{};
    std::uint64_t correlation_id = 0U;
    std::uint64_t rows_touched = 0U;
    double duration_ms = 0.0;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

}  // namespace minipg::engine
