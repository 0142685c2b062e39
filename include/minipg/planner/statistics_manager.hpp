#pragma once

#include "minipg/common/diagnostics.hpp"
#include "minipg/storage/json_codec.hpp"
#include "minipg/storage/value.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace minipg::catalog {
class CatalogStore;
}

namespace minipg::storage {
class TableStore;
}

namespace minipg::planner {

struct ColumnStatistics final {
    std::string column_name{};
    storage::Value min{};
    storage::Value max{};
    std::uint64_t count = 0U;
    // Histogram keyed by the value's text, in first-seen order.
    std::vector<std::pair<std::string, std::uint64_t>> value_frequencies{};

    [[nodiscard]] std::uint64_t frequency(const std::string& key) const noexcept;
};

class TableStatistics final {
public:
    void set_row_count(std::uint64_t value) noexcept;
    [[nodiscard]] std::uint64_t row_count() const noexcept;

    void upsert_column(ColumnStatistics column);
    [[nodiscard]] const ColumnStatistics* find_column(const std::string& name) const noexcept;
    [[nodiscard]] const std::vector<ColumnStatistics>& columns() const noexcept;

private:
    std::uint64_t row_count_ = 0U;
    std::vector<ColumnStatistics> columns_{};
};

[[nodiscard]] storage::Json statistics_to_json(const TableStatistics& statistics);
[[nodiscard]] TableStatistics statistics_from_json(const storage::Json& document);

// Histogram key for a value: strings as-is, everything else as compact JSON.
[[nodiscard]] std::string frequency_key(const storage::Value& value);

struct TableStatsOutcome final {
    std::string table{};
    std::error_code status{};
    std::string message{};

    [[nodiscard]] bool success() const noexcept { return !status; }
};

struct StatsRefreshReport final {
    std::vector<TableStatsOutcome> outcomes{};

    [[nodiscard]] std::size_t failure_count() const noexcept;
};

class StatisticsManager final {
public:
    struct Config final {
        const catalog::CatalogStore* catalog = nullptr;
        storage::TableStore* tables = nullptr;
        std::filesystem::path stats_root{};
        std::size_t max_workers = 4U;
        DiagnosticSink diagnostics{};
    };

    explicit StatisticsManager(Config config);

    // Full scan of the table; rewrites its statistics document.
    void update_table_stats(const std::string& table) const;

    // Throws StatsNotFound when no document has been written for the table.
    [[nodiscard]] TableStatistics get_table_stats(const std::string& table) const;

    // One task per catalog table; individual failures are reported, never propagated.
    [[nodiscard]] StatsRefreshReport update_all_table_stats() const;

    [[nodiscard]] std::filesystem::path stats_path(const std::string& table) const;

private:
    [[nodiscard]] TableStatistics compute(const std::string& table) const;

    Config config_{};
};

}  // namespace minipg::planner
