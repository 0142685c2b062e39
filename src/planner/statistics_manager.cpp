#include "minipg/planner/statistics_manager.hpp"

#include "minipg/catalog/catalog_store.hpp"
#include "minipg/common/errors.hpp"
#include "minipg/storage/table_store.hpp"
#include "minipg/storage/worker_pool.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

namespace minipg::planner {

namespace {

using storage::Json;
using storage::Value;

constexpr const char* kComponent = "statistics";
constexpr const char* kStatsExtension = ".json";

void accumulate(ColumnStatistics& column, const Value& value)
{
    if (value.is_null()) {
        return;
    }
    if (column.min.is_null() || storage::compare_values(value, column.min) < 0) {
        column.min = value;
    }
    if (column.max.is_null() || storage::compare_values(value, column.max) > 0) {
        column.max = value;
    }
    ++column.count;

    auto key = frequency_key(value);
    auto it = std::find_if(column.value_frequencies.begin(), column.value_frequencies.end(), [&key](const auto& entry) {
        return entry.first == key;
    });
    if (it == column.value_frequencies.end()) {
        column.value_frequencies.emplace_back(std::move(key), 1U);
    } else {
        ++it->second;
    }
}

}  // namespace

std::uint64_t ColumnStatistics::frequency(const std::string& key) const noexcept
{
    for (const auto& [value, count] : value_frequencies) {
        if (value == key) {
            return count;
        }
    }
    return 0U;
}

void TableStatistics::set_row_count(std::uint64_t value) noexcept
{
    row_count_ = value;
}

std::uint64_t TableStatistics::row_count() const noexcept
{
    return row_count_;
}

void TableStatistics::upsert_column(ColumnStatistics column)
{
    for (auto& existing : columns_) {
        if (existing.column_name == column.column_name) {
            existing = std::move(column);
            return;
        }
    }
    columns_.push_back(std::move(column));
}

const ColumnStatistics* TableStatistics::find_column(const std::string& name) const noexcept
{
    for (const auto& column : columns_) {
        if (column.column_name == name) {
            return &column;
        }
    }
    return nullptr;
}

const std::vector<ColumnStatistics>& TableStatistics::columns() const noexcept
{
    return columns_;
}

Json statistics_to_json(const TableStatistics& statistics)
{
    auto column_stats = Json::object();
    for (const auto& column : statistics.columns()) {
        auto frequencies = Json::object();
        for (const auto& [key, count] : column.value_frequencies) {
            frequencies[key] = count;
        }
        auto entry = Json::object();
        entry["min"] = storage::value_to_json(column.min);
        entry["max"] = storage::value_to_json(column.max);
        entry["count"] = column.count;
        entry["val_freq"] = std::move(frequencies);
        column_stats[column.column_name] = std::move(entry);
    }

    auto document = Json::object();
    document["row_count"] = statistics.row_count();
    document["column_stats"] = std::move(column_stats);
    return document;
}

TableStatistics statistics_from_json(const Json& document)
{
    TableStatistics statistics;
    statistics.set_row_count(document.value("row_count", std::uint64_t{0U}));
    const auto column_stats = document.find("column_stats");
    if (column_stats == document.end() || !column_stats->is_object()) {
        return statistics;
    }
    for (const auto& [name, entry] : column_stats->items()) {
        ColumnStatistics column{};
        column.column_name = name;
        if (const auto min = entry.find("min"); min != entry.end()) {
            column.min = storage::value_from_json(*min);
        }
        if (const auto max = entry.find("max"); max != entry.end()) {
            column.max = storage::value_from_json(*max);
        }
        column.count = entry.value("count", std::uint64_t{0U});
        if (const auto frequencies = entry.find("val_freq"); frequencies != entry.end() && frequencies->is_object()) {
            for (const auto& [key, count] : frequencies->items()) {
                column.value_frequencies.emplace_back(key, count.get<std::uint64_t>());
            }
        }
        statistics.upsert_column(std::move(column));
    }
    return statistics;
}

std::string frequency_key(const Value& value)
{
    if (value.kind() == storage::ValueKind::String) {
        return value.as_string();
    }
    return storage::value_to_json_text(value);
}

std::size_t StatsRefreshReport::failure_count() const noexcept
{
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(), [](const TableStatsOutcome& outcome) {
        return !outcome.success();
    }));
}

StatisticsManager::StatisticsManager(Config config)
    : config_{std::move(config)}
{
    if (config_.catalog == nullptr) {
        throw std::invalid_argument{"StatisticsManager requires a CatalogStore"};
    }
    if (config_.tables == nullptr) {
        throw std::invalid_argument{"StatisticsManager requires a TableStore"};
    }
    if (config_.stats_root.empty()) {
        throw std::invalid_argument{"StatisticsManager requires a statistics root"};
    }
    std::error_code ec;
    std::filesystem::create_directories(config_.stats_root, ec);
    if (ec) {
        throw std::system_error{ec, "failed to create statistics root '" + config_.stats_root.string() + "'"};
    }
}

void StatisticsManager::update_table_stats(const std::string& table) const
{
    const auto statistics = compute(table);
    storage::write_json_document(stats_path(table), statistics_to_json(statistics));
}

TableStatistics StatisticsManager::get_table_stats(const std::string& table) const
{
    const auto path = stats_path(table);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw std::system_error{make_error_code(EngineErrc::StatsNotFound),
                                "Statistics for table '" + table + "' not found"};
    }
    return statistics_from_json(storage::read_json_document(path));
}

StatsRefreshReport StatisticsManager::update_all_table_stats() const
{
    const auto tables = config_.catalog->list_tables();

    StatsRefreshReport report{};
    report.outcomes.reserve(tables.size());

    std::vector<std::future<storage::TaskResult>> futures;
    futures.reserve(tables.size());
    {
        storage::WorkerPool pool{storage::WorkerPoolConfig{.worker_threads = config_.max_workers,
                                                           .queue_depth = std::max<std::size_t>(1U, tables.size())}};
        for (const auto& table : tables) {
            futures.push_back(pool.submit([this, table]() -> storage::TaskResult {
                update_table_stats(table);
                return {};
            }));
        }
        pool.drain();
    }

    for (std::size_t index = 0U; index < tables.size(); ++index) {
        auto result = futures[index].get();
        TableStatsOutcome outcome{};
        outcome.table = tables[index];
        if (result.status) {
            outcome.status = make_error_code(EngineErrc::PerTableStatsFailure);
            outcome.message = std::move(result.message);
            if (config_.diagnostics) {
                Diagnostic diagnostic{};
                diagnostic.severity = Severity::Error;
                diagnostic.component = kComponent;
                diagnostic.message = "Error updating stats for table " + outcome.table + ": " + outcome.message;
                config_.diagnostics(diagnostic);
            }
        } else if (config_.diagnostics) {
            Diagnostic diagnostic{};
            diagnostic.severity = Severity::Info;
            diagnostic.component = kComponent;
            diagnostic.message = "Updated stats for table " + outcome.table;
            config_.diagnostics(diagnostic);
        }
        report.outcomes.push_back(std::move(outcome));
    }

    return report;
}

std::filesystem::path StatisticsManager::stats_path(const std::string& table) const
{
    return config_.stats_root / (table + kStatsExtension);
}

TableStatistics StatisticsManager::compute(const std::string& table) const
{
    const auto schema = config_.catalog->get_table(table);
    if (!schema) {
        throw std::system_error{make_error_code(EngineErrc::TableNotFound),
                                "Table '" + table + "' not found in catalog"};
    }

    std::vector<ColumnStatistics> columns;
    columns.reserve(schema->columns.size());
    for (const auto& definition : schema->columns) {
        ColumnStatistics column{};
        column.column_name = definition.name;
        columns.push_back(std::move(column));
    }

    std::uint64_t row_count = 0U;
    auto cursor = config_.tables->create_table_scan(table);
    storage::Row row;
    while (cursor->next(row)) {
        ++row_count;
        for (auto& column : columns) {
            if (const auto* value = row.find(column.column_name); value != nullptr) {
                accumulate(column, *value);
            }
        }
    }

    TableStatistics statistics;
    statistics.set_row_count(row_count);
    for (auto& column : columns) {
        statistics.upsert_column(std::move(column));
    }
    return statistics;
}

}  // namespace minipg::planner
