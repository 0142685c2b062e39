#include "minipg/catalog/catalog_store.hpp"
#include "minipg/common/errors.hpp"
#include "minipg/planner/statistics_manager.hpp"
#include "minipg/storage/table_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

using minipg::catalog::CatalogStore;
using minipg::catalog::ColumnDefinition;
using minipg::catalog::TableSchema;
using minipg::planner::StatisticsManager;
using minipg::storage::Row;
using minipg::storage::Value;

namespace {

std::filesystem::path make_unique_stats_root()
{
    const auto base = std::filesystem::temp_directory_path();
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("minipg_stats_" + std::to_string(stamp));
}

struct StatsFixture final {
    StatsFixture()
        : root{make_unique_stats_root()}
        , catalog{CatalogStore::Config{root / "global" / "mpg_tables.json"}}
        , tables{minipg::storage::create_json_lines_table_store(root / "json_db")}
    {
    }

    ~StatsFixture()
    {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    void create(const std::string& name, std::vector<ColumnDefinition> columns, const std::vector<Row>& rows)
    {
        TableSchema schema{};
        schema.name = name;
        schema.columns = std::move(columns);
        schema.sort = std::string{minipg::catalog::kAppendOnlySort};
        catalog.create_table(schema);
        tables->create_table(name);
        tables->append_rows(name, rows);
    }

    StatisticsManager make_manager(minipg::DiagnosticSink sink = {})
    {
        StatisticsManager::Config config{};
        config.catalog = &catalog;
        config.tables = tables.get();
        config.stats_root = root / "mpg_stat";
        config.max_workers = 3U;
        config.diagnostics = std::move(sink);
        return StatisticsManager{std::move(config)};
    }

    std::filesystem::path root;
    CatalogStore catalog;
    std::unique_ptr<minipg::storage::TableStore> tables;
};

std::string read_file(const std::filesystem::path& path)
{
    std::ifstream stream{path};
    return std::string{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
}

}  // namespace

TEST_CASE("Table statistics capture row count, bounds and frequencies", "[statistics]")
{
    StatsFixture fixture;
    fixture.create("users",
                   {ColumnDefinition{"name", "text"}, ColumnDefinition{"age", "int"}},
                   {Row{{"id", Value{1}}, {"name", Value{"Ann"}}, {"age", Value{30}}},
                    Row{{"id", Value{2}}, {"name", Value{"Bob"}}, {"age", Value{}}},
                    Row{{"id", Value{3}}, {"name", Value{"Ann"}}, {"age", Value{25}}}});

    const auto manager = fixture.make_manager();
    manager.update_table_stats("users");
    const auto statistics = manager.get_table_stats("users");

    CHECK(statistics.row_count() == 3U);
    CHECK(statistics.find_column("id") == nullptr);

    const auto* name = statistics.find_column("name");
    REQUIRE(name != nullptr);
    CHECK(name->count == 3U);
    CHECK(name->min == Value{"Ann"});
    CHECK(name->max == Value{"Bob"});
    CHECK(name->frequency("Ann") == 2U);
    CHECK(name->frequency("Bob") == 1U);

    const auto* age = statistics.find_column("age");
    REQUIRE(age != nullptr);
    CHECK(age->count == 2U);
    CHECK(age->min == Value{25});
    CHECK(age->max == Value{30});
    CHECK(age->frequency("30") == 1U);
}

TEST_CASE("Statistics for an empty table have null bounds", "[statistics]")
{
    StatsFixture fixture;
    fixture.create("empty", {ColumnDefinition{"value", "int"}}, {});

    const auto manager = fixture.make_manager();
    manager.update_table_stats("empty");
    const auto statistics = manager.get_table_stats("empty");

    CHECK(statistics.row_count() == 0U);
    const auto* column = statistics.find_column("value");
    REQUIRE(column != nullptr);
    CHECK(column->count == 0U);
    CHECK(column->min.is_null());
    CHECK(column->max.is_null());
    CHECK(column->value_frequencies.empty());
}

TEST_CASE("Statistics documents use the documented layout", "[statistics]")
{
    StatsFixture fixture;
    fixture.create("tags", {ColumnDefinition{"label", "text"}}, {Row{{"id", Value{1}}, {"label", Value{"x"}}}});

    const auto manager = fixture.make_manager();
    manager.update_table_stats("tags");

    CHECK(read_file(manager.stats_path("tags"))
          == R"({"row_count":1,"column_stats":{"label":{"min":"x","max":"x","count":1,"val_freq":{"x":1}}}})");
}

TEST_CASE("Missing statistics are reported as StatsNotFound", "[statistics]")
{
    StatsFixture fixture;
    const auto manager = fixture.make_manager();

    try {
        (void)manager.get_table_stats("ghost");
        FAIL("expected StatsNotFound");
    } catch (const std::system_error& error) {
        CHECK(error.code() == minipg::EngineErrc::StatsNotFound);
        CHECK(minipg::error_message(error) == "Statistics for table 'ghost' not found");
    }

    CHECK_THROWS_AS(manager.update_table_stats("ghost"), std::system_error);
}

TEST_CASE("Refreshing all tables matches per-table updates", "[statistics]")
{
    StatsFixture fixture;
    for (int table = 0; table < 6; ++table) {
        std::vector<Row> rows;
        for (int index = 0; index <= table; ++index) {
            rows.push_back(Row{{"id", Value{index + 1}}, {"value", Value{index % 3}}});
        }
        fixture.create("t" + std::to_string(table), {ColumnDefinition{"value", "int"}}, rows);
    }

    const auto manager = fixture.make_manager();
    std::vector<std::string> sequential;
    for (int table = 0; table < 6; ++table) {
        const auto name = "t" + std::to_string(table);
        manager.update_table_stats(name);
        sequential.push_back(read_file(manager.stats_path(name)));
    }

    const auto report = manager.update_all_table_stats();
    REQUIRE(report.outcomes.size() == 6U);
    CHECK(report.failure_count() == 0U);
    for (int table = 0; table < 6; ++table) {
        const auto name = "t" + std::to_string(table);
        CHECK(report.outcomes[static_cast<std::size_t>(table)].table == name);
        CHECK(read_file(manager.stats_path(name)) == sequential[static_cast<std::size_t>(table)]);
    }
}

TEST_CASE("A failing table does not stop the refresh of the others", "[statistics]")
{
    StatsFixture fixture;
    fixture.create("good", {ColumnDefinition{"value", "int"}}, {Row{{"id", Value{1}}, {"value", Value{5}}}});
    fixture.create("broken", {ColumnDefinition{"value", "int"}}, {});
    std::filesystem::remove(fixture.tables->table_path("broken"));

    std::mutex mutex;
    std::vector<minipg::Diagnostic> diagnostics;
    const auto manager = fixture.make_manager([&mutex, &diagnostics](const minipg::Diagnostic& diagnostic) {
        std::lock_guard<std::mutex> guard{mutex};
        diagnostics.push_back(diagnostic);
    });

    const auto report = manager.update_all_table_stats();
    REQUIRE(report.outcomes.size() == 2U);
    CHECK(report.failure_count() == 1U);
    CHECK(report.outcomes[0].success());
    CHECK(report.outcomes[1].status == minipg::EngineErrc::PerTableStatsFailure);
    CHECK(manager.get_table_stats("good").row_count() == 1U);

    bool error_reported = false;
    for (const auto& diagnostic : diagnostics) {
        if (diagnostic.severity == minipg::Severity::Error
            && diagnostic.message.rfind("Error updating stats for table broken", 0U) == 0U) {
            error_reported = true;
        }
    }
    CHECK(error_reported);
}
