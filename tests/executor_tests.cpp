#include "minipg/common/errors.hpp"
#include "minipg/executor/aggregate_functions.hpp"
#include "minipg/executor/aggregation_executor.hpp"
#include "minipg/executor/executor_context.hpp"
#include "minipg/executor/filter_executor.hpp"
#include "minipg/executor/insert_executor.hpp"
#include "minipg/executor/limit_executor.hpp"
#include "minipg/executor/nested_loop_join_executor.hpp"
#include "minipg/executor/predicate.hpp"
#include "minipg/executor/projection_executor.hpp"
#include "minipg/executor/seq_scan_executor.hpp"
#include "minipg/executor/sort_executor.hpp"
#include "minipg/executor/sort_key.hpp"
#include "minipg/executor/values_executor.hpp"
#include "minipg/storage/table_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using minipg::executor::AggregateFunction;
using minipg::executor::AggregationExecutor;
using minipg::executor::ExecutorContext;
using minipg::executor::ExecutorContextConfig;
using minipg::executor::FilterExecutor;
using minipg::executor::InsertExecutor;
using minipg::executor::LimitExecutor;
using minipg::executor::NestedLoopJoinExecutor;
using minipg::executor::ProjectionExecutor;
using minipg::executor::SequentialScanExecutor;
using minipg::executor::SortExecutor;
using minipg::executor::SortKey;
using minipg::executor::TableInsertTarget;
using minipg::executor::ValuesExecutor;
using minipg::storage::Row;
using minipg::storage::TableScanCursor;
using minipg::storage::TableStore;
using minipg::storage::Value;
using minipg::storage::ValueKind;

namespace {

class FrozenTableCursor final : public TableScanCursor {
public:
    explicit FrozenTableCursor(const std::vector<Row>* rows)
        : rows_{rows}
    {}

    bool next(Row& out_row) override
    {
        if (rows_ == nullptr || index_ >= rows_->size()) {
            return false;
        }
        out_row = (*rows_)[index_++];
        return true;
    }

    void reset() override
    {
        index_ = 0U;
    }

private:
    const std::vector<Row>* rows_ = nullptr;
    std::size_t index_ = 0U;
};

class MemoryTableStore final : public TableStore {
public:
    void create_table(const std::string& table) override
    {
        tables_[table].clear();
    }

    bool table_exists(const std::string& table) const override
    {
        return tables_.contains(table);
    }

    std::unique_ptr<TableScanCursor> create_table_scan(const std::string& table) override
    {
        const auto it = tables_.find(table);
        if (it == tables_.end()) {
            throw std::system_error{minipg::make_error_code(minipg::EngineErrc::StorageFailure), "no table " + table};
        }
        return std::make_unique<FrozenTableCursor>(&it->second);
    }

    void append_rows(const std::string& table, const std::vector<Row>& rows) override
    {
        auto& stored = tables_[table];
        stored.insert(stored.end(), rows.begin(), rows.end());
        ++append_calls;
    }

    std::filesystem::path table_path(const std::string& table) const override
    {
        return std::filesystem::path{"memory"} / table;
    }

    [[nodiscard]] const std::vector<Row>& rows(const std::string& table) const
    {
        return tables_.at(table);
    }

    std::size_t append_calls = 0U;

private:
    std::map<std::string, std::vector<Row>> tables_{};
};

struct ExecutorFixture final {
    ExecutorFixture()
    {
        store.create_table("users");
        store.append_rows("users",
                          {Row{{"id", Value{1}}, {"name", Value{"Ann"}}, {"age", Value{30}}, {"city", Value{"Oslo"}}},
                           Row{{"id", Value{2}}, {"name", Value{"Bob"}}, {"age", Value{25}}, {"city", Value{"Rome"}}},
                           Row{{"id", Value{3}}, {"name", Value{"Cid"}}, {"age", Value{35}}, {"city", Value{"Oslo"}}}});
        store.create_table("orders");
        store.append_rows("orders",
                          {Row{{"id", Value{1}}, {"user_id", Value{1}}, {"total", Value{9.5}}},
                           Row{{"id", Value{2}}, {"user_id", Value{3}}, {"total", Value{20}}},
                           Row{{"id", Value{3}}, {"user_id", Value{1}}, {"total", Value{4}}}});
        store.append_calls = 0U;

        ExecutorContextConfig config{};
        config.tables = &store;
        context = ExecutorContext{config};
    }

    MemoryTableStore store;
    ExecutorContext context;
};

std::unique_ptr<SequentialScanExecutor> make_scan(const std::string& table,
                                                  std::optional<std::string> prefix = std::nullopt,
                                                  std::vector<SortKey> keys = {})
{
    SequentialScanExecutor::Config config{};
    config.table = table;
    config.column_prefix = std::move(prefix);
    config.sort_keys = std::move(keys);
    return std::make_unique<SequentialScanExecutor>(std::move(config));
}

std::vector<Value> column_values(const std::vector<Row>& rows, const std::string& column)
{
    std::vector<Value> values;
    for (const auto& row : rows) {
        values.push_back(row.get(column));
    }
    return values;
}

}  // namespace

TEST_CASE("Sequential scan streams rows in file order", "[executor]")
{
    ExecutorFixture fixture;
    auto scan = make_scan("users");
    const auto rows = minipg::executor::drain(*scan, fixture.context);

    REQUIRE(rows.size() == 3U);
    CHECK(column_values(rows, "id") == std::vector<Value>{Value{1}, Value{2}, Value{3}});
}

TEST_CASE("Sequential scan sorts and prefixes on request", "[executor]")
{
    ExecutorFixture fixture;
    auto scan = make_scan("users", std::string{"users"}, {SortKey{"age", true}});
    const auto rows = minipg::executor::drain(*scan, fixture.context);

    REQUIRE(rows.size() == 3U);
    CHECK(column_values(rows, "users.age") == std::vector<Value>{Value{35}, Value{30}, Value{25}});
    CHECK_FALSE(rows.front().contains("age"));
}

TEST_CASE("Executor context without a table store fails on open", "[executor]")
{
    ExecutorContext context{};
    auto scan = make_scan("users");
    CHECK_THROWS_AS(scan->open(context), std::logic_error);
}

TEST_CASE("Sort keys parse directions and sort stably", "[executor]")
{
    const auto key = minipg::executor::parse_sort_key("age DESC");
    CHECK(key.column == "age");
    CHECK(key.descending);
    CHECK_FALSE(minipg::executor::parse_sort_key("name").descending);
    CHECK(minipg::executor::sort_key_to_string(minipg::executor::parse_sort_key("id")) == "id ASC");

    std::vector<Row> rows{Row{{"k", Value{1}}, {"tag", Value{"a"}}},
                          Row{{"k", Value{0}}, {"tag", Value{"b"}}},
                          Row{{"k", Value{1}}, {"tag", Value{"c"}}},
                          Row{{"k", Value{}}, {"tag", Value{"d"}}}};
    minipg::executor::sort_rows(rows, {SortKey{"k", false}});
    CHECK(column_values(rows, "tag") == std::vector<Value>{Value{"d"}, Value{"b"}, Value{"a"}, Value{"c"}});
}

TEST_CASE("Nested loop join emits one row per matching pair", "[executor]")
{
    ExecutorFixture fixture;
    NestedLoopJoinExecutor join{make_scan("users", std::string{"users"}),
                                make_scan("orders", std::string{"orders"}),
                                NestedLoopJoinExecutor::Config{"users.id", "orders.user_id"}};
    const auto rows = minipg::executor::drain(join, fixture.context);

    REQUIRE(rows.size() == 3U);
    CHECK(column_values(rows, "users.name") == std::vector<Value>{Value{"Ann"}, Value{"Ann"}, Value{"Cid"}});
    CHECK(column_values(rows, "orders.id") == std::vector<Value>{Value{1}, Value{3}, Value{2}});
    CHECK(rows.front().contains("users.city"));
    CHECK(rows.front().contains("orders.total"));
}

TEST_CASE("Filter executor keeps rows that satisfy the predicate", "[executor]")
{
    ExecutorFixture fixture;
    FilterExecutor filter{make_scan("users"), FilterExecutor::Config{[](const Row& row, ExecutorContext&) {
                              return minipg::executor::evaluate_where(row, "city = 'Oslo'");
                          }}};
    const auto rows = minipg::executor::drain(filter, fixture.context);

    CHECK(column_values(rows, "name") == std::vector<Value>{Value{"Ann"}, Value{"Cid"}});
}

TEST_CASE("Aggregate functions follow null and type rules", "[executor]")
{
    const std::vector<Row> rows{Row{{"v", Value{2}}}, Row{{"v", Value{}}}, Row{{"v", Value{4}}}};

    const auto count_all = minipg::executor::parse_aggregate_call("COUNT(*)");
    REQUIRE(count_all.has_value());
    CHECK(count_all->function == AggregateFunction::Count);
    CHECK_FALSE(count_all->argument.has_value());
    CHECK(minipg::executor::evaluate_aggregate(*count_all, rows) == Value{3});

    const auto count_column = minipg::executor::parse_aggregate_call("count(v)");
    REQUIRE(count_column.has_value());
    CHECK(minipg::executor::evaluate_aggregate(*count_column, rows) == Value{2});

    const auto sum = minipg::executor::parse_aggregate_call("SUM(v)");
    const auto sum_value = minipg::executor::evaluate_aggregate(*sum, rows);
    CHECK(sum_value.kind() == ValueKind::Int);
    CHECK(sum_value == Value{6});

    const auto avg = minipg::executor::parse_aggregate_call("AVG(v)");
    const auto avg_value = minipg::executor::evaluate_aggregate(*avg, rows);
    CHECK(avg_value.kind() == ValueKind::Float);
    CHECK(avg_value == Value{3.0});

    CHECK(minipg::executor::evaluate_aggregate(*minipg::executor::parse_aggregate_call("MIN(v)"), rows) == Value{2});
    CHECK(minipg::executor::evaluate_aggregate(*minipg::executor::parse_aggregate_call("MAX(v)"), rows) == Value{4});

    const std::vector<Row> empty;
    CHECK(minipg::executor::evaluate_aggregate(*count_all, empty) == Value{0});
    CHECK(minipg::executor::evaluate_aggregate(*sum, empty) == Value{0});
    CHECK(minipg::executor::evaluate_aggregate(*avg, empty).is_null());

    CHECK_FALSE(minipg::executor::parse_aggregate_call("LOWER(name)").has_value());
    CHECK_FALSE(minipg::executor::parse_aggregate_call("name").has_value());
}

TEST_CASE("Aggregation executor groups in first-seen order", "[executor]")
{
    ExecutorFixture fixture;
    AggregationExecutor::Config config{};
    config.group_columns = {"city"};
    config.aggregates = {*minipg::executor::parse_aggregate_call("COUNT(*)"),
                         *minipg::executor::parse_aggregate_call("MAX(age)")};
    AggregationExecutor aggregation{make_scan("users"), std::move(config)};
    const auto rows = minipg::executor::drain(aggregation, fixture.context);

    REQUIRE(rows.size() == 2U);
    CHECK(rows[0].get("city") == Value{"Oslo"});
    CHECK(rows[0].get("COUNT(*)") == Value{2});
    CHECK(rows[0].get("MAX(age)") == Value{35});
    CHECK(rows[1].get("city") == Value{"Rome"});
    CHECK(rows[1].get("COUNT(*)") == Value{1});
}

TEST_CASE("Aggregation row filter drops groups left empty", "[executor]")
{
    ExecutorFixture fixture;
    AggregationExecutor::Config config{};
    config.group_columns = {"city"};
    config.aggregates = {*minipg::executor::parse_aggregate_call("COUNT(*)")};
    config.row_filter = [](const Row& row, ExecutorContext&) {
        return minipg::executor::evaluate_where(row, "age > 26");
    };
    AggregationExecutor aggregation{make_scan("users"), std::move(config)};
    const auto rows = minipg::executor::drain(aggregation, fixture.context);

    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].get("city") == Value{"Oslo"});
    CHECK(rows[0].get("COUNT(*)") == Value{2});
}

TEST_CASE("Ungrouped aggregation emits one row for empty input", "[executor]")
{
    ExecutorFixture fixture;
    fixture.store.create_table("empty");

    AggregationExecutor::Config config{};
    config.aggregates = {*minipg::executor::parse_aggregate_call("COUNT(*)")};
    AggregationExecutor aggregation{make_scan("empty"), std::move(config)};
    const auto rows = minipg::executor::drain(aggregation, fixture.context);

    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].get("COUNT(*)") == Value{0});
}

TEST_CASE("Integer SUM refuses to leave the int64 range", "[executor]")
{
    const auto sum = minipg::executor::parse_aggregate_call("SUM(v)");
    REQUIRE(sum.has_value());

    const std::vector<Row> overflowing{Row{{"v", Value{std::numeric_limits<std::int64_t>::max()}}},
                                       Row{{"v", Value{1}}}};
    CHECK_THROWS_AS(minipg::executor::evaluate_aggregate(*sum, overflowing), std::system_error);

    const std::vector<Row> underflowing{Row{{"v", Value{std::numeric_limits<std::int64_t>::min()}}},
                                        Row{{"v", Value{-1}}}};
    CHECK_THROWS_AS(minipg::executor::evaluate_aggregate(*sum, underflowing), std::system_error);

    const std::vector<Row> mixed{Row{{"v", Value{std::numeric_limits<std::int64_t>::max()}}}, Row{{"v", Value{1}}},
                                 Row{{"v", Value{0.5}}}};
    const auto mixed_sum = minipg::executor::evaluate_aggregate(*sum, mixed);
    CHECK(mixed_sum.kind() == ValueKind::Float);

    const auto avg = minipg::executor::parse_aggregate_call("AVG(v)");
    CHECK(minipg::executor::evaluate_aggregate(*avg, overflowing).kind() == ValueKind::Float);
}

TEST_CASE("Aggregation groups numerically equal keys together", "[executor]")
{
    ExecutorFixture fixture;
    fixture.store.create_table("scores");
    fixture.store.append_rows("scores", {Row{{"k", Value{1}}, {"points", Value{10}}},
                                         Row{{"k", Value{1.0}}, {"points", Value{20}}},
                                         Row{{"k", Value{"1"}}, {"points", Value{40}}},
                                         Row{{"k", Value{true}}, {"points", Value{5}}},
                                         Row{{"k", Value{2.5}}, {"points", Value{1}}}});

    AggregationExecutor::Config config{};
    config.group_columns = {"k"};
    config.aggregates = {*minipg::executor::parse_aggregate_call("SUM(points)")};
    AggregationExecutor aggregation{make_scan("scores"), std::move(config)};
    const auto rows = minipg::executor::drain(aggregation, fixture.context);

    REQUIRE(rows.size() == 3U);
    CHECK(rows[0].get("k").kind() == ValueKind::Int);
    CHECK(rows[0].get("SUM(points)") == Value{35});
    CHECK(rows[1].get("k") == Value{"1"});
    CHECK(rows[1].get("SUM(points)") == Value{40});
    CHECK(rows[2].get("k") == Value{2.5});
}

TEST_CASE("Projection selects, expands and fills missing columns", "[executor]")
{
    ExecutorFixture fixture;
    auto join = std::make_unique<NestedLoopJoinExecutor>(make_scan("users", std::string{"users"}),
                                                         make_scan("orders", std::string{"orders"}),
                                                         NestedLoopJoinExecutor::Config{"users.id", "orders.user_id"});
    ProjectionExecutor projection{std::move(join),
                                  ProjectionExecutor::Config{{"name", "orders.*", "missing"}}};
    const auto rows = minipg::executor::drain(projection, fixture.context);

    REQUIRE(rows.size() == 3U);
    const auto& first = rows.front();
    REQUIRE(first.size() == 5U);
    CHECK(first.fields()[0].first == "name");
    CHECK(first.get("name") == Value{"Ann"});
    CHECK(first.fields()[1].first == "orders.id");
    CHECK(first.contains("orders.total"));
    CHECK(first.fields()[4].first == "missing");
    CHECK(first.get("missing").is_null());
}

TEST_CASE("Limit stops after the requested number of rows", "[executor]")
{
    ExecutorFixture fixture;

    LimitExecutor two{make_scan("users"), LimitExecutor::Config{2}};
    CHECK(minipg::executor::drain(two, fixture.context).size() == 2U);

    LimitExecutor none{make_scan("users"), LimitExecutor::Config{0}};
    CHECK(minipg::executor::drain(none, fixture.context).empty());

    CHECK_THROWS_AS(LimitExecutor(make_scan("users"), LimitExecutor::Config{-1}), std::invalid_argument);
}

TEST_CASE("Sort executor orders joined rows by qualified keys", "[executor]")
{
    ExecutorFixture fixture;
    auto join = std::make_unique<NestedLoopJoinExecutor>(make_scan("users", std::string{"users"}),
                                                         make_scan("orders", std::string{"orders"}),
                                                         NestedLoopJoinExecutor::Config{"users.id", "orders.user_id"});
    SortExecutor sort{std::move(join), SortExecutor::Config{{SortKey{"orders.total", true}}}};
    const auto rows = minipg::executor::drain(sort, fixture.context);

    CHECK(column_values(rows, "orders.total") == std::vector<Value>{Value{20}, Value{9.5}, Value{4}});
}

TEST_CASE("Insert executor writes values rows through the table target", "[executor]")
{
    ExecutorFixture fixture;
    std::int64_t next_id = 3;

    ValuesExecutor::Config values{};
    values.columns = {"name", "age"};
    values.tuples = {{Value{"Dee"}, Value{41}}, {Value{"Eve"}, Value{19}}};
    values.allocate_row_id = [&next_id]() { return ++next_id; };

    TableInsertTarget target{"users"};
    InsertExecutor insert{std::make_unique<ValuesExecutor>(std::move(values)), InsertExecutor::Config{&target}};
    const auto emitted = minipg::executor::drain(insert, fixture.context);

    CHECK(emitted.empty());
    CHECK(insert.inserted_rows() == 2U);
    CHECK(fixture.store.append_calls == 1U);

    const auto& rows = fixture.store.rows("users");
    REQUIRE(rows.size() == 5U);
    CHECK(rows[3].fields()[0].first == "id");
    CHECK(rows[3].get("id") == Value{4});
    CHECK(rows[4].get("id") == Value{5});
    CHECK(rows[4].get("name") == Value{"Eve"});
}

TEST_CASE("Values executor rejects tuples of the wrong width", "[executor]")
{
    ExecutorFixture fixture;
    ValuesExecutor::Config values{};
    values.columns = {"name", "age"};
    values.tuples = {minipg::planner::ValueTuple{Value{"Dee"}}};
    values.allocate_row_id = []() { return std::int64_t{1}; };

    ValuesExecutor executor{std::move(values)};
    try {
        executor.open(fixture.context);
        FAIL("expected MalformedInsert");
    } catch (const std::system_error& error) {
        CHECK(error.code() == minipg::EngineErrc::MalformedInsert);
        CHECK(minipg::error_message(error) == "Expected 2 values per record but got 1");
    }
}
