#include "minipg/common/errors.hpp"
#include "minipg/planner/plan_compiler.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <system_error>
#include <variant>
#include <vector>

using minipg::EngineErrc;
using minipg::PlanError;
using minipg::Severity;
using minipg::planner::CreateTablePlan;
using minipg::planner::InsertPlan;
using minipg::planner::JoinKind;
using minipg::planner::SelectPlan;
using minipg::storage::Value;
using minipg::storage::ValueKind;
using minipg::storage::ValueList;

namespace {

SelectPlan compile_select_text(const std::string& statement)
{
    const auto compiled = minipg::planner::compile_statement(statement);
    const auto* plan = std::get_if<SelectPlan>(&compiled.plan);
    REQUIRE(plan != nullptr);
    return *plan;
}

EngineErrc plan_error_code(const std::string& statement)
{
    try {
        (void)minipg::planner::compile_statement(statement);
    } catch (const PlanError& error) {
        return static_cast<EngineErrc>(error.code().value());
    }
    return EngineErrc::Success;
}

}  // namespace

TEST_CASE("Plan compiler builds a basic select plan", "[planner]")
{
    const auto plan = compile_select_text("SELECT * FROM table");

    CHECK(plan.select == std::vector<std::string>{"*"});
    CHECK(plan.from == "table");
    CHECK(plan.joins.empty());
    CHECK_FALSE(plan.where.has_value());
    CHECK_FALSE(plan.group_by.has_value());
    CHECK_FALSE(plan.order_by.has_value());
    CHECK_FALSE(plan.limit.has_value());
}

TEST_CASE("Plan compiler keeps the where text without the keyword", "[planner]")
{
    const auto plan = compile_select_text("SELECT * FROM table WHERE table.id = 1;");

    REQUIRE(plan.where.has_value());
    CHECK(*plan.where == "table.id = 1");
}

TEST_CASE("Plan compiler records joins on the joined table", "[planner]")
{
    const auto plan = compile_select_text("SELECT * FROM table1 JOIN table2 ON table1.id = table2.id");

    REQUIRE(plan.joins.size() == 1U);
    CHECK(plan.joins[0].first == "table2");
    const auto* join = plan.find_join("table2");
    REQUIRE(join != nullptr);
    CHECK(join->kind == JoinKind::Join);
    CHECK(join->left_table == "table1");
    CHECK(join->left_column == "id");
    CHECK(join->right_table == "table2");
    CHECK(join->right_column == "id");
}

TEST_CASE("Plan compiler normalizes a join condition written joined side first", "[planner]")
{
    const auto plan = compile_select_text("SELECT * FROM users INNER JOIN orders ON orders.user_id = users.id");

    const auto* join = plan.find_join("orders");
    REQUIRE(join != nullptr);
    CHECK(join->kind == JoinKind::Inner);
    CHECK(join->left_table == "users");
    CHECK(join->left_column == "id");
    CHECK(join->right_table == "orders");
    CHECK(join->right_column == "user_id");
}

TEST_CASE("Plan compiler collects order by, group by and limit", "[planner]")
{
    SECTION("order by")
    {
        const auto plan = compile_select_text("SELECT * FROM table ORDER BY id DESC");
        REQUIRE(plan.order_by.has_value());
        CHECK(*plan.order_by == std::vector<std::string>{"id DESC"});
    }

    SECTION("group by with an aggregate")
    {
        const auto plan = compile_select_text("SELECT column, COUNT(*) FROM table GROUP BY column");
        CHECK(plan.select == std::vector<std::string>{"column", "COUNT(*)"});
        REQUIRE(plan.group_by.has_value());
        CHECK(*plan.group_by == std::vector<std::string>{"column"});
    }

    SECTION("limit")
    {
        const auto plan = compile_select_text("SELECT name FROM users ORDER BY name ASC LIMIT 5;");
        CHECK(plan.select == std::vector<std::string>{"name"});
        REQUIRE(plan.order_by.has_value());
        CHECK(*plan.order_by == std::vector<std::string>{"name ASC"});
        REQUIRE(plan.limit.has_value());
        CHECK(*plan.limit == 5);
    }
}

TEST_CASE("Plan compiler reports tokens it cannot place", "[planner]")
{
    const auto compiled = minipg::planner::compile_statement("SELECT * FROM users 42");

    REQUIRE(compiled.diagnostics.size() == 1U);
    const auto& diagnostic = compiled.diagnostics.front();
    CHECK(diagnostic.severity == Severity::Info);
    CHECK(diagnostic.component == "planner");
    CHECK(diagnostic.message == "[JOIN_OR_CLAUSE] unresolved token '42' (IntegerLiteral)");
    CHECK(diagnostic.statement == "SELECT * FROM users 42");
}

TEST_CASE("Plan compiler warns about a join without a condition", "[planner]")
{
    const auto compiled = minipg::planner::compile_statement("SELECT * FROM users JOIN orders");

    const auto* plan = std::get_if<SelectPlan>(&compiled.plan);
    REQUIRE(plan != nullptr);
    CHECK(plan->joins.empty());
    REQUIRE_FALSE(compiled.diagnostics.empty());
    CHECK(compiled.diagnostics.back().severity == Severity::Warning);
}

TEST_CASE("Plan compiler rejects unsupported and incomplete statements", "[planner]")
{
    CHECK(plan_error_code("DELETE FROM users") == EngineErrc::UnsupportedStatement);
    CHECK(plan_error_code("SELECT FROM users") == EngineErrc::UnsupportedStatement);
    CHECK(plan_error_code("SELECT *") == EngineErrc::UnsupportedStatement);
}

TEST_CASE("Plan compiler builds insert plans", "[planner]")
{
    const auto compiled =
        minipg::planner::compile_statement("INSERT INTO users (name, age) VALUES ('Ann', 30), ('Bob', 25);");
    const auto* plan = std::get_if<InsertPlan>(&compiled.plan);
    REQUIRE(plan != nullptr);

    CHECK(plan->table == "users");
    CHECK(plan->columns == std::vector<std::string>{"name", "age"});
    REQUIRE(plan->values.size() == 2U);
    CHECK(plan->values[0][0] == Value{"Ann"});
    CHECK(plan->values[0][1].kind() == ValueKind::Int);
    CHECK(plan->values[1][1] == Value{25});
}

TEST_CASE("Insert without a column list leaves columns empty", "[planner]")
{
    const auto compiled = minipg::planner::compile_statement("INSERT INTO users VALUES ('Ann', 30)");
    const auto* plan = std::get_if<InsertPlan>(&compiled.plan);
    REQUIRE(plan != nullptr);

    CHECK(plan->table == "users");
    CHECK(plan->columns.empty());
    CHECK(plan->values.size() == 1U);
}

TEST_CASE("values_to_records infers types and applies casts", "[planner]")
{
    const auto records = minipg::planner::values_to_records(
        "(1, 2.5, 'text', plain, '7'::int, '3.5'::float, 'TRUE'::boolean, '{\"a\",\"b\"}'::text[], 'x::y')");

    REQUIRE(records.size() == 1U);
    const auto& record = records.front();
    REQUIRE(record.size() == 9U);
    CHECK(record[0].kind() == ValueKind::Int);
    CHECK(record[1].kind() == ValueKind::Float);
    CHECK(record[2] == Value{"text"});
    CHECK(record[3] == Value{"plain"});
    CHECK(record[4].kind() == ValueKind::Int);
    CHECK(record[4].as_int() == 7);
    CHECK(record[5].kind() == ValueKind::Float);
    CHECK(record[6] == Value{true});
    CHECK(record[7] == Value{ValueList{Value{"a"}, Value{"b"}}});
    CHECK(record[8] == Value{"x::y"});
}

TEST_CASE("Quoted numbers without a cast stay strings", "[planner]")
{
    const auto records = minipg::planner::values_to_records("('42')");

    REQUIRE(records.size() == 1U);
    CHECK(records[0][0].kind() == ValueKind::String);
}

TEST_CASE("values_to_records rejects bad casts and unbalanced input", "[planner]")
{
    CHECK_THROWS_AS(minipg::planner::values_to_records("('abc'::int)"), PlanError);
    CHECK_THROWS_AS(minipg::planner::values_to_records("(1::money)"), PlanError);
    CHECK_THROWS_AS(minipg::planner::values_to_records("(1, 2"), PlanError);
    CHECK_THROWS_AS(minipg::planner::values_to_records("('open)"), PlanError);
}

TEST_CASE("Plan compiler builds create table plans", "[planner]")
{
    const auto compiled = minipg::planner::compile_statement(
        "CREATE TABLE users (name text, age integer, score double precision);");
    const auto* plan = std::get_if<CreateTablePlan>(&compiled.plan);
    REQUIRE(plan != nullptr);

    CHECK(plan->table == "users");
    REQUIRE(plan->columns.size() == 3U);
    CHECK(plan->columns[0].name == "name");
    CHECK(plan->columns[0].declared_type == "text");
    CHECK(plan->columns[2].name == "score");
    CHECK(plan->columns[2].declared_type == "double precision");
}

TEST_CASE("Malformed create table statements are rejected", "[planner]")
{
    CHECK(plan_error_code("CREATE TABLE (a int)") == EngineErrc::MalformedCreateTable);
    CHECK(plan_error_code("CREATE TABLE t a int") == EngineErrc::MalformedCreateTable);
    CHECK(plan_error_code("CREATE TABLE t (a)") == EngineErrc::MalformedCreateTable);
    CHECK(plan_error_code("CREATE TABLE t (a int, a text)") == EngineErrc::MalformedCreateTable);
    CHECK(plan_error_code("CREATE TABLE t (a int,)") == EngineErrc::MalformedCreateTable);
}
