#include "minipg/planner/plan_compiler.hpp"

#include "minipg/common/errors.hpp"
#include "minipg/parser/tokenizer.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace minipg::planner {

namespace {

using parser::Token;
using parser::TokenKind;
using storage::Value;

constexpr const char* kComponent = "planner";

enum class SelectState {
    Start,
    SelectList,
    From,
    JoinOrClause,
    Join,
    On,
    OrderBy,
    GroupBy,
    Limit
};

std::string_view state_name(SelectState state) noexcept
{
    switch (state) {
    case SelectState::Start:
        return "START";
    case SelectState::SelectList:
        return "SELECT_LIST";
    case SelectState::From:
        return "FROM";
    case SelectState::JoinOrClause:
        return "JOIN_OR_CLAUSE";
    case SelectState::Join:
        return "JOIN";
    case SelectState::On:
        return "ON";
    case SelectState::OrderBy:
        return "ORDER_BY";
    case SelectState::GroupBy:
        return "GROUP_BY";
    case SelectState::Limit:
        return "LIMIT";
    }
    return "UNKNOWN";
}

std::string trim_copy(std::string_view text)
{
    std::size_t begin = 0U;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    auto end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1U]))) {
        --end;
    }
    return std::string{text.substr(begin, end - begin)};
}

std::string lowercase_copy(std::string_view text)
{
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return result;
}

std::string uppercase_copy(std::string_view text)
{
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return result;
}

void record_unresolved(std::vector<Diagnostic>& diagnostics, std::string_view state, const Token& token)
{
    Diagnostic diagnostic{};
    diagnostic.severity = Severity::Info;
    diagnostic.component = kComponent;
    diagnostic.message = "[" + std::string{state} + "] unresolved token '" + token.text + "' ("
                         + std::string{parser::token_kind_to_string(token.kind)} + ")";
    diagnostics.push_back(std::move(diagnostic));
}

std::optional<JoinKind> join_kind_from_keyword(const Token& token)
{
    if (token.kind != TokenKind::Keyword) {
        return std::nullopt;
    }
    const auto& keyword = token.keyword;
    if (keyword == "JOIN") {
        return JoinKind::Join;
    }
    if (keyword == "INNER JOIN") {
        return JoinKind::Inner;
    }
    if (keyword == "LEFT JOIN" || keyword == "LEFT OUTER JOIN") {
        return JoinKind::Left;
    }
    if (keyword == "RIGHT JOIN" || keyword == "RIGHT OUTER JOIN") {
        return JoinKind::Right;
    }
    if (keyword == "FULL JOIN" || keyword == "FULL OUTER JOIN") {
        return JoinKind::Full;
    }
    return std::nullopt;
}

std::pair<std::string, std::string> split_qualified(const std::string& operand, const std::string& default_table)
{
    const auto dot = operand.find('.');
    if (dot == std::string::npos) {
        return {default_table, operand};
    }
    return {operand.substr(0U, dot), operand.substr(dot + 1U)};
}

JoinSpec make_join_spec(JoinKind kind, const std::string& base_table, const std::string& join_table, const Token& comparison)
{
    auto [left_table, left_column] = split_qualified(comparison.left, base_table);
    auto [right_table, right_column] = split_qualified(comparison.right, join_table);
    if (left_table == join_table && right_table != join_table) {
        std::swap(left_table, right_table);
        std::swap(left_column, right_column);
    }

    JoinSpec join{};
    join.kind = kind;
    join.left_table = std::move(left_table);
    join.left_column = std::move(left_column);
    join.right_table = std::move(right_table);
    join.right_column = std::move(right_column);
    return join;
}

std::string where_text(const std::string& clause)
{
    constexpr std::size_t kWhereLength = 5U;
    auto text = trim_copy(std::string_view{clause}.substr(std::min(kWhereLength, clause.size())));
    while (!text.empty() && text.back() == ';') {
        text.pop_back();
        text = trim_copy(text);
    }
    return text;
}

// Splits on commas that sit outside quotes, braces, brackets and parentheses.
std::vector<std::string> split_fields(std::string_view text)
{
    std::vector<std::string> fields;
    bool single_quoted = false;
    bool double_quoted = false;
    int depth = 0;
    std::size_t start = 0U;
    for (std::size_t index = 0U; index < text.size(); ++index) {
        const auto ch = text[index];
        if (ch == '\'' && !double_quoted) {
            single_quoted = !single_quoted;
        } else if (ch == '"' && !single_quoted) {
            double_quoted = !double_quoted;
        } else if (single_quoted || double_quoted) {
            continue;
        } else if (ch == '{' || ch == '[' || ch == '(') {
            ++depth;
        } else if ((ch == '}' || ch == ']' || ch == ')') && depth > 0) {
            --depth;
        } else if (ch == ',' && depth == 0) {
            fields.push_back(trim_copy(text.substr(start, index - start)));
            start = index + 1U;
        }
    }
    fields.push_back(trim_copy(text.substr(start)));
    return fields;
}

std::optional<std::int64_t> parse_integer(std::string_view text)
{
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1U);
    }
    std::int64_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_float(std::string_view text)
{
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1U);
    }
    double value = 0.0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string> double_quoted_substrings(std::string_view text)
{
    std::vector<std::string> items;
    std::size_t position = 0U;
    while (true) {
        const auto open = text.find('"', position);
        if (open == std::string_view::npos) {
            break;
        }
        const auto close = text.find('"', open + 1U);
        if (close == std::string_view::npos) {
            break;
        }
        items.emplace_back(text.substr(open + 1U, close - open - 1U));
        position = close + 1U;
    }
    return items;
}

Value convert_field(const std::string& raw)
{
    auto text = trim_copy(raw);

    std::optional<std::string> cast;
    const auto cast_position = text.rfind("::");
    if (cast_position != std::string::npos && text.find('\'', cast_position) == std::string::npos) {
        cast = lowercase_copy(trim_copy(std::string_view{text}.substr(cast_position + 2U)));
        text = trim_copy(std::string_view{text}.substr(0U, cast_position));
    }

    const bool quoted = text.size() >= 2U && text.front() == '\'' && text.back() == '\'';
    if (quoted) {
        text = text.substr(1U, text.size() - 2U);
    }

    if (!cast) {
        if (quoted) {
            return Value{std::move(text)};
        }
        if (const auto integer = parse_integer(text)) {
            return Value{*integer};
        }
        if (const auto real = parse_float(text)) {
            return Value{*real};
        }
        return Value{std::move(text)};
    }

    const auto& type = *cast;
    if (type == "text" || type == "varchar" || type == "char") {
        return Value{std::move(text)};
    }
    if (type == "int" || type == "integer" || type == "bigint" || type == "smallint") {
        const auto integer = parse_integer(trim_copy(text));
        if (!integer) {
            throw PlanError{EngineErrc::MalformedInsert, "Invalid integer value '" + text + "' for cast to " + type};
        }
        return Value{*integer};
    }
    if (type == "float" || type == "double precision" || type == "real") {
        const auto real = parse_float(trim_copy(text));
        if (!real) {
            throw PlanError{EngineErrc::MalformedInsert, "Invalid numeric value '" + text + "' for cast to " + type};
        }
        return Value{*real};
    }
    if (type == "boolean") {
        return Value{lowercase_copy(text) == "true"};
    }
    if (type == "text[]") {
        storage::ValueList items;
        for (auto& item : double_quoted_substrings(text)) {
            items.emplace_back(std::move(item));
        }
        return Value{std::move(items)};
    }
    throw PlanError{EngineErrc::MalformedInsert, "Unsupported cast type '" + type + "'"};
}

}  // namespace

SelectPlan compile_select(const parser::TokenStream& stream, std::vector<Diagnostic>& diagnostics)
{
    SelectPlan plan{};
    auto state = SelectState::Start;
    JoinKind join_kind = JoinKind::Join;
    std::string join_table;

    for (const auto& token : stream.tokens) {
        if (token.kind == TokenKind::Whitespace) {
            continue;
        }

        switch (state) {
        case SelectState::Start:
            if (token.is_keyword("SELECT")) {
                state = SelectState::SelectList;
            } else {
                record_unresolved(diagnostics, state_name(state), token);
            }
            break;

        case SelectState::SelectList:
            if (token.is_keyword("FROM")) {
                state = SelectState::From;
            } else if (token.kind == TokenKind::IdentifierList) {
                plan.select = token.members;
            } else if (token.kind == TokenKind::Identifier || token.kind == TokenKind::Wildcard
                       || token.kind == TokenKind::FunctionCall) {
                plan.select.push_back(token.text);
            } else {
                record_unresolved(diagnostics, state_name(state), token);
            }
            break;

        case SelectState::From:
            if (token.kind == TokenKind::Keyword || token.kind == TokenKind::Identifier) {
                plan.from = token.text;
                state = SelectState::JoinOrClause;
            } else {
                record_unresolved(diagnostics, state_name(state), token);
            }
            break;

        case SelectState::JoinOrClause:
            if (const auto kind = join_kind_from_keyword(token)) {
                join_kind = *kind;
                state = SelectState::Join;
            } else if (token.kind == TokenKind::WhereClause) {
                plan.where = where_text(token.text);
            } else if (token.is_keyword("ORDER BY")) {
                state = SelectState::OrderBy;
            } else if (token.is_keyword("GROUP BY")) {
                state = SelectState::GroupBy;
            } else if (token.is_keyword("LIMIT")) {
                state = SelectState::Limit;
            } else {
                record_unresolved(diagnostics, state_name(state), token);
            }
            break;

        case SelectState::Join:
            if (token.kind == TokenKind::Identifier) {
                join_table = token.text;
                state = SelectState::On;
            } else {
                record_unresolved(diagnostics, state_name(state), token);
            }
            break;

        case SelectState::On:
            if (token.kind == TokenKind::Comparison) {
                plan.joins.emplace_back(join_table, make_join_spec(join_kind, plan.from, join_table, token));
                join_table.clear();
                join_kind = JoinKind::Join;
                state = SelectState::JoinOrClause;
            } else if (!token.is_keyword("ON")) {
                record_unresolved(diagnostics, state_name(state), token);
            }
            break;

        case SelectState::OrderBy:
            if (token.kind == TokenKind::IdentifierList) {
                plan.order_by = token.members;
            } else if (token.kind == TokenKind::Identifier) {
                if (!plan.order_by) {
                    plan.order_by.emplace();
                }
                plan.order_by->push_back(token.text);
            } else {
                record_unresolved(diagnostics, state_name(state), token);
            }
            state = SelectState::JoinOrClause;
            break;

        case SelectState::GroupBy:
            if (token.kind == TokenKind::IdentifierList) {
                plan.group_by = token.members;
            } else if (token.kind == TokenKind::Keyword || token.kind == TokenKind::Identifier) {
                if (!plan.group_by) {
                    plan.group_by.emplace();
                }
                plan.group_by->push_back(token.text);
            } else {
                record_unresolved(diagnostics, state_name(state), token);
            }
            state = SelectState::JoinOrClause;
            break;

        case SelectState::Limit:
            if (token.kind == TokenKind::IntegerLiteral) {
                const auto limit = parse_integer(token.text);
                if (!limit) {
                    throw PlanError{EngineErrc::UnsupportedStatement, "Invalid LIMIT value '" + token.text + "'"};
                }
                plan.limit = *limit;
            } else {
                record_unresolved(diagnostics, state_name(state), token);
            }
            state = SelectState::JoinOrClause;
            break;
        }
    }

    if (state == SelectState::Join || state == SelectState::On) {
        Diagnostic diagnostic{};
        diagnostic.severity = Severity::Warning;
        diagnostic.component = kComponent;
        diagnostic.message = "join without an ON comparison was ignored";
        diagnostics.push_back(std::move(diagnostic));
    }
    if (plan.select.empty()) {
        throw PlanError{EngineErrc::UnsupportedStatement, "SELECT statement has no select list"};
    }
    if (plan.from.empty()) {
        throw PlanError{EngineErrc::UnsupportedStatement, "SELECT statement requires a FROM clause"};
    }
    return plan;
}

InsertPlan compile_insert(const parser::TokenStream& stream, std::vector<Diagnostic>& diagnostics)
{
    enum class Target { None, Table, Values };

    InsertPlan plan{};
    auto target = Target::None;
    bool has_values = false;

    for (const auto& token : stream.tokens) {
        if (token.kind == TokenKind::Whitespace) {
            continue;
        }
        if (token.is_keyword("INSERT") || token.is_keyword("INTO")) {
            target = Target::Table;
        } else if (token.is_keyword("VALUES")) {
            target = Target::Values;
        } else if (token.kind == TokenKind::FunctionCall && target == Target::Table) {
            plan.table = token.function_name;
            plan.columns.clear();
            for (auto& column : split_fields(token.arguments)) {
                plan.columns.push_back(std::move(column));
            }
        } else if (token.kind == TokenKind::ValueList) {
            plan.values = values_to_records(token.text);
            has_values = true;
        } else if (token.kind == TokenKind::Identifier && target == Target::Table) {
            plan.table = token.text;
        } else {
            record_unresolved(diagnostics, "INSERT", token);
        }
    }

    if (plan.table.empty()) {
        throw PlanError{EngineErrc::MalformedInsert, "INSERT statement requires a target table"};
    }
    if (!has_values) {
        throw PlanError{EngineErrc::MalformedInsert, "INSERT statement requires a VALUES list"};
    }
    return plan;
}

CreateTablePlan compile_create_table(std::string_view statement)
{
    static constexpr std::string_view kCreateTable = "CREATE TABLE";

    const auto upper = uppercase_copy(statement);
    const auto keyword = upper.find(kCreateTable);
    if (keyword == std::string::npos) {
        throw PlanError{EngineErrc::MalformedCreateTable, "Invalid CREATE TABLE query: Table name not found"};
    }
    const auto name_start = keyword + kCreateTable.size();
    const auto open = statement.find('(', name_start);
    const auto close = statement.rfind(')');
    if (open == std::string_view::npos) {
        throw PlanError{EngineErrc::MalformedCreateTable, "Invalid CREATE TABLE query: Table name not found"};
    }

    CreateTablePlan plan{};
    plan.table = trim_copy(statement.substr(name_start, open - name_start));
    if (plan.table.empty()) {
        throw PlanError{EngineErrc::MalformedCreateTable, "Invalid CREATE TABLE query: Table name not found"};
    }
    if (close == std::string_view::npos || close < open) {
        throw PlanError{EngineErrc::MalformedCreateTable, "Invalid CREATE TABLE query: Columns not found"};
    }

    for (const auto& entry : split_fields(statement.substr(open + 1U, close - open - 1U))) {
        if (entry.empty()) {
            throw PlanError{EngineErrc::MalformedCreateTable, "Invalid CREATE TABLE query: empty column definition"};
        }
        const auto split = std::find_if(entry.begin(), entry.end(), [](unsigned char ch) {
            return std::isspace(ch) != 0;
        });
        catalog::ColumnDefinition column{};
        column.name = std::string{entry.begin(), split};
        column.declared_type = trim_copy(std::string_view{entry}.substr(column.name.size()));
        if (column.declared_type.empty()) {
            throw PlanError{EngineErrc::MalformedCreateTable,
                            "Invalid CREATE TABLE query: column '" + column.name + "' has no type"};
        }
        const auto duplicate = std::any_of(plan.columns.begin(), plan.columns.end(), [&column](const auto& existing) {
            return existing.name == column.name;
        });
        if (duplicate) {
            throw PlanError{EngineErrc::MalformedCreateTable,
                            "Invalid CREATE TABLE query: duplicate column '" + column.name + "'"};
        }
        plan.columns.push_back(std::move(column));
    }
    return plan;
}

std::vector<ValueTuple> values_to_records(std::string_view values)
{
    std::vector<ValueTuple> records;

    bool single_quoted = false;
    int depth = 0;
    std::size_t group_start = 0U;
    for (std::size_t index = 0U; index < values.size(); ++index) {
        const auto ch = values[index];
        if (ch == '\'') {
            single_quoted = !single_quoted;
        } else if (single_quoted) {
            continue;
        } else if (ch == '(') {
            if (depth == 0) {
                group_start = index + 1U;
            }
            ++depth;
        } else if (ch == ')' && depth > 0) {
            --depth;
            if (depth == 0) {
                ValueTuple record;
                for (const auto& field : split_fields(values.substr(group_start, index - group_start))) {
                    record.push_back(convert_field(field));
                }
                records.push_back(std::move(record));
            }
        }
    }

    if (single_quoted || depth != 0) {
        throw PlanError{EngineErrc::MalformedInsert, "Unbalanced VALUES list"};
    }
    return records;
}

CompiledPlan compile_statement(std::string_view statement)
{
    const auto stream = parser::tokenize(statement);

    CompiledPlan compiled{};
    switch (stream.command) {
    case parser::CommandKind::Select:
        compiled.plan = compile_select(stream, compiled.diagnostics);
        break;
    case parser::CommandKind::Insert:
        compiled.plan = compile_insert(stream, compiled.diagnostics);
        break;
    case parser::CommandKind::Create:
        compiled.plan = compile_create_table(statement);
        break;
    case parser::CommandKind::Unsupported:
        throw PlanError{EngineErrc::UnsupportedStatement, "Unsupported query type"};
    }

    const auto text = trim_copy(statement);
    for (auto& diagnostic : compiled.diagnostics) {
        diagnostic.statement = text;
    }
    return compiled;
}

}  // namespace minipg::planner
