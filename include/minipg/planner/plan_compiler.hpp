#pragma once

#include "minipg/parser/token.hpp"
#include "minipg/planner/plan.hpp"

#include <string_view>
#include <vector>

namespace minipg::planner {

// Single left-to-right pass over the token stream. Tokens the state machine has
// no use for are recorded as Info diagnostics and skipped.
[[nodiscard]] SelectPlan compile_select(const parser::TokenStream& stream, std::vector<Diagnostic>& diagnostics);

[[nodiscard]] InsertPlan compile_insert(const parser::TokenStream& stream, std::vector<Diagnostic>& diagnostics);

// Works on the statement text rather than the token stream.
[[nodiscard]] CreateTablePlan compile_create_table(std::string_view statement);

// "(1, 'a'), ('2'::int, '{\"x\"}'::text[])" -> one tuple per parenthesized group.
[[nodiscard]] std::vector<ValueTuple> values_to_records(std::string_view values);

// Tokenizes and dispatches on the command kind. Throws PlanError.
[[nodiscard]] CompiledPlan compile_statement(std::string_view statement);

}  // namespace minipg::planner
