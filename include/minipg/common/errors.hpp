#pragma once

#include <string>
#include <system_error>

namespace minipg {

enum class EngineErrc {
    Success = 0,
    UnsupportedStatement,
    TableNotFound,
    ColumnNotFound,
    TableAlreadyExists,
    SequenceNotFound,
    AggregateRequiresGroupBy,
    AppendOnlyViolation,
    MalformedCreateTable,
    MalformedPredicate,
    MalformedInsert,
    PerTableStatsFailure,
    StatsNotFound,
    StorageFailure
};

const std::error_category& engine_error_category() noexcept;
std::error_code make_error_code(EngineErrc value) noexcept;

// Raised by the plan compiler when a statement cannot be turned into a plan.
class PlanError final : public std::system_error {
public:
    PlanError(EngineErrc code, const std::string& what);
};

[[noreturn]] void throw_engine_error(EngineErrc code, const std::string& what);

// what() without the ": <category message>" suffix std::system_error appends.
[[nodiscard]] std::string error_message(const std::system_error& error);

}  // namespace minipg

namespace std {

template <>
struct is_error_code_enum<minipg::EngineErrc> : true_type {
};

}  // namespace std
