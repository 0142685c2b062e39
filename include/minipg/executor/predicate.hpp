#pragma once

#include "minipg/storage/value.hpp"

#include <string>
#include <string_view>

namespace minipg::executor {

enum class ComparisonOperator {
    Equal,
    NotEqual,
    Less,
    Greater,
    LessEqual,
    GreaterEqual
};

struct ComparisonTerm final {
    std::string column{};
    ComparisonOperator op = ComparisonOperator::Equal;
    storage::Value literal{};
};

// "age >= 21" / "name = 'Ann'". Throws MalformedPredicate when no operator is found.
[[nodiscard]] ComparisonTerm parse_comparison(std::string_view expression);

[[nodiscard]] bool evaluate_comparison(const storage::Row& row, const ComparisonTerm& term);

// Textual evaluation without precedence: the expression is split on " AND " first,
// otherwise on " OR ", otherwise a leading "NOT " negates the rest. Parentheses
// are not recognized: "a = 1 AND b = 2 OR c = 3" reads as a = 1 AND (b = 2 OR c = 3).
[[nodiscard]] bool evaluate_where(const storage::Row& row, std::string_view expression);

}  // namespace minipg::executor
