#include "minipg/executor/aggregate_functions.hpp"

#include "minipg/executor/column_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <system_error>

namespace minipg::executor {

namespace {

std::string trim_copy(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1U);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1U);
    }
    return std::string{text};
}

std::optional<AggregateFunction> function_from_name(std::string name)
{
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    if (name == "COUNT") {
        return AggregateFunction::Count;
    }
    if (name == "SUM") {
        return AggregateFunction::Sum;
    }
    if (name == "AVG") {
        return AggregateFunction::Avg;
    }
    if (name == "MIN") {
        return AggregateFunction::Min;
    }
    if (name == "MAX") {
        return AggregateFunction::Max;
    }
    return std::nullopt;
}

[[nodiscard]] std::int64_t checked_add(std::int64_t lhs, std::int64_t rhs)
{
    if ((rhs > 0 && lhs > std::numeric_limits<std::int64_t>::max() - rhs)
        || (rhs < 0 && lhs < std::numeric_limits<std::int64_t>::min() - rhs)) {
        throw std::system_error(std::make_error_code(std::errc::value_too_large), "SUM overflows a 64-bit integer");
    }
    return lhs + rhs;
}

// Non-null inputs of the call: one column's values, or every value of every row for "*".
std::vector<storage::Value> collect_inputs(const AggregateCall& call, const std::vector<storage::Row>& rows)
{
    std::vector<storage::Value> values;
    for (const auto& row : rows) {
        if (call.argument) {
            const auto* value = resolve_column(row, *call.argument);
            if (value != nullptr && !value->is_null()) {
                values.push_back(*value);
            }
            continue;
        }
        for (const auto& [column, value] : row) {
            (void)column;
            if (!value.is_null()) {
                values.push_back(value);
            }
        }
    }
    return values;
}

}  // namespace

std::optional<AggregateCall> parse_aggregate_call(std::string_view text)
{
    const auto open = text.find('(');
    const auto close = text.rfind(')');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
        return std::nullopt;
    }
    if (!trim_copy(text.substr(close + 1U)).empty()) {
        return std::nullopt;
    }
    const auto function = function_from_name(trim_copy(text.substr(0U, open)));
    if (!function) {
        return std::nullopt;
    }

    AggregateCall call{};
    call.output_name = std::string{text};
    call.function = *function;
    auto argument = trim_copy(text.substr(open + 1U, close - open - 1U));
    if (argument.empty()) {
        return std::nullopt;
    }
    if (argument != "*") {
        call.argument = std::move(argument);
    }
    return call;
}

std::string_view aggregate_function_name(AggregateFunction function) noexcept
{
    switch (function) {
    case AggregateFunction::Count:
        return "COUNT";
    case AggregateFunction::Sum:
        return "SUM";
    case AggregateFunction::Avg:
        return "AVG";
    case AggregateFunction::Min:
        return "MIN";
    case AggregateFunction::Max:
        return "MAX";
    }
    return "UNKNOWN";
}

storage::Value evaluate_aggregate(const AggregateCall& call, const std::vector<storage::Row>& rows)
{
    if (call.function == AggregateFunction::Count && !call.argument) {
        return storage::Value{static_cast<std::int64_t>(rows.size())};
    }

    const auto inputs = collect_inputs(call, rows);
    switch (call.function) {
    case AggregateFunction::Count:
        return storage::Value{static_cast<std::int64_t>(inputs.size())};

    case AggregateFunction::Sum:
    case AggregateFunction::Avg: {
        double float_sum = 0.0;
        std::size_t numeric_count = 0U;
        bool saw_float = false;
        for (const auto& value : inputs) {
            if (!value.is_numeric()) {
                continue;
            }
            ++numeric_count;
            float_sum += value.to_double();
            saw_float = saw_float || value.kind() == storage::ValueKind::Float;
        }
        if (call.function == AggregateFunction::Avg) {
            if (numeric_count == 0U) {
                return storage::Value{};
            }
            return storage::Value{float_sum / static_cast<double>(numeric_count)};
        }
        if (saw_float) {
            return storage::Value{float_sum};
        }

        std::int64_t integer_sum = 0;
        for (const auto& value : inputs) {
            if (value.kind() == storage::ValueKind::Int) {
                integer_sum = checked_add(integer_sum, value.as_int());
            } else if (value.kind() == storage::ValueKind::Bool) {
                integer_sum = checked_add(integer_sum, value.as_bool() ? 1 : 0);
            }
        }
        return storage::Value{integer_sum};
    }

    case AggregateFunction::Min:
    case AggregateFunction::Max: {
        if (inputs.empty()) {
            return storage::Value{};
        }
        const bool want_min = call.function == AggregateFunction::Min;
        const auto* best = &inputs.front();
        for (const auto& value : inputs) {
            const auto order = storage::compare_values(value, *best);
            if ((want_min && order < 0) || (!want_min && order > 0)) {
                best = &value;
            }
        }
        return *best;
    }
    }
    return storage::Value{};
}

}  // namespace minipg::executor
