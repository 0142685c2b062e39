#pragma once

#include "minipg/storage/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minipg::executor {

enum class AggregateFunction : std::uint8_t {
    Count = 0,
    Sum,
    Avg,
    Min,
    Max
};

struct AggregateCall final {
    std::string output_name{};
    AggregateFunction function = AggregateFunction::Count;
    // Empty for "*".
    std::optional<std::string> argument{};
};

// "COUNT(*)", "sum(price)"; empty when the text is not a call to a known aggregate.
[[nodiscard]] std::optional<AggregateCall> parse_aggregate_call(std::string_view text);

[[nodiscard]] std::string_view aggregate_function_name(AggregateFunction function) noexcept;

// Throws std::system_error (value_too_large) when an all-integer SUM leaves the int64 range.
[[nodiscard]] storage::Value evaluate_aggregate(const AggregateCall& call, const std::vector<storage::Row>& rows);

}  // namespace minipg::executor
