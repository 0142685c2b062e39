#pragma once

#include "minipg/storage/value.hpp"

#include <string_view>

namespace minipg::executor {

// Exact key first; an unqualified name then falls back to the single key ending
// in ".<name>". Returns nullptr when absent or ambiguous.
[[nodiscard]] const storage::Value* resolve_column(const storage::Row& row, std::string_view name) noexcept;

}  // namespace minipg::executor
