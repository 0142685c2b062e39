#pragma once

#include "minipg/catalog/catalog_store.hpp"
#include "minipg/common/diagnostics.hpp"
#include "minipg/storage/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace minipg::planner {

enum class JoinKind : std::uint8_t {
    Join = 0,
    Inner,
    Left,
    Right,
    Full
};

// right_table is always the joined table; columns are stored without their qualifier.
struct JoinSpec final {
    JoinKind kind = JoinKind::Join;
    std::string left_table{};
    std::string left_column{};
    std::string right_table{};
    std::string right_column{};

    friend bool operator==(const JoinSpec&, const JoinSpec&) = default;
};

struct SelectPlan final {
    std::vector<std::string> select{};
    std::string from{};
    std::vector<std::pair<std::string, JoinSpec>> joins{};
    std::optional<std::string> where{};
    std::optional<std::vector<std::string>> group_by{};
    std::optional<std::vector<std::string>> order_by{};
    std::optional<std::int64_t> limit{};

    [[nodiscard]] const JoinSpec* find_join(std::string_view table) const noexcept;
};

using ValueTuple = std::vector<storage::Value>;

struct InsertPlan final {
    std::string table{};
    // Empty means every declared column except the row id.
    std::vector<std::string> columns{};
    std::vector<ValueTuple> values{};
};

struct CreateTablePlan final {
    std::string table{};
    std::vector<catalog::ColumnDefinition> columns{};
};

using Plan = std::variant<SelectPlan, InsertPlan, CreateTablePlan>;

struct CompiledPlan final {
    Plan plan{};
    std::vector<Diagnostic> diagnostics{};
};

[[nodiscard]] std::string_view join_kind_to_string(JoinKind kind) noexcept;

}  // namespace minipg::planner
