#pragma once

#include "minipg/storage/value.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace minipg::executor {

struct SortKey final {
    std::string column{};
    bool descending = false;
};

// "age DESC" -> {age, true}; a missing direction means ascending.
[[nodiscard]] SortKey parse_sort_key(std::string_view text);

// Canonical "<column> <ASC|DESC>" form used to compare against a table's declared sort.
[[nodiscard]] std::string sort_key_to_string(const SortKey& key);

// Stable; keys compare lexicographically with compare_values and DESC keys reversed.
// Columns are looked up with resolve_column.
void sort_rows(std::vector<storage::Row>& rows, const std::vector<SortKey>& keys);

}  // namespace minipg::executor
