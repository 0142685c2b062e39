#include "minipg/executor/sort_key.hpp"

#include "minipg/executor/column_resolver.hpp"

#include <algorithm>
#include <cctype>

namespace minipg::executor {

namespace {

std::string uppercase_copy(std::string_view text)
{
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return result;
}

const storage::Value& lookup(const storage::Row& row, const std::string& column)
{
    static const storage::Value null_value{};
    const auto* value = resolve_column(row, column);
    return value != nullptr ? *value : null_value;
}

}  // namespace

SortKey parse_sort_key(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1U);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1U);
    }

    SortKey key{};
    const auto space = text.find_last_of(" \t");
    if (space != std::string_view::npos) {
        const auto direction = uppercase_copy(text.substr(space + 1U));
        if (direction == "ASC" || direction == "DESC") {
            key.descending = direction == "DESC";
            text = text.substr(0U, space);
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
                text.remove_suffix(1U);
            }
        }
    }
    key.column = std::string{text};
    return key;
}

std::string sort_key_to_string(const SortKey& key)
{
    return key.column + (key.descending ? " DESC" : " ASC");
}

void sort_rows(std::vector<storage::Row>& rows, const std::vector<SortKey>& keys)
{
    if (keys.empty()) {
        return;
    }
    std::stable_sort(rows.begin(), rows.end(), [&keys](const storage::Row& lhs, const storage::Row& rhs) {
        for (const auto& key : keys) {
            auto order = storage::compare_values(lookup(lhs, key.column), lookup(rhs, key.column));
            if (key.descending) {
                order = -order;
            }
            if (order != 0) {
                return order < 0;
            }
        }
        return false;
    });
}

}  // namespace minipg::executor
