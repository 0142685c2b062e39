#include "minipg/executor/column_resolver.hpp"

namespace minipg::executor {

const storage::Value* resolve_column(const storage::Row& row, std::string_view name) noexcept
{
    if (const auto* value = row.find(name); value != nullptr) {
        return value;
    }
    if (name.find('.') != std::string_view::npos) {
        return nullptr;
    }

    const storage::Value* match = nullptr;
    for (const auto& [key, value] : row) {
        const std::string_view candidate = key;
        if (candidate.size() > name.size() && candidate.ends_with(name)
            && candidate[candidate.size() - name.size() - 1U] == '.') {
            if (match != nullptr) {
                return nullptr;
            }
            match = &value;
        }
    }
    return match;
}

}  // namespace minipg::executor
