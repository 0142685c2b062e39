#include "minipg/executor/projection_executor.hpp"

#include "minipg/executor/column_resolver.hpp"
#include "minipg/storage/value.hpp"

#include <stdexcept>
#include <utility>

namespace minipg::executor {

ProjectionExecutor::ProjectionExecutor(ExecutorNodePtr child, Config config)
    : config_{std::move(config)}
{
    if (!child) {
        throw std::invalid_argument{"ProjectionExecutor requires a child executor"};
    }
    if (config_.columns.empty()) {
        throw std::invalid_argument{"ProjectionExecutor requires at least one column"};
    }
    add_child(std::move(child));
}

void ProjectionExecutor::open(ExecutorContext& context)
{
    auto* input = child(0U);
    if (input == nullptr) {
        throw std::logic_error{"ProjectionExecutor missing child executor"};
    }
    input->open(context);
}

bool ProjectionExecutor::next(ExecutorContext& context, storage::Row& row)
{
    auto* input = child(0U);
    if (input == nullptr) {
        return false;
    }

    storage::Row source;
    if (!input->next(context, source)) {
        return false;
    }

    storage::Row projected;
    for (const auto& column : config_.columns) {
        if (column == "*") {
            for (const auto& [key, value] : source) {
                projected.set(key, value);
            }
            continue;
        }
        if (column.size() > 2U && column.ends_with(".*")) {
            const auto prefix = column.substr(0U, column.size() - 1U);
            for (const auto& [key, value] : source) {
                if (key.starts_with(prefix)) {
                    projected.set(key, value);
                }
            }
            continue;
        }
        const auto* value = resolve_column(source, column);
        projected.set(column, value != nullptr ? *value : storage::Value{});
    }

    row = std::move(projected);
    return true;
}

void ProjectionExecutor::close(ExecutorContext& context)
{
    if (auto* input = child(0U); input != nullptr) {
        input->close(context);
    }
}

}  // namespace minipg::executor
