#include "minipg/executor/nested_loop_join_executor.hpp"

#include "minipg/executor/column_resolver.hpp"
#include "minipg/executor/executor_context.hpp"

#include <stdexcept>
#include <utility>

namespace minipg::executor {

NestedLoopJoinExecutor::NestedLoopJoinExecutor(ExecutorNodePtr outer, ExecutorNodePtr inner, Config config)
    : config_{std::move(config)}
{
    if (!outer || !inner) {
        throw std::invalid_argument{"NestedLoopJoinExecutor requires outer and inner children"};
    }
    if (config_.outer_key.empty() || config_.inner_key.empty()) {
        throw std::invalid_argument{"NestedLoopJoinExecutor requires join keys"};
    }
    add_child(std::move(outer));
    add_child(std::move(inner));
}

void NestedLoopJoinExecutor::open(ExecutorContext& context)
{
    auto* outer = outer_child();
    auto* inner = inner_child();
    if (outer == nullptr || inner == nullptr) {
        throw std::logic_error{"NestedLoopJoinExecutor missing child executor"};
    }

    inner_rows_ = drain(*inner, context);
    outer->open(context);
    outer_valid_ = false;
    inner_position_ = 0U;
}

bool NestedLoopJoinExecutor::next(ExecutorContext& context, storage::Row& row)
{
    auto* outer = outer_child();
    if (outer == nullptr) {
        return false;
    }

    while (true) {
        if (!outer_valid_) {
            outer_row_ = storage::Row{};
            if (!outer->next(context, outer_row_)) {
                return false;
            }
            outer_valid_ = true;
            inner_position_ = 0U;
        }

        const auto* outer_key = resolve_column(outer_row_, config_.outer_key);
        const storage::Value outer_value = outer_key != nullptr ? *outer_key : storage::Value{};

        while (inner_position_ < inner_rows_.size()) {
            const auto& inner_row = inner_rows_[inner_position_++];
            const auto* inner_key = resolve_column(inner_row, config_.inner_key);
            const storage::Value inner_value = inner_key != nullptr ? *inner_key : storage::Value{};
            if (!(outer_value == inner_value)) {
                continue;
            }
            row = outer_row_;
            for (const auto& [column, value] : inner_row) {
                row.set(column, value);
            }
            return true;
        }
        outer_valid_ = false;
    }
}

void NestedLoopJoinExecutor::close(ExecutorContext& context)
{
    if (auto* outer = outer_child(); outer != nullptr) {
        outer->close(context);
    }
    inner_rows_.clear();
    outer_valid_ = false;
}

ExecutorNode* NestedLoopJoinExecutor::outer_child() const noexcept
{
    return child(0U);
}

ExecutorNode* NestedLoopJoinExecutor::inner_child() const noexcept
{
    return child(1U);
}

}  // namespace minipg::executor
