#include "minipg/executor/sort_executor.hpp"

#include <stdexcept>
#include <utility>

namespace minipg::executor {

SortExecutor::SortExecutor(ExecutorNodePtr child, Config config)
    : config_{std::move(config)}
{
    if (!child) {
        throw std::invalid_argument{"SortExecutor requires a child executor"};
    }
    if (config_.keys.empty()) {
        throw std::invalid_argument{"SortExecutor requires at least one sort key"};
    }
    add_child(std::move(child));
}

void SortExecutor::open(ExecutorContext& context)
{
    auto* input = child(0U);
    if (input == nullptr) {
        throw std::logic_error{"SortExecutor missing child executor"};
    }
    rows_ = drain(*input, context);
    sort_rows(rows_, config_.keys);
    position_ = 0U;
}

bool SortExecutor::next(ExecutorContext& context, storage::Row& row)
{
    (void)context;
    if (position_ >= rows_.size()) {
        return false;
    }
    row = std::move(rows_[position_++]);
    return true;
}

void SortExecutor::close(ExecutorContext& context)
{
    (void)context;
    rows_.clear();
    position_ = 0U;
}

}  // namespace minipg::executor
