#include "minipg/executor/filter_executor.hpp"

#include "minipg/storage/value.hpp"

#include <stdexcept>
#include <utility>

namespace minipg::executor {

FilterExecutor::FilterExecutor(ExecutorNodePtr child, Config config)
    : config_{std::move(config)}
{
    if (!config_.predicate) {
        throw std::invalid_argument{"FilterExecutor requires a predicate"};
    }
    if (!child) {
        throw std::invalid_argument{"FilterExecutor requires a child executor"};
    }
    add_child(std::move(child));
}

void FilterExecutor::open(ExecutorContext& context)
{
    auto* input = child(0U);
    if (input == nullptr) {
        throw std::logic_error{"FilterExecutor missing child executor"};
    }
    input->open(context);
}

bool FilterExecutor::next(ExecutorContext& context, storage::Row& row)
{
    auto* input = child(0U);
    if (input == nullptr) {
        return false;
    }

    while (input->next(context, row)) {
        if (config_.predicate(row, context)) {
            return true;
        }
    }
    return false;
}

void FilterExecutor::close(ExecutorContext& context)
{
    if (auto* input = child(0U); input != nullptr) {
        input->close(context);
    }
}

}  // namespace minipg::executor
