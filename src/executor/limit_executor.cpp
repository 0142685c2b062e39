#include "minipg/executor/limit_executor.hpp"

#include <stdexcept>
#include <utility>

namespace minipg::executor {

LimitExecutor::LimitExecutor(ExecutorNodePtr child, Config config)
    : config_{std::move(config)}
{
    if (!child) {
        throw std::invalid_argument{"LimitExecutor requires a child executor"};
    }
    if (config_.limit < 0) {
        throw std::invalid_argument{"LimitExecutor requires a non-negative limit"};
    }
    add_child(std::move(child));
}

void LimitExecutor::open(ExecutorContext& context)
{
    auto* input = child(0U);
    if (input == nullptr) {
        throw std::logic_error{"LimitExecutor missing child executor"};
    }
    emitted_ = 0;
    input->open(context);
}

bool LimitExecutor::next(ExecutorContext& context, storage::Row& row)
{
    if (emitted_ >= config_.limit) {
        return false;
    }
    auto* input = child(0U);
    if (input == nullptr || !input->next(context, row)) {
        return false;
    }
    ++emitted_;
    return true;
}

void LimitExecutor::close(ExecutorContext& context)
{
    if (auto* input = child(0U); input != nullptr) {
        input->close(context);
    }
}

}  // namespace minipg::executor
