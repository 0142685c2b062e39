#include "minipg/executor/executor_node.hpp"

#include "minipg/storage/value.hpp"

#include <stdexcept>

namespace minipg::executor {

void ExecutorNode::add_child(ExecutorNodePtr child)
{
    if (!child) {
        throw std::invalid_argument("executor child must not be null");
    }
    children_.push_back(std::move(child));
}

std::size_t ExecutorNode::child_count() const noexcept
{
    return children_.size();
}

ExecutorNode* ExecutorNode::child(std::size_t index) const noexcept
{
    if (index >= children_.size()) {
        return nullptr;
    }
    return children_[index].get();
}

const std::vector<ExecutorNodePtr>& ExecutorNode::children() const noexcept
{
    return children_;
}

std::vector<storage::Row> drain(ExecutorNode& root, ExecutorContext& context)
{
    std::vector<storage::Row> rows;
    root.open(context);
    storage::Row row;
    while (root.next(context, row)) {
        rows.push_back(std::move(row));
        row = storage::Row{};
    }
    root.close(context);
    return rows;
}

}  // namespace minipg::executor
