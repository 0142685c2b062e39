#include "minipg/executor/insert_executor.hpp"

#include "minipg/executor/executor_context.hpp"
#include "minipg/storage/table_store.hpp"

#include <stdexcept>
#include <utility>

namespace minipg::executor {

InsertExecutor::InsertExecutor(ExecutorNodePtr child, Config config)
    : config_{std::move(config)}
{
    if (!child) {
        throw std::invalid_argument{"InsertExecutor requires a child executor"};
    }
    if (config_.target == nullptr) {
        throw std::invalid_argument{"InsertExecutor requires a storage target"};
    }
    add_child(std::move(child));
}

void InsertExecutor::open(ExecutorContext& context)
{
    auto* input = child(0U);
    if (input == nullptr) {
        throw std::logic_error{"InsertExecutor child is null"};
    }
    input->open(context);
    child_open_ = true;
    drained_ = false;
    inserted_rows_ = 0U;
}

bool InsertExecutor::next(ExecutorContext& context, storage::Row& row)
{
    (void)row;
    if (!drained_) {
        drain_child(context);
    }
    return false;
}

void InsertExecutor::close(ExecutorContext& context)
{
    if (child_open_) {
        if (!drained_) {
            drain_child(context);
        }
        child(0U)->close(context);
        child_open_ = false;
    }
}

std::size_t InsertExecutor::inserted_rows() const noexcept
{
    return inserted_rows_;
}

void InsertExecutor::drain_child(ExecutorContext& context)
{
    drained_ = true;
    auto* input = child(0U);
    storage::Row row;
    while (input->next(context, row)) {
        if (const auto ec = config_.target->insert_row(row, context); ec) {
            throw std::system_error{ec, "failed to insert row"};
        }
        ++inserted_rows_;
        row = storage::Row{};
    }
    if (const auto ec = config_.target->flush(context); ec) {
        throw std::system_error{ec, "failed to flush inserted rows"};
    }
}

TableInsertTarget::TableInsertTarget(std::string table)
    : table_{std::move(table)}
{
}

std::error_code TableInsertTarget::insert_row(const storage::Row& row, ExecutorContext& context)
{
    (void)context;
    pending_.push_back(row);
    return {};
}

std::error_code TableInsertTarget::flush(ExecutorContext& context)
{
    if (pending_.empty()) {
        return {};
    }
    context.tables().append_rows(table_, pending_);
    pending_.clear();
    return {};
}

}  // namespace minipg::executor
