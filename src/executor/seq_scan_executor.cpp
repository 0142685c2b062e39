#include "minipg/executor/seq_scan_executor.hpp"

#include "minipg/executor/executor_context.hpp"

#include <stdexcept>
#include <utility>

namespace minipg::executor {

SequentialScanExecutor::SequentialScanExecutor(Config config)
    : config_{std::move(config)}
{
    if (config_.table.empty()) {
        throw std::invalid_argument{"SequentialScanExecutor requires a table"};
    }
}

void SequentialScanExecutor::open(ExecutorContext& context)
{
    cursor_ = context.tables().create_table_scan(config_.table);
    sorted_rows_.clear();
    sorted_position_ = 0U;
    sorted_ = !config_.sort_keys.empty();

    if (sorted_) {
        storage::Row row;
        while (cursor_->next(row)) {
            sorted_rows_.push_back(std::move(row));
            row = storage::Row{};
        }
        cursor_.reset();
        sort_rows(sorted_rows_, config_.sort_keys);
    }
}

bool SequentialScanExecutor::next(ExecutorContext& context, storage::Row& row)
{
    (void)context;
    if (sorted_) {
        if (sorted_position_ >= sorted_rows_.size()) {
            return false;
        }
        row = apply_prefix(std::move(sorted_rows_[sorted_position_++]));
        return true;
    }

    if (!cursor_) {
        return false;
    }
    storage::Row scanned;
    if (!cursor_->next(scanned)) {
        return false;
    }
    row = apply_prefix(std::move(scanned));
    return true;
}

void SequentialScanExecutor::close(ExecutorContext& context)
{
    (void)context;
    cursor_.reset();
    sorted_rows_.clear();
    sorted_position_ = 0U;
}

storage::Row SequentialScanExecutor::apply_prefix(storage::Row row) const
{
    if (!config_.column_prefix) {
        return row;
    }
    storage::Row prefixed;
    for (const auto& [column, value] : row) {
        prefixed.set(*config_.column_prefix + "." + column, value);
    }
    return prefixed;
}

}  // namespace minipg::executor
