#include "minipg/executor/values_executor.hpp"

#include "minipg/catalog/catalog_store.hpp"
#include "minipg/common/errors.hpp"

#include <stdexcept>
#include <utility>

namespace minipg::executor {

ValuesExecutor::ValuesExecutor(Config config)
    : config_{std::move(config)}
{
    if (!config_.allocate_row_id) {
        throw std::invalid_argument{"ValuesExecutor requires a row id allocator"};
    }
}

void ValuesExecutor::open(ExecutorContext& context)
{
    (void)context;
    for (const auto& tuple : config_.tuples) {
        if (tuple.size() != config_.columns.size()) {
            throw_engine_error(EngineErrc::MalformedInsert,
                               "Expected " + std::to_string(config_.columns.size()) + " values per record but got "
                                   + std::to_string(tuple.size()));
        }
    }
    position_ = 0U;
}

bool ValuesExecutor::next(ExecutorContext& context, storage::Row& row)
{
    (void)context;
    if (position_ >= config_.tuples.size()) {
        return false;
    }
    const auto& tuple = config_.tuples[position_++];

    storage::Row record;
    record.set(std::string{catalog::kRowIdColumn}, storage::Value{config_.allocate_row_id()});
    for (std::size_t index = 0U; index < tuple.size(); ++index) {
        record.set(config_.columns[index], tuple[index]);
    }
    row = std::move(record);
    return true;
}

void ValuesExecutor::close(ExecutorContext& context)
{
    (void)context;
    position_ = 0U;
}

}  // namespace minipg::executor
