#pragma once

#include "minipg/executor/executor_node.hpp"
#include "minipg/planner/plan.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace minipg::executor {

// Emits one row per VALUES tuple: the allocated row id first, then the named columns.
class ValuesExecutor final : public ExecutorNode {
public:
    using RowIdAllocator = std::function<std::int64_t()>;

    struct Config final {
        std::vector<std::string> columns{};
        std::vector<planner::ValueTuple> tuples{};
        RowIdAllocator allocate_row_id{};
    };

    explicit ValuesExecutor(Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, storage::Row& row) override;
    void close(ExecutorContext& context) override;

private:
    Config config_{};
    std::size_t position_ = 0U;
};

}  // namespace minipg::executor
