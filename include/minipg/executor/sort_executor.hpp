#pragma once

#include "minipg/executor/executor_node.hpp"
#include "minipg/executor/sort_key.hpp"
#include "minipg/storage/value.hpp"

#include <cstddef>
#include <vector>

namespace minipg::executor {

class SortExecutor final : public ExecutorNode {
public:
    struct Config final {
        std::vector<SortKey> keys{};
    };

    SortExecutor(ExecutorNodePtr child, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, storage::Row& row) override;
    void close(ExecutorContext& context) override;

private:
    Config config_{};
    std::vector<storage::Row> rows_{};
    std::size_t position_ = 0U;
};

}  // namespace minipg::executor
