#pragma once

#include "minipg/executor/executor_node.hpp"

#include <cstdint>

namespace minipg::executor {

class LimitExecutor final : public ExecutorNode {
public:
    struct Config final {
        std::int64_t limit = 0;
    };

    LimitExecutor(ExecutorNodePtr child, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, storage::Row& row) override;
    void close(ExecutorContext& context) override;

private:
    Config config_{};
    std::int64_t emitted_ = 0;
};

}  // namespace minipg::executor
