#pragma once

#include "minipg/executor/executor_node.hpp"

#include <functional>

namespace minipg::executor {

class FilterExecutor final : public ExecutorNode {
public:
    using Predicate = std::function<bool(const storage::Row&, ExecutorContext&)>;

    struct Config final {
        Predicate predicate;
    };

    FilterExecutor(ExecutorNodePtr child, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, storage::Row& row) override;
    void close(ExecutorContext& context) override;

private:
    Config config_{};
};

}  // namespace minipg::executor
