#pragma once

#include "minipg/executor/executor_node.hpp"

#include <string>
#include <vector>

namespace minipg::executor {

// "*" passes rows through; "t.*" expands to every "t." key; other names are
// resolved with resolve_column and project as Null when missing.
class ProjectionExecutor final : public ExecutorNode {
public:
    struct Config final {
        std::vector<std::string> columns;
    };

    ProjectionExecutor(ExecutorNodePtr child, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, storage::Row& row) override;
    void close(ExecutorContext& context) override;

private:
    Config config_{};
};

}  // namespace minipg::executor
