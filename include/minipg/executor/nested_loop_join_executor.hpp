#pragma once

#include "minipg/executor/executor_node.hpp"
#include "minipg/storage/value.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace minipg::executor {

// Inner join on key equality. The inner side is materialized once at open; every
// matching (outer, inner) pair yields the outer row with the inner columns merged in.
class NestedLoopJoinExecutor final : public ExecutorNode {
public:
    struct Config final {
        std::string outer_key{};
        std::string inner_key{};
    };

    NestedLoopJoinExecutor(ExecutorNodePtr outer, ExecutorNodePtr inner, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, storage::Row& row) override;
    void close(ExecutorContext& context) override;

private:
    [[nodiscard]] ExecutorNode* outer_child() const noexcept;
    [[nodiscard]] ExecutorNode* inner_child() const noexcept;

    Config config_{};
    std::vector<storage::Row> inner_rows_{};
    storage::Row outer_row_{};
    std::size_t inner_position_ = 0U;
    bool outer_valid_ = false;
};

}  // namespace minipg::executor
