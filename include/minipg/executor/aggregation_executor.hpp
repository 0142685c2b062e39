#pragma once

#include "minipg/executor/aggregate_functions.hpp"
#include "minipg/executor/executor_node.hpp"
#include "minipg/storage/value.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace minipg::executor {

// Groups the whole input before emitting. Without group columns there is exactly one
// group, emitted even when empty. With group columns, groups keep first-seen order over
// every input row, row_filter then drops rows inside each group, and groups left empty
// are not emitted.
class AggregationExecutor final : public ExecutorNode {
public:
    using RowFilter = std::function<bool(const storage::Row&, ExecutorContext&)>;

    struct Config final {
        std::vector<std::string> group_columns{};
        // Selected non-aggregate columns, taken from the group's first row.
        std::vector<std::string> passthrough_columns{};
        std::vector<AggregateCall> aggregates{};
        RowFilter row_filter{};
    };

    AggregationExecutor(ExecutorNodePtr child, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, storage::Row& row) override;
    void close(ExecutorContext& context) override;

private:
    struct GroupEntry final {
        std::vector<storage::Row> rows{};
    };

    void build_groups(ExecutorContext& context);
    [[nodiscard]] storage::Row project_group(const GroupEntry& group) const;

    Config config_{};
    std::vector<GroupEntry> groups_{};
    std::unordered_map<std::string, std::size_t> group_index_{};
    std::size_t emission_index_ = 0U;
    bool built_ = false;
};

}  // namespace minipg::executor
