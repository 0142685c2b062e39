#pragma once

#include "minipg/executor/executor_node.hpp"
#include "minipg/executor/sort_key.hpp"
#include "minipg/storage/table_store.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace minipg::executor {

// Streams a table in file order, or loads and sorts it when sort keys are given.
// With a column prefix every emitted key becomes "<prefix>.<column>".
class SequentialScanExecutor final : public ExecutorNode {
public:
    struct Config final {
        std::string table{};
        std::optional<std::string> column_prefix{};
        std::vector<SortKey> sort_keys{};
    };

    explicit SequentialScanExecutor(Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, storage::Row& row) override;
    void close(ExecutorContext& context) override;

private:
    [[nodiscard]] storage::Row apply_prefix(storage::Row row) const;

    Config config_{};
    std::unique_ptr<storage::TableScanCursor> cursor_{};
    std::vector<storage::Row> sorted_rows_{};
    std::size_t sorted_position_ = 0U;
    bool sorted_ = false;
};

}  // namespace minipg::executor
