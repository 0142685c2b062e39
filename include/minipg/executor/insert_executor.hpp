#pragma once

#include "minipg/executor/executor_node.hpp"
#include "minipg/storage/value.hpp"

#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

namespace minipg::executor {

// Drains its child into a Target; never emits rows itself.
class InsertExecutor final : public ExecutorNode {
public:
    class Target {
    public:
        virtual ~Target() = default;

        virtual std::error_code insert_row(const storage::Row& row, ExecutorContext& context) = 0;
        virtual std::error_code flush(ExecutorContext& context)
        {
            (void)context;
            return {};
        }
    };

    struct Config final {
        Target* target = nullptr;
    };

    InsertExecutor(ExecutorNodePtr child, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, storage::Row& row) override;
    void close(ExecutorContext& context) override;

    [[nodiscard]] std::size_t inserted_rows() const noexcept;

private:
    void drain_child(ExecutorContext& context);

    Config config_{};
    std::size_t inserted_rows_ = 0U;
    bool child_open_ = false;
    bool drained_ = false;
};

// Buffers rows and appends them to one table in a single write on flush.
class TableInsertTarget final : public InsertExecutor::Target {
public:
    explicit TableInsertTarget(std::string table);

    std::error_code insert_row(const storage::Row& row, ExecutorContext& context) override;
    std::error_code flush(ExecutorContext& context) override;

private:
    std::string table_{};
    std::vector<storage::Row> pending_{};
};

}  // namespace minipg::executor
