#pragma once

#include "minipg/catalog/catalog_store.hpp"
#include "minipg/catalog/sequence_manager.hpp"
#include "minipg/engine/engine_config.hpp"
#include "minipg/engine/query_result.hpp"
#include "minipg/planner/plan.hpp"
#include "minipg/planner/statistics_manager.hpp"
#include "minipg/storage/table_store.hpp"
#include "minipg/storage/worker_pool.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace minipg::engine {

// Everything one open data directory needs. Owned by the caller; closing drains the
// background pool and writes every cached sequence value.
class EngineState final {
public:
    explicit EngineState(EngineConfig config);
    ~EngineState();

    EngineState(const EngineState&) = delete;
    EngineState& operator=(const EngineState&) = delete;
    EngineState(EngineState&&) = delete;
    EngineState& operator=(EngineState&&) = delete;

    [[nodiscard]] const EngineConfig& config() const noexcept;
    [[nodiscard]] const EnginePaths& paths() const noexcept;

    [[nodiscard]] catalog::CatalogStore& catalog() noexcept;
    [[nodiscard]] catalog::SequenceManager& sequences() noexcept;
    [[nodiscard]] planner::StatisticsManager& statistics() noexcept;
    [[nodiscard]] storage::TableStore& tables() noexcept;

    void close();
    [[nodiscard]] bool closed() const noexcept;

    [[nodiscard]] std::uint64_t next_correlation_id() noexcept;

private:
    EngineConfig config_{};
    EnginePaths paths_{};
    std::unique_ptr<storage::WorkerPool> background_{};
    std::unique_ptr<storage::TableStore> tables_{};
    std::unique_ptr<catalog::CatalogStore> catalog_{};
    std::unique_ptr<catalog::SequenceManager> sequences_{};
    std::unique_ptr<planner::StatisticsManager> statistics_{};
    std::mutex close_mutex_{};
    std::atomic<bool> closed_{false};
    std::atomic<std::uint64_t> correlation_counter_{1U};
};

[[nodiscard]] std::unique_ptr<EngineState> open_engine(EngineConfig config);

// Idempotent.
void close_engine(EngineState& state);

// Never throws for statement errors; they come back as "Error: <message>".
[[nodiscard]] QueryResult run_query(EngineState& state, std::string_view statement);

// Throws StatsNotFound when statistics were never computed for the table.
[[nodiscard]] planner::TableStatistics get_table_stats(EngineState& state, const std::string& table);

[[nodiscard]] planner::StatsRefreshReport update_all_table_stats(EngineState& state);

}  // namespace minipg::engine
