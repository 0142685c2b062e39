#pragma once

#include "minipg/common/diagnostics.hpp"
#include "minipg/engine/query_result.hpp"
#include "minipg/storage/table_store.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>

namespace minipg::engine {

struct EngineConfig final {
    std::filesystem::path data_dir{"./data"};
    std::size_t seq_cache_flush_after = 10U;
    std::size_t max_stats_workers = 4U;
    std::size_t max_bg_workers = 4U;
    std::size_t bg_queue_depth = 128U;
    storage::StorageFormat storage_format = storage::StorageFormat::JsonLines;
    DiagnosticSink diagnostic_sink{};
    std::function<void(const QueryResult&)> query_logger{};
};

// On-disk layout below data_dir.
struct EnginePaths final {
    std::filesystem::path catalog_path{};
    std::filesystem::path sequences_path{};
    std::filesystem::path stats_root{};
    std::filesystem::path table_root{};
};

[[nodiscard]] EnginePaths make_engine_paths(const std::filesystem::path& data_dir);

// Throws std::invalid_argument for an empty data directory or zero-sized pools and thresholds.
void validate_engine_config(const EngineConfig& config);

}  // namespace minipg::engine
