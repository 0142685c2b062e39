#include "minipg/engine/engine_config.hpp"

#include <stdexcept>

namespace minipg::engine {

EnginePaths make_engine_paths(const std::filesystem::path& data_dir)
{
    EnginePaths paths{};
    paths.catalog_path = data_dir / "global" / "mpg_tables.json";
    paths.sequences_path = data_dir / "global" / "mpg_sequences.json";
    paths.stats_root = data_dir / "mpg_stat";
    paths.table_root = data_dir / "json_db";
    return paths;
}

void validate_engine_config(const EngineConfig& config)
{
    if (config.data_dir.empty()) {
        throw std::invalid_argument{"data_dir must not be empty"};
    }
    if (config.seq_cache_flush_after == 0U) {
        throw std::invalid_argument{"seq_cache_flush_after must be greater than zero"};
    }
    if (config.max_stats_workers == 0U) {
        throw std::invalid_argument{"max_stats_workers must be greater than zero"};
    }
    if (config.max_bg_workers == 0U) {
        throw std::invalid_argument{"max_bg_workers must be greater than zero"};
    }
    if (config.bg_queue_depth == 0U) {
        throw std::invalid_argument{"bg_queue_depth must be greater than zero"};
    }
}

}  // namespace minipg::engine
