#pragma once

#include "minipg/common/diagnostics.hpp"
#include "minipg/storage/worker_pool.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace minipg::catalog {

[[nodiscard]] std::string row_id_sequence_name(const std::string& table);

// Write-back cache over the sequence document. The cached value is authoritative between
// flushes; a flush is scheduled on the background pool every `flush_after` allocations.
class SequenceManager final {
public:
    struct Config final {
        std::filesystem::path sequences_path{};
        std::size_t flush_after = 10U;
        storage::WorkerPool* background = nullptr;
        DiagnosticSink diagnostics{};
    };

    explicit SequenceManager(Config config);
    ~SequenceManager();

    SequenceManager(const SequenceManager&) = delete;
    SequenceManager& operator=(const SequenceManager&) = delete;
    SequenceManager(SequenceManager&&) = delete;
    SequenceManager& operator=(SequenceManager&&) = delete;

    void register_sequence(const std::string& name, std::int64_t start = 0);

    // Throws SequenceNotFound when the sequence was never registered.
    [[nodiscard]] std::int64_t next_value(const std::string& name, bool flush = false);

    // Synchronously persists every cached value after waiting for scheduled flushes.
    void flush_all();

    [[nodiscard]] std::optional<std::int64_t> persisted_value(const std::string& name) const;
    [[nodiscard]] std::optional<std::int64_t> cached_value(const std::string& name) const;
    [[nodiscard]] bool has_pending_updates() const;

private:
    struct SequenceState final {
        std::int64_t value = 0;
        std::size_t hits = 0U;
        bool dirty = false;
    };

    SequenceState& ensure_state(const std::string& name);
    void schedule_flush(const std::string& name, std::int64_t value);
    void write_values(const std::vector<std::pair<std::string, std::int64_t>>& values);
    void reap_flushes(bool wait);
    void report(Severity severity, std::string message);

    Config config_{};
    mutable std::mutex cache_mutex_{};
    mutable std::mutex document_mutex_{};
    std::unordered_map<std::string, SequenceState> states_{};
    std::vector<std::future<storage::TaskResult>> pending_flushes_{};
};

}  // namespace minipg::catalog
