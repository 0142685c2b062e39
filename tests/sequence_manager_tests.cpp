#include "minipg/catalog/sequence_manager.hpp"
#include "minipg/common/errors.hpp"
#include "minipg/storage/worker_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using minipg::catalog::SequenceManager;
using minipg::storage::WorkerPool;
using minipg::storage::WorkerPoolConfig;

namespace {

std::filesystem::path make_unique_sequence_root()
{
    const auto base = std::filesystem::temp_directory_path();
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("minipg_sequences_" + std::to_string(stamp));
}

struct TempSequenceDirectory final {
    TempSequenceDirectory()
        : path{make_unique_sequence_root()}
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    ~TempSequenceDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    [[nodiscard]] std::filesystem::path document() const
    {
        return path / "global" / "mpg_sequences.json";
    }

    std::filesystem::path path;
};

}  // namespace

TEST_CASE("Sequence values are cached until the flush threshold", "[sequence]")
{
    TempSequenceDirectory temp_dir;
    SequenceManager manager{SequenceManager::Config{temp_dir.document(), 3U, nullptr, {}}};
    manager.register_sequence("users_id_seq");

    CHECK(manager.next_value("users_id_seq") == 1);
    CHECK(manager.next_value("users_id_seq") == 2);
    CHECK(manager.persisted_value("users_id_seq") == 0);
    CHECK(manager.has_pending_updates());

    CHECK(manager.next_value("users_id_seq") == 3);
    CHECK(manager.persisted_value("users_id_seq") == 3);
    CHECK_FALSE(manager.has_pending_updates());
    CHECK(manager.cached_value("users_id_seq") == 3);
}

TEST_CASE("An explicit flush request persists immediately", "[sequence]")
{
    TempSequenceDirectory temp_dir;
    SequenceManager manager{SequenceManager::Config{temp_dir.document(), 10U, nullptr, {}}};
    manager.register_sequence("orders_id_seq", 41);

    CHECK(manager.next_value("orders_id_seq", true) == 42);
    CHECK(manager.persisted_value("orders_id_seq") == 42);
}

TEST_CASE("Unknown sequences are reported", "[sequence]")
{
    TempSequenceDirectory temp_dir;
    SequenceManager manager{SequenceManager::Config{temp_dir.document(), 10U, nullptr, {}}};

    try {
        (void)manager.next_value("ghost_id_seq");
        FAIL("expected SequenceNotFound");
    } catch (const std::system_error& error) {
        CHECK(error.code() == minipg::EngineErrc::SequenceNotFound);
    }
}

TEST_CASE("Registering an existing sequence keeps its persisted value", "[sequence]")
{
    TempSequenceDirectory temp_dir;
    SequenceManager manager{SequenceManager::Config{temp_dir.document(), 1U, nullptr, {}}};
    manager.register_sequence("users_id_seq");
    (void)manager.next_value("users_id_seq");
    (void)manager.next_value("users_id_seq");

    manager.register_sequence("users_id_seq");
    CHECK(manager.persisted_value("users_id_seq") == 2);
    CHECK(manager.next_value("users_id_seq") == 3);
}

TEST_CASE("flush_all writes cached values and survives a restart", "[sequence]")
{
    TempSequenceDirectory temp_dir;
    {
        WorkerPool background{WorkerPoolConfig{.worker_threads = 2U, .queue_depth = 8U}};
        SequenceManager manager{SequenceManager::Config{temp_dir.document(), 4U, &background, {}}};
        manager.register_sequence("users_id_seq");
        for (int index = 0; index < 7; ++index) {
            (void)manager.next_value("users_id_seq");
        }
        manager.flush_all();
        CHECK(manager.persisted_value("users_id_seq") == 7);
        background.shutdown();
    }

    SequenceManager reopened{SequenceManager::Config{temp_dir.document(), 4U, nullptr, {}}};
    CHECK(reopened.next_value("users_id_seq") == 8);
}

TEST_CASE("Concurrent allocations never hand out the same value", "[sequence]")
{
    TempSequenceDirectory temp_dir;
    WorkerPool background{WorkerPoolConfig{.worker_threads = 2U, .queue_depth = 16U}};
    SequenceManager manager{SequenceManager::Config{temp_dir.document(), 5U, &background, {}}};
    manager.register_sequence("events_id_seq");

    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;
    std::vector<std::vector<std::int64_t>> allocated(kThreads);
    std::vector<std::thread> threads;
    for (int thread = 0; thread < kThreads; ++thread) {
        threads.emplace_back([&manager, &allocated, thread]() {
            for (int index = 0; index < kPerThread; ++index) {
                allocated[thread].push_back(manager.next_value("events_id_seq"));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::vector<bool> seen(kThreads * kPerThread + 1, false);
    for (const auto& values : allocated) {
        for (const auto value : values) {
            REQUIRE(value >= 1);
            REQUIRE(value <= kThreads * kPerThread);
            CHECK_FALSE(seen[static_cast<std::size_t>(value)]);
            seen[static_cast<std::size_t>(value)] = true;
        }
    }

    manager.flush_all();
    CHECK(manager.persisted_value("events_id_seq") == kThreads * kPerThread);
    background.shutdown();
}
