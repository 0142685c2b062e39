#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace minipg::storage {

struct TaskResult final {
    std::error_code status{};
    std::string message{};
};

struct WorkerPoolConfig final {
    std::size_t worker_threads = 4U;
    std::size_t queue_depth = 128U;
};

// Bounded task queue drained by a fixed set of threads.
class WorkerPool final {
public:
    using Task = std::function<TaskResult()>;

    explicit WorkerPool(WorkerPoolConfig config = {});
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    // Blocks while the queue is full. After shutdown the returned future holds operation_canceled.
    [[nodiscard]] std::future<TaskResult> submit(Task task);

    // Waits until the queue is empty and no task is running.
    void drain();

    // Stops accepting work, runs what is already queued, then joins the workers.
    void shutdown();

    [[nodiscard]] bool running() const;
    [[nodiscard]] std::size_t worker_count() const noexcept;

private:
    using Operation = std::packaged_task<TaskResult()>;

    void worker_loop();

    WorkerPoolConfig config_{};
    std::vector<std::thread> workers_{};
    std::deque<Operation> queue_{};
    mutable std::mutex queue_mutex_{};
    std::condition_variable queue_cv_{};
    bool running_ = true;

    std::mutex inflight_mutex_{};
    std::condition_variable inflight_cv_{};
    std::size_t inflight_operations_ = 0U;
};

}  // namespace minipg::storage
