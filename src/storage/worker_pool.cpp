#include "minipg/storage/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace minipg::storage {

WorkerPool::WorkerPool(WorkerPoolConfig config)
    : config_{config}
{
    config_.queue_depth = std::max<std::size_t>(1U, config_.queue_depth);
    const auto worker_count = std::max<std::size_t>(1U, config_.worker_threads);
    for (std::size_t index = 0; index < worker_count; ++index) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

std::future<TaskResult> WorkerPool::submit(Task task)
{
    Operation operation{[task = std::move(task)]() -> TaskResult {
        try {
            return task();
        } catch (const std::system_error& error) {
            return TaskResult{error.code(), error.what()};
        } catch (const std::exception& error) {
            return TaskResult{std::make_error_code(std::errc::io_error), error.what()};
        }
    }};

    std::unique_lock lock(queue_mutex_);
    queue_cv_.wait(lock, [this]() { return queue_.size() < config_.queue_depth || !running_; });
    if (!running_) {
        lock.unlock();
        std::promise<TaskResult> promise;
        auto future = promise.get_future();
        promise.set_value(TaskResult{std::make_error_code(std::errc::operation_canceled), "worker pool is shut down"});
        return future;
    }

    auto future = operation.get_future();
    {
        std::scoped_lock inflight_lock(inflight_mutex_);
        ++inflight_operations_;
    }
    queue_.emplace_back(std::move(operation));
    lock.unlock();
    queue_cv_.notify_all();
    return future;
}

void WorkerPool::drain()
{
    std::unique_lock lock(inflight_mutex_);
    inflight_cv_.wait(lock, [this]() { return inflight_operations_ == 0U; });
}

void WorkerPool::shutdown()
{
    {
        std::scoped_lock lock(queue_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool WorkerPool::running() const
{
    std::scoped_lock lock(queue_mutex_);
    return running_;
}

std::size_t WorkerPool::worker_count() const noexcept
{
    return workers_.size();
}

void WorkerPool::worker_loop()
{
    while (true) {
        Operation operation;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return !queue_.empty() || !running_; });
            if (!running_ && queue_.empty()) {
                return;
            }
            operation = std::move(queue_.front());
            queue_.pop_front();
        }
        queue_cv_.notify_all();

        operation();

        {
            std::scoped_lock lock(inflight_mutex_);
            --inflight_operations_;
        }
        inflight_cv_.notify_all();
    }
}

}  // namespace minipg::storage
