/**
 * @file thread_pool.hpp
 * @brief Fixed-size std::jthread worker pool used to bound gather fan-out.
 */

#pragma once

#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace fleet_usage {

/**
 * @brief Runs submitted callables on a fixed number of worker threads.
 *
 * At most thread_count() tasks execute at once. Tasks still queued when the
 * pool is destroyed are run to completion before the workers join, so every
 * future handed out by submit() eventually becomes ready.
 */
class ThreadPool {
public:
    /// @param num_threads Worker count; 0 picks the hardware concurrency.
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a callable; exceptions it throws surface through the future.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    // std::function needs a copyable target, so the task lives behind a shared_ptr.
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(func));
    auto future = task->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push([task] { (*task)(); });
    }
    queue_cv_.notify_one();
    return future;
}

}  // namespace fleet_usage
