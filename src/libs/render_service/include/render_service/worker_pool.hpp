#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace render_service {

// Fixed-size FIFO thread pool. Jobs run outside the queue lock; an exception
// thrown by a job lands in its future and never reaches the worker loop.
class WorkerPool {
public:
    // 0 threads: hardware concurrency (at least 1).
    explicit WorkerPool(unsigned threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> future = task->get_future();
        enqueue([task] { (*task)(); });
        return future;
    }

    // Runs every queued job, then joins the workers. Later submits throw.
    void shutdown();

    std::size_t size() const;
    std::size_t queued() const;

private:
    void enqueue(std::function<void()> job);
    void worker_loop(std::size_t index);

    std::vector<std::thread> threads_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<std::function<void()>> queue_;
    bool shutdown_ = false;
};

} // namespace render_service
