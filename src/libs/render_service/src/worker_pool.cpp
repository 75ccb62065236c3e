#include <render_service/worker_pool.hpp>
#include <clipper_log/log.hpp>
#include <algorithm>

namespace render_service {

WorkerPool::WorkerPool(unsigned threads) {
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    threads_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this, i);
    }
    clipper_log::logger()->debug("worker_pool_started threads={}", threads);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            throw std::runtime_error("worker pool is shut down");
        }
        queue_.push_back(std::move(job));
    }
    cond_.notify_one();
}

void WorkerPool::worker_loop(std::size_t index) {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // Wait for jobs or shutdown
            cond_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
            if (queue_.empty()) break;
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        // packaged_task stores exceptions in the future.
        job();
    }
    clipper_log::logger()->debug("worker_pool_thread_exit index={}", index);
}

void WorkerPool::shutdown() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        threads.swap(threads_);
    }
    cond_.notify_all();
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
}

std::size_t WorkerPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.size();
}

std::size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace render_service
