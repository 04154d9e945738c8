#include "thread_pool.hpp"

#include <iostream>

namespace quickpack {

ThreadPool::ThreadPool(const Config& config) {
    start(config.get_thread_count());
}

ThreadPool::ThreadPool(size_t num_threads) {
    start(num_threads == 0 ? 1 : num_threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::start(size_t num_threads) {
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::worker_thread, this, i);
    }
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) return;
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::worker_thread(size_t thread_id) {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // Packaged tasks store their own exceptions; anything reaching here
        // escaped a raw task body.
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "Task error in thread " << thread_id << ": " << e.what() << "\n";
        }
    }
}

}  // namespace quickpack
