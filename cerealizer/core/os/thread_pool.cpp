#include "thread_pool.h"
#include "cerealizer/core/log/Log.h"

ThreadPool::ThreadPool(size_t thread_count) {
    if (thread_count == 0) {
        thread_count = 1;
    }
    workers_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back([this, i]() { run_worker(i); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock lock(queue_mutex_);
        stopping_ = true;
    }
    condition_.notify_all();
    // Join here: the queue and its mutex are destroyed before workers_.
    for (auto& worker : workers_) {
        worker.join();
    }
}

void ThreadPool::run_worker(size_t index) {
    INFO("Cerealizer worker {} started", index);
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            condition_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (stopping_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}
