#pragma once
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <concepts>
#include <memory>
#include <optional>
#include <tuple>

// Fixed set of worker threads draining one FIFO task queue. Used by
// CerealEngine::cerealize_all to convert independent objects in parallel.
class ThreadPool {
public:
    // At least one worker, even when hardware_concurrency() reports 0.
    explicit ThreadPool(size_t thread_count = std::thread::hardware_concurrency());

    // Stops accepting tasks; workers finish what is queued, then join.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Exceptions thrown by the task surface from the future.
    // std::nullopt once the pool is stopping.
    template<class F, class... Args>
    requires std::invocable<F, Args...>
    auto enqueue(F&& f, Args&&... args) -> std::optional<std::future<std::invoke_result_t<F, Args...>>> {
        using return_type = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            [f = std::forward<F>(f), bound = std::make_tuple(std::forward<Args>(args)...)]() mutable {
                return std::apply(f, std::move(bound));
            });

        std::future<return_type> res = task->get_future();
        {
            std::unique_lock lock(queue_mutex_);
            if (stopping_) return std::nullopt;
            tasks_.emplace([task]() { (*task)(); });
        }
        condition_.notify_one();
        return res;
    }

    size_t size() const { return workers_.size(); }

private:
    void run_worker(size_t index);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stopping_ = false;
};
