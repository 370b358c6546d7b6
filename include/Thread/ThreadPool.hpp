#pragma once
#include "core/Common.hpp"


// Fixed set of workers draining one FIFO task queue.
class ThreadPool final {
public:
    // 0 picks hardware_concurrency()
    explicit ThreadPool(size_t threadCount = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const noexcept;

    // queued plus running tasks
    size_t pending() const;

    // blocks until the queue is empty and no task is running
    void waitIdle();

    void shutdown();

    template <class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<decltype(f(std::declval<Args>()...))>
    {
        using R = decltype(f(std::declval<Args>()...));

        auto task = std::make_shared<std::packaged_task<R()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<R> fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (stop_) {
                throw std::runtime_error("ThreadPool is stopped");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return fut;
    }

private:
    void workerLoop();

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    bool stop_{false};
    size_t running_{0};

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
};
