#include "core/Common.hpp"
#include "Thread/ThreadPool.hpp"

ThreadPool::ThreadPool(size_t threadCount)
{
    if (threadCount == 0) {
        threadCount = std::thread::hardware_concurrency();
        if (threadCount == 0) threadCount = 2;
    }

    workers_.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        workers_.emplace_back([this] { workerLoop(); });
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

size_t ThreadPool::size() const noexcept
{
    return workers_.size();
}

size_t ThreadPool::pending() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return tasks_.size() + running_;
}

void ThreadPool::waitIdle()
{
    std::unique_lock<std::mutex> lock(mtx_);
    idleCv_.wait(lock, [&] { return tasks_.empty() && running_ == 0; });
}

// Queued tasks still run; shutdown returns once the workers have drained them.
void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stop_) return;
        stop_ = true;
    }
    cv_.notify_all();

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

void ThreadPool::workerLoop()
{
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [&] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) return;

            job = std::move(tasks_.front());
            tasks_.pop();
            ++running_;
        }

        // packaged_task stores any exception in its future
        job();

        {
            std::lock_guard<std::mutex> lock(mtx_);
            --running_;
            if (tasks_.empty() && running_ == 0) idleCv_.notify_all();
        }
    }
}
