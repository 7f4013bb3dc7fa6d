/*
 * pool.cpp: Fixed-size worker pool
 */

#include "pool.hpp"

namespace pool {

WorkerPool::WorkerPool(unsigned threads)
{
    if (threads == 0)
        threads = std::thread::hardware_concurrency();
    if (threads == 0)
        threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; i++)
        workers_.emplace_back([this] { worker_func(); });
}

WorkerPool::~WorkerPool()
{
    {
        std::lock_guard lock(mutex_);
        quit_ = true;
    }
    work_cv_.notify_all();
    for (auto &t : workers_)
        t.join();
}

void WorkerPool::submit(std::function<void()> task)
{
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(std::move(task));
    }
    work_cv_.notify_one();
}

void WorkerPool::wait_idle()
{
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::worker_func()
{
    while (true) {
        std::unique_lock lock(mutex_);
        work_cv_.wait(lock, [this] { return !queue_.empty() || quit_; });
        if (queue_.empty()) break;      // quit with nothing left
        auto task = std::move(queue_.front());
        queue_.pop_front();
        active_++;
        lock.unlock();

        task();

        lock.lock();
        active_--;
        bool idle = queue_.empty() && active_ == 0;
        lock.unlock();
        if (idle)
            idle_cv_.notify_all();
    }
}

} // namespace pool
