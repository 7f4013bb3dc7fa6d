/*
 * pool.hpp: Fixed-size worker pool
 */

#ifndef DS_POOL_H
#define DS_POOL_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace pool {

class WorkerPool {
public:
    /* threads == 0 picks the hardware concurrency. */
    explicit WorkerPool(unsigned threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    void submit(std::function<void()> task);

    /* Block until the queue is empty and no task is running. */
    void wait_idle();

    unsigned size() const { return (unsigned)workers_.size(); }

private:
    void worker_func();

    std::vector<std::thread>          workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex                        mutex_;
    std::condition_variable           work_cv_;
    std::condition_variable           idle_cv_;
    unsigned                          active_ = 0;
    bool                              quit_ = false;
};

} // namespace pool

#endif // DS_POOL_H
