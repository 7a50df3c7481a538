#ifndef SHARDAVAIL_UTIL_THREAD_POOL_HPP
#define SHARDAVAIL_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool. The shards manager runs chunk reconstruction
 *        here so decoding never blocks the network or timer threads.
 *
 * Usage Example:
 *  @code
 *    shardavail::util::ThreadPool pool(2);
 *    pool.post([] { reconstruct(); });            // fire and forget
 *    pool.waitIdle();                             // queue drained, workers idle
 *  @endcode
 */

namespace shardavail {
namespace util {

class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. Zero means hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
        , active_(0)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    /**
     * @brief Runs every queued task, then joins the workers.
     */
    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        taskReady_.notify_all();
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a task with no result. Exceptions must be handled by the task.
     * @throw std::runtime_error if the pool is shutting down.
     */
    void post(std::function<void()> task)
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool::post on stopped pool");
            }
            taskQueue_.push(std::move(task));
        }
        taskReady_.notify_one();
    }

    /**
     * @brief Block until the queue is empty and no worker is running a task.
     */
    void waitIdle()
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        idle_.wait(lock, [this] { return taskQueue_.empty() && active_ == 0; });
    }

    size_t size() const { return workers_.size(); }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                taskReady_.wait(lock, [this] { return !taskQueue_.empty() || stop_; });
                if (stop_ && taskQueue_.empty()) {
                    return;
                }
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
                ++active_;
            }

            task();

            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                --active_;
                if (taskQueue_.empty() && active_ == 0) {
                    idle_.notify_all();
                }
            }
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> taskQueue_;
    std::mutex queueMutex_;
    std::condition_variable taskReady_;
    std::condition_variable idle_;
    bool stop_;
    size_t active_;
};

} // namespace util
} // namespace shardavail

#endif // SHARDAVAIL_UTIL_THREAD_POOL_HPP
