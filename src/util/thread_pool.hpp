#ifndef DOCSANITIZER_UTIL_THREAD_POOL_HPP
#define DOCSANITIZER_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool. The sanitization engine sizes one of these to
 *        the chunk fan-out limit so that no more than that many model calls are
 *        in flight at once, whatever the number of concurrent requests.
 *
 * Usage Example:
 *  @code
 *    docsanitizer::util::ThreadPool pool(4);
 *    auto done = pool.enqueue([](int ordinal) { return ordinal * 2; }, 21);
 *    int value = done.get(); // 42
 *  @endcode
 */

namespace docsanitizer {
namespace util {

/**
 * @class ThreadPool
 * @brief Workers pull tasks FIFO. The destructor drains the queue and joins.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of workers. Zero means hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    /**
     * @brief Schedule a callable. Exceptions it throws surface from future::get().
     * @throw std::runtime_error if the pool is shutting down.
     */
    template <typename F, typename... Args>
    auto enqueue(F &&f, Args &&...args) -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));

        std::future<return_type> result = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool: enqueue on stopped pool");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        condVar_.notify_one();
        return result;
    }

    size_t size() const { return workers_.size(); }

    /**
     * @brief Tasks queued but not yet picked up by a worker.
     */
    size_t pending() const
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return tasks_.size();
    }

private:
    void workerLoop()
    {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condVar_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
};

} // namespace util
} // namespace docsanitizer

#endif // DOCSANITIZER_UTIL_THREAD_POOL_HPP
