#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <queue>
#include <functional>
#include <condition_variable>
#include <mutex>

namespace RpcExtractor {

/**
 * @class ThreadPool
 * @brief Fixed-size worker pool executing submitted tasks in FIFO order
 *
 * shutdown() lets workers finish every queued task before joining.
 * Tasks submitted after shutdown() are rejected.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit a task; returns false once the pool is shut down
    bool submit(std::function<void()> task);

    // Get number of queued (not yet started) tasks
    size_t getPendingTasks() const;

    // Live worker count; 0 after shutdown()
    size_t size() const;

    // Drain the queue and join all workers; safe to call concurrently
    void shutdown();

private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queueMutex;  // mutable for const getPendingTasks
    std::condition_variable condition;
    std::atomic<bool> isRunning;
};

} // namespace RpcExtractor
