#include <rpcextractor/core/utils/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace RpcExtractor {

ThreadPool::ThreadPool(size_t numThreads) : isRunning(true) {
    if (numThreads == 0) numThreads = 1;
    workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers.emplace_back(&ThreadPool::workerLoop, this);
    }
    spdlog::debug("[ThreadPool] Started {} workers", numThreads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!isRunning.load(std::memory_order_acquire)) {
            return false;
        }
        tasks.push(std::move(task));
    }
    condition.notify_one();
    return true;
}

size_t ThreadPool::getPendingTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return tasks.size();
}

void ThreadPool::shutdown() {
    // Only the first caller takes the threads; later callers find nothing to join
    std::vector<std::thread> joining;
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        isRunning.store(false, std::memory_order_release);
        joining.swap(workers);
    }
    condition.notify_all();
    for (auto& worker : joining) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t ThreadPool::size() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return workers.size();
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            condition.wait(lock, [this]() {
                return !tasks.empty() || !isRunning.load(std::memory_order_acquire);
            });
            // Drain remaining tasks before exiting
            if (tasks.empty()) {
                return;
            }
            task = std::move(tasks.front());
            tasks.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[ThreadPool] Task threw: {}", e.what());
        }
    }
}

} // namespace RpcExtractor
