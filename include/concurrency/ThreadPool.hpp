#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace ts::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks and joins the workers once their current task returns.
    void stop();

    void submit(std::shared_ptr<Task> task);

    [[nodiscard]] unsigned int workerCount() const;
    [[nodiscard]] bool isStopped() const { return stopFlag.load(); }

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace ts::concurrency
