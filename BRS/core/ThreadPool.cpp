#include "ThreadPool.h"

ThreadPool::ThreadPool(std::atomic<bool>& stopFlag)
    : shouldStop(stopFlag) {
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::start(std::size_t n, WorkerFn worker) {
    std::lock_guard<std::mutex> lock(mtx);

    const std::size_t first = threads.size();
    for (std::size_t i = 0; i < n; ++i) {
        threads.emplace_back(worker, first + i);
    }
}

void ThreadPool::shutdown() {
    std::lock_guard<std::mutex> lock(mtx);

    shouldStop.store(true);

    for (auto& t : threads) {
        if (t.joinable())
            t.join();
    }

    threads.clear();
}
