#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <functional>
#include <mutex>

// Fixed set of threads running the same worker loop until the stop flag is raised.
class ThreadPool {
public:
    // Receives the worker's slot number
    using WorkerFn = std::function<void(std::size_t)>;

    explicit ThreadPool(std::atomic<bool>& stopFlag);
    ~ThreadPool();

    void start(std::size_t n, WorkerFn worker);
    void shutdown();

private:
    std::vector<std::thread> threads;
    std::atomic<bool>& shouldStop;
    std::mutex mtx;
};
