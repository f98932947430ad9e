#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "../core/utils.h"
#include "../monitor/Logger.h"

// Saves decoded documents one at a time, in arrival order, with a fixed pause between
// consecutive saves. enqueue() never blocks the decoder; a failed save is logged and
// the next item proceeds.
class DownloadScheduler {
public:
    using SaveFn = std::function<bool(const DecodedPart&)>;

    DownloadScheduler(SaveFn save, std::chrono::milliseconds interval, Logger& logger);
    ~DownloadScheduler();

    void start();
    void enqueue(DecodedPart part);

    // Lets every queued item be saved, then stops the worker
    void drain();
    // Drops whatever is still queued and stops the worker
    void stop();

    std::size_t triggered() const { return triggeredCount.load(); }
    std::size_t saved() const { return savedCount.load(); }
    std::size_t failed() const { return failedCount.load(); }

    // Writes <dir>/<display name>.pdf, adding " (n)" when the name is taken
    static SaveFn saveToDirectory(const std::string& dir, Logger& logger);

private:
    void run();

private:
    SaveFn saveFn;
    std::chrono::milliseconds spacing;
    Logger& logger;

    std::queue<DecodedPart> pending;
    std::mutex mtx;
    std::condition_variable cv;
    bool running{ false };
    bool aborted{ false };
    std::thread worker;

    std::atomic<std::size_t> triggeredCount{ 0 };
    std::atomic<std::size_t> savedCount{ 0 };
    std::atomic<std::size_t> failedCount{ 0 };
};
