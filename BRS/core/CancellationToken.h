#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <condition_variable>

class CancellationToken {
public:
    void cancel();
    bool cancelled() const;

    // Sleeps up to `timeout`. Returns true if cancelled meanwhile.
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> flag{ false };
    mutable std::mutex mtx;
    mutable std::condition_variable cv;
};
