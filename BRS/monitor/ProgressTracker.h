#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <condition_variable>

enum class ProgressPhase {
    Inactive,
    Active,
    Completed,
    Errored
};

struct ProgressState {
    bool isActive = false;
    std::string title;
    std::size_t current = 0;
    std::size_t total = 0;
    std::string currentName;
    bool isCompleted = false;
    bool hasError = false;
    std::string errorMessage;
};

// Observable job progress. One instance per UI session, driven by at most one job at a time.
class ProgressTracker {
public:
    using Observer = std::function<void(const ProgressState&)>;

    explicit ProgressTracker(std::chrono::milliseconds autoResetDelay = std::chrono::seconds(5));
    ~ProgressTracker();

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    // Observers are called with a snapshot after every transition, outside the lock.
    std::uint64_t subscribe(Observer observer);
    void unsubscribe(std::uint64_t token);

    // Throws std::logic_error if a job is already active.
    void start(const std::string& title, std::size_t total);
    void setTotal(std::size_t total);
    void update(std::size_t current, const std::string& name);
    void complete();
    void error(const std::string& message);
    void reset();

    ProgressState snapshot() const;
    ProgressPhase phase() const;

    double progress() const;
    double itemsPerSec() const;

private:
    void publish(const ProgressState& state);
    void timerLoop();

private:
    mutable std::mutex mtx;
    ProgressState state;
    ProgressPhase current{ ProgressPhase::Inactive };
    std::chrono::steady_clock::time_point startedAt;

    std::mutex observerMtx;
    std::map<std::uint64_t, Observer> observers;
    std::uint64_t nextToken{ 1 };

    // Auto-reset after completion
    std::chrono::milliseconds resetDelay;
    std::uint64_t generation{ 0 };
    bool resetArmed{ false };
    std::chrono::steady_clock::time_point resetAt;
    bool stopping{ false };
    std::condition_variable timerCv;
    std::thread timer;
};
