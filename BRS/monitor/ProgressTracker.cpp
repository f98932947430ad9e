#include "ProgressTracker.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

ProgressTracker::ProgressTracker(std::chrono::milliseconds autoResetDelay)
    : startedAt(std::chrono::steady_clock::now()),
    resetDelay(autoResetDelay) {
    timer = std::thread(&ProgressTracker::timerLoop, this);
}

ProgressTracker::~ProgressTracker() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopping = true;
    }
    timerCv.notify_all();

    if (timer.joinable())
        timer.join();
}

std::uint64_t ProgressTracker::subscribe(Observer observer) {
    std::lock_guard<std::mutex> lock(observerMtx);
    const std::uint64_t token = nextToken++;
    observers.emplace(token, std::move(observer));
    return token;
}

void ProgressTracker::unsubscribe(std::uint64_t token) {
    std::lock_guard<std::mutex> lock(observerMtx);
    observers.erase(token);
}

void ProgressTracker::start(const std::string& title, std::size_t total) {
    ProgressState copy;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (current == ProgressPhase::Active)
            throw std::logic_error("progress already driven by an active job: " + state.title);

        ++generation;
        resetArmed = false;

        state = ProgressState{};
        state.isActive = true;
        state.title = title;
        state.total = total;
        current = ProgressPhase::Active;
        startedAt = std::chrono::steady_clock::now();
        copy = state;
    }
    publish(copy);
}

void ProgressTracker::setTotal(std::size_t total) {
    ProgressState copy;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (current != ProgressPhase::Active)
            return;

        state.total = total;
        state.current = std::min(state.current, total);
        copy = state;
    }
    publish(copy);
}

void ProgressTracker::update(std::size_t done, const std::string& name) {
    ProgressState copy;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (current != ProgressPhase::Active)
            return;

        state.current = std::min(done, state.total);
        state.currentName = name;
        copy = state;
    }
    publish(copy);
}

void ProgressTracker::complete() {
    ProgressState copy;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (current != ProgressPhase::Active)
            return;

        state.current = state.total;
        state.currentName.clear();
        state.isCompleted = true;
        state.hasError = false;
        current = ProgressPhase::Completed;

        ++generation;
        if (resetDelay.count() > 0) {
            resetArmed = true;
            resetAt = std::chrono::steady_clock::now() + resetDelay;
        }
        copy = state;
    }
    timerCv.notify_all();
    publish(copy);
}

void ProgressTracker::error(const std::string& message) {
    ProgressState copy;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (current != ProgressPhase::Active)
            return;

        state.isCompleted = false;
        state.hasError = true;
        state.errorMessage = message;
        current = ProgressPhase::Errored;
        copy = state;
    }
    publish(copy);
}

void ProgressTracker::reset() {
    ProgressState copy;
    {
        std::lock_guard<std::mutex> lock(mtx);
        ++generation;
        resetArmed = false;
        state = ProgressState{};
        current = ProgressPhase::Inactive;
        copy = state;
    }
    timerCv.notify_all();
    publish(copy);
}

ProgressState ProgressTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state;
}

ProgressPhase ProgressTracker::phase() const {
    std::lock_guard<std::mutex> lock(mtx);
    return current;
}

double ProgressTracker::progress() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state.total == 0 ? 0.0 : (double)state.current / (double)state.total;
}

double ProgressTracker::itemsPerSec() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startedAt;
    return elapsed.count() > 0 ? state.current / elapsed.count() : 0.0;
}

void ProgressTracker::publish(const ProgressState& snapshotState) {
    std::vector<Observer> targets;
    {
        std::lock_guard<std::mutex> lock(observerMtx);
        targets.reserve(observers.size());
        for (const auto& entry : observers)
            targets.push_back(entry.second);
    }

    for (const auto& observer : targets)
        observer(snapshotState);
}

void ProgressTracker::timerLoop() {
    std::unique_lock<std::mutex> lock(mtx);
    while (!stopping) {
        if (!resetArmed) {
            timerCv.wait(lock, [&]() {
                return stopping || resetArmed;
                });
            continue;
        }

        const std::uint64_t armedGeneration = generation;
        const auto deadline = resetAt;
        timerCv.wait_until(lock, deadline, [&]() {
            return stopping || !resetArmed || generation != armedGeneration;
            });

        if (stopping)
            break;

        if (resetArmed && generation == armedGeneration
            && current == ProgressPhase::Completed
            && std::chrono::steady_clock::now() >= deadline) {
            resetArmed = false;
            ++generation;
            state = ProgressState{};
            current = ProgressPhase::Inactive;
            ProgressState copy = state;

            lock.unlock();
            publish(copy);
            lock.lock();
        }
    }
}
