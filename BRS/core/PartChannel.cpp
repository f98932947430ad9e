#include "PartChannel.h"

#include <chrono>

namespace {
// Cancellation is signalled on a different condition variable, so waits are sliced
constexpr std::chrono::milliseconds kPollSlice{ 50 };
}

bool PartChannel::awaitCapacity(const CancellationToken& cancel) {
    std::unique_lock<std::mutex> lock(mtx);
    while (slot.has_value() && !isClosed) {
        if (cancel.cancelled())
            return false;
        cv.wait_for(lock, kPollSlice);
    }
    return !isClosed && !cancel.cancelled();
}

bool PartChannel::push(RenderedPart part, const CancellationToken& cancel) {
    std::unique_lock<std::mutex> lock(mtx);
    while (slot.has_value() && !isClosed) {
        if (cancel.cancelled())
            return false;
        cv.wait_for(lock, kPollSlice);
    }

    if (isClosed || cancel.cancelled())
        return false;

    slot = std::move(part);
    lock.unlock();
    cv.notify_all();
    return true;
}

std::optional<RenderedPart> PartChannel::pop(const CancellationToken& cancel) {
    std::unique_lock<std::mutex> lock(mtx);
    while (!slot.has_value() && !isClosed) {
        if (cancel.cancelled())
            return std::nullopt;
        cv.wait_for(lock, kPollSlice);
    }

    if (!slot.has_value() || cancel.cancelled())
        return std::nullopt;

    std::optional<RenderedPart> out = std::move(slot);
    slot.reset();
    lock.unlock();
    cv.notify_all();
    return out;
}

void PartChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        isClosed = true;
    }
    cv.notify_all();
}

bool PartChannel::closed() const {
    std::lock_guard<std::mutex> lock(mtx);
    return isClosed;
}
