#pragma once
#include <mutex>
#include <optional>
#include <condition_variable>

#include "utils.h"
#include "CancellationToken.h"

// Single-slot hand-off between the producer thread and the encoder.
class PartChannel {
public:
    // Blocks until the slot is free. False if closed or cancelled.
    bool awaitCapacity(const CancellationToken& cancel);
    bool push(RenderedPart part, const CancellationToken& cancel);

    // Blocks until a part is available. nullopt once closed and empty, or cancelled.
    std::optional<RenderedPart> pop(const CancellationToken& cancel);

    void close();
    bool closed() const;

private:
    std::optional<RenderedPart> slot;
    bool isClosed{ false };
    mutable std::mutex mtx;
    std::condition_variable cv;
};
