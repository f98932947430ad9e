#pragma once
#include <optional>
#include <vector>
#include <cstddef>

#include "utils.h"
#include "DocumentRenderer.h"
#include "../monitor/Logger.h"

// Forward-only, single-consumer sequence of rendered documents in job order.
// Renders one record per next() call; failing records are skipped and recorded.
class StreamProducer {
public:
    StreamProducer(const Job& job, DocumentRenderer& renderer, Logger& logger);

    StreamProducer(const StreamProducer&) = delete;
    StreamProducer& operator=(const StreamProducer&) = delete;

    bool hasWork() const;
    std::optional<RenderedPart> next();

    // No further records are rendered after stop().
    void stop();
    bool exhausted() const;

    std::size_t delivered() const;
    const std::vector<SkippedItem>& skipped() const;

private:
    const Job& job;
    DocumentRenderer& renderer;
    Logger& logger;

    std::size_t cursor{ 0 };
    std::size_t producedCount{ 0 };
    bool stopped{ false };
    std::vector<SkippedItem> skippedItems;
};
