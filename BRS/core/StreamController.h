#pragma once
#include <chrono>
#include <string>

#include "utils.h"
#include "CancellationToken.h"
#include "DocumentRenderer.h"
#include "../net/ResponseSink.h"
#include "../monitor/Logger.h"

// Runs one streaming job: a producer thread renders into a single-slot channel,
// the calling thread encodes onto the sink, and an optional watcher cancels the
// job as soon as the peer goes away.
class StreamController {
public:
    StreamController(DocumentRenderer& renderer, Logger& logger,
        long keepAliveSec = 600,
        std::chrono::milliseconds watchInterval = std::chrono::milliseconds(200));

    // Throws NoWorkError for an empty job; nothing is written to the sink in that case.
    StreamReport run(const Job& job, ResponseSink& sink, CancellationToken& cancel,
        const std::string& boundary);

private:
    DocumentRenderer& renderer;
    Logger& logger;
    long keepAliveSec;
    std::chrono::milliseconds watchInterval;
};
