#pragma once
#include <atomic>
#include <csignal>
#include <string>

#include "utils.h"
#include "CancellationToken.h"
#include "../io/DownloadScheduler.h"
#include "../monitor/ProgressTracker.h"
#include "../monitor/Logger.h"

// Client side of one job: requests the job, decodes parts as they arrive,
// drives the progress tracker and hands every document to the scheduler.
class FetchController {
public:
    FetchController(const FetchConfig& config, ProgressTracker& progress, Logger& logger,
        DownloadScheduler::SaveFn save, volatile std::sig_atomic_t* externalStop = nullptr);

    FetchReport run();
    // Stops the transfer within about a second, even while no data arrives.
    // Safe from any thread.
    void stop();

    std::string jobUrl() const;

private:
    FetchReport runStreaming(DownloadScheduler& scheduler);
    FetchReport runBulk(DownloadScheduler& scheduler);
    // A single PDF: one record, or the combined document
    FetchReport runSingle(DownloadScheduler& scheduler);

    // "{}" or { "ids": [...] } when the job is narrowed
    std::string requestBody() const;

    bool stopRequested() const;
    void finishScheduler(DownloadScheduler& scheduler, FetchReport& report);

    // Text of a JSON { "error": ... } reply, or the raw body
    static std::string errorFromBody(long status, const std::string& body);

private:
    const FetchConfig& cfg;
    ProgressTracker& progress;
    Logger& logger;
    DownloadScheduler::SaveFn saveFn;
    volatile std::sig_atomic_t* externalStopSignal{ nullptr };

    CancellationToken cancel;
};
