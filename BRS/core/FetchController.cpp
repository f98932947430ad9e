#include "FetchController.h"

#include <algorithm>
#include <iomanip>
#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "errors.h"
#include "../net/BulkJsonCodec.h"
#include "../net/Encoding.h"
#include "../net/HttpClient.h"
#include "../net/MultipartDecoder.h"

namespace {
constexpr long kConnectTimeoutSec = 10;
constexpr std::size_t kMaxErrorBody = 64 * 1024;

std::string trimSlash(std::string url) {
    while (!url.empty() && url.back() == '/')
        url.pop_back();
    return url;
}
}

FetchController::FetchController(const FetchConfig& config, ProgressTracker& p, Logger& log,
    DownloadScheduler::SaveFn save, volatile std::sig_atomic_t* externalStop)
    : cfg(config),
    progress(p),
    logger(log),
    saveFn(std::move(save)),
    externalStopSignal(externalStop) {
}

std::string FetchController::jobUrl() const {
    const std::string base = trimSlash(cfg.baseUrl) + "/jobs/" + encoding::percentEncode(cfg.jobId);
    if (!cfg.recordId.empty())
        return base + "/records/" + encoding::percentEncode(cfg.recordId);
    if (cfg.combined)
        return base + "/combined";
    return base + (cfg.bulk ? "/bulk" : "/stream");
}

std::string FetchController::requestBody() const {
    if (cfg.onlyIds.empty())
        return "{}";
    const nlohmann::json body{ { "ids", cfg.onlyIds } };
    return body.dump();
}

void FetchController::stop() {
    cancel.cancel();
}

bool FetchController::stopRequested() const {
    if (externalStopSignal && *externalStopSignal != 0)
        return true;
    return cancel.cancelled();
}

std::string FetchController::errorFromBody(long status, const std::string& body) {
    std::string text;
    try {
        const auto doc = nlohmann::json::parse(body);
        if (doc.is_object() && doc.contains("error") && doc["error"].is_string())
            text = doc["error"].get<std::string>();
    }
    catch (const nlohmann::json::exception&) {
        text = body.substr(0, 200);
    }

    std::string out = "server replied " + std::to_string(status);
    if (!text.empty())
        out += ": " + text;
    return out;
}

FetchReport FetchController::run() {
    const std::string title = cfg.title.empty() ? "Downloading Reports" : cfg.title;

    FetchReport report;
    try {
        progress.start(title, 0);
    }
    catch (const std::logic_error& e) {
        report.outcome = FetchOutcome::Failed;
        report.error = e.what();
        logger.error(report.error);
        return report;
    }

    DownloadScheduler scheduler(saveFn, std::chrono::milliseconds(cfg.intervalMs), logger);
    scheduler.start();

    logger.info("Fetching " + jobUrl());
    const auto startTime = std::chrono::steady_clock::now();

    if (!cfg.recordId.empty() || cfg.combined)
        report = runSingle(scheduler);
    else
        report = cfg.bulk ? runBulk(scheduler) : runStreaming(scheduler);

    const std::chrono::duration<double> duration = std::chrono::steady_clock::now() - startTime;

    std::ostringstream summary;
    summary << "Fetch of job " << cfg.jobId << ' ';
    switch (report.outcome) {
    case FetchOutcome::Completed: summary << "completed"; break;
    case FetchOutcome::NotFound: summary << "found no job"; break;
    case FetchOutcome::Cancelled: summary << "cancelled"; break;
    case FetchOutcome::Failed: summary << "failed"; break;
    }
    summary << " in " << std::fixed << std::setprecision(2) << duration.count() << "s, received "
        << report.received << "/" << report.expected << ", saved " << report.saved;
    if (report.failedSaves > 0)
        summary << ", " << report.failedSaves << " failed to save";
    if (!report.error.empty())
        summary << " (" << report.error << ")";

    if (report.outcome == FetchOutcome::Completed)
        logger.info(summary.str());
    else
        logger.warn(summary.str());

    return report;
}

FetchReport FetchController::runStreaming(DownloadScheduler& scheduler) {
    FetchReport report;

    HttpClient client(jobUrl());
    client.setTimeouts(kConnectTimeoutSec, cfg.timeoutSec);
    client.setStopCheck([this] { return stopRequested(); });

    long status = 0;
    bool headSeen = false;
    std::string errorBody;
    std::string protocolError;
    std::unique_ptr<MultipartDecoder> decoder;

    auto onPart = [&](DecodedPart&& part) {
        ++report.received;
        logger.debug("Received part " + std::to_string(part.index + 1) + "/"
            + std::to_string(report.expected) + ": " + part.displayName
            + " (" + std::to_string(part.bytes.size()) + " bytes)");
        progress.update(report.received, part.displayName);
        scheduler.enqueue(std::move(part));
    };

    auto onHead = [&](const HttpResponseHead& head) {
        headSeen = true;
        status = head.status;
        if (status != 200)
            return true;

        try {
            const std::string boundary = MultipartDecoder::boundaryFromContentType(head.contentType);
            decoder = std::make_unique<MultipartDecoder>(boundary, onPart);
        }
        catch (const ProtocolError& e) {
            protocolError = e.what();
            return false;
        }

        if (head.hasTotalCount) {
            report.expected = static_cast<std::size_t>(head.totalCount);
            progress.setTotal(report.expected);
            logger.info("Job " + cfg.jobId + " has " + std::to_string(report.expected) + " documents");
        }
        return true;
    };

    auto onData = [&](const char* data, std::size_t size) {
        if (stopRequested())
            return false;
        if (!decoder) {
            errorBody.append(data, size);
            return errorBody.size() < kMaxErrorBody;
        }
        decoder->feed(data, size);
        return true;
    };

    const bool ok = client.postStream(requestBody(), onHead, onData);

    if (decoder) {
        try {
            decoder->finish();
        }
        catch (const ProtocolError& e) {
            protocolError = e.what();
        }
        report.diagnostics = decoder->diagnostics();
        for (const auto& note : report.diagnostics)
            logger.warn(note);
    }

    if (stopRequested()) {
        report.outcome = FetchOutcome::Cancelled;
        report.error = "stopped after " + std::to_string(report.received) + " documents";
        scheduler.stop();
        report.saved = scheduler.saved();
        report.failedSaves = scheduler.failed();
        progress.reset();
        return report;
    }

    if (!protocolError.empty()) {
        report.outcome = FetchOutcome::Failed;
        report.error = protocolError;
        progress.error(protocolError);
        finishScheduler(scheduler, report);
        return report;
    }

    if (!headSeen) {
        // Nothing came back at all, e.g. connection refused
        report.outcome = FetchOutcome::Failed;
        report.error = client.lastError();
        progress.error("Download failed: " + report.error);
        finishScheduler(scheduler, report);
        return report;
    }

    if (status != 200) {
        report.outcome = status == 404 ? FetchOutcome::NotFound : FetchOutcome::Failed;
        report.error = errorFromBody(status, errorBody);
        progress.error(report.error);
        finishScheduler(scheduler, report);
        return report;
    }

    finishScheduler(scheduler, report);

    if (decoder->terminated()) {
        report.outcome = FetchOutcome::Completed;
        if (report.received != report.expected) {
            logger.warn("Server delivered " + std::to_string(report.received) + " of "
                + std::to_string(report.expected) + " documents; "
                + std::to_string(report.expected - std::min(report.expected, report.received))
                + " were skipped");
        }
        progress.complete();
        return report;
    }

    // Stream cut before the closing boundary; the parts already received stay saved.
    report.outcome = FetchOutcome::Failed;
    report.error = "stream ended after " + std::to_string(report.received) + " of "
        + std::to_string(report.expected) + " documents";
    if (!ok && !client.lastError().empty())
        report.error += ": " + client.lastError();
    progress.reset();
    return report;
}

FetchReport FetchController::runBulk(DownloadScheduler& scheduler) {
    FetchReport report;

    HttpClient client(jobUrl());
    client.setTimeouts(kConnectTimeoutSec, cfg.timeoutSec);
    client.setStopCheck([this] { return stopRequested(); });

    HttpResponseHead head;
    std::string body;
    const bool ok = client.post(requestBody(), head, body);

    if (stopRequested()) {
        report.outcome = FetchOutcome::Cancelled;
        scheduler.stop();
        progress.reset();
        return report;
    }

    if (!ok) {
        report.outcome = FetchOutcome::Failed;
        report.error = client.lastError();
        progress.error("Download failed: " + report.error);
        finishScheduler(scheduler, report);
        return report;
    }

    if (head.status != 200) {
        report.outcome = head.status == 404 ? FetchOutcome::NotFound : FetchOutcome::Failed;
        report.error = errorFromBody(head.status, body);
        progress.error(report.error);
        finishScheduler(scheduler, report);
        return report;
    }

    BulkJsonCodec::Decoded decoded;
    try {
        decoded = BulkJsonCodec::decode(body);
    }
    catch (const ProtocolError& e) {
        report.outcome = FetchOutcome::Failed;
        report.error = e.what();
        progress.error(report.error);
        finishScheduler(scheduler, report);
        return report;
    }

    report.expected = decoded.total;
    report.diagnostics = decoded.diagnostics;
    progress.setTotal(decoded.total);

    for (const auto& note : decoded.diagnostics)
        logger.warn(note);
    for (const auto& item : decoded.skipped)
        logger.warn("Server skipped " + item.displayName + " (" + item.id + "): " + item.reason);

    for (auto& part : decoded.items) {
        ++report.received;
        progress.update(report.received, part.displayName);
        scheduler.enqueue(std::move(part));
    }

    finishScheduler(scheduler, report);
    report.outcome = FetchOutcome::Completed;
    progress.complete();
    return report;
}

FetchReport FetchController::runSingle(DownloadScheduler& scheduler) {
    FetchReport report;

    HttpClient client(jobUrl());
    client.setTimeouts(kConnectTimeoutSec, cfg.timeoutSec);
    client.setStopCheck([this] { return stopRequested(); });

    HttpResponseHead head;
    std::string body;
    const bool ok = client.post(requestBody(), head, body);

    if (stopRequested()) {
        report.outcome = FetchOutcome::Cancelled;
        scheduler.stop();
        progress.reset();
        return report;
    }

    if (!ok) {
        report.outcome = FetchOutcome::Failed;
        report.error = client.lastError();
        progress.error("Download failed: " + report.error);
        finishScheduler(scheduler, report);
        return report;
    }

    if (head.status != 200) {
        report.outcome = head.status == 404 ? FetchOutcome::NotFound : FetchOutcome::Failed;
        report.error = errorFromBody(head.status, body);
        progress.error(report.error);
        finishScheduler(scheduler, report);
        return report;
    }

    if (body.empty()) {
        report.outcome = FetchOutcome::Failed;
        report.error = "server sent an empty document";
        progress.error(report.error);
        finishScheduler(scheduler, report);
        return report;
    }

    DecodedPart part{};
    part.id = encoding::percentDecode(head.header("x-record-id"));
    part.displayName = encoding::percentDecode(head.header("x-display-name"));
    if (part.displayName.empty())
        part.displayName = cfg.recordId.empty() ? cfg.jobId : cfg.recordId;
    part.bytes.assign(body.begin(), body.end());

    const std::string skipped = head.header("x-skipped-count");
    if (!skipped.empty() && skipped != "0")
        logger.warn("Server left " + skipped + " records out of " + part.displayName);

    report.expected = 1;
    report.received = 1;
    progress.setTotal(1);
    progress.update(1, part.displayName);
    scheduler.enqueue(std::move(part));

    finishScheduler(scheduler, report);
    report.outcome = FetchOutcome::Completed;
    progress.complete();
    return report;
}

void FetchController::finishScheduler(DownloadScheduler& scheduler, FetchReport& report) {
    if (stopRequested())
        scheduler.stop();
    else
        scheduler.drain();

    report.saved = scheduler.saved();
    report.failedSaves = scheduler.failed();
}
