#include "StreamController.h"

#include <iomanip>
#include <sstream>
#include <thread>

#include "errors.h"
#include "PartChannel.h"
#include "StreamProducer.h"
#include "../net/MultipartEncoder.h"

StreamController::StreamController(DocumentRenderer& r, Logger& log,
    long keepAlive, std::chrono::milliseconds watch)
    : renderer(r),
    logger(log),
    keepAliveSec(keepAlive),
    watchInterval(watch) {
}

StreamReport StreamController::run(const Job& job, ResponseSink& sink, CancellationToken& cancel,
    const std::string& boundary) {
    if (job.items.empty())
        throw NoWorkError("job " + job.id + " has no records");

    const std::size_t total = job.total();

    StreamReport report;
    report.boundary = boundary;
    report.total = total;

    StreamProducer producer(job, renderer, logger);
    MultipartEncoder encoder(sink, logger, boundary);

    logger.info("Starting stream of " + std::to_string(total) + " documents for job " + job.id);
    const auto startTime = std::chrono::steady_clock::now();

    if (!encoder.begin(total, keepAliveSec)) {
        report.outcome = StreamOutcome::TransportFailed;
        report.error = "failed to send response head";
        encoder.abort();
        logger.error("Stream for job " + job.id + " failed before the first part: " + report.error);
        return report;
    }

    PartChannel channel;

    std::thread producerThread([&]() {
        try {
            while (channel.awaitCapacity(cancel)) {
                auto part = producer.next();
                if (!part.has_value())
                    break;
                if (!channel.push(std::move(*part), cancel))
                    break;
            }
        }
        catch (const std::exception& e) {
            logger.error("Producer for job " + job.id + " stopped: " + e.what());
            cancel.cancel();
        }

        if (cancel.cancelled())
            producer.stop();
        channel.close();
        });

    CancellationToken watchStop;
    std::thread watcher;
    if (watchInterval.count() > 0) {
        watcher = std::thread([&]() {
            while (!watchStop.cancelled() && !cancel.cancelled()) {
                if (!sink.connected()) {
                    logger.warn("Client disconnected during stream of job " + job.id);
                    cancel.cancel();
                    break;
                }
                watchStop.waitFor(watchInterval);
            }
            });
    }

    bool transportFailed = false;
    try {
        while (true) {
            auto part = channel.pop(cancel);
            if (!part.has_value())
                break;

            logger.info("Sending part " + std::to_string(part->index + 1) + "/" + std::to_string(total)
                + ": " + part->displayName + " (" + std::to_string(part->byteLength()) + " bytes)");

            if (!encoder.writePart(*part, total, cancel)) {
                logger.warn("Stopping job " + job.id + " - client disconnected at "
                    + std::to_string(report.delivered) + "/" + std::to_string(total));
                cancel.cancel();
                break;
            }
            ++report.delivered;
        }
    }
    catch (const TransportWriteError& e) {
        transportFailed = true;
        report.error = e.what();
        logger.error("Write failed for job " + job.id + ": " + e.what());
        cancel.cancel();
    }

    // The producer may be parked on the channel; closing releases it
    if (cancel.cancelled())
        channel.close();
    producerThread.join();

    watchStop.cancel();
    if (watcher.joinable())
        watcher.join();

    report.skipped = producer.skipped();

    if (transportFailed) {
        report.outcome = StreamOutcome::TransportFailed;
        encoder.abort();
    }
    else if (cancel.cancelled()) {
        report.outcome = StreamOutcome::Cancelled;
        if (report.error.empty())
            report.error = "client disconnected";
        encoder.abort();
    }
    else if (!encoder.finish()) {
        report.outcome = StreamOutcome::TransportFailed;
        report.error = "failed to write terminating boundary";
    }
    else {
        report.outcome = StreamOutcome::Completed;
    }

    report.bytesWritten = encoder.state().bytesWrittenSoFar;

    const std::chrono::duration<double> duration = std::chrono::steady_clock::now() - startTime;
    std::ostringstream summary;
    summary << "Streaming "
        << (report.outcome == StreamOutcome::Completed ? "completed" : "incomplete")
        << " for job " << job.id << ", sent " << report.delivered << "/" << total
        << " documents (" << report.bytesWritten << " bytes) in "
        << std::fixed << std::setprecision(2) << duration.count() << "s";
    if (!report.skipped.empty())
        summary << ", skipped " << report.skipped.size();
    if (report.outcome != StreamOutcome::Completed)
        summary << " (" << report.error << ")";

    if (report.outcome == StreamOutcome::Completed)
        logger.info(summary.str());
    else
        logger.warn(summary.str());

    return report;
}
