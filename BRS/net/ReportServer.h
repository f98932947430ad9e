#pragma once
#include <atomic>
#include <csignal>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "HttpRequest.h"
#include "ResponseSink.h"
#include "TcpSocket.h"
#include "../core/utils.h"
#include "../core/CancellationToken.h"
#include "../core/ConnectionQueue.h"
#include "../core/DocumentRenderer.h"
#include "../core/RecordSource.h"
#include "../core/ThreadPool.h"
#include "../monitor/Logger.h"

// HTTP front end for report jobs.
//   GET  /health
//   POST /jobs/<id>/stream   multipart/mixed, one part per document
//   POST /jobs/<id>/bulk     one JSON document with every item base64-encoded
//   POST /jobs/<id>/combined one PDF with a page per record
//   POST /jobs/<id>/records/<record id>   the PDF of a single record
// stream, bulk and combined take an optional { "ids": [...] } body that narrows the job
// to those records, in job order.
// One request per connection. The record source and renderer are shared by all workers.
class ReportServer {
public:
    ReportServer(const ServerConfig& config, RecordSource& source, DocumentRenderer& renderer,
        Logger& logger, volatile std::sig_atomic_t* externalStop = nullptr);
    ~ReportServer();

    ReportServer(const ReportServer&) = delete;
    ReportServer& operator=(const ReportServer&) = delete;

    // Binds the listening socket. Throws std::runtime_error.
    void bind();
    std::uint16_t port() const;

    // Accepts until stop() or the external stop signal. Calls bind() if needed.
    void serve();
    // Cancels running jobs and makes serve() return. Safe from any thread.
    void stop();

    // Reads and answers one request on an accepted connection
    void handle(TcpSocket& client);

private:
    void workerLoop(std::size_t slot);

    void handleHealth(TcpSocket& client);
    void handleStream(TcpSocket& client, Job& job);
    void handleBulk(TcpSocket& client, Job& job);
    void handleCombined(TcpSocket& client, Job& job);
    void handleRecord(TcpSocket& client, const Job& job, const std::string& recordId);

    // Replies 500 or 404 itself when there is no job to work on
    std::optional<Job> loadJob(TcpSocket& client, const std::string& jobId);

    void sendBody(TcpSocket& client, int status, const std::string& contentType,
        const std::string& body, const HeaderList& extraHeaders = {});
    void sendJson(TcpSocket& client, int status, const std::string& body);
    void sendError(TcpSocket& client, int status, const std::string& message);

    bool stopRequested() const;

    void track(CancellationToken& token);
    void untrack(CancellationToken& token);

private:
    const ServerConfig& cfg;
    RecordSource& source;
    DocumentRenderer& renderer;
    Logger& logger;
    volatile std::sig_atomic_t* externalStopSignal{ nullptr };

    TcpSocket listener;
    std::atomic<bool> stopFlag{ false };
    std::atomic<bool> poolStop{ false };
    ConnectionQueue connections;

    std::mutex jobsMutex;
    std::set<CancellationToken*> activeJobs;
};
