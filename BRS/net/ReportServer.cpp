#include "ReportServer.h"
#include "BulkJsonCodec.h"
#include "Encoding.h"
#include "SocketResponse.h"
#include "../core/errors.h"
#include "../core/StreamController.h"
#include "../core/StreamProducer.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace {
constexpr int kAcceptPollMs = 200;
constexpr long kRequestTimeoutSec = 30;
constexpr std::size_t kQueuePerWorker = 16;
constexpr std::chrono::milliseconds kReplyTimeout{ 10000 };
constexpr std::chrono::milliseconds kWorkerPoll{ 200 };

// Keeps only the records named in { "ids": [...] }, in job order. An empty body or one
// without "ids" keeps every record.
bool selectRecords(const std::string& body, Job& job, std::string& error) {
    if (body.find_first_not_of(" \t\r\n") == std::string::npos)
        return true;

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    }
    catch (const nlohmann::json::exception& e) {
        error = std::string("request body is not valid JSON: ") + e.what();
        return false;
    }

    if (!doc.is_object()) {
        error = "request body must be a JSON object";
        return false;
    }
    if (!doc.contains("ids"))
        return true;

    const auto& ids = doc["ids"];
    if (!ids.is_array()) {
        error = "\"ids\" must be an array of record ids";
        return false;
    }

    std::set<std::string> wanted;
    for (const auto& id : ids) {
        if (!id.is_string()) {
            error = "\"ids\" must be an array of record ids";
            return false;
        }
        wanted.insert(id.get<std::string>());
    }

    std::vector<RecordRef> selected;
    for (auto& record : job.items) {
        if (wanted.count(record.id))
            selected.push_back(std::move(record));
    }
    job.items = std::move(selected);
    return true;
}
}

ReportServer::ReportServer(const ServerConfig& config, RecordSource& src, DocumentRenderer& r,
    Logger& log, volatile std::sig_atomic_t* externalStop)
    : cfg(config),
    source(src),
    renderer(r),
    logger(log),
    externalStopSignal(externalStop),
    connections((config.workers == 0 ? 1 : config.workers) * kQueuePerWorker) {
}

ReportServer::~ReportServer() {
    stop();
}

void ReportServer::bind() {
    listener = TcpSocket::listenOn(cfg.bindAddress, cfg.port);
}

std::uint16_t ReportServer::port() const {
    return listener.isValid() ? listener.localPort() : 0;
}

bool ReportServer::stopRequested() const {
    if (externalStopSignal && *externalStopSignal != 0)
        return true;
    return stopFlag.load();
}

void ReportServer::stop() {
    stopFlag.store(true);

    std::lock_guard<std::mutex> lock(jobsMutex);
    for (auto* token : activeJobs)
        token->cancel();
}

void ReportServer::track(CancellationToken& token) {
    std::lock_guard<std::mutex> lock(jobsMutex);
    activeJobs.insert(&token);
    if (stopFlag.load())
        token.cancel();
}

void ReportServer::untrack(CancellationToken& token) {
    std::lock_guard<std::mutex> lock(jobsMutex);
    activeJobs.erase(&token);
}

void ReportServer::serve() {
    if (!listener.isValid())
        bind();

    const std::size_t workers = cfg.workers == 0 ? 1 : cfg.workers;
    logger.info("Listening on " + (cfg.bindAddress.empty() ? std::string("0.0.0.0") : cfg.bindAddress)
        + ":" + std::to_string(port()) + " with " + std::to_string(workers)
        + " workers, jobs from " + cfg.dataDir);

    poolStop.store(false);
    ThreadPool pool(poolStop);
    pool.start(workers, [this](std::size_t slot) {
        workerLoop(slot);
        });

    while (!stopRequested()) {
        TcpSocket client;
        if (!listener.acceptWithin(kAcceptPollMs, client))
            continue;

        if (!connections.push(client)) {
            logger.warn("All workers busy, refusing connection from " + client.peerAddr());
            sendError(client, 503, "server busy");
        }
    }

    logger.info("Shutting down");
    stop();
    connections.close();
    pool.shutdown();
    listener.close();
    logger.info("Server stopped");
}

void ReportServer::workerLoop(std::size_t slot) {
    logger.debug("Worker " + std::to_string(slot) + " started");

    while (!poolStop.load()) {
        auto connection = connections.popFor(kWorkerPoll);
        if (!connection.has_value())
            continue;

        try {
            handle(*connection);
        }
        catch (const std::exception& e) {
            logger.error("Worker " + std::to_string(slot) + ": request failed: " + e.what());
        }
    }

    logger.debug("Worker " + std::to_string(slot) + " stopped");
}

void ReportServer::handle(TcpSocket& client) {
    client.setTimeouts(kRequestTimeoutSec);

    HttpRequest request;
    std::string error;
    switch (HttpRequestReader::read(client, request, error)) {
    case ReadStatus::Ok:
        break;
    case ReadStatus::Closed:
        if (!error.empty())
            logger.debug("Dropping connection from " + client.peerAddr() + ": " + error);
        return;
    case ReadStatus::Malformed:
        sendError(client, 400, error);
        return;
    case ReadStatus::TooLarge:
        sendError(client, 413, error);
        return;
    }

    logger.debug(request.method + " " + request.target + " from " + client.peerAddr());

    if (request.path == "/health") {
        if (request.method != "GET") {
            sendError(client, 405, "method " + request.method + " not allowed on /health");
            return;
        }
        handleHealth(client);
        return;
    }

    const std::string prefix = "/jobs/";
    if (request.path.compare(0, prefix.size(), prefix) != 0) {
        sendError(client, 404, "no route for " + request.path);
        return;
    }

    const std::string rest = request.path.substr(prefix.size());
    const auto slash = rest.find('/');
    const std::string jobId = rest.substr(0, slash);
    const std::string action = slash == std::string::npos ? std::string() : rest.substr(slash + 1);

    const std::string recordPrefix = "records/";
    std::string recordId;
    if (action.compare(0, recordPrefix.size(), recordPrefix) == 0)
        recordId = action.substr(recordPrefix.size());

    const bool known = action == "stream" || action == "bulk" || action == "combined" || !recordId.empty();
    if (jobId.empty() || !known) {
        sendError(client, 404, "no route for " + request.path);
        return;
    }
    if (request.method != "POST") {
        sendError(client, 405, "method " + request.method + " not allowed on " + request.path);
        return;
    }

    auto job = loadJob(client, jobId);
    if (!job.has_value())
        return;

    if (!recordId.empty()) {
        handleRecord(client, *job, recordId);
        return;
    }

    std::string selectionError;
    if (!selectRecords(request.body, *job, selectionError)) {
        sendError(client, 400, selectionError);
        return;
    }
    if (job->items.empty()) {
        sendError(client, 404, "none of the requested records are in job " + jobId);
        return;
    }

    if (action == "stream")
        handleStream(client, *job);
    else if (action == "bulk")
        handleBulk(client, *job);
    else
        handleCombined(client, *job);
}

void ReportServer::handleHealth(TcpSocket& client) {
    const nlohmann::json body{
        { "status", "ok" },
        { "service", "report streaming" }
    };
    sendJson(client, 200, body.dump());
}

std::optional<Job> ReportServer::loadJob(TcpSocket& client, const std::string& jobId) {
    std::optional<Job> job;
    try {
        job = source.load(jobId);
    }
    catch (const std::exception& e) {
        logger.error("Cannot load job " + jobId + ": " + e.what());
        sendError(client, 500, "job " + jobId + " could not be loaded");
        return std::nullopt;
    }

    if (!job.has_value()) {
        sendError(client, 404, "job " + jobId + " not found");
        return std::nullopt;
    }
    if (job->items.empty()) {
        sendError(client, 404, "job " + jobId + " has no records");
        return std::nullopt;
    }
    return job;
}

void ReportServer::handleStream(TcpSocket& client, Job& job) {
    client.setTimeouts(cfg.streamTimeoutSec);
    SocketResponse response(client, cfg.highWaterBytes, std::chrono::seconds(cfg.streamTimeoutSec));
    StreamController controller(renderer, logger, cfg.streamTimeoutSec);

    CancellationToken cancel;
    track(cancel);

    try {
        controller.run(job, response, cancel, encoding::makeBoundary());
    }
    catch (const NoWorkError& e) {
        untrack(cancel);
        logger.info("Job " + job.id + " not streamed: " + e.what());
        sendError(client, 404, e.what());
        return;
    }
    catch (const std::exception&) {
        untrack(cancel);
        response.abort();
        throw;
    }

    untrack(cancel);
}

void ReportServer::handleBulk(TcpSocket& client, Job& job) {
    const auto startTime = std::chrono::steady_clock::now();

    StreamProducer producer(job, renderer, logger);
    const std::string body = BulkJsonCodec::encode(job.id, job.total(), producer);

    const std::chrono::duration<double> duration = std::chrono::steady_clock::now() - startTime;
    std::ostringstream os;
    os << "Bulk job " << job.id << ": rendered " << producer.delivered() << "/" << job.total()
        << " in " << std::fixed << std::setprecision(2) << duration.count() << "s, "
        << body.size() << " bytes";
    if (!producer.skipped().empty())
        os << ", " << producer.skipped().size() << " skipped";
    logger.info(os.str());

    client.setTimeouts(cfg.streamTimeoutSec);
    sendJson(client, 200, body);
}

void ReportServer::handleCombined(TcpSocket& client, Job& job) {
    const std::string name = job.title.empty() ? job.id : job.title;

    std::vector<SkippedItem> skipped;
    std::vector<char> document;
    try {
        document = renderer.renderCombined(job.items, skipped);
    }
    catch (const std::exception& e) {
        logger.warn("Combined document for job " + job.id + " failed: " + e.what());
        sendError(client, 500, "job " + job.id + " could not be rendered: " + e.what());
        return;
    }

    for (const auto& item : skipped)
        logger.warn("Left " + item.displayName + " (" + item.id + ") out of the combined document: " + item.reason);
    logger.info("Combined job " + job.id + ": " + std::to_string(job.total() - skipped.size()) + "/"
        + std::to_string(job.total()) + " records, " + std::to_string(document.size()) + " bytes");

    client.setTimeouts(cfg.streamTimeoutSec);
    sendBody(client, 200, "application/pdf", std::string(document.begin(), document.end()), {
        { "Content-Disposition", "attachment; filename=\"" + encoding::percentEncode(name) + ".pdf\"" },
        { "X-Display-Name", encoding::percentEncode(name) },
        { "X-Total-Count", std::to_string(job.total()) },
        { "X-Skipped-Count", std::to_string(skipped.size()) }
        });
}

void ReportServer::handleRecord(TcpSocket& client, const Job& job, const std::string& recordId) {
    const auto it = std::find_if(job.items.begin(), job.items.end(),
        [&](const RecordRef& r) { return r.id == recordId; });
    if (it == job.items.end()) {
        sendError(client, 404, "record " + recordId + " not in job " + job.id);
        return;
    }

    std::vector<char> document;
    try {
        document = renderer.render(*it);
    }
    catch (const std::exception& e) {
        logger.warn("Record " + recordId + " of job " + job.id + " failed: " + e.what());
        sendError(client, 500, "record " + recordId + " could not be rendered: " + e.what());
        return;
    }

    logger.info("Record " + recordId + " of job " + job.id + ": " + std::to_string(document.size()) + " bytes");

    const std::string name = encoding::percentEncode(it->displayName);
    sendBody(client, 200, "application/pdf", std::string(document.begin(), document.end()), {
        { "Content-Disposition", "attachment; filename=\"" + name + ".pdf\"" },
        { "X-Display-Name", name },
        { "X-Record-Id", encoding::percentEncode(it->id) },
        { "X-Index", std::to_string(static_cast<std::size_t>(it - job.items.begin())) }
        });
}

void ReportServer::sendBody(TcpSocket& client, int status, const std::string& contentType,
    const std::string& body, const HeaderList& extraHeaders) {
    SocketResponse response(client, body.size() + 1, kReplyTimeout);

    HeaderList headers{
        { "Content-Type", contentType },
        { "Content-Length", std::to_string(body.size()) },
        { "Cache-Control", "no-cache" },
        { "Connection", "close" }
    };
    headers.insert(headers.end(), extraHeaders.begin(), extraHeaders.end());

    if (!response.sendHead(status, headers)
        || response.write(body.data(), body.size()) == WriteStatus::Closed
        || !response.end()) {
        logger.warn("Could not deliver " + std::to_string(status) + " reply to " + client.peerAddr());
    }
}

void ReportServer::sendJson(TcpSocket& client, int status, const std::string& body) {
    sendBody(client, status, "application/json", body);
}

void ReportServer::sendError(TcpSocket& client, int status, const std::string& message) {
    if (status >= 500)
        logger.error("Replying " + std::to_string(status) + ": " + message);
    else
        logger.debug("Replying " + std::to_string(status) + ": " + message);

    const nlohmann::json body{ { "error", message } };
    sendJson(client, status, body.dump());
}
