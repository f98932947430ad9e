#include <iostream>
#include <iomanip>
#include <sstream>
#include <csignal>
#include "cli/ArgumentParser.h"
#include "core/FetchController.h"
#include "io/DownloadScheduler.h"
#include "io/ManifestRecordSource.h"
#include "io/TextPdfRenderer.h"
#include "monitor/Logger.h"
#include "monitor/ProgressTracker.h"
#include "net/ReportServer.h"
using namespace std;

namespace {
volatile std::sig_atomic_t gStopRequested = 0;

void handleSignal(int) {
    gStopRequested = 1;
}

int runServe(const AppConfig& config, Logger& logger) {
    ManifestRecordSource source(config.server.dataDir);
    TextPdfRenderer renderer(config.server.requiredFields);
    ReportServer server(config.server, source, renderer, logger, &gStopRequested);

    try {
        server.serve();
    }
    catch (const std::exception& e) {
        logger.error(std::string("Server failed: ") + e.what());
        return 1;
    }
    return 0;
}

int runFetch(const AppConfig& config, Logger& logger) {
    ProgressTracker progress;

    // Console rendering of the shared progress state
    progress.subscribe([&logger, &progress](const ProgressState& state) {
        if (state.hasError) {
            logger.error(state.title + ": " + state.errorMessage);
            return;
        }
        if (state.isCompleted) {
            logger.info(state.title + ": done, " + std::to_string(state.total) + " documents");
            return;
        }
        if (!state.isActive || state.currentName.empty())
            return;

        std::ostringstream os;
        os << state.title << ": " << state.current << "/" << state.total;
        if (state.total > 0) {
            os << " (" << std::fixed << std::setprecision(1)
                << (100.0 * static_cast<double>(state.current) / static_cast<double>(state.total)) << "%)";
        }
        os << " " << state.currentName << ", " << std::fixed << std::setprecision(1)
            << progress.itemsPerSec() << " docs/s";
        logger.info(os.str());
        });

    FetchController controller(config.fetch, progress, logger,
        DownloadScheduler::saveToDirectory(config.fetch.outputDir, logger), &gStopRequested);

    const FetchReport report = controller.run();
    switch (report.outcome) {
    case FetchOutcome::Completed:
        return report.failedSaves == 0 ? 0 : 1;
    case FetchOutcome::NotFound:
        return 2;
    case FetchOutcome::Cancelled:
        return 130;
    case FetchOutcome::Failed:
        break;
    }
    return 1;
}
}

int main(int argc, char* argv[]) {
    AppConfig config;
    ArgumentParser parser;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
    std::signal(SIGPIPE, SIG_IGN);

    if (!parser.parse(argc, argv, config))
        return 1;

    Logger logger(cout, config.logLevel);
    logger.start();

    const int rc = config.command == Command::Serve
        ? runServe(config, logger)
        : runFetch(config, logger);

    logger.stop();
    return rc;
}
