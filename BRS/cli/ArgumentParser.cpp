#include "ArgumentParser.h"
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {
constexpr std::uint16_t kDefaultPort = 8080;
constexpr std::size_t kDefaultWorkers = 4;
constexpr long kDefaultTimeoutSec = 600;
constexpr std::size_t kDefaultHighWater = 256 * 1024;
constexpr long kDefaultIntervalMs = 100;

constexpr unsigned long long kMaxTimeoutSec = 7 * 24 * 3600;
constexpr unsigned long long kMaxIntervalMs = 60 * 1000;
constexpr unsigned long long kMaxWorkers = 1024;

// Whole-string unsigned number; throws std::invalid_argument otherwise
unsigned long long toNumber(const std::string& text) {
    if (text.empty() || text[0] == '-' || text[0] == '+')
        throw std::invalid_argument(text);

    std::size_t used = 0;
    const unsigned long long value = std::stoull(text, &used);
    if (used != text.size())
        throw std::invalid_argument(text);
    return value;
}
}

bool ArgumentParser::fail(const std::string& message) {
    errorText = message;
    std::cerr << "brs: " << message << "\n\n";
    printUsage();
    return false;
}

bool ArgumentParser::parse(int argc, char* argv[], AppConfig& out) {
    errorText.clear();

    out.logLevel = LogLevel::Info;

    out.server.dataDir.clear();
    out.server.bindAddress = "0.0.0.0";
    out.server.port = kDefaultPort;
    out.server.workers = kDefaultWorkers;
    out.server.streamTimeoutSec = kDefaultTimeoutSec;
    out.server.highWaterBytes = kDefaultHighWater;
    out.server.requiredFields.clear();

    out.fetch.baseUrl.clear();
    out.fetch.jobId.clear();
    out.fetch.outputDir = ".";
    out.fetch.title.clear();
    out.fetch.bulk = false;
    out.fetch.combined = false;
    out.fetch.recordId.clear();
    out.fetch.onlyIds.clear();
    out.fetch.timeoutSec = kDefaultTimeoutSec;
    out.fetch.intervalMs = kDefaultIntervalMs;

    if (argc < 2)
        return fail("missing command");

    const std::string command = argv[1];
    if (command == "serve") {
        out.command = Command::Serve;
        return parseServe(argc, argv, out);
    }
    if (command == "fetch") {
        out.command = Command::Fetch;
        return parseFetch(argc, argv, out);
    }
    if (command == "-h" || command == "--help") {
        printUsage();
        return false;
    }
    return fail("unknown command '" + command + "'");
}

bool ArgumentParser::parseCommon(const std::string& arg, AppConfig& out) {
    if (arg == "--verbose" || arg == "-v") {
        out.logLevel = LogLevel::Debug;
        return true;
    }
    if (arg == "--quiet" || arg == "-q") {
        out.logLevel = LogLevel::Warn;
        return true;
    }
    return false;
}

bool ArgumentParser::parseServe(int argc, char* argv[], AppConfig& out) {
    ServerConfig& cfg = out.server;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            const bool hasValue = i + 1 < argc;

            if (parseCommon(arg, out))
                continue;

            if ((arg == "--data" || arg == "-d") && hasValue) {
                cfg.dataDir = argv[++i];
            }
            else if ((arg == "--port" || arg == "-p") && hasValue) {
                const auto port = toNumber(argv[++i]);
                if (port > std::numeric_limits<std::uint16_t>::max())
                    return fail("port out of range: " + std::string(argv[i]));
                cfg.port = static_cast<std::uint16_t>(port);
            }
            else if ((arg == "--bind" || arg == "-b") && hasValue) {
                cfg.bindAddress = argv[++i];
            }
            else if ((arg == "--workers" || arg == "-w") && hasValue) {
                const auto workers = toNumber(argv[++i]);
                if (workers > kMaxWorkers)
                    return fail("--workers out of range: " + std::string(argv[i]));
                cfg.workers = static_cast<std::size_t>(workers);
            }
            else if (arg == "--timeout" && hasValue) {
                const auto timeout = toNumber(argv[++i]);
                if (timeout > kMaxTimeoutSec)
                    return fail("--timeout out of range: " + std::string(argv[i]));
                cfg.streamTimeoutSec = static_cast<long>(timeout);
            }
            else if (arg == "--high-water" && hasValue) {
                cfg.highWaterBytes = static_cast<std::size_t>(toNumber(argv[++i]));
            }
            else if (arg == "--require" && hasValue) {
                cfg.requiredFields.push_back(argv[++i]);
            }
            else {
                return fail("unexpected argument '" + arg + "'");
            }
        }
    }
    catch (const std::exception&) {
        return fail("invalid number in arguments");
    }

    if (cfg.dataDir.empty())
        return fail("serve needs --data <dir>");
    if (cfg.workers == 0)
        return fail("--workers must be at least 1");
    if (cfg.streamTimeoutSec == 0)
        return fail("--timeout must be at least 1 second");
    if (cfg.highWaterBytes == 0)
        return fail("--high-water must be at least 1 byte");

    return true;
}

bool ArgumentParser::parseFetch(int argc, char* argv[], AppConfig& out) {
    FetchConfig& cfg = out.fetch;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            const bool hasValue = i + 1 < argc;

            if (parseCommon(arg, out))
                continue;

            if (arg == "-o" && hasValue) {
                cfg.outputDir = argv[++i];
            }
            else if (arg == "--bulk") {
                cfg.bulk = true;
            }
            else if (arg == "--combined") {
                cfg.combined = true;
            }
            else if (arg == "--record" && hasValue) {
                cfg.recordId = argv[++i];
            }
            else if (arg == "--only" && hasValue) {
                cfg.onlyIds.push_back(argv[++i]);
            }
            else if (arg == "--interval" && hasValue) {
                const auto interval = toNumber(argv[++i]);
                if (interval > kMaxIntervalMs)
                    return fail("--interval out of range: " + std::string(argv[i]));
                cfg.intervalMs = static_cast<long>(interval);
            }
            else if (arg == "--timeout" && hasValue) {
                const auto timeout = toNumber(argv[++i]);
                if (timeout > kMaxTimeoutSec)
                    return fail("--timeout out of range: " + std::string(argv[i]));
                cfg.timeoutSec = static_cast<long>(timeout);
            }
            else if (arg == "--title" && hasValue) {
                cfg.title = argv[++i];
            }
            else if (!arg.empty() && arg[0] == '-') {
                return fail("unexpected argument '" + arg + "'");
            }
            else if (cfg.baseUrl.empty()) {
                cfg.baseUrl = arg;
            }
            else if (cfg.jobId.empty()) {
                cfg.jobId = arg;
            }
            else {
                return fail("unexpected argument '" + arg + "'");
            }
        }
    }
    catch (const std::exception&) {
        return fail("invalid number in arguments");
    }

    if (cfg.baseUrl.empty() || cfg.jobId.empty())
        return fail("fetch needs <base-url> and <job-id>");
    if (cfg.timeoutSec == 0)
        return fail("--timeout must be at least 1 second");
    if (!cfg.recordId.empty() && (cfg.bulk || cfg.combined || !cfg.onlyIds.empty()))
        return fail("--record cannot be combined with --bulk, --combined or --only");
    if (cfg.bulk && cfg.combined)
        return fail("--bulk and --combined are alternatives");
    if (cfg.outputDir.empty())
        cfg.outputDir = ".";

    return true;
}

void ArgumentParser::printUsage() const {
    std::cerr <<
        "Usage:\n"
        "  brs serve --data <dir> [options]\n"
        "  brs fetch <base-url> <job-id> [options]\n\n"
        "Serve options:\n"
        "  -d, --data <dir>     Directory holding <job-id>.job manifests\n"
        "  -p, --port <port>    Listen port (default: 8080)\n"
        "  -b, --bind <addr>    Bind address (default: 0.0.0.0)\n"
        "  -w, --workers <n>    Connection workers (default: 4)\n"
        "  --timeout <sec>      Streaming read/write timeout (default: 600)\n"
        "  --high-water <bytes> Unsent bytes before backpressure (default: 262144)\n"
        "  --require <field>    Field every record must have; repeatable\n\n"
        "Fetch options:\n"
        "  -o <dir>             Output directory (default: .)\n"
        "  --bulk               Use the single JSON response instead of streaming\n"
        "  --combined           Save the job as one PDF with a page per record\n"
        "  --record <id>        Save only this record's PDF\n"
        "  --only <id>          Limit the job to this record; repeatable\n"
        "  --interval <ms>      Pause between saved files (default: 100)\n"
        "  --timeout <sec>      Give up after this long without data (default: 600)\n"
        "  --title <text>       Progress title (default: Downloading Reports)\n\n"
        "Common:\n"
        "  -v, --verbose        Debug logging\n"
        "  -q, --quiet          Warnings and errors only\n";
}
