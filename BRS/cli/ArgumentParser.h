#pragma once
#include <string>
#include "../core/utils.h"
#include "../monitor/Logger.h"

enum class Command {
    Serve,
    Fetch
};

struct AppConfig {
    Command command = Command::Serve;
    LogLevel logLevel = LogLevel::Info;
    ServerConfig server;
    FetchConfig fetch;
};

class ArgumentParser {
public:
    // False on bad input; the reason and the usage text go to stderr
    bool parse(int argc, char* argv[], AppConfig& out);

    const std::string& lastError() const { return errorText; }

private:
    bool parseServe(int argc, char* argv[], AppConfig& out);
    bool parseFetch(int argc, char* argv[], AppConfig& out);
    bool parseCommon(const std::string& arg, AppConfig& out);

    bool fail(const std::string& message);
    void printUsage() const;

private:
    std::string errorText;
};
