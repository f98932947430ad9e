#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <thread>
#include <ostream>
#include <condition_variable>
#include <atomic>

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

class Logger {
public:
    Logger();
    explicit Logger(std::ostream& out, LogLevel minLevel = LogLevel::Info);
    ~Logger();

    void start();
    void stop();

    void setLevel(LogLevel level);
    LogLevel level() const;

    void log(LogLevel level, const std::string& msg);
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

private:
    void run();
    static std::string format(LogLevel level, const std::string& msg);

private:
    std::ostream& sink;
    std::atomic<LogLevel> minLevel;

    std::queue<std::string> messages;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{ false };
    std::thread worker;
};
