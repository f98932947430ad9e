#include "Logger.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace {
const char* levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}
}

Logger::Logger()
    : Logger(std::cout) {
}

Logger::Logger(std::ostream& out, LogLevel level)
    : sink(out), minLevel(level) {
}

Logger::~Logger() {
    stop();
}

void Logger::start() {
    if (running.exchange(true))
        return;
    worker = std::thread(&Logger::run, this);
}

void Logger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();

    if (worker.joinable())
        worker.join();
}

void Logger::setLevel(LogLevel level) {
    minLevel.store(level);
}

LogLevel Logger::level() const {
    return minLevel.load();
}

void Logger::log(LogLevel level, const std::string& msg) {
    if (level < minLevel.load())
        return;

    {
        std::lock_guard<std::mutex> lock(mtx);
        messages.push(format(level, msg));
    }
    cv.notify_one();
}

std::string Logger::format(LogLevel level, const std::string& msg) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream os;
    os << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count()
        << " [" << levelTag(level) << "] " << msg;
    return os.str();
}

void Logger::run() {
    std::unique_lock<std::mutex> lock(mtx);
    while (running.load() || !messages.empty()) {
        cv.wait(lock, [&]() {
            return !messages.empty() || !running.load();
            });

        while (!messages.empty()) {
            sink << messages.front() << std::endl;
            messages.pop();
        }
    }
}
