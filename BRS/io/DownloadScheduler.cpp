#include "DownloadScheduler.h"
#include "FileWriter.h"

#include <filesystem>

DownloadScheduler::DownloadScheduler(SaveFn save, std::chrono::milliseconds interval, Logger& log)
    : saveFn(std::move(save)),
    spacing(interval),
    logger(log) {
}

DownloadScheduler::~DownloadScheduler() {
    stop();
}

void DownloadScheduler::start() {
    std::lock_guard<std::mutex> lock(mtx);
    if (running)
        return;

    running = true;
    aborted = false;
    worker = std::thread(&DownloadScheduler::run, this);
}

void DownloadScheduler::enqueue(DecodedPart part) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        pending.push(std::move(part));
    }
    cv.notify_one();
}

void DownloadScheduler::drain() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running = false;
    }
    cv.notify_all();

    if (worker.joinable())
        worker.join();
}

void DownloadScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running = false;
        aborted = true;
        std::queue<DecodedPart>().swap(pending);
    }
    cv.notify_all();

    if (worker.joinable())
        worker.join();
}

void DownloadScheduler::run() {
    bool first = true;
    auto lastTrigger = std::chrono::steady_clock::now();

    std::unique_lock<std::mutex> lock(mtx);
    while (true) {
        cv.wait(lock, [&]() {
            return !pending.empty() || !running || aborted;
            });

        if (aborted)
            break;
        if (pending.empty()) {
            if (!running)
                break;
            continue;
        }

        if (!first) {
            const auto due = lastTrigger + spacing;
            cv.wait_until(lock, due, [&]() {
                return aborted;
                });
            if (aborted)
                break;
        }

        DecodedPart part = std::move(pending.front());
        pending.pop();
        first = false;
        lastTrigger = std::chrono::steady_clock::now();

        lock.unlock();

        bool ok = false;
        try {
            ok = saveFn(part);
        }
        catch (const std::exception& e) {
            logger.error("Saving " + part.displayName + " threw: " + e.what());
        }

        ++triggeredCount;
        if (ok) {
            ++savedCount;
        }
        else {
            ++failedCount;
            logger.warn("Could not save document " + std::to_string(part.index + 1)
                + " (" + part.displayName + ")");
        }

        lock.lock();
    }
}

DownloadScheduler::SaveFn DownloadScheduler::saveToDirectory(const std::string& dir, Logger& logger) {
    return [dir, &logger](const DecodedPart& part) {
        std::error_code ec;
        std::filesystem::create_directories(dir.empty() ? "." : dir, ec);
        if (ec) {
            logger.error("Cannot create output directory " + dir + ": " + ec.message());
            return false;
        }

        const std::string base = FileWriter::sanitizeFileName(
            part.displayName.empty() ? part.id : part.displayName);
        const std::string path = FileWriter::uniquePath(dir, base, ".pdf");

        if (!FileWriter::writeWhole(path, part.bytes.data(), part.bytes.size())) {
            logger.error("Failed to write " + path);
            return false;
        }

        logger.info("Saved " + path + " (" + std::to_string(part.bytes.size()) + " bytes)");
        return true;
    };
}
