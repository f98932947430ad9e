#include <gtest/gtest.h>

#include <fstream>
#include <iterator>

#include "fakes.h"
#include "io/DownloadScheduler.h"

namespace {
DecodedPart makePart(std::size_t index, const std::string& id, const std::string& name, const std::string& bytes) {
    DecodedPart part{};
    part.index = index;
    part.id = id;
    part.displayName = name;
    part.bytes.assign(bytes.begin(), bytes.end());
    return part;
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}
}

TEST(DownloadSchedulerTest, SavesInArrivalOrder) {
    QuietLog log;
    std::mutex mtx;
    std::vector<std::string> order;

    DownloadScheduler scheduler([&](const DecodedPart& part) {
        std::lock_guard<std::mutex> lock(mtx);
        order.push_back(part.id);
        return true;
        }, std::chrono::milliseconds(1), log.logger);

    scheduler.start();
    for (int i = 0; i < 5; ++i)
        scheduler.enqueue(makePart(i, "id" + std::to_string(i), "N", "x"));
    scheduler.drain();

    EXPECT_EQ(order, (std::vector<std::string>{ "id0", "id1", "id2", "id3", "id4" }));
    EXPECT_EQ(scheduler.triggered(), 5u);
    EXPECT_EQ(scheduler.saved(), 5u);
    EXPECT_EQ(scheduler.failed(), 0u);
}

TEST(DownloadSchedulerTest, SavesAreSpacedByInterval) {
    QuietLog log;
    std::mutex mtx;
    std::vector<std::chrono::steady_clock::time_point> times;

    DownloadScheduler scheduler([&](const DecodedPart&) {
        std::lock_guard<std::mutex> lock(mtx);
        times.push_back(std::chrono::steady_clock::now());
        return true;
        }, std::chrono::milliseconds(40), log.logger);

    scheduler.start();
    for (int i = 0; i < 4; ++i)
        scheduler.enqueue(makePart(i, std::to_string(i), "N", "x"));
    scheduler.drain();

    ASSERT_EQ(times.size(), 4u);
    for (std::size_t i = 1; i < times.size(); ++i)
        EXPECT_GE(times[i] - times[i - 1], std::chrono::milliseconds(35));
}

TEST(DownloadSchedulerTest, FailedSaveDoesNotStopLaterItems) {
    QuietLog log;
    std::vector<std::string> attempted;

    DownloadScheduler scheduler([&](const DecodedPart& part) {
        attempted.push_back(part.id);
        if (part.id == "c")
            throw std::runtime_error("disk full");
        return part.id != "b";
        }, std::chrono::milliseconds(1), log.logger);

    scheduler.start();
    for (const char* id : { "a", "b", "c", "d" })
        scheduler.enqueue(makePart(0, id, id, "x"));
    scheduler.drain();

    EXPECT_EQ(attempted, (std::vector<std::string>{ "a", "b", "c", "d" }));
    EXPECT_EQ(scheduler.saved(), 2u);
    EXPECT_EQ(scheduler.failed(), 2u);
    EXPECT_EQ(scheduler.triggered(), 4u);
}

TEST(DownloadSchedulerTest, EnqueueNeverWaitsForSaves) {
    QuietLog log;
    DownloadScheduler scheduler([&](const DecodedPart&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return true;
        }, std::chrono::milliseconds(1), log.logger);

    scheduler.start();
    const auto before = std::chrono::steady_clock::now();
    for (int i = 0; i < 3; ++i)
        scheduler.enqueue(makePart(i, std::to_string(i), "N", "x"));
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::milliseconds(80));

    scheduler.drain();
    EXPECT_EQ(scheduler.saved(), 3u);
}

TEST(DownloadSchedulerTest, StopDropsQueuedItems) {
    QuietLog log;
    DownloadScheduler scheduler([&](const DecodedPart&) {
        return true;
        }, std::chrono::milliseconds(200), log.logger);

    scheduler.start();
    for (int i = 0; i < 5; ++i)
        scheduler.enqueue(makePart(i, std::to_string(i), "N", "x"));

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    scheduler.stop();

    EXPECT_LT(scheduler.triggered(), 5u);
}

TEST(DownloadSchedulerTest, SaveToDirectoryKeepsEveryFile) {
    QuietLog log;
    TempDir dir;
    auto save = DownloadScheduler::saveToDirectory(dir.path.string(), log.logger);

    EXPECT_TRUE(save(makePart(0, "a", "Ram", "%PDF-first")));
    EXPECT_TRUE(save(makePart(1, "b", "Ram", "%PDF-second")));
    EXPECT_TRUE(save(makePart(2, "c", "North/South", "%PDF-third")));
    EXPECT_TRUE(save(makePart(3, "d", "", "%PDF-fourth")));

    EXPECT_EQ(readFile(dir.file("Ram.pdf")), "%PDF-first");
    EXPECT_EQ(readFile(dir.file("Ram (2).pdf")), "%PDF-second");
    EXPECT_EQ(readFile(dir.file("North_South.pdf")), "%PDF-third");
    EXPECT_EQ(readFile(dir.file("d.pdf")), "%PDF-fourth");
}

TEST(DownloadSchedulerTest, SaveToDirectoryCreatesOutputDirectory) {
    QuietLog log;
    TempDir dir;
    const std::string nested = dir.file("out/reports");
    auto save = DownloadScheduler::saveToDirectory(nested, log.logger);

    EXPECT_TRUE(save(makePart(0, "a", "Shyam", "bytes")));
    EXPECT_EQ(readFile(nested + "/Shyam.pdf"), "bytes");
}
