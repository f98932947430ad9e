#include <gtest/gtest.h>

#include <regex>
#include <sstream>

#include "monitor/Logger.h"

TEST(LoggerTest, LinesCarryTimestampAndLevel) {
    std::ostringstream out;
    Logger logger(out, LogLevel::Info);
    logger.start();
    logger.info("Sending part 1/2: Ram (10 bytes)");
    logger.error("Write failed");
    logger.stop();

    const std::string text = out.str();
    EXPECT_TRUE(std::regex_search(text, std::regex(
        R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3} \[INFO\] Sending part 1/2: Ram \(10 bytes\)\n)")));
    EXPECT_NE(text.find("[ERROR] Write failed\n"), std::string::npos);
}

TEST(LoggerTest, MessagesBelowLevelAreDropped) {
    std::ostringstream out;
    Logger logger(out, LogLevel::Warn);
    logger.start();
    logger.debug("debug line");
    logger.info("info line");
    logger.warn("warn line");
    logger.stop();

    const std::string text = out.str();
    EXPECT_EQ(text.find("debug line"), std::string::npos);
    EXPECT_EQ(text.find("info line"), std::string::npos);
    EXPECT_NE(text.find("[WARN] warn line"), std::string::npos);
}

TEST(LoggerTest, LevelCanBeLoweredAtRuntime) {
    std::ostringstream out;
    Logger logger(out, LogLevel::Info);
    logger.setLevel(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);

    logger.start();
    logger.debug("now visible");
    logger.stop();

    EXPECT_NE(out.str().find("[DEBUG] now visible"), std::string::npos);
}

TEST(LoggerTest, QueuedMessagesAreWrittenInOrderOnStop) {
    std::ostringstream out;
    Logger logger(out, LogLevel::Info);
    logger.info("first");
    logger.start();
    for (int i = 0; i < 100; ++i)
        logger.info("line " + std::to_string(i));
    logger.stop();

    const std::string text = out.str();
    EXPECT_LT(text.find("first"), text.find("line 0\n"));
    EXPECT_LT(text.find("line 0\n"), text.find("line 99\n"));
}
