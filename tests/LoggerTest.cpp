#include <sstream>
#include <string>
#include <gtest/gtest.h>

#include "monitor/Logger.h"

namespace bdmtest {

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    std::ostringstream sink;
    Logger logger(sink);

    logger.log(LogLevel::Debug, "hidden");
    logger.log("shown");
    logger.log(LogLevel::Error, "broken");

    EXPECT_EQ(sink.str(), "[INFO] shown\n[ERROR] broken\n");
}

TEST(LoggerTest, SetMinLevelEnablesDebug) {
    std::ostringstream sink;
    Logger logger(sink);
    EXPECT_FALSE(logger.enabled(LogLevel::Debug));

    logger.setMinLevel(LogLevel::Debug);
    EXPECT_TRUE(logger.enabled(LogLevel::Debug));
    logger.log(LogLevel::Debug, "range bytes=0-9");

    logger.setMinLevel(LogLevel::Warn);
    logger.log("progress");
    logger.log(LogLevel::Warn, "attempt failed");

    EXPECT_EQ(sink.str(), "[DEBUG] range bytes=0-9\n[WARN] attempt failed\n");
}

TEST(LoggerTest, StopFlushesQueuedMessagesInOrder) {
    std::ostringstream sink;
    Logger logger(sink);
    logger.start();

    for (int i = 0; i < 100; ++i)
        logger.log("line " + std::to_string(i));
    logger.stop();

    std::string expected;
    for (int i = 0; i < 100; ++i)
        expected += "[INFO] line " + std::to_string(i) + "\n";
    EXPECT_EQ(sink.str(), expected);
}

} // namespace bdmtest
