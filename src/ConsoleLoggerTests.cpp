#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>
#include "utils/ConsoleLogger.hpp"

// 临时替换std::cout/std::cerr的缓冲区
class StreamCapture {
private:
    std::ostream& stream;
    std::streambuf* original;
    std::ostringstream buffer;

public:
    explicit StreamCapture(std::ostream& target) : stream(target), original(target.rdbuf()) {
        stream.rdbuf(buffer.rdbuf());
    }
    ~StreamCapture() {
        stream.rdbuf(original);
    }
    std::string str() const {
        return buffer.str();
    }
};

TEST(ConsoleLoggerTest, FiltersBelowThreshold) {
    ConsoleLogger logger(LogLevel::WARNING);
    StreamCapture out(std::cout);
    logger.info("hidden message");
    logger.debug("hidden debug");
    logger.warn("visible warning");
    EXPECT_EQ(std::string::npos, out.str().find("hidden"));
    EXPECT_NE(std::string::npos, out.str().find("[WARN] visible warning"));
}

TEST(ConsoleLoggerTest, ErrorsGoToStderr) {
    ConsoleLogger logger;
    StreamCapture err(std::cerr);
    StreamCapture out(std::cout);
    logger.error("disk full");
    EXPECT_NE(std::string::npos, err.str().find("[ERROR] disk full"));
    EXPECT_TRUE(out.str().empty());
}

TEST(ConsoleLoggerTest, LevelCanBeChanged) {
    ConsoleLogger logger;
    EXPECT_EQ(LogLevel::INFO, logger.getLogLevel());
    logger.setLogLevel(LogLevel::DEBUG);
    EXPECT_EQ(LogLevel::DEBUG, logger.getLogLevel());
}

TEST(ConsoleLoggerTest, ParseLogLevelNames) {
    EXPECT_EQ(LogLevel::DEBUG, parseLogLevel("DEBUG"));
    EXPECT_EQ(LogLevel::WARNING, parseLogLevel("warning"));
    EXPECT_EQ(LogLevel::WARNING, parseLogLevel("warn"));
    EXPECT_EQ(LogLevel::ERROR_LEVEL, parseLogLevel("Error"));
    EXPECT_EQ(LogLevel::INFO, parseLogLevel("info"));
    EXPECT_EQ(LogLevel::INFO, parseLogLevel("verbose"));
}

TEST(ConsoleLoggerTest, LevelNames) {
    EXPECT_EQ("DEBUG", toString(LogLevel::DEBUG));
    EXPECT_EQ("WARN", toString(LogLevel::WARNING));
    EXPECT_EQ("ERROR", toString(LogLevel::ERROR_LEVEL));
}
