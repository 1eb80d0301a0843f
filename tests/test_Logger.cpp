// tests/test_Logger.cpp
#include <gtest/gtest.h>
#include "Logger.hpp"
#include <QCoreApplication>
#include <QFile>
#include <QTemporaryDir>
#include <memory>

namespace router_monitor {
namespace testing {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        app = std::make_unique<QCoreApplication>(argc, argv);
        auto& logger = Logger::instance();
        logger.clear();
        logger.setLogLevel(LogLevel::Info);
        logger.setLogDestination(LogDestination::File);
        logger.enableTimestamps(false);
        logger.enableSourceInfo(false);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        QObject::disconnect(&logger, nullptr, nullptr, nullptr);
        logger.setLogFile("");
        logger.setLogDestination(LogDestination::Console);
        logger.enableTimestamps(true);
        logger.enableSourceInfo(true);
        logger.clear();
        app.reset();
    }

    int argc{1};
    char appName[5] = "test";
    char* argv[1] = {appName};
    std::unique_ptr<QCoreApplication> app;
};

TEST_F(LoggerTest, FiltersBelowLevel) {
    auto& logger = Logger::instance();
    logger.setLogLevel(LogLevel::Warning);

    logger.debug("hidden");
    logger.info("hidden too");
    logger.warning("shown");
    logger.error("also shown");

    EXPECT_EQ(logger.recentLogs(), (std::vector<std::string>{
        "[WARNING] shown", "[ERROR] also shown"}));
}

TEST_F(LoggerTest, RecentLogsReturnsNewestEntries) {
    auto& logger = Logger::instance();
    logger.info("one");
    logger.info("two");
    logger.info("three");

    EXPECT_EQ(logger.recentLogs(2), (std::vector<std::string>{"[INFO] two", "[INFO] three"}));
}

TEST_F(LoggerTest, SourceInfoUsesBaseName) {
    auto& logger = Logger::instance();
    logger.enableSourceInfo(true);
    logger.info("hello", "/some/path/RouterDevice.cpp", "connect");

    ASSERT_EQ(logger.recentLogs(1).size(), 1u);
    EXPECT_EQ(logger.recentLogs(1).front(), "[INFO] RouterDevice.cpp:connect - hello");
}

TEST_F(LoggerTest, EmitsLogAdded) {
    auto& logger = Logger::instance();
    std::vector<std::string> messages;
    QObject::connect(&logger, &Logger::logAdded,
        [&messages](LogLevel level, const std::string& message) {
            if (level == LogLevel::Error) {
                messages.push_back(message);
            }
        });

    logger.info("ignored");
    RM_LOG_ERROR("went wrong");

    EXPECT_EQ(messages, std::vector<std::string>{"went wrong"});
}

TEST_F(LoggerTest, WritesToFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("router-monitor.log");
    auto& logger = Logger::instance();
    logger.setLogFile(path.toStdString());

    logger.info("to file");
    logger.flush();
    logger.setLogFile("");

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    EXPECT_EQ(file.readAll().trimmed().toStdString(), "[INFO] to file");
}

TEST_F(LoggerTest, LevelConversions) {
    EXPECT_EQ(Logger::levelFromInt(0), LogLevel::Debug);
    EXPECT_EQ(Logger::levelFromInt(4), LogLevel::Critical);
    EXPECT_EQ(Logger::levelFromInt(99), LogLevel::Info);
    EXPECT_EQ(Logger::levelName(LogLevel::Warning), "WARNING");
}

} // namespace testing
} // namespace router_monitor
