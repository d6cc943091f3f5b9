#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "core/Logger.hpp"
#include "core/MeshValidator.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>

using namespace neuroforge;
using namespace neuroforge::test;

namespace {

std::string read_text(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

// Redirects a standard stream into a buffer for the lifetime of the object
class StreamCapture {
public:
    explicit StreamCapture(std::ostream& stream)
        : stream_(stream), previous_(stream.rdbuf(buffer_.rdbuf())) {}
    ~StreamCapture() { stream_.rdbuf(previous_); }

    std::string text() const { return buffer_.str(); }

private:
    std::ostream& stream_;
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::INFO);
    }
};

TEST_F(LoggerTest, ObserverReceivesComponentName) {
    LogCapture capture;
    Logger logger("MeshScaler", capture.observer());

    logger.info("Scaling by 2.0");
    logger.warning("Zero extent");

    auto records = capture.records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].component, "MeshScaler");
    EXPECT_EQ(records[0].level, LogLevel::INFO);
    EXPECT_EQ(records[0].message, "Scaling by 2.0");
    EXPECT_EQ(records[1].level, LogLevel::WARNING);
}

TEST_F(LoggerTest, ObserverReceivesEveryLevelRegardlessOfGlobals) {
    LogCapture capture;
    Logger logger("MeshRepairer", capture.observer());

    Logger::setDefaultLevel(LogLevel::ERROR);
    Logger::setFacilityLevel("MeshRepairer", LogLevel::ERROR);
    logger.info("info");
    logger.detailed("detailed");
    logger.debug("debug");
    logger.trace("trace");

    EXPECT_EQ(capture.records().size(), 4u);
    EXPECT_EQ(capture.count(LogLevel::TRACE), 1u);
}

TEST_F(LoggerTest, ValidatorOutcomeReachesObserverUnderRestrictiveDefault) {
    LogCapture capture;
    MeshValidator validator(capture.observer());

    Logger::setDefaultLevel(LogLevel::ERROR);
    ValidationResult result = validator.validate(make_box(10, 10, 10));

    EXPECT_TRUE(result.is_valid());
    EXPECT_TRUE(capture.contains("Mesh validation passed"));
    EXPECT_GE(capture.count(LogLevel::INFO), 1u);
}

TEST_F(LoggerTest, ObserverSeesEveryRepeat) {
    LogCapture capture;
    MeshValidator validator(capture.observer());

    validator.validate(Mesh());
    validator.validate(Mesh());

    EXPECT_EQ(capture.count(LogLevel::ERROR), 2u);
    EXPECT_FALSE(capture.contains("occurred"));
}

TEST_F(LoggerTest, ObserverMayLogThroughSameLogger) {
    std::vector<std::string> seen;
    std::unique_ptr<Logger> logger;
    logger = std::make_unique<Logger>("MeshImporter",
        [&](LogLevel level, const std::string&, const std::string& message) {
            seen.push_back(message);
            if (level == LogLevel::ERROR) {
                logger->info("after error");
            }
        });

    logger->error("read failed");

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "read failed");
    EXPECT_EQ(seen[1], "after error");
}

TEST_F(LoggerTest, ConsoleDefaultLevelFiltersVerboseMessages) {
    TempDir dir("logger_default");
    std::string path = dir.file("console.log");
    {
        Logger logger("MeshRepairer");
        logger.setLogFile(path);
        logger.info("kept info");
        logger.detailed("dropped detailed");

        Logger::setDefaultLevel(LogLevel::ERROR);
        logger.warning("dropped warning");
        StreamCapture errors(std::cerr);
        logger.error("kept error");
    }

    std::string text = read_text(path);
    EXPECT_NE(text.find("kept info"), std::string::npos);
    EXPECT_NE(text.find("kept error"), std::string::npos);
    EXPECT_EQ(text.find("dropped"), std::string::npos);
}

TEST_F(LoggerTest, ConsoleFacilityLevelOverridesDefault) {
    TempDir dir("logger_facility");
    std::string repairer_path = dir.file("repairer.log");
    std::string validator_path = dir.file("validator.log");
    {
        Logger repairer("MeshRepairer");
        Logger validator("MeshValidator");
        repairer.setLogFile(repairer_path);
        validator.setLogFile(validator_path);

        Logger::setFacilityLevel("MeshRepairer", LogLevel::DEBUG);
        repairer.debug("loop details");
        validator.debug("hidden");
    }

    EXPECT_NE(read_text(repairer_path).find("MeshRepairer: loop details"), std::string::npos);
    EXPECT_EQ(read_text(validator_path).find("hidden"), std::string::npos);
}

TEST_F(LoggerTest, ExplicitLevelBeatsDefault) {
    Logger logger("Pipeline");
    logger.setLogLevel(LogLevel::TRACE);

    Logger::setDefaultLevel(LogLevel::ERROR);
    EXPECT_EQ(logger.getEffectiveLevel(), LogLevel::TRACE);
    EXPECT_TRUE(logger.shouldOutput(LogLevel::DEBUG));

    Logger::setFacilityLevel("Pipeline", LogLevel::WARNING);
    EXPECT_EQ(logger.getEffectiveLevel(), LogLevel::WARNING);
}

TEST_F(LoggerTest, ConsoleRepeatsAreCollapsed) {
    TempDir dir("logger_repeat");
    std::string path = dir.file("repeat.log");
    {
        Logger logger(LogLevel::INFO, path);
        logger.info("same");
        logger.info("same");
        logger.info("same");
        logger.info("different");
        logger.warning("again");
        logger.warning("again");
    }

    std::string text = read_text(path);
    EXPECT_NE(text.find("The previous message occurred 3 times."), std::string::npos);
    EXPECT_NE(text.find("[INFO] different"), std::string::npos);
    EXPECT_NE(text.find("The previous message occurred 2 times."), std::string::npos);
}

TEST_F(LoggerTest, ErrorsGoToStderr) {
    StreamCapture out(std::cout);
    StreamCapture err(std::cerr);
    {
        Logger logger("MeshExporter");
        logger.error("disk full");
        logger.info("written");
    }

    EXPECT_NE(err.text().find("[ERROR] MeshExporter: disk full"), std::string::npos);
    EXPECT_EQ(out.text().find("disk full"), std::string::npos);
    EXPECT_NE(out.text().find("[INFO] MeshExporter: written"), std::string::npos);
}

TEST_F(LoggerTest, ParseLogConfig) {
    EXPECT_TRUE(Logger::parseLogConfig("2,MeshRepairer=6, MeshValidator = 4"));
    EXPECT_EQ(Logger::getFacilityLevel("MeshRepairer"), LogLevel::TRACE);
    EXPECT_EQ(Logger::getFacilityLevel("MeshValidator"), LogLevel::DETAILED);
    EXPECT_EQ(Logger::getFacilityLevel("MeshScaler"), LogLevel::WARNING);

    EXPECT_TRUE(Logger::parseLogConfig("default=5"));
    EXPECT_EQ(Logger::getFacilityLevel("MeshScaler"), LogLevel::DEBUG);

    EXPECT_TRUE(Logger::parseLogConfig("MeshExporter=99"));
    EXPECT_EQ(Logger::getFacilityLevel("MeshExporter"), LogLevel::TRACE);
}

TEST_F(LoggerTest, ParseLogConfigRejectsBadTokens) {
    EXPECT_FALSE(Logger::parseLogConfig("loud"));
    EXPECT_FALSE(Logger::parseLogConfig("MeshRepairer=high,MeshScaler=5"));
    EXPECT_EQ(Logger::getFacilityLevel("MeshScaler"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::getFacilityLevel("MeshRepairer"), LogLevel::INFO);
    EXPECT_TRUE(Logger::parseLogConfig(""));
}

TEST_F(LoggerTest, FileLoggerAppends) {
    TempDir dir("logger_file");
    std::string path = dir.file("logs/prep.log");
    {
        Logger logger(LogLevel::DETAILED, path);
        logger.detailed("first line");
        logger.debug("filtered");
    }
    {
        Logger logger(LogLevel::INFO, path);
        logger.info("second line");
    }

    std::string text = read_text(path);
    EXPECT_NE(text.find("[DETAILED] first line"), std::string::npos);
    EXPECT_NE(text.find("[INFO] second line"), std::string::npos);
    EXPECT_EQ(text.find("filtered"), std::string::npos);
}

TEST_F(LoggerTest, LevelNames) {
    EXPECT_STREQ(to_string(LogLevel::ERROR), "ERROR");
    EXPECT_STREQ(to_string(LogLevel::DETAILED), "DETAILED");
    EXPECT_STREQ(to_string(LogLevel::TRACE), "TRACE");
}
