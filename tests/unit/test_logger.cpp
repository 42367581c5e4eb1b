#include <gtest/gtest.h>
#include "puresend/core/logger.hpp"
#include <filesystem>
#include <fstream>

using namespace puresend::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file = (std::filesystem::temp_directory_path() / "test_puresend.log").string();
    }

    void TearDown() override {
        Logger::shutdown();
        if (std::filesystem::exists(log_file)) {
            std::filesystem::remove(log_file);
        }
    }

    std::string read_log() {
        Logger::get()->flush();
        std::ifstream file(log_file);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }

    std::string log_file;
};

TEST_F(LoggerTest, Initialize) {
    ASSERT_TRUE(Logger::initialize(log_file, LogLevel::Debug));

    EXPECT_NE(Logger::get(), nullptr);
    EXPECT_TRUE(std::filesystem::exists(log_file));
}

TEST_F(LoggerTest, LogMessages) {
    Logger::initialize(log_file, LogLevel::Debug);

    LOG_DEBUG("Debug message: {}", 123);
    LOG_INFO("Info message: {}", "test");
    LOG_WARN("Warning message");
    LOG_ERROR("Error message");
    LOG_CRITICAL("Critical message");

    auto content = read_log();

    EXPECT_TRUE(content.find("Debug message: 123") != std::string::npos);
    EXPECT_TRUE(content.find("Info message: test") != std::string::npos);
    EXPECT_TRUE(content.find("Warning message") != std::string::npos);
    EXPECT_TRUE(content.find("Error message") != std::string::npos);
    EXPECT_TRUE(content.find("Critical message") != std::string::npos);
}

TEST_F(LoggerTest, LogLevel) {
    Logger::initialize(log_file, LogLevel::Warn);

    LOG_DEBUG("Debug message");
    LOG_INFO("Info message");
    LOG_WARN("Warning message");

    auto content = read_log();

    EXPECT_TRUE(content.find("Debug message") == std::string::npos);
    EXPECT_TRUE(content.find("Info message") == std::string::npos);
    EXPECT_TRUE(content.find("Warning message") != std::string::npos);
}

TEST_F(LoggerTest, LevelChangesAtRuntime) {
    Logger::initialize(log_file, LogLevel::Warn);
    LOG_INFO("Quiet info");

    Logger::set_level(LogLevel::Debug);
    LOG_DEBUG("Loud debug");

    auto content = read_log();
    EXPECT_EQ(content.find("Quiet info"), std::string::npos);
    EXPECT_NE(content.find("Loud debug"), std::string::npos);
}

TEST_F(LoggerTest, CreatesLogDirectory) {
    auto nested = std::filesystem::temp_directory_path() / "puresend_log_dir" / "logs" / "app.log";
    std::filesystem::remove_all(nested.parent_path().parent_path());

    ASSERT_TRUE(Logger::initialize(nested.string(), LogLevel::Info));
    EXPECT_TRUE(std::filesystem::exists(nested));

    Logger::shutdown();
    std::filesystem::remove_all(nested.parent_path().parent_path());
}

TEST_F(LoggerTest, UnwritableFileFallsBackToConsole) {
    auto blocker = std::filesystem::temp_directory_path() / "puresend_log_blocker";
    std::ofstream(blocker) << "not a directory";

    auto result = Logger::initialize((blocker / "app.log").string(), LogLevel::Info);
    EXPECT_EQ(result.error, ErrorCode::IO_ERROR);
    ASSERT_NE(Logger::get(), nullptr);
    EXPECT_EQ(Logger::get()->sinks().size(), 1u);

    std::filesystem::remove(blocker);
}

TEST_F(LoggerTest, ConsoleOnly) {
    ASSERT_TRUE(Logger::initialize("", LogLevel::Info));
    EXPECT_EQ(Logger::get()->sinks().size(), 1u);
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("WARNING"), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_EQ(Logger::parse_level("loud", LogLevel::Error), LogLevel::Error);
    EXPECT_STREQ(to_string(LogLevel::Warn), "warn");
}

TEST_F(LoggerTest, MacrosWorkBeforeInitialize) {
    LOG_INFO("Logged through the default logger");
    EXPECT_EQ(Logger::get(), nullptr);
}
