#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include "option_screener/core/logger.hpp"

using namespace option_screener;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Reset logger first to close any existing file handles
        Logger::reset_for_tests();
        Logger::register_component("");

        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);

        // Reset logger BEFORE directory cleanup
        Logger::reset_for_tests();
        Logger::register_component("");

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    std::vector<std::filesystem::path> get_log_files(const std::string& dir) {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) return "";
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig file_config() const {
        LoggerConfig config;
        config.destination = LogDestination::FILE;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::streambuf* original_cout;
    std::stringstream cout_buffer;
    const std::string test_log_dir = "test_logs";
};

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config = file_config();
    config.log_directory = test_log_dir + "/subdir";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
}

TEST_F(LoggerTest, LogsToConsoleWhenConfigured) {
    LoggerConfig config;
    config.destination = LogDestination::CONSOLE;
    config.include_timestamp = false;
    config.include_level = false;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "Console message");

    EXPECT_EQ(cout_buffer.str(), "Console message\n");
}

TEST_F(LoggerTest, LogsToFileWhenConfigured) {
    Logger::instance().initialize(file_config());

    Logger::instance().log(LogLevel::INFO, "File message");

    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1);
    EXPECT_EQ(read_file(files[0]), "File message\n");
    EXPECT_EQ(files[0].filename().string().rfind("option_screener_", 0), 0u);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config = file_config();
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::DEBUG, "Debug");
    Logger::instance().log(LogLevel::INFO, "Info");
    Logger::instance().log(LogLevel::WARNING, "Warning");
    Logger::instance().log(LogLevel::ERR, "Error");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content.find("Debug"), std::string::npos);
    EXPECT_EQ(content.find("Info"), std::string::npos);
    EXPECT_NE(content.find("Warning\nError\n"), std::string::npos);
}

TEST_F(LoggerTest, MacrosIncludeLevelAndComponent) {
    LoggerConfig config = file_config();
    config.include_level = true;
    Logger::instance().initialize(config);
    Logger::register_component("ScreeningPipeline");

    int priced = 3;
    INFO("Priced " << priced << " symbols");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content, "[INFO] [ScreeningPipeline] Priced 3 symbols\n");
}

TEST_F(LoggerTest, FileRotation) {
    LoggerConfig config = file_config();
    config.max_file_size = 10;
    config.max_files = 2;
    Logger::instance().initialize(config);

    // Each message is 9 bytes ("12345678\n"); the second triggers rotation
    Logger::instance().log(LogLevel::INFO, "12345678");
    Logger::instance().log(LogLevel::INFO, "12345678");

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2);
}

TEST_F(LoggerTest, MaxFilesEnforced) {
    LoggerConfig config = file_config();
    config.max_file_size = 1;  // Rotate every message
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 3; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2);
}

TEST_F(LoggerTest, LogBeforeInitializationDoesNotWrite) {
    Logger::instance().log(LogLevel::INFO, "Test");

    EXPECT_TRUE(cout_buffer.str().empty());
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST_F(LoggerTest, ConfigJsonRoundTrip) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "screen";

    LoggerConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.min_level, LogLevel::DEBUG);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.filename_prefix, "screen");

    EXPECT_EQ(level_from_string("ERROR", LogLevel::INFO), LogLevel::ERR);
    EXPECT_EQ(level_from_string("verbose", LogLevel::INFO), LogLevel::INFO);
}
