// EN: Unit tests for the NDJSON Logger
// FR: Tests unitaires pour le Logger NDJSON

#include <gtest/gtest.h>
#include "infrastructure/logging/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

using namespace CDO;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file_ = (std::filesystem::temp_directory_path() /
                     ("cdo_logger_test_" + std::to_string(::getpid()) + ".log")).string();
        std::remove(log_file_.c_str());

        auto& logger = Logger::getInstance();
        logger.setLogLevel(LogLevel::DEBUG);
        logger.setCorrelationId("");
        logger.clearGlobalMetadata();
        ASSERT_TRUE(logger.setOutputFile(log_file_));
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.setLogLevel(LogLevel::INFO);
        logger.clearGlobalMetadata();
        logger.setCorrelationId("");
        std::remove(log_file_.c_str());
    }

    // EN: Every line written so far, parsed as JSON
    // FR: Toutes les lignes écrites jusqu'ici, analysées en JSON
    std::vector<nlohmann::json> readEntries() {
        Logger::getInstance().flush();
        std::vector<nlohmann::json> entries;
        std::ifstream file(log_file_);
        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty()) {
                entries.push_back(nlohmann::json::parse(line));
            }
        }
        return entries;
    }

    std::string log_file_;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
    LOG_INFO("runner", "Run started");
    LOG_ERROR("runner", "Job failed");

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0]["level"], "INFO");
    EXPECT_EQ(entries[0]["module"], "runner");
    EXPECT_EQ(entries[0]["message"], "Run started");
    EXPECT_TRUE(entries[0].contains("timestamp"));
    EXPECT_TRUE(entries[0].contains("thread_id"));
    EXPECT_EQ(entries[1]["level"], "ERROR");
}

// EN: Messages below the current level are dropped
// FR: Les messages sous le niveau courant sont ignorés
TEST_F(LoggerTest, FiltersBelowCurrentLevel) {
    Logger::getInstance().setLogLevel(LogLevel::WARN);

    LOG_DEBUG("level", "hidden");
    LOG_INFO("level", "hidden");
    LOG_WARN("level", "shown");
    LOG_ERROR("level", "shown");

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0]["level"], "WARN");
    EXPECT_EQ(entries[1]["level"], "ERROR");
}

TEST_F(LoggerTest, MetadataAndCorrelationIdAreEmitted) {
    auto& logger = Logger::getInstance();
    logger.setCorrelationId("corr-1234");
    logger.addGlobalMetadata("component", "engine");

    LOG_INFO_META("engine", "Run triggered", (Logger::Metadata{{"run_id", "ci#0001"}, {"pipeline", "ci"}}));

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["correlation_id"], "corr-1234");
    EXPECT_EQ(entries[0]["run_id"], "ci#0001");
    EXPECT_EQ(entries[0]["pipeline"], "ci");
    EXPECT_EQ(entries[0]["component"], "engine");
}

// EN: Metadata cannot overwrite reserved fields
// FR: Les métadonnées ne peuvent pas écraser les champs réservés
TEST_F(LoggerTest, MetadataNeverOverridesReservedFields) {
    LOG_INFO_META("engine", "real message", (Logger::Metadata{{"message", "forged"}, {"level", "ERROR"}}));

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["message"], "real message");
    EXPECT_EQ(entries[0]["level"], "INFO");
}

TEST_F(LoggerTest, EscapesSpecialCharacters) {
    LOG_INFO("shell", "line one\nline \"two\"\t\\end");

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["message"], "line one\nline \"two\"\t\\end");
}

TEST_F(LoggerTest, ConcurrentWritersProduceWholeLines) {
    const int num_threads = 6;
    const int messages_per_thread = 25;
    std::vector<std::thread> threads;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < messages_per_thread; ++j) {
                LOG_INFO("thread_test", "Thread " + std::to_string(i) + " message " + std::to_string(j));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto entries = readEntries();
    EXPECT_EQ(entries.size(), static_cast<size_t>(num_threads * messages_per_thread));
    for (const auto& entry : entries) {
        EXPECT_EQ(entry["module"], "thread_test");
    }
}

TEST_F(LoggerTest, CorrelationIdHasUuidShape) {
    std::string id = Logger::getInstance().generateCorrelationId();
    EXPECT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_NE(id, Logger::getInstance().generateCorrelationId());
}

TEST(LoggerLevelTest, LevelNamesRoundTrip) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromString("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("ERROR"), LogLevel::ERROR);
    EXPECT_FALSE(Logger::levelFromString("verbose").has_value());
    EXPECT_EQ(Logger::levelToString(LogLevel::INFO), "INFO");
}

TEST(LoggerLevelTest, UnwritableFileIsRejected) {
    EXPECT_FALSE(Logger::getInstance().setOutputFile("/nonexistent-dir/cdo.log"));
}
