#include <gtest/gtest.h>
#include "utilities/config.hpp"
#include "utilities/errors.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace chunkseal;

class ConfigTest : public ::testing::Test {
protected:
  std::string path_;

  void SetUp() override {
    path_ = (std::filesystem::temp_directory_path() / "chunkseal_test_var" /
             "config_test.yaml")
                .string();
    std::filesystem::create_directories(
        std::filesystem::path(path_).parent_path());
    std::remove(path_.c_str());
    clearEnv();
  }

  void TearDown() override {
    std::remove(path_.c_str());
    clearEnv();
  }

  static void clearEnv() {
    for (const char *name :
         {"CHUNKSEAL_CONFIG", "CHUNKSEAL_MIN_CHUNK", "CHUNKSEAL_AVG_CHUNK",
          "CHUNKSEAL_MAX_CHUNK", "CHUNKSEAL_LOG_FILE", "CHUNKSEAL_LOG_LEVEL",
          "CHUNKSEAL_COVERAGE_THRESHOLD"}) {
      unsetenv(name);
    }
  }

  void writeConfig(const std::string &text) {
    std::ofstream out(path_);
    out << text;
  }
};

TEST_F(ConfigTest, MissingFileGivesDefaults) {
  RuntimeOptions opts = loadRuntimeOptions(path_);
  EXPECT_EQ(opts.chunker.minChunkSize, constants::CDC_MIN_CHUNK_SIZE);
  EXPECT_EQ(opts.chunker.avgChunkSize, constants::CDC_AVG_CHUNK_SIZE);
  EXPECT_EQ(opts.chunker.maxChunkSize, constants::CDC_MAX_CHUNK_SIZE);
  EXPECT_EQ(opts.logFile, Logger::CONSOLE_ONLY_OUTPUT);
  EXPECT_EQ(opts.logLevel, LogLevel::WARN);
  EXPECT_DOUBLE_EQ(opts.coverageThreshold, 0.999);
}

TEST_F(ConfigTest, YamlValuesApply) {
  writeConfig("min_chunk_size: 1024\n"
              "avg_chunk_size: 4096\n"
              "max_chunk_size: 16384\n"
              "read_buffer_size: 8192\n"
              "log_file: /tmp/chunkseal.log\n"
              "log_level: debug\n"
              "coverage_threshold: 0.95\n");
  RuntimeOptions opts = loadRuntimeOptions(path_);
  EXPECT_EQ(opts.chunker.minChunkSize, 1024);
  EXPECT_EQ(opts.chunker.avgChunkSize, 4096);
  EXPECT_EQ(opts.chunker.maxChunkSize, 16384);
  EXPECT_EQ(opts.chunker.readBufferSize, 8192u);
  EXPECT_EQ(opts.logFile, "/tmp/chunkseal.log");
  EXPECT_EQ(opts.logLevel, LogLevel::DEBUG);
  EXPECT_DOUBLE_EQ(opts.coverageThreshold, 0.95);
}

TEST_F(ConfigTest, EnvironmentOverridesYaml) {
  writeConfig("min_chunk_size: 1024\navg_chunk_size: 4096\n"
              "max_chunk_size: 16384\nlog_level: info\n");
  setenv("CHUNKSEAL_MAX_CHUNK", "32768", 1);
  setenv("CHUNKSEAL_LOG_LEVEL", "ERROR", 1);
  setenv("CHUNKSEAL_COVERAGE_THRESHOLD", "0.5", 1);
  RuntimeOptions opts = loadRuntimeOptions(path_);
  EXPECT_EQ(opts.chunker.minChunkSize, 1024);
  EXPECT_EQ(opts.chunker.maxChunkSize, 32768);
  EXPECT_EQ(opts.logLevel, LogLevel::ERROR);
  EXPECT_DOUBLE_EQ(opts.coverageThreshold, 0.5);
}

TEST_F(ConfigTest, ConfigPathFromEnvironment) {
  writeConfig("log_level: trace\n");
  setenv("CHUNKSEAL_CONFIG", path_.c_str(), 1);
  EXPECT_EQ(loadRuntimeOptions().logLevel, LogLevel::TRACE);
}

TEST_F(ConfigTest, RejectsBadValues) {
  setenv("CHUNKSEAL_MIN_CHUNK", "12abc", 1);
  EXPECT_THROW(loadRuntimeOptions(path_), ContractViolation);
  clearEnv();

  setenv("CHUNKSEAL_LOG_LEVEL", "loud", 1);
  EXPECT_THROW(loadRuntimeOptions(path_), ContractViolation);
  clearEnv();

  setenv("CHUNKSEAL_COVERAGE_THRESHOLD", "0", 1);
  EXPECT_THROW(loadRuntimeOptions(path_), ContractViolation);
  clearEnv();

  // min above avg never validates
  setenv("CHUNKSEAL_MIN_CHUNK", "4194304", 1);
  EXPECT_THROW(loadRuntimeOptions(path_), ContractViolation);
}

TEST_F(ConfigTest, RejectsMalformedYaml) {
  writeConfig("min_chunk_size: [1, 2\n");
  EXPECT_THROW(loadRuntimeOptions(path_), ContractViolation);

  writeConfig("avg_chunk_size: large\n");
  EXPECT_THROW(loadRuntimeOptions(path_), ContractViolation);
}
