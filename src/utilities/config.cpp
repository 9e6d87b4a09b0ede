#include "utilities/config.hpp"
#include "utilities/errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace chunkseal {

namespace {

int64_t parseSize(const std::string &name, const std::string &value) {
  size_t used = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &used);
  } catch (const std::logic_error &) {
    used = 0;
  }
  if (used == 0 || used != value.size()) {
    raiseContractViolation(name + " is not an integer: " + value);
  }
  return parsed;
}

double parseDouble(const std::string &name, const std::string &value) {
  size_t used = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &used);
  } catch (const std::logic_error &) {
    used = 0;
  }
  if (used == 0 || used != value.size()) {
    raiseContractViolation(name + " is not a number: " + value);
  }
  return parsed;
}

LogLevel parseLogLevel(const std::string &name, const std::string &value) {
  try {
    return Logger::parseLevel(value);
  } catch (const std::invalid_argument &) {
    raiseContractViolation(name + " is not a log level: " + value);
  }
}

void applyYaml(RuntimeOptions &opts, const std::string &path) {
  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    raiseContractViolation("Cannot parse config " + path + ": " + e.what());
  }

  try {
    if (node["min_chunk_size"])
      opts.chunker.minChunkSize = node["min_chunk_size"].as<int64_t>();
    if (node["avg_chunk_size"])
      opts.chunker.avgChunkSize = node["avg_chunk_size"].as<int64_t>();
    if (node["max_chunk_size"])
      opts.chunker.maxChunkSize = node["max_chunk_size"].as<int64_t>();
    if (node["read_buffer_size"])
      opts.chunker.readBufferSize = node["read_buffer_size"].as<size_t>();
    if (node["log_file"])
      opts.logFile = node["log_file"].as<std::string>();
    if (node["log_level"])
      opts.logLevel =
          parseLogLevel("log_level", node["log_level"].as<std::string>());
    if (node["coverage_threshold"])
      opts.coverageThreshold = node["coverage_threshold"].as<double>();
  } catch (const YAML::Exception &e) {
    raiseContractViolation("Invalid value in config " + path + ": " +
                           e.what());
  }
}

void applyEnvironment(RuntimeOptions &opts) {
  if (const char *env = std::getenv("CHUNKSEAL_MIN_CHUNK"))
    opts.chunker.minChunkSize = parseSize("CHUNKSEAL_MIN_CHUNK", env);
  if (const char *env = std::getenv("CHUNKSEAL_AVG_CHUNK"))
    opts.chunker.avgChunkSize = parseSize("CHUNKSEAL_AVG_CHUNK", env);
  if (const char *env = std::getenv("CHUNKSEAL_MAX_CHUNK"))
    opts.chunker.maxChunkSize = parseSize("CHUNKSEAL_MAX_CHUNK", env);
  if (const char *env = std::getenv("CHUNKSEAL_LOG_FILE"))
    opts.logFile = env;
  if (const char *env = std::getenv("CHUNKSEAL_LOG_LEVEL"))
    opts.logLevel = parseLogLevel("CHUNKSEAL_LOG_LEVEL", env);
  if (const char *env = std::getenv("CHUNKSEAL_COVERAGE_THRESHOLD"))
    opts.coverageThreshold =
        parseDouble("CHUNKSEAL_COVERAGE_THRESHOLD", env);
}

} // namespace

RuntimeOptions loadRuntimeOptions(const std::string &path) {
  RuntimeOptions opts;
  if (std::filesystem::exists(path)) {
    applyYaml(opts, path);
  }
  applyEnvironment(opts);

  opts.chunker.validate();
  if (!(opts.coverageThreshold > 0.0 && opts.coverageThreshold <= 1.0)) {
    raiseContractViolation("coverage_threshold must be in (0, 1], got " +
                           std::to_string(opts.coverageThreshold));
  }
  return opts;
}

RuntimeOptions loadRuntimeOptions() {
  const char *cfg = std::getenv("CHUNKSEAL_CONFIG");
  if (!cfg)
    cfg = "chunkseal_config.yaml";
  return loadRuntimeOptions(cfg);
}

} // namespace chunkseal
