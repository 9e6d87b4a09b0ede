#ifndef CHUNKSEAL_CONFIG_HPP
#define CHUNKSEAL_CONFIG_HPP

#include <string>

#include "upload/content_defined_chunker.hpp"
#include "upload/upload_constants.hpp"
#include "utilities/logger.h"

namespace chunkseal {

/// Process-wide settings for the command line tools.
struct RuntimeOptions {
  ChunkerConfig chunker;
  std::string logFile = Logger::CONSOLE_ONLY_OUTPUT;
  LogLevel logLevel = LogLevel::WARN;
  double coverageThreshold = constants::DEFAULT_COVERAGE_THRESHOLD;
};

/**
 * @brief Load options from the YAML file named by CHUNKSEAL_CONFIG
 * (default "chunkseal_config.yaml"), then apply environment overrides.
 *
 * Recognised keys: min_chunk_size, avg_chunk_size, max_chunk_size,
 * read_buffer_size, log_file, log_level, coverage_threshold. A missing file
 * leaves the defaults in place.
 *
 * @throws ContractViolation for unparsable YAML, a bad value, or a
 *         resulting chunker configuration that does not validate.
 */
RuntimeOptions loadRuntimeOptions();

/// Same as loadRuntimeOptions() with an explicit file path.
RuntimeOptions loadRuntimeOptions(const std::string &path);

} // namespace chunkseal

#endif // CHUNKSEAL_CONFIG_HPP
