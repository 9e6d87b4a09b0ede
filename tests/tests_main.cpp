#include "utilities/logger.h" // Include Logger header
#include <filesystem>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  namespace fs = std::filesystem;
  fs::path base = fs::temp_directory_path() / "chunkseal_test_var";
  fs::create_directories(base);

  // Initialize the logger for tests
  try {
    Logger::init((base / "chunkseal_tests.log").string(), LogLevel::DEBUG);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Test initialization failed: " << e.what() << std::endl;
    return 1; // Exit if logger fails to initialize
  }

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
