#include "utilities/app_dirs.hpp"
#include "utilities/logger.h"
#include <filesystem>
#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char **argv) {
  namespace fs = std::filesystem;
  fs::path base = fs::temp_directory_path() / "site_blocker_test_data";
  siteblocker::setDataDir(base.string());
  fs::create_directories(siteblocker::logsDir());

  try {
    Logger::init(siteblocker::logsDir() + "/site_blocker_tests.log",
                 LogLevel::DEBUG);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Test initialization failed: " << e.what() << std::endl;
    return 1;
  }

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
