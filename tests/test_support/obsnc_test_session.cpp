//==============================================================================
// Obsnc Test Session
//
// Custom Catch2 main() that installs a quiet logger before running tests.
// Set OBSNC_TEST_LOG_LEVEL to see converter logs while debugging a test.
// The banner is skipped in listing modes: catch_discover_tests reads every
// line of --list-test-names-only output as a test name.
// Note: CATCH_CONFIG_RUNNER is defined by CMake for this source file only
//==============================================================================

#include "obsnc_logger.hpp"
#include <catch2/catch.hpp>
#include <cstdlib>
#include <iostream>

int main(int argc, char *argv[]) {
  const char *level = std::getenv("OBSNC_TEST_LOG_LEVEL");
  obsnc::init_logging("", level ? level : "off");

  // Create Catch2 session
  Catch::Session session;

  // Parse command line arguments
  int returnCode = session.applyCommandLine(argc, argv);
  if (returnCode != 0) {
    return returnCode;
  }

  const auto &cfg = session.configData();
  const bool listing = cfg.listTests || cfg.listTestNamesOnly ||
                       cfg.listTags || cfg.listReporters;

  if (!listing) {
    std::cout << "========================================" << std::endl;
    std::cout << "Obsnc Converter Tests" << std::endl;
    std::cout << "========================================" << std::endl;
  }

  int result = session.run();

  if (!listing) {
    std::cout << "========================================" << std::endl;
    if (result == 0) {
      std::cout << "All tests passed!" << std::endl;
    } else {
      std::cout << "Tests failed." << std::endl;
    }
    std::cout << "========================================" << std::endl;
  }

  return result;
}
