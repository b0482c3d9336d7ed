//==============================================================================
// Test: Logging
//
// Unit tests for logger installation and message prefixes.
//==============================================================================

#include "obsnc_logger.hpp"
#include "test_config.hpp"
#include <catch2/catch.hpp>

#include <fstream>
#include <sstream>

using namespace obsnc;
using namespace obsnc::testing;

namespace {

// Reinstalls a console logger at the session's level when a test ends.
class LoggerRestore {
public:
  LoggerRestore() {
    auto name = spdlog::level::to_string_view(spdlog::get_level());
    m_level.assign(name.data(), name.size());
  }
  ~LoggerRestore() { init_logging("", m_level); }

private:
  std::string m_level;
};

} // namespace

TEST_CASE("pack_log_msg", "[unit][logger]") {
  REQUIRE(pack_log_msg("/a/b/record_parser.cpp", 42, "hello") ==
          "[record_parser.cpp:42] hello");
  REQUIRE(pack_log_msg("main.cpp", 7, "x") == "[main.cpp:7] x");
}

TEST_CASE("init_logging", "[unit][logger]") {
  LoggerRestore restore;

  SECTION("runtime level comes from the argument") {
    REQUIRE(init_logging("", "debug") == 1);
    REQUIRE(spdlog::get_level() == spdlog::level::debug);
    REQUIRE(spdlog::default_logger()->name() == DefaultLoggerName);

    REQUIRE(init_logging("", "warning") == 1);
    REQUIRE(spdlog::get_level() == spdlog::level::warn);
  }

  SECTION("off disables logging") {
    REQUIRE(init_logging("", "off") == 0);
    REQUIRE(spdlog::get_level() == spdlog::level::off);
  }

  SECTION("file sink receives prefixed messages") {
    ScratchDir dir("obsnc_logger");
    const std::string log_file = dir.file("run.log");

    REQUIRE(init_logging(log_file, "info") == 1);
    OBSNC_LOG_INFO("converted {} file(s)", 2);
    OBSNC_LOG_DEBUG("not written at info level");
    spdlog::default_logger()->flush();

    std::ifstream in(log_file);
    std::stringstream text;
    text << in.rdbuf();
    REQUIRE(text.str().find("[obsnc info] [test_obsnc_logger.cpp:") !=
            std::string::npos);
    REQUIRE(text.str().find("converted 2 file(s)") != std::string::npos);
    REQUIRE(text.str().find("not written") == std::string::npos);

    init_logging("", "off");
  }
}
