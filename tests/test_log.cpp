/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "xlink/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("Log level defaults", "[log]") {
  // In debug builds default is kDebug, in release kInfo
#ifdef NDEBUG
  REQUIRE(xlink::log::GetLevel() == xlink::log::Level::kInfo);
#else
  REQUIRE(xlink::log::GetLevel() == xlink::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = xlink::log::GetLevel();
  xlink::log::SetLevel(xlink::log::Level::kError);
  REQUIRE(xlink::log::GetLevel() == xlink::log::Level::kError);
  xlink::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!xlink::log::IsInitialized());
  xlink::log::Init();
  REQUIRE(xlink::log::IsInitialized());
  xlink::log::Shutdown();
  REQUIRE(!xlink::log::IsInitialized());
}

TEST_CASE("Log ParseLevel", "[log]") {
  xlink::log::Level level = xlink::log::Level::kInfo;
  REQUIRE(xlink::log::ParseLevel("debug", level));
  REQUIRE(level == xlink::log::Level::kDebug);
  REQUIRE(xlink::log::ParseLevel("WARN", level));
  REQUIRE(level == xlink::log::Level::kWarn);
  REQUIRE(xlink::log::ParseLevel("Off", level));
  REQUIRE(level == xlink::log::Level::kOff);

  // Rejected input leaves the output untouched.
  REQUIRE(!xlink::log::ParseLevel("warning", level));
  REQUIRE(!xlink::log::ParseLevel("", level));
  REQUIRE(!xlink::log::ParseLevel("verbose-level", level));
  REQUIRE(!xlink::log::ParseLevel(nullptr, level));
  REQUIRE(level == xlink::log::Level::kOff);
}

TEST_CASE("Log macros compile and run", "[log]") {
  xlink::log::SetLevel(xlink::log::Level::kDebug);
  XLINK_LOG_DEBUG("Test", "debug %d", 1);
  XLINK_LOG_INFO("Test", "info %s", "msg");
  XLINK_LOG_WARN("Test", "warn");
  XLINK_LOG_ERROR("Test", "error %d %d", 1, 2);
  // FATAL aborts
  REQUIRE(true);
}

TEST_CASE("Log with very long message", "[log]") {
  xlink::log::SetLevel(xlink::log::Level::kDebug);
  std::string long_msg(600, 'x');
  XLINK_LOG_INFO("Test", "%s", long_msg.c_str());
  XLINK_LOG_DEBUG("Test", "Long: %s %s", long_msg.c_str(), long_msg.c_str());
  REQUIRE(true);
}

TEST_CASE("Log level hierarchy filtering", "[log]") {
  xlink::log::SetLevel(xlink::log::Level::kWarn);
  XLINK_LOG_DEBUG("Test", "debug filtered");
  XLINK_LOG_INFO("Test", "info filtered");
  XLINK_LOG_WARN("Test", "warn passes");
  XLINK_LOG_ERROR("Test", "error passes");

  xlink::log::SetLevel(xlink::log::Level::kOff);
  XLINK_LOG_ERROR("Test", "error filtered");

  xlink::log::SetLevel(xlink::log::Level::kDebug);
  REQUIRE(true);
}
