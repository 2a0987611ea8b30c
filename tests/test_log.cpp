/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "pdfmerge/log.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(pdfmerge::log::GetLevel() == pdfmerge::log::Level::kInfo);
#else
  REQUIRE(pdfmerge::log::GetLevel() == pdfmerge::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = pdfmerge::log::GetLevel();
  pdfmerge::log::SetLevel(pdfmerge::log::Level::kError);
  REQUIRE(pdfmerge::log::GetLevel() == pdfmerge::log::Level::kError);
  pdfmerge::log::SetLevel(prev);
}

TEST_CASE("Log ParseLevel", "[log]") {
  pdfmerge::log::Level lv = pdfmerge::log::Level::kInfo;
  REQUIRE(pdfmerge::log::ParseLevel("warn", lv));
  CHECK(lv == pdfmerge::log::Level::kWarn);
  REQUIRE(pdfmerge::log::ParseLevel("off", lv));
  CHECK(lv == pdfmerge::log::Level::kOff);

  CHECK_FALSE(pdfmerge::log::ParseLevel("verbose", lv));
  CHECK_FALSE(pdfmerge::log::ParseLevel(nullptr, lv));
  CHECK(lv == pdfmerge::log::Level::kOff);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  pdfmerge::log::Init();
  REQUIRE(pdfmerge::log::IsInitialized());
  pdfmerge::log::Shutdown();
  REQUIRE(!pdfmerge::log::IsInitialized());
}

TEST_CASE("Log macros run at every level", "[log]") {
  auto prev = pdfmerge::log::GetLevel();
  pdfmerge::log::SetLevel(pdfmerge::log::Level::kDebug);
  PDFMERGE_LOG_DEBUG("Test", "debug %d", 1);
  PDFMERGE_LOG_INFO("Test", "info %s", "msg");
  PDFMERGE_LOG_WARN("Test", "warn");
  PDFMERGE_LOG_ERROR("Test", "error %d %d", 1, 2);

  pdfmerge::log::SetLevel(pdfmerge::log::Level::kOff);
  PDFMERGE_LOG_ERROR("Test", "filtered");
  pdfmerge::log::SetLevel(prev);
  REQUIRE(true);
}
