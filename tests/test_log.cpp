/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "recycle/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>
#include <vector>

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(recycle::log::GetLevel() == recycle::log::Level::kInfo);
#else
  REQUIRE(recycle::log::GetLevel() == recycle::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = recycle::log::GetLevel();
  recycle::log::SetLevel(recycle::log::Level::kError);
  REQUIRE(recycle::log::GetLevel() == recycle::log::Level::kError);
  recycle::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!recycle::log::IsInitialized());
  recycle::log::Init();
  REQUIRE(recycle::log::IsInitialized());
  recycle::log::Shutdown();
  REQUIRE(!recycle::log::IsInitialized());
}

TEST_CASE("Log ParseLevel", "[log]") {
  recycle::log::Level level = recycle::log::Level::kOff;
  REQUIRE(recycle::log::ParseLevel("debug", level));
  REQUIRE(level == recycle::log::Level::kDebug);
  REQUIRE(recycle::log::ParseLevel("INFO", level));
  REQUIRE(level == recycle::log::Level::kInfo);
  REQUIRE(recycle::log::ParseLevel("Warning", level));
  REQUIRE(level == recycle::log::Level::kWarn);
  REQUIRE(recycle::log::ParseLevel("off", level));
  REQUIRE(level == recycle::log::Level::kOff);

  REQUIRE(!recycle::log::ParseLevel("verbose", level));
  REQUIRE(!recycle::log::ParseLevel("err", level));
  REQUIRE(!recycle::log::ParseLevel(nullptr, level));
  REQUIRE(level == recycle::log::Level::kOff);
}

TEST_CASE("Log macros compile and run", "[log]") {
  recycle::log::SetLevel(recycle::log::Level::kDebug);
  RECYCLE_LOG_DEBUG("Test", "debug %d", 1);
  RECYCLE_LOG_INFO("Test", "info %s", "msg");
  RECYCLE_LOG_WARN("Test", "warn");
  RECYCLE_LOG_ERROR("Test", "error %d %d", 1, 2);
  REQUIRE(true);
}

TEST_CASE("Log runtime level filtering", "[log]") {
  recycle::log::SetLevel(recycle::log::Level::kOff);
  RECYCLE_LOG_DEBUG("Test", "should not appear");
  RECYCLE_LOG_ERROR("Test", "should not appear");
  recycle::log::SetLevel(recycle::log::Level::kDebug);
  REQUIRE(true);
}

TEST_CASE("Log long message is truncated", "[log]") {
  std::string big(2000, 'x');
  RECYCLE_LOG_INFO("Test", "%s", big.c_str());
  REQUIRE(true);
}

TEST_CASE("Log from concurrent threads", "[log]") {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t]() {
      for (int i = 0; i < 20; ++i) {
        RECYCLE_LOG_DEBUG("Test", "thread %d line %d", t, i);
      }
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(true);
}
