// tests/unit/basic/test_log.cpp - Unit tests for the named loggers
//

#include <gtest/gtest.h>

#include "modgraph/basic/log.hpp"

using namespace modgraph;

TEST(Log, LoggersLiveInSpdlogRegistry)
{
  const auto logger = log::get("resolve-test");
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(spdlog::get("resolve-test"), logger);
  EXPECT_EQ(log::get("resolve-test"), logger);
  const auto graph = log::graph();
  EXPECT_EQ(spdlog::get("graph"), graph);
}

TEST(Log, InitLoggingReachesExistingAndLaterLoggers)
{
  const auto before = log::get("early-test");
  log::init_logging(spdlog::level::debug);
  const auto after = log::get("late-test");

  EXPECT_EQ(before->level(), spdlog::level::debug);
  EXPECT_EQ(after->level(), spdlog::level::debug);
  EXPECT_TRUE(log::cache()->should_log(spdlog::level::debug));

  log::init_logging(spdlog::level::warn);
  EXPECT_FALSE(after->should_log(spdlog::level::info));
}
