#include <gtest/gtest.h>

#include "SystemEventQueue.hpp"

using namespace mdns_reflector;

namespace
{
  class SystemEventQueueTest : public ::testing::Test
  {
  protected:
    SystemEventQueueTest()
    {
      SystemEventQueue::setConsoleOutput(false);
      SystemEventQueue::setLevel(LogLevel::Info);
      SystemEventQueue::clearEvents();
    }

    ~SystemEventQueueTest() override
    {
      SystemEventQueue::setLevel(LogLevel::Info);
      SystemEventQueue::setConsoleOutput(true);
    }
  };
} // namespace

TEST_F(SystemEventQueueTest, RecordsEventsAtOrAboveLevel)
{
  SystemEventQueue::debug("relay", "hidden");
  SystemEventQueue::push("relay", "shown");
  SystemEventQueue::error("mcast", "failed");

  auto events = SystemEventQueue::getEventList();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0]->message, "shown");
  EXPECT_EQ(events[0]->level, LogLevel::Info);
  EXPECT_EQ(events[1]->subsystem, "mcast");
  EXPECT_EQ(events[1]->level, LogLevel::Error);

  SystemEventQueue::setLevel(LogLevel::Debug);
  SystemEventQueue::debug("relay", "now visible");
  EXPECT_EQ(SystemEventQueue::getEventList().size(), 3u);
}

TEST_F(SystemEventQueueTest, KeepsTheLatestTwoHundredEvents)
{
  for (int i = 0; i < 250; ++i)
    SystemEventQueue::push("relay", "event " + std::to_string(i));

  auto events = SystemEventQueue::getEventList();
  ASSERT_EQ(events.size(), 200u);
  EXPECT_EQ(events.front()->message, "event 50");
  EXPECT_EQ(events.back()->message, "event 249");
}

TEST(LogLevelTest, ParsesNames)
{
  LogLevel level = LogLevel::Info;
  EXPECT_TRUE(parseLogLevel("warn", level));
  EXPECT_EQ(level, LogLevel::Warn);
  EXPECT_FALSE(parseLogLevel("verbose", level));
  EXPECT_EQ(level, LogLevel::Warn);
  EXPECT_STREQ(logLevelName(LogLevel::Debug), "DEBUG");
}
