#include <gtest/gtest.h>
#include "error_log.hpp"

#include <regex>
#include <string>
#include <thread>
#include <vector>

TEST(ErrorLog, EmptyLogHasNoEntries) {
  ErrorLog log;
  EXPECT_EQ(log.size(), 0u);
  EXPECT_TRUE(log.recent().empty());
  EXPECT_EQ(log.capacity(), 5u);
}

TEST(ErrorLog, KeepsInsertionOrder) {
  ErrorLog log;
  log.record("a");
  log.record("b");
  log.record("c");

  const std::vector<ErrorEntry> r = log.recent();
  ASSERT_EQ(r.size(), 3u);
  EXPECT_EQ(r[0].message, "a");
  EXPECT_EQ(r[1].message, "b");
  EXPECT_EQ(r[2].message, "c");
}

TEST(ErrorLog, DropsOldestBeyondCapacity) {
  ErrorLog log(5);
  for (int i = 1; i <= 6; ++i) log.record("e" + std::to_string(i));

  const std::vector<ErrorEntry> r = log.recent();
  ASSERT_EQ(r.size(), 5u);
  EXPECT_EQ(r.front().message, "e2");
  EXPECT_EQ(r.back().message, "e6");
  EXPECT_EQ(log.size(), 5u);
}

TEST(ErrorLog, RecentReturnsNewestN) {
  ErrorLog log(5);
  for (int i = 1; i <= 4; ++i) log.record("e" + std::to_string(i));

  const std::vector<ErrorEntry> r = log.recent(2);
  ASSERT_EQ(r.size(), 2u);
  EXPECT_EQ(r[0].message, "e3");
  EXPECT_EQ(r[1].message, "e4");
}

TEST(ErrorLog, EntryRendersWithClockStamp) {
  ErrorLog log;
  log.record("Position fetch error: boom");

  const std::string s = log.recent().back().to_string();
  EXPECT_TRUE(std::regex_match(s, std::regex(R"(\[\d{2}:\d{2}:\d{2}\] Position fetch error: boom)"))) << s;
}

TEST(ErrorLog, ConcurrentRecordersStayBounded) {
  ErrorLog log(5);
  std::vector<std::thread> ths;
  for (int t = 0; t < 4; ++t) {
    ths.emplace_back([&log, t]{
      for (int i = 0; i < 200; ++i) log.record("t" + std::to_string(t) + "#" + std::to_string(i));
    });
  }
  for (std::thread& th : ths) th.join();

  EXPECT_EQ(log.size(), 5u);
  for (const ErrorEntry& e : log.recent()) EXPECT_FALSE(e.message.empty());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
