#include <gtest/gtest.h>

#include "core/util/TimeFormat.hpp"

using namespace frl;

TEST(TimeFormat, ClockDurationRoundsFractionsUp) {
  EXPECT_EQ(clock_duration(0), "0:00:00");
  EXPECT_EQ(clock_duration(1800), "0:30:00");
  EXPECT_EQ(clock_duration(3599.2), "1:00:00");
  EXPECT_EQ(clock_duration(59.5), "0:01:00");
  EXPECT_EQ(clock_duration(7201.25), "2:00:02");
  EXPECT_EQ(clock_duration(-3), "0:00:00");
}

TEST(TimeFormat, HumanBytes) {
  EXPECT_EQ(human_bytes(512), "512.0 B");
  EXPECT_EQ(human_bytes(1536), "1.5 KB");
  EXPECT_EQ(human_bytes(2000ull * 1024 * 1024), "2.0 GB");
}
