#include "clock-regulator.h"

#include <gtest/gtest.h>

namespace {

using std::chrono::milliseconds;

TEST(ClockRegulatorTest, TicksOncePerPeriod) {
  ClockRegulator regulator(100);
  const auto start = ClockRegulator::Clock::now();

  EXPECT_TRUE(regulator.TickAt(start));
  EXPECT_FALSE(regulator.TickAt(start));
  EXPECT_FALSE(regulator.TickAt(start + milliseconds(5)));
  EXPECT_TRUE(regulator.TickAt(start + milliseconds(10)));
  EXPECT_FALSE(regulator.TickAt(start + milliseconds(10)));
}

TEST(ClockRegulatorTest, MissedTicksAreNotReplayed) {
  ClockRegulator regulator(60);
  const auto start = ClockRegulator::Clock::now();
  ASSERT_TRUE(regulator.TickAt(start));

  const auto later = start + std::chrono::seconds(1);
  EXPECT_TRUE(regulator.TickAt(later));
  EXPECT_FALSE(regulator.TickAt(later));
}

TEST(ClockRegulatorTest, FrequencyCanChange) {
  ClockRegulator regulator(700);
  EXPECT_EQ(regulator.frequency(), 700);
  regulator.SetFrequency(800);
  EXPECT_EQ(regulator.frequency(), 800);
  regulator.SetFrequency(0);
  EXPECT_EQ(regulator.frequency(), 1);
}

} // namespace
