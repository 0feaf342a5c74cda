// VELEDGER - Clock Tests
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "veledger/core/errors.h"
#include "veledger/util/clock.h"

namespace veledger {
namespace util {
namespace {

TEST(ClockTest, SystemClockIsMonotonic) {
    SystemClock clock;
    Timestamp a = clock.Now();
    Timestamp b = clock.Now();
    EXPECT_GT(a, 1600000000);
    EXPECT_GE(b, a);
}

TEST(ClockTest, ManualClockStartsWhereTold) {
    ManualClock clock(1700000000);
    EXPECT_EQ(clock.Now(), 1700000000);
}

TEST(ClockTest, ManualClockAdvances) {
    ManualClock clock(1000);
    clock.Advance(5);
    EXPECT_EQ(clock.Now(), 1005);
    clock.AdvanceDays(1);
    EXPECT_EQ(clock.Now(), 1005 + DAY);
    clock.AdvanceWeeks(2);
    EXPECT_EQ(clock.Now(), 1005 + DAY + 2 * WEEK);
    clock.Advance(0);
    EXPECT_EQ(clock.Now(), 1005 + DAY + 2 * WEEK);
}

TEST(ClockTest, ManualClockNeverMovesBackwards) {
    ManualClock clock(1000);
    clock.Set(2000);
    EXPECT_EQ(clock.Now(), 2000);
    clock.Set(2000);
    EXPECT_THROW(clock.Set(1999), PreconditionError);
    EXPECT_THROW(clock.Advance(-1), PreconditionError);
    EXPECT_EQ(clock.Now(), 2000);
}

TEST(ClockTest, UsableThroughInterface) {
    ManualClock manual(42);
    IClock& clock = manual;
    manual.Advance(8);
    EXPECT_EQ(clock.Now(), 50);
}

} // namespace
} // namespace util
} // namespace veledger
