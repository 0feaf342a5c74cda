// VELEDGER - Point History Tests
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "veledger/escrow/point_history.h"

#include <vector>

using namespace veledger;
using namespace veledger::escrow;

namespace {

constexpr Timestamp T0 = 1699488000; // week boundary

Point MakePoint(Amount bias, Amount slope, Timestamp ts) {
    Point p;
    p.bias = bias;
    p.slope = slope;
    p.ts = ts;
    return p;
}

} // namespace

// ============================================================================
// Points and Locks
// ============================================================================

TEST(PointTest, ValueDecaysAndFloorsAtZero) {
    Point p = MakePoint(1000, 10, 100);
    EXPECT_EQ(p.ValueAt(100), 1000);
    EXPECT_EQ(p.ValueAt(150), 500);
    EXPECT_EQ(p.ValueAt(200), 0);
    EXPECT_EQ(p.ValueAt(500), 0);
}

TEST(LockedBalanceTest, ToPoint) {
    LockedBalance lock;
    lock.amount = 1000 * COIN;
    lock.end = T0 + MAXTIME;

    Point p = lock.ToPoint(T0);
    EXPECT_EQ(p.slope, 1000 * COIN / MAXTIME);
    EXPECT_EQ(p.bias, p.slope * MAXTIME);
    EXPECT_LE(p.bias, 1000 * COIN);

    EXPECT_EQ(lock.ToPoint(lock.end), Point());
    EXPECT_TRUE(LockedBalance().IsEmpty());
}

// ============================================================================
// PointHistory
// ============================================================================

class PointHistoryTest : public ::testing::Test {
protected:
    void Add(const Point& p) {
        Transaction tx(journal_);
        history_.Record(p, journal_);
        tx.Commit();
    }

    Journal journal_;
    PointHistory history_;
};

TEST_F(PointHistoryTest, StartsWithSentinel) {
    EXPECT_EQ(history_.Epoch(), 0u);
    EXPECT_EQ(history_.At(0), Point());
    EXPECT_EQ(history_.FindEpoch(T0), 0u);
    EXPECT_THROW(history_.At(1), PreconditionError);
}

TEST_F(PointHistoryTest, FindEpochBinarySearch) {
    Add(MakePoint(10, 0, T0));
    Add(MakePoint(20, 0, T0 + 100));
    Add(MakePoint(30, 0, T0 + 200));

    EXPECT_EQ(history_.Epoch(), 3u);
    EXPECT_EQ(history_.FindEpoch(T0 - 1), 0u);
    EXPECT_EQ(history_.FindEpoch(T0), 1u);
    EXPECT_EQ(history_.FindEpoch(T0 + 150), 2u);
    EXPECT_EQ(history_.FindEpoch(T0 + 10000), 3u);
}

TEST_F(PointHistoryTest, SameInstantReplacesHead) {
    Add(MakePoint(10, 0, T0));
    Add(MakePoint(15, 0, T0));
    EXPECT_EQ(history_.Epoch(), 1u);
    EXPECT_EQ(history_.Latest().bias, 15);
}

TEST_F(PointHistoryTest, EarlierCheckpointRejected) {
    Add(MakePoint(10, 0, T0 + 100));
    Transaction tx(journal_);
    try {
        history_.Record(MakePoint(5, 0, T0), journal_);
        FAIL() << "expected InvariantError";
    } catch (const InvariantError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CheckpointUnorderedInsertion);
    }
}

TEST_F(PointHistoryTest, RollbackRemovesAppendedPoints) {
    Add(MakePoint(10, 0, T0));
    {
        Transaction tx(journal_);
        history_.Record(MakePoint(20, 0, T0 + 1), journal_);
        history_.Record(MakePoint(30, 0, T0 + 1), journal_);
    }
    EXPECT_EQ(history_.Epoch(), 1u);
    EXPECT_EQ(history_.Latest().bias, 10);
}

TEST_F(PointHistoryTest, AssignValidatesOrder) {
    std::vector<Point> points(1);
    points.push_back(MakePoint(1, 0, T0));
    points.push_back(MakePoint(2, 0, T0));
    EXPECT_THROW(history_.Assign(points), InvariantError);

    points.pop_back();
    history_.Assign(points);
    EXPECT_EQ(history_.Epoch(), 1u);
}

// ============================================================================
// Slope changes and replay
// ============================================================================

TEST(SlopeChangeTest, RequiresWeekBoundary) {
    Journal journal;
    SlopeChangeSchedule schedule;
    Transaction tx(journal);
    EXPECT_THROW(schedule.Set(T0 + 1, -5, journal), InvariantError);
    schedule.Set(T0 + WEEK, -5, journal);
    tx.Commit();
    EXPECT_EQ(schedule.At(T0 + WEEK), -5);
    EXPECT_EQ(schedule.At(T0), 0);
    EXPECT_EQ(schedule.Size(), 1u);
}

TEST(ReplayTest, AppliesScheduledSlopeChanges) {
    Journal journal;
    SlopeChangeSchedule schedule;
    {
        Transaction tx(journal);
        schedule.Set(T0 + 2 * WEEK, -4, journal);
        tx.Commit();
    }

    // Two lines with slope 4 and 6, the first ends after two weeks
    Point p = MakePoint(4 * 2 * WEEK + 6 * 4 * WEEK, 10, T0);
    std::vector<Timestamp> boundaries;
    ASSERT_TRUE(ReplayDecay(p, T0 + 3 * WEEK, schedule, DEFAULT_MAX_REPLAY_WEEKS,
                            [&](const Point& b) { boundaries.push_back(b.ts); }));

    EXPECT_EQ(p.ts, T0 + 3 * WEEK);
    EXPECT_EQ(p.slope, 6);
    EXPECT_EQ(p.bias, 6 * WEEK);
    ASSERT_EQ(boundaries.size(), 2u);
    EXPECT_EQ(boundaries[0], T0 + WEEK);
    EXPECT_EQ(boundaries[1], T0 + 2 * WEEK);
}

TEST(ReplayTest, ClampsAtZero) {
    SlopeChangeSchedule schedule;
    Point p = MakePoint(100, 1, T0);
    ASSERT_TRUE(ReplayDecay(p, T0 + WEEK, schedule, DEFAULT_MAX_REPLAY_WEEKS));
    EXPECT_EQ(p.bias, 0);
}

TEST(ReplayTest, ReportsExhaustedBound) {
    SlopeChangeSchedule schedule;
    Point p = MakePoint(0, 0, T0);
    EXPECT_FALSE(ReplayDecay(p, T0 + 10 * WEEK, schedule, 3));
    EXPECT_EQ(p.ts, T0 + 3 * WEEK);
}

TEST(ReplayTest, RejectsTargetInPast) {
    SlopeChangeSchedule schedule;
    Point p = MakePoint(0, 0, T0);
    EXPECT_THROW(ReplayDecay(p, T0 - 1, schedule, 10), InvariantError);
}
