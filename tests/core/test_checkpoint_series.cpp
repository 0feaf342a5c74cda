// VELEDGER - Checkpoint Series Tests
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "veledger/core/checkpoint_series.h"
#include "veledger/core/errors.h"

using namespace veledger;

class CheckpointSeriesTest : public ::testing::Test {
protected:
    CheckpointSeries<Amount> series_;
};

TEST_F(CheckpointSeriesTest, EmptyLookupsReturnDefault) {
    EXPECT_TRUE(series_.Empty());
    EXPECT_EQ(series_.UpperLookup(100), 0);
    EXPECT_EQ(series_.Latest(), 0);
}

TEST_F(CheckpointSeriesTest, UpperLookupFindsMostRecentAtOrBefore) {
    series_.Push(100, 1);
    series_.Push(200, 2);
    series_.Push(300, 3);

    EXPECT_EQ(series_.UpperLookup(99), 0);
    EXPECT_EQ(series_.UpperLookup(100), 1);
    EXPECT_EQ(series_.UpperLookup(199), 1);
    EXPECT_EQ(series_.UpperLookup(200), 2);
    EXPECT_EQ(series_.UpperLookup(1000), 3);
    EXPECT_EQ(series_.Latest(), 3);
}

TEST_F(CheckpointSeriesTest, SameKeyOverwrites) {
    series_.Push(100, 1);
    series_.Push(100, 5);
    EXPECT_EQ(series_.Length(), 1u);
    EXPECT_EQ(series_.UpperLookup(100), 5);
}

TEST_F(CheckpointSeriesTest, EarlierKeyRejected) {
    series_.Push(200, 1);
    try {
        series_.Push(100, 2);
        FAIL() << "expected InvariantError";
    } catch (const InvariantError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CheckpointUnorderedInsertion);
    }
    EXPECT_EQ(series_.Length(), 1u);
}

TEST_F(CheckpointSeriesTest, AssignRequiresIncreasingKeys) {
    series_.Assign({{10, 1}, {20, 2}});
    EXPECT_EQ(series_.UpperLookup(15), 1);

    EXPECT_THROW(series_.Assign({{10, 1}, {10, 2}}), InvariantError);
    // Failed assignment leaves the series untouched
    EXPECT_EQ(series_.Length(), 2u);
}
