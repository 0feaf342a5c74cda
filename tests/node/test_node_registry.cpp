// VELEDGER - Node Registry Tests
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "veledger/core/errors.h"
#include "veledger/node/node_registry.h"

namespace veledger {
namespace node {
namespace {

TEST(NodeRegistryTest, AttachAndDetach) {
    NodeRegistry nodes;
    EXPECT_FALSE(nodes.IsAttached(1));

    nodes.Attach(1);
    nodes.Attach(2);
    EXPECT_TRUE(nodes.IsAttached(1));
    EXPECT_EQ(nodes.AttachedCount(), 2u);

    nodes.Detach(1);
    EXPECT_FALSE(nodes.IsAttached(1));
    EXPECT_EQ(nodes.AttachedCount(), 1u);
}

TEST(NodeRegistryTest, AttachTwiceRejected) {
    NodeRegistry nodes;
    nodes.Attach(7);
    try {
        nodes.Attach(7);
        FAIL() << "expected NodeAttached";
    } catch (const PreconditionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NodeAttached);
    }
    EXPECT_EQ(nodes.AttachedCount(), 1u);
}

TEST(NodeRegistryTest, DetachUnknownRejected) {
    NodeRegistry nodes;
    try {
        nodes.Detach(3);
        FAIL() << "expected InvalidState";
    } catch (const PreconditionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidState);
    }
}

TEST(NodeRegistryTest, QualityDefaultsToZero) {
    NodeRegistry nodes;
    EXPECT_EQ(nodes.QualityOf(1, 1000), 0);
}

TEST(NodeRegistryTest, QualityIsCheckpointed) {
    NodeRegistry nodes;
    nodes.SetQuality(1, 4, 1000);
    nodes.SetQuality(1, 9, 2000);

    EXPECT_EQ(nodes.QualityOf(1, 999), 0);
    EXPECT_EQ(nodes.QualityOf(1, 1000), 4);
    EXPECT_EQ(nodes.QualityOf(1, 1999), 4);
    EXPECT_EQ(nodes.QualityOf(1, 2000), 9);
    EXPECT_EQ(nodes.QualityOf(2, 2000), 0);

    // Same instant overwrites
    nodes.SetQuality(1, 6, 2000);
    EXPECT_EQ(nodes.QualityOf(1, 5000), 6);
}

TEST(NodeRegistryTest, QualityOutOfRangeRejected) {
    NodeRegistry nodes;
    EXPECT_THROW(nodes.SetQuality(1, -1, 1000), PreconditionError);
    EXPECT_THROW(nodes.SetQuality(1, 11, 1000), PreconditionError);
    nodes.SetQuality(1, 10, 1000);
    EXPECT_EQ(nodes.QualityOf(1, 1000), 10);
}

TEST(NodeRegistryTest, EarlierQualityRejected) {
    NodeRegistry nodes;
    nodes.SetQuality(1, 5, 2000);
    EXPECT_THROW(nodes.SetQuality(1, 3, 1000), InvariantError);
    EXPECT_EQ(nodes.QualityOf(1, 2000), 5);
}

} // namespace
} // namespace node
} // namespace veledger
