// VELEDGER - Serialization Tests
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "veledger/core/serialize.h"

#include <vector>

using namespace veledger;

class SerializeTest : public ::testing::Test {
protected:
    DataStream stream_;
};

// ============================================================================
// Fixed-width Encodings
// ============================================================================

TEST_F(SerializeTest, LittleEndian64) {
    Serialize(stream_, static_cast<uint64_t>(0x0102030405060708ULL));
    ASSERT_EQ(stream_.size(), 8u);
    EXPECT_EQ(stream_.data()[0], 0x08);
    EXPECT_EQ(stream_.data()[7], 0x01);
}

TEST_F(SerializeTest, BigEndianKeysSortNumerically) {
    DataStream a, b;
    ser_writebe64(a, 255);
    ser_writebe64(b, 256);
    EXPECT_LT(a.str(), b.str());
    EXPECT_EQ(ser_readbe64(b), 256u);
}

TEST_F(SerializeTest, SignedValuesKeepSign) {
    stream_ << static_cast<int64_t>(-5) << static_cast<Amount>(-COIN * 3);
    EXPECT_EQ(stream_.size(), 8u + 16u);

    int64_t small = 0;
    Amount big = 0;
    stream_ >> small >> big;
    EXPECT_EQ(small, -5);
    EXPECT_EQ(big, -COIN * 3);
    EXPECT_TRUE(stream_.empty());
}

TEST_F(SerializeTest, ExtremeAmounts) {
    stream_ << MAX_AMOUNT << (-MAX_AMOUNT - 1);
    Amount hi = 0, lo = 0;
    stream_ >> hi >> lo;
    EXPECT_EQ(hi, MAX_AMOUNT);
    EXPECT_EQ(lo, -MAX_AMOUNT - 1);
}

// ============================================================================
// Variable-length Encodings
// ============================================================================

TEST_F(SerializeTest, CompactSizeBoundaries) {
    WriteCompactSize(stream_, 252);
    EXPECT_EQ(stream_.size(), 1u);
    WriteCompactSize(stream_, 253);
    EXPECT_EQ(stream_.size(), 1u + 9u);

    EXPECT_EQ(ReadCompactSize(stream_), 252u);
    EXPECT_EQ(ReadCompactSize(stream_), 253u);
}

TEST_F(SerializeTest, NonCanonicalCompactSizeRejected) {
    ser_writedata8(stream_, 0xFF);
    ser_writedata64(stream_, 5);
    EXPECT_THROW(ReadCompactSize(stream_), std::ios_base::failure);
}

TEST_F(SerializeTest, StringsAndVectors) {
    std::vector<uint64_t> ids = {1, 7, 42};
    stream_ << std::string("veledger") << ids << Address::FromLabel(9);

    std::string name;
    std::vector<uint64_t> decodedIds;
    Address addr;
    stream_ >> name >> decodedIds >> addr;
    EXPECT_EQ(name, "veledger");
    EXPECT_EQ(decodedIds, ids);
    EXPECT_EQ(addr, Address::FromLabel(9));
}

TEST_F(SerializeTest, TruncatedReadThrows) {
    ser_writedata8(stream_, 1);
    uint64_t value = 0;
    EXPECT_THROW(stream_ >> value, std::ios_base::failure);
}

TEST_F(SerializeTest, BoolRoundTrip) {
    stream_ << true << false;
    bool a = false, b = true;
    stream_ >> a >> b;
    EXPECT_TRUE(a);
    EXPECT_FALSE(b);
}
