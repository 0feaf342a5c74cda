// VELEDGER - Core Types Tests
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "veledger/core/errors.h"
#include "veledger/core/types.h"

using namespace veledger;

// ============================================================================
// Time Helpers
// ============================================================================

TEST(TimeTest, FloorToWeek) {
    EXPECT_EQ(FloorToWeek(0), 0);
    EXPECT_EQ(FloorToWeek(WEEK - 1), 0);
    EXPECT_EQ(FloorToWeek(WEEK), WEEK);
    EXPECT_EQ(FloorToWeek(1700000000), 1699488000);
}

TEST(TimeTest, FloorToDay) {
    EXPECT_EQ(FloorToDay(1700000000), 1699920000);
    EXPECT_EQ(FloorToDay(1699920000), 1699920000);
}

TEST(TimeTest, MaxTimeIsFourYears) {
    EXPECT_EQ(MAXTIME, 126144000);
    EXPECT_EQ(MULTIPLIER, COIN);
}

// ============================================================================
// Checked Arithmetic
// ============================================================================

TEST(CheckedArithmeticTest, AddSubMul) {
    EXPECT_EQ(CheckedAdd(2, 3), 5);
    EXPECT_EQ(CheckedSub(2, 3), -1);
    EXPECT_EQ(CheckedMul(COIN, 1000), 1000 * COIN);
}

TEST(CheckedArithmeticTest, OverflowThrows) {
    EXPECT_THROW(CheckedAdd(MAX_AMOUNT, 1), ArithmeticError);
    EXPECT_THROW(CheckedSub(-MAX_AMOUNT - 1, 1), ArithmeticError);
    EXPECT_THROW(CheckedMul(MAX_AMOUNT, 2), ArithmeticError);

    try {
        CheckedAdd(MAX_AMOUNT, 1);
        FAIL() << "expected ArithmeticError";
    } catch (const ArithmeticError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ArithmeticOverflow);
    }
}

TEST(CheckedArithmeticTest, MulDivUsesWideIntermediate) {
    // a * b overflows 128 bits but the quotient fits
    Amount a = MAX_AMOUNT / 2;
    EXPECT_EQ(MulDiv(a, 4, 4), a);
    EXPECT_EQ(MulDiv(7, 3, 2), 10);
    EXPECT_EQ(MulDiv(0, MAX_AMOUNT, 1), 0);
}

TEST(CheckedArithmeticTest, MulDivRejectsBadInput) {
    EXPECT_THROW(MulDiv(1, 1, 0), ArithmeticError);
    EXPECT_THROW(MulDiv(MAX_AMOUNT, 4, 2), ArithmeticError);
}

TEST(CheckedArithmeticTest, SafeCast) {
    EXPECT_EQ(SafeCast<int64_t>(static_cast<Amount>(42)), 42);
    EXPECT_EQ(SafeCast<uint64_t>(static_cast<Amount>(UINT64_MAX)), UINT64_MAX);
    EXPECT_THROW(SafeCast<int64_t>(static_cast<Amount>(INT64_MAX) + 1), ArithmeticError);
    EXPECT_THROW(SafeCast<uint64_t>(static_cast<Amount>(-1)), ArithmeticError);
}

// ============================================================================
// Amount Formatting
// ============================================================================

TEST(AmountTest, AmountToStringHandles128Bits) {
    EXPECT_EQ(AmountToString(0), "0");
    EXPECT_EQ(AmountToString(-17), "-17");
    EXPECT_EQ(AmountToString(COIN * COIN), "1000000000000000000000000000000000000");
}

TEST(AmountTest, FormatAmount) {
    EXPECT_EQ(FormatAmount(COIN), "1");
    EXPECT_EQ(FormatAmount(COIN / 2), "0.5");
    EXPECT_EQ(FormatAmount(1), "0.000000000000000001");
    EXPECT_EQ(FormatAmount(-3 * COIN / 2, "VE"), "-1.5 VE");
}

TEST(AmountTest, ParseAmount) {
    Amount out = 0;
    ASSERT_TRUE(ParseAmount("12.5", out));
    EXPECT_EQ(out, 25 * COIN / 2);
    ASSERT_TRUE(ParseAmount("1000", out));
    EXPECT_EQ(out, 1000 * COIN);
    ASSERT_TRUE(ParseAmount("0.000000000000000001", out));
    EXPECT_EQ(out, 1);

    EXPECT_FALSE(ParseAmount("", out));
    EXPECT_FALSE(ParseAmount("1.", out));
    EXPECT_FALSE(ParseAmount("-1", out));
    EXPECT_FALSE(ParseAmount("abc", out));
    EXPECT_FALSE(ParseAmount("0.0000000000000000001", out));
}

TEST(AmountTest, ParseRawAmount) {
    Amount out = 0;
    ASSERT_TRUE(ParseRawAmount("170141183460469231731687303715884105727", out));
    EXPECT_EQ(out, MAX_AMOUNT);
    EXPECT_FALSE(ParseRawAmount("170141183460469231731687303715884105728", out));
}

// ============================================================================
// Address
// ============================================================================

TEST(AddressTest, NullAddress) {
    Address addr;
    EXPECT_TRUE(addr.IsNull());
    EXPECT_EQ(addr.ToHex(), std::string(40, '0'));
}

TEST(AddressTest, HexRoundTrip) {
    const std::string hex = "00112233445566778899aabbccddeeff00112233";
    Address addr = Address::FromHex("0x" + hex);
    EXPECT_FALSE(addr.IsNull());
    EXPECT_EQ(addr.ToHex(), hex);
    EXPECT_EQ(Address::FromHex(hex), addr);
}

TEST(AddressTest, BadHexGivesNull) {
    EXPECT_TRUE(Address::FromHex("0x1234").IsNull());
    EXPECT_TRUE(Address::FromHex(std::string(40, 'z')).IsNull());
}

TEST(AddressTest, LabelsAreDistinctAndOrdered) {
    Address a = Address::FromLabel(1);
    Address b = Address::FromLabel(2);
    EXPECT_NE(a, b);
    EXPECT_FALSE(a.IsNull());
    EXPECT_TRUE(a < b || b < a);
    EXPECT_EQ(Address::FromLabel(1), a);
}

TEST(HexTest, HexStrAndParse) {
    std::vector<Byte> bytes = {0x00, 0x7f, 0xff};
    EXPECT_EQ(HexStr(bytes.data(), bytes.size()), "007fff");
    EXPECT_EQ(ParseHex("007fff"), bytes);
}
