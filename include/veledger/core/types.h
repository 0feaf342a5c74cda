// VELEDGER - Core Types Header
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// This file defines fundamental types used throughout VELEDGER.

#ifndef VELEDGER_CORE_TYPES_H
#define VELEDGER_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

namespace veledger {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Signed fixed-point quantity in base units (18 decimals).
/// 128 bits wide so that bias = slope * duration never wraps for realistic supplies.
using Amount = __int128;

/// Unsigned companion of Amount, used for intermediate products
using UAmount = unsigned __int128;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Position identifier (0 is never allocated)
using TokenId = uint64_t;

/// Constants
constexpr Amount COIN = static_cast<Amount>(1000000000000000000LL);  // 1 token = 10^18 base units
constexpr int DECIMALS = 18;

/// Largest representable Amount
constexpr Amount MAX_AMOUNT = static_cast<Amount>(~static_cast<UAmount>(0) >> 1);

// ============================================================================
// Time Constants
// ============================================================================

constexpr Timestamp DAY = 86400;
constexpr Timestamp WEEK = 7 * DAY;

/// Maximum lock duration (4 years)
constexpr Timestamp MAXTIME = 4 * 365 * DAY;

/// Fixed-point precision used by emission rates
constexpr Amount MULTIPLIER = COIN;

/// Round a timestamp down to a week boundary
inline Timestamp FloorToWeek(Timestamp t) {
    return (t / WEEK) * WEEK;
}

/// Round a timestamp down to a day boundary (midnight)
inline Timestamp FloorToDay(Timestamp t) {
    return t - (t % DAY);
}

// ============================================================================
// Amount Formatting
// ============================================================================

/// Decimal string of a raw 128-bit value (no decimal point)
std::string AmountToString(Amount value);

/// Parse a raw decimal integer string into an Amount
bool ParseRawAmount(const std::string& str, Amount& out);

/// Format as whole tokens with up to 18 decimals (e.g. "997.996 VE")
std::string FormatAmount(Amount amount, const std::string& unit = "");

/// Parse a token amount such as "12.5" into base units
bool ParseAmount(const std::string& str, Amount& out);

// ============================================================================
// Checked Arithmetic
// ============================================================================

/// a + b, throws ArithmeticError on overflow
Amount CheckedAdd(Amount a, Amount b);

/// a - b, throws ArithmeticError on overflow
Amount CheckedSub(Amount a, Amount b);

/// a * b, throws ArithmeticError on overflow
Amount CheckedMul(Amount a, Amount b);

/// Computes floor(a * b / d) for non-negative operands with a 256-bit
/// intermediate product. Throws ArithmeticError if d == 0 or the quotient
/// does not fit in an Amount.
Amount MulDiv(Amount a, Amount b, Amount d);

/// Throws ArithmeticError describing a narrowing failure
[[noreturn]] void ThrowNarrowingError(const std::string& value, int bits);

/// Narrow an Amount into a smaller integer type, failing loudly on overflow
template<typename T>
T SafeCast(Amount value) {
    if (value > static_cast<Amount>(std::numeric_limits<T>::max()) ||
        value < static_cast<Amount>(std::numeric_limits<T>::min())) {
        ThrowNarrowingError(AmountToString(value),
                            std::numeric_limits<T>::digits + (std::numeric_limits<T>::is_signed ? 1 : 0));
    }
    return static_cast<T>(value);
}

// ============================================================================
// Address
// ============================================================================

/**
 * 160-bit account identifier.
 *
 * The null address doubles as "no delegate" in the delegation index.
 */
class Address {
public:
    static constexpr size_t SIZE = 20;

    Address() noexcept { data_.fill(0); }

    explicit Address(const std::array<Byte, SIZE>& data) noexcept : data_(data) {}

    Address(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    constexpr size_t size() const noexcept { return SIZE; }
    const Byte* data() const noexcept { return data_.data(); }
    Byte* data() noexcept { return data_.data(); }

    bool operator==(const Address& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const Address& other) const noexcept { return !(*this == other); }
    bool operator<(const Address& other) const noexcept { return data_ < other.data_; }

    /// Hex string (40 chars, no prefix)
    std::string ToHex() const;

    /// Parse 40 hex chars, optional "0x" prefix; returns null address on error
    static Address FromHex(const std::string& hex);

    /// Deterministic address from a small integer label (tests and scripts)
    static Address FromLabel(uint64_t label);

private:
    std::array<Byte, SIZE> data_;
};

/// 32-byte digest
using Hash256 = std::array<Byte, 32>;

/// Hex encoding helpers
std::string HexStr(const Byte* data, size_t len);
std::vector<Byte> ParseHex(const std::string& hex);

} // namespace veledger

#endif // VELEDGER_CORE_TYPES_H
