// VELEDGER - Core Types Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/core/types.h"
#include "veledger/core/errors.h"

#include <algorithm>
#include <stdexcept>

namespace veledger {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    constexpr UAmount LOW64_MASK = (static_cast<UAmount>(1) << 64) - 1;

    /// Full 128x128 -> 256 bit product as (hi, lo)
    void Multiply256(UAmount a, UAmount b, UAmount& hi, UAmount& lo) {
        UAmount a0 = a & LOW64_MASK, a1 = a >> 64;
        UAmount b0 = b & LOW64_MASK, b1 = b >> 64;

        UAmount p00 = a0 * b0;
        UAmount p01 = a0 * b1;
        UAmount p10 = a1 * b0;
        UAmount p11 = a1 * b1;

        UAmount mid = (p00 >> 64) + (p01 & LOW64_MASK) + (p10 & LOW64_MASK);
        lo = (mid << 64) | (p00 & LOW64_MASK);
        hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);
    }
}

// ============================================================================
// Checked Arithmetic
// ============================================================================

Amount CheckedAdd(Amount a, Amount b) {
    Amount r;
    if (__builtin_add_overflow(a, b, &r)) {
        throw ArithmeticError("addition overflow: " + AmountToString(a) + " + " + AmountToString(b));
    }
    return r;
}

Amount CheckedSub(Amount a, Amount b) {
    Amount r;
    if (__builtin_sub_overflow(a, b, &r)) {
        throw ArithmeticError("subtraction overflow: " + AmountToString(a) + " - " + AmountToString(b));
    }
    return r;
}

Amount CheckedMul(Amount a, Amount b) {
    Amount r;
    if (__builtin_mul_overflow(a, b, &r)) {
        throw ArithmeticError("multiplication overflow: " + AmountToString(a) + " * " + AmountToString(b));
    }
    return r;
}

Amount MulDiv(Amount a, Amount b, Amount d) {
    if (a < 0 || b < 0 || d <= 0) {
        throw ArithmeticError("MulDiv requires non-negative operands and positive divisor");
    }

    UAmount hi, lo;
    Multiply256(static_cast<UAmount>(a), static_cast<UAmount>(b), hi, lo);

    UAmount divisor = static_cast<UAmount>(d);
    if (hi >= divisor) {
        throw ArithmeticError("MulDiv overflow: " + AmountToString(a) + " * " +
                              AmountToString(b) + " / " + AmountToString(d));
    }

    // Restoring long division of (hi:lo) by divisor; hi < divisor keeps the quotient in 128 bits.
    UAmount rem = hi;
    UAmount quotient = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((lo >> i) & 1);
        quotient <<= 1;
        if (carry || rem >= divisor) {
            rem -= divisor;
            quotient |= 1;
        }
    }

    if (quotient > static_cast<UAmount>(MAX_AMOUNT)) {
        throw ArithmeticError("MulDiv result exceeds 127 bits");
    }
    return static_cast<Amount>(quotient);
}

void ThrowNarrowingError(const std::string& value, int bits) {
    throw ArithmeticError("SafeCast overflow: value " + value + " does not fit in " +
                          std::to_string(bits) + " bits");
}

// ============================================================================
// Amount Formatting
// ============================================================================

std::string AmountToString(Amount value) {
    if (value == 0) return "0";

    bool negative = value < 0;
    // Work in unsigned space so the most negative value does not overflow on negation
    UAmount magnitude = negative ? static_cast<UAmount>(0) - static_cast<UAmount>(value)
                                 : static_cast<UAmount>(value);
    std::string digits;
    while (magnitude > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
        magnitude /= 10;
    }
    if (negative) digits.push_back('-');
    std::reverse(digits.begin(), digits.end());
    return digits;
}

bool ParseRawAmount(const std::string& str, Amount& out) {
    if (str.empty()) return false;

    size_t i = 0;
    bool negative = false;
    if (str[0] == '-') {
        negative = true;
        i = 1;
        if (str.size() == 1) return false;
    }

    Amount value = 0;
    for (; i < str.size(); ++i) {
        char c = str[i];
        if (c < '0' || c > '9') return false;
        if (__builtin_mul_overflow(value, 10, &value) ||
            __builtin_add_overflow(value, c - '0', &value)) {
            return false;
        }
    }
    out = negative ? -value : value;
    return true;
}

std::string FormatAmount(Amount amount, const std::string& unit) {
    bool negative = amount < 0;
    Amount magnitude = negative ? -amount : amount;
    Amount whole = magnitude / COIN;
    Amount frac = magnitude % COIN;

    std::string result = (negative ? "-" : "") + AmountToString(whole);
    if (frac > 0) {
        std::string fracStr = AmountToString(frac);
        fracStr.insert(0, DECIMALS - fracStr.size(), '0');
        fracStr.erase(fracStr.find_last_not_of('0') + 1);
        result += "." + fracStr;
    }
    if (!unit.empty()) {
        result += " " + unit;
    }
    return result;
}

bool ParseAmount(const std::string& str, Amount& out) {
    size_t dot = str.find('.');
    std::string wholePart = str.substr(0, dot);
    std::string fracPart = dot == std::string::npos ? "" : str.substr(dot + 1);

    if (wholePart.empty() || fracPart.size() > static_cast<size_t>(DECIMALS)) {
        return false;
    }
    if (dot != std::string::npos && fracPart.empty()) {
        return false;
    }

    Amount whole = 0;
    if (!ParseRawAmount(wholePart, whole) || whole < 0) {
        return false;
    }

    Amount frac = 0;
    if (!fracPart.empty()) {
        fracPart.append(DECIMALS - fracPart.size(), '0');
        if (!ParseRawAmount(fracPart, frac) || frac < 0) {
            return false;
        }
    }

    Amount scaled;
    if (__builtin_mul_overflow(whole, COIN, &scaled) ||
        __builtin_add_overflow(scaled, frac, &scaled)) {
        return false;
    }
    out = scaled;
    return true;
}

// ============================================================================
// Hex Helpers
// ============================================================================

std::string HexStr(const Byte* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }
    return result;
}

std::vector<Byte> ParseHex(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<Byte> result;
    result.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = HexCharToNibble(hex[i]);
        int low = HexCharToNibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        result.push_back(static_cast<Byte>((high << 4) | low));
    }
    return result;
}

// ============================================================================
// Address Implementation
// ============================================================================

std::string Address::ToHex() const {
    return HexStr(data_.data(), SIZE);
}

Address Address::FromHex(const std::string& hex) {
    std::string body = hex;
    if (body.size() >= 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X')) {
        body = body.substr(2);
    }
    if (body.size() != SIZE * 2) {
        return Address();
    }
    try {
        std::vector<Byte> bytes = ParseHex(body);
        return Address(bytes.data(), bytes.size());
    } catch (const std::invalid_argument&) {
        return Address();
    }
}

Address Address::FromLabel(uint64_t label) {
    std::array<Byte, SIZE> data{};
    for (int i = 0; i < 8; ++i) {
        data[SIZE - 1 - i] = static_cast<Byte>(label >> (8 * i));
    }
    data[0] = 0xAE;
    return Address(data);
}

} // namespace veledger
