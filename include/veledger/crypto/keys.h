// VELEDGER - secp256k1 Keys
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Key pairs used to authorize delegation by signature. Public keys are
// carried in compressed SEC1 form; signatures are DER-encoded ECDSA.

#ifndef VELEDGER_CRYPTO_KEYS_H
#define VELEDGER_CRYPTO_KEYS_H

#include "veledger/core/types.h"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace veledger {
namespace crypto {

// ============================================================================
// PublicKey
// ============================================================================

class PublicKey {
public:
    /// Compressed size (0x02/0x03 + 32 bytes X)
    static constexpr size_t SIZE = 33;

    PublicKey() { data_.fill(0); }

    PublicKey(const Byte* data, size_t len);

    explicit PublicKey(const std::vector<Byte>& data)
        : PublicKey(data.data(), data.size()) {}

    /// True if the bytes encode a point on the curve
    bool IsValid() const;

    const Byte* data() const { return data_.data(); }
    static constexpr size_t size() { return SIZE; }

    std::vector<Byte> ToVector() const { return std::vector<Byte>(data_.begin(), data_.end()); }

    /// Ledger account controlled by this key: last 20 bytes of SHA-256(key)
    Address GetAddress() const;

    /// Verify a DER ECDSA signature over a 32-byte digest
    bool Verify(const Hash256& hash, const std::vector<Byte>& signature) const;

    bool operator==(const PublicKey& other) const { return data_ == other.data_; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

    std::string ToHex() const { return HexStr(data_.data(), SIZE); }

    static std::optional<PublicKey> FromHex(const std::string& hex);

private:
    std::array<Byte, SIZE> data_;
    bool parsed_{false};
};

// ============================================================================
// PrivateKey
// ============================================================================

/**
 * A secp256k1 private key, always 32 bytes in [1, n-1].
 * The secret is wiped on destruction.
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = 32;

    PrivateKey() { data_.fill(0); }

    /// Construct from raw bytes; IsValid() reports range errors
    explicit PrivateKey(const std::array<Byte, SIZE>& data);

    ~PrivateKey();

    PrivateKey(const PrivateKey& other) = default;
    PrivateKey& operator=(const PrivateKey& other) = default;

    /// Fresh key from the OpenSSL CSPRNG
    static PrivateKey Generate();

    /// Deterministic key derived from a seed string (tests and scripts only)
    static PrivateKey FromSeed(const std::string& seed);

    static std::optional<PrivateKey> FromHex(const std::string& hex);

    bool IsValid() const { return valid_; }

    const Byte* data() const { return data_.data(); }

    PublicKey GetPublicKey() const;

    /// DER-encoded ECDSA signature; empty on failure
    std::vector<Byte> Sign(const Hash256& hash) const;

    void Clear();

private:
    std::array<Byte, SIZE> data_;
    bool valid_{false};

    bool Validate() const;
};

} // namespace crypto
} // namespace veledger

#endif // VELEDGER_CRYPTO_KEYS_H
