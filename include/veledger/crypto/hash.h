// VELEDGER - Hashing
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// SHA-256 helpers backed by OpenSSL.

#ifndef VELEDGER_CRYPTO_HASH_H
#define VELEDGER_CRYPTO_HASH_H

#include "veledger/core/types.h"

#include <string>
#include <vector>

namespace veledger {
namespace crypto {

/// SHA-256 of a byte range
Hash256 Sha256(const Byte* data, size_t len);

inline Hash256 Sha256(const std::vector<Byte>& data) {
    return Sha256(data.data(), data.size());
}

/// Incremental writer producing a SHA-256 digest of everything written
class HashWriter {
public:
    HashWriter& Write(const Byte* data, size_t len) {
        buffer_.insert(buffer_.end(), data, data + len);
        return *this;
    }

    HashWriter& Write(const std::string& tag) {
        return Write(reinterpret_cast<const Byte*>(tag.data()), tag.size());
    }

    HashWriter& Write(const Address& addr) {
        return Write(addr.data(), Address::SIZE);
    }

    /// Big-endian 64-bit value
    HashWriter& WriteU64(uint64_t value);

    Hash256 GetHash() const { return Sha256(buffer_); }

private:
    std::vector<Byte> buffer_;
};

} // namespace crypto
} // namespace veledger

#endif // VELEDGER_CRYPTO_HASH_H
