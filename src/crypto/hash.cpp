// VELEDGER - Hashing Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/crypto/hash.h"

#include <openssl/sha.h>

namespace veledger {
namespace crypto {

Hash256 Sha256(const Byte* data, size_t len) {
    Hash256 out{};
    SHA256(data, len, out.data());
    return out;
}

HashWriter& HashWriter::WriteU64(uint64_t value) {
    Byte buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<Byte>(value >> (8 * (7 - i)));
    }
    return Write(buf, sizeof(buf));
}

} // namespace crypto
} // namespace veledger
