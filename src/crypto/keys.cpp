// VELEDGER - secp256k1 Keys Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/crypto/keys.h"
#include "veledger/crypto/hash.h"
#include "veledger/util/logging.h"

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>

namespace veledger {
namespace crypto {

namespace {

struct EcKeyDeleter { void operator()(EC_KEY* p) const { EC_KEY_free(p); } };
struct EcPointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct BignumDeleter { void operator()(BIGNUM* p) const { BN_clear_free(p); } };

using EcKeyPtr = std::unique_ptr<EC_KEY, EcKeyDeleter>;
using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

/// EC_KEY holding the public point decoded from compressed bytes
EcKeyPtr DecodePublicKey(const Byte* data, size_t len) {
    EcKeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
    if (!key) {
        return nullptr;
    }
    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    EcPointPtr point(EC_POINT_new(group));
    if (!point || !EC_POINT_oct2point(group, point.get(), data, len, nullptr)) {
        return nullptr;
    }
    if (!EC_KEY_set_public_key(key.get(), point.get())) {
        return nullptr;
    }
    return key;
}

/// EC_KEY holding the secret scalar and its public point
EcKeyPtr DecodePrivateKey(const Byte* secret) {
    EcKeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
    if (!key) {
        return nullptr;
    }
    BignumPtr priv(BN_bin2bn(secret, PrivateKey::SIZE, nullptr));
    if (!priv || !EC_KEY_set_private_key(key.get(), priv.get())) {
        return nullptr;
    }

    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    EcPointPtr pub(EC_POINT_new(group));
    if (!pub || !EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, nullptr) ||
        !EC_KEY_set_public_key(key.get(), pub.get())) {
        return nullptr;
    }
    return key;
}

} // namespace

// ============================================================================
// PublicKey
// ============================================================================

PublicKey::PublicKey(const Byte* data, size_t len) {
    data_.fill(0);
    if (data && len == SIZE && (data[0] == 0x02 || data[0] == 0x03)) {
        std::copy(data, data + SIZE, data_.begin());
        parsed_ = true;
    }
}

bool PublicKey::IsValid() const {
    return parsed_ && DecodePublicKey(data_.data(), SIZE) != nullptr;
}

Address PublicKey::GetAddress() const {
    Hash256 digest = Sha256(data_.data(), SIZE);
    return Address(digest.data() + (digest.size() - Address::SIZE), Address::SIZE);
}

bool PublicKey::Verify(const Hash256& hash, const std::vector<Byte>& signature) const {
    if (!parsed_ || signature.empty()) {
        return false;
    }
    EcKeyPtr key = DecodePublicKey(data_.data(), SIZE);
    if (!key) {
        return false;
    }
    int rc = ECDSA_verify(0, hash.data(), static_cast<int>(hash.size()),
                          signature.data(), static_cast<int>(signature.size()), key.get());
    return rc == 1;
}

std::optional<PublicKey> PublicKey::FromHex(const std::string& hex) {
    std::vector<Byte> bytes;
    try {
        bytes = ParseHex(hex);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    PublicKey key(bytes);
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

// ============================================================================
// PrivateKey
// ============================================================================

PrivateKey::PrivateKey(const std::array<Byte, SIZE>& data) : data_(data) {
    valid_ = Validate();
}

PrivateKey::~PrivateKey() {
    Clear();
}

void PrivateKey::Clear() {
    OPENSSL_cleanse(data_.data(), SIZE);
    valid_ = false;
}

bool PrivateKey::Validate() const {
    EcKeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
    if (!key) {
        return false;
    }
    BignumPtr value(BN_bin2bn(data_.data(), SIZE, nullptr));
    if (!value || BN_is_zero(value.get())) {
        return false;
    }
    const BIGNUM* order = EC_GROUP_get0_order(EC_KEY_get0_group(key.get()));
    return BN_cmp(value.get(), order) < 0;
}

PrivateKey PrivateKey::Generate() {
    std::array<Byte, SIZE> secret{};
    for (int attempt = 0; attempt < 16; ++attempt) {
        if (RAND_bytes(secret.data(), SIZE) != 1) {
            break;
        }
        PrivateKey key(secret);
        OPENSSL_cleanse(secret.data(), SIZE);
        if (key.IsValid()) {
            return key;
        }
    }
    LOG_ERROR(util::LogCategory::CRYPTO) << "Unable to generate a private key";
    return PrivateKey();
}

PrivateKey PrivateKey::FromSeed(const std::string& seed) {
    Hash256 digest = Sha256(reinterpret_cast<const Byte*>(seed.data()), seed.size());
    // Re-hash in the (astronomically unlikely) case the digest is out of range
    PrivateKey key(digest);
    while (!key.IsValid()) {
        digest = Sha256(digest.data(), digest.size());
        key = PrivateKey(digest);
    }
    return key;
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    std::vector<Byte> bytes;
    try {
        bytes = ParseHex(hex);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    if (bytes.size() != SIZE) {
        return std::nullopt;
    }
    std::array<Byte, SIZE> secret{};
    std::copy(bytes.begin(), bytes.end(), secret.begin());
    PrivateKey key(secret);
    OPENSSL_cleanse(secret.data(), SIZE);
    OPENSSL_cleanse(bytes.data(), bytes.size());
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

PublicKey PrivateKey::GetPublicKey() const {
    if (!valid_) {
        return PublicKey();
    }
    EcKeyPtr key = DecodePrivateKey(data_.data());
    if (!key) {
        return PublicKey();
    }

    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    const EC_POINT* point = EC_KEY_get0_public_key(key.get());
    std::array<Byte, PublicKey::SIZE> out{};
    size_t written = EC_POINT_point2oct(group, point, POINT_CONVERSION_COMPRESSED,
                                        out.data(), out.size(), nullptr);
    if (written != PublicKey::SIZE) {
        return PublicKey();
    }
    return PublicKey(out.data(), out.size());
}

std::vector<Byte> PrivateKey::Sign(const Hash256& hash) const {
    if (!valid_) {
        return {};
    }
    EcKeyPtr key = DecodePrivateKey(data_.data());
    if (!key) {
        return {};
    }

    std::vector<Byte> signature(static_cast<size_t>(ECDSA_size(key.get())));
    unsigned int sigLen = 0;
    if (!ECDSA_sign(0, hash.data(), static_cast<int>(hash.size()),
                    signature.data(), &sigLen, key.get())) {
        LOG_WARN(util::LogCategory::CRYPTO) << "ECDSA signing failed";
        return {};
    }
    signature.resize(sigLen);
    return signature;
}

} // namespace crypto
} // namespace veledger
