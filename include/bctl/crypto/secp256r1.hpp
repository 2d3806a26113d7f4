#ifndef BCTL_CRYPTO_SECP256R1_HPP
#define BCTL_CRYPTO_SECP256R1_HPP
#pragma once
/*
 * ECDSA (NIST P-256) primitives
 *
 * Copyright (C) 2020-5 Pollere LLC
 * Copyright (C) 2025 The bctl authors
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2.1 of
 *  the License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with this program; if not, see <https://www.gnu.org/licenses/>.
 *  You may contact Pollere LLC at info@pollere.net.
 */

/*
 * Signatures are computed over the SHA-256 hash of the message and are
 * DER-encoded Ecdsa-Sig-Value structures (RFC 3279, Section 2.2.3).
 * Private keys are the 32 byte big-endian scalar, public keys the 33 byte
 * SEC1 compressed point.
 */

#include <array>
#include <memory>

extern "C" {
    #include <openssl/bn.h>
    #include <openssl/ec.h>
    #include <openssl/ecdsa.h>
    #include <openssl/obj_mac.h>
};

#include "../encoding.hpp"
#include "../errors.hpp"
#include "algorithm.hpp"

namespace bctl::secp256r1 {

static constexpr size_t privateSize = 32;
static constexpr size_t publicSize = 33;

using ecKey = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;
using ecPoint = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using bigNum = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;

static inline ecKey newKey() {
    ecKey k{EC_KEY_new_by_curve_name(NID_X9_62_prime256v1), EC_KEY_free};
    if (! k) throw std::runtime_error("unable to allocate P-256 key");
    return k;
}

// build a full key (private scalar plus derived public point)
static inline ecKey fromPrivate(byteSpan d) {
    if (d.size() != privateSize) fail(errc::malformedKey, "secp256r1 private key must be {} bytes, not {}", privateSize, d.size());
    auto k = newKey();
    const auto* grp = EC_KEY_get0_group(k.get());
    bigNum bn{BN_bin2bn(d.data(), d.size(), nullptr), BN_clear_free};
    if (! bn || BN_is_zero(bn.get()) || BN_cmp(bn.get(), EC_GROUP_get0_order(grp)) >= 0)
        fail(errc::malformedKey, "secp256r1 private key out of range");
    ecPoint pub{EC_POINT_new(grp), EC_POINT_free};
    if (! pub || EC_POINT_mul(grp, pub.get(), bn.get(), nullptr, nullptr, nullptr) != 1
        || EC_KEY_set_private_key(k.get(), bn.get()) != 1 || EC_KEY_set_public_key(k.get(), pub.get()) != 1)
        throw std::runtime_error("unable to derive P-256 public key");
    return k;
}

static inline ecKey fromPublic(byteSpan q) {
    auto k = newKey();
    const auto* grp = EC_KEY_get0_group(k.get());
    ecPoint pub{EC_POINT_new(grp), EC_POINT_free};
    if (! pub || EC_POINT_oct2point(grp, pub.get(), q.data(), q.size(), nullptr) != 1
        || EC_KEY_set_public_key(k.get(), pub.get()) != 1)
        fail(errc::malformedKey, "invalid secp256r1 public key");
    return k;
}

static inline keyVal publicBytes(const EC_KEY* k) {
    keyVal q(publicSize);
    if (EC_POINT_point2oct(EC_KEY_get0_group(k), EC_KEY_get0_public_key(k), POINT_CONVERSION_COMPRESSED,
                           q.data(), q.size(), nullptr) != publicSize)
        throw std::runtime_error("unable to encode P-256 public key");
    return q;
}

static inline keyVal privateBytes(const EC_KEY* k) {
    keyVal d(privateSize);
    if (BN_bn2binpad(EC_KEY_get0_private_key(k), d.data(), d.size()) != int(privateSize))
        throw std::runtime_error("unable to encode P-256 private key");
    return d;
}

static inline keyVal generate() {
    auto k = newKey();
    if (EC_KEY_generate_key(k.get()) != 1) throw std::runtime_error("P-256 key generation failed");
    return privateBytes(k.get());
}

static inline keyVal publicFromPrivate(byteSpan d) { return publicBytes(fromPrivate(d).get()); }

static inline std::array<uint8_t, crypto_hash_sha256_BYTES> digest(byteSpan msg) {
    std::array<uint8_t, crypto_hash_sha256_BYTES> h;
    crypto_hash_sha256(h.data(), msg.data(), msg.size());
    return h;
}

static inline bytes sign(byteSpan d, byteSpan msg) {
    auto k = fromPrivate(d);
    auto h = digest(msg);
    bytes sig(ECDSA_size(k.get()));
    unsigned int sigLen{};
    if (ECDSA_sign(0, h.data(), h.size(), sig.data(), &sigLen, k.get()) != 1)
        throw std::runtime_error("P-256 signing failed");
    sig.resize(sigLen);
    return sig;
}

static inline bool verify(byteSpan q, byteSpan msg, byteSpan sig) {
    ecKey k{nullptr, EC_KEY_free};
    try { k = fromPublic(q); } catch (const error&) { return false; }
    auto h = digest(msg);
    return ECDSA_verify(0, h.data(), h.size(), sig.data(), sig.size(), k.get()) == 1;
}

} // namespace bctl::secp256r1

#endif // BCTL_CRYPTO_SECP256R1_HPP
