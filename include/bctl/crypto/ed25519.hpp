#ifndef BCTL_CRYPTO_ED25519_HPP
#define BCTL_CRYPTO_ED25519_HPP
#pragma once
/*
 * EdDSA (ed25519) primitives
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
 * Uses libsodium (see https://doc.libsodium.org/). A private key is the
 * 32 byte seed; libsodium's 64 byte secret key is rebuilt from it for
 * each signature and wiped afterwards.
 */

#include <array>

#include "../encoding.hpp"
#include "algorithm.hpp"

namespace bctl::ed25519 {

static constexpr size_t privateSize = crypto_sign_SEEDBYTES;
static constexpr size_t publicSize = crypto_sign_PUBLICKEYBYTES;
static constexpr size_t sigSize = crypto_sign_BYTES;

static inline keyVal generate() {
    keyVal seed(privateSize);
    randombytes_buf(seed.data(), seed.size());
    return seed;
}

static inline keyVal publicFromPrivate(byteSpan seed) {
    keyVal pk(publicSize);
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> sk;
    crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data());
    sodium_memzero(sk.data(), sk.size());
    return pk;
}

static inline bytes sign(byteSpan seed, byteSpan msg) {
    std::array<uint8_t, publicSize> pk;
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> sk;
    crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data());
    bytes sig(sigSize);
    crypto_sign_detached(sig.data(), nullptr, msg.data(), msg.size(), sk.data());
    sodium_memzero(sk.data(), sk.size());
    return sig;
}

static inline bool verify(byteSpan pk, byteSpan msg, byteSpan sig) {
    if (pk.size() != publicSize || sig.size() != sigSize) return false;
    return crypto_sign_verify_detached(sig.data(), msg.data(), msg.size(), pk.data()) == 0;
}

} // namespace bctl::ed25519

#endif // BCTL_CRYPTO_ED25519_HPP
