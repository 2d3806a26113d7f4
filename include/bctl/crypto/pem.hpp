#ifndef BCTL_CRYPTO_PEM_HPP
#define BCTL_CRYPTO_PEM_HPP
#pragma once
/*
 * PEM (PKCS#8 private / SubjectPublicKeyInfo public) key envelopes
 *
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
 */

#include <memory>
#include <string>
#include <string_view>
#include <utility>

extern "C" {
    #include <openssl/bio.h>
    #include <openssl/buffer.h>
    #include <openssl/evp.h>
    #include <openssl/pem.h>
};

#include "ed25519.hpp"
#include "secp256r1.hpp"

namespace bctl::pem {

using bio = std::unique_ptr<BIO, decltype(&BIO_free_all)>;
using pkey = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

static inline bio memBio() {
    bio b{BIO_new(BIO_s_mem()), BIO_free_all};
    if (! b) throw std::runtime_error("unable to allocate BIO");
    return b;
}

static inline bio readBio(std::string_view text) {
    bio b{BIO_new_mem_buf(text.data(), int(text.size())), BIO_free_all};
    if (! b) throw std::runtime_error("unable to allocate BIO");
    return b;
}

static inline std::string bioString(BIO* b) {
    BUF_MEM* bm{};
    BIO_get_mem_ptr(b, &bm);
    return std::string(bm->data, bm->length);
}

// wrap a key in an EVP_PKEY. 'priv' selects whether 'k' is a private or public key.
static inline pkey toPkey(Algorithm alg, byteSpan k, bool priv) {
    if (alg == Algorithm::Ed25519) {
        auto* p = priv? EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, k.data(), k.size())
                      : EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, k.data(), k.size());
        if (! p) fail(errc::malformedKey, "invalid ed25519 key");
        return {p, EVP_PKEY_free};
    }
    auto ec = priv? secp256r1::fromPrivate(k) : secp256r1::fromPublic(k);
    pkey p{EVP_PKEY_new(), EVP_PKEY_free};
    if (! p || EVP_PKEY_set1_EC_KEY(p.get(), ec.get()) != 1) throw std::runtime_error("unable to wrap P-256 key");
    return p;
}

// extract the algorithm and raw key bytes from an EVP_PKEY
static inline std::pair<Algorithm,keyVal> fromPkey(EVP_PKEY* p, bool priv) {
    switch (EVP_PKEY_get_base_id(p)) {
    case EVP_PKEY_ED25519: {
        keyVal k(priv? ed25519::privateSize : ed25519::publicSize);
        size_t len = k.size();
        auto ok = priv? EVP_PKEY_get_raw_private_key(p, k.data(), &len) : EVP_PKEY_get_raw_public_key(p, k.data(), &len);
        if (ok != 1 || len != k.size()) fail(errc::malformedKey, "unable to extract ed25519 key from PEM");
        return {Algorithm::Ed25519, k};
    }
    case EVP_PKEY_EC: {
        secp256r1::ecKey ec{EVP_PKEY_get1_EC_KEY(p), EC_KEY_free};
        if (! ec || EC_GROUP_get_curve_name(EC_KEY_get0_group(ec.get())) != NID_X9_62_prime256v1)
            fail(errc::malformedKey, "PEM EC key is not on curve secp256r1");
        return {Algorithm::Secp256r1, priv? secp256r1::privateBytes(ec.get()) : secp256r1::publicBytes(ec.get())};
    }
    default:
        fail(errc::malformedKey, "unsupported PEM key type");
    }
}

static inline std::string privateToPem(Algorithm alg, byteSpan k) {
    auto p = toPkey(alg, k, true);
    auto b = memBio();
    if (PEM_write_bio_PrivateKey(b.get(), p.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
        throw std::runtime_error("unable to PEM encode private key");
    return bioString(b.get());
}

static inline std::string publicToPem(Algorithm alg, byteSpan k) {
    auto p = toPkey(alg, k, false);
    auto b = memBio();
    if (PEM_write_bio_PUBKEY(b.get(), p.get()) != 1) throw std::runtime_error("unable to PEM encode public key");
    return bioString(b.get());
}

static inline std::pair<Algorithm,keyVal> privateFromPem(std::string_view text) {
    auto b = readBio(text);
    pkey p{PEM_read_bio_PrivateKey(b.get(), nullptr, nullptr, nullptr), EVP_PKEY_free};
    if (! p) fail(errc::malformedKey, "invalid PEM private key");
    return fromPkey(p.get(), true);
}

static inline std::pair<Algorithm,keyVal> publicFromPem(std::string_view text) {
    auto b = readBio(text);
    pkey p{PEM_read_bio_PUBKEY(b.get(), nullptr, nullptr, nullptr), EVP_PKEY_free};
    if (! p) fail(errc::malformedKey, "invalid PEM public key");
    return fromPkey(p.get(), false);
}

} // namespace bctl::pem

#endif // BCTL_CRYPTO_PEM_HPP
