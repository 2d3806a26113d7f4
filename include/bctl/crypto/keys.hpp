#ifndef BCTL_CRYPTO_KEYS_HPP
#define BCTL_CRYPTO_KEYS_HPP
#pragma once
/*
 * Public/private keys and key pairs
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

/*
 * Keys are held as raw bytes tagged with their algorithm. Text forms:
 *   private:  ed25519-private/<hex>   secp256r1-private/<hex>
 *   public:   ed25519/<hex>           secp256r1/<hex>
 * Unprefixed hex is accepted on input and interpreted with the algorithm
 * supplied by the caller (ed25519 if none).
 */

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

#include "../format.hpp"
#include "ed25519.hpp"
#include "pem.hpp"
#include "secp256r1.hpp"

namespace bctl {

namespace detail {

static inline std::string_view trimmed(std::string_view s) noexcept {
    while (! s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
    while (! s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
    return s;
}

// split "<alg><suffix>/<hex>" into its algorithm (if prefixed) and hex
static inline std::pair<std::optional<Algorithm>,std::string_view> splitPrefixed(std::string_view s,
                                                                               std::string_view suffix) {
    for (auto a : {Algorithm::Ed25519, Algorithm::Secp256r1}) {
        auto pfx = std::string(algorithmName(a)).append(suffix).append("/");
        if (s.starts_with(pfx)) return {a, s.substr(pfx.size())};
    }
    return {std::nullopt, s};
}

static inline std::optional<Algorithm> pickAlgorithm(std::optional<Algorithm> found, std::optional<Algorithm> wanted,
                                                     std::string_view what) {
    if (found && wanted && *found != *wanted)
        fail(errc::malformedKey, "{} is a {} key but {} was specified", what, algorithmName(*found), algorithmName(*wanted));
    return found? found : wanted;
}

} // namespace detail

struct PublicKey {
    Algorithm alg_{Algorithm::Ed25519};
    keyVal key_{};

    PublicKey() = default;
    PublicKey(Algorithm alg, keyVal key) : alg_{alg}, key_{std::move(key)} { }

    static PublicKey fromBytes(byteSpan b, Algorithm alg) {
        if (alg == Algorithm::Ed25519) {
            if (b.size() != ed25519::publicSize)
                fail(errc::malformedKey, "ed25519 public key must be {} bytes, not {}", ed25519::publicSize, b.size());
        } else {
            secp256r1::fromPublic(b);   // throws if not a valid point
        }
        return {alg, keyVal(b.begin(), b.end())};
    }

    // "<alg>/<hex>" or plain hex with a caller-supplied algorithm
    static PublicKey fromString(std::string_view s, std::optional<Algorithm> alg = std::nullopt) {
        auto [found, hex] = detail::splitPrefixed(detail::trimmed(s), "");
        auto a = detail::pickAlgorithm(found, alg, "public key");
        auto b = fromHex(hex);
        if (! b) fail(errc::malformedKey, "public key is not valid hex");
        return fromBytes(*b, a.value_or(Algorithm::Ed25519));
    }

    static PublicKey fromPem(std::string_view s, std::optional<Algorithm> alg = std::nullopt) {
        auto [a, k] = pem::publicFromPem(s);
        detail::pickAlgorithm(a, alg, "PEM public key");
        return {a, std::move(k)};
    }

    constexpr Algorithm algorithm() const noexcept { return alg_; }
    const keyVal& toBytes() const noexcept { return key_; }

    std::string toString() const { return format("{}/{}", algorithmName(alg_), toHex(key_)); }
    std::string toPem() const { return pem::publicToPem(alg_, key_); }

    bool verify(byteSpan msg, byteSpan sig) const {
        return alg_ == Algorithm::Ed25519? ed25519::verify(key_, msg, sig) : secp256r1::verify(key_, msg, sig);
    }

    bool operator==(const PublicKey&) const = default;
};

struct PrivateKey {
    Algorithm alg_{Algorithm::Ed25519};
    keyVal key_{};

    PrivateKey() = default;
    PrivateKey(Algorithm alg, keyVal key) : alg_{alg}, key_{std::move(key)} { }
    ~PrivateKey() { if (! key_.empty()) sodium_memzero(key_.data(), key_.size()); }
    PrivateKey(const PrivateKey&) = default;
    PrivateKey(PrivateKey&&) = default;
    PrivateKey& operator=(const PrivateKey&) = default;
    PrivateKey& operator=(PrivateKey&&) = default;

    static PrivateKey generate(Algorithm alg) {
        return {alg, alg == Algorithm::Ed25519? ed25519::generate() : secp256r1::generate()};
    }

    static PrivateKey fromBytes(byteSpan b, Algorithm alg) {
        if (alg == Algorithm::Ed25519) {
            if (b.size() != ed25519::privateSize)
                fail(errc::malformedKey, "ed25519 private key must be {} bytes, not {}", ed25519::privateSize, b.size());
        } else {
            secp256r1::fromPrivate(b);  // range check
        }
        return {alg, keyVal(b.begin(), b.end())};
    }

    // "<alg>-private/<hex>" or plain hex with a caller-supplied algorithm
    static PrivateKey fromString(std::string_view s, std::optional<Algorithm> alg = std::nullopt) {
        auto [found, hex] = detail::splitPrefixed(detail::trimmed(s), "-private");
        auto a = detail::pickAlgorithm(found, alg, "private key");
        auto b = fromHex(hex);
        if (! b) fail(errc::malformedKey, "private key is not valid hex");
        auto k = fromBytes(*b, a.value_or(Algorithm::Ed25519));
        sodium_memzero(b->data(), b->size());
        return k;
    }

    static PrivateKey fromPem(std::string_view s, std::optional<Algorithm> alg = std::nullopt) {
        auto [a, k] = pem::privateFromPem(s);
        detail::pickAlgorithm(a, alg, "PEM private key");
        return {a, std::move(k)};
    }

    constexpr Algorithm algorithm() const noexcept { return alg_; }
    const keyVal& toBytes() const noexcept { return key_; }

    std::string toPrefixedString() const { return format("{}-private/{}", algorithmName(alg_), toHex(key_)); }
    std::string toPem() const { return pem::privateToPem(alg_, key_); }

    PublicKey publicKey() const {
        return {alg_, alg_ == Algorithm::Ed25519? ed25519::publicFromPrivate(key_) : secp256r1::publicFromPrivate(key_)};
    }

    bytes sign(byteSpan msg) const {
        return alg_ == Algorithm::Ed25519? ed25519::sign(key_, msg) : secp256r1::sign(key_, msg);
    }
};

struct KeyPair {
    PrivateKey private_;
    PublicKey public_;

    explicit KeyPair(PrivateKey sk) : private_{std::move(sk)}, public_{private_.publicKey()} { }

    static KeyPair generate(Algorithm alg = Algorithm::Ed25519) { return KeyPair(PrivateKey::generate(alg)); }

    const PrivateKey& privateKey() const noexcept { return private_; }
    const PublicKey& publicKey() const noexcept { return public_; }
};

} // namespace bctl

#endif // BCTL_CRYPTO_KEYS_HPP
