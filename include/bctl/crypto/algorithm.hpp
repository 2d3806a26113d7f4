#ifndef BCTL_CRYPTO_ALGORITHM_HPP
#define BCTL_CRYPTO_ALGORITHM_HPP
#pragma once
/*
 * Key algorithms supported for root, third-party and ephemeral keys
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

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace bctl {

using keyVal = std::vector<uint8_t>;

// the numeric values are part of the token wire format
enum class Algorithm : uint8_t { Ed25519 = 0, Secp256r1 = 1 };

static constexpr std::string_view algorithmName(Algorithm a) noexcept {
    return a == Algorithm::Ed25519? "ed25519" : "secp256r1";
}

static constexpr std::optional<Algorithm> algorithmFrom(std::string_view s) noexcept {
    if (s == "ed25519") return Algorithm::Ed25519;
    if (s == "secp256r1" || s == "p256" || s == "p-256") return Algorithm::Secp256r1;
    return std::nullopt;
}

static constexpr std::optional<Algorithm> algorithmFrom(uint8_t b) noexcept {
    if (b == uint8_t(Algorithm::Ed25519)) return Algorithm::Ed25519;
    if (b == uint8_t(Algorithm::Secp256r1)) return Algorithm::Secp256r1;
    return std::nullopt;
}

} // namespace bctl

#endif // BCTL_CRYPTO_ALGORITHM_HPP
