#ifndef BCTL_TOKEN_TLV_ENCODER_HPP
#define BCTL_TOKEN_TLV_ENCODER_HPP
#pragma once
/*
 * bctl TLV encoder
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

#include <chrono>
#include <span>
#include <string_view>
#include <vector>

#include "../crypto/keys.hpp"
#include "../errors.hpp"
#include "tlv.hpp"

namespace bctl {

// routines for encoding tlv blocks. Lengths >= 253 use the 3 byte
// (253, hi, lo) form and lengths over 64k the 5 byte (254, 4 byte length) form.
struct tlvEncoder {
    using Blk = std::vector<uint8_t>;
    static constexpr uint8_t extra_bytes_code{253};
    static constexpr uint8_t extra4_bytes_code{254};

    Blk m_blk{};    // vector to fill with TLVs

    auto& vec() const noexcept { return m_blk; }

    auto size() const noexcept { return m_blk.size(); }

    auto data() const noexcept { return m_blk.data(); }

    void addTlvHeader(tlv typ, size_t len) {
        m_blk.emplace_back(uint8_t(typ));
        if (len > 0xffff) {
            if (len > 0xffffffff) fail(errc::malformedToken, "tlv type {} too large to encode ({} bytes)", uint8_t(typ), len);
            m_blk.emplace_back(extra4_bytes_code);
            for (int s = 24; s > 0; s -= 8) m_blk.emplace_back(uint8_t(len >> s));
        } else if (len >= extra_bytes_code) {
            m_blk.emplace_back(extra_bytes_code);
            m_blk.emplace_back(uint8_t(len >> 8));
        }
        m_blk.emplace_back(uint8_t(len));
    }

    // add an uint64_t with tlv type 'typ'
    auto& addNumber(tlv typ, uint64_t num) {
        m_blk.emplace_back(uint8_t(typ));
        m_blk.emplace_back(8);
        for (int s = 56; s >= 0; s -= 8) m_blk.emplace_back(uint8_t(num >> s));
        return *this;
    }

    auto& addBytes(tlv typ, std::span<const uint8_t> s) {
        addTlvHeader(typ, s.size());
        m_blk.insert(m_blk.end(), s.begin(), s.end());
        return *this;
    }

    auto& addString(tlv typ, std::string_view s) { return addBytes(typ, {(const uint8_t*)s.data(), s.size()}); }

    // wrap the contents of another encoder in a tlv of type 'typ'
    auto& addNested(tlv typ, const tlvEncoder& inner) { return addBytes(typ, inner.vec()); }

    // a public key is (algorithm, key bytes)
    auto& addKey(tlv typ, const PublicKey& pk) {
        tlvEncoder k{};
        k.addNumber(tlv::KeyAlgorithm, uint8_t(pk.algorithm()));
        k.addBytes(tlv::KeyBytes, pk.toBytes());
        return addNested(typ, k);
    }
};

} // namespace bctl

#endif // BCTL_TOKEN_TLV_ENCODER_HPP
