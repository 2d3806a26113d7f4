#ifndef BCTL_TOKEN_TLV_PARSER_HPP
#define BCTL_TOKEN_TLV_PARSER_HPP
#pragma once
/*
 * bctl TLV parser
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

#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "../crypto/keys.hpp"
#include "../errors.hpp"
#include "tlv.hpp"

namespace bctl {

// routines for parsing tlv blocks. Every structural problem is reported
// as a malformed token.
struct tlvParser {
    static constexpr uint8_t extra_bytes_code{253};
    static constexpr uint8_t extra4_bytes_code{254};
    using Blk = std::span<const uint8_t>;
    Blk m_blk{};
    size_t m_off{};

    constexpr size_t size() const noexcept { return m_blk.size(); }

    constexpr auto data() const noexcept { return m_blk.data(); }

    constexpr auto off() const noexcept { return m_off; }

    constexpr auto eof() const noexcept { return off() >= size(); }

    constexpr Blk subspan(size_t off, size_t cnt = std::dynamic_extent) const noexcept { return m_blk.subspan(off, cnt); }

    constexpr Blk rest() const noexcept { return subspan(off()); }

    constexpr auto isType(tlv typ) const noexcept { return size() > 0 && m_blk[0] == uint8_t(typ); }

    uint8_t cur() const {
        if (off() >= size()) fail(errc::malformedToken, "read past end of tlv block");
        return m_blk[off()];
    }

    constexpr tlvParser() = default;

    constexpr tlvParser(Blk blk, size_t off) noexcept : m_blk{blk}, m_off{off} { }

    // parse a sequence of tlvs (no enclosing type and length)
    static tlvParser sequence(Blk blk) { return tlvParser(blk, 0); }

    // parse a buffer that must consist of exactly one tlv of type 'typ'.
    // The offset is left at the first content byte.
    static tlvParser outer(Blk blk, tlv typ) {
        auto seq = sequence(blk);
        if (seq.eof()) fail(errc::malformedToken, "empty input");
        auto b = seq.nextBlk(typ);
        if (! seq.eof()) fail(errc::malformedToken, "{} bytes of trailing garbage", seq.size() - seq.off());
        return b;
    }

    auto nextByte() {
        if (off() >= size()) fail(errc::malformedToken, "read past end of tlv block");
        return m_blk[m_off++];
    }

    // decode the variable length 'length' field of the TLV. 'off' will end up
    // at the octet following the length (start of the block's content).
    size_t blkLen() {
        auto c = nextByte();
        if (c < extra_bytes_code) return c;
        if (c > extra4_bytes_code) fail(errc::malformedToken, "invalid tlv length code {}", c);
        size_t len = 0;
        for (int n = c == extra_bytes_code? 2 : 4; n > 0; --n) len = (len << 8) | nextByte();
        return len;
    }

    /*
     * return a parser for the block starting at the current offset and advance
     * this block's offset over that block. The offset of the new block will be
     * set to its first content byte.
     */
    tlvParser nextBlk() {
        auto strt = m_off;  // remember start
        nextByte();         // skip over type
        auto len = blkLen();
        if (m_off + len > m_blk.size()) fail(errc::malformedToken, "nested tlv block larger than parent");
        auto off = m_off - strt; // new block's tlv hdr size
        m_off += len;
        return tlvParser(subspan(strt, len + off), off);
    }

    // check that the block at the current offset is type 'typ' then return a parser for it.
    tlvParser nextBlk(tlv typ) {
        if (eof()) fail(errc::malformedToken, "expected type {} block, got eof", uint8_t(typ));
        if (cur() != uint8_t(typ)) fail(errc::malformedToken, "expected type {} block, got {}", uint8_t(typ), cur());
        return nextBlk();
    }

    // true if the next block is of type 'typ'
    bool peek(tlv typ) const noexcept { return ! eof() && m_blk[m_off] == uint8_t(typ); }

    // contents of the block (everything after the type and length)
    constexpr Blk content() const noexcept { return rest(); }

    // return the contents of a tlv block as an uint64_t. An error is thrown if the block
    // contains more than 8 bytes.
    uint64_t toNumber() const {
        auto c = content();
        if (c.size() > 8) fail(errc::malformedToken, "block too large to be a number");
        uint64_t res{};
        for (auto b : c) res = (res << 8) | b;
        return res;
    }

    // return the contents of the tlv block as a string_view.
    constexpr auto toSv() const noexcept { return std::string_view((const char*)(m_blk.data()+m_off), size() - off()); }

    auto toVector() const { auto c = content(); return std::vector<uint8_t>(c.begin(), c.end()); }

    // decode a (KeyAlgorithm, KeyBytes) pair
    PublicKey toKey() const {
        auto p = tlvParser(m_blk, m_off);
        auto a = algorithmFrom(uint8_t(p.nextBlk(tlv::KeyAlgorithm).toNumber()));
        if (! a) fail(errc::malformedToken, "unknown key algorithm");
        auto k = p.nextBlk(tlv::KeyBytes).toVector();
        if (! p.eof()) fail(errc::malformedToken, "unexpected data after key");
        try {
            return PublicKey::fromBytes(k, *a);
        } catch (const error& e) {
            fail(errc::malformedToken, "invalid embedded key: {}", e.what());
        }
    }

    // the entire block (header included) as bytes
    constexpr auto asSpan() const noexcept { return m_blk; }
};

} // namespace bctl

#endif // BCTL_TOKEN_TLV_PARSER_HPP
