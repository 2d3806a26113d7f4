#ifndef BCTL_ENCODING_HPP
#define BCTL_ENCODING_HPP
#pragma once
/*
 * hex, base64 and utf-8 helpers (libsodium codecs)
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
#include <cstring>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
    #include <sodium.h>
};

namespace bctl {

using bytes = std::vector<uint8_t>;
using byteSpan = std::span<const uint8_t>;

static inline void sodiumInit() {
    if (sodium_init() == -1) throw std::runtime_error("unable to set up libsodium");
}

static inline std::string toHex(byteSpan b) {
    std::string out(b.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), b.data(), b.size());
    out.resize(b.size() * 2);
    return out;
}

// returns nullopt if 'hex' has an odd length or any non-hex character
static inline std::optional<bytes> fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) return std::nullopt;
    bytes out(hex.size() / 2);
    size_t len{};
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &len, nullptr) != 0
        || len != out.size()) return std::nullopt;
    return out;
}

// tokens are emitted with the url-safe alphabet (with padding)
static inline std::string toBase64(byteSpan b) {
    const auto outLen = sodium_base64_encoded_len(b.size(), sodium_base64_VARIANT_URLSAFE);
    std::string out(outLen, '\0');
    sodium_bin2base64(out.data(), out.size(), b.data(), b.size(), sodium_base64_VARIANT_URLSAFE);
    out.resize(std::strlen(out.c_str())); // trim trailing '\0'
    return out;
}

/*
 * Decode base64 text that came from a file, stdin or the command line.
 * ASCII whitespace (e.g., the newline at the end of a file) is ignored and
 * both alphabets are accepted, with or without padding.
 */
static inline std::optional<bytes> fromBase64(std::string_view in) {
    std::string s;
    s.reserve(in.size());
    for (char c : in) {
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t') s.push_back(c);
    }
    bytes out(s.size() * 3 / 4 + 3);
    size_t outLen = 0;

    auto try_variant = [&](int variant) -> bool {
        outLen = 0;
        return sodium_base642bin(out.data(), out.size(), s.c_str(), s.size(),
                                 nullptr, &outLen, nullptr, variant) == 0;
    };
    if (try_variant(sodium_base64_VARIANT_URLSAFE) ||
        try_variant(sodium_base64_VARIANT_URLSAFE_NO_PADDING) ||
        try_variant(sodium_base64_VARIANT_ORIGINAL) ||
        try_variant(sodium_base64_VARIANT_ORIGINAL_NO_PADDING)) {
        out.resize(outLen);
        return out;
    }
    return std::nullopt;
}

/*
 * Strict utf-8 check: rejects overlong encodings, surrogates, code points
 * past U+10FFFF and truncated sequences.
 */
static inline bool validUtf8(byteSpan s) noexcept {
    size_t i = 0;
    const auto n = s.size();
    while (i < n) {
        auto c = s[i];
        if (c < 0x80) { ++i; continue; }
        size_t len;
        uint32_t cp;
        if ((c & 0xe0) == 0xc0) { len = 2; cp = c & 0x1f; }
        else if ((c & 0xf0) == 0xe0) { len = 3; cp = c & 0x0f; }
        else if ((c & 0xf8) == 0xf0) { len = 4; cp = c & 0x07; }
        else return false;
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            if ((s[i+k] & 0xc0) != 0x80) return false;
            cp = (cp << 6) | (s[i+k] & 0x3f);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) return false;
        i += len;
    }
    return true;
}

static inline std::string_view asSv(byteSpan b) noexcept { return {(const char*)b.data(), b.size()}; }

static inline byteSpan asBytes(std::string_view s) noexcept { return {(const uint8_t*)s.data(), s.size()}; }

} // namespace bctl

#endif // BCTL_ENCODING_HPP
