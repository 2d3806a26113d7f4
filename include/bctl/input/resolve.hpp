#ifndef BCTL_INPUT_RESOLVE_HPP
#define BCTL_INPUT_RESOLVE_HPP
#pragma once
/*
 * Turn input sources into keys, token bytes and datalog text
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

#include <string>
#include <string_view>
#include <variant>

#include "../crypto/keys.hpp"
#include "../encoding.hpp"
#include "../errors.hpp"
#include "../file_to_vec.hpp"
#include "editor.hpp"
#include "sources.hpp"
#include "stdin.hpp"

namespace bctl {

namespace detail {

// overload set for std::visit
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

static inline std::string asText(const bytes& b, std::string_view what) {
    if (! validUtf8(b)) fail(errc::invalidText, "{} is not valid UTF-8 text", what);
    return std::string(asSv(b));
}

// read the key material and return it with the format to decode it with
static inline std::pair<bytes,KeyFormat> keyMaterial(const KeySource& ks, StdinReader& in, std::string_view what) {
    return std::visit(overloaded {
        [](const KeySource::HexLiteral& l) { auto s = asBytes(l.text); return std::pair{bytes(s.begin(), s.end()), KeyFormat::Hex}; },
        [](const KeySource::PemLiteral& l) { auto s = asBytes(l.text); return std::pair{bytes(s.begin(), s.end()), KeyFormat::Pem}; },
        [](const KeySource::FromFile& f) { return std::pair{fileToVec(f.path), f.format}; },
        [&](const KeySource::FromStdin& s) { return std::pair{in.read(what), s.format}; }
    }, ks.src_);
}

} // namespace detail

/*
 * Resolve a private key. Hex may carry an "<alg>-private/" prefix, PEM
 * carries its own algorithm and raw bytes use the source's algorithm
 * (ed25519 if none was given).
 */
static inline PrivateKey resolveKey(const KeySource& ks, StdinReader& in, std::string_view what = "private key") {
    auto [mat, fmt] = detail::keyMaterial(ks, in, what);
    struct wipe { bytes& b; ~wipe() { if (! b.empty()) sodium_memzero(b.data(), b.size()); } } w{mat};
    switch (fmt) {
        case KeyFormat::Raw: return PrivateKey::fromBytes(mat, ks.alg_.value_or(Algorithm::Ed25519));
        case KeyFormat::Hex:
            if (! validUtf8(mat)) fail(errc::malformedKey, "{} is not hex text", what);
            return PrivateKey::fromString(asSv(mat), ks.alg_);
        case KeyFormat::Pem: return PrivateKey::fromPem(asSv(mat), ks.alg_);
    }
    throw std::logic_error("unhandled key format");
}

static inline PublicKey resolvePublicKey(const KeySource& ks, StdinReader& in, std::string_view what = "public key") {
    auto [mat, fmt] = detail::keyMaterial(ks, in, what);
    switch (fmt) {
        case KeyFormat::Raw: return PublicKey::fromBytes(mat, ks.alg_.value_or(Algorithm::Ed25519));
        case KeyFormat::Hex:
            if (! validUtf8(mat)) fail(errc::malformedKey, "{} is not hex text", what);
            return PublicKey::fromString(asSv(mat), ks.alg_);
        case KeyFormat::Pem: return PublicKey::fromPem(asSv(mat), ks.alg_);
    }
    throw std::logic_error("unhandled key format");
}

// Resolve the bytes of a token (or request, third-party block, snapshot).
static inline bytes resolveToken(const TokenSource& ts, StdinReader& in, std::string_view what = "token") {
    auto decode = [what](byteSpan text) {
        auto b = fromBase64(asSv(text));
        if (! b) fail(errc::malformedToken, "{} is not valid base64", what);
        return std::move(*b);
    };
    return std::visit(detail::overloaded {
        [&](const TokenSource::Literal& l) { return decode(asBytes(l.text)); },
        [&](const TokenSource::FromFile& f) {
            auto b = fileToVec(f.path);
            return f.enc == Encoding::Raw? b : decode(b);
        },
        [&](const TokenSource::FromStdin& s) {
            auto b = in.read(what);
            return s.enc == Encoding::Raw? b : decode(b);
        }
    }, ts.src_);
}

static inline std::string resolveDatalog(const DatalogSource& ds, StdinReader& in, Editor& ed,
                                         std::string_view what = "datalog") {
    return std::visit(detail::overloaded {
        [](const DatalogSource::Literal& l) { return l.text; },
        [&](const DatalogSource::FromFile& f) { return detail::asText(fileToVec(f.path), what); },
        [&](const DatalogSource::FromStdin&) { return detail::asText(in.read(what), what); },
        [&](const DatalogSource::FromEditor&) { return ed.edit(what); }
    }, ds.src_);
}

} // namespace bctl

#endif // BCTL_INPUT_RESOLVE_HPP
