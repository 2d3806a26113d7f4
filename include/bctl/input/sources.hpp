#ifndef BCTL_INPUT_SOURCES_HPP
#define BCTL_INPUT_SOURCES_HPP
#pragma once
/*
 * Where command inputs (keys, tokens, datalog) come from and how they're encoded
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
 * Sources are plain data. They can only be made through the static
 * builders below, which map option values onto the set of valid variants:
 * a path of "-" always becomes a stdin source and raw key material can't
 * be given as a literal. Combinations the option parser should have
 * rejected (e.g., both a literal and a file) are std::logic_error.
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include "../crypto/algorithm.hpp"
#include "../errors.hpp"

namespace bctl {

static constexpr std::string_view stdinPath{"-"};

enum class KeyFormat { Hex, Pem, Raw };

static constexpr std::string_view keyFormatName(KeyFormat f) noexcept {
    switch (f) {
        case KeyFormat::Hex: return "hex";
        case KeyFormat::Pem: return "pem";
        case KeyFormat::Raw: return "raw";
    }
    return "?";
}

static constexpr std::optional<KeyFormat> keyFormatFrom(std::string_view s) noexcept {
    if (s == "hex") return KeyFormat::Hex;
    if (s == "pem") return KeyFormat::Pem;
    if (s == "raw") return KeyFormat::Raw;
    return std::nullopt;
}

enum class Encoding { Base64, Raw };

struct KeySource {
    struct HexLiteral { std::string text; };
    struct PemLiteral { std::string text; };
    struct FromFile { KeyFormat format; std::string path; };
    struct FromStdin { KeyFormat format; };
    using Variant = std::variant<HexLiteral, PemLiteral, FromFile, FromStdin>;

    Variant src_;
    std::optional<Algorithm> alg_{};  // only for file/stdin sources

    // key text given on the command line
    static KeySource literal(std::string text, KeyFormat fmt) {
        switch (fmt) {
            case KeyFormat::Hex: return {HexLiteral{std::move(text)}, std::nullopt};
            case KeyFormat::Pem: return {PemLiteral{std::move(text)}, std::nullopt};
            case KeyFormat::Raw: break;
        }
        fail(errc::usage, "raw key input is only allowed from a file or stdin");
    }

    // key read from 'path' ("-" is stdin)
    static KeySource file(std::string path, KeyFormat fmt, std::optional<Algorithm> alg = std::nullopt) {
        if (path == stdinPath) return {FromStdin{fmt}, alg};
        return {FromFile{fmt, std::move(path)}, alg};
    }

    // Exactly one of 'lit' or 'path' must be set.
    static KeySource select(const std::optional<std::string>& lit, const std::optional<std::string>& path,
                            KeyFormat fmt, std::optional<Algorithm> alg) {
        if (lit && path) throw std::logic_error("key given both as a literal and as a file");
        if (lit) {
            if (alg) throw std::logic_error("key algorithm given for a literal key");
            return literal(*lit, fmt);
        }
        if (path) return file(*path, fmt, alg);
        throw std::logic_error("no key source given");
    }

    bool readsStdin() const noexcept { return std::holds_alternative<FromStdin>(src_); }
};

// tokens, third-party requests, third-party blocks and snapshots
struct TokenSource {
    struct FromStdin { Encoding enc; };
    struct FromFile { Encoding enc; std::string path; };
    struct Literal { std::string text; };       // always base64
    using Variant = std::variant<FromStdin, FromFile, Literal>;

    Variant src_;

    static TokenSource file(std::string path, bool raw) {
        auto enc = raw? Encoding::Raw : Encoding::Base64;
        if (path == stdinPath) return {FromStdin{enc}};
        return {FromFile{enc, std::move(path)}};
    }

    static TokenSource literal(std::string text) { return {Literal{std::move(text)}}; }

    static TokenSource select(const std::optional<std::string>& lit, const std::optional<std::string>& path, bool raw) {
        if (lit && path) throw std::logic_error("input given both as a literal and as a file");
        if (lit) {
            if (raw) throw std::logic_error("raw encoding given for a literal input");
            return literal(*lit);
        }
        if (path) return file(*path, raw);
        throw std::logic_error("no input source given");
    }

    bool readsStdin() const noexcept { return std::holds_alternative<FromStdin>(src_); }
};

struct DatalogSource {
    struct FromFile { std::string path; };
    struct FromStdin { };
    struct Literal { std::string text; };
    struct FromEditor { };
    using Variant = std::variant<FromFile, FromStdin, Literal, FromEditor>;

    Variant src_;

    static DatalogSource file(std::string path) {
        if (path == stdinPath) return {FromStdin{}};
        return {FromFile{std::move(path)}};
    }

    static DatalogSource literal(std::string text) { return {Literal{std::move(text)}}; }

    static DatalogSource editor() { return {FromEditor{}}; }

    // the editor is used when neither a literal nor a file was given
    static DatalogSource select(const std::optional<std::string>& lit, const std::optional<std::string>& path) {
        if (lit && path) throw std::logic_error("datalog given both as a literal and as a file");
        if (lit) return literal(*lit);
        if (path) return file(*path);
        return editor();
    }

    bool readsStdin() const noexcept { return std::holds_alternative<FromStdin>(src_); }
    bool usesEditor() const noexcept { return std::holds_alternative<FromEditor>(src_); }
};

} // namespace bctl

#endif // BCTL_INPUT_SOURCES_HPP
