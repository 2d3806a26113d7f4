#ifndef BCTL_INPUT_PARAM_HPP
#define BCTL_INPUT_PARAM_HPP
#pragma once
/*
 * --param name[:type]=value
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

#include <cctype>
#include <charconv>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../crypto/keys.hpp"
#include "../datalog/params.hpp"
#include "../errors.hpp"
#include "../rfc3339.hpp"

namespace bctl {

struct Param {
    std::string name;
    datalog::ParamValue value;
};

/*
 * Types are string (the default), integer, date (RFC3339), bytes ("hex:" prefix),
 * bool and pubkey ("ed25519/" or "secp256r1/" prefix).
 */
static inline Param parseParam(std::string_view arg) {
    using datalog::Term;
    auto eq = arg.find('=');
    if (eq == arg.npos) fail(errc::parse, "param '{}' must be name[:type]=value", arg);
    auto lhs = arg.substr(0, eq);
    auto val = arg.substr(eq + 1);
    std::string_view type{"string"};
    if (auto c = lhs.find(':'); c != lhs.npos) {
        type = lhs.substr(c + 1);
        lhs = lhs.substr(0, c);
    }
    if (lhs.empty()) fail(errc::parse, "param '{}' has no name", arg);
    for (char c : lhs)
        if (! (std::isalnum((unsigned char)c) || c == '_')) fail(errc::parse, "invalid param name '{}'", lhs);

    std::string name{lhs};
    if (type == "string") return {name, Term::string(std::string(val))};
    if (type == "integer") {
        int64_t v{};
        auto [p, ec] = std::from_chars(val.data(), val.data() + val.size(), v);
        if (ec != std::errc{} || p != val.data() + val.size()) fail(errc::parse, "param {}: '{}' is not an integer", name, val);
        return {name, Term::integer(v)};
    }
    if (type == "date") {
        auto d = parseRfc3339(val);
        if (! d) fail(errc::parse, "param {}: '{}' is not an RFC3339 date", name, val);
        return {name, Term::date(toEpoch(*d))};
    }
    if (type == "bytes") {
        if (! val.starts_with("hex:")) fail(errc::parse, "param {}: bytes must be hex encoded with a 'hex:' prefix", name);
        auto b = fromHex(val.substr(4));
        if (! b) fail(errc::parse, "param {}: '{}' is not valid hex", name, val.substr(4));
        return {name, Term::byteString(std::move(*b))};
    }
    if (type == "bool") {
        if (val == "true") return {name, Term::boolean(true)};
        if (val == "false") return {name, Term::boolean(false)};
        fail(errc::parse, "param {}: '{}' is not true or false", name, val);
    }
    if (type == "pubkey") {
        if (! val.starts_with("ed25519/") && ! val.starts_with("secp256r1/"))
            fail(errc::parse, "param {}: public keys must start with 'ed25519/' or 'secp256r1/'", name);
        try {
            return {name, PublicKey::fromString(val)};
        } catch (const error& e) {
            fail(errc::parse, "param {}: {}", name, e.what());
        }
    }
    fail(errc::parse, "param {}: unknown type '{}' (string, integer, date, bytes, bool or pubkey)", name, type);
}

// the last value given for a name wins
static inline datalog::ParamMap paramMap(const std::vector<Param>& params) {
    datalog::ParamMap m{};
    for (const auto& p : params) m.insert_or_assign(p.name, p.value);
    return m;
}

} // namespace bctl

#endif // BCTL_INPUT_PARAM_HPP
