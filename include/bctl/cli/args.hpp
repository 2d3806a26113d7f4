#ifndef BCTL_CLI_ARGS_HPP
#define BCTL_CLI_ARGS_HPP
#pragma once
/*
 * Command line options of the bctl subcommands
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
 * All subcommands share one set of long-only options (ids start at 256 so
 * they can't collide with short option characters). Each subcommand passes
 * getopt_long the table of the options it accepts and parseArgs fills in
 * an Args. Constraints between options (conflicts, needs, one-of) are
 * checked by the subcommand with the helpers at the end.
 */

#include <getopt.h>

#include <charconv>
#include <chrono>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../crypto/algorithm.hpp"
#include "../datalog/parser.hpp"
#include "../errors.hpp"
#include "../input/param.hpp"
#include "../input/sources.hpp"
#include "../input/ttl.hpp"

namespace bctl::cli {

enum opt : int {
    Help = 'h',
    FromPrivateKey = 256, FromFile, FromFormat, FromAlgorithm, KeyAlgorithm, KeyOutputFormat,
    OnlyPublicKey, OnlyPrivateKey,
    RootKeyId, Param, Raw, RawInput, RawOutput,
    PrivateKey, PrivateKeyFile, PrivateKeyFormat, PrivateKeyAlgorithm,
    Context, AddTtl, Block, BlockFile,
    Json, PublicKey, PublicKeyFile, PublicKeyFormat, PublicKeyAlgorithm,
    MaxFacts, MaxIterations, MaxTime,
    AuthorizeInteractive, AuthorizeWith, AuthorizeWithFile, AuthorizeWithSnapshot, AuthorizeWithSnapshotFile,
    AuthorizeWithRawSnapshotFile, IncludeTime,
    Query, QueryAll,
    DumpSnapshotTo, DumpRawSnapshot, DumpPoliciesSnapshotTo, DumpRawPoliciesSnapshot,
    BlockContents, BlockContentsFile, RawBlockContents
};

struct Args {
    std::vector<std::string> positional{};
    std::set<int> seen{};

    std::optional<std::string> fromPrivateKey{}, fromFile{};
    KeyFormat fromFormat{KeyFormat::Hex};
    std::optional<Algorithm> fromAlgorithm{}, keyAlgorithm{};
    KeyFormat keyOutputFormat{KeyFormat::Hex};

    std::optional<uint32_t> rootKeyId{};
    std::vector<bctl::Param> params{};

    std::optional<std::string> privateKey{}, privateKeyFile{};
    KeyFormat privateKeyFormat{KeyFormat::Hex};
    std::optional<Algorithm> privateKeyAlgorithm{};

    std::optional<std::string> context{};
    std::optional<Ttl> addTtl{};
    std::optional<std::string> block{}, blockFile{};

    std::optional<std::string> publicKey{}, publicKeyFile{};
    KeyFormat publicKeyFormat{KeyFormat::Hex};
    std::optional<Algorithm> publicKeyAlgorithm{};

    std::optional<uint64_t> maxFacts{}, maxIterations{};
    std::optional<std::chrono::nanoseconds> maxTime{};

    std::optional<std::string> authorizeWith{}, authorizeWithFile{}, authorizeWithSnapshot{}, authorizeWithSnapshotFile{};
    std::optional<datalog::Rule> query{};
    std::optional<std::string> dumpSnapshotTo{}, dumpPoliciesSnapshotTo{};
    std::optional<std::string> blockContents{}, blockContentsFile{};

    bool has(int id) const noexcept { return seen.contains(id); }
};

// the option table entry for 'id' (its first name if it has aliases)
static inline const option* optionFor(std::span<const option> table, int id) noexcept {
    for (const auto& o : table) if (o.name && o.val == id) return &o;
    return nullptr;
}

static inline std::string optName(std::span<const option> table, int id) {
    auto o = optionFor(table, id);
    return o? format("--{}", o->name) : format("option {}", id);
}

namespace detail {

static inline KeyFormat keyFormat(std::string_view v, std::string_view opt) {
    auto f = keyFormatFrom(v);
    if (! f) fail(errc::usage, "invalid value '{}' for --{} (hex, pem or raw)", v, opt);
    return *f;
}

static inline Algorithm algorithm(std::string_view v, std::string_view opt) {
    auto a = algorithmFrom(v);
    if (! a) fail(errc::usage, "invalid value '{}' for --{} (ed25519 or secp256r1)", v, opt);
    return *a;
}

template <typename T>
static inline T number(std::string_view v, std::string_view opt) {
    T n{};
    auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
    if (ec != std::errc{} || p != v.data() + v.size()) fail(errc::usage, "invalid value '{}' for --{}", v, opt);
    return n;
}

} // namespace detail

/*
 * Parse 'argv' (argv[0] is the subcommand name) using the options in 'table'
 * which must end with a zero entry. Positional arguments are collected in order.
 */
static inline Args parseArgs(int argc, char* const* argv, std::span<const option> table) {
    Args a{};
    opterr = 0;     // errors are reported as bctl::error
    optind = 0;     // full rescan: each subcommand has its own argv
    const option* longopts = table.data();
    for (int c, idx = -1; (c = getopt_long(argc, argv, "-:h", longopts, &idx)) != -1; idx = -1) {
        std::string_view name = idx >= 0? table[idx].name : "";
        std::string_view v = optarg? optarg : "";
        if (c != 1 && c != '?' && c != ':') a.seen.insert(c);
        switch (c) {
            case 1: a.positional.emplace_back(v); break;
            case '?': {
                std::string_view bad = optind > 0 && optind <= argc? argv[optind - 1] : "";
                if (optopt && optopt < 256) fail(errc::usage, "unknown option -{}", char(optopt));
                fail(errc::usage, "unknown option '{}'", bad);
            }
            case ':': {
                std::string_view bad = optind > 0 && optind <= argc? argv[optind - 1] : "";
                fail(errc::usage, "option '{}' requires a value", bad);
            }
            case Help: break;
            case FromPrivateKey: a.fromPrivateKey = v; break;
            case FromFile: a.fromFile = v; break;
            case FromFormat: a.fromFormat = detail::keyFormat(v, name); break;
            case FromAlgorithm: a.fromAlgorithm = detail::algorithm(v, name); break;
            case KeyAlgorithm: a.keyAlgorithm = detail::algorithm(v, name); break;
            case KeyOutputFormat: a.keyOutputFormat = detail::keyFormat(v, name); break;
            case RootKeyId: a.rootKeyId = detail::number<uint32_t>(v, name); break;
            case Param: a.params.emplace_back(parseParam(v)); break;
            case PrivateKey: a.privateKey = v; break;
            case PrivateKeyFile: a.privateKeyFile = v; break;
            case PrivateKeyFormat: a.privateKeyFormat = detail::keyFormat(v, name); break;
            case PrivateKeyAlgorithm: a.privateKeyAlgorithm = detail::algorithm(v, name); break;
            case Context: a.context = v; break;
            case AddTtl: a.addTtl = Ttl::parse(v); break;
            case Block: a.block = v; break;
            case BlockFile: a.blockFile = v; break;
            case PublicKey: a.publicKey = v; break;
            case PublicKeyFile: a.publicKeyFile = v; break;
            case PublicKeyFormat: a.publicKeyFormat = detail::keyFormat(v, name); break;
            case PublicKeyAlgorithm: a.publicKeyAlgorithm = detail::algorithm(v, name); break;
            case MaxFacts: a.maxFacts = detail::number<uint64_t>(v, name); break;
            case MaxIterations: a.maxIterations = detail::number<uint64_t>(v, name); break;
            case MaxTime: {
                auto d = parseDuration(v);
                if (! d) fail(errc::parse, "invalid duration '{}' for --max-time (e.g., 100ms, 1s)", v);
                a.maxTime = *d;
                break;
            }
            case AuthorizeWith: a.authorizeWith = v; break;
            case AuthorizeWithFile: a.authorizeWithFile = v; break;
            case AuthorizeWithSnapshot: a.authorizeWithSnapshot = v; break;
            case AuthorizeWithSnapshotFile: a.authorizeWithSnapshotFile = v; break;
            case Query: a.query = datalog::parseRule(v); break;
            case DumpSnapshotTo: a.dumpSnapshotTo = v; break;
            case DumpPoliciesSnapshotTo: a.dumpPoliciesSnapshotTo = v; break;
            case BlockContents: a.blockContents = v; break;
            case BlockContentsFile: a.blockContentsFile = v; break;
            default: break;     // flags: recorded in 'seen'
        }
    }
    return a;
}

/* option constraints. Violations are usage errors. */

static inline void conflicts(const Args& a, std::span<const option> t, int x, int y) {
    if (a.has(x) && a.has(y)) fail(errc::usage, "{} can't be used with {}", optName(t, x), optName(t, y));
}

// 'x' can only be given if 'y' is
static inline void needs(const Args& a, std::span<const option> t, int x, int y) {
    if (a.has(x) && ! a.has(y)) fail(errc::usage, "{} requires {}", optName(t, x), optName(t, y));
}

// at most one of 'ids' may be given
static inline void exclusive(const Args& a, std::span<const option> t, std::initializer_list<int> ids) {
    for (auto i = ids.begin(); i != ids.end(); ++i)
        for (auto j = i + 1; j != ids.end(); ++j) conflicts(a, t, *i, *j);
}

// exactly one of 'x' and 'y' must be given
static inline void exactlyOne(const Args& a, std::span<const option> t, int x, int y) {
    conflicts(a, t, x, y);
    if (! a.has(x) && ! a.has(y)) fail(errc::usage, "one of {} or {} is required", optName(t, x), optName(t, y));
}

static inline void positionals(const Args& a, size_t min, size_t max, std::string_view what) {
    if (a.positional.size() < min) fail(errc::usage, "missing {}", what);
    if (a.positional.size() > max) fail(errc::usage, "unexpected argument '{}'", a.positional[max]);
}

} // namespace bctl::cli

#endif // BCTL_CLI_ARGS_HPP
