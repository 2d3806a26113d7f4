#ifndef BCTL_CMD_INSPECT_HPP
#define BCTL_CMD_INSPECT_HPP
#pragma once
/*
 * bctl inspect and inspect-snapshot
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

#include <optional>
#include <string>

#include "../file_to_vec.hpp"
#include "common.hpp"
#include "report.hpp"

namespace bctl::cmd {

static const option inspectOpts[] = {
    {"json",                            no_argument,       nullptr, cli::Json},
    {"raw-input",                       no_argument,       nullptr, cli::RawInput},
    {"public-key",                      required_argument, nullptr, cli::PublicKey},
    {"public-key-file",                 required_argument, nullptr, cli::PublicKeyFile},
    {"public-key-format",               required_argument, nullptr, cli::PublicKeyFormat},
    {"public-key-algorithm",            required_argument, nullptr, cli::PublicKeyAlgorithm},
    {"max-facts",                       required_argument, nullptr, cli::MaxFacts},
    {"max-iterations",                  required_argument, nullptr, cli::MaxIterations},
    {"max-time",                        required_argument, nullptr, cli::MaxTime},
    {"authorize-interactive",           no_argument,       nullptr, cli::AuthorizeInteractive},
    {"verify-interactive",              no_argument,       nullptr, cli::AuthorizeInteractive},
    {"authorize-with",                  required_argument, nullptr, cli::AuthorizeWith},
    {"verify-with",                     required_argument, nullptr, cli::AuthorizeWith},
    {"authorize-with-file",             required_argument, nullptr, cli::AuthorizeWithFile},
    {"verify-with-file",                required_argument, nullptr, cli::AuthorizeWithFile},
    {"authorize-with-snapshot",         required_argument, nullptr, cli::AuthorizeWithSnapshot},
    {"authorize-with-snapshot-file",    required_argument, nullptr, cli::AuthorizeWithSnapshotFile},
    {"authorize-with-raw-snapshot-file", no_argument,      nullptr, cli::AuthorizeWithRawSnapshotFile},
    {"include-time",                    no_argument,       nullptr, cli::IncludeTime},
    {"query",                           required_argument, nullptr, cli::Query},
    {"query-all",                       no_argument,       nullptr, cli::QueryAll},
    {"param",                           required_argument, nullptr, cli::Param},
    {"dump-snapshot-to",                required_argument, nullptr, cli::DumpSnapshotTo},
    {"dump-raw-snapshot",               no_argument,       nullptr, cli::DumpRawSnapshot},
    {"dump-policies-snapshot-to",       required_argument, nullptr, cli::DumpPoliciesSnapshotTo},
    {"dump-raw-policies-snapshot",      no_argument,       nullptr, cli::DumpRawPoliciesSnapshot},
    {"help",                            no_argument,       nullptr, cli::Help},
    {}
};

namespace detail {

static inline void dumpSnapshot(const std::string& path, const bytes& snap, bool raw, std::string_view what) {
    if (raw) vecToFile(path, snap);
    else {
        auto b64 = toBase64(snap);
        vecToFile(path, bytes(b64.begin(), b64.end()));
    }
    bctl::log(L_INFO)("{} written to {}", what, path);
}

} // namespace detail

/*
 * Decode a token, optionally check its root signature, run an authorizer
 * against it, query it and dump snapshots, then print a report.
 * An authorization failure is a delegate error (no report) but requested
 * snapshots are still written.
 */
static inline void inspect(const Args& a, Env& env) {
    optTable t{inspectOpts};
    auto in = positionalInput(a, "BISCUIT_FILE");

    cli::exclusive(a, t, {cli::PublicKey, cli::PublicKeyFile});
    cli::needs(a, t, cli::PublicKeyAlgorithm, cli::PublicKeyFile);
    if (a.has(cli::PublicKeyFormat) && ! a.has(cli::PublicKey) && ! a.has(cli::PublicKeyFile))
        fail(errc::usage, "--public-key-format requires --public-key or --public-key-file");
    cli::exclusive(a, t, {cli::AuthorizeInteractive, cli::AuthorizeWith, cli::AuthorizeWithFile, cli::AuthorizeWithSnapshot, cli::AuthorizeWithSnapshotFile});
    cli::needs(a, t, cli::AuthorizeWithRawSnapshotFile, cli::AuthorizeWithSnapshotFile);
    cli::needs(a, t, cli::QueryAll, cli::Query);
    cli::needs(a, t, cli::DumpRawSnapshot, cli::DumpSnapshotTo);
    cli::needs(a, t, cli::DumpRawPoliciesSnapshot, cli::DumpPoliciesSnapshotTo);

    std::optional<KeySource> pkSrc{};
    if (a.publicKey || a.publicKeyFile)
        pkSrc = KeySource::select(a.publicKey, a.publicKeyFile, a.publicKeyFormat, a.publicKeyAlgorithm);

    std::optional<DatalogSource> authSrc{};
    if (a.has(cli::AuthorizeInteractive)) authSrc = DatalogSource::editor();
    else if (a.authorizeWith || a.authorizeWithFile) authSrc = DatalogSource::select(a.authorizeWith, a.authorizeWithFile);

    std::optional<TokenSource> snapSrc{};
    if (a.authorizeWithSnapshot || a.authorizeWithSnapshotFile)
        snapSrc = TokenSource::select(a.authorizeWithSnapshot, a.authorizeWithSnapshotFile, a.has(cli::AuthorizeWithRawSnapshotFile));

    Pipeline p{env, "inspect"};
    p.input("token", in).input("public key", pkSrc).input("authorizer", authSrc).input("authorizer snapshot", snapSrc).validate();

    auto token = Token::fromBytes(p.token(in));
    TokenReport report{token};

    if (pkSrc) {
        auto pk = p.publicKey(*pkSrc);
        token.verify(pk);
        report.publicKey_ = pk.toString();
    }

    auto params = paramMap(a.params);
    bool authorizing = authSrc || snapSrc;
    std::optional<Authorizer> auth{};
    if (authorizing || a.query || a.dumpSnapshotTo || a.dumpPoliciesSnapshotTo) {
        auth.emplace();
        if (authSrc) auth->addCode(p.datalog(*authSrc, "authorizer"), params);
        if (snapSrc) auth->addCode(Authorizer::fromSnapshot(p.token(*snapSrc, "authorizer snapshot")).source(), params);
        if (a.has(cli::IncludeTime)) auth->setTime(std::chrono::floor<std::chrono::seconds>(p.now()));
        auth->setLimits(runLimits(a));
        // policies snapshots hold only the authorizer code
        if (a.dumpPoliciesSnapshotTo)
            detail::dumpSnapshot(*a.dumpPoliciesSnapshotTo, auth->policiesSnapshot(), a.has(cli::DumpRawPoliciesSnapshot),
                                 "policies snapshot");
        auth->addToken(token);
    }

    if (authorizing) {
        auto res = auth->authorize();
        if (a.dumpSnapshotTo) detail::dumpSnapshot(*a.dumpSnapshotTo, auth->snapshot(), a.has(cli::DumpRawSnapshot), "snapshot");
        if (! res.ok()) fail(errc::delegate, "authorization failed:\n{}", res.failure());
        report.authorization_ = std::move(res);
    }
    if (a.query) report.query_.emplace(*a.query, a.has(cli::QueryAll), auth->query(*a.query, params, a.has(cli::QueryAll)));
    if (! authorizing && a.dumpSnapshotTo)
        detail::dumpSnapshot(*a.dumpSnapshotTo, auth->snapshot(), a.has(cli::DumpRawSnapshot), "snapshot");

    p.writeText(a.has(cli::Json)? toJson(report).dump(2) + "\n" : toText(report));
}

static const option inspectSnapshotOpts[] = {
    {"json",            no_argument,       nullptr, cli::Json},
    {"raw-input",       no_argument,       nullptr, cli::RawInput},
    {"max-facts",       required_argument, nullptr, cli::MaxFacts},
    {"max-iterations",  required_argument, nullptr, cli::MaxIterations},
    {"max-time",        required_argument, nullptr, cli::MaxTime},
    {"query",           required_argument, nullptr, cli::Query},
    {"query-all",       no_argument,       nullptr, cli::QueryAll},
    {"param",           required_argument, nullptr, cli::Param},
    {"help",            no_argument,       nullptr, cli::Help},
    {}
};

/*
 * Re-run the authorizer recorded in a snapshot. A denied authorization is
 * part of the report, not a command failure.
 */
static inline void inspectSnapshot(const Args& a, Env& env) {
    optTable t{inspectSnapshotOpts};
    auto in = positionalInput(a, "SNAPSHOT_FILE");
    cli::needs(a, t, cli::QueryAll, cli::Query);

    Pipeline p{env, "inspect-snapshot"};
    p.input("snapshot", in).validate();

    auto auth = Authorizer::fromSnapshot(p.token(in, "snapshot"));
    if (a.maxFacts || a.maxIterations || a.maxTime) {
        auto l = auth.limits();
        if (a.maxFacts) l.maxFacts = *a.maxFacts;
        if (a.maxIterations) l.maxIterations = *a.maxIterations;
        if (a.maxTime) l.maxTime = std::chrono::duration_cast<std::chrono::microseconds>(*a.maxTime);
        auth.setLimits(l);
    }
    SnapshotReport report{auth};
    report.authorization_ = auth.authorize();
    if (a.query) report.query_.emplace(*a.query, a.has(cli::QueryAll), auth.query(*a.query, paramMap(a.params), a.has(cli::QueryAll)));

    p.writeText(a.has(cli::Json)? toJson(report).dump(2) + "\n" : toText(report));
}

} // namespace bctl::cmd

#endif // BCTL_CMD_INSPECT_HPP
