#ifndef BCTL_CMD_KEYPAIR_HPP
#define BCTL_CMD_KEYPAIR_HPP
#pragma once
/*
 * bctl keypair: create a key pair or derive one from a private key
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

#include "common.hpp"

namespace bctl::cmd {

static const option keypairOpts[] = {
    {"from-private-key",    required_argument, nullptr, cli::FromPrivateKey},
    {"from-file",           required_argument, nullptr, cli::FromFile},
    {"from-format",         required_argument, nullptr, cli::FromFormat},
    {"from-algorithm",      required_argument, nullptr, cli::FromAlgorithm},
    {"key-algorithm",       required_argument, nullptr, cli::KeyAlgorithm},
    {"key-output-format",   required_argument, nullptr, cli::KeyOutputFormat},
    {"only-public-key",     no_argument,       nullptr, cli::OnlyPublicKey},
    {"only-private-key",    no_argument,       nullptr, cli::OnlyPrivateKey},
    {"help",                no_argument,       nullptr, cli::Help},
    {}
};

static inline void keypair(const Args& a, Env& env) {
    optTable t{keypairOpts};
    cli::positionals(a, 0, 0, "");
    cli::conflicts(a, t, cli::FromPrivateKey, cli::FromFile);
    if (a.has(cli::FromFormat) && ! a.has(cli::FromPrivateKey) && ! a.has(cli::FromFile))
        fail(errc::usage, "--from-format requires --from-private-key or --from-file");
    cli::needs(a, t, cli::FromAlgorithm, cli::FromFile);
    cli::conflicts(a, t, cli::KeyAlgorithm, cli::FromPrivateKey);
    cli::conflicts(a, t, cli::KeyAlgorithm, cli::FromFile);
    cli::conflicts(a, t, cli::OnlyPublicKey, cli::OnlyPrivateKey);

    bool onlyPub = a.has(cli::OnlyPublicKey);
    bool onlyPriv = a.has(cli::OnlyPrivateKey);
    auto ofmt = a.keyOutputFormat;
    if (! onlyPub && ! onlyPriv && ofmt == KeyFormat::Raw)
        fail(errc::usage, "Only a single key can be returned in a binary format");

    std::optional<KeySource> from{};
    if (a.fromPrivateKey || a.fromFile)
        from = KeySource::select(a.fromPrivateKey, a.fromFile, a.fromFormat, a.fromAlgorithm);

    Pipeline p{env, "keypair"};
    p.input("private key", from).validate();

    auto kp = from? KeyPair(p.privateKey(*from)) : KeyPair::generate(a.keyAlgorithm.value_or(Algorithm::Ed25519));
    const auto& sk = kp.privateKey();
    const auto& pk = kp.publicKey();

    if (onlyPriv) {
        switch (ofmt) {
            case KeyFormat::Raw: p.write(sk.toBytes(), true); return;
            case KeyFormat::Hex: p.writeText(sk.toPrefixedString() + "\n"); return;
            case KeyFormat::Pem: p.writeText(sk.toPem() + "\n"); return;
        }
    }
    if (onlyPub) {
        switch (ofmt) {
            case KeyFormat::Raw: p.write(pk.toBytes(), true); return;
            case KeyFormat::Hex: p.writeText(pk.toString() + "\n"); return;
            case KeyFormat::Pem: p.writeText(pk.toPem() + "\n"); return;
        }
    }
    if (ofmt == KeyFormat::Hex) {
        p.writeText(format("{}\nPrivate key: {}\nPublic key: {}\n",
                           from? "Generating a keypair from the provided private key" : "Generating a new random keypair",
                           sk.toPrefixedString(), pk.toString()));
    } else {
        p.writeText(format("{}\n{}{}\n",
                           from? "Generating a keypair for the provided private key" : "Generating a new random keypair",
                           sk.toPem(), pk.toPem()));
    }
}

} // namespace bctl::cmd

#endif // BCTL_CMD_KEYPAIR_HPP
