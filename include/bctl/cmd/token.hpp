#ifndef BCTL_CMD_TOKEN_HPP
#define BCTL_CMD_TOKEN_HPP
#pragma once
/*
 * bctl generate, attenuate and seal
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

#include "../token/biscuit.hpp"
#include "common.hpp"

namespace bctl::cmd {

static const option generateOpts[] = {
    {"root-key-id",             required_argument, nullptr, cli::RootKeyId},
    {"param",                   required_argument, nullptr, cli::Param},
    {"raw",                     no_argument,       nullptr, cli::Raw},
    {"private-key",             required_argument, nullptr, cli::PrivateKey},
    {"private-key-file",        required_argument, nullptr, cli::PrivateKeyFile},
    {"private-key-format",      required_argument, nullptr, cli::PrivateKeyFormat},
    {"private-key-algorithm",   required_argument, nullptr, cli::PrivateKeyAlgorithm},
    {"context",                 required_argument, nullptr, cli::Context},
    {"add-ttl",                 required_argument, nullptr, cli::AddTtl},
    {"help",                    no_argument,       nullptr, cli::Help},
    {}
};

// sign a new token whose authority block comes from DATALOG_FILE (or the editor)
static inline void generate(const Args& a, Env& env) {
    optTable t{generateOpts};
    cli::positionals(a, 0, 1, "");
    auto key = privateKeyArgs(a, t);
    auto authority = a.positional.empty()? DatalogSource::editor() : DatalogSource::file(a.positional[0]);

    Pipeline p{env, "generate"};
    p.input("authority block", authority).input("private key", key).validate();

    auto bb = blockBuilder(p.datalog(authority, "authority block"), a, p.now());
    auto root = p.privateKey(key);
    auto token = Token::build(root, bb, a.rootKeyId);
    bctl::log(L_INFO)("generated token with revocation id {}", token.revocationId(0));
    p.write(token.toBytes(), a.has(cli::Raw));
}

static const option attenuateOpts[] = {
    {"raw-input",   no_argument,       nullptr, cli::RawInput},
    {"raw-output",  no_argument,       nullptr, cli::RawOutput},
    {"block",       required_argument, nullptr, cli::Block},
    {"block-file",  required_argument, nullptr, cli::BlockFile},
    {"context",     required_argument, nullptr, cli::Context},
    {"add-ttl",     required_argument, nullptr, cli::AddTtl},
    {"param",       required_argument, nullptr, cli::Param},
    {"help",        no_argument,       nullptr, cli::Help},
    {}
};

static inline void attenuate(const Args& a, Env& env) {
    optTable t{attenuateOpts};
    auto in = positionalInput(a, "BISCUIT_FILE");
    auto block = blockArgs(a, t);

    Pipeline p{env, "attenuate"};
    p.input("token", in).input("block", block).validate();

    auto token = Token::fromBytes(p.token(in));
    // a sealed token fails here rather than after the block has been edited
    if (token.sealed()) fail(errc::delegate, "token is sealed");
    auto bb = blockBuilder(p.datalog(block, "block"), a, p.now());
    auto res = token.append(bb);
    bctl::log(L_INFO)("appended block {}", res.blockCount() - 1);
    p.write(res.toBytes(), a.has(cli::RawOutput));
}

static const option sealOpts[] = {
    {"raw-input",   no_argument, nullptr, cli::RawInput},
    {"raw-output",  no_argument, nullptr, cli::RawOutput},
    {"help",        no_argument, nullptr, cli::Help},
    {}
};

static inline void seal(const Args& a, Env& env) {
    auto in = positionalInput(a, "BISCUIT_FILE");

    Pipeline p{env, "seal"};
    p.input("token", in).validate();

    auto token = Token::fromBytes(p.token(in));
    p.write(token.seal().toBytes(), a.has(cli::RawOutput));
}

} // namespace bctl::cmd

#endif // BCTL_CMD_TOKEN_HPP
