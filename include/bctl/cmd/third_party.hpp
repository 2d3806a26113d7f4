#ifndef BCTL_CMD_THIRD_PARTY_HPP
#define BCTL_CMD_THIRD_PARTY_HPP
#pragma once
/*
 * bctl third-party block exchange:
 *   generate-third-party-block-request (token holder)
 *   generate-third-party-block (third party, signs a block for the request)
 *   append-third-party-block (token holder)
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

static const option requestOpts[] = {
    {"raw-input",   no_argument, nullptr, cli::RawInput},
    {"raw-output",  no_argument, nullptr, cli::RawOutput},
    {"help",        no_argument, nullptr, cli::Help},
    {}
};

static inline void thirdPartyRequest(const Args& a, Env& env) {
    auto in = positionalInput(a, "BISCUIT_FILE");

    Pipeline p{env, "generate-third-party-block-request"};
    p.input("token", in).validate();

    auto token = Token::fromBytes(p.token(in));
    p.write(token.thirdPartyRequest().serialize(), a.has(cli::RawOutput));
}

static const option thirdPartyBlockOpts[] = {
    {"raw-input",               no_argument,       nullptr, cli::RawInput},
    {"raw-output",              no_argument,       nullptr, cli::RawOutput},
    {"private-key",             required_argument, nullptr, cli::PrivateKey},
    {"private-key-file",        required_argument, nullptr, cli::PrivateKeyFile},
    {"private-key-format",      required_argument, nullptr, cli::PrivateKeyFormat},
    {"private-key-algorithm",   required_argument, nullptr, cli::PrivateKeyAlgorithm},
    {"block",                   required_argument, nullptr, cli::Block},
    {"block-file",              required_argument, nullptr, cli::BlockFile},
    {"context",                 required_argument, nullptr, cli::Context},
    {"add-ttl",                 required_argument, nullptr, cli::AddTtl},
    {"param",                   required_argument, nullptr, cli::Param},
    {"help",                    no_argument,       nullptr, cli::Help},
    {}
};

static inline void thirdPartyBlock(const Args& a, Env& env) {
    optTable t{thirdPartyBlockOpts};
    auto in = positionalInput(a, "REQUEST_FILE");
    auto key = privateKeyArgs(a, t);
    auto block = blockArgs(a, t);

    Pipeline p{env, "generate-third-party-block"};
    p.input("third-party block request", in).input("block", block).input("private key", key).validate();

    auto req = ThirdPartyRequest::fromBytes(p.token(in, "third-party block request"));
    auto bb = blockBuilder(p.datalog(block, "block"), a, p.now());
    auto sk = p.privateKey(key);
    bctl::log(L_INFO)("signing third-party block with {}", sk.publicKey().toString());
    p.write(req.createBlock(sk, bb).serialize(), a.has(cli::RawOutput));
}

static const option appendThirdPartyOpts[] = {
    {"raw-input",               no_argument,       nullptr, cli::RawInput},
    {"raw-output",              no_argument,       nullptr, cli::RawOutput},
    {"block-contents",          required_argument, nullptr, cli::BlockContents},
    {"block-contents-file",     required_argument, nullptr, cli::BlockContentsFile},
    {"raw-block-contents",      no_argument,       nullptr, cli::RawBlockContents},
    {"help",                    no_argument,       nullptr, cli::Help},
    {}
};

static inline void appendThirdParty(const Args& a, Env& env) {
    optTable t{appendThirdPartyOpts};
    auto in = positionalInput(a, "BISCUIT_FILE");
    cli::exactlyOne(a, t, cli::BlockContents, cli::BlockContentsFile);
    cli::needs(a, t, cli::RawBlockContents, cli::BlockContentsFile);
    auto contents = TokenSource::select(a.blockContents, a.blockContentsFile, a.has(cli::RawBlockContents));

    Pipeline p{env, "append-third-party-block"};
    p.input("token", in).input("third-party block", contents).validate();

    auto token = Token::fromBytes(p.token(in));
    auto tpb = ThirdPartyBlock::fromBytes(p.token(contents, "third-party block"));
    p.write(token.appendThirdParty(tpb).toBytes(), a.has(cli::RawOutput));
}

} // namespace bctl::cmd

#endif // BCTL_CMD_THIRD_PARTY_HPP
