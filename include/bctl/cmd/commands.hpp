#ifndef BCTL_CMD_COMMANDS_HPP
#define BCTL_CMD_COMMANDS_HPP
#pragma once
/*
 * The bctl subcommand table
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

#include <span>
#include <string_view>
#include <vector>

#include "inspect.hpp"
#include "keypair.hpp"
#include "third_party.hpp"
#include "token.hpp"

namespace bctl::cmd {

struct Command {
    std::string_view name;
    std::string_view synopsis;
    std::string_view help;
    std::span<const option> opts;
    void (*run)(const Args&, Env&);
};

static const Command commands[] = {
    {"keypair",
     "[--from-private-key KEY | --from-file FILE [--from-algorithm ALG]] [--from-format hex|pem|raw]\n"
     "        [--key-algorithm ALG] [--key-output-format hex|pem|raw] [--only-public-key | --only-private-key]",
     "Create a key pair or derive one from a private key", keypairOpts, keypair},
    {"generate",
     "(--private-key KEY | --private-key-file FILE) [--private-key-format F] [--private-key-algorithm ALG]\n"
     "        [--root-key-id N] [--param P]... [--context S] [--add-ttl TTL] [--raw] [DATALOG_FILE]",
     "Create a token whose authority block is DATALOG_FILE (or the editor)", generateOpts, generate},
    {"attenuate",
     "[--raw-input] [--raw-output] [--block S | --block-file FILE] [--context S] [--add-ttl TTL] [--param P]... BISCUIT_FILE",
     "Append a block to a token", attenuateOpts, attenuate},
    {"inspect",
     "[--json] [--raw-input] [--public-key K | --public-key-file F] [--public-key-format F] [--public-key-algorithm ALG]\n"
     "        [--authorize-interactive | --authorize-with S | --authorize-with-file F | --authorize-with-snapshot S\n"
     "         | --authorize-with-snapshot-file F [--authorize-with-raw-snapshot-file]] [--include-time]\n"
     "        [--max-facts N] [--max-iterations N] [--max-time D] [--query RULE [--query-all]] [--param P]...\n"
     "        [--dump-snapshot-to F [--dump-raw-snapshot]] [--dump-policies-snapshot-to F [--dump-raw-policies-snapshot]]\n"
     "        BISCUIT_FILE",
     "Show a token's blocks, check its signature, authorize and query it", inspectOpts, inspect},
    {"inspect-snapshot",
     "[--json] [--raw-input] [--max-facts N] [--max-iterations N] [--max-time D] [--query RULE [--query-all]]\n"
     "        [--param P]... SNAPSHOT_FILE",
     "Show and re-run an authorizer snapshot", inspectSnapshotOpts, inspectSnapshot},
    {"generate-third-party-block-request",
     "[--raw-input] [--raw-output] BISCUIT_FILE",
     "Create a request for a third-party block", requestOpts, thirdPartyRequest},
    {"generate-third-party-block",
     "(--private-key KEY | --private-key-file FILE) [--private-key-format F] [--private-key-algorithm ALG]\n"
     "        [--raw-input] [--raw-output] [--block S | --block-file FILE] [--context S] [--add-ttl TTL] [--param P]...\n"
     "        REQUEST_FILE",
     "Sign a block in answer to a third-party block request", thirdPartyBlockOpts, thirdPartyBlock},
    {"append-third-party-block",
     "[--raw-input] [--raw-output] (--block-contents S | --block-contents-file F [--raw-block-contents]) BISCUIT_FILE",
     "Append a signed third-party block to a token", appendThirdPartyOpts, appendThirdParty},
    {"seal",
     "[--raw-input] [--raw-output] BISCUIT_FILE",
     "Seal a token so it can't be attenuated", sealOpts, seal},
};

static inline const Command* findCommand(std::string_view name) noexcept {
    for (const auto& c : commands) if (c.name == name) return &c;
    return nullptr;
}

/*
 * Parse the arguments of 'argv' (argv[0] is the subcommand name) and run it.
 * Returns false if only help was requested.
 */
static inline bool runCommand(const Command& c, int argc, char* const* argv, Env& env) {
    auto a = cli::parseArgs(argc, argv, c.opts);
    if (a.has(cli::Help)) return false;
    bctl::log(L_DEBUG)("running {}", c.name);
    c.run(a, env);
    return true;
}

} // namespace bctl::cmd

#endif // BCTL_CMD_COMMANDS_HPP
