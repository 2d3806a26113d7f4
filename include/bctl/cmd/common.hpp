#ifndef BCTL_CMD_COMMON_HPP
#define BCTL_CMD_COMMON_HPP
#pragma once
/*
 * Argument groups shared by several bctl commands
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
#include <string>

#include "../cli/args.hpp"
#include "../token/block.hpp"
#include "pipeline.hpp"

namespace bctl::cmd {

using cli::Args;
using optTable = std::span<const option>;

// the token (or request, block, snapshot) named by the first positional argument
static inline TokenSource positionalInput(const Args& a, std::string_view what) {
    cli::positionals(a, 1, 1, what);
    return TokenSource::file(a.positional[0], a.has(cli::RawInput));
}

// --private-key | --private-key-file, --private-key-format, --private-key-algorithm
static inline KeySource privateKeyArgs(const Args& a, optTable t) {
    cli::exactlyOne(a, t, cli::PrivateKey, cli::PrivateKeyFile);
    cli::needs(a, t, cli::PrivateKeyAlgorithm, cli::PrivateKeyFile);
    return KeySource::select(a.privateKey, a.privateKeyFile, a.privateKeyFormat, a.privateKeyAlgorithm);
}

// --block | --block-file, editor if neither
static inline DatalogSource blockArgs(const Args& a, optTable t) {
    cli::conflicts(a, t, cli::Block, cli::BlockFile);
    return DatalogSource::select(a.block, a.blockFile);
}

static inline RunLimits runLimits(const Args& a) {
    RunLimits l{};
    if (a.maxFacts) l.maxFacts = *a.maxFacts;
    if (a.maxIterations) l.maxIterations = *a.maxIterations;
    if (a.maxTime) l.maxTime = std::chrono::duration_cast<std::chrono::microseconds>(*a.maxTime);
    return l;
}

/*
 * Block from 'src' plus --param, --context and --add-ttl. TTL durations
 * are converted to an expiration instant relative to 'now'.
 */
static inline BlockBuilder blockBuilder(std::string_view src, const Args& a, std::chrono::system_clock::time_point now) {
    BlockBuilder bb{};
    bb.addCode(src, paramMap(a.params));
    if (a.context) bb.context(*a.context);
    if (a.addTtl) bb.checkExpiration(a.addTtl->expiration(now));
    return bb;
}

} // namespace bctl::cmd

#endif // BCTL_CMD_COMMON_HPP
