#ifndef BCTL_TOKEN_BLOCK_HPP
#define BCTL_TOKEN_BLOCK_HPP
#pragma once
/*
 * Block builder and block payload encoding
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
 * A block payload is
 *   4 (Payload) > 5 (Version) [6 (Context)] 7 (Source)
 * where Source is the block's datalog in canonical form.
 */

#include <optional>
#include <string>
#include <string_view>

#include "../datalog/params.hpp"
#include "../datalog/parser.hpp"
#include "../datalog/printer.hpp"
#include "../input/ttl.hpp"
#include "../log.hpp"
#include "tlv_encoder.hpp"
#include "tlv_parser.hpp"

namespace bctl {

// the decoded content of a block
struct Block {
    std::optional<std::string> context_{};
    std::string source_{};
    datalog::BlockCode code_{};

    // decode a Payload tlv. 'which' names the block in error messages.
    static Block fromPayload(byteSpan payload, std::string_view which) {
        auto p = tlvParser::outer(payload, tlv::Payload);
        auto v = p.nextBlk(tlv::Version).toNumber();
        if (v != blockVersion) fail(errc::malformedToken, "{} has unsupported version {}", which, v);
        Block b{};
        if (p.peek(tlv::Context)) {
            auto c = p.nextBlk(tlv::Context);
            if (! validUtf8(c.content())) fail(errc::malformedToken, "{} context is not valid UTF-8", which);
            b.context_ = std::string(c.toSv());
        }
        auto s = p.nextBlk(tlv::Source);
        if (! validUtf8(s.content())) fail(errc::malformedToken, "{} source is not valid UTF-8", which);
        if (! p.eof()) fail(errc::malformedToken, "{} has unexpected trailing data", which);
        b.source_ = std::string(s.toSv());
        try {
            b.code_ = datalog::parseBlock(b.source_);
        } catch (const error& e) {
            fail(errc::malformedToken, "{} contains invalid datalog: {}", which, e.what());
        }
        return b;
    }
};

/*
 * Accumulates the datalog, context and expiration of a block to be added
 * to a token (or signed as a third-party block).
 */
class BlockBuilder {
    datalog::BlockCode code_{};
    std::optional<std::string> context_{};

  public:
    // parse 'src', substitute 'params' and add the result
    BlockBuilder& addCode(std::string_view src, const datalog::ParamMap& params = {}) {
        auto code = datalog::parseBlock(src);
        datalog::applyParams(code, params);
        code_.merge(std::move(code));
        return *this;
    }

    BlockBuilder& context(std::string c) { context_ = std::move(c); return *this; }

    BlockBuilder& checkExpiration(sysTime exp) {
        bctl::log(L_DEBUG)("adding expiration check {}", toRfc3339(exp));
        return addCode(expirationCheck(exp));
    }

    const datalog::BlockCode& code() const noexcept { return code_; }
    const std::optional<std::string>& context() const noexcept { return context_; }
    std::string source() const { return datalog::toString(code_); }

    bytes payload() const {
        tlvEncoder c{};
        c.addNumber(tlv::Version, blockVersion);
        if (context_) c.addString(tlv::Context, *context_);
        c.addString(tlv::Source, source());
        tlvEncoder p{};
        p.addNested(tlv::Payload, c);
        return p.m_blk;
    }
};

} // namespace bctl

#endif // BCTL_TOKEN_BLOCK_HPP
