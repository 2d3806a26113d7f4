#ifndef BCTL_TOKEN_AUTHORIZER_HPP
#define BCTL_TOKEN_AUTHORIZER_HPP
#pragma once
/*
 * Authorizer: token blocks + authorizer datalog + run limits, and its snapshots
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
 * Snapshot layouts (neither contains signatures so neither is a token):
 *   19 (Snapshot) > 21 (MaxFacts) 22 (MaxIterations) 23 (MaxTime) 24 (Iterations)
 *                   25 (Elapsed) [27 (Time)] 26 (AuthorizerSource) 28 (SnapshotBlock)...
 *   28 (SnapshotBlock) > [6 (Context)] 7 (Source) [13 (ExternalKey)]
 *   20 (PoliciesSnapshot) > 26 (AuthorizerSource)
 */

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "../datalog/engine.hpp"
#include "../datalog/params.hpp"
#include "../datalog/parser.hpp"
#include "../datalog/printer.hpp"
#include "../rfc3339.hpp"
#include "biscuit.hpp"
#include "tlv_encoder.hpp"
#include "tlv_parser.hpp"

namespace bctl {

using datalog::RunLimits;

struct Authorization {
    std::optional<std::string> limitError_{};
    std::vector<datalog::FailedCheck> failedChecks_{};
    std::optional<datalog::MatchedPolicy> policy_{};
    datalog::EvalStats stats_{};

    bool ok() const noexcept {
        return ! limitError_ && failedChecks_.empty() && policy_ && policy_->kind_ == datalog::Policy::Kind::Allow;
    }

    // what went wrong (empty if authorization succeeded)
    std::string failure() const {
        if (limitError_) return format("evaluation aborted: {}", *limitError_);
        std::string r{};
        if (! failedChecks_.empty()) {
            r = "failed checks:";
            for (const auto& c : failedChecks_) r += "\n  " + c.toString();
        }
        if (! policy_) r += (r.empty()? "" : "\n") + std::string("no policy matched");
        else if (policy_->kind_ == datalog::Policy::Kind::Deny)
            r += (r.empty()? "" : "\n") + format("matched deny policy #{}: {}", policy_->index_, policy_->text_);
        return r;
    }
};

// a token block as recorded in a snapshot
struct SnapshotBlock {
    std::optional<std::string> context_{};
    std::string source_{};
    std::optional<PublicKey> externalKey_{};
};

class Authorizer {
    datalog::BlockCode code_{};
    std::optional<sysTime> time_{};
    RunLimits limits_{};
    std::vector<SnapshotBlock> blocks_{};
    std::vector<datalog::CodeBlock> codeBlocks_{};
    std::optional<datalog::EvalStats> recorded_{};    // statistics from a loaded snapshot
    std::unique_ptr<datalog::Engine> engine_{};
    std::optional<std::string> limitError_{};

    datalog::Engine& engine() {
        if (! engine_) {
            auto code = code_;
            if (time_) code.facts_.push_back(datalog::Fact{"time", {datalog::Term::date(toEpoch(*time_))}});
            engine_ = std::make_unique<datalog::Engine>(codeBlocks_, std::move(code), limits_);
            limitError_ = engine_->run();
        }
        return *engine_;
    }

    static void addSnapshotBlock(Authorizer& a, SnapshotBlock sb, std::string_view which) {
        datalog::BlockCode code{};
        try {
            code = datalog::parseBlock(sb.source_);
        } catch (const error& e) {
            fail(errc::malformedToken, "snapshot {} contains invalid datalog: {}", which, e.what());
        }
        a.codeBlocks_.push_back({std::move(code), sb.externalKey_});
        a.blocks_.emplace_back(std::move(sb));
    }

    static datalog::BlockCode parseSource(std::string_view src) {
        try {
            return datalog::parseAuthorizer(src);
        } catch (const error& e) {
            fail(errc::malformedToken, "snapshot authorizer contains invalid datalog: {}", e.what());
        }
    }

  public:
    Authorizer() = default;

    // code can only be added before evaluation
    Authorizer& addCode(std::string_view src, const datalog::ParamMap& params = {}) {
        if (engine_) throw std::logic_error("authorizer code added after evaluation");
        auto code = datalog::parseAuthorizer(src);
        datalog::applyParams(code, params);
        code_.merge(std::move(code));
        return *this;
    }

    Authorizer& setTime(sysTime t) { time_ = t; return *this; }
    Authorizer& setLimits(const RunLimits& l) { limits_ = l; return *this; }

    Authorizer& addToken(const Token& t) {
        if (engine_) throw std::logic_error("token added after evaluation");
        for (size_t i = 0; i < t.blockCount(); ++i) {
            const auto& b = t.block(i);
            blocks_.push_back({b.context_, b.source_, t.externalKey(i)});
        }
        auto cb = t.codeBlocks();
        codeBlocks_.insert(codeBlocks_.end(), cb.begin(), cb.end());
        return *this;
    }

    const RunLimits& limits() const noexcept { return limits_; }
    const std::optional<sysTime>& time() const noexcept { return time_; }
    const std::vector<SnapshotBlock>& blocks() const noexcept { return blocks_; }
    const std::optional<datalog::EvalStats>& recordedStats() const noexcept { return recorded_; }
    std::string source() const { return datalog::toString(code_); }
    bool hasPolicies() const noexcept { return ! code_.policies_.empty(); }

    Authorization authorize() {
        auto& e = engine();
        Authorization a{};
        a.stats_ = e.stats();
        if (limitError_) {
            a.limitError_ = limitError_;
            return a;
        }
        a.failedChecks_ = e.failedChecks();
        a.policy_ = e.matchingPolicy();
        bctl::log(L_INFO)("authorization {}", a.ok()? "succeeded" : "failed");
        return a;
    }

    // facts produced by 'q' after evaluation. A limit error makes the query fail.
    std::set<datalog::Fact> query(datalog::Rule q, const datalog::ParamMap& params, bool allBlocks) {
        datalog::applyParams(q, params);
        auto& e = engine();
        if (limitError_) fail(errc::delegate, "evaluation aborted: {}", *limitError_);
        return e.query(q, allBlocks);
    }

    bytes snapshot() {
        auto stats = engine_? engine_->stats() : recorded_.value_or(datalog::EvalStats{});
        tlvEncoder c{};
        c.addNumber(tlv::MaxFacts, limits_.maxFacts);
        c.addNumber(tlv::MaxIterations, limits_.maxIterations);
        c.addNumber(tlv::MaxTime, uint64_t(limits_.maxTime.count()));
        c.addNumber(tlv::Iterations, stats.iterations_);
        c.addNumber(tlv::Elapsed, uint64_t(stats.elapsed_.count()));
        if (time_) c.addNumber(tlv::Time, toEpoch(*time_));
        c.addString(tlv::AuthorizerSource, source());
        for (const auto& b : blocks_) {
            tlvEncoder s{};
            if (b.context_) s.addString(tlv::Context, *b.context_);
            s.addString(tlv::Source, b.source_);
            if (b.externalKey_) s.addKey(tlv::ExternalKey, *b.externalKey_);
            c.addNested(tlv::SnapshotBlock, s);
        }
        tlvEncoder o{};
        o.addNested(tlv::Snapshot, c);
        return o.m_blk;
    }

    bytes policiesSnapshot() const {
        tlvEncoder c{};
        c.addString(tlv::AuthorizerSource, source());
        tlvEncoder o{};
        o.addNested(tlv::PoliciesSnapshot, c);
        return o.m_blk;
    }

    // rebuild an authorizer from either kind of snapshot
    static Authorizer fromSnapshot(byteSpan buf) {
        Authorizer a{};
        auto text = [](const tlvParser& p, std::string_view what) {
            if (! validUtf8(p.content())) fail(errc::malformedToken, "snapshot {} is not valid UTF-8", what);
            return std::string(p.toSv());
        };
        auto seq = tlvParser::sequence(buf);
        if (seq.peek(tlv::PoliciesSnapshot)) {
            auto p = tlvParser::outer(buf, tlv::PoliciesSnapshot);
            a.code_ = parseSource(text(p.nextBlk(tlv::AuthorizerSource), "authorizer"));
            if (! p.eof()) fail(errc::malformedToken, "policies snapshot has unexpected trailing data");
            return a;
        }
        auto p = tlvParser::outer(buf, tlv::Snapshot);
        a.limits_.maxFacts = p.nextBlk(tlv::MaxFacts).toNumber();
        a.limits_.maxIterations = p.nextBlk(tlv::MaxIterations).toNumber();
        a.limits_.maxTime = std::chrono::microseconds(int64_t(p.nextBlk(tlv::MaxTime).toNumber()));
        datalog::EvalStats st{};
        st.iterations_ = p.nextBlk(tlv::Iterations).toNumber();
        st.elapsed_ = std::chrono::microseconds(int64_t(p.nextBlk(tlv::Elapsed).toNumber()));
        a.recorded_ = st;
        if (p.peek(tlv::Time)) a.time_ = fromEpoch(p.nextBlk(tlv::Time).toNumber());
        a.code_ = parseSource(text(p.nextBlk(tlv::AuthorizerSource), "authorizer"));
        while (p.peek(tlv::SnapshotBlock)) {
            auto s = p.nextBlk(tlv::SnapshotBlock);
            SnapshotBlock sb{};
            auto which = format("block {}", a.blocks_.size());
            if (s.peek(tlv::Context)) sb.context_ = text(s.nextBlk(tlv::Context), "context");
            sb.source_ = text(s.nextBlk(tlv::Source), "block source");
            if (s.peek(tlv::ExternalKey)) sb.externalKey_ = s.nextBlk(tlv::ExternalKey).toKey();
            if (! s.eof()) fail(errc::malformedToken, "snapshot {} has unexpected trailing data", which);
            addSnapshotBlock(a, std::move(sb), which);
        }
        if (! p.eof()) fail(errc::malformedToken, "snapshot has unexpected trailing data");
        return a;
    }
};

} // namespace bctl

#endif // BCTL_TOKEN_AUTHORIZER_HPP
