#ifndef BCTL_CMD_REPORT_HPP
#define BCTL_CMD_REPORT_HPP
#pragma once
/*
 * Human and JSON renderings of the inspect and inspect-snapshot results
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
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../datalog/printer.hpp"
#include "../rfc3339.hpp"
#include "../token/authorizer.hpp"
#include "../token/biscuit.hpp"

namespace bctl::cmd {

struct QueryReport {
    std::string rule_;
    bool all_{};
    std::vector<std::string> facts_{};

    QueryReport(const datalog::Rule& q, bool all, const std::set<datalog::Fact>& res)
        : rule_{datalog::toString(q)}, all_{all} {
        for (const auto& f : res) facts_.emplace_back(datalog::toString(f));
    }
};

struct BlockInfo {
    std::optional<std::string> context_{};
    std::optional<std::string> externalKey_{};
    std::string source_{};
    std::optional<std::string> revocationId_{};     // not recorded in snapshots
};

static inline std::string blockName(size_t i) { return i == 0? "Authority block" : format("Block n°{}", i); }

struct TokenReport {
    std::vector<BlockInfo> blocks_{};
    bool sealed_{};
    std::optional<uint32_t> rootKeyId_{};
    std::optional<std::string> publicKey_{};        // the key the root signature was checked with
    std::optional<Authorization> authorization_{};
    std::optional<QueryReport> query_{};

    explicit TokenReport(const Token& t) : sealed_{t.sealed()}, rootKeyId_{t.rootKeyId()} {
        for (size_t i = 0; i < t.blockCount(); ++i) {
            const auto& b = t.block(i);
            auto ek = t.externalKey(i);
            blocks_.push_back({b.context_, ek? std::optional(ek->toString()) : std::nullopt, b.source_, t.revocationId(i)});
        }
    }
};

struct SnapshotReport {
    RunLimits limits_{};
    std::optional<datalog::EvalStats> recorded_{};
    std::optional<sysTime> time_{};
    std::vector<BlockInfo> blocks_{};
    std::string authorizer_{};
    Authorization authorization_{};
    std::optional<QueryReport> query_{};

    explicit SnapshotReport(const Authorizer& a)
        : limits_{a.limits()}, recorded_{a.recordedStats()}, time_{a.time()}, authorizer_{a.source()} {
        for (const auto& b : a.blocks())
            blocks_.push_back({b.context_, b.externalKey_? std::optional(b.externalKey_->toString()) : std::nullopt,
                               b.source_, std::nullopt});
    }
};

namespace detail {

static inline std::string indent(const std::string& src) {
    if (src.empty()) return "  (empty)\n";
    std::string r{};
    size_t s = 0;
    while (s < src.size()) {
        auto e = src.find('\n', s);
        if (e == src.npos) e = src.size();
        r += "  " + src.substr(s, e - s) + "\n";
        s = e + 1;
    }
    return r;
}

static inline std::string blocksText(const std::vector<BlockInfo>& blocks) {
    std::string r{};
    for (size_t i = 0; i < blocks.size(); ++i) {
        const auto& b = blocks[i];
        r += blockName(i) + ":\n";
        if (b.context_) r += format("== Context ==\n  {}\n", *b.context_);
        if (b.externalKey_) r += format("== External key ==\n  {}\n", *b.externalKey_);
        r += "== Datalog ==\n" + indent(b.source_);
        if (b.revocationId_) r += format("== Revocation id ==\n  {}\n", *b.revocationId_);
        r += "\n";
    }
    return r;
}

static inline std::string statsText(const datalog::EvalStats& s) {
    return format("{} iterations, {} facts, {}us", s.iterations_, s.facts_, s.elapsed_.count());
}

static inline std::string authorizationText(const Authorization& a) {
    if (a.ok()) return format("Authorization succeeded ({})\nMatched allow policy #{}: {}\n",
                              statsText(a.stats_), a.policy_->index_, a.policy_->text_);
    return format("Authorization failed ({})\n{}\n", statsText(a.stats_), a.failure());
}

static inline std::string queryText(const QueryReport& q) {
    std::string r = format("Query{}: {}\n", q.all_? " (all blocks)" : "", q.rule_);
    if (q.facts_.empty()) r += "  no facts matched\n";
    for (const auto& f : q.facts_) r += format("  {}\n", f);
    return r;
}

static inline nlohmann::json blocksJson(const std::vector<BlockInfo>& blocks) {
    nlohmann::json arr = nlohmann::json::array();
    for (size_t i = 0; i < blocks.size(); ++i) {
        const auto& b = blocks[i];
        nlohmann::json row = nlohmann::json::object();
        row["index"] = i;
        row["context"] = b.context_? nlohmann::json(*b.context_) : nlohmann::json(nullptr);
        row["external_key"] = b.externalKey_? nlohmann::json(*b.externalKey_) : nlohmann::json(nullptr);
        row["code"] = b.source_;
        if (b.revocationId_) row["revocation_id"] = *b.revocationId_;
        arr.push_back(row);
    }
    return arr;
}

static inline nlohmann::json statsJson(const datalog::EvalStats& s) {
    return {{"iterations", s.iterations_}, {"facts", s.facts_}, {"elapsed_us", s.elapsed_.count()}};
}

static inline nlohmann::json limitsJson(const RunLimits& l) {
    return {{"max_facts", l.maxFacts}, {"max_iterations", l.maxIterations}, {"max_time_us", l.maxTime.count()}};
}

static inline nlohmann::json authorizationJson(const Authorization& a) {
    nlohmann::json out = nlohmann::json::object();
    out["result"] = a.ok()? "success" : "failure";
    out["stats"] = statsJson(a.stats_);
    if (a.limitError_) out["limit_error"] = *a.limitError_;
    nlohmann::json checks = nlohmann::json::array();
    for (const auto& c : a.failedChecks_) {
        checks.push_back({{"block", c.block_? nlohmann::json(*c.block_) : nlohmann::json("authorizer")},
                          {"check", c.index_}, {"code", c.text_}});
    }
    out["failed_checks"] = checks;
    if (a.policy_) {
        out["policy"] = {{"index", a.policy_->index_},
                         {"kind", a.policy_->kind_ == datalog::Policy::Kind::Allow? "allow" : "deny"},
                         {"code", a.policy_->text_}};
    } else {
        out["policy"] = nullptr;
    }
    return out;
}

static inline nlohmann::json queryJson(const QueryReport& q) {
    return {{"rule", q.rule_}, {"all_blocks", q.all_}, {"facts", q.facts_}};
}

} // namespace detail

static inline std::string toText(const TokenReport& r) {
    auto s = detail::blocksText(r.blocks_);
    s += format("Sealed: {}\n", r.sealed_? "yes" : "no");
    if (r.rootKeyId_) s += format("Root key id: {}\n", *r.rootKeyId_);
    s += r.publicKey_? format("Public key check succeeded ({})\n", *r.publicKey_) : "Public key check skipped\n";
    s += r.authorization_? detail::authorizationText(*r.authorization_) : "Authorization skipped\n";
    if (r.query_) s += detail::queryText(*r.query_);
    return s;
}

static inline nlohmann::json toJson(const TokenReport& r) {
    nlohmann::json out = nlohmann::json::object();
    out["blocks"] = detail::blocksJson(r.blocks_);
    out["sealed"] = r.sealed_;
    out["root_key_id"] = r.rootKeyId_? nlohmann::json(*r.rootKeyId_) : nlohmann::json(nullptr);
    out["public_key_check"] = r.publicKey_? nlohmann::json({{"result", "success"}, {"key", *r.publicKey_}})
                                          : nlohmann::json(nullptr);
    out["authorization"] = r.authorization_? detail::authorizationJson(*r.authorization_) : nlohmann::json(nullptr);
    out["query"] = r.query_? detail::queryJson(*r.query_) : nlohmann::json(nullptr);
    return out;
}

static inline std::string toText(const SnapshotReport& r) {
    auto s = detail::blocksText(r.blocks_);
    s += "Authorizer:\n== Datalog ==\n" + detail::indent(r.authorizer_);
    if (r.time_) s += format("== Time ==\n  {}\n", toRfc3339(*r.time_));
    s += format("== Run limits ==\n  max facts {}, max iterations {}, max time {}us\n",
                r.limits_.maxFacts, r.limits_.maxIterations, r.limits_.maxTime.count());
    if (r.recorded_) s += format("== Recorded evaluation ==\n  {}\n", detail::statsText(*r.recorded_));
    s += "\n" + detail::authorizationText(r.authorization_);
    if (r.query_) s += detail::queryText(*r.query_);
    return s;
}

static inline nlohmann::json toJson(const SnapshotReport& r) {
    nlohmann::json out = nlohmann::json::object();
    out["blocks"] = detail::blocksJson(r.blocks_);
    out["authorizer_code"] = r.authorizer_;
    out["time"] = r.time_? nlohmann::json(toRfc3339(*r.time_)) : nlohmann::json(nullptr);
    out["limits"] = detail::limitsJson(r.limits_);
    out["recorded"] = r.recorded_? detail::statsJson(*r.recorded_) : nlohmann::json(nullptr);
    out["authorization"] = detail::authorizationJson(r.authorization_);
    out["query"] = r.query_? detail::queryJson(*r.query_) : nlohmann::json(nullptr);
    return out;
}

} // namespace bctl::cmd

#endif // BCTL_CMD_REPORT_HPP
