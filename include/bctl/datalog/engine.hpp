#ifndef BCTL_DATALOG_ENGINE_HPP
#define BCTL_DATALOG_ENGINE_HPP
#pragma once
/*
 * Datalog evaluation: origin-tracked facts, scoped rules, checks and policies
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
 * Every fact is tagged with its origin: the set of blocks whose facts and
 * rules produced it (authorizerOrigin stands for the authorizer). A rule
 * only sees facts whose whole origin is inside its trusted set:
 *  - by default block i trusts {0, i, authorizer} and the authorizer
 *    trusts {0, authorizer}
 *  - 'trusting authority' adds 0, 'trusting previous' adds 0..i and
 *    'trusting <key>' adds each block signed by that external key.
 * Rules are applied in rounds until nothing new is produced or a run
 * limit is hit.
 */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../errors.hpp"
#include "../log.hpp"
#include "ast.hpp"
#include "printer.hpp"

namespace bctl::datalog {

using namespace std::literals::chrono_literals;

static constexpr size_t authorizerOrigin = std::numeric_limits<size_t>::max();
using Origin = std::set<size_t>;
using Bindings = std::map<std::string, Term>;

struct RunLimits {
    uint64_t maxFacts{1000};
    uint64_t maxIterations{100};
    std::chrono::microseconds maxTime{10ms};
};

// a block of code plus what's needed to decide who trusts it
struct CodeBlock {
    BlockCode code_;
    std::optional<bctl::PublicKey> externalKey_{};
};

struct FailedCheck {
    std::optional<size_t> block_;   // nullopt for the authorizer
    size_t index_;
    std::string text_;

    std::string toString() const {
        return block_? format("block {} check #{}: {}", *block_, index_, text_)
                     : format("authorizer check #{}: {}", index_, text_);
    }
};

struct MatchedPolicy {
    size_t index_;
    Policy::Kind kind_;
    std::string text_;
};

struct EvalStats {
    uint64_t iterations_{};
    std::chrono::microseconds elapsed_{};
    size_t facts_{};
};

namespace detail {

static inline bool ckAdd(int64_t a, int64_t b, int64_t& r) { return ! __builtin_add_overflow(a, b, &r); }
static inline bool ckSub(int64_t a, int64_t b, int64_t& r) { return ! __builtin_sub_overflow(a, b, &r); }
static inline bool ckMul(int64_t a, int64_t b, int64_t& r) { return ! __builtin_mul_overflow(a, b, &r); }

} // namespace detail

/*
 * Evaluate an expression with the given variable bindings. Type errors,
 * overflow and division by zero produce nullopt which never satisfies a body.
 */
static inline std::optional<Term> evaluate(const Expr& e, const Bindings& b) {
    using T = termType;
    switch (e.op_) {
    case exprOp::Value:
        if (e.value_.isVariable()) {
            auto it = b.find(e.value_.str_);
            if (it == b.end()) return std::nullopt;
            return it->second;
        }
        if (e.value_.isParameter()) return std::nullopt;
        return e.value_;
    case exprOp::Parens: return evaluate(e.args_[0], b);
    case exprOp::Not: {
        auto v = evaluate(e.args_[0], b);
        if (! v || ! v->isBool()) return std::nullopt;
        return Term::boolean(! v->asBool());
    }
    case exprOp::Neg: {
        auto v = evaluate(e.args_[0], b);
        int64_t r{};
        if (! v || v->type() != T::Integer || ! detail::ckSub(0, v->int_, r)) return std::nullopt;
        return Term::integer(r);
    }
    case exprOp::Length: {
        auto v = evaluate(e.args_[0], b);
        if (! v) return std::nullopt;
        if (v->type() == T::String) return Term::integer(int64_t(v->str_.size()));
        if (v->type() == T::Bytes) return Term::integer(int64_t(v->bytes_.size()));
        if (v->type() == T::Set) return Term::integer(int64_t(v->set_.size()));
        return std::nullopt;
    }
    case exprOp::And:
    case exprOp::Or: {
        auto l = evaluate(e.args_[0], b);
        if (! l || ! l->isBool()) return std::nullopt;
        if (e.op_ == exprOp::And && ! l->asBool()) return Term::boolean(false);
        if (e.op_ == exprOp::Or && l->asBool()) return Term::boolean(true);
        auto r = evaluate(e.args_[1], b);
        if (! r || ! r->isBool()) return std::nullopt;
        return Term::boolean(r->asBool());
    }
    default: break;
    }

    auto l = evaluate(e.args_[0], b);
    auto r = evaluate(e.args_[1], b);
    if (! l || ! r) return std::nullopt;
    switch (e.op_) {
    case exprOp::Eq: return Term::boolean(*l == *r);
    case exprOp::Ne: return Term::boolean(! (*l == *r));
    case exprOp::Lt: case exprOp::Gt: case exprOp::Le: case exprOp::Ge: {
        if (l->type() != r->type() || (l->type() != T::Integer && l->type() != T::Date)) return std::nullopt;
        auto c = compare(*l, *r);
        bool res = e.op_ == exprOp::Lt? c < 0 : e.op_ == exprOp::Gt? c > 0 : e.op_ == exprOp::Le? c <= 0 : c >= 0;
        return Term::boolean(res);
    }
    case exprOp::Add:
        if (l->type() == T::String && r->type() == T::String) return Term::string(l->str_ + r->str_);
        [[fallthrough]];
    case exprOp::Sub: case exprOp::Mul: case exprOp::Div: {
        if (l->type() != T::Integer || r->type() != T::Integer) return std::nullopt;
        int64_t res{};
        bool ok = true;
        switch (e.op_) {
            case exprOp::Add: ok = detail::ckAdd(l->int_, r->int_, res); break;
            case exprOp::Sub: ok = detail::ckSub(l->int_, r->int_, res); break;
            case exprOp::Mul: ok = detail::ckMul(l->int_, r->int_, res); break;
            default:
                if (r->int_ == 0 || (l->int_ == std::numeric_limits<int64_t>::min() && r->int_ == -1)) ok = false;
                else res = l->int_ / r->int_;
        }
        if (! ok) return std::nullopt;
        return Term::integer(res);
    }
    case exprOp::Contains:
        if (l->type() == T::String && r->type() == T::String) return Term::boolean(l->str_.find(r->str_) != std::string::npos);
        if (l->type() != T::Set) return std::nullopt;
        if (r->type() == T::Set)
            return Term::boolean(std::includes(l->set_.begin(), l->set_.end(), r->set_.begin(), r->set_.end()));
        return Term::boolean(std::binary_search(l->set_.begin(), l->set_.end(), *r));
    case exprOp::StartsWith:
        if (l->type() != T::String || r->type() != T::String) return std::nullopt;
        return Term::boolean(l->str_.starts_with(r->str_));
    case exprOp::EndsWith:
        if (l->type() != T::String || r->type() != T::String) return std::nullopt;
        return Term::boolean(l->str_.ends_with(r->str_));
    default:
        return std::nullopt;
    }
}

// facts indexed by origin
class FactSet {
    std::map<Origin, std::set<Fact>> facts_{};
    size_t size_{};

  public:
    bool insert(const Origin& o, Fact f) {
        auto [it, added] = facts_[o].emplace(std::move(f));
        if (added) ++size_;
        return added;
    }

    size_t size() const noexcept { return size_; }

    const auto& byOrigin() const noexcept { return facts_; }

    // every fact visible to 'trusted'
    std::set<Fact> visible(const Origin& trusted) const {
        std::set<Fact> r{};
        for (const auto& [o, fs] : facts_)
            if (std::includes(trusted.begin(), trusted.end(), o.begin(), o.end())) r.insert(fs.begin(), fs.end());
        return r;
    }

    bool contains(const Origin& o, const Fact& f) const {
        auto it = facts_.find(o);
        return it != facts_.end() && it->second.contains(f);
    }

    static constexpr size_t pollEvery = 1024;

    /*
     * Call fn(bindings, origin) for each way the body predicates of 'r' can be
     * matched by facts visible to 'trusted'. Expressions aren't evaluated.
     * Matching stops when fn returns false or when 'poll', called once every
     * pollEvery candidate facts, returns false. Returns false if it stopped early.
     */
    bool matchBody(const Rule& r, const Origin& trusted,
                   const std::function<bool(const Bindings&, const Origin&)>& fn,
                   const std::function<bool()>& poll = {}) const {
        std::vector<const std::pair<const Origin, std::set<Fact>>*> sources{};
        for (const auto& entry : facts_)
            if (std::includes(trusted.begin(), trusted.end(), entry.first.begin(), entry.first.end()))
                sources.push_back(&entry);

        Bindings b{};
        Origin o{};
        size_t candidates = 0;
        std::function<bool(size_t)> step = [&](size_t i) {
            if (i == r.body_.size()) return fn(b, o);
            const auto& pred = r.body_[i];
            for (const auto* src : sources) {
                for (const auto& f : src->second) {
                    if (poll && ++candidates % pollEvery == 0 && ! poll()) return false;
                    if (f.name_ != pred.name_ || f.terms_.size() != pred.terms_.size()) continue;
                    auto saved = b;
                    bool ok = true;
                    for (size_t t = 0; ok && t < f.terms_.size(); ++t) {
                        const auto& pt = pred.terms_[t];
                        if (! pt.isVariable()) { ok = pt == f.terms_[t]; continue; }
                        auto [it, added] = b.emplace(pt.str_, f.terms_[t]);
                        if (! added) ok = it->second == f.terms_[t];
                    }
                    if (ok) {
                        auto savedOrigin = o;
                        o.insert(src->first.begin(), src->first.end());
                        bool more = step(i + 1);
                        o = std::move(savedOrigin);
                        if (! more) return false;
                    }
                    b = std::move(saved);
                }
            }
            return true;
        };
        return step(0);
    }
};

static inline bool exprsHold(const Rule& r, const Bindings& b) {
    for (const auto& e : r.exprs_) {
        auto v = evaluate(e, b);
        if (! v || ! v->isBool() || ! v->asBool()) return false;
    }
    return true;
}

static inline Fact instantiate(const Predicate& head, const Bindings& b) {
    Fact f{head.name_, {}};
    for (const auto& t : head.terms_) f.terms_.emplace_back(t.isVariable()? b.at(t.str_) : t);
    return f;
}

/*
 * The token blocks and authorizer code of one evaluation. Block i's origin
 * is i; the authorizer's is authorizerOrigin.
 */
class Engine {
    std::vector<CodeBlock> blocks_;
    BlockCode authorizer_;
    RunLimits limits_;
    FactSet facts_{};
    EvalStats stats_{};
    bool ran_{false};

    Origin trusted(const std::vector<Scope>& scopes, size_t current) const {
        Origin t{current, authorizerOrigin};
        if (scopes.empty()) {
            t.insert(0);
            return t;
        }
        for (const auto& s : scopes) {
            switch (s.kind_) {
            case Scope::Kind::Authority: t.insert(0); break;
            case Scope::Kind::Previous: {
                auto last = current == authorizerOrigin? blocks_.size() : current + 1;
                for (size_t i = 0; i < last && i < blocks_.size(); ++i) t.insert(i);
                break;
            }
            case Scope::Kind::PublicKey:
                for (size_t i = 0; i < blocks_.size(); ++i)
                    if (blocks_[i].externalKey_ && *blocks_[i].externalKey_ == s.key_) t.insert(i);
                break;
            case Scope::Kind::Parameter:
                fail(errc::parse, "unbound parameter {{{}}} in trusting scope", s.param_);
            }
        }
        return t;
    }

    // every rule with the origin of the code it came from
    std::vector<std::pair<const Rule*, size_t>> allRules() const {
        std::vector<std::pair<const Rule*, size_t>> r{};
        for (size_t i = 0; i < blocks_.size(); ++i)
            for (const auto& x : blocks_[i].code_.rules_) r.emplace_back(&x, i);
        for (const auto& x : authorizer_.rules_) r.emplace_back(&x, authorizerOrigin);
        return r;
    }

    bool queryMatches(const Rule& q, size_t origin, Check::Kind kind) const {
        auto t = trusted(q.scopes_, origin);
        bool any = false, allOk = true;
        facts_.matchBody(q, t, [&](const Bindings& b, const Origin&) {
            if (exprsHold(q, b)) any = true;
            else allOk = false;
            return kind == Check::Kind::All? allOk : ! any;
        });
        if (kind == Check::Kind::All) return allOk;
        return any;
    }

  public:
    Engine(std::vector<CodeBlock> blocks, BlockCode authorizer, RunLimits limits)
        : blocks_{std::move(blocks)}, authorizer_{std::move(authorizer)}, limits_{limits} { }

    const std::vector<CodeBlock>& blocks() const noexcept { return blocks_; }
    const BlockCode& authorizer() const noexcept { return authorizer_; }
    const RunLimits& limits() const noexcept { return limits_; }
    const EvalStats& stats() const noexcept { return stats_; }
    const FactSet& facts() const noexcept { return facts_; }

    /*
     * Compute the fixpoint. Returns a description of the exceeded limit if
     * evaluation had to be stopped. The fact and time limits are enforced
     * while rules are being matched, not only between iterations.
     */
    std::optional<std::string> run() {
        if (ran_) return std::nullopt;
        ran_ = true;
        auto start = std::chrono::steady_clock::now();
        auto elapsed = [&] {
            return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
        };
        std::optional<std::string> exceeded{};
        auto tooMany = [&](size_t pending) {
            stats_.facts_ = facts_.size() + pending;
            if (stats_.facts_ > limits_.maxFacts) exceeded = format("too many facts (limit {})", limits_.maxFacts);
            return exceeded.has_value();
        };
        auto tooLong = [&] {
            stats_.elapsed_ = elapsed();
            if (stats_.elapsed_ > limits_.maxTime)
                exceeded = format("evaluation took too long (limit {}us)", limits_.maxTime.count());
            return exceeded.has_value();
        };

        for (size_t i = 0; i < blocks_.size(); ++i)
            for (const auto& f : blocks_[i].code_.facts_) facts_.insert(Origin{i}, f);
        for (const auto& f : authorizer_.facts_) facts_.insert(Origin{authorizerOrigin}, f);
        if (tooMany(0)) return exceeded;

        auto rules = allRules();
        while (true) {
            if (stats_.iterations_ >= limits_.maxIterations) {
                stats_.elapsed_ = elapsed();
                return format("too many iterations (limit {})", limits_.maxIterations);
            }
            ++stats_.iterations_;
            // only facts not already known, so its size is the growth of this iteration
            std::set<std::pair<Origin, Fact>> produced{};
            for (const auto& ro : rules) {
                const Rule* rule = ro.first;
                size_t origin = ro.second;
                auto t = trusted(rule->scopes_, origin);
                bool done = facts_.matchBody(*rule, t, [&](const Bindings& b, const Origin& o) {
                    if (! exprsHold(*rule, b)) return true;
                    auto fo = o;
                    fo.insert(origin);
                    auto f = instantiate(rule->head_, b);
                    if (! facts_.contains(fo, f)) produced.emplace(std::move(fo), std::move(f));
                    return ! tooMany(produced.size());
                }, [&] { return ! tooLong(); });
                if (! done) return exceeded;
            }
            for (auto& [o, f] : produced) facts_.insert(o, f);
            if (tooMany(0) || tooLong()) return exceeded;
            if (produced.empty()) break;
        }
        bctl::log(L_DEBUG)("fixpoint after {} iterations, {} facts, {}us", stats_.iterations_, facts_.size(),
                           stats_.elapsed_.count());
        return std::nullopt;
    }

    // checks of the authorizer then of each block. Call after run().
    std::vector<FailedCheck> failedChecks() const {
        std::vector<FailedCheck> failed{};
        auto checkAll = [&](const std::vector<Check>& checks, size_t origin, std::optional<size_t> block) {
            for (size_t c = 0; c < checks.size(); ++c) {
                const auto& chk = checks[c];
                bool ok = std::any_of(chk.queries_.begin(), chk.queries_.end(),
                                      [&](const Rule& q) { return queryMatches(q, origin, chk.kind_); });
                if (! ok) failed.push_back({block, c, toString(chk)});
            }
        };
        checkAll(authorizer_.checks_, authorizerOrigin, std::nullopt);
        for (size_t i = 0; i < blocks_.size(); ++i) checkAll(blocks_[i].code_.checks_, i, i);
        return failed;
    }

    // the first policy with a matching query
    std::optional<MatchedPolicy> matchingPolicy() const {
        for (size_t p = 0; p < authorizer_.policies_.size(); ++p) {
            const auto& pol = authorizer_.policies_[p];
            for (const auto& q : pol.queries_)
                if (queryMatches(q, authorizerOrigin, Check::Kind::If)) return MatchedPolicy{p, pol.kind_, toString(pol)};
        }
        return std::nullopt;
    }

    // facts produced by rule 'q' run with the authorizer's trust (or trusting every block)
    std::set<Fact> query(const Rule& q, bool allBlocks) const {
        Origin t{};
        if (allBlocks) {
            for (size_t i = 0; i < blocks_.size(); ++i) t.insert(i);
            t.insert(authorizerOrigin);
        } else {
            t = trusted(q.scopes_, authorizerOrigin);
        }
        std::set<Fact> res{};
        facts_.matchBody(q, t, [&](const Bindings& b, const Origin&) {
            if (exprsHold(q, b)) res.insert(instantiate(q.head_, b));
            return true;
        });
        return res;
    }
};

} // namespace bctl::datalog

#endif // BCTL_DATALOG_ENGINE_HPP
