#ifndef BCTL_DATALOG_PARAMS_HPP
#define BCTL_DATALOG_PARAMS_HPP
#pragma once
/*
 * Substitution of {param} placeholders in parsed datalog
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

#include <map>
#include <string>
#include <variant>

#include "../errors.hpp"
#include "ast.hpp"

namespace bctl::datalog {

// a parameter is bound either to a term or (for 'trusting' scopes) to a public key
using ParamValue = std::variant<Term, bctl::PublicKey>;
using ParamMap = std::map<std::string, ParamValue>;

namespace detail {

struct substituter {
    const ParamMap& params_;

    void term(Term& t) const {
        if (t.type() == termType::Set) {
            for (auto& s : t.set_) term(s);
            t = Term::set(std::move(t.set_));
            return;
        }
        if (! t.isParameter()) return;
        auto it = params_.find(t.str_);
        if (it == params_.end()) fail(errc::parse, "no value was supplied for parameter {{{}}}", t.str_);
        if (! std::holds_alternative<Term>(it->second))
            fail(errc::parse, "parameter {{{}}} is a public key and can only be used in a 'trusting' scope", t.str_);
        t = std::get<Term>(it->second);
    }

    void pred(Predicate& p) const { for (auto& t : p.terms_) term(t); }

    void expr(Expr& e) const {
        if (e.op_ == exprOp::Value) term(e.value_);
        for (auto& a : e.args_) expr(a);
    }

    void scope(Scope& s) const {
        if (s.kind_ != Scope::Kind::Parameter) return;
        auto it = params_.find(s.param_);
        if (it == params_.end()) fail(errc::parse, "no value was supplied for parameter {{{}}}", s.param_);
        if (! std::holds_alternative<bctl::PublicKey>(it->second))
            fail(errc::parse, "parameter {{{}}} is used as a 'trusting' scope but isn't a public key", s.param_);
        s.kind_ = Scope::Kind::PublicKey;
        s.key_ = std::get<bctl::PublicKey>(it->second);
        s.param_.clear();
    }

    void rule(Rule& r) const {
        pred(r.head_);
        for (auto& p : r.body_) pred(p);
        for (auto& e : r.exprs_) expr(e);
        for (auto& s : r.scopes_) scope(s);
    }
};

} // namespace detail

/*
 * Replace every parameter in 'code' with its value from 'params'. A parameter
 * without a value is an error. Values for parameters that don't appear are ignored.
 */
static inline void applyParams(BlockCode& code, const ParamMap& params) {
    detail::substituter s{params};
    for (auto& f : code.facts_) s.pred(f);
    for (auto& r : code.rules_) s.rule(r);
    for (auto& c : code.checks_) for (auto& q : c.queries_) s.rule(q);
    for (auto& p : code.policies_) for (auto& q : p.queries_) s.rule(q);
}

static inline void applyParams(Rule& r, const ParamMap& params) { detail::substituter{params}.rule(r); }

} // namespace bctl::datalog

#endif // BCTL_DATALOG_PARAMS_HPP
