#ifndef BCTL_DATALOG_AST_HPP
#define BCTL_DATALOG_AST_HPP
#pragma once
/*
 * Datalog terms, predicates, expressions, rules, checks and policies
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

#include <algorithm>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "../crypto/keys.hpp"
#include "../encoding.hpp"

namespace bctl::datalog {

enum class termType : uint8_t { Variable, Parameter, Integer, String, Date, Bytes, Bool, Set };

/*
 * A Term is a tagged value. Only the member(s) for its type are meaningful:
 *   Variable, Parameter, String: str_
 *   Integer, Bool: int_        Date: date_ (seconds since the epoch)
 *   Bytes: bytes_              Set: set_ (sorted, no duplicates)
 */
struct Term {
    termType type_{termType::Integer};
    int64_t int_{};
    uint64_t date_{};
    std::string str_{};
    bytes bytes_{};
    std::vector<Term> set_{};

    static Term variable(std::string n) { Term t; t.type_ = termType::Variable; t.str_ = std::move(n); return t; }
    static Term parameter(std::string n) { Term t; t.type_ = termType::Parameter; t.str_ = std::move(n); return t; }
    static Term integer(int64_t v) { Term t; t.type_ = termType::Integer; t.int_ = v; return t; }
    static Term string(std::string s) { Term t; t.type_ = termType::String; t.str_ = std::move(s); return t; }
    static Term date(uint64_t d) { Term t; t.type_ = termType::Date; t.date_ = d; return t; }
    static Term byteString(bytes b) { Term t; t.type_ = termType::Bytes; t.bytes_ = std::move(b); return t; }
    static Term boolean(bool b) { Term t; t.type_ = termType::Bool; t.int_ = b; return t; }
    static Term set(std::vector<Term> v) {
        std::sort(v.begin(), v.end());
        v.erase(std::unique(v.begin(), v.end()), v.end());
        Term t; t.type_ = termType::Set; t.set_ = std::move(v); return t;
    }

    constexpr termType type() const noexcept { return type_; }
    bool isVariable() const noexcept { return type_ == termType::Variable; }
    bool isParameter() const noexcept { return type_ == termType::Parameter; }
    bool isBool() const noexcept { return type_ == termType::Bool; }
    bool asBool() const noexcept { return int_ != 0; }

    // total order: by type then value
    friend int compare(const Term& a, const Term& b) noexcept {
        if (a.type_ != b.type_) return a.type_ < b.type_? -1 : 1;
        switch (a.type_) {
            case termType::Integer:
            case termType::Bool:
                return a.int_ < b.int_? -1 : a.int_ > b.int_? 1 : 0;
            case termType::Date:
                return a.date_ < b.date_? -1 : a.date_ > b.date_? 1 : 0;
            case termType::Variable:
            case termType::Parameter:
            case termType::String:
                return a.str_.compare(b.str_) < 0? -1 : a.str_ == b.str_? 0 : 1;
            case termType::Bytes:
                return a.bytes_ < b.bytes_? -1 : a.bytes_ == b.bytes_? 0 : 1;
            case termType::Set: {
                auto n = std::min(a.set_.size(), b.set_.size());
                for (size_t i = 0; i < n; ++i)
                    if (auto c = compare(a.set_[i], b.set_[i]); c != 0) return c;
                return a.set_.size() < b.set_.size()? -1 : a.set_.size() > b.set_.size()? 1 : 0;
            }
        }
        return 0;
    }
    friend bool operator==(const Term& a, const Term& b) noexcept { return compare(a, b) == 0; }
    friend bool operator<(const Term& a, const Term& b) noexcept { return compare(a, b) < 0; }
};

struct Predicate {
    std::string name_;
    std::vector<Term> terms_;

    bool hasVariables() const noexcept {
        return std::any_of(terms_.begin(), terms_.end(), [](const auto& t) { return t.isVariable(); });
    }

    friend bool operator==(const Predicate& a, const Predicate& b) noexcept {
        return a.name_ == b.name_ && a.terms_ == b.terms_;
    }
    friend bool operator<(const Predicate& a, const Predicate& b) noexcept {
        if (a.name_ != b.name_) return a.name_ < b.name_;
        return std::lexicographical_compare(a.terms_.begin(), a.terms_.end(), b.terms_.begin(), b.terms_.end());
    }
};
using Fact = Predicate;

enum class exprOp : uint8_t {
    Value, Parens,
    Not, Neg,
    Mul, Div, Add, Sub,
    Lt, Gt, Le, Ge, Eq, Ne,
    And, Or,
    Contains, StartsWith, EndsWith, Length
};

// expressions are evaluated and printed recursively so their depth is capped when parsed
static constexpr size_t maxExprDepth = 128;

struct Expr {
    exprOp op_{exprOp::Value};
    Term value_{};              // for Value
    std::vector<Expr> args_{};  // 1 for unary ops, Parens and Length; 2 for the others
    size_t depth_{1};

    static Expr value(Term t) { Expr e; e.value_ = std::move(t); return e; }
    static Expr unary(exprOp op, Expr a) {
        Expr e; e.op_ = op; e.depth_ = a.depth_ + 1; e.args_.emplace_back(std::move(a)); return e;
    }
    static Expr binary(exprOp op, Expr a, Expr b) {
        Expr e; e.op_ = op; e.depth_ = std::max(a.depth_, b.depth_) + 1;
        e.args_.emplace_back(std::move(a)); e.args_.emplace_back(std::move(b)); return e;
    }
};

struct Scope {
    enum class Kind : uint8_t { Authority, Previous, PublicKey, Parameter };
    Kind kind_{Kind::Authority};
    bctl::PublicKey key_{};
    std::string param_{};
};

struct Rule {
    Predicate head_;
    std::vector<Predicate> body_;
    std::vector<Expr> exprs_;
    std::vector<Scope> scopes_;
};

struct Check {
    enum class Kind : uint8_t { If, All };
    Kind kind_{Kind::If};
    std::vector<Rule> queries_;     // alternatives separated by 'or'
};

struct Policy {
    enum class Kind : uint8_t { Allow, Deny };
    Kind kind_{Kind::Allow};
    std::vector<Rule> queries_;
};

// the code of one block or of the authorizer
struct BlockCode {
    std::vector<Fact> facts_;
    std::vector<Rule> rules_;
    std::vector<Check> checks_;
    std::vector<Policy> policies_;

    bool empty() const noexcept { return facts_.empty() && rules_.empty() && checks_.empty() && policies_.empty(); }

    // append all of 'o's statements
    void merge(BlockCode o) {
        for (auto& f : o.facts_) facts_.emplace_back(std::move(f));
        for (auto& r : o.rules_) rules_.emplace_back(std::move(r));
        for (auto& c : o.checks_) checks_.emplace_back(std::move(c));
        for (auto& p : o.policies_) policies_.emplace_back(std::move(p));
    }
};

// collect the names of the variables used by terms
static inline void variablesOf(const Term& t, std::set<std::string>& out) {
    if (t.isVariable()) out.insert(t.str_);
}
static inline void variablesOf(const Predicate& p, std::set<std::string>& out) {
    for (const auto& t : p.terms_) variablesOf(t, out);
}
static inline void variablesOf(const Expr& e, std::set<std::string>& out) {
    if (e.op_ == exprOp::Value) variablesOf(e.value_, out);
    for (const auto& a : e.args_) variablesOf(a, out);
}

} // namespace bctl::datalog

#endif // BCTL_DATALOG_AST_HPP
