#ifndef BCTL_DATALOG_PRINTER_HPP
#define BCTL_DATALOG_PRINTER_HPP
#pragma once
/*
 * Canonical text form of datalog. Everything printed here parses back
 * to the same AST.
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

#include <string>
#include <string_view>

#include "../format.hpp"
#include "../rfc3339.hpp"
#include "ast.hpp"

namespace bctl::datalog {

static inline std::string quoted(std::string_view s) {
    std::string r{"\""};
    for (char c : s) {
        switch (c) {
            case '"': r += "\\\""; break;
            case '\\': r += "\\\\"; break;
            case '\n': r += "\\n"; break;
            case '\t': r += "\\t"; break;
            default: r += c;
        }
    }
    r += '"';
    return r;
}

static inline std::string toString(const Term& t) {
    switch (t.type()) {
        case termType::Variable: return "$" + t.str_;
        case termType::Parameter: return "{" + t.str_ + "}";
        case termType::Integer: return format("{}", t.int_);
        case termType::String: return quoted(t.str_);
        case termType::Date: return toRfc3339(fromEpoch(t.date_));
        case termType::Bytes: return "hex:" + toHex(t.bytes_);
        case termType::Bool: return t.asBool()? "true" : "false";
        case termType::Set: {
            std::string r{"["};
            for (size_t i = 0; i < t.set_.size(); ++i) {
                if (i) r += ", ";
                r += toString(t.set_[i]);
            }
            return r + "]";
        }
    }
    return {};
}

static inline std::string toString(const Predicate& p) {
    std::string r = p.name_ + "(";
    for (size_t i = 0; i < p.terms_.size(); ++i) {
        if (i) r += ", ";
        r += toString(p.terms_[i]);
    }
    return r + ")";
}

static constexpr std::string_view opText(exprOp op) noexcept {
    switch (op) {
        case exprOp::Not: return "!";
        case exprOp::Neg: return "-";
        case exprOp::Mul: return "*";
        case exprOp::Div: return "/";
        case exprOp::Add: return "+";
        case exprOp::Sub: return "-";
        case exprOp::Lt: return "<";
        case exprOp::Gt: return ">";
        case exprOp::Le: return "<=";
        case exprOp::Ge: return ">=";
        case exprOp::Eq: return "==";
        case exprOp::Ne: return "!=";
        case exprOp::And: return "&&";
        case exprOp::Or: return "||";
        case exprOp::Contains: return "contains";
        case exprOp::StartsWith: return "starts_with";
        case exprOp::EndsWith: return "ends_with";
        case exprOp::Length: return "length";
        default: return "";
    }
}

// binding strength of a binary operator (higher binds tighter)
static constexpr int precedence(exprOp op) noexcept {
    switch (op) {
        case exprOp::Or: return 1;
        case exprOp::And: return 2;
        case exprOp::Lt: case exprOp::Gt: case exprOp::Le: case exprOp::Ge: case exprOp::Eq: case exprOp::Ne: return 3;
        case exprOp::Add: case exprOp::Sub: return 4;
        case exprOp::Mul: case exprOp::Div: return 5;
        default: return 6;
    }
}

static inline std::string toString(const Expr& e) {
    // the parser keeps explicit parentheses so operands print as written
    switch (e.op_) {
        case exprOp::Value: return toString(e.value_);
        case exprOp::Parens: return "(" + toString(e.args_[0]) + ")";
        case exprOp::Not:
        case exprOp::Neg: return std::string(opText(e.op_)) + toString(e.args_[0]);
        case exprOp::Length: return toString(e.args_[0]) + ".length()";
        case exprOp::Contains:
        case exprOp::StartsWith:
        case exprOp::EndsWith:
            return format("{}.{}({})", toString(e.args_[0]), opText(e.op_), toString(e.args_[1]));
        default:
            return format("{} {} {}", toString(e.args_[0]), opText(e.op_), toString(e.args_[1]));
    }
}

static inline std::string toString(const Scope& s) {
    switch (s.kind_) {
        case Scope::Kind::Authority: return "authority";
        case Scope::Kind::Previous: return "previous";
        case Scope::Kind::PublicKey: return s.key_.toString();
        case Scope::Kind::Parameter: return "{" + s.param_ + "}";
    }
    return {};
}

// a rule body: predicates, then expressions, then any scopes
static inline std::string bodyString(const Rule& r) {
    std::string b{};
    for (const auto& p : r.body_) {
        if (! b.empty()) b += ", ";
        b += toString(p);
    }
    for (const auto& e : r.exprs_) {
        if (! b.empty()) b += ", ";
        b += toString(e);
    }
    if (! r.scopes_.empty()) {
        b += " trusting ";
        for (size_t i = 0; i < r.scopes_.size(); ++i) {
            if (i) b += ", ";
            b += toString(r.scopes_[i]);
        }
    }
    return b;
}

static inline std::string toString(const Rule& r) { return toString(r.head_) + " <- " + bodyString(r); }

static inline std::string queriesString(const std::vector<Rule>& qs) {
    std::string r{};
    for (size_t i = 0; i < qs.size(); ++i) {
        if (i) r += " or ";
        r += bodyString(qs[i]);
    }
    return r;
}

static inline std::string toString(const Check& c) {
    return (c.kind_ == Check::Kind::All? "check all " : "check if ") + queriesString(c.queries_);
}

static inline std::string toString(const Policy& p) {
    return (p.kind_ == Policy::Kind::Allow? "allow if " : "deny if ") + queriesString(p.queries_);
}

// one ';'-terminated statement per line
static inline std::string toString(const BlockCode& b) {
    std::string r{};
    for (const auto& f : b.facts_) r += toString(f) + ";\n";
    for (const auto& x : b.rules_) r += toString(x) + ";\n";
    for (const auto& c : b.checks_) r += toString(c) + ";\n";
    for (const auto& p : b.policies_) r += toString(p) + ";\n";
    return r;
}

} // namespace bctl::datalog

#endif // BCTL_DATALOG_PRINTER_HPP
