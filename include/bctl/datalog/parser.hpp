#ifndef BCTL_DATALOG_PARSER_HPP
#define BCTL_DATALOG_PARSER_HPP
#pragma once
/*
 * Recursive descent parser for bctl datalog
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
 * Grammar (statements are separated by ';', '//' starts a comment):
 *
 *   statement := fact | rule | check | policy
 *   fact      := name '(' term, ... ')'
 *   rule      := predicate '<-' body
 *   check     := 'check' ('if' | 'all') body ('or' body)*
 *   policy    := ('allow' | 'deny') 'if' body ('or' body)*
 *   body      := element (',' element)* ['trusting' scope (',' scope)*]
 *   element   := predicate | expression
 *   scope     := 'authority' | 'previous' | ALG '/' HEX | '{' name '}'
 *   term      := '$'var | '{'param'}' | string | integer | date | 'hex:'HEX
 *              | 'true' | 'false' | '[' term, ... ']'
 */

#include <cctype>
#include <charconv>
#include <set>
#include <string>
#include <string_view>

#include "../errors.hpp"
#include "../rfc3339.hpp"
#include "ast.hpp"
#include "printer.hpp"

namespace bctl::datalog {

class Parser {
    std::string_view src_;
    size_t pos_{};
    size_t nesting_{};      // active unary() calls
    bool policiesOk_;

    [[noreturn]] void bad(std::string_view msg) const {
        size_t line = 1, col = 1;
        for (size_t i = 0; i < pos_ && i < src_.size(); ++i) {
            if (src_[i] == '\n') { ++line; col = 1; } else ++col;
        }
        auto near = src_.substr(std::min(pos_, src_.size()), 20);
        if (auto nl = near.find('\n'); nl != near.npos) near = near.substr(0, nl);
        fail(errc::parse, "datalog error at line {} column {}: {}{}", line, col, msg,
             near.empty()? std::string(" (at end of input)") : format(" near '{}'", near));
    }

    Expr bounded(Expr e) const {
        if (e.depth_ > maxExprDepth) bad(format("expression nested too deeply (limit {})", maxExprDepth));
        return e;
    }

    bool atEnd() const noexcept { return pos_ >= src_.size(); }
    char peek(size_t ahead = 0) const noexcept { return pos_ + ahead < src_.size()? src_[pos_ + ahead] : '\0'; }

    void skipWs() noexcept {
        while (! atEnd()) {
            if (std::isspace((unsigned char)peek())) { ++pos_; continue; }
            if (peek() == '/' && peek(1) == '/') {
                while (! atEnd() && peek() != '\n') ++pos_;
                continue;
            }
            break;
        }
    }

    static bool identStart(char c) noexcept { return std::isalpha((unsigned char)c) || c == '_'; }
    static bool identChar(char c) noexcept { return std::isalnum((unsigned char)c) || c == '_' || c == ':'; }
    static bool nameChar(char c) noexcept { return std::isalnum((unsigned char)c) || c == '_'; }

    // the identifier at the current position (not consumed)
    std::string_view peekIdent() const noexcept {
        if (! identStart(peek())) return {};
        size_t e = pos_;
        while (e < src_.size() && identChar(src_[e])) ++e;
        return src_.substr(pos_, e - pos_);
    }

    // consume keyword 'kw' if it's next (and not the prefix of a longer identifier)
    bool keyword(std::string_view kw) {
        skipWs();
        if (peekIdent() != kw) return false;
        pos_ += kw.size();
        return true;
    }

    bool punct(std::string_view p) {
        skipWs();
        if (src_.substr(pos_, p.size()) != p) return false;
        pos_ += p.size();
        return true;
    }

    void expect(std::string_view p) { if (! punct(p)) bad(format("expected '{}'", p)); }

    std::string name(bool (*ok)(char)) {
        size_t s = pos_;
        while (! atEnd() && ok(peek())) ++pos_;
        if (s == pos_) bad("expected a name");
        return std::string(src_.substr(s, pos_ - s));
    }

    std::string stringLit() {
        ++pos_; // opening quote
        std::string r{};
        while (true) {
            if (atEnd()) bad("unterminated string");
            char c = src_[pos_++];
            if (c == '"') break;
            if (c != '\\') { r += c; continue; }
            if (atEnd()) bad("unterminated string");
            switch (char e = src_[pos_++]; e) {
                case '"': r += '"'; break;
                case '\\': r += '\\'; break;
                case 'n': r += '\n'; break;
                case 't': r += '\t'; break;
                default: --pos_; bad(format("unknown escape '\\{}'", e));
            }
        }
        if (! validUtf8(asBytes(r))) bad("string is not valid UTF-8");
        return r;
    }

    bool looksLikeDate() const noexcept {
        for (size_t i = 0; i < 4; ++i) if (! std::isdigit((unsigned char)peek(i))) return false;
        return peek(4) == '-';
    }

    Term number() {
        if (looksLikeDate()) {
            auto n = rfc3339Span(src_.substr(pos_));
            auto d = parseRfc3339(src_.substr(pos_, n));
            if (! d) bad("invalid RFC3339 date");
            pos_ += n;
            return Term::date(toEpoch(*d));
        }
        size_t s = pos_;
        if (peek() == '-') ++pos_;
        while (std::isdigit((unsigned char)peek())) ++pos_;
        int64_t v{};
        auto [p, ec] = std::from_chars(src_.data() + s, src_.data() + pos_, v);
        if (ec != std::errc{} || p != src_.data() + pos_) { pos_ = s; bad("integer out of range"); }
        return Term::integer(v);
    }

    Term term(bool inSet = false) {
        skipWs();
        char c = peek();
        if (c == '$') {
            if (inSet) bad("variables aren't allowed in sets");
            ++pos_;
            return Term::variable(name(nameChar));
        }
        if (c == '{') {
            ++pos_;
            auto n = name(nameChar);
            expect("}");
            return Term::parameter(std::move(n));
        }
        if (c == '"') return Term::string(stringLit());
        if (c == '[') {
            if (inSet) bad("sets can't contain sets");
            ++pos_;
            std::vector<Term> v{};
            if (! punct("]")) {
                do v.emplace_back(term(true)); while (punct(","));
                expect("]");
            }
            return Term::set(std::move(v));
        }
        if (std::isdigit((unsigned char)c) || (c == '-' && std::isdigit((unsigned char)peek(1)))) return number();
        if (src_.substr(pos_, 4) == "hex:") {
            pos_ += 4;
            size_t s = pos_;
            while (std::isxdigit((unsigned char)peek())) ++pos_;
            auto b = fromHex(src_.substr(s, pos_ - s));
            if (! b) bad("invalid hex byte string");
            return Term::byteString(std::move(*b));
        }
        if (keyword("true")) return Term::boolean(true);
        if (keyword("false")) return Term::boolean(false);
        bad("expected a term");
    }

    Predicate predicate() {
        skipWs();
        Predicate p{};
        p.name_ = std::string(peekIdent());
        if (p.name_.empty()) bad("expected a predicate name");
        pos_ += p.name_.size();
        expect("(");
        if (! punct(")")) {
            do {
                auto t = term();
                p.terms_.emplace_back(std::move(t));
            } while (punct(","));
            expect(")");
        }
        return p;
    }

    // is the next thing in a body a predicate (as opposed to an expression)?
    bool atPredicate() {
        skipWs();
        auto id = peekIdent();
        if (id.empty() || id == "true" || id == "false" || id.starts_with("hex:")) return false;
        size_t e = pos_ + id.size();
        while (e < src_.size() && std::isspace((unsigned char)src_[e])) ++e;
        return e < src_.size() && src_[e] == '(';
    }

    /* expressions, lowest to highest binding: || && comparisons +- * / unary postfix */

    Expr primary() {
        skipWs();
        if (punct("(")) {
            auto e = expr();
            expect(")");
            return bounded(Expr::unary(exprOp::Parens, std::move(e)));
        }
        auto e = Expr::value(term());
        while (punct(".")) {
            auto m = name(nameChar);
            expect("(");
            if (m == "length") {
                expect(")");
                e = bounded(Expr::unary(exprOp::Length, std::move(e)));
                continue;
            }
            exprOp op;
            if (m == "contains") op = exprOp::Contains;
            else if (m == "starts_with") op = exprOp::StartsWith;
            else if (m == "ends_with") op = exprOp::EndsWith;
            else bad(format("unknown method '{}'", m));
            auto arg = expr();
            expect(")");
            e = bounded(Expr::binary(op, std::move(e), std::move(arg)));
        }
        return e;
    }

    // every nested expression goes through here so this bounds the parser's recursion
    Expr unary() {
        struct Nest {
            size_t& n_;
            ~Nest() { --n_; }
        } nest{++nesting_};
        if (nesting_ > maxExprDepth) bad(format("expression nested too deeply (limit {})", maxExprDepth));
        skipWs();
        if (peek() == '!' && peek(1) != '=') { ++pos_; return bounded(Expr::unary(exprOp::Not, unary())); }
        if (peek() == '-' && ! std::isdigit((unsigned char)peek(1))) { ++pos_; return bounded(Expr::unary(exprOp::Neg, unary())); }
        return primary();
    }

    // the binary operator at the current position with its binding strength (not consumed)
    std::pair<exprOp,std::string_view> peekBinop() {
        skipWs();
        static constexpr std::pair<exprOp,std::string_view> ops[] = {
            {exprOp::Or, "||"}, {exprOp::And, "&&"}, {exprOp::Le, "<="}, {exprOp::Ge, ">="}, {exprOp::Eq, "=="},
            {exprOp::Ne, "!="}, {exprOp::Lt, "<"}, {exprOp::Gt, ">"}, {exprOp::Add, "+"}, {exprOp::Sub, "-"},
            {exprOp::Mul, "*"}, {exprOp::Div, "/"}
        };
        auto rest = src_.substr(pos_);
        if (rest.starts_with("<-") || rest.starts_with("//")) return {exprOp::Value, {}};
        for (const auto& [op, txt] : ops) if (rest.starts_with(txt)) return {op, txt};
        return {exprOp::Value, {}};
    }

    // precedence climbing. Comparisons don't chain.
    Expr binary(int minPrec) {
        auto lhs = unary();
        while (true) {
            auto [op, txt] = peekBinop();
            if (op == exprOp::Value) break;
            int prec = precedence(op);
            if (prec < minPrec) break;
            pos_ += txt.size();
            auto rhs = binary(prec + 1);
            lhs = bounded(Expr::binary(op, std::move(lhs), std::move(rhs)));
            if (prec == 3) {
                auto [nop, ntxt] = peekBinop();
                if (nop != exprOp::Value && precedence(nop) == 3) bad("comparisons can't be chained, use parentheses");
            }
        }
        return lhs;
    }

    Expr expr() { return binary(1); }

    Scope scope() {
        skipWs();
        Scope s{};
        if (keyword("authority")) { s.kind_ = Scope::Kind::Authority; return s; }
        if (keyword("previous")) { s.kind_ = Scope::Kind::Previous; return s; }
        if (peek() == '{') {
            ++pos_;
            s.kind_ = Scope::Kind::Parameter;
            s.param_ = name(nameChar);
            expect("}");
            return s;
        }
        for (auto a : {Algorithm::Ed25519, Algorithm::Secp256r1}) {
            auto pfx = std::string(algorithmName(a)) + "/";
            if (src_.substr(pos_, pfx.size()) != pfx) continue;
            size_t s0 = pos_;
            pos_ += pfx.size();
            while (std::isxdigit((unsigned char)peek())) ++pos_;
            try {
                s.kind_ = Scope::Kind::PublicKey;
                s.key_ = PublicKey::fromString(src_.substr(s0, pos_ - s0));
            } catch (const bctl::error& e) {
                pos_ = s0;
                bad(format("invalid public key in scope: {}", e.what()));
            }
            return s;
        }
        bad("expected 'authority', 'previous', a public key or a parameter");
    }

    // checks that every variable in the head and expressions is bound by a body predicate
    void checkVariables(const Rule& r, bool isQuery) {
        std::set<std::string> bound{}, used{};
        for (const auto& p : r.body_) variablesOf(p, bound);
        if (! isQuery) variablesOf(r.head_, used);
        for (const auto& e : r.exprs_) variablesOf(e, used);
        for (const auto& v : used)
            if (! bound.contains(v)) bad(format("variable ${} doesn't appear in a body predicate", v));
    }

    Rule body(Predicate head, bool isQuery) {
        Rule r{std::move(head), {}, {}, {}};
        do {
            if (atPredicate()) r.body_.emplace_back(predicate());
            else r.exprs_.emplace_back(expr());
        } while (punct(","));
        if (keyword("trusting")) {
            do r.scopes_.emplace_back(scope()); while (punct(","));
        }
        checkVariables(r, isQuery);
        return r;
    }

    std::vector<Rule> queries() {
        std::vector<Rule> qs{};
        do qs.emplace_back(body(Predicate{"query", {}}, true)); while (keyword("or"));
        return qs;
    }

    void statement(BlockCode& b) {
        skipWs();
        auto startPos = pos_;
        if (keyword("check")) {
            Check c{};
            if (keyword("if")) c.kind_ = Check::Kind::If;
            else if (keyword("all")) c.kind_ = Check::Kind::All;
            else bad("expected 'if' or 'all' after 'check'");
            c.queries_ = queries();
            b.checks_.emplace_back(std::move(c));
            return;
        }
        for (auto [kw, kind] : {std::pair{"allow", Policy::Kind::Allow}, std::pair{"deny", Policy::Kind::Deny}}) {
            if (! keyword(kw)) continue;
            if (! policiesOk_) { pos_ = startPos; bad("policies are only allowed in an authorizer"); }
            if (! keyword("if")) bad(format("expected 'if' after '{}'", kw));
            b.policies_.emplace_back(Policy{kind, queries()});
            return;
        }
        auto p = predicate();
        if (punct("<-")) {
            b.rules_.emplace_back(body(std::move(p), false));
            return;
        }
        if (p.hasVariables()) { pos_ = startPos; bad("facts can't contain variables"); }
        b.facts_.emplace_back(std::move(p));
    }

  public:
    Parser(std::string_view src, bool policiesOk) : src_{src}, policiesOk_{policiesOk} { }

    BlockCode block() {
        BlockCode b{};
        skipWs();
        while (! atEnd()) {
            statement(b);
            if (! punct(";")) {
                skipWs();
                if (! atEnd()) bad("expected ';'");
            }
            skipWs();
        }
        return b;
    }

    // a single rule with nothing after it (optionally ';'-terminated)
    Rule rule() {
        auto p = predicate();
        expect("<-");
        auto r = body(std::move(p), false);
        punct(";");
        skipWs();
        if (! atEnd()) bad("unexpected text after rule");
        return r;
    }
};

// parse the code of a block (no policies allowed)
static inline BlockCode parseBlock(std::string_view src) { return Parser(src, false).block(); }

// parse an authorizer (policies allowed)
static inline BlockCode parseAuthorizer(std::string_view src) { return Parser(src, true).block(); }

static inline Rule parseRule(std::string_view src) { return Parser(src, false).rule(); }

} // namespace bctl::datalog

#endif // BCTL_DATALOG_PARSER_HPP
