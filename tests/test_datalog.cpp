/*
 * test_datalog.cpp -- datalog parser, printer and evaluation
 *
 * Copyright (C) 2025 The bctl authors
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program; if not, see <https://www.gnu.org/licenses/>.
 */

#include <catch2/catch.hpp>

#include "test.hpp"

using namespace bctl;
using namespace bctl::datalog;

static std::string parseErr(std::string_view src, bool authorizer = false) {
    try {
        authorizer? parseAuthorizer(src) : parseBlock(src);
    } catch (const error& e) {
        CHECK(e.kind() == errc::parse);
        return e.what();
    }
    FAIL("parsed: " << src);
    return {};
}

static Engine engine(std::vector<std::string_view> blocks, std::string_view authorizer, RunLimits l = {}) {
    std::vector<CodeBlock> cb{};
    for (auto b : blocks) cb.push_back({parseBlock(b), std::nullopt});
    return Engine{std::move(cb), parseAuthorizer(authorizer), l};
}

TEST_CASE("parsing blocks", "[datalog][parser]") {
    auto b = parseBlock(R"(
        // comments are skipped
        right("file1", "read");
        user(1234);
        can_read($f) <- right($f, "read"), $f.starts_with("file");
        check if time($t), $t <= 2030-01-01T00:00:00Z;
        check all op($o), ["read", "write"].contains($o)
    )");
    CHECK(b.facts_.size() == 2);
    CHECK(b.rules_.size() == 1);
    REQUIRE(b.checks_.size() == 2);
    CHECK(b.checks_[0].kind_ == Check::Kind::If);
    CHECK(b.checks_[1].kind_ == Check::Kind::All);
    CHECK(b.policies_.empty());
    CHECK(b.facts_[1].terms_[0] == Term::integer(1234));

    SECTION("term types") {
        auto f = parseBlock(R"(t(-7, "a\"b", 2025-04-01T00:00:00Z, hex:00ff, true, [3, 1, 3]);)").facts_.at(0);
        REQUIRE(f.terms_.size() == 6);
        CHECK(f.terms_[0] == Term::integer(-7));
        CHECK(f.terms_[1] == Term::string("a\"b"));
        CHECK(f.terms_[2] == Term::date(1'743'465'600));
        CHECK(f.terms_[3] == Term::byteString({0x00, 0xff}));
        CHECK(f.terms_[4] == Term::boolean(true));
        CHECK(f.terms_[5] == Term::set({Term::integer(1), Term::integer(3)}));
    }
    SECTION("checks with alternatives and scopes") {
        auto c = parseBlock("check if a(1) or b(2) trusting authority, previous;").checks_.at(0);
        REQUIRE(c.queries_.size() == 2);
        REQUIRE(c.queries_[1].scopes_.size() == 2);
        CHECK(c.queries_[1].scopes_[1].kind_ == Scope::Kind::Previous);
    }
    SECTION("the authorizer can carry policies") {
        auto a = parseAuthorizer("allow if user($u); deny if true;");
        REQUIRE(a.policies_.size() == 2);
        CHECK(a.policies_[0].kind_ == Policy::Kind::Allow);
        CHECK(a.policies_[1].kind_ == Policy::Kind::Deny);
    }
}

TEST_CASE("datalog errors", "[datalog][parser]") {
    CHECK_THAT(parseErr("allow if true;"), Catch::Contains("policies are only allowed in an authorizer"));
    CHECK_THAT(parseErr("a($x);"), Catch::Contains("facts can't contain variables"));
    CHECK_THAT(parseErr("r($y) <- a($x);"), Catch::Contains("variable $y"));
    CHECK_THAT(parseErr("a(1) b(2);"), Catch::Contains("expected ';'"));
    CHECK_THAT(parseErr("check a(1);"), Catch::Contains("expected 'if' or 'all'"));
    CHECK_THAT(parseErr("check if a($x), $x < 1 < 2;"), Catch::Contains("can't be chained"));
    CHECK_THAT(parseErr("a(\"open"), Catch::Contains("unterminated string"));
    CHECK_THAT(parseErr("a(1);\nb(99999999999999999999);"), Catch::Contains("line 2"));
    CHECK_THAT(parseErr("check if a(1) trusting ed25519/00;"), Catch::Contains("invalid public key"));
    parseErr("a(1", true);
    CHECK_THROWS_AS(parseRule("q($x) <- a($x); extra(1)"), error);
}

TEST_CASE("expression depth", "[datalog][parser]") {
    auto repeat = [](std::string_view s, size_t n) {
        std::string r{};
        for (size_t i = 0; i < n; ++i) r += s;
        return r;
    };
    SECTION("deep nesting is a parse error, not a crash") {
        CHECK_THAT(parseErr("check if " + repeat("!", 60000) + "true;"), Catch::Contains("nested too deeply (limit 128)"));
        CHECK_THAT(parseErr("check if " + repeat("(", 60000) + "true;"), Catch::Contains("nested too deeply"));
        CHECK_THAT(parseErr("check if a($x), " + repeat("-", 300) + "$x == 1;"), Catch::Contains("nested too deeply"));
    }
    SECTION("long operator chains and method chains are capped too") {
        CHECK_THAT(parseErr("check if " + repeat("1 + ", 20000) + "1 == 1;"), Catch::Contains("nested too deeply"));
        CHECK_THAT(parseErr("check if \"a\"" + repeat(".length()", 500) + " == 1;"), Catch::Contains("nested too deeply"));
    }
    SECTION("expressions within the limit parse, print and evaluate") {
        auto src = "check if " + repeat("!", 100) + "true;";
        auto b = parseBlock(src);
        REQUIRE(b.checks_.size() == 1);
        CHECK(b.checks_[0].queries_[0].exprs_[0].depth_ == 101);
        CHECK(toString(b) == src + "\n");
        auto e = engine({src}, "allow if true;");
        REQUIRE_FALSE(e.run());
        CHECK(e.failedChecks().empty());
    }
}

TEST_CASE("printing", "[datalog][printer]") {
    auto text = toString(parseBlock(R"(a(1);r($x)<-a($x),$x>0;check if r(1)or r(2);check all a($y),($y+1)*2!=0)"));
    CHECK(text == "a(1);\n"
                  "r($x) <- a($x), $x > 0;\n"
                  "check if r(1) or r(2);\n"
                  "check all a($y), ($y + 1) * 2 != 0;\n");
    // printed code parses back to the same text
    CHECK(toString(parseBlock(text)) == text);

    CHECK(toString(parseAuthorizer(R"(allow if s($s), $s.length() > 2 || !$s.ends_with("\n");)"))
          == "allow if s($s), $s.length() > 2 || !$s.ends_with(\"\\n\");\n");
    CHECK(toString(Term::date(1'743'465'600)) == "2025-04-01T00:00:00Z");
    CHECK(toString(Term::byteString({0xab})) == "hex:ab");
}

TEST_CASE("parameters", "[datalog][params]") {
    auto pk = PrivateKey::generate(Algorithm::Ed25519).publicKey();
    auto b = parseBlock("user({id}); check if a(1) trusting {key};");
    ParamMap m{{"id", Term::integer(7)}, {"key", pk}, {"unused", Term::boolean(false)}};
    applyParams(b, m);
    CHECK(b.facts_[0].terms_[0] == Term::integer(7));
    const auto& s = b.checks_[0].queries_[0].scopes_.at(0);
    CHECK(s.kind_ == Scope::Kind::PublicKey);
    CHECK(s.key_ == pk);

    auto missing = parseBlock("user({id});");
    CHECK_THROWS_AS(applyParams(missing, {}), error);
    auto wrongKind = parseBlock("user({key});");
    CHECK_THROWS_AS(applyParams(wrongKind, m), error);
}

TEST_CASE("evaluation", "[datalog][engine]") {
    SECTION("rules derive facts") {
        auto e = engine({"a(1); a(-2); r($x) <- a($x), $x > 0;"}, "check if r(1); check if r(-2);");
        REQUIRE_FALSE(e.run());
        auto failed = e.failedChecks();
        REQUIRE(failed.size() == 1);
        CHECK_FALSE(failed[0].block_);
        CHECK(failed[0].index_ == 1);
        CHECK(failed[0].toString() == "authorizer check #1: check if r(-2)");
    }
    SECTION("the authorizer only trusts the authority block by default") {
        auto e = engine({"a(0);", "b(1);"}, "check if a(0); check if b(1); check if b(1) trusting previous;");
        REQUIRE_FALSE(e.run());
        auto failed = e.failedChecks();
        REQUIRE(failed.size() == 1);
        CHECK(failed[0].index_ == 1);
    }
    SECTION("a block can't see facts of later blocks") {
        auto e = engine({"check if b(1);", "b(1); check if b(1);"}, "");
        REQUIRE_FALSE(e.run());
        auto failed = e.failedChecks();
        REQUIRE(failed.size() == 1);
        CHECK(failed[0].block_ == 0u);
    }
    SECTION("blocks see facts derived from their own and the authority's code") {
        auto e = engine({"a(1);", "r($x) <- a($x); check if r(1);"}, "check if r(1);");
        REQUIRE_FALSE(e.run());
        auto failed = e.failedChecks();
        // r(1) has origin {0, 1} which the authorizer doesn't trust
        REQUIRE(failed.size() == 1);
        CHECK_FALSE(failed[0].block_);
    }
    SECTION("check all") {
        auto e = engine({"n(1); n(5);"}, "check all n($x), $x > 0; check all n($x), $x > 2; check all m($x), $x > 0;");
        REQUIRE_FALSE(e.run());
        auto failed = e.failedChecks();
        REQUIRE(failed.size() == 1);
        CHECK(failed[0].index_ == 1);
    }
    SECTION("expression errors don't match") {
        auto e = engine({"a(1); big(9223372036854775807);"},
                        "check if a($x), $x / 0 == 1; check if big($b), $b + 1 > 0; check if a($x), $x + \"s\" == 1;");
        REQUIRE_FALSE(e.run());
        CHECK(e.failedChecks().size() == 3);
    }
    SECTION("external keys are trusted by name") {
        auto pk = PrivateKey::generate(Algorithm::Ed25519).publicKey();
        std::vector<CodeBlock> cb{{parseBlock("a(0);"), std::nullopt}, {parseBlock("signed(1);"), pk}};
        Engine e{std::move(cb), parseAuthorizer(format("check if signed(1) trusting {};", pk.toString())), {}};
        REQUIRE_FALSE(e.run());
        CHECK(e.failedChecks().empty());
    }
    SECTION("the first matching policy wins") {
        auto e = engine({"user(1);"}, "deny if user(2); allow if user(1); deny if true;");
        REQUIRE_FALSE(e.run());
        auto p = e.matchingPolicy();
        REQUIRE(p);
        CHECK(p->index_ == 1);
        CHECK(p->kind_ == Policy::Kind::Allow);
        CHECK(p->text_ == "allow if user(1)");
    }
    SECTION("queries") {
        auto e = engine({"a(1); a(2);", "a(3);"}, "");
        REQUIRE_FALSE(e.run());
        auto q = parseRule("found($x) <- a($x)");
        CHECK(e.query(q, false).size() == 2);
        auto all = e.query(q, true);
        CHECK(all.size() == 3);
        CHECK(all.contains(Fact{"found", {Term::integer(3)}}));
    }
}

TEST_CASE("run limits", "[datalog][engine]") {
    SECTION("facts") {
        RunLimits l{};
        l.maxFacts = 2;
        auto e = engine({"a(1); a(2); a(3);"}, "", l);
        auto err = e.run();
        REQUIRE(err);
        CHECK(*err == "too many facts (limit 2)");
    }
    SECTION("iterations") {
        RunLimits l{};
        l.maxIterations = 1;
        auto e = engine({"e(1, 2); e(2, 3); p($x, $y) <- e($x, $y); p($x, $z) <- p($x, $y), e($y, $z);"}, "", l);
        auto err = e.run();
        REQUIRE(err);
        CHECK(*err == "too many iterations (limit 1)");
    }
    SECTION("a cartesian product stops at the fact limit") {
        std::string src{};
        for (int i = 0; i < 150; ++i) src += format("n({});", i);
        src += "p($a, $b, $c) <- n($a), n($b), n($c);";
        RunLimits l{};
        l.maxTime = std::chrono::hours{1};
        auto e = engine({src}, "", l);
        auto start = std::chrono::steady_clock::now();
        auto err = e.run();
        REQUIRE(err);
        CHECK(*err == "too many facts (limit 1000)");
        CHECK(e.facts().size() <= l.maxFacts);
        CHECK(e.stats().facts_ == l.maxFacts + 1);
        CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds{2});
    }
    SECTION("a long join stops at the time limit") {
        std::string src{};
        for (int i = 0; i < 150; ++i) src += format("n({});", i);
        // the join never completes a match so only the time limit applies
        src += "p($a) <- n($a), n($b), n($c), missing($a);";
        RunLimits l{};
        l.maxTime = std::chrono::milliseconds{5};
        auto e = engine({src}, "", l);
        auto start = std::chrono::steady_clock::now();
        auto err = e.run();
        REQUIRE(err);
        CHECK(*err == "evaluation took too long (limit 5000us)");
        CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds{2});
    }
    SECTION("a fixpoint inside the limits") {
        auto e = engine({"e(1, 2); e(2, 3); p($x, $y) <- e($x, $y); p($x, $z) <- p($x, $y), e($y, $z);"}, "");
        REQUIRE_FALSE(e.run());
        CHECK(e.facts().size() == 5);
        CHECK(e.stats().iterations_ >= 2);
    }
}
