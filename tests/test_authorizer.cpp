/*
 * test_authorizer.cpp -- authorization, queries and snapshots
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

static Token token(const PrivateKey& root, std::vector<std::string_view> blocks) {
    BlockBuilder a{};
    a.addCode(blocks.at(0));
    auto t = Token::build(root, a);
    for (size_t i = 1; i < blocks.size(); ++i) {
        BlockBuilder bb{};
        bb.addCode(blocks[i]);
        t = t.append(bb);
    }
    return t;
}

TEST_CASE("authorization", "[authorizer]") {
    auto root = PrivateKey::generate(Algorithm::Ed25519);
    auto t = token(root, {R"(right("file1", "read"); right("file2", "read");)", R"(check if resource($r), $r == "file1";)"});

    SECTION("allowed") {
        Authorizer a{};
        a.addCode(R"(resource("file1"); operation("read"); allow if resource($r), operation($o), right($r, $o);)");
        a.addToken(t);
        auto res = a.authorize();
        CHECK(res.ok());
        CHECK(res.failure().empty());
        REQUIRE(res.policy_);
        CHECK(res.policy_->index_ == 0);
        CHECK(res.stats_.iterations_ >= 1);
    }
    SECTION("a block's check fails") {
        Authorizer a{};
        a.addCode(R"(resource("file2"); operation("read"); allow if resource($r), operation($o), right($r, $o);)");
        a.addToken(t);
        auto res = a.authorize();
        CHECK_FALSE(res.ok());
        REQUIRE(res.failedChecks_.size() == 1);
        CHECK(res.failedChecks_[0].block_ == 1u);
        CHECK(res.failure() == "failed checks:\n  block 1 check #0: check if resource($r), $r == \"file1\"");
    }
    SECTION("a deny policy") {
        Authorizer a{};
        a.addCode(R"(resource("file1"); deny if right("file2", "read"); allow if true;)");
        a.addToken(t);
        auto res = a.authorize();
        CHECK_FALSE(res.ok());
        CHECK(res.failure() == "matched deny policy #0: deny if right(\"file2\", \"read\")");
    }
    SECTION("no policy") {
        Authorizer a{};
        a.addCode(R"(resource("file1");)");
        a.addToken(t);
        CHECK_FALSE(a.hasPolicies());
        auto res = a.authorize();
        CHECK_FALSE(res.ok());
        CHECK(res.failure() == "no policy matched");
    }
    SECTION("time") {
        Authorizer a{};
        a.addCode("allow if time($t), $t > 2020-01-01T00:00:00Z;");
        a.setTime(fromEpoch(1'743'465'600));
        a.addToken(token(root, {"a(1);"}));
        CHECK(a.authorize().ok());
    }
    SECTION("limits") {
        Authorizer a{};
        RunLimits l{};
        l.maxFacts = 1;
        a.addCode("allow if true;").setLimits(l).addToken(t);
        auto res = a.authorize();
        CHECK_FALSE(res.ok());
        REQUIRE(res.limitError_);
        CHECK(res.failure() == "evaluation aborted: too many facts (limit 1)");
        try {
            a.query(datalog::parseRule("r($x) <- right($x, $y)"), {}, false);
            FAIL("query ran past a limit");
        } catch (const error& e) {
            CHECK(e.kind() == errc::delegate);
        }
    }
    SECTION("no code after evaluation") {
        Authorizer a{};
        a.addCode("allow if true;").addToken(t);
        a.authorize();
        CHECK_THROWS_AS(a.addCode("b(1);"), std::logic_error);
        CHECK_THROWS_AS(a.addToken(t), std::logic_error);
    }
}

TEST_CASE("queries", "[authorizer]") {
    auto root = PrivateKey::generate(Algorithm::Ed25519);
    auto t = token(root, {R"(right("file1", "read");)", R"(right("file9", "write");)"});
    Authorizer a{};
    a.addToken(t);
    auto q = datalog::parseRule("r($f) <- right($f, {op})");

    auto read = a.query(q, {{"op", datalog::Term::string("read")}}, false);
    REQUIRE(read.size() == 1);
    CHECK(datalog::toString(*read.begin()) == "r(\"file1\")");
    // later blocks are only seen when asked for
    CHECK(a.query(q, {{"op", datalog::Term::string("write")}}, false).empty());
    CHECK(a.query(q, {{"op", datalog::Term::string("write")}}, true).size() == 1);
    CHECK_THROWS_AS(a.query(q, {}, false), error);
}

TEST_CASE("snapshots", "[authorizer][snapshot]") {
    auto root = PrivateKey::generate(Algorithm::Ed25519);
    auto ext = PrivateKey::generate(Algorithm::Ed25519);
    auto t = token(root, {R"(right("file1", "read");)"});
    BlockBuilder tb{};
    tb.addCode("approved(true);").context("idp");
    t = t.appendThirdParty(t.thirdPartyRequest().createBlock(ext, tb));

    Authorizer a{};
    RunLimits l{};
    l.maxFacts = 50;
    a.addCode(format("resource(\"file1\"); allow if right($r, \"read\"), resource($r), approved(true) trusting authority, {};",
                     ext.publicKey().toString()));
    a.setTime(fromEpoch(1'743'465'600)).setLimits(l).addToken(t);
    auto policies = a.policiesSnapshot();
    REQUIRE(a.authorize().ok());
    auto snap = a.snapshot();

    SECTION("a snapshot restores the authorizer and its token") {
        auto r = Authorizer::fromSnapshot(snap);
        CHECK(r.source() == a.source());
        CHECK(r.limits().maxFacts == 50);
        CHECK(r.time() == fromEpoch(1'743'465'600));
        REQUIRE(r.blocks().size() == 2);
        CHECK(r.blocks()[1].context_ == "idp");
        CHECK(r.blocks()[1].externalKey_ == ext.publicKey());
        REQUIRE(r.recordedStats());
        CHECK(r.recordedStats()->iterations_ >= 1);
        CHECK(r.authorize().ok());
        // snapshots of snapshots are stable
        auto again = Authorizer::fromSnapshot(r.snapshot());
        CHECK(again.source() == a.source());
        CHECK(again.blocks().size() == 2);
    }
    SECTION("a policies snapshot holds only authorizer code") {
        auto r = Authorizer::fromSnapshot(policies);
        CHECK(r.source() == a.source());
        CHECK(r.blocks().empty());
        CHECK_FALSE(r.time());
        r.addToken(t);
        CHECK(r.authorize().ok());
    }
    SECTION("corrupt snapshots") {
        auto bad = snap;
        bad.pop_back();
        CHECK_THROWS_AS(Authorizer::fromSnapshot(bad), error);
        CHECK_THROWS_AS(Authorizer::fromSnapshot(t.toBytes()), error);
    }
}
