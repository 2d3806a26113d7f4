/*
 * test_token.cpp -- token building, attenuation, sealing and third-party blocks
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

#include <algorithm>

using namespace bctl;

static errc kindOf(auto&& f) {
    try {
        f();
    } catch (const error& e) {
        return e.kind();
    }
    FAIL("no bctl::error thrown");
    return errc::usage;
}

static BlockBuilder block(std::string_view src, std::optional<std::string> ctx = std::nullopt) {
    BlockBuilder bb{};
    bb.addCode(src);
    if (ctx) bb.context(*ctx);
    return bb;
}

// replace the first occurrence of 'from' with the same-length 'to'
static bytes patched(bytes b, std::string_view from, std::string_view to) {
    auto it = std::search(b.begin(), b.end(), from.begin(), from.end());
    REQUIRE(it != b.end());
    std::copy(to.begin(), to.end(), it);
    return b;
}

TEST_CASE("block builder", "[token][block]") {
    BlockBuilder bb{};
    bb.addCode("user({id});", {{"id", datalog::Term::integer(4)}}).addCode("check if op(\"read\");");
    bb.context("ctx").checkExpiration(fromEpoch(1'743'465'600));
    CHECK(bb.source() == "user(4);\n"
                         "check if op(\"read\");\n"
                         "check if time($time), $time <= 2025-04-01T00:00:00Z;\n");
    auto b = Block::fromPayload(bb.payload(), "block");
    CHECK(b.context_ == "ctx");
    CHECK(b.source_ == bb.source());
    CHECK(b.code_.checks_.size() == 2);

    CHECK(kindOf([] { BlockBuilder{}.addCode("allow if true;"); }) == errc::parse);
    CHECK(kindOf([] { BlockBuilder{}.addCode("user({id});"); }) == errc::parse);
}

TEST_CASE("tokens", "[token]") {
    auto alg = GENERATE(Algorithm::Ed25519, Algorithm::Secp256r1);
    auto root = PrivateKey::generate(alg);
    auto t = Token::build(root, block("right(\"file1\", \"read\");"));
    REQUIRE(t.blockCount() == 1);
    CHECK_FALSE(t.sealed());
    CHECK_FALSE(t.rootKeyId());
    CHECK_NOTHROW(t.verify(root.publicKey()));

    SECTION("encoding keeps everything") {
        auto a = t.append(block("check if op(\"read\");", "second"));
        auto d = Token::fromBase64(a.toBase64());
        REQUIRE(d.blockCount() == 2);
        CHECK(d.block(0).source_ == "right(\"file1\", \"read\");\n");
        CHECK(d.block(1).context_ == "second");
        CHECK(d.revocationId(0) == a.revocationId(0));
        CHECK(d.revocationId(1) == a.revocationId(1));
        CHECK(d.revocationId(0) != d.revocationId(1));
        CHECK(d.toBytes() == a.toBytes());
        CHECK_NOTHROW(d.verify(root.publicKey()));
    }
    SECTION("root key ids") {
        auto k = Token::build(root, block("a(1);"), 7);
        CHECK(Token::fromBytes(k.toBytes()).rootKeyId() == 7u);
    }
    SECTION("the wrong root key") {
        auto other = PrivateKey::generate(alg).publicKey();
        CHECK(kindOf([&] { t.verify(other); }) == errc::delegate);
    }
    SECTION("attenuation doesn't change the original") {
        auto a = t.append(block("b(1);"));
        CHECK(t.blockCount() == 1);
        CHECK(a.blockCount() == 2);
        CHECK(a.append(block("c(1);")).blockCount() == 3);
    }
    SECTION("tokens and blocks larger than 64k") {
        std::string big(30'000, 'x');
        auto a = t;
        for (int i = 0; i < 3; ++i) a = a.append(block(format("blob({}, \"{}\");", i, big)));
        a = a.append(block(format("huge(\"{}{}\");", big, big + big)));
        REQUIRE(a.toBytes().size() > 180'000);
        auto d = Token::fromBytes(a.toBytes());
        REQUIRE(d.blockCount() == 5);
        CHECK(d.block(4).source_.size() > 90'000);
        CHECK(d.toBytes() == a.toBytes());
        CHECK_NOTHROW(d.verify(root.publicKey()));
    }
    SECTION("sealing") {
        auto s = t.append(block("b(1);")).seal();
        CHECK(s.sealed());
        auto d = Token::fromBytes(s.toBytes());
        CHECK(d.sealed());
        CHECK_NOTHROW(d.verify(root.publicKey()));
        CHECK(kindOf([&] { d.append(block("c(1);")); }) == errc::delegate);
        CHECK(kindOf([&] { d.thirdPartyRequest(); }) == errc::delegate);
        CHECK(kindOf([&] { d.seal(); }) == errc::delegate);
    }
}

TEST_CASE("tampering", "[token]") {
    auto root = PrivateKey::generate(Algorithm::Ed25519);
    auto t = Token::build(root, block("right(\"read\");")).append(block("check if op(\"read\");"));
    auto good = t.toBytes();

    SECTION("in the authority block") {
        auto d = Token::fromBytes(patched(good, "right(\"read\")", "right(\"rxad\")"));
        CHECK(kindOf([&] { d.verify(root.publicKey()); }) == errc::delegate);
    }
    SECTION("in a later block") {
        CHECK(kindOf([&] { Token::fromBytes(patched(good, "op(\"read\")", "op(\"rxad\")")); }) == errc::delegate);
    }
    SECTION("truncated or padded") {
        CHECK(kindOf([&] { Token::fromBytes(bytes(good.begin(), good.end() - 1)); }) == errc::malformedToken);
        auto padded = good;
        padded.push_back(0);
        CHECK(kindOf([&] { Token::fromBytes(padded); }) == errc::malformedToken);
        CHECK(kindOf([] { Token::fromBytes(bytes{}); }) == errc::malformedToken);
        CHECK(kindOf([] { Token::fromBase64("not base64!"); }) == errc::malformedToken);
    }
    SECTION("invalid datalog in a block") {
        CHECK(kindOf([&] { Token::fromBytes(patched(good, "right(", "right<")); }) == errc::malformedToken);
    }
}

TEST_CASE("third-party blocks", "[token][third-party]") {
    auto root = PrivateKey::generate(Algorithm::Ed25519);
    auto ext = PrivateKey::generate(Algorithm::Secp256r1);
    auto t = Token::build(root, block("user(1);"));

    // the request and the signed block both travel as bytes
    auto req = ThirdPartyRequest::fromBytes(t.thirdPartyRequest().serialize());
    auto tpb = ThirdPartyBlock::fromBytes(req.createBlock(ext, block("group(\"admin\");", "from idp")).serialize());
    CHECK(tpb.externalSig().key_ == ext.publicKey());

    auto a = Token::fromBytes(t.appendThirdParty(tpb).toBytes());
    REQUIRE(a.blockCount() == 2);
    CHECK_FALSE(a.externalKey(0));
    CHECK(a.externalKey(1) == ext.publicKey());
    CHECK(a.block(1).context_ == "from idp");
    auto cb = a.codeBlocks();
    REQUIRE(cb.size() == 2);
    CHECK(cb[1].externalKey_ == ext.publicKey());

    SECTION("a block requested for one token can't be appended to another") {
        auto other = Token::build(root, block("user(1);"));
        CHECK(kindOf([&] { other.appendThirdParty(tpb); }) == errc::delegate);
        // nor after the token has moved on
        CHECK(kindOf([&] { t.append(block("b(1);")).appendThirdParty(tpb); }) == errc::delegate);
    }
    SECTION("sealed tokens take no third-party blocks") {
        CHECK(kindOf([&] { t.seal().appendThirdParty(tpb); }) == errc::delegate);
    }
    SECTION("malformed request") {
        auto r = t.thirdPartyRequest().serialize();
        r.push_back(0);
        CHECK(kindOf([&] { ThirdPartyRequest::fromBytes(r); }) == errc::malformedToken);
        CHECK(kindOf([&] { ThirdPartyBlock::fromBytes(t.toBytes()); }) == errc::malformedToken);
    }
}
