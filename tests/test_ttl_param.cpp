/*
 * test_ttl_param.cpp -- TTL and datalog parameter arguments
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
using namespace std::chrono;

static errc kindOf(auto&& f) {
    try {
        f();
    } catch (const error& e) {
        return e.kind();
    }
    FAIL("no bctl::error thrown");
    return errc::usage;
}

TEST_CASE("durations", "[ttl]") {
    CHECK(parseDuration("15m") == minutes(15));
    CHECK(parseDuration("1d") == hours(24));
    CHECK(parseDuration("1h 30m") == minutes(90));
    CHECK(parseDuration("2weeks") == hours(24 * 14));
    CHECK(parseDuration("500ms") == milliseconds(500));
    CHECK_FALSE(parseDuration(""));
    CHECK_FALSE(parseDuration("m"));
    CHECK_FALSE(parseDuration("10"));
    CHECK_FALSE(parseDuration("3 fortnights"));
    CHECK_FALSE(parseDuration("99999999999999999999d"));
}

TEST_CASE("TTL arguments", "[ttl]") {
    auto now = sys_seconds{seconds{1'700'000'000}} + milliseconds(750);

    SECTION("an RFC3339 date is absolute") {
        auto t = Ttl::parse("2025-04-01T00:00:00Z");
        CHECK_FALSE(t.isDuration());
        CHECK(toEpoch(t.expiration(now)) == 1'743'465'600u);
        CHECK(t.expiration(now) == t.expiration(now + hours(5)));
    }
    SECTION("a duration is relative to now, rounded down to the second") {
        auto t = Ttl::parse("1d");
        CHECK(t.isDuration());
        CHECK(toEpoch(t.expiration(now)) == 1'700'000'000u + 86'400u);
        CHECK(toEpoch(Ttl::parse("15m").expiration(now)) == 1'700'000'000u + 900u);
    }
    SECTION("sub-second parts carry into the seconds") {
        CHECK(toEpoch(Ttl::parse("500ms").expiration(now)) == 1'700'000'001u);
        CHECK(toEpoch(Ttl::parse("1s 200ms").expiration(now)) == 1'700'000'001u);
    }
    SECTION("durations of centuries stay in the future") {
        auto t = Ttl::parse("100000d", now);
        CHECK(toEpoch(t.expiration(now)) == 1'700'000'000u + 8'640'000'000u);
        auto longest = Ttl::parse("106000d", now);
        CHECK(longest.expiration(now) > floor<seconds>(now));
        CHECK(toEpoch(longest.expiration(now)) == 1'700'000'000u + 9'158'400'000u);
    }
    SECTION("anything else is a parse error") {
        CHECK(kindOf([] { Ttl::parse("tomorrow"); }) == errc::parse);
        CHECK(kindOf([] { Ttl::parse("2025-13-01T00:00:00Z"); }) == errc::parse);
    }
    SECTION("expiration check") {
        CHECK(expirationCheck(fromEpoch(1'743'465'600)) == "check if time($time), $time <= 2025-04-01T00:00:00Z;");
    }
}

TEST_CASE("params", "[param]") {
    using datalog::Term;
    auto term = [](const Param& p) { return std::get<Term>(p.value); };

    SECTION("typed values") {
        auto s = parseParam("user=alice");
        CHECK(s.name == "user");
        CHECK(term(s) == Term::string("alice"));
        CHECK(term(parseParam("n:string=a=b")) == Term::string("a=b"));
        CHECK(term(parseParam("n:integer=-42")) == Term::integer(-42));
        CHECK(term(parseParam("d:date=2025-04-01T00:00:00Z")) == Term::date(1'743'465'600));
        CHECK(term(parseParam("b:bytes=hex:00ff")) == Term::byteString({0x00, 0xff}));
        CHECK(term(parseParam("ok:bool=true")) == Term::boolean(true));
        CHECK(term(parseParam("ok:bool=false")) == Term::boolean(false));
    }
    SECTION("public keys") {
        auto pk = PrivateKey::generate(Algorithm::Ed25519).publicKey();
        auto p = parseParam("k:pubkey=" + pk.toString());
        REQUIRE(std::holds_alternative<PublicKey>(p.value));
        CHECK(std::get<PublicKey>(p.value) == pk);
        CHECK(kindOf([] { parseParam("k:pubkey=00112233"); }) == errc::parse);
    }
    SECTION("malformed params") {
        CHECK(kindOf([] { parseParam("novalue"); }) == errc::parse);
        CHECK(kindOf([] { parseParam("=x"); }) == errc::parse);
        CHECK(kindOf([] { parseParam("a-b=x"); }) == errc::parse);
        CHECK(kindOf([] { parseParam("n:integer=4x"); }) == errc::parse);
        CHECK(kindOf([] { parseParam("b:bytes=00ff"); }) == errc::parse);
        CHECK(kindOf([] { parseParam("b:bool=yes"); }) == errc::parse);
        CHECK(kindOf([] { parseParam("x:float=1.5"); }) == errc::parse);
    }
    SECTION("the last value for a name wins") {
        auto m = paramMap({parseParam("a=1"), parseParam("b:integer=2"), parseParam("a=3")});
        REQUIRE(m.size() == 2);
        CHECK(std::get<Term>(m.at("a")) == Term::string("3"));
        CHECK(std::get<Term>(m.at("b")) == Term::integer(2));
    }
}
