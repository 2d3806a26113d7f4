/*
 * test_commands.cpp -- the bctl subcommands run end to end
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

#include <nlohmann/json.hpp>

using namespace bctl;
using test::runCmd;
using test::TempFile;

// run a command that must fail with 'kind' and return its message
static std::string cmdError(std::vector<std::string> args, errc kind, std::string in = {}, Editor* ed = nullptr) {
    try {
        runCmd(std::move(args), std::move(in), ed);
    } catch (const error& e) {
        CHECK(e.kind() == kind);
        return e.what();
    }
    FAIL("command succeeded");
    return {};
}

static std::string rawString(byteSpan b) { return std::string(asSv(b)); }

TEST_CASE("keypair", "[commands][keypair]") {
    SECTION("a new pair") {
        auto out = runCmd({"keypair"});
        CHECK_THAT(out, Catch::StartsWith("Generating a new random keypair\nPrivate key: ed25519-private/"));
        CHECK_THAT(out, Catch::Contains("\nPublic key: ed25519/"));
    }
    SECTION("a single raw private key") {
        auto out = runCmd({"keypair", "--only-private-key", "--key-output-format", "raw"});
        CHECK(out.size() == 32);
        auto sk = PrivateKey::fromBytes(asBytes(out), Algorithm::Ed25519);
        CHECK(sk.publicKey().toBytes().size() == 32);
    }
    SECTION("derived from a private key") {
        auto sk = PrivateKey::generate(Algorithm::Secp256r1);
        CHECK(runCmd({"keypair", "--from-private-key", sk.toPrefixedString(), "--only-public-key"})
              == sk.publicKey().toString() + "\n");
        auto out = runCmd({"keypair", "--from-private-key", sk.toPrefixedString()});
        CHECK_THAT(out, Catch::StartsWith("Generating a keypair from the provided private key\n"));
        CHECK_THAT(out, Catch::Contains(sk.publicKey().toString()));
    }
    SECTION("raw key material from stdin") {
        auto sk = PrivateKey::generate(Algorithm::Secp256r1);
        auto out = runCmd({"keypair", "--from-file", "-", "--from-format", "raw", "--from-algorithm", "secp256r1",
                           "--only-public-key", "--key-output-format", "pem"},
                          rawString(sk.toBytes()));
        CHECK(PublicKey::fromPem(out) == sk.publicKey());
    }
    SECTION("pem output of both keys") {
        auto sk = PrivateKey::generate(Algorithm::Ed25519);
        TempFile f{sk.toPem()};
        auto out = runCmd({"keypair", "--from-file", f.path(), "--from-format", "pem", "--key-output-format", "pem"});
        CHECK_THAT(out, Catch::StartsWith("Generating a keypair for the provided private key\n"));
        CHECK_THAT(out, Catch::Contains(sk.publicKey().toPem()));
    }
    SECTION("usage errors") {
        CHECK(cmdError({"keypair", "--key-output-format", "raw"}, errc::usage)
              == "Only a single key can be returned in a binary format");
        cmdError({"keypair", "--only-public-key", "--only-private-key"}, errc::usage);
        cmdError({"keypair", "--key-algorithm", "secp256r1", "--from-private-key", "00"}, errc::usage);
        cmdError({"keypair", "--from-algorithm", "ed25519"}, errc::usage);
        cmdError({"keypair", "--from-format", "pem"}, errc::usage);
        cmdError({"keypair", "--key-output-format", "der"}, errc::usage);
        cmdError({"keypair", "--from-private-key", "00", "--from-format", "raw"}, errc::usage);
        cmdError({"keypair", "--bogus"}, errc::usage);
        cmdError({"keypair", "extra"}, errc::usage);
    }
    SECTION("bad key material") {
        cmdError({"keypair", "--from-private-key", "ed25519-private/abcd"}, errc::malformedKey);
    }
}

TEST_CASE("generate", "[commands][token]") {
    auto root = PrivateKey::generate(Algorithm::Ed25519);
    TempFile authority{"user({id});\nright(\"file1\", \"read\");\n"};

    SECTION("from a file with params, context and root key id") {
        auto out = runCmd({"generate", "--private-key", root.toPrefixedString(), "--param", "id:integer=12",
                           "--context", "demo", "--root-key-id", "3", authority.path()});
        auto t = Token::fromBase64(out);
        CHECK_NOTHROW(t.verify(root.publicKey()));
        CHECK(t.rootKeyId() == 3u);
        CHECK(t.block(0).context_ == "demo");
        CHECK(t.block(0).source_ == "user(12);\nright(\"file1\", \"read\");\n");
    }
    SECTION("raw output and a key from stdin") {
        auto out = runCmd({"generate", "--private-key-file", "-", "--param", "id=x", "--raw", authority.path()},
                          root.toPrefixedString() + "\n");
        auto t = Token::fromBytes(asBytes(out));
        CHECK_NOTHROW(t.verify(root.publicKey()));
    }
    SECTION("a PEM key file") {
        TempFile key{root.toPem()};
        auto out = runCmd({"generate", "--private-key-file", key.path(), "--private-key-format", "pem",
                           "--param", "id=x", authority.path()});
        CHECK_NOTHROW(Token::fromBase64(out).verify(root.publicKey()));
    }
    SECTION("the authority block from the editor") {
        test::FakeEditor ed{"admin(true);"};
        auto out = runCmd({"generate", "--private-key", root.toPrefixedString()}, {}, &ed);
        CHECK(ed.calls_ == 1);
        CHECK(Token::fromBase64(out).block(0).source_ == "admin(true);\n");
    }
    SECTION("a TTL adds an expiration check") {
        auto out = runCmd({"generate", "--private-key", root.toPrefixedString(), "--param", "id=x",
                           "--add-ttl", "2030-01-01T00:00:00Z", authority.path()});
        CHECK_THAT(Token::fromBase64(out).block(0).source_,
                   Catch::Contains("check if time($time), $time <= 2030-01-01T00:00:00Z;"));
    }
    SECTION("errors are found before the key is used") {
        // the key would be read from stdin; it's never consumed
        CHECK_THAT(cmdError({"generate", "--private-key-file", "-", "--add-ttl", "soon", authority.path()}, errc::parse),
                   Catch::Contains("invalid TTL"));
        cmdError({"generate", "--private-key-file", "-", authority.path()}, errc::parse, "junk");
        cmdError({"generate", "--private-key-file", "-", "-"}, errc::multipleStdin);
    }
    SECTION("usage errors") {
        cmdError({"generate", authority.path()}, errc::usage);
        cmdError({"generate", "--private-key", "k", "--private-key-file", "f", authority.path()}, errc::usage);
        cmdError({"generate", "--private-key", "k", "--private-key-algorithm", "ed25519", authority.path()}, errc::usage);
        cmdError({"generate", "--private-key", root.toPrefixedString(), "--root-key-id", "-1", authority.path()},
                 errc::usage);
        cmdError({"generate", "--private-key", root.toPrefixedString(), "a", "b"}, errc::usage);
    }
    SECTION("bad input") {
        cmdError({"generate", "--private-key", root.toPrefixedString(), "/nonexistent/authority"}, errc::io);
        TempFile policy{"allow if true;"};
        cmdError({"generate", "--private-key", root.toPrefixedString(), policy.path()}, errc::parse);
        TempFile binary{"a(\"\xfe\");"};
        cmdError({"generate", "--private-key", root.toPrefixedString(), binary.path()}, errc::invalidText);
    }
}

TEST_CASE("attenuate and seal", "[commands][token]") {
    auto root = PrivateKey::generate(Algorithm::Ed25519);
    auto tok = test::makeToken(root, R"(right("file1", "read");)");

    SECTION("a block from the command line") {
        auto out = runCmd({"attenuate", "--block", "check if op(\"read\");", "--context", "narrow", "-"}, tok);
        auto t = Token::fromBase64(out);
        REQUIRE(t.blockCount() == 2);
        CHECK(t.block(1).context_ == "narrow");
        CHECK_NOTHROW(t.verify(root.publicKey()));
    }
    SECTION("raw in and out") {
        TempFile raw{rawString(*fromBase64(tok))};
        TempFile block{"check if op({op});"};
        auto out = runCmd({"attenuate", "--raw-input", "--raw-output", "--block-file", block.path(), "--param", "op=read",
                           raw.path()});
        auto t = Token::fromBytes(asBytes(out));
        CHECK(t.block(1).source_ == "check if op(\"read\");\n");
    }
    SECTION("the block from the editor") {
        test::FakeEditor ed{"check if true;"};
        TempFile t{tok};
        Token::fromBase64(runCmd({"attenuate", t.path()}, {}, &ed));
        CHECK(ed.calls_ == 1);
    }
    SECTION("token and block can't both come from stdin") {
        auto msg = cmdError({"attenuate", "--block-file", "-", "-"}, errc::multipleStdin, tok);
        CHECK_THAT(msg, Catch::Contains("token"));
        CHECK_THAT(msg, Catch::Contains("block"));
    }
    SECTION("sealed tokens") {
        auto sealed = runCmd({"seal", "-"}, tok);
        CHECK(Token::fromBase64(sealed).sealed());
        test::FakeEditor ed{"check if true;"};
        TempFile f{sealed};
        CHECK(cmdError({"attenuate", f.path()}, errc::delegate, {}, &ed) == "token is sealed");
        // the block isn't asked for
        CHECK(ed.calls_ == 0);
        CHECK(cmdError({"seal", "-"}, errc::delegate, sealed) == "token is already sealed");
        cmdError({"generate-third-party-block-request", "-"}, errc::delegate, sealed);
    }
    SECTION("bad tokens") {
        cmdError({"attenuate", "--block", "a(1);", "-"}, errc::malformedToken, "####");
        cmdError({"seal", "-"}, errc::malformedToken, "AAAA");
        cmdError({"seal"}, errc::usage);
        cmdError({"attenuate", "--block", "a(1);", "--block-file", "f", "-"}, errc::usage, tok);
    }
}

TEST_CASE("third-party blocks", "[commands][third-party]") {
    auto root = PrivateKey::generate(Algorithm::Ed25519);
    auto ext = PrivateKey::generate(Algorithm::Secp256r1);
    auto tok = test::makeToken(root, R"(user("alice");)");
    TempFile tokFile{tok};

    auto req = runCmd({"generate-third-party-block-request", "-"}, tok);
    auto tpb = runCmd({"generate-third-party-block", "--private-key", ext.toPrefixedString(),
                       "--block", "group(\"admin\");", "-"}, req);
    auto out = runCmd({"append-third-party-block", "--block-contents", tpb, "-"}, tok);
    auto t = Token::fromBase64(out);
    REQUIRE(t.blockCount() == 2);
    CHECK(t.externalKey(1) == ext.publicKey());
    CHECK_NOTHROW(t.verify(root.publicKey()));

    SECTION("raw request and block") {
        TempFile rawReq{rawString(*fromBase64(req))};
        auto rawTpb = runCmd({"generate-third-party-block", "--raw-input", "--raw-output", "--private-key-file", "-",
                              "--block", "group(\"ops\");", rawReq.path()},
                             ext.toPrefixedString());
        TempFile tpbFile{rawTpb};
        auto res = runCmd({"append-third-party-block", "--block-contents-file", tpbFile.path(), "--raw-block-contents",
                           tokFile.path()});
        CHECK(Token::fromBase64(res).block(1).source_ == "group(\"ops\");\n");
    }
    SECTION("the block must answer a request from this token") {
        auto other = test::makeToken(root, R"(user("bob");)");
        cmdError({"append-third-party-block", "--block-contents", tpb, "-"}, errc::delegate, other);
    }
    SECTION("argument errors") {
        cmdError({"append-third-party-block", tokFile.path()}, errc::usage);
        cmdError({"append-third-party-block", "--raw-block-contents", "--block-contents", tpb, tokFile.path()}, errc::usage);
        cmdError({"append-third-party-block", "--block-contents-file", "-", "-"}, errc::multipleStdin, tok);
        cmdError({"generate-third-party-block", "--block", "a(1);", "-"}, errc::usage, req);
        cmdError({"generate-third-party-block", "--private-key-file", "-", "--block", "a(1);", "-"}, errc::multipleStdin);
        // a token isn't a request
        cmdError({"generate-third-party-block", "--private-key", ext.toPrefixedString(), "--block", "a(1);", "-"},
                 errc::malformedToken, tok);
    }
}

TEST_CASE("inspect", "[commands][inspect]") {
    auto root = PrivateKey::generate(Algorithm::Ed25519);
    auto pk = root.publicKey().toString();
    auto tok = runCmd({"attenuate", "--block", "check if operation(\"read\");", "--context", "ro", "-"},
                      test::makeToken(root, R"(right("file1", "read"); right("file2", "write");)"));
    TempFile tokFile{tok};
    std::string allow = R"(operation("read"); allow if right($f, "read");)";

    SECTION("blocks only") {
        auto out = runCmd({"inspect", "-"}, tok);
        CHECK_THAT(out, Catch::StartsWith("Authority block:\n== Datalog ==\n  right(\"file1\", \"read\");\n"));
        CHECK_THAT(out, Catch::Contains("Block n°1:\n== Context ==\n  ro\n== Datalog ==\n  check if operation(\"read\");\n"));
        CHECK_THAT(out, Catch::Contains("== Revocation id ==\n"));
        CHECK_THAT(out, Catch::Contains("Sealed: no\nPublic key check skipped\nAuthorization skipped\n"));
    }
    SECTION("root signature") {
        CHECK_THAT(runCmd({"inspect", "--public-key", pk, tokFile.path()}),
                   Catch::Contains(format("Public key check succeeded ({})", pk)));
        TempFile pem{root.publicKey().toPem()};
        CHECK_THAT(runCmd({"inspect", "--public-key-file", pem.path(), "--public-key-format", "pem", tokFile.path()}),
                   Catch::Contains("Public key check succeeded"));
        auto other = PrivateKey::generate(Algorithm::Ed25519).publicKey().toString();
        cmdError({"inspect", "--public-key", other, tokFile.path()}, errc::delegate);
    }
    SECTION("authorization") {
        auto out = runCmd({"inspect", "--public-key", pk, "--authorize-with", allow, tokFile.path()});
        CHECK_THAT(out, Catch::Contains("Authorization succeeded ("));
        CHECK_THAT(out, Catch::Contains("Matched allow policy #0: allow if right($f, \"read\")"));

        auto msg = cmdError({"inspect", "--authorize-with", "allow if right($f, \"read\");", tokFile.path()}, errc::delegate);
        CHECK_THAT(msg, Catch::StartsWith("authorization failed:\n"));
        CHECK_THAT(msg, Catch::Contains("block 1 check #0: check if operation(\"read\")"));

        TempFile authFile{allow};
        CHECK_THAT(runCmd({"inspect", "--verify-with-file", authFile.path(), "-"}, tok),
                   Catch::Contains("Authorization succeeded"));
        test::FakeEditor ed{allow};
        CHECK_THAT(runCmd({"inspect", "--authorize-interactive", tokFile.path()}, {}, &ed),
                   Catch::Contains("Authorization succeeded"));
        CHECK(ed.calls_ == 1);
    }
    SECTION("time and limits") {
        auto ttl = runCmd({"attenuate", "--block", "a(1);", "--add-ttl", "1h", "-"}, tok);
        cmdError({"inspect", "--authorize-with", allow, "-"}, errc::delegate, ttl);
        CHECK_THAT(runCmd({"inspect", "--authorize-with", allow, "--include-time", "-"}, ttl),
                   Catch::Contains("Authorization succeeded"));
        CHECK_THAT(cmdError({"inspect", "--authorize-with", allow, "--max-facts", "1", "-"}, errc::delegate, tok),
                   Catch::Contains("too many facts (limit 1)"));
    }
    SECTION("queries") {
        auto out = runCmd({"inspect", "--query", "data($f) <- right($f, {op})", "--param", "op=write", tokFile.path()});
        CHECK_THAT(out, Catch::Contains("Query: data($f) <- right($f, {op})\n  data(\"file2\")\n"));
        auto none = runCmd({"inspect", "--query", "c($x) <- check($x)", tokFile.path()});
        CHECK_THAT(none, Catch::Contains("  no facts matched\n"));
        cmdError({"inspect", "--query-all", tokFile.path()}, errc::usage);
        cmdError({"inspect", "--query", "not a rule", tokFile.path()}, errc::parse);
    }
    SECTION("json") {
        auto j = nlohmann::json::parse(runCmd({"inspect", "--json", "--public-key", pk, "--authorize-with", allow,
                                               "--query", "q($f) <- right($f, $o)", tokFile.path()}));
        REQUIRE(j["blocks"].size() == 2);
        CHECK(j["blocks"][1]["context"] == "ro");
        CHECK(j["blocks"][0]["context"].is_null());
        CHECK(j["sealed"] == false);
        CHECK(j["root_key_id"].is_null());
        CHECK(j["public_key_check"]["key"] == pk);
        CHECK(j["authorization"]["result"] == "success");
        CHECK(j["authorization"]["policy"]["index"] == 0);
        CHECK(j["query"]["facts"].size() == 2);
    }
    SECTION("snapshots") {
        TempFile snap{}, policies{};
        runCmd({"inspect", "--authorize-with", allow, "--dump-snapshot-to", snap.path(),
                "--dump-policies-snapshot-to", policies.path(), tokFile.path()});
        CHECK_FALSE(snap.read().empty());

        auto out = runCmd({"inspect-snapshot", snap.path()});
        CHECK_THAT(out, Catch::Contains("Authorizer:\n== Datalog ==\n  operation(\"read\");\n"));
        CHECK_THAT(out, Catch::Contains("== Recorded evaluation ==\n"));
        CHECK_THAT(out, Catch::Contains("Authorization succeeded"));

        auto j = nlohmann::json::parse(runCmd({"inspect-snapshot", "--json", "--query", "q($f) <- right($f, \"read\")", "-"},
                                              snap.read()));
        CHECK(j["blocks"].size() == 2);
        CHECK(j["limits"]["max_facts"] == 1000);
        CHECK(j["query"]["facts"].size() == 1);

        // the policies can be reused against the token
        CHECK_THAT(runCmd({"inspect", "--authorize-with-snapshot-file", policies.path(), "-"}, tok),
                   Catch::Contains("Authorization succeeded"));
        CHECK_THAT(runCmd({"inspect", "--authorize-with-snapshot", policies.read(), "-"}, tok),
                   Catch::Contains("Authorization succeeded"));
    }
    SECTION("a failed authorization still writes the snapshot") {
        TempFile snap{};
        cmdError({"inspect", "--authorize-with", "allow if false;", "--dump-snapshot-to", snap.path(),
                  "--dump-raw-snapshot", tokFile.path()}, errc::delegate);
        auto j = nlohmann::json::parse(runCmd({"inspect-snapshot", "--raw-input", "--json", snap.path()}));
        CHECK(j["authorization"]["result"] == "failure");
        CHECK(j["authorization"]["policy"].is_null());
    }
    SECTION("argument errors") {
        cmdError({"inspect", "--authorize-with", allow, "--authorize-with-file", "f", tokFile.path()}, errc::usage);
        cmdError({"inspect", "--authorize-with-raw-snapshot-file", tokFile.path()}, errc::usage);
        cmdError({"inspect", "--dump-raw-snapshot", tokFile.path()}, errc::usage);
        cmdError({"inspect", "--public-key-format", "pem", tokFile.path()}, errc::usage);
        cmdError({"inspect", "--max-time", "forever", tokFile.path()}, errc::parse);
        cmdError({"inspect", "--public-key-file", "-", "-"}, errc::multipleStdin, tok);
        cmdError({"inspect", "--authorize-with-file", "-", "-"}, errc::multipleStdin, tok);
    }
}
