#ifndef BCTL_TOKEN_BISCUIT_HPP
#define BCTL_TOKEN_BISCUIT_HPP
#pragma once
/*
 * Signed, append-only chains of datalog blocks
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
 * Token layout:
 *   1 (Token) > [2 (RootKeyId)] 3 (SignedBlock)... (14 (ProofSecret) | 15 (ProofSignature))
 *   3 (SignedBlock) > 4 (Payload) 8 (NextKey) 11 (Signature) [12 (ExternalSignature) 13 (ExternalKey)]
 *
 * Block 0 is signed by the root key. Every block names the public half of a
 * fresh ed25519 "next key" whose private half signs the following block. The
 * private half of the last next key travels in ProofSecret so anyone holding
 * the token can append a block. Sealing replaces it with a signature by that
 * key over the last block, after which nothing can be appended.
 *
 * Each block signature covers payload || next key (algorithm byte, key
 * bytes) || external signature (third-party blocks only). A third-party
 * block's external signature covers payload || signature of the previous block.
 */

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../crypto/keys.hpp"
#include "../datalog/engine.hpp"
#include "../log.hpp"
#include "block.hpp"
#include "tlv_encoder.hpp"
#include "tlv_parser.hpp"

namespace bctl {

struct ExternalSig {
    bytes signature_;
    PublicKey key_;
};

struct SignedBlock {
    bytes payload_;         // the complete Payload tlv
    PublicKey nextKey_;
    bytes signature_;
    std::optional<ExternalSig> external_{};

    bytes signedData() const {
        bytes d(payload_.begin(), payload_.end());
        d.push_back(uint8_t(nextKey_.algorithm()));
        d.insert(d.end(), nextKey_.toBytes().begin(), nextKey_.toBytes().end());
        if (external_) d.insert(d.end(), external_->signature_.begin(), external_->signature_.end());
        return d;
    }
};

// what an external signer signs: the block's payload and the signature it will follow
static inline bytes externalSignedData(byteSpan payload, byteSpan previousSig) {
    bytes d(payload.begin(), payload.end());
    d.insert(d.end(), previousSig.begin(), previousSig.end());
    return d;
}

class ThirdPartyRequest;
class ThirdPartyBlock;

class Token {
    std::optional<uint32_t> rootKeyId_{};
    std::vector<SignedBlock> blocks_{};
    std::vector<Block> decoded_{};
    std::variant<PrivateKey, bytes> proof_{};   // next secret or (sealed) final signature

    Token() = default;

    // sign a new block with the current next secret and make a fresh next key
    static SignedBlock signBlock(const PrivateKey& signer, bytes payload, std::optional<ExternalSig> ext,
                                 PrivateKey& nextSecret) {
        nextSecret = PrivateKey::generate(Algorithm::Ed25519);
        SignedBlock sb{std::move(payload), nextSecret.publicKey(), {}, std::move(ext)};
        sb.signature_ = signer.sign(sb.signedData());
        return sb;
    }

    const PrivateKey& nextSecret() const {
        if (sealed()) fail(errc::delegate, "token is sealed");
        return std::get<PrivateKey>(proof_);
    }

    Token appendSigned(bytes payload, std::optional<ExternalSig> ext) const {
        const auto& signer = nextSecret();
        auto which = format("block {}", blocks_.size());
        auto blk = Block::fromPayload(payload, which);
        Token t{*this};
        PrivateKey next{};
        t.blocks_.emplace_back(signBlock(signer, std::move(payload), std::move(ext), next));
        t.decoded_.emplace_back(std::move(blk));
        t.proof_ = std::move(next);
        bctl::log(L_DEBUG)("appended {}", which);
        return t;
    }

    // checks of everything except block 0's signature
    void verifyInternal() const {
        for (size_t i = 1; i < blocks_.size(); ++i) {
            const auto& b = blocks_[i];
            if (! blocks_[i-1].nextKey_.verify(b.signedData(), b.signature_))
                fail(errc::delegate, "invalid signature on block {}", i);
            if (b.external_ &&
                ! b.external_->key_.verify(externalSignedData(b.payload_, blocks_[i-1].signature_), b.external_->signature_))
                fail(errc::delegate, "invalid third-party signature on block {}", i);
        }
        if (blocks_.front().external_) fail(errc::malformedToken, "the authority block can't be a third-party block");
        const auto& last = blocks_.back();
        if (auto sk = std::get_if<PrivateKey>(&proof_); sk) {
            if (! (sk->publicKey() == last.nextKey_)) fail(errc::delegate, "token proof doesn't match its last block");
        } else if (! last.nextKey_.verify(sealData(), std::get<bytes>(proof_))) {
            fail(errc::delegate, "invalid seal signature");
        }
    }

    bytes sealData() const {
        auto d = blocks_.back().signedData();
        d.insert(d.end(), blocks_.back().signature_.begin(), blocks_.back().signature_.end());
        return d;
    }

  public:
    /*
     * Make a token whose authority block is 'authority' signed by 'root'.
     */
    static Token build(const PrivateKey& root, const BlockBuilder& authority, std::optional<uint32_t> rootKeyId = {}) {
        Token t{};
        t.rootKeyId_ = rootKeyId;
        auto payload = authority.payload();
        t.decoded_.emplace_back(Block::fromPayload(payload, "authority block"));
        PrivateKey next{};
        t.blocks_.emplace_back(signBlock(root, std::move(payload), std::nullopt, next));
        t.proof_ = std::move(next);
        return t;
    }

    Token append(const BlockBuilder& bb) const { return appendSigned(bb.payload(), std::nullopt); }

    Token appendThirdParty(const ThirdPartyBlock& tpb) const;
    ThirdPartyRequest thirdPartyRequest() const;

    Token seal() const {
        if (sealed()) fail(errc::delegate, "token is already sealed");
        Token t{*this};
        t.proof_ = std::get<PrivateKey>(proof_).sign(sealData());
        return t;
    }

    bool sealed() const noexcept { return std::holds_alternative<bytes>(proof_); }

    // throws a delegate error unless block 0 was signed by 'root'
    void verify(const PublicKey& root) const {
        const auto& b = blocks_.front();
        if (! root.verify(b.signedData(), b.signature_))
            fail(errc::delegate, "authority block signature doesn't verify with public key {}", root.toString());
    }

    size_t blockCount() const noexcept { return blocks_.size(); }
    const Block& block(size_t i) const { return decoded_.at(i); }
    const SignedBlock& signedBlock(size_t i) const { return blocks_.at(i); }
    std::optional<uint32_t> rootKeyId() const noexcept { return rootKeyId_; }

    std::optional<PublicKey> externalKey(size_t i) const {
        const auto& b = blocks_.at(i);
        if (! b.external_) return std::nullopt;
        return b.external_->key_;
    }

    std::string revocationId(size_t i) const { return toHex(blocks_.at(i).signature_); }

    // the blocks' code for evaluation
    std::vector<datalog::CodeBlock> codeBlocks() const {
        std::vector<datalog::CodeBlock> cb{};
        for (size_t i = 0; i < blocks_.size(); ++i) cb.push_back({decoded_[i].code_, externalKey(i)});
        return cb;
    }

    bytes toBytes() const {
        tlvEncoder c{};
        if (rootKeyId_) c.addNumber(tlv::RootKeyId, *rootKeyId_);
        for (const auto& b : blocks_) {
            tlvEncoder s{};
            s.m_blk.insert(s.m_blk.end(), b.payload_.begin(), b.payload_.end());
            s.addKey(tlv::NextKey, b.nextKey_);
            s.addBytes(tlv::Signature, b.signature_);
            if (b.external_) {
                s.addBytes(tlv::ExternalSignature, b.external_->signature_);
                s.addKey(tlv::ExternalKey, b.external_->key_);
            }
            c.addNested(tlv::SignedBlock, s);
        }
        if (sealed()) c.addBytes(tlv::ProofSignature, std::get<bytes>(proof_));
        else c.addBytes(tlv::ProofSecret, std::get<PrivateKey>(proof_).toBytes());
        tlvEncoder t{};
        t.addNested(tlv::Token, c);
        return t.m_blk;
    }

    std::string toBase64() const { return bctl::toBase64(toBytes()); }

    // decode a token and check its internal signatures (not the root signature)
    static Token fromBytes(byteSpan buf) {
        auto p = tlvParser::outer(buf, tlv::Token);
        Token t{};
        if (p.peek(tlv::RootKeyId)) {
            auto id = p.nextBlk(tlv::RootKeyId).toNumber();
            if (id > 0xffffffffu) fail(errc::malformedToken, "root key id out of range");
            t.rootKeyId_ = uint32_t(id);
        }
        while (p.peek(tlv::SignedBlock)) {
            auto s = p.nextBlk(tlv::SignedBlock);
            SignedBlock sb{};
            auto which = t.blocks_.empty()? std::string("authority block") : format("block {}", t.blocks_.size());
            sb.payload_ = [&] { auto pl = s.nextBlk(tlv::Payload).asSpan(); return bytes(pl.begin(), pl.end()); }();
            t.decoded_.emplace_back(Block::fromPayload(sb.payload_, which));
            sb.nextKey_ = s.nextBlk(tlv::NextKey).toKey();
            sb.signature_ = s.nextBlk(tlv::Signature).toVector();
            if (s.peek(tlv::ExternalSignature)) {
                auto sig = s.nextBlk(tlv::ExternalSignature).toVector();
                sb.external_ = ExternalSig{std::move(sig), s.nextBlk(tlv::ExternalKey).toKey()};
            }
            if (! s.eof()) fail(errc::malformedToken, "{} has unexpected trailing data", which);
            t.blocks_.emplace_back(std::move(sb));
        }
        if (t.blocks_.empty()) fail(errc::malformedToken, "token has no blocks");
        if (p.peek(tlv::ProofSecret)) {
            try {
                t.proof_ = PrivateKey::fromBytes(p.nextBlk(tlv::ProofSecret).toVector(), Algorithm::Ed25519);
            } catch (const error& e) {
                fail(errc::malformedToken, "invalid token proof: {}", e.what());
            }
        } else {
            t.proof_ = p.nextBlk(tlv::ProofSignature).toVector();
        }
        if (! p.eof()) fail(errc::malformedToken, "token has unexpected trailing data");
        t.verifyInternal();
        return t;
    }

    static Token fromBase64(std::string_view s) {
        auto b = bctl::fromBase64(s);
        if (! b) fail(errc::malformedToken, "token is not valid base64");
        return fromBytes(*b);
    }
};

/*
 * A request for a third-party block: the signature of the token's last block,
 * which the third party's signature will be bound to.
 */
class ThirdPartyRequest {
    bytes previousSig_;

  public:
    explicit ThirdPartyRequest(bytes prev) : previousSig_{std::move(prev)} { }

    const bytes& previousSignature() const noexcept { return previousSig_; }

    ThirdPartyBlock createBlock(const PrivateKey& key, const BlockBuilder& bb) const;

    bytes serialize() const {
        tlvEncoder c{};
        c.addBytes(tlv::PreviousSignature, previousSig_);
        tlvEncoder r{};
        r.addNested(tlv::Request, c);
        return r.m_blk;
    }

    std::string serializeBase64() const { return toBase64(serialize()); }

    static ThirdPartyRequest fromBytes(byteSpan buf) {
        auto p = tlvParser::outer(buf, tlv::Request);
        auto sig = p.nextBlk(tlv::PreviousSignature).toVector();
        if (! p.eof()) fail(errc::malformedToken, "third-party request has unexpected trailing data");
        return ThirdPartyRequest(std::move(sig));
    }
};

// A block signed by an external key, ready to be appended to the token it was requested for.
class ThirdPartyBlock {
    bytes payload_;
    ExternalSig sig_;

  public:
    ThirdPartyBlock(bytes payload, ExternalSig sig) : payload_{std::move(payload)}, sig_{std::move(sig)} { }

    const bytes& payload() const noexcept { return payload_; }
    const ExternalSig& externalSig() const noexcept { return sig_; }

    bytes serialize() const {
        tlvEncoder c{};
        c.m_blk.insert(c.m_blk.end(), payload_.begin(), payload_.end());
        c.addBytes(tlv::ExternalSignature, sig_.signature_);
        c.addKey(tlv::ExternalKey, sig_.key_);
        tlvEncoder b{};
        b.addNested(tlv::ThirdPartyBlock, c);
        return b.m_blk;
    }

    std::string serializeBase64() const { return toBase64(serialize()); }

    static ThirdPartyBlock fromBytes(byteSpan buf) {
        auto p = tlvParser::outer(buf, tlv::ThirdPartyBlock);
        auto pl = p.nextBlk(tlv::Payload).asSpan();
        bytes payload(pl.begin(), pl.end());
        Block::fromPayload(payload, "third-party block");   // validates the contents
        auto sig = p.nextBlk(tlv::ExternalSignature).toVector();
        auto key = p.nextBlk(tlv::ExternalKey).toKey();
        if (! p.eof()) fail(errc::malformedToken, "third-party block has unexpected trailing data");
        return ThirdPartyBlock(std::move(payload), ExternalSig{std::move(sig), std::move(key)});
    }
};

inline ThirdPartyBlock ThirdPartyRequest::createBlock(const PrivateKey& key, const BlockBuilder& bb) const {
    auto payload = bb.payload();
    auto sig = key.sign(externalSignedData(payload, previousSig_));
    return ThirdPartyBlock(std::move(payload), ExternalSig{std::move(sig), key.publicKey()});
}

inline ThirdPartyRequest Token::thirdPartyRequest() const {
    if (sealed()) fail(errc::delegate, "token is sealed");
    return ThirdPartyRequest(blocks_.back().signature_);
}

inline Token Token::appendThirdParty(const ThirdPartyBlock& tpb) const {
    if (sealed()) fail(errc::delegate, "token is sealed");
    const auto& ext = tpb.externalSig();
    if (! ext.key_.verify(externalSignedData(tpb.payload(), blocks_.back().signature_), ext.signature_))
        fail(errc::delegate, "third-party block signature doesn't match this token (was it requested for another token?)");
    return appendSigned(tpb.payload(), ext);
}

} // namespace bctl

#endif // BCTL_TOKEN_BISCUIT_HPP
