#ifndef BCTL_TOKEN_TLV_HPP
#define BCTL_TOKEN_TLV_HPP
#pragma once
/*
 * TLV types of bctl tokens, third-party exchanges and snapshots
 *
 * Copyright (C) 2020-5 Pollere LLC
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
 *  You may contact Pollere LLC at info@pollere.net.
 */
#include <cstdint>

namespace bctl {

enum class tlv : uint8_t {
    // a token contains an optional RootKeyId, one or more SignedBlocks then
    // exactly one of ProofSecret or ProofSignature:
    //   1 (Token) > [2 (RootKeyId)] 3 (SignedBlock)... 14|15 (Proof)
    Token = 1,
        RootKeyId = 2,
        SignedBlock = 3,
            // a SignedBlock is 4 (Payload) 8 (NextKey) 11 (Signature)
            // followed, for third-party blocks, by 12 (ExternalSignature) 13 (ExternalKey)
            Payload = 4,
                Version = 5,
                Context = 6,
                Source = 7,
            NextKey = 8,
                // a key is 9 (KeyAlgorithm) 10 (KeyBytes)
                KeyAlgorithm = 9,
                KeyBytes = 10,
            Signature = 11,
            ExternalSignature = 12,
            ExternalKey = 13,
        ProofSecret = 14,
        ProofSignature = 15,

    // third-party exchange
    Request = 16,
        PreviousSignature = 17,
    ThirdPartyBlock = 18,       // 4 (Payload) 12 (ExternalSignature) 13 (ExternalKey)

    // authorizer and policies snapshots
    Snapshot = 19,
    PoliciesSnapshot = 20,
        MaxFacts = 21,
        MaxIterations = 22,
        MaxTime = 23,           // microseconds
        Iterations = 24,
        Elapsed = 25,           // microseconds
        AuthorizerSource = 26,
        Time = 27,              // seconds since the epoch of the included time() fact
        SnapshotBlock = 28      // 6 (Context) 7 (Source) [13 (ExternalKey)]
};

// wire format version of block payloads
static constexpr uint64_t blockVersion = 1;

} // namespace bctl

#endif // BCTL_TOKEN_TLV_HPP
