/**
 * BIP-340 Schnorr Signatures
 *
 * SchnorrVerifier is parameterized by the hash engine and EC multiplier of a
 * backend; every combination accepts exactly the same signatures.
 * schnorr_sign() exists to synthesize valid signatures for test corpora.
 */

#pragma once

#include "../core/types.hpp"
#include "ec_multiplier.hpp"
#include "hash_engine.hpp"

#include <array>
#include <optional>
#include <vector>

namespace conhal {
namespace crypto {

using XOnlyPubKey = std::array<uint8_t, 32>;
using SchnorrSig = std::array<uint8_t, 64>;

struct SchnorrBatchItem {
    ByteView msg;
    ByteView pubkey;
    ByteView sig;
};

class SchnorrVerifier {
public:
    SchnorrVerifier(const HashEngine& hash, const EcMultiplier& ec)
        : hash_(hash), ec_(ec) {}

    /**
     * Verify sig over msg with the x-only key pubkey.
     * pubkey must be 32 bytes and sig 64 bytes; any other size is rejected.
     */
    bool verify(ByteView msg, ByteView pubkey, ByteView sig) const;

    /**
     * verify() on every item. The challenge hashes of the whole batch go
     * through one sha256_batch call, so lane engines fill their lanes.
     * Result i is exactly verify(items[i]).
     */
    std::vector<bool> verify_batch(const std::vector<SchnorrBatchItem>& items) const;

private:
    const HashEngine& hash_;
    const EcMultiplier& ec_;
};

/**
 * x-only public key for a 32-byte secret key. nullopt if the key is 0 or >= n.
 */
std::optional<XOnlyPubKey> xonly_pubkey(ByteView seckey);

/**
 * BIP-340 signing with auxiliary randomness aux (32 bytes).
 */
std::optional<SchnorrSig> schnorr_sign(ByteView seckey, ByteView msg, ByteView aux);

}  // namespace crypto
}  // namespace conhal
