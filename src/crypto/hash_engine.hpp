/**
 * Hash Engine
 *
 * SHA-256 front end used by every operation. One engine per backend; the
 * kind picks the implementation strategy, never the result.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace conhal {
namespace crypto {

enum class HashEngineKind : uint8_t {
    Reference,   // Scalar SHA256 class
    Lanes4,      // 4-lane multi-buffer
    Lanes8,      // 8-lane multi-buffer
    Lanes16,     // 16-lane multi-buffer
    Hardware     // OpenSSL EVP (SHA-NI / ARMv8-CE / Zknh when the CPU has them)
};

const char* to_string(HashEngineKind kind);

class HashEngine {
public:
    /**
     * Hardware engines run a known-answer self-test here and throw
     * BackendUnavailable if OpenSSL produces a wrong digest.
     */
    explicit HashEngine(HashEngineKind kind = HashEngineKind::Reference);

    HashEngineKind kind() const { return kind_; }

    Hash256 sha256(ByteView data) const;

    // SHA256(SHA256(data))
    Hash256 hash256(ByteView data) const;

    // BIP-340 tagged hash: SHA256(SHA256(tag) || SHA256(tag) || msg)
    Hash256 tagged_hash(std::string_view tag, ByteView msg) const;

    // Batched forms; lane engines hash the whole batch in parallel lanes
    void sha256_batch(const ByteView* msgs, size_t count, Hash256* out) const;
    void hash256_batch(const ByteView* msgs, size_t count, Hash256* out) const;

private:
    HashEngineKind kind_;
};

/**
 * Bitcoin merkle root over 32-byte leaves. An odd trailing node is paired
 * with itself. `leaves` must be non-empty.
 */
Hash256 merkle_root(const HashEngine& engine, std::vector<Hash256> leaves);

}  // namespace crypto
}  // namespace conhal
