/**
 * Equivalence Corpus Builder
 *
 * Inputs the harness runs through every backend:
 *
 *   boundary     hand-picked edges: wrong lengths, x >= p, r = p, s = n,
 *                off-curve keys, empty and truncated scripts, odd merkle
 *                widths, ragged batches, empty input
 *   synthesized  valid BIP-340 signatures, script spends and signature
 *                batches built with the in-tree signer, plus single-bit
 *                corruptions of each
 *   fuzzed       seeded mutations (bit flips, truncation, extension, splices)
 *                of the boundary and synthesized items
 *
 * The same seed always yields the same corpus.
 */

#pragma once

#include "../core/types.hpp"
#include "../engine/operation.hpp"

#include <cstdint>
#include <vector>

namespace conhal {
namespace verify {

struct Corpus {
    Operation operation = Operation::SignatureVerification;
    std::vector<Bytes> inputs;
};

class CorpusBuilder {
public:
    explicit CorpusBuilder(uint64_t seed = 0x5eed) : seed_(seed) {}

    std::vector<Bytes> boundary(Operation op) const;
    std::vector<Bytes> synthesized(Operation op, size_t count) const;
    std::vector<Bytes> fuzzed(Operation op, const std::vector<Bytes>& seeds, size_t count) const;

    /**
     * boundary + synthesized + `fuzz_iterations` mutations of both.
     */
    Corpus build(Operation op, size_t fuzz_iterations) const;

    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
};

}  // namespace verify
}  // namespace conhal
