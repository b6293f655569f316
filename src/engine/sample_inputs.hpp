/**
 * Representative inputs
 *
 * One realistic, valid input per operation: a BIP-340 signature, a
 * key-path-style tapscript spend, a transaction-sized preimage, a block's
 * worth of merkle leaves and a four-signature batch. Used by the benchmark,
 * the path self-test and as seeds for the fuzzer.
 */

#pragma once

#include "../core/types.hpp"
#include "operation.hpp"

#include <array>

namespace conhal {

// Secret key behind every sample signature (BIP-340 test vector 1)
extern const std::array<uint8_t, 32> SAMPLE_SECKEY;

Bytes sample_input(Operation op);

}  // namespace conhal
