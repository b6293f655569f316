/**
 * conhal Execution Paths
 *
 * An ExecutionPath binds one Operation to one Backend's kernels. Paths are
 * immutable once built: execute() is const, touches no shared mutable state
 * and may be called from any number of threads. Constant tables (generator
 * multiples, the hardware hash self-test) are settled in the constructor,
 * and make_path() runs the operation's sample input through the new path
 * before handing it out.
 *
 * Every backend decodes its input with the same codec, so malformed input is
 * rejected identically everywhere.
 */

#pragma once

#include "../crypto/ec_multiplier.hpp"
#include "../crypto/hash_engine.hpp"
#include "../crypto/schnorr.hpp"
#include "../script/interpreter.hpp"
#include "backend.hpp"
#include "operation.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace conhal {

class ExecutionPath {
public:
    virtual ~ExecutionPath() = default;

    virtual ExecutionOutput execute(ByteView input) const = 0;

    virtual Operation operation() const = 0;
    virtual Backend backend() const = 0;

    std::string describe() const {
        return std::string(to_string(operation())) + "@" + to_string(backend());
    }
};

using PathHandle = std::shared_ptr<const ExecutionPath>;

/**
 * The kernels one backend runs with. Member order matters: the verifier
 * refers to hash and ec, the interpreter to hash and verifier.
 */
struct BackendKernels {
    explicit BackendKernels(const BackendDescriptor& desc)
        : hash(desc.hash),
          ec(desc.ec_window),
          verifier(hash, ec),
          interpreter(hash, verifier) {}

    BackendKernels(const BackendKernels&) = delete;
    BackendKernels& operator=(const BackendKernels&) = delete;

    crypto::HashEngine hash;
    crypto::EcMultiplier ec;
    crypto::SchnorrVerifier verifier;
    script::ScriptInterpreter interpreter;
};

/**
 * Build the path for (op, backend). Throws BackendUnavailable when a kernel
 * fails its construction-time self-test, or when the sample input for `op`
 * does not come out as the scalar reference computes it.
 */
PathHandle make_path(Operation op, Backend backend);

// How the engine obtains paths; make_path unless replaced
using PathFactory = std::function<PathHandle(Operation, Backend)>;

// -----------------------------------------------------------------------------
// Input codecs
// -----------------------------------------------------------------------------

constexpr size_t SIGNATURE_INPUT_SIZE = 32 + 32 + 64;

// msg32 || xonly_pubkey32 || sig64
Bytes encode_signature_input(ByteView msg, ByteView pubkey, ByteView sig);

// Concatenated 32-byte leaves
Bytes encode_merkle_input(const std::vector<Hash256>& leaves);

/**
 * BatchVerification input: k >= 1 SignatureVerification inputs back to back.
 * The output carries one Verdict byte per item, in order, and its verdict is
 * Valid only if every item is. Items are always 128 bytes, so per-item
 * verdicts are Valid or Invalid; an input that does not split into items is
 * Malformed as a whole.
 */
Bytes encode_batch_input(const std::vector<Bytes>& signature_inputs);

// Per-item verdicts of a BatchVerification output, empty for Malformed
std::vector<Verdict> batch_verdicts(const ExecutionOutput& out);

/**
 * ScriptError carried in a ScriptExecution output, nullopt for Malformed.
 */
std::optional<script::ScriptError> script_error(const ExecutionOutput& out);

}  // namespace conhal
