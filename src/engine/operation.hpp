/**
 * conhal Operations
 *
 * The closed set of consensus primitives the engine accelerates, and the
 * value every ExecutionPath returns. Dispatch over Operation is always an
 * exhaustive switch without a default, compiled with -Werror=switch.
 */

#pragma once

#include "../core/types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace conhal {

enum class Operation : uint8_t {
    SignatureVerification,  // BIP-340 Schnorr
    ScriptExecution,        // Tapscript evaluation
    DoubleSha256,           // hash256
    MerkleRoot,             // Bitcoin merkle root
    BatchVerification       // many BIP-340 checks, one verdict each
};

inline constexpr std::array<Operation, 5> ALL_OPERATIONS = {
    Operation::SignatureVerification,
    Operation::ScriptExecution,
    Operation::DoubleSha256,
    Operation::MerkleRoot,
    Operation::BatchVerification,
};

inline const char* to_string(Operation op) {
    switch (op) {
        case Operation::SignatureVerification: return "SignatureVerification";
        case Operation::ScriptExecution:       return "ScriptExecution";
        case Operation::DoubleSha256:          return "DoubleSha256";
        case Operation::MerkleRoot:            return "MerkleRoot";
        case Operation::BatchVerification:     return "BatchVerification";
    }
    return "?";
}

inline std::optional<Operation> parse_operation(std::string_view name) {
    for (Operation op : ALL_OPERATIONS) {
        if (name == to_string(op)) return op;
    }
    return std::nullopt;
}

enum class Verdict : uint8_t {
    Valid,
    Invalid,
    Malformed   // input does not decode for this operation
};

inline const char* to_string(Verdict v) {
    switch (v) {
        case Verdict::Valid:     return "Valid";
        case Verdict::Invalid:   return "Invalid";
        case Verdict::Malformed: return "Malformed";
    }
    return "?";
}

/**
 * Result of one execute() call. Two outputs are equal only if both the
 * verdict and every data byte match.
 */
struct ExecutionOutput {
    Verdict verdict = Verdict::Malformed;
    Bytes data;

    bool operator==(const ExecutionOutput& o) const {
        return verdict == o.verdict && data == o.data;
    }
    bool operator!=(const ExecutionOutput& o) const { return !(*this == o); }

    std::string to_string() const {
        return std::string(conhal::to_string(verdict)) + (data.empty() ? "" : ":" + to_hex(as_view(data)));
    }
};

}  // namespace conhal
