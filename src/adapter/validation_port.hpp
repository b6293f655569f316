/**
 * conhal Validation Ports
 *
 * The hexagonal boundary. ConsensusDomain is implemented by the consensus
 * layer outside this library and sees nothing but ExecutionPath handles in a
 * ValidationContext; it never learns which backend is behind them.
 * ValidationPort is what the node's networking and block-connection code
 * calls into.
 */

#pragma once

#include "../core/types.hpp"
#include "../engine/execution_path.hpp"
#include "../engine/operation.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace conhal {

/**
 * One path per operation, fixed for the lifetime of the context.
 */
struct ValidationContext {
    PathHandle signature;
    PathHandle script;
    PathHandle hash;
    PathHandle merkle;
    PathHandle batch;

    const ExecutionPath& path(Operation op) const {
        switch (op) {
            case Operation::SignatureVerification: return *signature;
            case Operation::ScriptExecution:       return *script;
            case Operation::DoubleSha256:          return *hash;
            case Operation::MerkleRoot:            return *merkle;
            case Operation::BatchVerification:     return *batch;
        }
        return *signature;
    }

    // "SignatureVerification=ArmNeon, ..." for logs and status output
    std::string backend_summary() const {
        std::string out;
        for (Operation op : ALL_OPERATIONS) {
            if (!out.empty()) out += ", ";
            out += std::string(to_string(op)) + "=" + to_string(path(op).backend());
        }
        return out;
    }
};

/**
 * The accelerated parts of a transaction's validation: its serialization
 * (for the txid), the Schnorr checks of its inputs and its tapscript spends.
 * Sighash computation happens before this point.
 */
struct TransactionCheck {
    Hash256 txid{};
    Bytes serialized;
    std::vector<Bytes> signature_inputs;    // SignatureVerification wire format
    std::vector<Bytes> script_inputs;       // ScriptExecution wire format
};

struct BlockCheck {
    uint32_t height = 0;
    Hash256 declared_merkle_root{};
    std::vector<TransactionCheck> transactions;
};

struct ValidationOutcome {
    bool accepted = false;
    std::string reason;     // empty when accepted

    static ValidationOutcome accept() { return {true, ""}; }
    static ValidationOutcome reject(std::string why) { return {false, std::move(why)}; }

    bool operator==(const ValidationOutcome&) const = default;
};

/**
 * Driven port: consensus rules, implemented outside the library.
 */
class ConsensusDomain {
public:
    virtual ~ConsensusDomain() = default;

    virtual ValidationOutcome validate_transaction(const TransactionCheck& tx, const ValidationContext& ctx) = 0;
    virtual ValidationOutcome validate_block(const BlockCheck& block, const ValidationContext& ctx) = 0;

    // Validate and make the block part of the domain's state
    virtual ValidationOutcome apply_block(const BlockCheck& block, const ValidationContext& ctx) = 0;
};

/**
 * Driving port: what the node calls.
 */
class ValidationPort {
public:
    virtual ~ValidationPort() = default;

    virtual ValidationOutcome submit_transaction(const TransactionCheck& tx) = 0;
    virtual ValidationOutcome submit_block(const BlockCheck& block) = 0;
    virtual ValidationOutcome connect_block(const BlockCheck& block) = 0;
};

}  // namespace conhal
