/**
 * Tapscript Interpreter
 *
 * Evaluates the tapscript subset accelerated by the ScriptExecution operation:
 * pushes, flow control, stack manipulation, 32-bit arithmetic, SHA256/HASH256
 * and BIP-342 CHECKSIG / CHECKSIGVERIFY / CHECKSIGADD.
 *
 * Signature checks use the sighash supplied with the request; computing it
 * belongs to the transaction layer.
 */

#pragma once

#include "../core/types.hpp"
#include "../crypto/hash_engine.hpp"
#include "../crypto/schnorr.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace conhal {
namespace script {

// Consensus limits
constexpr size_t MAX_SCRIPT_SIZE = 10000;
constexpr size_t MAX_SCRIPT_ELEMENT_SIZE = 520;
constexpr size_t MAX_STACK_SIZE = 1000;      // stack + altstack
constexpr int MAX_OPS_PER_SCRIPT = 201;       // non-push opcodes
constexpr size_t MAX_SCRIPTNUM_SIZE = 4;

enum Opcode : uint8_t {
    OP_0 = 0x00,
    OP_PUSHDATA1 = 0x4c,
    OP_PUSHDATA2 = 0x4d,
    OP_PUSHDATA4 = 0x4e,
    OP_1NEGATE = 0x4f,
    OP_1 = 0x51,
    OP_16 = 0x60,

    OP_NOP = 0x61,
    OP_IF = 0x63,
    OP_NOTIF = 0x64,
    OP_ELSE = 0x67,
    OP_ENDIF = 0x68,
    OP_VERIFY = 0x69,
    OP_RETURN = 0x6a,

    OP_TOALTSTACK = 0x6b,
    OP_FROMALTSTACK = 0x6c,
    OP_2DROP = 0x6d,
    OP_2DUP = 0x6e,
    OP_IFDUP = 0x73,
    OP_DEPTH = 0x74,
    OP_DROP = 0x75,
    OP_DUP = 0x76,
    OP_NIP = 0x77,
    OP_OVER = 0x78,
    OP_PICK = 0x79,
    OP_ROLL = 0x7a,
    OP_ROT = 0x7b,
    OP_SWAP = 0x7c,
    OP_TUCK = 0x7d,

    OP_CAT = 0x7e,
    OP_SUBSTR = 0x7f,
    OP_LEFT = 0x80,
    OP_RIGHT = 0x81,
    OP_SIZE = 0x82,
    OP_INVERT = 0x83,
    OP_AND = 0x84,
    OP_OR = 0x85,
    OP_XOR = 0x86,
    OP_EQUAL = 0x87,
    OP_EQUALVERIFY = 0x88,

    OP_1ADD = 0x8b,
    OP_1SUB = 0x8c,
    OP_2MUL = 0x8d,
    OP_2DIV = 0x8e,
    OP_NEGATE = 0x8f,
    OP_ABS = 0x90,
    OP_NOT = 0x91,
    OP_0NOTEQUAL = 0x92,
    OP_ADD = 0x93,
    OP_SUB = 0x94,
    OP_MUL = 0x95,
    OP_DIV = 0x96,
    OP_MOD = 0x97,
    OP_LSHIFT = 0x98,
    OP_RSHIFT = 0x99,
    OP_BOOLAND = 0x9a,
    OP_BOOLOR = 0x9b,
    OP_NUMEQUAL = 0x9c,
    OP_NUMEQUALVERIFY = 0x9d,
    OP_NUMNOTEQUAL = 0x9e,
    OP_LESSTHAN = 0x9f,
    OP_GREATERTHAN = 0xa0,
    OP_LESSTHANOREQUAL = 0xa1,
    OP_GREATERTHANOREQUAL = 0xa2,
    OP_MIN = 0xa3,
    OP_MAX = 0xa4,
    OP_WITHIN = 0xa5,

    OP_SHA256 = 0xa8,
    OP_HASH256 = 0xaa,
    OP_CHECKSIG = 0xac,
    OP_CHECKSIGVERIFY = 0xad,
    OP_CHECKSIGADD = 0xba,
};

/**
 * Script result codes. The numeric value is the ScriptExecution output byte,
 * so the order is part of the wire contract.
 */
enum class ScriptError : uint8_t {
    Ok = 0,
    EvalFalse,
    OpReturn,
    ScriptSize,
    PushSize,
    OpCount,
    StackSize,
    BadPush,                  // push runs past the end of the script
    InvalidStackOperation,
    InvalidAltstackOperation,
    UnbalancedConditional,
    MinimalIf,
    Verify,
    EqualVerify,
    NumEqualVerify,
    CheckSigVerify,
    ScriptNumOverflow,
    BadOpcode,
    DisabledOpcode,
    SchnorrSigSize,
    SchnorrSig,
    PubkeyType,
    CleanStack,
};

const char* to_string(ScriptError err);

/**
 * Decoded ScriptExecution request.
 */
struct ScriptRequest {
    Hash256 sighash{};
    std::vector<Bytes> stack;   // initial stack, bottom first
    Bytes script;
};

/**
 * Wire layout: sighash32 || CompactSize(n) || n x (CompactSize(len) || item)
 *              || CompactSize(len) || script
 * Returns nullopt on truncation, non-canonical sizes or trailing bytes.
 */
std::optional<ScriptRequest> decode_request(ByteView input);
Bytes encode_request(const ScriptRequest& req);

class ScriptInterpreter {
public:
    ScriptInterpreter(const crypto::HashEngine& hash, const crypto::SchnorrVerifier& verifier)
        : hash_(hash), verifier_(verifier) {}

    /**
     * Run the script over the initial stack. Success requires a clean
     * stack holding exactly one true element.
     */
    ScriptError run(const ScriptRequest& req) const;

private:
    ScriptError check_sig(ByteView sig, ByteView pubkey, const Hash256& sighash, bool& success) const;

    const crypto::HashEngine& hash_;
    const crypto::SchnorrVerifier& verifier_;
};

// Shared with tests and corpus builders
bool cast_to_bool(const Bytes& v);
Bytes encode_num(int64_t n);

}  // namespace script
}  // namespace conhal
