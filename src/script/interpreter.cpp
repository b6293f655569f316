/**
 * Tapscript Interpreter implementation
 */

#include "interpreter.hpp"

#include <algorithm>

namespace conhal {
namespace script {

namespace {

bool is_disabled(uint8_t op) {
    switch (op) {
        case OP_CAT: case OP_SUBSTR: case OP_LEFT: case OP_RIGHT:
        case OP_INVERT: case OP_AND: case OP_OR: case OP_XOR:
        case OP_2MUL: case OP_2DIV: case OP_MUL: case OP_DIV:
        case OP_MOD: case OP_LSHIFT: case OP_RSHIFT:
            return true;
        default:
            return false;
    }
}

// Little-endian sign-magnitude, at most MAX_SCRIPTNUM_SIZE bytes
bool decode_num(const Bytes& v, int64_t& out) {
    if (v.size() > MAX_SCRIPTNUM_SIZE) return false;
    if (v.empty()) {
        out = 0;
        return true;
    }
    int64_t result = 0;
    for (size_t i = 0; i < v.size(); i++) {
        result |= int64_t(v[i]) << (8 * i);
    }
    if (v.back() & 0x80) {
        result &= ~(int64_t(0x80) << (8 * (v.size() - 1)));
        result = -result;
    }
    out = result;
    return true;
}

const Bytes TRUE_ELEMENT{1};
const Bytes FALSE_ELEMENT{};

}  // namespace

const char* to_string(ScriptError err) {
    switch (err) {
        case ScriptError::Ok:                       return "ok";
        case ScriptError::EvalFalse:                return "eval-false";
        case ScriptError::OpReturn:                 return "op-return";
        case ScriptError::ScriptSize:               return "script-size";
        case ScriptError::PushSize:                 return "push-size";
        case ScriptError::OpCount:                  return "op-count";
        case ScriptError::StackSize:                return "stack-size";
        case ScriptError::BadPush:                  return "bad-push";
        case ScriptError::InvalidStackOperation:    return "invalid-stack-operation";
        case ScriptError::InvalidAltstackOperation: return "invalid-altstack-operation";
        case ScriptError::UnbalancedConditional:    return "unbalanced-conditional";
        case ScriptError::MinimalIf:                return "minimalif";
        case ScriptError::Verify:                   return "verify";
        case ScriptError::EqualVerify:              return "equalverify";
        case ScriptError::NumEqualVerify:           return "numequalverify";
        case ScriptError::CheckSigVerify:           return "checksigverify";
        case ScriptError::ScriptNumOverflow:        return "scriptnum-overflow";
        case ScriptError::BadOpcode:                return "bad-opcode";
        case ScriptError::DisabledOpcode:           return "disabled-opcode";
        case ScriptError::SchnorrSigSize:           return "schnorr-sig-size";
        case ScriptError::SchnorrSig:               return "schnorr-sig";
        case ScriptError::PubkeyType:               return "pubkey-type";
        case ScriptError::CleanStack:               return "cleanstack";
    }
    return "unknown";
}

bool cast_to_bool(const Bytes& v) {
    for (size_t i = 0; i < v.size(); i++) {
        if (v[i] != 0) {
            // Negative zero is false
            if (i == v.size() - 1 && v[i] == 0x80) return false;
            return true;
        }
    }
    return false;
}

Bytes encode_num(int64_t n) {
    Bytes out;
    if (n == 0) return out;

    bool neg = n < 0;
    uint64_t abs = neg ? uint64_t(-n) : uint64_t(n);
    while (abs) {
        out.push_back(uint8_t(abs & 0xFF));
        abs >>= 8;
    }
    if (out.back() & 0x80) {
        out.push_back(neg ? 0x80 : 0x00);
    } else if (neg) {
        out.back() |= 0x80;
    }
    return out;
}

// -----------------------------------------------------------------------------
// Request codec
// -----------------------------------------------------------------------------

std::optional<ScriptRequest> decode_request(ByteView input) {
    ByteReader in(input);
    ScriptRequest req;

    ByteView sighash;
    if (!in.read(32, sighash)) return std::nullopt;
    std::copy(sighash.begin(), sighash.end(), req.sighash.begin());

    uint64_t count = 0;
    if (!in.read_compact_size(count) || count > in.remaining()) return std::nullopt;
    req.stack.reserve(count);
    for (uint64_t i = 0; i < count; i++) {
        uint64_t len = 0;
        ByteView item;
        if (!in.read_compact_size(len) || len > in.remaining() || !in.read(len, item)) {
            return std::nullopt;
        }
        req.stack.emplace_back(item.begin(), item.end());
    }

    uint64_t script_len = 0;
    ByteView script;
    if (!in.read_compact_size(script_len) || script_len > in.remaining() ||
        !in.read(script_len, script)) {
        return std::nullopt;
    }
    req.script.assign(script.begin(), script.end());

    if (!in.at_end()) return std::nullopt;
    return req;
}

Bytes encode_request(const ScriptRequest& req) {
    Bytes out;
    append(out, as_view(req.sighash));
    write_compact_size(out, req.stack.size());
    for (const auto& item : req.stack) {
        write_compact_size(out, item.size());
        append(out, as_view(item));
    }
    write_compact_size(out, req.script.size());
    append(out, as_view(req.script));
    return out;
}

// -----------------------------------------------------------------------------
// Evaluation
// -----------------------------------------------------------------------------

ScriptError ScriptInterpreter::check_sig(ByteView sig, ByteView pubkey,
                                         const Hash256& sighash, bool& success) const {
    success = !sig.empty();

    if (pubkey.empty()) return ScriptError::PubkeyType;

    if (pubkey.size() == 32 && success) {
        // 65 bytes carries an explicit hash type, which may not be 0x00
        if (sig.size() == 65) {
            if (sig[64] == 0x00) return ScriptError::SchnorrSigSize;
            sig = sig.first(64);
        } else if (sig.size() != 64) {
            return ScriptError::SchnorrSigSize;
        }
        if (!verifier_.verify(as_view(sighash), pubkey, sig)) {
            return ScriptError::SchnorrSig;
        }
    }

    // Other key sizes are reserved for upgrades and always succeed
    return ScriptError::Ok;
}

ScriptError ScriptInterpreter::run(const ScriptRequest& req) const {
    const Bytes& script = req.script;
    if (script.size() > MAX_SCRIPT_SIZE) return ScriptError::ScriptSize;
    if (req.stack.size() > MAX_STACK_SIZE) return ScriptError::StackSize;

    std::vector<Bytes> stack = req.stack;
    for (const auto& item : stack) {
        if (item.size() > MAX_SCRIPT_ELEMENT_SIZE) return ScriptError::PushSize;
    }

    std::vector<Bytes> altstack;
    std::vector<bool> exec_stack;
    int op_count = 0;
    size_t pc = 0;

    auto top = [&stack](int i) -> Bytes& { return stack[stack.size() + i]; };
    auto pop = [&stack]() { stack.pop_back(); };
    auto pop_num = [&](int64_t& n) -> ScriptError {
        if (stack.empty()) return ScriptError::InvalidStackOperation;
        if (!decode_num(stack.back(), n)) return ScriptError::ScriptNumOverflow;
        stack.pop_back();
        return ScriptError::Ok;
    };

    while (pc < script.size()) {
        bool exec = std::find(exec_stack.begin(), exec_stack.end(), false) == exec_stack.end();
        uint8_t op = script[pc++];

        // Push operations
        if (op <= OP_PUSHDATA4) {
            size_t len = 0;
            if (op < OP_PUSHDATA1) {
                len = op;
            } else {
                size_t width = op == OP_PUSHDATA1 ? 1 : op == OP_PUSHDATA2 ? 2 : 4;
                if (script.size() - pc < width) return ScriptError::BadPush;
                for (size_t i = 0; i < width; i++) len |= size_t(script[pc + i]) << (8 * i);
                pc += width;
            }
            if (script.size() - pc < len) return ScriptError::BadPush;
            if (len > MAX_SCRIPT_ELEMENT_SIZE) return ScriptError::PushSize;
            if (exec) stack.emplace_back(script.begin() + pc, script.begin() + pc + len);
            pc += len;
        } else {
            if (op > OP_16 && ++op_count > MAX_OPS_PER_SCRIPT) return ScriptError::OpCount;
            if (is_disabled(op)) return ScriptError::DisabledOpcode;

            if (exec || (op >= OP_IF && op <= OP_ENDIF)) {
                switch (op) {
                    // Small integers
                    case OP_1NEGATE:
                        stack.push_back(encode_num(-1));
                        break;

                    case 0x51: case 0x52: case 0x53: case 0x54:
                    case 0x55: case 0x56: case 0x57: case 0x58:
                    case 0x59: case 0x5a: case 0x5b: case 0x5c:
                    case 0x5d: case 0x5e: case 0x5f: case 0x60:
                        stack.push_back(encode_num(int64_t(op) - (OP_1 - 1)));
                        break;

                    case OP_NOP:
                        break;

                    // Flow control
                    case OP_IF:
                    case OP_NOTIF: {
                        bool value = false;
                        if (exec) {
                            if (stack.empty()) return ScriptError::UnbalancedConditional;
                            const Bytes& v = top(-1);
                            if (v.size() > 1 || (v.size() == 1 && v[0] != 1)) {
                                return ScriptError::MinimalIf;
                            }
                            value = cast_to_bool(v);
                            if (op == OP_NOTIF) value = !value;
                            pop();
                        }
                        exec_stack.push_back(value);
                        break;
                    }

                    case OP_ELSE:
                        if (exec_stack.empty()) return ScriptError::UnbalancedConditional;
                        exec_stack.back() = !exec_stack.back();
                        break;

                    case OP_ENDIF:
                        if (exec_stack.empty()) return ScriptError::UnbalancedConditional;
                        exec_stack.pop_back();
                        break;

                    case OP_VERIFY:
                        if (stack.empty()) return ScriptError::InvalidStackOperation;
                        if (!cast_to_bool(top(-1))) return ScriptError::Verify;
                        pop();
                        break;

                    case OP_RETURN:
                        return ScriptError::OpReturn;

                    // Stack operations
                    case OP_TOALTSTACK:
                        if (stack.empty()) return ScriptError::InvalidStackOperation;
                        altstack.push_back(std::move(top(-1)));
                        pop();
                        break;

                    case OP_FROMALTSTACK:
                        if (altstack.empty()) return ScriptError::InvalidAltstackOperation;
                        stack.push_back(std::move(altstack.back()));
                        altstack.pop_back();
                        break;

                    case OP_2DROP:
                        if (stack.size() < 2) return ScriptError::InvalidStackOperation;
                        pop();
                        pop();
                        break;

                    case OP_2DUP: {
                        if (stack.size() < 2) return ScriptError::InvalidStackOperation;
                        Bytes a = top(-2), b = top(-1);
                        stack.push_back(std::move(a));
                        stack.push_back(std::move(b));
                        break;
                    }

                    case OP_IFDUP:
                        if (stack.empty()) return ScriptError::InvalidStackOperation;
                        if (cast_to_bool(top(-1))) stack.push_back(top(-1));
                        break;

                    case OP_DEPTH:
                        stack.push_back(encode_num(int64_t(stack.size())));
                        break;

                    case OP_DROP:
                        if (stack.empty()) return ScriptError::InvalidStackOperation;
                        pop();
                        break;

                    case OP_DUP:
                        if (stack.empty()) return ScriptError::InvalidStackOperation;
                        stack.push_back(top(-1));
                        break;

                    case OP_NIP:
                        if (stack.size() < 2) return ScriptError::InvalidStackOperation;
                        stack.erase(stack.end() - 2);
                        break;

                    case OP_OVER:
                        if (stack.size() < 2) return ScriptError::InvalidStackOperation;
                        stack.push_back(top(-2));
                        break;

                    case OP_PICK:
                    case OP_ROLL: {
                        int64_t n = 0;
                        if (auto err = pop_num(n); err != ScriptError::Ok) return err;
                        if (n < 0 || n >= int64_t(stack.size())) return ScriptError::InvalidStackOperation;
                        Bytes v = top(int(-n - 1));
                        if (op == OP_ROLL) stack.erase(stack.end() - n - 1);
                        stack.push_back(std::move(v));
                        break;
                    }

                    case OP_ROT:
                        if (stack.size() < 3) return ScriptError::InvalidStackOperation;
                        std::swap(top(-3), top(-2));
                        std::swap(top(-2), top(-1));
                        break;

                    case OP_SWAP:
                        if (stack.size() < 2) return ScriptError::InvalidStackOperation;
                        std::swap(top(-2), top(-1));
                        break;

                    case OP_TUCK: {
                        if (stack.size() < 2) return ScriptError::InvalidStackOperation;
                        Bytes v = top(-1);
                        stack.insert(stack.end() - 2, std::move(v));
                        break;
                    }

                    case OP_SIZE:
                        if (stack.empty()) return ScriptError::InvalidStackOperation;
                        stack.push_back(encode_num(int64_t(top(-1).size())));
                        break;

                    // Bitwise logic
                    case OP_EQUAL:
                    case OP_EQUALVERIFY: {
                        if (stack.size() < 2) return ScriptError::InvalidStackOperation;
                        bool equal = top(-2) == top(-1);
                        pop();
                        pop();
                        stack.push_back(equal ? TRUE_ELEMENT : FALSE_ELEMENT);
                        if (op == OP_EQUALVERIFY) {
                            if (!equal) return ScriptError::EqualVerify;
                            pop();
                        }
                        break;
                    }

                    // Unary arithmetic
                    case OP_1ADD:
                    case OP_1SUB:
                    case OP_NEGATE:
                    case OP_ABS:
                    case OP_NOT:
                    case OP_0NOTEQUAL: {
                        int64_t n = 0;
                        if (auto err = pop_num(n); err != ScriptError::Ok) return err;
                        switch (op) {
                            case OP_1ADD:      n += 1; break;
                            case OP_1SUB:      n -= 1; break;
                            case OP_NEGATE:    n = -n; break;
                            case OP_ABS:       if (n < 0) n = -n; break;
                            case OP_NOT:       n = (n == 0); break;
                            case OP_0NOTEQUAL: n = (n != 0); break;
                        }
                        stack.push_back(encode_num(n));
                        break;
                    }

                    // Binary arithmetic
                    case OP_ADD:
                    case OP_SUB:
                    case OP_BOOLAND:
                    case OP_BOOLOR:
                    case OP_NUMEQUAL:
                    case OP_NUMEQUALVERIFY:
                    case OP_NUMNOTEQUAL:
                    case OP_LESSTHAN:
                    case OP_GREATERTHAN:
                    case OP_LESSTHANOREQUAL:
                    case OP_GREATERTHANOREQUAL:
                    case OP_MIN:
                    case OP_MAX: {
                        if (stack.size() < 2) return ScriptError::InvalidStackOperation;
                        int64_t b = 0, a = 0;
                        if (auto err = pop_num(b); err != ScriptError::Ok) return err;
                        if (auto err = pop_num(a); err != ScriptError::Ok) return err;
                        int64_t r = 0;
                        switch (op) {
                            case OP_ADD:                r = a + b; break;
                            case OP_SUB:                r = a - b; break;
                            case OP_BOOLAND:            r = (a != 0 && b != 0); break;
                            case OP_BOOLOR:             r = (a != 0 || b != 0); break;
                            case OP_NUMEQUAL:
                            case OP_NUMEQUALVERIFY:     r = (a == b); break;
                            case OP_NUMNOTEQUAL:        r = (a != b); break;
                            case OP_LESSTHAN:           r = (a < b); break;
                            case OP_GREATERTHAN:        r = (a > b); break;
                            case OP_LESSTHANOREQUAL:    r = (a <= b); break;
                            case OP_GREATERTHANOREQUAL: r = (a >= b); break;
                            case OP_MIN:                r = std::min(a, b); break;
                            case OP_MAX:                r = std::max(a, b); break;
                        }
                        if (op == OP_NUMEQUALVERIFY) {
                            if (!r) return ScriptError::NumEqualVerify;
                        } else {
                            stack.push_back(encode_num(r));
                        }
                        break;
                    }

                    case OP_WITHIN: {
                        if (stack.size() < 3) return ScriptError::InvalidStackOperation;
                        int64_t max = 0, min = 0, x = 0;
                        if (auto err = pop_num(max); err != ScriptError::Ok) return err;
                        if (auto err = pop_num(min); err != ScriptError::Ok) return err;
                        if (auto err = pop_num(x); err != ScriptError::Ok) return err;
                        stack.push_back(encode_num(min <= x && x < max));
                        break;
                    }

                    // Crypto
                    case OP_SHA256:
                    case OP_HASH256: {
                        if (stack.empty()) return ScriptError::InvalidStackOperation;
                        Hash256 h = op == OP_SHA256 ? hash_.sha256(as_view(top(-1)))
                                                    : hash_.hash256(as_view(top(-1)));
                        top(-1).assign(h.begin(), h.end());
                        break;
                    }

                    case OP_CHECKSIG:
                    case OP_CHECKSIGVERIFY: {
                        if (stack.size() < 2) return ScriptError::InvalidStackOperation;
                        bool success = false;
                        auto err = check_sig(as_view(top(-2)), as_view(top(-1)), req.sighash, success);
                        if (err != ScriptError::Ok) return err;
                        pop();
                        pop();
                        if (op == OP_CHECKSIGVERIFY) {
                            if (!success) return ScriptError::CheckSigVerify;
                        } else {
                            stack.push_back(success ? TRUE_ELEMENT : FALSE_ELEMENT);
                        }
                        break;
                    }

                    case OP_CHECKSIGADD: {
                        // <sig> <n> <pubkey> -> <n + success>
                        if (stack.size() < 3) return ScriptError::InvalidStackOperation;
                        int64_t n = 0;
                        if (!decode_num(top(-2), n)) return ScriptError::ScriptNumOverflow;
                        bool success = false;
                        auto err = check_sig(as_view(top(-3)), as_view(top(-1)), req.sighash, success);
                        if (err != ScriptError::Ok) return err;
                        pop();
                        pop();
                        pop();
                        stack.push_back(encode_num(n + (success ? 1 : 0)));
                        break;
                    }

                    default:
                        return ScriptError::BadOpcode;
                }
            }
        }

        if (stack.size() + altstack.size() > MAX_STACK_SIZE) return ScriptError::StackSize;
    }

    if (!exec_stack.empty()) return ScriptError::UnbalancedConditional;

    if (stack.size() != 1) return ScriptError::CleanStack;
    if (!cast_to_bool(stack.back())) return ScriptError::EvalFalse;
    return ScriptError::Ok;
}

}  // namespace script
}  // namespace conhal
