/**
 * Equivalence Corpus Builder implementation
 */

#include "corpus.hpp"

#include "../crypto/hash_engine.hpp"
#include "../crypto/schnorr.hpp"
#include "../crypto/secp256k1.hpp"
#include "../engine/execution_path.hpp"
#include "../engine/sample_inputs.hpp"
#include "../script/interpreter.hpp"

#include <algorithm>
#include <random>

namespace conhal {
namespace verify {

using crypto::SECP256K1_N;
using crypto::SECP256K1_P;

namespace {

Bytes hex(const char* h) {
    auto b = from_hex(h);
    return b ? *b : Bytes();
}

Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes out;
    for (const auto& p : parts) append(out, as_view(p));
    return out;
}

Bytes bytes_of(const crypto::uint256_t& v) {
    auto a = v.to_bytes();
    return Bytes(a.begin(), a.end());
}

// sighash || stack || script in the ScriptExecution layout
Bytes script_input(const std::vector<Bytes>& stack, const Bytes& program, uint8_t sighash_fill = 0) {
    script::ScriptRequest req;
    req.sighash.fill(sighash_fill);
    req.stack = stack;
    req.script = program;
    return script::encode_request(req);
}

Bytes push32(const uint8_t* data) {
    Bytes out{32};
    out.insert(out.end(), data, data + 32);
    return out;
}

std::mt19937_64 make_rng(uint64_t seed, Operation op, uint64_t stream) {
    std::seed_seq seq{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
                      static_cast<uint32_t>(op), static_cast<uint32_t>(stream)};
    return std::mt19937_64(seq);
}

Bytes random_bytes(std::mt19937_64& rng, size_t n) {
    Bytes out(n);
    for (auto& b : out) b = static_cast<uint8_t>(rng());
    return out;
}

// -----------------------------------------------------------------------------
// Boundary sets
// -----------------------------------------------------------------------------

std::vector<Bytes> signature_boundary() {
    std::vector<Bytes> out;
    Bytes valid = sample_input(Operation::SignatureVerification);
    Bytes msg(valid.begin(), valid.begin() + 32);
    Bytes pk(valid.begin() + 32, valid.begin() + 64);
    Bytes r(valid.begin() + 64, valid.begin() + 96);
    Bytes s(valid.begin() + 96, valid.end());

    out.push_back({});
    out.push_back(Bytes(127, 0));
    out.push_back(Bytes(129, 0));
    out.push_back(Bytes(128, 0));
    out.push_back(Bytes(valid.begin(), valid.end() - 1));
    out.push_back(concat({valid, Bytes{0x00}}));
    out.push_back(valid);

    // Known answers: valid vectors 0 and 1 of BIP-340
    out.push_back(concat({Bytes(32, 0),
        hex("F9308A019258C31049344F85F89D5229B531C845836F99B08601F113BCE036F9"),
        hex("E907831F80848D1069A5371B402410364BDF1C5F8307B0084C55F1CE2DCA8215"
            "25F66A4A85EA8B71E482A74F382D2CE5EBEEE8FDB2172F477DF4900D310536C0")}));
    out.push_back(concat({
        hex("243F6A8885A308D313198A2E03707344A4093822299F31D0082EFA98EC4E6C89"),
        hex("DFF1D77F2A671C5F36183726DB2341BE58FEAE1DA2DECED843240F7B502BA659"),
        hex("6896BD60EEAE296DB48A229FF71DFE071BDE413E6D43F917DC8DCF8C78DE3341"
            "8906D11AC976ABCCB20B091292BFF4EA897EFCB639EA871CFA95F6DE339E4B0A")}));

    // Public key edges
    out.push_back(concat({msg, bytes_of(SECP256K1_P), r, s}));
    out.push_back(concat({msg, Bytes(32, 0xFF), r, s}));
    out.push_back(concat({msg, Bytes(32, 0x00), r, s}));
    out.push_back(concat({msg, hex("EEFDEA4CDB677750A420FEE807EACF21EB9898AE79B9768766E4FAA04A2D4A34"), r, s}));

    // Signature edges
    out.push_back(concat({msg, pk, bytes_of(SECP256K1_P), s}));
    out.push_back(concat({msg, pk, Bytes(32, 0xFF), s}));
    out.push_back(concat({msg, pk, Bytes(32, 0x00), s}));
    out.push_back(concat({msg, pk, r, bytes_of(SECP256K1_N)}));
    out.push_back(concat({msg, pk, r, Bytes(32, 0xFF)}));
    out.push_back(concat({msg, pk, r, Bytes(32, 0x00)}));

    // Right signature, wrong message
    Bytes other_msg = msg;
    other_msg[31] ^= 0x01;
    out.push_back(concat({other_msg, pk, r, s}));
    return out;
}

std::vector<Bytes> script_boundary() {
    using namespace script;
    std::vector<Bytes> out;
    Bytes valid = sample_input(Operation::ScriptExecution);

    // Decoder edges
    out.push_back({});
    out.push_back(Bytes(32, 0));
    out.push_back(Bytes(31, 0));
    out.push_back(concat({Bytes(32, 0), Bytes{0x00}}));                     // no script length
    out.push_back(concat({Bytes(32, 0), Bytes{0xFD, 0x00, 0x00, 0x00}}));   // non-canonical count
    out.push_back(concat({Bytes(32, 0), Bytes{0x01, 0x05, 0xAA}}));          // item runs short
    out.push_back(valid);
    out.push_back(concat({valid, Bytes{0x00}}));
    out.push_back(Bytes(valid.begin(), valid.end() - 1));

    // Script edges
    out.push_back(script_input({}, {}));
    out.push_back(script_input({}, {OP_1}));
    out.push_back(script_input({}, {OP_0}));
    out.push_back(script_input({}, {OP_1, OP_1}));
    out.push_back(script_input({}, {OP_RETURN}));
    out.push_back(script_input({}, {OP_PUSHDATA1}));
    out.push_back(script_input({}, {OP_PUSHDATA1, 0x05, 0x01}));
    out.push_back(script_input({}, {OP_PUSHDATA2, 0xFF}));
    out.push_back(script_input({}, {OP_1, OP_IF}));
    out.push_back(script_input({}, {OP_ELSE}));
    out.push_back(script_input({}, {OP_ENDIF}));
    out.push_back(script_input({{0x02}}, {OP_IF, OP_1, OP_ENDIF}));          // MINIMALIF
    out.push_back(script_input({}, {OP_1, OP_1, OP_CAT}));
    out.push_back(script_input({}, {OP_DROP}));
    out.push_back(script_input({}, {OP_FROMALTSTACK}));
    out.push_back(script_input({}, {0x05, 0xFF, 0xFF, 0xFF, 0xFF, 0x7F, OP_1ADD}));
    out.push_back(script_input({}, {0x04, 0xFF, 0xFF, 0xFF, 0x7F, OP_1ADD, OP_DROP, OP_1}));
    out.push_back(script_input({}, {0xFF}));
    out.push_back(script_input({Bytes(MAX_SCRIPT_ELEMENT_SIZE + 1, 0x01)}, {OP_DROP, OP_1}));
    out.push_back(script_input({Bytes(MAX_SCRIPT_ELEMENT_SIZE, 0x01)}, {OP_DROP, OP_1}));

    Bytes nops(MAX_OPS_PER_SCRIPT + 1, OP_NOP);
    nops.push_back(OP_1);
    out.push_back(script_input({}, nops));
    Bytes nops_ok(MAX_OPS_PER_SCRIPT, OP_NOP);
    nops_ok.push_back(OP_1);
    out.push_back(script_input({}, nops_ok));

    Bytes oversized(MAX_SCRIPT_SIZE + 1, OP_1);
    out.push_back(script_input({}, oversized));

    // CHECKSIG with a short signature, an empty signature, an empty key
    Bytes pk(32, 0x02);
    Bytes key_script = concat({push32(pk.data()), Bytes{OP_CHECKSIG}});
    out.push_back(script_input({Bytes(63, 0x01)}, key_script));
    out.push_back(script_input({Bytes()}, concat({key_script, Bytes{OP_NOT}})));
    out.push_back(script_input({Bytes(64, 0x01)}, {OP_0, OP_CHECKSIG}));
    out.push_back(script_input({Bytes(65, 0x00)}, key_script));
    out.push_back(script_input({Bytes(64, 0x01)}, {0x01, 0x07, OP_CHECKSIG}));   // unknown key type
    return out;
}

std::vector<Bytes> hash_boundary() {
    std::vector<Bytes> out;
    for (size_t n : {0, 1, 31, 32, 55, 56, 63, 64, 65, 119, 120, 127, 128, 1000}) {
        Bytes b(n);
        for (size_t i = 0; i < n; i++) b[i] = static_cast<uint8_t>(i);
        out.push_back(b);
    }
    out.push_back(Bytes(64, 0xFF));
    out.push_back(sample_input(Operation::DoubleSha256));
    return out;
}

std::vector<Bytes> merkle_boundary() {
    std::vector<Bytes> out;
    out.push_back({});
    out.push_back(Bytes(31, 0));
    out.push_back(Bytes(33, 0));
    out.push_back(Bytes(63, 0));
    out.push_back(Bytes(32, 0));
    for (size_t leaves : {1, 2, 3, 4, 5, 7, 8, 9, 16, 17}) {
        Bytes b(leaves * 32);
        for (size_t i = 0; i < b.size(); i++) b[i] = static_cast<uint8_t>(i * 7 + leaves);
        out.push_back(b);
    }
    // Duplicated trailing leaf: same root as the odd tree it mimics
    Bytes three(96);
    for (size_t i = 0; i < three.size(); i++) three[i] = static_cast<uint8_t>(i);
    out.push_back(three);
    out.push_back(concat({three, Bytes(three.end() - 32, three.end())}));
    out.push_back(sample_input(Operation::MerkleRoot));
    return out;
}

std::vector<Bytes> batch_boundary() {
    std::vector<Bytes> out;
    Bytes single = sample_input(Operation::SignatureVerification);
    Bytes sample = sample_input(Operation::BatchVerification);

    out.push_back({});
    out.push_back(Bytes(SIGNATURE_INPUT_SIZE - 1, 0));
    out.push_back(Bytes(SIGNATURE_INPUT_SIZE + 1, 0));
    out.push_back(single);
    out.push_back(sample);
    out.push_back(concat({sample, Bytes{0x00}}));
    out.push_back(Bytes(sample.begin(), sample.end() - 1));

    Bytes bad_last = sample;
    bad_last.back() ^= 0x01;
    out.push_back(bad_last);
    Bytes bad_first = sample;
    bad_first[0] ^= 0x01;
    out.push_back(bad_first);

    // Every full-size signature edge in one batch, and each after a valid item
    std::vector<Bytes> edges;
    for (const auto& item : signature_boundary()) {
        if (item.size() == SIGNATURE_INPUT_SIZE) edges.push_back(item);
    }
    out.push_back(encode_batch_input(edges));
    for (const auto& edge : edges) out.push_back(encode_batch_input({single, edge}));

    // One item more than the widest lane group
    out.push_back(encode_batch_input(std::vector<Bytes>(17, single)));
    return out;
}

// -----------------------------------------------------------------------------
// Synthesis
// -----------------------------------------------------------------------------

struct Signer {
    Bytes seckey;
    crypto::XOnlyPubKey pubkey{};

    crypto::SchnorrSig sign(const Hash256& msg, const Hash256& aux) const {
        auto sig = crypto::schnorr_sign(as_view(seckey), as_view(msg), as_view(aux));
        return sig ? *sig : crypto::SchnorrSig{};
    }
};

// Random key; nullopt in the (negligible) case the bytes are not a valid scalar
std::optional<Signer> random_signer(std::mt19937_64& rng) {
    Signer s;
    s.seckey = random_bytes(rng, 32);
    auto pk = crypto::xonly_pubkey(as_view(s.seckey));
    if (!pk) return std::nullopt;
    s.pubkey = *pk;
    return s;
}

Hash256 random_hash(std::mt19937_64& rng) {
    Hash256 h;
    for (auto& b : h) b = static_cast<uint8_t>(rng());
    return h;
}

Bytes flip_bit(Bytes b, std::mt19937_64& rng) {
    if (b.empty()) return b;
    size_t bit = rng() % (b.size() * 8);
    b[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
    return b;
}

void synthesize_signatures(std::mt19937_64& rng, size_t count, std::vector<Bytes>& out) {
    for (size_t i = 0; i < count; i++) {
        auto signer = random_signer(rng);
        if (!signer) continue;
        Hash256 msg = random_hash(rng);
        crypto::SchnorrSig sig = signer->sign(msg, random_hash(rng));
        Bytes input = encode_signature_input(as_view(msg), ByteView(signer->pubkey), ByteView(sig));
        out.push_back(input);
        out.push_back(flip_bit(input, rng));
    }
}

void synthesize_scripts(std::mt19937_64& rng, size_t count, std::vector<Bytes>& out) {
    using namespace script;
    for (size_t i = 0; i < count; i++) {
        auto a = random_signer(rng);
        auto b = random_signer(rng);
        if (!a || !b) continue;

        script::ScriptRequest req;
        req.sighash = random_hash(rng);
        crypto::SchnorrSig sig_a = a->sign(req.sighash, random_hash(rng));
        crypto::SchnorrSig sig_b = b->sign(req.sighash, random_hash(rng));

        // 2-of-2: <pk_a> CHECKSIG <pk_b> CHECKSIGADD 2 NUMEQUAL
        req.stack = {Bytes(sig_b.begin(), sig_b.end()), Bytes(sig_a.begin(), sig_a.end())};
        req.script = concat({push32(a->pubkey.data()), Bytes{OP_CHECKSIG},
                             push32(b->pubkey.data()), Bytes{OP_CHECKSIGADD},
                             Bytes{static_cast<uint8_t>(OP_1 + 1), OP_NUMEQUAL}});
        Bytes multisig = encode_request(req);
        out.push_back(multisig);

        // Same script with one signature missing (empty vector = "no signature")
        req.stack[0].clear();
        out.push_back(encode_request(req));

        // Corrupted copy of the complete spend
        out.push_back(flip_bit(multisig, rng));

        // Hash lock with a random preimage and an arithmetic tail
        Bytes preimage = random_bytes(rng, 1 + rng() % 64);
        crypto::HashEngine hash;
        Hash256 lock = hash.sha256(as_view(preimage));
        int64_t x = static_cast<int64_t>(rng() % 2000) - 1000;
        ScriptRequest lock_req;
        lock_req.sighash = req.sighash;
        lock_req.stack = {encode_num(x), preimage};
        lock_req.script = concat({Bytes{OP_SHA256}, push32(lock.data()), Bytes{OP_EQUALVERIFY},
                                  Bytes{OP_DUP, OP_ABS, OP_SWAP, OP_NEGATE, OP_ABS, OP_NUMEQUAL}});
        out.push_back(encode_request(lock_req));
    }
}

// Even batches hold only valid signatures, odd ones mix in corrupted copies
void synthesize_batches(std::mt19937_64& rng, size_t count, std::vector<Bytes>& out) {
    std::vector<Bytes> pool;
    synthesize_signatures(rng, count, pool);
    if (pool.size() < 2) return;

    for (size_t i = 0; i < count; i++) {
        size_t k = 1 + rng() % 12;
        std::vector<Bytes> items;
        for (size_t j = 0; j < k; j++) {
            size_t pick = (i % 2 == 0) ? 2 * (rng() % (pool.size() / 2)) : rng() % pool.size();
            items.push_back(pool[pick]);
        }
        out.push_back(encode_batch_input(items));
    }
}

// -----------------------------------------------------------------------------
// Mutation
// -----------------------------------------------------------------------------

Bytes mutate(const Bytes& in, const std::vector<Bytes>& pool, std::mt19937_64& rng) {
    Bytes b = in;
    switch (rng() % 7) {
        case 0:
            return flip_bit(b, rng);
        case 1:
            if (!b.empty()) b.resize(rng() % b.size());
            return b;
        case 2:
            append(b, as_view(random_bytes(rng, 1 + rng() % 33)));
            return b;
        case 3: {
            // Overwrite an aligned 32-byte word with a field or group edge
            if (b.size() < 32) return flip_bit(b, rng);
            static const Bytes edges[] = {bytes_of(SECP256K1_P), bytes_of(SECP256K1_N),
                                          Bytes(32, 0x00), Bytes(32, 0xFF)};
            const Bytes& e = edges[rng() % 4];
            size_t word = rng() % (b.size() / 32);
            std::copy(e.begin(), e.end(), b.begin() + word * 32);
            return b;
        }
        case 4: {
            // Splice the head of this item onto the tail of another
            const Bytes& other = pool[rng() % pool.size()];
            size_t cut_a = b.empty() ? 0 : rng() % (b.size() + 1);
            size_t cut_b = other.empty() ? 0 : rng() % (other.size() + 1);
            Bytes out(b.begin(), b.begin() + cut_a);
            out.insert(out.end(), other.begin() + cut_b, other.end());
            return out;
        }
        case 5:
            if (!b.empty()) b[rng() % b.size()] = static_cast<uint8_t>(rng());
            return b;
        default:
            for (int i = 0; i < 4; i++) b = flip_bit(b, rng);
            return b;
    }
}

}  // namespace

std::vector<Bytes> CorpusBuilder::boundary(Operation op) const {
    switch (op) {
        case Operation::SignatureVerification: return signature_boundary();
        case Operation::ScriptExecution:       return script_boundary();
        case Operation::DoubleSha256:          return hash_boundary();
        case Operation::MerkleRoot:            return merkle_boundary();
        case Operation::BatchVerification:     return batch_boundary();
    }
    return {};
}

std::vector<Bytes> CorpusBuilder::synthesized(Operation op, size_t count) const {
    std::mt19937_64 rng = make_rng(seed_, op, 1);
    std::vector<Bytes> out;
    switch (op) {
        case Operation::SignatureVerification:
            synthesize_signatures(rng, count, out);
            break;
        case Operation::ScriptExecution:
            synthesize_scripts(rng, count, out);
            break;
        case Operation::DoubleSha256:
            for (size_t i = 0; i < count; i++) out.push_back(random_bytes(rng, rng() % 300));
            break;
        case Operation::MerkleRoot:
            for (size_t i = 0; i < count; i++) out.push_back(random_bytes(rng, 32 * (1 + rng() % 40)));
            break;
        case Operation::BatchVerification:
            synthesize_batches(rng, count, out);
            break;
    }
    return out;
}

std::vector<Bytes> CorpusBuilder::fuzzed(Operation op, const std::vector<Bytes>& seeds, size_t count) const {
    std::vector<Bytes> out;
    if (seeds.empty()) return out;
    std::mt19937_64 rng = make_rng(seed_, op, 2);
    out.reserve(count);
    for (size_t i = 0; i < count; i++) {
        out.push_back(mutate(seeds[rng() % seeds.size()], seeds, rng));
    }
    return out;
}

Corpus CorpusBuilder::build(Operation op, size_t fuzz_iterations) const {
    Corpus corpus;
    corpus.operation = op;
    corpus.inputs = boundary(op);

    // Signing is slow; a handful of keys is enough to seed the fuzzer
    std::vector<Bytes> synth = synthesized(op, 8);
    corpus.inputs.insert(corpus.inputs.end(), synth.begin(), synth.end());

    std::vector<Bytes> fuzz = fuzzed(op, corpus.inputs, fuzz_iterations);
    corpus.inputs.insert(corpus.inputs.end(), fuzz.begin(), fuzz.end());
    return corpus;
}

}  // namespace verify
}  // namespace conhal
