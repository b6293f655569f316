/**
 * Representative inputs
 */

#include "sample_inputs.hpp"

#include "../crypto/hash_engine.hpp"
#include "../crypto/schnorr.hpp"
#include "../script/interpreter.hpp"
#include "execution_path.hpp"

#include <stdexcept>

namespace conhal {

const std::array<uint8_t, 32> SAMPLE_SECKEY = {
    0xB7, 0xE1, 0x51, 0x62, 0x8A, 0xED, 0x2A, 0x6A, 0xBF, 0x71, 0x58, 0x80, 0x9C, 0xF4, 0xF3, 0xC7,
    0x62, 0xE7, 0x16, 0x0F, 0x38, 0xB4, 0xDA, 0x56, 0xA7, 0x84, 0xD9, 0x04, 0x51, 0x90, 0xCF, 0xEF,
};

namespace {

Hash256 sample_message(uint8_t salt) {
    crypto::HashEngine hash;
    Bytes seed = {'c', 'o', 'n', 'h', 'a', 'l', salt};
    return hash.sha256(as_view(seed));
}

crypto::SchnorrSig sign_sample(const Hash256& msg) {
    Hash256 aux{};
    auto sig = crypto::schnorr_sign(ByteView(SAMPLE_SECKEY), as_view(msg), as_view(aux));
    if (!sig) throw std::runtime_error("sample signature could not be produced");
    return *sig;
}

crypto::XOnlyPubKey sample_pubkey() {
    auto pk = crypto::xonly_pubkey(ByteView(SAMPLE_SECKEY));
    if (!pk) throw std::runtime_error("sample key invalid");
    return *pk;
}

/**
 * Hash-locked signature spend:
 *   stack:  <preimage> <sig>
 *   script: <pubkey> CHECKSIGVERIFY SHA256 <hash> EQUAL
 */
Bytes sample_script_request() {
    crypto::HashEngine hash;
    Hash256 sighash = sample_message(1);
    crypto::SchnorrSig sig = sign_sample(sighash);
    crypto::XOnlyPubKey pk = sample_pubkey();

    Bytes preimage(32, 0x42);
    Hash256 lock = hash.sha256(as_view(preimage));

    script::ScriptRequest req;
    req.sighash = sighash;
    req.stack.push_back(preimage);
    req.stack.push_back(Bytes(sig.begin(), sig.end()));

    req.script.push_back(32);
    req.script.insert(req.script.end(), pk.begin(), pk.end());
    req.script.push_back(script::OP_CHECKSIGVERIFY);
    req.script.push_back(script::OP_SHA256);
    req.script.push_back(32);
    req.script.insert(req.script.end(), lock.begin(), lock.end());
    req.script.push_back(script::OP_EQUAL);

    return script::encode_request(req);
}

Bytes sample_signature_input(uint8_t salt) {
    Hash256 msg = sample_message(salt);
    crypto::SchnorrSig sig = sign_sample(msg);
    crypto::XOnlyPubKey pk = sample_pubkey();
    return encode_signature_input(as_view(msg), ByteView(pk), ByteView(sig));
}

}  // namespace

Bytes sample_input(Operation op) {
    switch (op) {
        case Operation::SignatureVerification:
            return sample_signature_input(0);
        case Operation::ScriptExecution:
            return sample_script_request();
        case Operation::DoubleSha256: {
            // Size of a typical one-input, two-output segwit transaction
            Bytes tx(222);
            for (size_t i = 0; i < tx.size(); i++) tx[i] = static_cast<uint8_t>(i * 131 + 7);
            return tx;
        }
        case Operation::MerkleRoot: {
            crypto::HashEngine hash;
            std::vector<Hash256> leaves(255);
            for (size_t i = 0; i < leaves.size(); i++) {
                Bytes seed = {static_cast<uint8_t>(i), static_cast<uint8_t>(i >> 8)};
                leaves[i] = hash.hash256(as_view(seed));
            }
            return encode_merkle_input(leaves);
        }
        case Operation::BatchVerification: {
            // The inputs of one small transaction
            std::vector<Bytes> items;
            for (uint8_t salt = 2; salt < 6; salt++) items.push_back(sample_signature_input(salt));
            return encode_batch_input(items);
        }
    }
    return {};
}

}  // namespace conhal
