/**
 * Validation Adapter Tests
 *
 * A small consensus domain driven through HardwareAcceleratedValidation on
 * several simulated hosts, and on engines whose paths cannot be built for
 * some or all backends. Every host must reach the same decisions.
 */

#include "adapter/accelerated_validation.hpp"
#include "adapter/validation_port.hpp"
#include "core/errors.hpp"
#include "crypto/hash_engine.hpp"
#include "crypto/schnorr.hpp"
#include "engine/engine.hpp"
#include "engine/sample_inputs.hpp"
#include "script/interpreter.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

using namespace conhal;
using namespace conhal::platform;

/**
 * Checks txids, signatures, scripts and the merkle root using only the
 * paths in the context, and keeps a chain tip for connect_block. Signatures
 * go through the batch path when every one is well sized.
 */
class TestDomain : public ConsensusDomain {
public:
    ValidationOutcome validate_transaction(const TransactionCheck& tx, const ValidationContext& ctx) override {
        ExecutionOutput id = ctx.hash->execute(as_view(tx.serialized));
        if (id.data != Bytes(tx.txid.begin(), tx.txid.end())) {
            return ValidationOutcome::reject("txid mismatch");
        }
        bool batchable = !tx.signature_inputs.empty() &&
                         std::all_of(tx.signature_inputs.begin(), tx.signature_inputs.end(),
                                     [](const Bytes& in) { return in.size() == SIGNATURE_INPUT_SIZE; });
        if (batchable) {
            ExecutionOutput out = ctx.batch->execute(as_view(encode_batch_input(tx.signature_inputs)));
            std::vector<Verdict> verdicts = batch_verdicts(out);
            if (verdicts.size() != tx.signature_inputs.size()) return ValidationOutcome::reject("batch malformed");
            for (size_t i = 0; i < verdicts.size(); i++) {
                if (verdicts[i] != Verdict::Valid) {
                    return ValidationOutcome::reject("signature " + std::to_string(i) + " " + to_string(verdicts[i]));
                }
            }
            batched++;
        } else {
            for (size_t i = 0; i < tx.signature_inputs.size(); i++) {
                ExecutionOutput out = ctx.signature->execute(as_view(tx.signature_inputs[i]));
                if (out.verdict != Verdict::Valid) {
                    return ValidationOutcome::reject("signature " + std::to_string(i) + " " + to_string(out.verdict));
                }
            }
        }
        for (size_t i = 0; i < tx.script_inputs.size(); i++) {
            ExecutionOutput out = ctx.script->execute(as_view(tx.script_inputs[i]));
            if (out.verdict != Verdict::Valid) {
                auto err = script_error(out);
                return ValidationOutcome::reject("script " + std::to_string(i) + " " +
                                                 (err ? script::to_string(*err) : "malformed"));
            }
        }
        seen_backends.push_back(ctx.signature->backend());
        return ValidationOutcome::accept();
    }

    ValidationOutcome validate_block(const BlockCheck& block, const ValidationContext& ctx) override {
        if (block.transactions.empty()) return ValidationOutcome::reject("empty block");

        std::vector<Hash256> txids;
        for (const auto& tx : block.transactions) {
            ValidationOutcome o = validate_transaction(tx, ctx);
            if (!o.accepted) return o;
            txids.push_back(tx.txid);
        }

        ExecutionOutput root = ctx.merkle->execute(as_view(encode_merkle_input(txids)));
        if (root.data != Bytes(block.declared_merkle_root.begin(), block.declared_merkle_root.end())) {
            return ValidationOutcome::reject("bad merkle root");
        }
        return ValidationOutcome::accept();
    }

    ValidationOutcome apply_block(const BlockCheck& block, const ValidationContext& ctx) override {
        if (block.height != tip + 1) return ValidationOutcome::reject("does not extend tip");
        ValidationOutcome o = validate_block(block, ctx);
        if (o.accepted) tip = block.height;
        return o;
    }

    uint32_t tip = 0;
    size_t batched = 0;
    std::vector<Backend> seen_backends;
};

// -----------------------------------------------------------------------------
// Fixtures
// -----------------------------------------------------------------------------

static const crypto::HashEngine REF;

static TransactionCheck make_tx(uint8_t tag) {
    TransactionCheck tx;
    tx.serialized = Bytes(120 + tag, tag);
    tx.txid = REF.hash256(as_view(tx.serialized));

    Bytes seckey(32, 0);
    seckey[31] = static_cast<uint8_t>(tag + 1);
    Bytes aux(32, tag);
    Hash256 sighash = REF.sha256(as_view(tx.serialized));
    auto pk = crypto::xonly_pubkey(as_view(seckey));
    auto sig = crypto::schnorr_sign(as_view(seckey), as_view(sighash), as_view(aux));
    assert(pk && sig);
    tx.signature_inputs.push_back(encode_signature_input(as_view(sighash), ByteView(*pk), ByteView(*sig)));
    tx.script_inputs.push_back(sample_input(Operation::ScriptExecution));
    return tx;
}

static BlockCheck make_block(uint32_t height, size_t tx_count) {
    BlockCheck block;
    block.height = height;
    std::vector<Hash256> txids;
    for (size_t i = 0; i < tx_count; i++) {
        block.transactions.push_back(make_tx(static_cast<uint8_t>(height * 16 + i)));
        txids.push_back(block.transactions.back().txid);
    }
    block.declared_merkle_root = crypto::merkle_root(REF, txids);
    return block;
}

static HardwareCapabilities caps_for(Architecture arch, Vendor vendor, ExtensionSet vec, ExtensionSet crypto) {
    HardwareCapabilities caps;
    caps.architecture = arch;
    caps.vendor = vendor;
    caps.vector_extensions = vec;
    caps.crypto_extensions = crypto;
    return caps;
}

static std::vector<HardwareCapabilities> simulated_hosts() {
    return {
        HardwareCapabilities::minimal(),
        caps_for(Architecture::X86_64, Vendor::Intel,
                 {Extension::AVX2, Extension::AVX512F}, {Extension::SHA_NI}),
        caps_for(Architecture::X86_64, Vendor::AMD, {Extension::AVX2}, {}),
        caps_for(Architecture::AArch64, Vendor::ARM, {Extension::NEON}, {}),
        caps_for(Architecture::AArch64, Vendor::ARM, {Extension::NEON, Extension::SVE}, {Extension::ARM_SHA2}),
        caps_for(Architecture::RISCV64, Vendor::RISCV, {Extension::RVV}, {Extension::ZKNH}),
    };
}

/**
 * Run a fixed sequence of submissions and collect the outcomes.
 */
static std::vector<ValidationOutcome> run_scenario(ValidationPort& port) {
    std::vector<ValidationOutcome> out;

    TransactionCheck good = make_tx(7);
    out.push_back(port.submit_transaction(good));

    TransactionCheck bad_sig = make_tx(8);
    bad_sig.signature_inputs[0].back() ^= 0x01;
    out.push_back(port.submit_transaction(bad_sig));

    TransactionCheck short_sig = make_tx(9);
    short_sig.signature_inputs[0].pop_back();
    out.push_back(port.submit_transaction(short_sig));

    TransactionCheck bad_script = make_tx(10);
    script::ScriptRequest req;
    req.script = {script::OP_1, script::OP_1};
    bad_script.script_inputs[0] = script::encode_request(req);
    out.push_back(port.submit_transaction(bad_script));

    TransactionCheck bad_txid = make_tx(11);
    bad_txid.txid[0] ^= 0xFF;
    out.push_back(port.submit_transaction(bad_txid));

    out.push_back(port.submit_block(make_block(1, 3)));

    BlockCheck wrong_root = make_block(1, 3);
    wrong_root.declared_merkle_root[5] ^= 0x10;
    out.push_back(port.submit_block(wrong_root));

    out.push_back(port.connect_block(make_block(1, 2)));
    out.push_back(port.connect_block(make_block(1, 2)));     // already connected
    out.push_back(port.connect_block(make_block(2, 5)));
    return out;
}

void test_outcomes() {
    std::cout << "Testing validation outcomes... ";

    ExecutionEngine engine(HardwareCapabilities::minimal());
    TestDomain domain;
    HardwareAcceleratedValidation port(engine, domain);

    std::vector<ValidationOutcome> out = run_scenario(port);
    assert(out.size() == 10);
    assert(out[0] == ValidationOutcome::accept());
    assert(out[1] == ValidationOutcome::reject("signature 0 Invalid"));
    assert(out[2] == ValidationOutcome::reject("signature 0 Malformed"));
    assert(out[3] == ValidationOutcome::reject("script 0 cleanstack"));
    assert(out[4] == ValidationOutcome::reject("txid mismatch"));
    assert(out[5] == ValidationOutcome::accept());
    assert(out[6] == ValidationOutcome::reject("bad merkle root"));
    assert(out[7] == ValidationOutcome::accept());
    assert(out[8] == ValidationOutcome::reject("does not extend tip"));
    assert(out[9] == ValidationOutcome::accept());
    assert(domain.tip == 2);
    assert(domain.batched > 0);

    std::cout << "PASS\n";
}

void test_identical_decisions_across_hosts() {
    std::cout << "Testing identical decisions across simulated hosts... ";

    std::vector<ValidationOutcome> reference;
    std::vector<Backend> used;

    for (const auto& caps : simulated_hosts()) {
        ExecutionEngine engine(caps);
        TestDomain domain;
        HardwareAcceleratedValidation port(engine, domain);

        std::vector<ValidationOutcome> out = run_scenario(port);
        if (reference.empty()) {
            reference = out;
        } else {
            assert(out == reference);
        }
        assert(!domain.seen_backends.empty());
        used.push_back(domain.seen_backends.front());
    }

    // The hosts really did run on different backends
    assert(used.front() == Backend::Generic);
    assert(used[1] == Backend::IntelShaNi);
    assert(used[2] == Backend::AmdAvx2);
    assert(used[3] == Backend::ArmNeon);
    assert(used[4] == Backend::ArmCrypto);
    assert(used[5] == Backend::RiscvCrypto);

    std::cout << "PASS\n";
}

void test_refresh_context() {
    std::cout << "Testing context refresh after tuning... ";

    ExecutionEngine engine(caps_for(Architecture::X86_64, Vendor::Intel,
                                    {Extension::AVX2, Extension::AVX512F}, {Extension::SHA_NI}));
    TestDomain domain;
    HardwareAcceleratedValidation port(engine, domain);

    auto before = port.context();
    assert(before->signature->backend() == Backend::IntelShaNi);
    assert(before->backend_summary().find("MerkleRoot=IntelShaNi") != std::string::npos);

    WorkloadProfile profile;
    profile.power_target = PowerTarget::Efficient;
    profile.custom_parameters["crypto_extensions"] = 0.0;
    engine.tune_for_workload(profile);

    // Not picked up until refreshed
    assert(port.context() == before);

    port.refresh_context();
    auto after = port.context();
    assert(after != before);
    for (Operation op : ALL_OPERATIONS) {
        assert(after->path(op).backend() == Backend::IntelAvx2);
        assert(before->path(op).backend() == Backend::IntelShaNi);
    }

    // Still the same decisions
    assert(port.submit_block(make_block(3, 4)) == ValidationOutcome::accept());

    std::cout << "PASS\n";
}

static PathFactory failing_factory(std::vector<Backend> broken) {
    return [broken](Operation op, Backend b) -> PathHandle {
        if (std::find(broken.begin(), broken.end(), b) != broken.end()) {
            throw BackendUnavailable(std::string(to_string(b)) + " self-test failed");
        }
        return make_path(op, b);
    };
}

void test_unbuildable_paths() {
    std::cout << "Testing validation on engines with unbuildable paths... ";

    HardwareCapabilities intel = caps_for(Architecture::X86_64, Vendor::Intel,
                                          {Extension::AVX2, Extension::AVX512F}, {Extension::SHA_NI});

    ExecutionEngine healthy(intel);
    TestDomain healthy_domain;
    HardwareAcceleratedValidation healthy_port(healthy, healthy_domain);
    std::vector<ValidationOutcome> reference = run_scenario(healthy_port);

    // SHA-NI kernels unavailable: the engine settles one rung down
    std::vector<DegradationEvent> heard;
    ExecutionEngine::Options one;
    one.path_factory = failing_factory({Backend::IntelShaNi});
    one.on_degraded = [&heard](const DegradationEvent& ev) { heard.push_back(ev); };
    ExecutionEngine shani_broken(intel, one);
    TestDomain domain1;
    HardwareAcceleratedValidation port1(shani_broken, domain1);
    for (Operation op : ALL_OPERATIONS) {
        assert(port1.context()->path(op).backend() == Backend::IntelAvx512);
    }
    assert(heard.size() == ALL_OPERATIONS.size());
    assert(run_scenario(port1) == reference);

    // Nothing builds through the engine: the context is all Generic
    ExecutionEngine::Options none;
    none.path_factory = failing_factory(std::vector<Backend>(ALL_BACKENDS.begin(), ALL_BACKENDS.end()));
    ExecutionEngine all_broken(intel, none);
    TestDomain domain2;
    HardwareAcceleratedValidation port2(all_broken, domain2);
    for (Operation op : ALL_OPERATIONS) {
        assert(port2.context()->path(op).backend() == Backend::Generic);
    }
    assert(run_scenario(port2) == reference);
    assert(domain2.batched > 0);

    std::cout << "PASS\n";
}

int main() {
    std::cout << "=== conhal Validation Adapter Tests ===\n\n";

    try {
        test_outcomes();
        test_identical_decisions_across_hosts();
        test_refresh_context();
        test_unbuildable_paths();

        std::cout << "\n=== All tests passed! ===\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nTest FAILED: " << e.what() << "\n";
        return 1;
    }
}
