/**
 * Dispatch Tests
 *
 * Optimizer selection per architecture: ladders, policy gating, degradation
 * events, the factory mapping, and totality over randomly generated
 * capability snapshots.
 */

#include "engine/backend.hpp"
#include "engine/engine.hpp"
#include "engine/optimizer.hpp"
#include "engine/sample_inputs.hpp"
#include "platform/capabilities.hpp"
#include "platform/feature_verifier.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <random>
#include <vector>

using namespace conhal;
using namespace conhal::platform;

static const TrustAdvertisedVerifier TRUST;

static HardwareCapabilities make_caps(Architecture arch, Vendor vendor,
                                      ExtensionSet vec, ExtensionSet crypto) {
    HardwareCapabilities caps;
    caps.architecture = arch;
    caps.vendor = vendor;
    caps.vector_extensions = vec;
    caps.crypto_extensions = crypto;
    return caps;
}

static HardwareCapabilities intel_full() {
    return make_caps(Architecture::X86_64, Vendor::Intel,
                     {Extension::AVX, Extension::AVX2, Extension::AVX512F}, {Extension::SHA_NI});
}

static MaskedFeatureVerifier masking(ExtensionSet masked) {
    return MaskedFeatureVerifier(std::make_shared<TrustAdvertisedVerifier>(), masked);
}

static bool contains(const std::vector<Backend>& v, Backend b) {
    return std::find(v.begin(), v.end(), b) != v.end();
}

void test_backend_table() {
    std::cout << "Testing backend table... ";

    for (Backend b : ALL_BACKENDS) {
        const BackendDescriptor& d = descriptor(b);
        assert(d.backend == b);
        assert(parse_backend(to_string(b)) == b);
        // Generic alone needs nothing
        assert(d.required.has_value() == (b != Backend::Generic));
        if (d.required) {
            assert(extension_architecture(*d.required) == d.architecture);
        }
    }
    assert(!parse_backend("Cuda"));

    std::cout << "PASS\n";
}

void test_scenario_arm_neon() {
    std::cout << "Testing AArch64 with NEON only... ";

    HardwareCapabilities caps = make_caps(Architecture::AArch64, Vendor::ARM, {Extension::NEON}, {});
    ExecutionEngine engine(caps);

    PathHandle path = engine.create_optimized_path(Operation::SignatureVerification);
    assert(path->backend() == Backend::ArmNeon);
    assert(path->operation() == Operation::SignatureVerification);

    Bytes input = sample_input(Operation::SignatureVerification);
    PathHandle generic = make_path(Operation::SignatureVerification, Backend::Generic);
    ExecutionOutput out = path->execute(as_view(input));
    assert(out.verdict == Verdict::Valid);
    assert(out == generic->execute(as_view(input)));

    std::cout << "PASS\n";
}

void test_scenario_x86_without_extensions() {
    std::cout << "Testing x86_64 without SIMD or crypto extensions... ";

    for (Vendor vendor : {Vendor::Intel, Vendor::AMD, Vendor::Other}) {
        ExecutionEngine engine(make_caps(Architecture::X86_64, vendor, {}, {}));
        PathHandle path = engine.create_optimized_path(Operation::ScriptExecution);
        assert(path->backend() == Backend::Generic);
        assert(engine.select_backend(Operation::ScriptExecution).degraded.empty());
    }

    // Nothing known about the host at all
    ExecutionEngine minimal(HardwareCapabilities::minimal());
    for (Operation op : ALL_OPERATIONS) {
        assert(minimal.create_optimized_path(op)->backend() == Backend::Generic);
    }

    std::cout << "PASS\n";
}

void test_factory_mapping() {
    std::cout << "Testing optimizer factory... ";

    auto is_intel = [](const HardwareCapabilities& c) {
        auto o = make_optimizer(c);
        return dynamic_cast<const IntelOptimizer*>(o.get()) != nullptr;
    };
    auto is_amd = [](const HardwareCapabilities& c) {
        auto o = make_optimizer(c);
        return dynamic_cast<const AmdOptimizer*>(o.get()) != nullptr;
    };
    auto is_arm = [](const HardwareCapabilities& c) {
        auto o = make_optimizer(c);
        return dynamic_cast<const ArmOptimizer*>(o.get()) != nullptr;
    };
    auto is_riscv = [](const HardwareCapabilities& c) {
        auto o = make_optimizer(c);
        return dynamic_cast<const RiscvOptimizer*>(o.get()) != nullptr;
    };
    auto is_generic = [](const HardwareCapabilities& c) {
        auto o = make_optimizer(c);
        return dynamic_cast<const GenericOptimizer*>(o.get()) != nullptr;
    };

    assert(is_intel(make_caps(Architecture::X86_64, Vendor::Intel, {}, {})));
    assert(is_amd(make_caps(Architecture::X86_64, Vendor::AMD, {}, {})));
    assert(is_generic(make_caps(Architecture::X86_64, Vendor::Other, {}, {})));
    assert(is_arm(make_caps(Architecture::AArch64, Vendor::ARM, {}, {})));
    assert(is_arm(make_caps(Architecture::AArch64, Vendor::Other, {}, {})));
    assert(is_riscv(make_caps(Architecture::RISCV64, Vendor::RISCV, {}, {})));
    assert(is_generic(make_caps(Architecture::Other, Vendor::Intel, {}, {})));
    assert(is_generic(HardwareCapabilities::minimal()));

    // Views
    HardwareCapabilities intel = intel_full();
    intel.core_count = 8;
    intel.thread_count = 16;
    IntelOptimizer io(intel);
    assert(io.view().avx && io.view().avx2 && io.view().avx512 && io.view().sha_ni);
    assert(!io.view().aes_ni);
    assert(io.view().hyperthreading);
    assert(io.name() == "intel(avx=avx512,sha_ni,ht)");

    AmdOptimizer ao(make_caps(Architecture::X86_64, Vendor::AMD, {Extension::AVX2}, {}));
    assert(ao.view().avx2 && !ao.view().sha_ni && !ao.view().smt);

    ArmOptimizer arm(make_caps(Architecture::AArch64, Vendor::ARM, {Extension::NEON, Extension::SVE},
                               {Extension::ARM_SHA2}));
    assert(arm.view().neon && arm.view().sve && arm.view().sha2);

    RiscvOptimizer rv(make_caps(Architecture::RISCV64, Vendor::RISCV, {Extension::RVV}, {}));
    assert(rv.view().vector && !rv.view().zknh);

    std::cout << "PASS\n";
}

void test_ladders() {
    std::cout << "Testing ladders... ";

    auto intel = make_optimizer(intel_full());
    auto amd = make_optimizer(make_caps(Architecture::X86_64, Vendor::AMD, {}, {}));
    auto arm = make_optimizer(make_caps(Architecture::AArch64, Vendor::ARM, {}, {}));
    auto riscv = make_optimizer(make_caps(Architecture::RISCV64, Vendor::RISCV, {}, {}));
    auto generic = make_optimizer(HardwareCapabilities::minimal());

    for (Operation op : ALL_OPERATIONS) {
        assert(intel->ladder(op) == std::vector<Backend>({Backend::IntelShaNi, Backend::IntelAvx512,
                                                          Backend::IntelAvx2, Backend::Generic}));
        assert(amd->ladder(op) == std::vector<Backend>({Backend::AmdShaNi, Backend::AmdAvx2,
                                                        Backend::Generic}));
        assert(arm->ladder(op) == std::vector<Backend>({Backend::ArmCrypto, Backend::ArmSve,
                                                        Backend::ArmNeon, Backend::Generic}));
        assert(riscv->ladder(op) == std::vector<Backend>({Backend::RiscvCrypto, Backend::RiscvVector,
                                                          Backend::Generic}));
        assert(generic->ladder(op) == std::vector<Backend>({Backend::Generic}));
    }

    std::cout << "PASS\n";
}

void test_best_rung_and_policy() {
    std::cout << "Testing rung choice under selection policies... ";

    SelectionPolicy all;
    SelectionPolicy no_wide;
    no_wide.allow_wide_vectors = false;
    SelectionPolicy no_crypto;
    no_crypto.allow_crypto_extensions = false;
    SelectionPolicy neither;
    neither.allow_wide_vectors = false;
    neither.allow_crypto_extensions = false;

    const Operation op = Operation::DoubleSha256;

    auto intel = make_optimizer(intel_full());
    assert(intel->select(op, all, TRUST).backend == Backend::IntelShaNi);
    assert(intel->select(op, no_wide, TRUST).backend == Backend::IntelShaNi);
    assert(intel->select(op, no_crypto, TRUST).backend == Backend::IntelAvx512);
    assert(intel->select(op, neither, TRUST).backend == Backend::IntelAvx2);

    // Policy skips are not degradations
    assert(intel->select(op, neither, TRUST).degraded.empty());

    auto amd = make_optimizer(make_caps(Architecture::X86_64, Vendor::AMD,
                                        {Extension::AVX2, Extension::AVX512F}, {Extension::SHA_NI}));
    assert(amd->select(op, all, TRUST).backend == Backend::AmdShaNi);
    assert(amd->select(op, no_crypto, TRUST).backend == Backend::AmdAvx2);

    auto arm = make_optimizer(make_caps(Architecture::AArch64, Vendor::ARM,
                                        {Extension::NEON, Extension::SVE}, {Extension::ARM_SHA2}));
    assert(arm->select(op, all, TRUST).backend == Backend::ArmCrypto);
    assert(arm->select(op, no_crypto, TRUST).backend == Backend::ArmSve);
    assert(arm->select(op, neither, TRUST).backend == Backend::ArmNeon);

    auto riscv = make_optimizer(make_caps(Architecture::RISCV64, Vendor::RISCV,
                                          {Extension::RVV}, {Extension::ZKNH}));
    assert(riscv->select(op, all, TRUST).backend == Backend::RiscvCrypto);
    assert(riscv->select(op, no_crypto, TRUST).backend == Backend::RiscvVector);

    // Extensions of another architecture are ignored
    auto confused = make_optimizer(make_caps(Architecture::AArch64, Vendor::ARM,
                                             {Extension::AVX2, Extension::AVX512F}, {Extension::SHA_NI}));
    assert(confused->select(op, all, TRUST).backend == Backend::Generic);

    // Policy derivation from a workload profile
    WorkloadProfile efficient;
    efficient.power_target = PowerTarget::Efficient;
    assert(!SelectionPolicy::from_profile(efficient).allow_wide_vectors);
    efficient.priority = Priority::Critical;
    assert(SelectionPolicy::from_profile(efficient).allow_wide_vectors);
    WorkloadProfile minimal_mem;
    minimal_mem.memory_target = MemoryTarget::Minimal;
    assert(!SelectionPolicy::from_profile(minimal_mem).allow_wide_vectors);
    WorkloadProfile no_sha;
    no_sha.custom_parameters["crypto_extensions"] = 0.0;
    assert(!SelectionPolicy::from_profile(no_sha).allow_crypto_extensions);
    assert(SelectionPolicy::from_profile(WorkloadProfile{}) == SelectionPolicy{});

    std::cout << "PASS\n";
}

void test_degradation_events() {
    std::cout << "Testing degradation events... ";

    const Operation op = Operation::SignatureVerification;
    auto intel = make_optimizer(intel_full());

    // SHA-NI advertised but unusable: one rung down
    MaskedFeatureVerifier no_sha = masking({Extension::SHA_NI});
    Selection sel = intel->select(op, SelectionPolicy{}, no_sha);
    assert(sel.backend == Backend::IntelAvx512);
    assert(sel.degraded.size() == 1);
    assert(sel.degraded[0] == (DegradationEvent{op, Backend::IntelShaNi, Backend::IntelAvx512,
                                                Extension::SHA_NI}));

    // Two unusable rungs: both reported, both pointing at the final choice
    MaskedFeatureVerifier no_sha_512 = masking({Extension::SHA_NI, Extension::AVX512F});
    sel = intel->select(op, SelectionPolicy{}, no_sha_512);
    assert(sel.backend == Backend::IntelAvx2);
    assert(sel.degraded.size() == 2);
    assert(sel.degraded[0].from == Backend::IntelShaNi);
    assert(sel.degraded[1].from == Backend::IntelAvx512);
    assert(sel.degraded[0].to == Backend::IntelAvx2 && sel.degraded[1].to == Backend::IntelAvx2);

    // A rung that is not advertised is skipped silently
    auto avx2_only = make_optimizer(make_caps(Architecture::X86_64, Vendor::Intel, {Extension::AVX2}, {}));
    assert(avx2_only->select(op, SelectionPolicy{}, no_sha_512).degraded.empty());

    // Masked and absent land on the same rung
    for (Extension ext : intel_full().advertised().list()) {
        MaskedFeatureVerifier masked = masking({ext});
        auto absent = make_optimizer(intel_full().without(ext));
        for (Operation o : ALL_OPERATIONS) {
            assert(intel->select(o, SelectionPolicy{}, masked).backend ==
                   absent->select(o, SelectionPolicy{}, TRUST).backend);
        }
    }

    // The engine reports through the listener; select_backend does not
    std::vector<DegradationEvent> heard;
    ExecutionEngine::Options options;
    options.verifier = std::make_shared<MaskedFeatureVerifier>(no_sha);
    options.on_degraded = [&heard](const DegradationEvent& ev) { heard.push_back(ev); };
    ExecutionEngine engine(intel_full(), options);

    Selection quiet = engine.select_backend(op);
    assert(quiet.degraded.size() == 1);
    assert(heard.empty());

    PathHandle path = engine.create_optimized_path(op);
    assert(path->backend() == Backend::IntelAvx512);
    assert(heard.size() == 1);
    assert(heard[0] == quiet.degraded[0]);

    std::cout << "PASS\n";
}

void test_select_below_and_reachable() {
    std::cout << "Testing select_below and reachable... ";

    const Operation op = Operation::MerkleRoot;
    auto intel = make_optimizer(intel_full());
    SelectionPolicy all;

    assert(intel->select_below(op, Backend::IntelShaNi, all, TRUST).backend == Backend::IntelAvx512);
    assert(intel->select_below(op, Backend::IntelAvx512, all, TRUST).backend == Backend::IntelAvx2);
    assert(intel->select_below(op, Backend::IntelAvx2, all, TRUST).backend == Backend::Generic);
    assert(intel->select_below(op, Backend::Generic, all, TRUST).backend == Backend::Generic);

    MaskedFeatureVerifier no_512 = masking({Extension::AVX512F});
    Selection below = intel->select_below(op, Backend::IntelShaNi, all, no_512);
    assert(below.backend == Backend::IntelAvx2);
    assert(below.degraded.size() == 1 && below.degraded[0].from == Backend::IntelAvx512);

    assert(intel->reachable(op, TRUST) == std::vector<Backend>({Backend::IntelShaNi, Backend::IntelAvx512,
                                                                Backend::IntelAvx2, Backend::Generic}));
    assert(intel->reachable(op, no_512) == std::vector<Backend>({Backend::IntelShaNi, Backend::IntelAvx2,
                                                                 Backend::Generic}));

    auto avx2_only = make_optimizer(make_caps(Architecture::X86_64, Vendor::Intel, {Extension::AVX2}, {}));
    assert(avx2_only->reachable(op, TRUST) == std::vector<Backend>({Backend::IntelAvx2, Backend::Generic}));

    std::cout << "PASS\n";
}

static HardwareCapabilities random_caps(std::mt19937_64& rng) {
    static const Architecture archs[] = {Architecture::X86_64, Architecture::AArch64,
                                         Architecture::RISCV64, Architecture::Other};
    static const Vendor vendors[] = {Vendor::Intel, Vendor::AMD, Vendor::ARM, Vendor::RISCV, Vendor::Other};

    HardwareCapabilities caps;
    caps.architecture = archs[rng() % 4];
    caps.vendor = vendors[rng() % 5];

    // Roughly one in five snapshots leaves the extension sets undetermined
    if (rng() % 5 != 0) {
        ExtensionSet all, vec, crypto;
        for (Extension e : ALL_EXTENSIONS) {
            if (rng() % 2) all.insert(e);
        }
        split_extensions(all, vec, crypto);
        caps.vector_extensions = vec;
        caps.crypto_extensions = crypto;
    }
    return caps;
}

static bool rung_allowed(Backend b, const SelectionPolicy& policy) {
    switch (descriptor(b).rung) {
        case RungKind::Generic:
        case RungKind::Vector:     return true;
        case RungKind::WideVector: return policy.allow_wide_vectors;
        case RungKind::Crypto:     return policy.allow_crypto_extensions;
    }
    return false;
}

void test_selection_totality() {
    std::cout << "Testing selection totality over random snapshots... ";

    std::mt19937_64 rng(0xC0FFEE);
    for (int round = 0; round < 2000; round++) {
        HardwareCapabilities caps = random_caps(rng);
        ExtensionSet mask;
        for (Extension e : ALL_EXTENSIONS) {
            if (rng() % 4 == 0) mask.insert(e);
        }
        MaskedFeatureVerifier verifier = masking(mask);
        SelectionPolicy policy;
        policy.allow_wide_vectors = rng() % 2;
        policy.allow_crypto_extensions = rng() % 2;

        auto optimizer = make_optimizer(caps);
        for (Operation op : ALL_OPERATIONS) {
            std::vector<Backend> ladder = optimizer->ladder(op);
            assert(!ladder.empty() && ladder.back() == Backend::Generic);

            Selection sel = optimizer->select(op, policy, verifier);
            assert(contains(ladder, sel.backend));

            const BackendDescriptor& d = descriptor(sel.backend);
            if (d.required) {
                assert(d.architecture == caps.architecture);
                assert(caps.advertises(*d.required));
                assert(verifier.usable(*d.required));
                assert(rung_allowed(sel.backend, policy));
            }

            for (const auto& ev : sel.degraded) {
                assert(ev.operation == op);
                assert(ev.to == sel.backend);
                assert(descriptor(ev.from).required == ev.extension);
                assert(caps.advertises(ev.extension));
                assert(!verifier.usable(ev.extension));
            }

            // Deterministic
            Selection again = optimizer->select(op, policy, verifier);
            assert(again.backend == sel.backend);
            assert(again.degraded == sel.degraded);

            // Anything selectable is reachable
            assert(contains(optimizer->reachable(op, verifier), sel.backend));
        }
    }

    std::cout << "PASS\n";
}

int main() {
    std::cout << "=== conhal Dispatch Tests ===\n\n";

    try {
        test_backend_table();
        test_scenario_arm_neon();
        test_scenario_x86_without_extensions();
        test_factory_mapping();
        test_ladders();
        test_best_rung_and_policy();
        test_degradation_events();
        test_select_below_and_reachable();
        test_selection_totality();

        std::cout << "\n=== All tests passed! ===\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nTest FAILED: " << e.what() << "\n";
        return 1;
    }
}
