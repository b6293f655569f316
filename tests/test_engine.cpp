/**
 * Execution Engine Tests
 *
 * Tuning state, isolation of issued paths from later tuning, path self-tests
 * and the walk past backends whose paths cannot be built, the benchmark,
 * relative backend speed, and construction from an EngineConfig.
 */

#include "core/config.hpp"
#include "core/errors.hpp"
#include "engine/benchmark.hpp"
#include "engine/engine.hpp"
#include "engine/sample_inputs.hpp"
#include "platform/feature_verifier.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <set>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace conhal;
using namespace conhal::platform;

static HardwareCapabilities intel_caps(bool sha_ni) {
    HardwareCapabilities caps;
    caps.architecture = Architecture::X86_64;
    caps.vendor = Vendor::Intel;
    caps.vector_extensions = ExtensionSet{Extension::AVX, Extension::AVX2, Extension::AVX512F};
    caps.crypto_extensions = sha_ni ? ExtensionSet{Extension::SHA_NI} : ExtensionSet{};
    return caps;
}

void test_tuning_state() {
    std::cout << "Testing tuning state... ";

    ExecutionEngine engine(intel_caps(true));
    assert(!engine.tuning());
    assert(engine.policy() == SelectionPolicy{});

    WorkloadProfile first;
    first.transaction_volume = 5000;
    first.power_target = PowerTarget::Efficient;
    engine.tune_for_workload(first);
    assert(engine.tuning() == first);
    assert(!engine.policy().allow_wide_vectors);

    // Re-tuning replaces the profile; there is no terminal state
    WorkloadProfile second;
    second.priority = Priority::Critical;
    second.custom_parameters["crypto_extensions"] = 0.0;
    engine.tune_for_workload(second);
    assert(engine.tuning() == second);
    assert(engine.policy().allow_wide_vectors);
    assert(!engine.policy().allow_crypto_extensions);

    engine.tune_for_workload(WorkloadProfile{});
    assert(engine.tuning() == WorkloadProfile{});
    assert(engine.policy() == SelectionPolicy{});

    std::cout << "PASS\n";
}

void test_tuning_does_not_touch_issued_paths() {
    std::cout << "Testing that tuning leaves issued paths alone... ";

    ExecutionEngine engine(intel_caps(true));
    const Operation op = Operation::SignatureVerification;
    Bytes input = sample_input(op);

    PathHandle before = engine.create_optimized_path(op);
    assert(before->backend() == Backend::IntelShaNi);
    ExecutionOutput expected = before->execute(as_view(input));

    WorkloadProfile no_crypto;
    no_crypto.custom_parameters["crypto_extensions"] = 0.0;
    engine.tune_for_workload(no_crypto);

    PathHandle after = engine.create_optimized_path(op);
    assert(after->backend() == Backend::IntelAvx512);
    assert(before->backend() == Backend::IntelShaNi);
    assert(before->execute(as_view(input)) == expected);
    assert(after->execute(as_view(input)) == expected);

    WorkloadProfile efficient;
    efficient.power_target = PowerTarget::Efficient;
    efficient.custom_parameters["crypto_extensions"] = 0.0;
    engine.tune_for_workload(efficient);
    assert(engine.create_optimized_path(op)->backend() == Backend::IntelAvx2);
    assert(after->backend() == Backend::IntelAvx512);

    std::cout << "PASS\n";
}

void test_paths_pass_self_test() {
    std::cout << "Testing path construction self-test... ";

    for (Operation op : ALL_OPERATIONS) {
        Bytes input = sample_input(op);
        ExecutionOutput reference = make_path(op, Backend::Generic)->execute(as_view(input));
        assert(reference.verdict == Verdict::Valid);
        for (Backend b : ALL_BACKENDS) {
            PathHandle path = make_path(op, b);
            assert(path->operation() == op && path->backend() == b);
            assert(path->execute(as_view(input)) == reference);
        }
    }

    // The batch sample reports one verdict per signature
    ExecutionOutput batch = make_path(Operation::BatchVerification, Backend::IntelAvx512)
                                ->execute(as_view(sample_input(Operation::BatchVerification)));
    assert(batch_verdicts(batch) == std::vector<Verdict>(4, Verdict::Valid));

    std::cout << "PASS\n";
}

/**
 * make_path, except that the listed backends fail as if their kernels had
 * failed the construction self-test.
 */
static PathFactory failing_factory(std::set<Backend> broken) {
    return [broken](Operation op, Backend b) -> PathHandle {
        if (broken.count(b)) throw BackendUnavailable(std::string(to_string(b)) + " self-test failed");
        return make_path(op, b);
    };
}

void test_unbuildable_backend_falls_one_rung() {
    std::cout << "Testing fall-back past a backend that cannot be built... ";

    std::vector<DegradationEvent> heard;
    ExecutionEngine::Options options;
    options.path_factory = failing_factory({Backend::IntelShaNi});
    options.on_degraded = [&heard](const DegradationEvent& ev) { heard.push_back(ev); };
    ExecutionEngine engine(intel_caps(true), options);

    // Selection itself is unaware of the failure
    assert(engine.select_backend(Operation::SignatureVerification).backend == Backend::IntelShaNi);

    for (Operation op : ALL_OPERATIONS) {
        heard.clear();
        PathHandle path = engine.create_optimized_path(op);
        assert(path->backend() == Backend::IntelAvx512);
        assert(heard.size() == 1);
        assert(heard[0].operation == op);
        assert(heard[0].from == Backend::IntelShaNi);
        assert(heard[0].to == Backend::IntelAvx512);
        assert(heard[0].extension == Extension::SHA_NI);

        Bytes input = sample_input(op);
        assert(path->execute(as_view(input)) == make_path(op, Backend::Generic)->execute(as_view(input)));
    }

    // Two broken rungs: one event per skipped rung
    heard.clear();
    ExecutionEngine::Options two;
    two.path_factory = failing_factory({Backend::IntelShaNi, Backend::IntelAvx512});
    two.on_degraded = [&heard](const DegradationEvent& ev) { heard.push_back(ev); };
    ExecutionEngine engine2(intel_caps(true), two);
    assert(engine2.create_optimized_path(Operation::DoubleSha256)->backend() == Backend::IntelAvx2);
    assert(heard.size() == 2);
    assert(heard[0].from == Backend::IntelShaNi && heard[0].to == Backend::IntelAvx512);
    assert(heard[1].from == Backend::IntelAvx512 && heard[1].to == Backend::IntelAvx2);
    assert(heard[1].extension == Extension::AVX512F);

    // Nothing builds: the engine reports it rather than inventing a path
    ExecutionEngine::Options none;
    none.path_factory = failing_factory(std::set<Backend>(ALL_BACKENDS.begin(), ALL_BACKENDS.end()));
    ExecutionEngine engine3(intel_caps(true), none);
    bool threw = false;
    try {
        engine3.create_optimized_path(Operation::MerkleRoot);
    } catch (const BackendUnavailable&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASS\n";
}

void test_concurrent_tuning() {
    std::cout << "Testing concurrent tuning and selection... ";

    ExecutionEngine engine(intel_caps(true));
    const Operation op = Operation::DoubleSha256;
    Bytes input = sample_input(op);
    ExecutionOutput expected = make_path(op, Backend::Generic)->execute(as_view(input));

    std::atomic<bool> failed{false};
    std::vector<std::thread> threads;

    threads.emplace_back([&engine]() {
        for (int i = 0; i < 200; i++) {
            WorkloadProfile p;
            p.transaction_volume = uint64_t(i);
            if (i % 2) p.custom_parameters["crypto_extensions"] = 0.0;
            engine.tune_for_workload(p);
        }
    });

    for (int t = 0; t < 3; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; i++) {
                PathHandle path = engine.create_optimized_path(op);
                Backend b = path->backend();
                if (b != Backend::IntelShaNi && b != Backend::IntelAvx512) failed = true;
                if (path->execute(as_view(input)) != expected) failed = true;
            }
        });
    }

    for (auto& t : threads) t.join();
    assert(!failed);

    std::cout << "PASS\n";
}

void test_benchmark_shape() {
    std::cout << "Testing benchmark output... ";

    ExecutionEngine engine(intel_caps(true));
    BenchmarkSettings settings;
    settings.iterations = 3;
    settings.warmup = 1;

    PerformanceMetrics m = engine.benchmark_performance(settings);

    size_t expected_pairs = 0;
    for (Operation op : ALL_OPERATIONS) expected_pairs += engine.reachable_backends(op).size();
    assert(m.samples.size() == expected_pairs);
    assert(expected_pairs == 20);

    for (const auto& s : m.samples) {
        assert(s.iterations == 3);
        assert(s.mean_ns > 0.0 && s.min_ns > 0.0 && s.min_ns <= s.mean_ns);
        assert(s.ops_per_sec > 0.0);
    }

    // Summary rates come from the selected backends
    assert(m.signature_verifications_per_sec ==
           m.find(Operation::SignatureVerification, Backend::IntelShaNi)->ops_per_sec);
    assert(m.hashes_per_sec == m.find(Operation::DoubleSha256, Backend::IntelShaNi)->ops_per_sec);
    assert(m.batches_per_sec == m.find(Operation::BatchVerification, Backend::IntelShaNi)->ops_per_sec);
    assert(m.find(Operation::MerkleRoot, Backend::Generic) != nullptr);
    assert(!m.find(Operation::MerkleRoot, Backend::ArmNeon));

    std::string report = m.report();
    assert(report.find("IntelAvx512") != std::string::npos);
    assert(report.find("Signature verifications/sec") != std::string::npos);
    assert(report.find("Batches/sec") != std::string::npos);

    std::cout << "PASS\n";
}

/**
 * Path whose output changes on every call.
 */
class FlakyPath : public ExecutionPath {
public:
    ExecutionOutput execute(ByteView) const override {
        ExecutionOutput out;
        out.verdict = Verdict::Valid;
        out.data.push_back(static_cast<uint8_t>(calls_++));
        return out;
    }
    Operation operation() const override { return Operation::DoubleSha256; }
    Backend backend() const override { return Backend::IntelAvx2; }

private:
    mutable std::atomic<uint32_t> calls_{0};
};

void test_benchmark_rejects_nondeterminism() {
    std::cout << "Testing benchmark determinism check... ";

    FlakyPath flaky;
    Bytes input = {1, 2, 3};
    bool threw = false;
    try {
        benchmark_path(flaky, as_view(input), BenchmarkSettings{});
    } catch (const EquivalenceViolation&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASS\n";
}

void test_vector_rung_outpaces_generic() {
    std::cout << "Testing relative speed of AVX-512, AVX2 and Generic... ";

    // AVX2 and AVX-512 advertised, no SHA-NI
    ExecutionEngine engine(intel_caps(false));
    assert(engine.create_optimized_path(Operation::SignatureVerification)->backend() == Backend::IntelAvx512);

    BenchmarkSettings settings;
    settings.iterations = 40;
    settings.warmup = 4;

    const Operation op = Operation::SignatureVerification;
    const int trials = 5;
    int avx2_wins = 0;
    int avx512_wins = 0;
    for (int t = 0; t < trials; t++) {
        auto samples = run_benchmark({{op, Backend::Generic}, {op, Backend::IntelAvx2},
                                      {op, Backend::IntelAvx512}}, settings);
        assert(samples.size() == 3);
        if (samples[1].min_ns <= samples[0].min_ns) avx2_wins++;
        if (samples[2].min_ns <= samples[1].min_ns) avx512_wins++;
    }
    assert(avx2_wins * 2 > trials);
    assert(avx512_wins * 2 > trials);

    std::cout << "PASS\n";
    std::cout << "  AVX2 <= Generic in " << avx2_wins << "/" << trials
              << ", AVX-512 <= AVX2 in " << avx512_wins << "/" << trials << "\n";
}

void test_config_parsing() {
    std::cout << "Testing config parsing... ";

    std::stringstream good(
        "# comment\n"
        "masked_extensions = avx512f, sha_ni\n"
        "benchmark_iterations=500\n"
        "fuzz_seed=0x10\n"
        "priority=high\n"
        "power_target=efficient\n");
    EngineConfig cfg;
    Result r = cfg.parse(good);
    assert(r.ok());
    assert(cfg.masked_extensions == std::vector<std::string>({"avx512f", "sha_ni"}));
    assert(cfg.benchmark_iterations == 500);
    assert(cfg.fuzz_seed == 16);
    assert(cfg.priority == "high");
    assert(cfg.power_target == "efficient");
    assert(cfg.memory_target.empty());

    // The first error is reported, later keys still apply, bad values keep defaults
    std::stringstream bad(
        "benchmark_iterations=0\n"
        "priority=urgent\n"
        "no equals sign\n"
        "fuzz_iterations=4294967296\n"
        "benchmark_warmup=3\n");
    EngineConfig cfg2;
    r = cfg2.parse(bad);
    assert(!r.ok());
    assert(r.code == ErrorCode::ConfigError);
    assert(r.message.find("benchmark_iterations") != std::string::npos);
    assert(cfg2.benchmark_iterations == 200);
    assert(cfg2.priority.empty());
    assert(cfg2.fuzz_iterations == 256);
    assert(cfg2.benchmark_warmup == 3);

    std::stringstream not_a_number("benchmark_iterations=12x\n");
    EngineConfig cfg4;
    assert(!cfg4.parse(not_a_number).ok());
    assert(cfg4.benchmark_iterations == 200);

    std::stringstream unknown("turbo=on\n");
    EngineConfig cfg3;
    assert(!cfg3.parse(unknown).ok());

    // save / load
    std::filesystem::path path = std::filesystem::temp_directory_path() /
                                 ("conhal_config_" + std::to_string(::getpid()));
    assert(cfg.save(path.string()));
    EngineConfig loaded;
    Result status;
    assert(loaded.load(path.string(), &status));
    assert(status.ok());
    assert(loaded.masked_extensions == cfg.masked_extensions);
    assert(loaded.benchmark_iterations == 500);
    assert(loaded.fuzz_seed == 16);
    assert(loaded.priority == "high");
    std::filesystem::remove(path);

    assert(!EngineConfig().load("/nonexistent/conhal/config"));

    std::cout << "PASS\n";
}

void test_engine_from_config() {
    std::cout << "Testing engine construction from config... ";

    EngineConfig cfg;
    cfg.masked_extensions = {"avx512f", "bogus"};
    cfg.priority = "critical";
    cfg.power_target = "efficient";

    Result status;
    auto engine = ExecutionEngine::from_config(cfg, &status);
    assert(engine);
    assert(status.code == ErrorCode::ConfigError);
    assert(status.message.find("bogus") != std::string::npos);
    assert(engine->verifier().name().find("masked[avx512f]") != std::string::npos);
    assert(!engine->verifier().usable(Extension::AVX512F));

    auto profile = engine->tuning();
    assert(profile);
    assert(profile->priority == Priority::Critical);
    assert(profile->power_target == PowerTarget::Efficient);
    assert(profile->memory_target == MemoryTarget::Balanced);

    // Whatever this host is, every operation gets a working path
    for (Operation op : ALL_OPERATIONS) {
        Bytes input = sample_input(op);
        PathHandle path = engine->create_optimized_path(op);
        assert(path->backend() != Backend::IntelAvx512);
        assert(path->execute(as_view(input)) ==
               make_path(op, Backend::Generic)->execute(as_view(input)));
    }

    // No workload keys: untuned
    Result clean;
    auto untuned = ExecutionEngine::from_config(EngineConfig{}, &clean);
    assert(clean.ok());
    assert(!untuned->tuning());

    std::cout << "PASS\n";
}

int main() {
    std::cout << "=== conhal Execution Engine Tests ===\n\n";

    try {
        test_tuning_state();
        test_tuning_does_not_touch_issued_paths();
        test_paths_pass_self_test();
        test_unbuildable_backend_falls_one_rung();
        test_concurrent_tuning();
        test_benchmark_shape();
        test_benchmark_rejects_nondeterminism();
        test_vector_rung_outpaces_generic();
        test_config_parsing();
        test_engine_from_config();

        std::cout << "\n=== All tests passed! ===\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nTest FAILED: " << e.what() << "\n";
        return 1;
    }
}
