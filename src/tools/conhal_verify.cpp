/**
 * Consensus Equivalence Verifier CLI
 *
 * Checks every backend against the Generic reference over the boundary,
 * synthesized and fuzzed corpora, then forces each advertised extension of
 * this host unusable and checks the fall-back. Exits 1 on any divergence.
 *
 * Usage:
 *   conhal_verify [options]
 *
 * Options:
 *   -n, --iterations  Fuzz iterations per operation (default: config, 256)
 *   -s, --seed        Fuzz seed (default: config, 0x5eed)
 *   -c, --config      Config file (default: ~/.conhal/config)
 *   -b, --benchmark   Print the benchmark report afterwards
 *   -t, --timing      Run the timing leakage check on signature verification
 *   -h, --help        Show this help message
 */

#include "../core/config.hpp"
#include "../core/logger.hpp"
#include "../engine/engine.hpp"
#include "../engine/sample_inputs.hpp"
#include "../verify/corpus.hpp"
#include "../verify/equivalence.hpp"

#include <getopt.h>

#include <chrono>
#include <iostream>

using namespace conhal;

void print_usage(const char* prog) {
    std::cout << "conhal Consensus Equivalence Verifier\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -n, --iterations  Fuzz iterations per operation (default: 256)\n"
              << "  -s, --seed        Fuzz seed (default: 0x5eed)\n"
              << "  -c, --config      Config file (default: ~/.conhal/config)\n"
              << "  -b, --benchmark   Print the benchmark report afterwards\n"
              << "  -t, --timing      Run the timing leakage check on signature verification\n"
              << "  -h, --help        Show this help message\n\n"
              << "Example:\n"
              << "  " << prog << " -n 4096 -s 42 --benchmark\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::optional<uint32_t> iterations;
    std::optional<uint64_t> seed;
    bool benchmark = false;
    bool timing = false;

    static struct option long_options[] = {
        {"iterations", required_argument, nullptr, 'n'},
        {"seed",       required_argument, nullptr, 's'},
        {"config",     required_argument, nullptr, 'c'},
        {"benchmark",  no_argument,       nullptr, 'b'},
        {"timing",     no_argument,       nullptr, 't'},
        {"help",       no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    try {
        int opt;
        while ((opt = getopt_long(argc, argv, "n:s:c:bth", long_options, nullptr)) != -1) {
            switch (opt) {
                case 'n': iterations = static_cast<uint32_t>(std::stoul(optarg)); break;
                case 's': seed = std::stoull(optarg, nullptr, 0); break;
                case 'c': config_path = optarg; break;
                case 'b': benchmark = true; break;
                case 't': timing = true; break;
                case 'h':
                default:
                    print_usage(argv[0]);
                    return opt == 'h' ? 0 : 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "[!] Invalid argument: " << e.what() << "\n";
        return 1;
    }

    EngineConfig config;
    Result status;
    if (config.load(config_path, &status) && !status.ok()) {
        std::cerr << "[!] Config: " << status.message << " (defaults kept)\n";
    }
    Logger::instance().init(config.log_dir);

    uint32_t fuzz_iterations = iterations.value_or(config.fuzz_iterations);
    uint64_t fuzz_seed = seed.value_or(config.fuzz_seed);

    try {
        Result engine_status;
        auto engine = ExecutionEngine::from_config(config, &engine_status,
            [](const DegradationEvent& ev) {
                std::cout << "[!] Degraded: " << ev.to_string() << "\n";
            });
        if (!engine_status.ok()) {
            std::cerr << "[!] Config: " << engine_status.message << "\n";
        }

        std::cout << "conhal Consensus Equivalence Verifier\n"
                  << "=====================================\n\n"
                  << "Host:\n"
                  << "  " << engine->detect_capabilities().summary() << "\n"
                  << "  Optimizer: " << engine->optimizer().name() << "\n"
                  << "  Verifier:  " << engine->verifier().name() << "\n\n"
                  << "Selected paths:\n";
        for (Operation op : ALL_OPERATIONS) {
            std::cout << "  " << to_string(op) << " -> "
                      << to_string(engine->create_optimized_path(op)->backend()) << "\n";
        }

        std::cout << "\n[*] Building corpora (seed=" << fuzz_seed
                  << ", fuzz=" << fuzz_iterations << ")...\n";
        verify::CorpusBuilder builder(fuzz_seed);
        std::vector<verify::Corpus> corpora;
        for (Operation op : ALL_OPERATIONS) {
            corpora.push_back(builder.build(op, fuzz_iterations));
        }

        auto start = std::chrono::steady_clock::now();
        size_t failures = 0;

        std::cout << "[*] Checking every backend against Generic...\n";
        for (const auto& report : verify::verify_all_backends(corpora)) {
            std::cout << (report.ok() ? "  [+] " : "  [!] ") << report.summary() << "\n";
            if (!report.ok()) {
                failures++;
                for (const auto& d : report.divergences) {
                    std::cout << "      " << d.to_string() << "\n";
                }
            }
        }

        std::cout << "[*] Checking degradation on this host...\n";
        for (const auto& check : verify::verify_degradation(engine->detect_capabilities(),
                                                            engine->shared_verifier(), corpora)) {
            std::cout << (check.ok() ? "  [+] " : "  [!] ") << check.summary() << "\n";
            if (!check.ok()) failures++;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::cout << "\nEquivalence checks finished in " << elapsed.count() << " ms\n";

        if (timing) {
            std::cout << "\n[*] Timing leakage check (valid vs. corrupted signatures)...\n";
            Bytes valid = sample_input(Operation::SignatureVerification);
            Bytes corrupted = valid;
            corrupted.back() ^= 0x01;
            PathHandle path = engine->create_optimized_path(Operation::SignatureVerification);
            auto t = verify::timing_leakage_check(*path, {valid}, {corrupted}, 2000);
            std::cout << "  " << path->describe() << ": t=" << t.t_statistic
                      << " (mean " << t.mean_a_ns << " ns vs " << t.mean_b_ns << " ns)"
                      << (t.suspicious() ? "  [!] above threshold" : "") << "\n";
        }

        if (benchmark) {
            std::cout << "\n[*] Benchmarking (" << config.benchmark_iterations << " iterations)...\n\n";
            BenchmarkSettings settings;
            settings.iterations = config.benchmark_iterations;
            settings.warmup = config.benchmark_warmup;
            std::cout << engine->benchmark_performance(settings).report();
        }

        if (failures > 0) {
            std::cout << "\n[!] " << failures << " check(s) FAILED: consensus divergence\n";
            LOG_ERROR("conhal_verify: " + std::to_string(failures) + " failed checks");
            return 1;
        }
        std::cout << "\n[+] All backends consensus-equivalent\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        LOG_ERROR(std::string("conhal_verify: ") + e.what());
        return 1;
    }
}
