/**
 * Benchmark implementation
 */

#include "benchmark.hpp"

#include "../core/errors.hpp"
#include "../core/logger.hpp"
#include "sample_inputs.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>

namespace conhal {

BenchmarkSample benchmark_path(const ExecutionPath& path, ByteView input,
                               const BenchmarkSettings& settings) {
    using clock = std::chrono::steady_clock;

    BenchmarkSample sample;
    sample.operation = path.operation();
    sample.backend = path.backend();
    sample.iterations = std::max<uint32_t>(settings.iterations, 1);

    // Results are compared so the calls cannot be optimized away
    ExecutionOutput expected = path.execute(input);
    for (uint32_t i = 1; i < settings.warmup; i++) {
        if (path.execute(input) != expected) {
            throw EquivalenceViolation(path.describe() + " is not deterministic");
        }
    }

    double total_ns = 0.0;
    double min_ns = std::numeric_limits<double>::max();
    for (uint32_t i = 0; i < sample.iterations; i++) {
        auto start = clock::now();
        ExecutionOutput out = path.execute(input);
        auto end = clock::now();
        if (out != expected) {
            throw EquivalenceViolation(path.describe() + " is not deterministic");
        }
        double ns = std::chrono::duration<double, std::nano>(end - start).count();
        total_ns += ns;
        min_ns = std::min(min_ns, ns);
    }

    sample.mean_ns = total_ns / sample.iterations;
    sample.min_ns = min_ns;
    sample.ops_per_sec = sample.mean_ns > 0.0 ? 1e9 / sample.mean_ns : 0.0;
    return sample;
}

std::vector<BenchmarkSample> run_benchmark(const std::vector<std::pair<Operation, Backend>>& pairs,
                                           const BenchmarkSettings& settings) {
    std::map<Operation, Bytes> inputs;
    std::vector<BenchmarkSample> samples;

    for (const auto& [op, backend] : pairs) {
        auto it = inputs.find(op);
        if (it == inputs.end()) it = inputs.emplace(op, sample_input(op)).first;

        PathHandle path;
        try {
            path = make_path(op, backend);
        } catch (const BackendUnavailable& e) {
            LOG_WARN(std::string("BENCHMARK: skipping ") + to_string(op) + "@" +
                     to_string(backend) + ": " + e.what());
            continue;
        }

        BenchmarkSample s = benchmark_path(*path, as_view(it->second), settings);
        std::stringstream ss;
        ss << "BENCHMARK: " << path->describe() << " mean=" << std::fixed << std::setprecision(0)
           << s.mean_ns << "ns min=" << s.min_ns << "ns";
        LOG_DEBUG(ss.str());
        samples.push_back(s);
    }
    return samples;
}

std::string PerformanceMetrics::report() const {
    std::stringstream ss;
    ss << std::left << std::setw(24) << "Operation"
       << std::setw(14) << "Backend"
       << std::right << std::setw(14) << "Mean (ns)"
       << std::setw(14) << "Min (ns)"
       << std::setw(14) << "Ops/sec" << "\n";
    ss << std::string(80, '-') << "\n";

    ss << std::fixed << std::setprecision(0);
    for (const auto& s : samples) {
        ss << std::left << std::setw(24) << to_string(s.operation)
           << std::setw(14) << to_string(s.backend)
           << std::right << std::setw(14) << s.mean_ns
           << std::setw(14) << s.min_ns
           << std::setw(14) << s.ops_per_sec << "\n";
    }

    ss << "\n";
    ss << "Selected paths:\n";
    ss << "  Signature verifications/sec: " << signature_verifications_per_sec << "\n";
    ss << "  Script executions/sec:       " << script_executions_per_sec << "\n";
    ss << "  Hashes/sec:                  " << hashes_per_sec << "\n";
    ss << "  Merkle roots/sec:            " << merkle_roots_per_sec << "\n";
    ss << "  Batches/sec:                 " << batches_per_sec << "\n";
    return ss.str();
}

}  // namespace conhal
