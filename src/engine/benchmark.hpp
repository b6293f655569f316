/**
 * conhal Benchmark
 *
 * Fixed micro-benchmark over (operation, backend) pairs. Each pair runs the
 * representative input for its operation: a warmup, then `iterations` timed
 * calls. Figures are informational and never feed back into selection.
 */

#pragma once

#include "backend.hpp"
#include "execution_path.hpp"
#include "operation.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace conhal {

struct BenchmarkSettings {
    uint32_t iterations = 200;
    uint32_t warmup = 10;
};

struct BenchmarkSample {
    Operation operation = Operation::SignatureVerification;
    Backend backend = Backend::Generic;
    uint32_t iterations = 0;
    double mean_ns = 0.0;
    double min_ns = 0.0;
    double ops_per_sec = 0.0;
};

struct PerformanceMetrics {
    std::vector<BenchmarkSample> samples;

    // Rates of the paths create_optimized_path() currently hands out
    double signature_verifications_per_sec = 0.0;
    double script_executions_per_sec = 0.0;
    double hashes_per_sec = 0.0;
    double merkle_roots_per_sec = 0.0;
    double batches_per_sec = 0.0;           // of the four-signature sample batch

    const BenchmarkSample* find(Operation op, Backend backend) const {
        for (const auto& s : samples) {
            if (s.operation == op && s.backend == backend) return &s;
        }
        return nullptr;
    }

    // Human-readable table
    std::string report() const;
};

/**
 * Time one path on one input.
 */
BenchmarkSample benchmark_path(const ExecutionPath& path, ByteView input,
                               const BenchmarkSettings& settings);

/**
 * Time every listed pair. A backend whose path cannot be built is skipped
 * with a warning.
 */
std::vector<BenchmarkSample> run_benchmark(const std::vector<std::pair<Operation, Backend>>& pairs,
                                           const BenchmarkSettings& settings);

}  // namespace conhal
