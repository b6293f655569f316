/**
 * Consensus Equivalence Harness
 *
 * Runs a corpus through a path under test and the Generic reference and
 * lists every input where the two disagree. Any divergence is a consensus
 * bug: require_equivalence() turns a failed report into an
 * EquivalenceViolation, and conhal_verify exits non-zero on it.
 */

#pragma once

#include "../core/errors.hpp"
#include "../engine/execution_path.hpp"
#include "../platform/capabilities.hpp"
#include "../platform/feature_verifier.hpp"
#include "corpus.hpp"

#include <memory>
#include <string>
#include <vector>

namespace conhal {
namespace verify {

struct Divergence {
    size_t index = 0;
    Bytes input;
    ExecutionOutput expected;   // reference
    ExecutionOutput actual;     // path under test

    std::string to_string() const;
};

struct VerificationReport {
    Operation operation = Operation::SignatureVerification;
    Backend backend = Backend::Generic;
    Backend reference = Backend::Generic;
    size_t cases = 0;
    std::vector<Divergence> divergences;

    bool ok() const { return divergences.empty(); }
    std::string summary() const;
};

VerificationReport verify_equivalence(Operation op, const ExecutionPath& under_test,
                                      const ExecutionPath& reference, const Corpus& corpus);

// Throws EquivalenceViolation listing the first divergences
void require_equivalence(const VerificationReport& report);

/**
 * Every non-Generic backend against Generic, for every corpus. Backends are
 * portable code, so this covers backends the host could never select.
 * A backend whose kernels fail their self-test is logged and skipped.
 */
std::vector<VerificationReport> verify_all_backends(const std::vector<Corpus>& corpora);

/**
 * One forced-unusable extension and what the engine made of it.
 */
struct DegradationCheck {
    Operation operation = Operation::SignatureVerification;
    platform::Extension masked = platform::Extension::SSE42;
    Backend before = Backend::Generic;      // selection with nothing masked
    Backend expected = Backend::Generic;    // selection on caps.without(masked)
    Backend selected = Backend::Generic;    // selection with masked unusable
    bool event_reported = false;            // listener saw the masked extension
    VerificationReport equivalence;

    bool ok() const {
        bool needs_event = before != selected;
        return selected == expected && (!needs_event || event_reported) && equivalence.ok();
    }
    std::string summary() const;
};

/**
 * For every advertised extension: mask it, confirm selection falls exactly
 * as if the extension were not advertised, that the fall was reported, and
 * that the degraded path still matches Generic on the corpus.
 */
std::vector<DegradationCheck> verify_degradation(const platform::HardwareCapabilities& caps,
                                                 std::shared_ptr<const platform::FeatureVerifier> verifier,
                                                 const std::vector<Corpus>& corpora);

/**
 * dudect-style check: Welch's t statistic between execution times of two
 * input classes. Informational; |t| above the threshold suggests timing
 * depends on the class.
 */
struct TimingReport {
    size_t samples_per_class = 0;
    double mean_a_ns = 0.0;
    double mean_b_ns = 0.0;
    double t_statistic = 0.0;

    static constexpr double THRESHOLD = 4.5;
    bool suspicious() const { return t_statistic > THRESHOLD || t_statistic < -THRESHOLD; }
};

TimingReport timing_leakage_check(const ExecutionPath& path, const std::vector<Bytes>& class_a,
                                  const std::vector<Bytes>& class_b, size_t rounds);

}  // namespace verify
}  // namespace conhal
