/**
 * Consensus Equivalence Harness implementation
 */

#include "equivalence.hpp"

#include "../core/logger.hpp"
#include "../engine/engine.hpp"

#include <chrono>
#include <cmath>
#include <sstream>

namespace conhal {
namespace verify {

namespace {

const Corpus* find_corpus(const std::vector<Corpus>& corpora, Operation op) {
    for (const auto& c : corpora) {
        if (c.operation == op) return &c;
    }
    return nullptr;
}

// Hex is truncated so a report stays readable for long scripts
std::string short_hex(const Bytes& b) {
    constexpr size_t MAX = 96;
    if (b.size() <= MAX) return to_hex(as_view(b));
    return to_hex(ByteView(b.data(), MAX)) + "...(" + std::to_string(b.size()) + " bytes)";
}

}  // namespace

std::string Divergence::to_string() const {
    std::stringstream ss;
    ss << "#" << index << " input=" << short_hex(input)
       << " expected=" << expected.to_string()
       << " actual=" << actual.to_string();
    return ss.str();
}

std::string VerificationReport::summary() const {
    std::stringstream ss;
    ss << to_string(operation) << " " << to_string(backend) << " vs " << to_string(reference)
       << ": " << cases << " cases, " << divergences.size() << " divergences";
    return ss.str();
}

VerificationReport verify_equivalence(Operation op, const ExecutionPath& under_test,
                                      const ExecutionPath& reference, const Corpus& corpus) {
    VerificationReport report;
    report.operation = op;
    report.backend = under_test.backend();
    report.reference = reference.backend();
    report.cases = corpus.inputs.size();

    for (size_t i = 0; i < corpus.inputs.size(); i++) {
        ByteView input = as_view(corpus.inputs[i]);
        ExecutionOutput expected = reference.execute(input);
        ExecutionOutput actual = under_test.execute(input);
        if (expected != actual) {
            report.divergences.push_back(Divergence{i, corpus.inputs[i], expected, actual});
        }
    }

    Logger::instance().log_equivalence(to_string(op), to_string(report.backend),
                                       report.cases, report.divergences.size());
    return report;
}

void require_equivalence(const VerificationReport& report) {
    if (report.ok()) return;

    std::stringstream ss;
    ss << "Consensus divergence: " << report.summary();
    size_t shown = 0;
    for (const auto& d : report.divergences) {
        if (shown++ == 5) {
            ss << "\n  ...";
            break;
        }
        ss << "\n  " << d.to_string();
    }
    throw EquivalenceViolation(ss.str());
}

std::vector<VerificationReport> verify_all_backends(const std::vector<Corpus>& corpora) {
    std::vector<VerificationReport> reports;
    for (const auto& corpus : corpora) {
        PathHandle reference = make_path(corpus.operation, Backend::Generic);
        for (Backend b : ALL_BACKENDS) {
            if (b == Backend::Generic) continue;

            PathHandle path;
            try {
                path = make_path(corpus.operation, b);
            } catch (const BackendUnavailable& e) {
                LOG_WARN(std::string("EQUIVALENCE: ") + to_string(b) + " skipped: " + e.what());
                continue;
            }
            reports.push_back(verify_equivalence(corpus.operation, *path, *reference, corpus));
        }
    }
    return reports;
}

// -----------------------------------------------------------------------------
// Degradation
// -----------------------------------------------------------------------------

std::string DegradationCheck::summary() const {
    std::stringstream ss;
    ss << to_string(operation) << " mask " << platform::to_string(masked) << ": "
       << to_string(before) << " -> " << to_string(selected)
       << " (expected " << to_string(expected) << ")"
       << (before != selected ? (event_reported ? ", reported" : ", NOT reported") : "")
       << (equivalence.ok() ? "" : ", DIVERGED");
    return ss.str();
}

std::vector<DegradationCheck> verify_degradation(const platform::HardwareCapabilities& caps,
                                                 std::shared_ptr<const platform::FeatureVerifier> verifier,
                                                 const std::vector<Corpus>& corpora) {
    std::vector<DegradationCheck> checks;
    if (!verifier) verifier = std::make_shared<platform::TrustAdvertisedVerifier>();

    ExecutionEngine::Options base_options;
    base_options.verifier = verifier;
    ExecutionEngine baseline(caps, base_options);

    for (platform::Extension ext : caps.advertised().list()) {
        std::vector<DegradationEvent> events;

        ExecutionEngine::Options masked_options;
        masked_options.verifier = std::make_shared<platform::MaskedFeatureVerifier>(
            verifier, platform::ExtensionSet{ext});
        masked_options.on_degraded = [&events](const DegradationEvent& ev) { events.push_back(ev); };
        ExecutionEngine masked(caps, masked_options);

        ExecutionEngine::Options absent_options;
        absent_options.verifier = verifier;
        ExecutionEngine absent(caps.without(ext), absent_options);

        for (Operation op : ALL_OPERATIONS) {
            events.clear();

            DegradationCheck check;
            check.operation = op;
            check.masked = ext;
            check.before = baseline.select_backend(op).backend;
            check.expected = absent.select_backend(op).backend;

            PathHandle path = masked.create_optimized_path(op);
            check.selected = path->backend();
            for (const auto& ev : events) {
                if (ev.extension == ext) check.event_reported = true;
            }

            if (const Corpus* corpus = find_corpus(corpora, op)) {
                PathHandle reference = make_path(op, Backend::Generic);
                check.equivalence = verify_equivalence(op, *path, *reference, *corpus);
            }
            checks.push_back(std::move(check));
        }
    }
    return checks;
}

// -----------------------------------------------------------------------------
// Timing
// -----------------------------------------------------------------------------

TimingReport timing_leakage_check(const ExecutionPath& path, const std::vector<Bytes>& class_a,
                                  const std::vector<Bytes>& class_b, size_t rounds) {
    using clock = std::chrono::steady_clock;

    TimingReport report;
    if (class_a.empty() || class_b.empty() || rounds == 0) return report;

    // Welford accumulators per class
    double n[2] = {0, 0}, mean[2] = {0, 0}, m2[2] = {0, 0};

    for (size_t r = 0; r < rounds; r++) {
        // Interleave classes so drift hits both equally
        for (int cls = 0; cls < 2; cls++) {
            const auto& set = cls == 0 ? class_a : class_b;
            const Bytes& input = set[r % set.size()];
            auto start = clock::now();
            ExecutionOutput out = path.execute(as_view(input));
            auto end = clock::now();
            (void)out;
            double t = std::chrono::duration<double, std::nano>(end - start).count();
            n[cls] += 1;
            double delta = t - mean[cls];
            mean[cls] += delta / n[cls];
            m2[cls] += delta * (t - mean[cls]);
        }
    }

    report.samples_per_class = rounds;
    report.mean_a_ns = mean[0];
    report.mean_b_ns = mean[1];
    double var_a = n[0] > 1 ? m2[0] / (n[0] - 1) : 0.0;
    double var_b = n[1] > 1 ? m2[1] / (n[1] - 1) : 0.0;
    double denom = std::sqrt(var_a / n[0] + var_b / n[1]);
    report.t_statistic = denom > 0.0 ? (mean[0] - mean[1]) / denom : 0.0;
    return report;
}

}  // namespace verify
}  // namespace conhal
