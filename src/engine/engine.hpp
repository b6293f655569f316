/**
 * conhal Execution Engine
 *
 * The façade the host application constructs once at startup and passes to
 * its validation call sites. Holds the capability snapshot, the optimizer
 * for the detected architecture, the feature verifier and the tuning cell.
 *
 * Tuning cell: Untuned -> Tuned(profile), re-enterable, no terminal state.
 * tune_for_workload() swaps an immutable snapshot under a short lock;
 * selection reads a copy of the pointer, so paths already handed out are
 * never affected.
 */

#pragma once

#include "../core/config.hpp"
#include "../core/errors.hpp"
#include "../platform/capabilities.hpp"
#include "../platform/detector.hpp"
#include "../platform/feature_verifier.hpp"
#include "benchmark.hpp"
#include "execution_path.hpp"
#include "optimizer.hpp"
#include "workload.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace conhal {

class ExecutionEngine {
public:
    struct Options {
        // nullptr: HostFeatureVerifier for a probe, TrustAdvertisedVerifier for a snapshot
        std::shared_ptr<const platform::FeatureVerifier> verifier;
        DegradationListener on_degraded;
        // empty: make_path
        PathFactory path_factory;
    };

    /**
     * Detect through `probe`. Detection never fails; a throwing probe leaves
     * the engine on the minimal snapshot and therefore on Generic.
     */
    explicit ExecutionEngine(const platform::CapabilityProbe& probe, Options options = {});

    /**
     * Use a fixed snapshot.
     */
    explicit ExecutionEngine(platform::HardwareCapabilities caps, Options options = {});

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    /**
     * Host engine configured from an EngineConfig: masked extensions wrap the
     * host verifier, and a complete default workload is applied. Problems in
     * the config are reported through `status`; the engine is built anyway.
     */
    static std::unique_ptr<ExecutionEngine> from_config(const EngineConfig& config,
                                                        Result* status = nullptr,
                                                        DegradationListener on_degraded = {});

    const platform::HardwareCapabilities& detect_capabilities() const { return caps_; }

    /**
     * Path for the best usable rung. Degradations are logged and reported to
     * the listener; a backend whose kernels fail their self-test is treated
     * the same way and the walk continues below it.
     */
    PathHandle create_optimized_path(Operation op) const;

    // Pure selection result, no logging or callbacks
    Selection select_backend(Operation op) const;

    std::vector<Backend> reachable_backends(Operation op) const;

    void tune_for_workload(const WorkloadProfile& profile);

    // nullopt while untuned
    std::optional<WorkloadProfile> tuning() const;
    SelectionPolicy policy() const;

    /**
     * Time every (operation, reachable backend) pair; the summary rates come
     * from the currently selected backends.
     */
    PerformanceMetrics benchmark_performance(const BenchmarkSettings& settings = {}) const;

    const IOptimizer& optimizer() const { return *optimizer_; }
    const platform::FeatureVerifier& verifier() const { return *verifier_; }
    std::shared_ptr<const platform::FeatureVerifier> shared_verifier() const { return verifier_; }

private:
    struct TuningState {
        std::optional<WorkloadProfile> profile;
        SelectionPolicy policy;
    };

    void init(Options options, bool from_host);
    std::shared_ptr<const TuningState> tuning_state() const;
    void report(const DegradationEvent& event) const;

    platform::HardwareCapabilities caps_;
    std::unique_ptr<const IOptimizer> optimizer_;
    std::shared_ptr<const platform::FeatureVerifier> verifier_;
    DegradationListener on_degraded_;
    PathFactory path_factory_;

    mutable std::mutex tuning_mutex_;
    std::shared_ptr<const TuningState> tuning_;
};

}  // namespace conhal
