/**
 * Execution Engine implementation
 */

#include "engine.hpp"

#include "../core/logger.hpp"

namespace conhal {

ExecutionEngine::ExecutionEngine(const platform::CapabilityProbe& probe, Options options)
    : caps_(platform::Detector::detect(probe)) {
    init(std::move(options), true);
}

ExecutionEngine::ExecutionEngine(platform::HardwareCapabilities caps, Options options)
    : caps_(std::move(caps)) {
    init(std::move(options), false);
}

void ExecutionEngine::init(Options options, bool from_host) {
    optimizer_ = make_optimizer(caps_);
    verifier_ = std::move(options.verifier);
    if (!verifier_) {
        if (from_host) verifier_ = std::make_shared<platform::HostFeatureVerifier>();
        else verifier_ = std::make_shared<platform::TrustAdvertisedVerifier>();
    }
    on_degraded_ = std::move(options.on_degraded);
    path_factory_ = options.path_factory ? std::move(options.path_factory) : PathFactory(make_path);
    tuning_ = std::make_shared<TuningState>();

    LOG_INFO("ENGINE: Optimizer=" + optimizer_->name() + ", Verifier=" + verifier_->name());
}

std::unique_ptr<ExecutionEngine> ExecutionEngine::from_config(const EngineConfig& config,
                                                              Result* status,
                                                              DegradationListener on_degraded) {
    Result r = Result::success();

    std::vector<std::string> unknown;
    platform::ExtensionSet masked = platform::parse_extension_list(config.masked_extensions, &unknown);
    if (!unknown.empty()) {
        std::string names;
        for (const auto& n : unknown) names += (names.empty() ? "" : ",") + n;
        r = Result::error(ErrorCode::ConfigError, "masked_extensions: unknown extension(s) " + names);
        LOG_WARN(r.message);
    }

    Options options;
    std::shared_ptr<const platform::FeatureVerifier> host = std::make_shared<platform::HostFeatureVerifier>();
    if (masked.empty()) {
        options.verifier = host;
    } else {
        options.verifier = std::make_shared<platform::MaskedFeatureVerifier>(host, masked);
    }
    options.on_degraded = std::move(on_degraded);

    platform::HostProbe probe;
    auto engine = std::make_unique<ExecutionEngine>(probe, std::move(options));

    if (!config.priority.empty() || !config.memory_target.empty() || !config.power_target.empty()) {
        WorkloadProfile profile;
        if (auto p = parse_priority(config.priority)) profile.priority = *p;
        if (auto m = parse_memory_target(config.memory_target)) profile.memory_target = *m;
        if (auto p = parse_power_target(config.power_target)) profile.power_target = *p;
        engine->tune_for_workload(profile);
    }

    if (status) *status = r;
    return engine;
}

Selection ExecutionEngine::select_backend(Operation op) const {
    return optimizer_->select(op, tuning_state()->policy, *verifier_);
}

std::vector<Backend> ExecutionEngine::reachable_backends(Operation op) const {
    return optimizer_->reachable(op, *verifier_);
}

void ExecutionEngine::report(const DegradationEvent& event) const {
    Logger::instance().log_degradation(to_string(event.operation), to_string(event.from),
                                       to_string(event.to), platform::to_string(event.extension));
    if (on_degraded_) on_degraded_(event);
}

PathHandle ExecutionEngine::create_optimized_path(Operation op) const {
    std::shared_ptr<const TuningState> state = tuning_state();
    Selection sel = optimizer_->select(op, state->policy, *verifier_);
    for (const auto& ev : sel.degraded) report(ev);

    Backend backend = sel.backend;
    for (;;) {
        try {
            PathHandle path = path_factory_(op, backend);
            Logger::instance().log_selection(to_string(op), to_string(backend), optimizer_->name());
            return path;
        } catch (const BackendUnavailable& e) {
            const BackendDescriptor& d = descriptor(backend);
            if (!d.required) throw;     // Generic has nothing below it

            LOG_ERROR(std::string("ENGINE: ") + to_string(backend) + " kernels unavailable: " + e.what());
            Selection below = optimizer_->select_below(op, backend, state->policy, *verifier_);
            for (const auto& ev : below.degraded) report(ev);
            report(DegradationEvent{op, backend, below.backend, *d.required});
            backend = below.backend;
        }
    }
}

std::shared_ptr<const ExecutionEngine::TuningState> ExecutionEngine::tuning_state() const {
    std::lock_guard<std::mutex> lock(tuning_mutex_);
    return tuning_;
}

void ExecutionEngine::tune_for_workload(const WorkloadProfile& profile) {
    auto next = std::make_shared<TuningState>();
    next->profile = profile;
    next->policy = SelectionPolicy::from_profile(profile);

    Logger::instance().log_tuning(profile.transaction_volume, to_string(profile.priority),
                                  next->policy.allow_wide_vectors,
                                  next->policy.allow_crypto_extensions);

    std::lock_guard<std::mutex> lock(tuning_mutex_);
    tuning_ = std::move(next);
}

std::optional<WorkloadProfile> ExecutionEngine::tuning() const {
    return tuning_state()->profile;
}

SelectionPolicy ExecutionEngine::policy() const {
    return tuning_state()->policy;
}

PerformanceMetrics ExecutionEngine::benchmark_performance(const BenchmarkSettings& settings) const {
    std::vector<std::pair<Operation, Backend>> pairs;
    for (Operation op : ALL_OPERATIONS) {
        for (Backend b : reachable_backends(op)) pairs.emplace_back(op, b);
    }

    PerformanceMetrics metrics;
    metrics.samples = run_benchmark(pairs, settings);

    for (Operation op : ALL_OPERATIONS) {
        const BenchmarkSample* s = metrics.find(op, select_backend(op).backend);
        double rate = s ? s->ops_per_sec : 0.0;
        switch (op) {
            case Operation::SignatureVerification: metrics.signature_verifications_per_sec = rate; break;
            case Operation::ScriptExecution:       metrics.script_executions_per_sec = rate; break;
            case Operation::DoubleSha256:          metrics.hashes_per_sec = rate; break;
            case Operation::MerkleRoot:            metrics.merkle_roots_per_sec = rate; break;
            case Operation::BatchVerification:     metrics.batches_per_sec = rate; break;
        }
    }
    return metrics;
}

}  // namespace conhal
