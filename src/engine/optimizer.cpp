/**
 * Ladder walk, Generic optimizer and optimizer factory
 */

#include "optimizer.hpp"

namespace conhal {

using platform::Architecture;
using platform::HardwareCapabilities;
using platform::Vendor;

bool IOptimizer::allowed(Backend backend, const SelectionPolicy& policy) {
    switch (descriptor(backend).rung) {
        case RungKind::Generic:    return true;
        case RungKind::Vector:     return true;
        case RungKind::WideVector: return policy.allow_wide_vectors;
        case RungKind::Crypto:     return policy.allow_crypto_extensions;
    }
    return false;
}

Selection IOptimizer::select(Operation op, const SelectionPolicy& policy,
                             const platform::FeatureVerifier& verifier) const {
    return walk(op, 0, policy, verifier);
}

Selection IOptimizer::select_below(Operation op, Backend failed, const SelectionPolicy& policy,
                                   const platform::FeatureVerifier& verifier) const {
    std::vector<Backend> rungs = ladder(op);
    for (size_t i = 0; i < rungs.size(); i++) {
        if (rungs[i] == failed) return walk(op, i + 1, policy, verifier);
    }
    return walk(op, rungs.size(), policy, verifier);
}

Selection IOptimizer::walk(Operation op, size_t first, const SelectionPolicy& policy,
                           const platform::FeatureVerifier& verifier) const {
    Selection sel;
    std::vector<Backend> rungs = ladder(op);
    for (size_t i = first; i < rungs.size(); i++) {
        Backend b = rungs[i];
        const BackendDescriptor& d = descriptor(b);
        if (!d.required) {
            sel.backend = b;
            break;
        }
        if (!advertised(b) || !allowed(b, policy)) continue;
        if (!verifier.usable(*d.required)) {
            sel.degraded.push_back(DegradationEvent{op, b, Backend::Generic, *d.required});
            continue;
        }
        sel.backend = b;
        break;
    }
    for (auto& ev : sel.degraded) ev.to = sel.backend;
    return sel;
}

std::vector<Backend> IOptimizer::reachable(Operation op, const platform::FeatureVerifier& verifier) const {
    std::vector<Backend> out;
    for (Backend b : ladder(op)) {
        const BackendDescriptor& d = descriptor(b);
        if (!d.required || (advertised(b) && verifier.usable(*d.required))) {
            out.push_back(b);
        }
    }
    return out;
}

// -----------------------------------------------------------------------------
// Generic
// -----------------------------------------------------------------------------

std::vector<Backend> GenericOptimizer::ladder(Operation) const {
    return {Backend::Generic};
}

bool GenericOptimizer::advertised(Backend backend) const {
    return backend == Backend::Generic;
}

// -----------------------------------------------------------------------------
// Factory
// -----------------------------------------------------------------------------

std::unique_ptr<const IOptimizer> make_optimizer(const HardwareCapabilities& caps) {
    switch (caps.architecture) {
        case Architecture::RISCV64:
            return std::make_unique<RiscvOptimizer>(caps);
        case Architecture::AArch64:
            return std::make_unique<ArmOptimizer>(caps);
        case Architecture::X86_64:
            if (caps.vendor == Vendor::AMD) return std::make_unique<AmdOptimizer>(caps);
            if (caps.vendor == Vendor::Intel) return std::make_unique<IntelOptimizer>(caps);
            return std::make_unique<GenericOptimizer>();
        case Architecture::Other:
            return std::make_unique<GenericOptimizer>();
    }
    return std::make_unique<GenericOptimizer>();
}

}  // namespace conhal
