/**
 * conhal Architecture Optimizers
 *
 * One optimizer per architecture family, chosen by make_optimizer() from the
 * detected capabilities. The set is closed: Intel, AMD, ARM, RISC-V and
 * Generic. There is no registration hook.
 *
 * Each optimizer owns a ladder of backends, fastest first and Generic last,
 * and a narrow view of the capabilities it cares about. select() walks the
 * ladder:
 *
 *   advertised + allowed by policy  ->  eligible
 *   eligible + verifier says usable ->  selected
 *   eligible but not usable         ->  DegradationEvent, fall one rung
 *
 * Generic needs nothing, so the walk always ends with a backend.
 */

#pragma once

#include "../platform/capabilities.hpp"
#include "../platform/feature_verifier.hpp"
#include "backend.hpp"
#include "operation.hpp"
#include "workload.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace conhal {

/**
 * A rung the host advertises but cannot execute.
 */
struct DegradationEvent {
    Operation operation;
    Backend from;                   // rung that was skipped
    Backend to;                     // backend finally selected
    platform::Extension extension;  // the unusable extension

    std::string to_string() const {
        return std::string(conhal::to_string(operation)) + ": " + conhal::to_string(from) +
               " -> " + conhal::to_string(to) + " (" + platform::to_string(extension) + " unusable)";
    }

    bool operator==(const DegradationEvent&) const = default;
};

using DegradationListener = std::function<void(const DegradationEvent&)>;

struct Selection {
    Backend backend = Backend::Generic;
    std::vector<DegradationEvent> degraded;
};

class IOptimizer {
public:
    virtual ~IOptimizer() = default;

    virtual std::string name() const = 0;

    /**
     * Backends to try for op, fastest first. Always ends with Generic.
     */
    virtual std::vector<Backend> ladder(Operation op) const = 0;

    /**
     * Pure function of (op, capabilities, policy, verifier). Logging and
     * listener callbacks are the caller's business.
     */
    Selection select(Operation op, const SelectionPolicy& policy,
                     const platform::FeatureVerifier& verifier) const;

    /**
     * Same walk, starting on the rung below `failed`. Used when the path for
     * a selected backend could not be built.
     */
    Selection select_below(Operation op, Backend failed, const SelectionPolicy& policy,
                           const platform::FeatureVerifier& verifier) const;

    /**
     * Every rung select() could land on with the most permissive policy,
     * Generic included.
     */
    std::vector<Backend> reachable(Operation op, const platform::FeatureVerifier& verifier) const;

protected:
    // Whether the capability view shows the backend's required extension
    virtual bool advertised(Backend backend) const = 0;

    static bool allowed(Backend backend, const SelectionPolicy& policy);

private:
    Selection walk(Operation op, size_t first, const SelectionPolicy& policy,
                   const platform::FeatureVerifier& verifier) const;
};

class GenericOptimizer : public IOptimizer {
public:
    std::string name() const override { return "generic"; }
    std::vector<Backend> ladder(Operation op) const override;

protected:
    bool advertised(Backend backend) const override;
};

class IntelOptimizer : public IOptimizer {
public:
    struct View {
        bool avx = false;
        bool avx2 = false;
        bool avx512 = false;        // AVX-512F
        bool sha_ni = false;
        bool aes_ni = false;
        bool hyperthreading = false;
    };

    explicit IntelOptimizer(const platform::HardwareCapabilities& caps);

    std::string name() const override;
    std::vector<Backend> ladder(Operation op) const override;
    const View& view() const { return view_; }

protected:
    bool advertised(Backend backend) const override;

private:
    View view_;
};

class AmdOptimizer : public IOptimizer {
public:
    struct View {
        bool avx2 = false;
        bool sha_ni = false;
        bool smt = false;
    };

    explicit AmdOptimizer(const platform::HardwareCapabilities& caps);

    std::string name() const override;
    std::vector<Backend> ladder(Operation op) const override;
    const View& view() const { return view_; }

protected:
    bool advertised(Backend backend) const override;

private:
    View view_;
};

class ArmOptimizer : public IOptimizer {
public:
    struct View {
        bool neon = false;
        bool sve = false;
        bool sha2 = false;
    };

    explicit ArmOptimizer(const platform::HardwareCapabilities& caps);

    std::string name() const override;
    std::vector<Backend> ladder(Operation op) const override;
    const View& view() const { return view_; }

protected:
    bool advertised(Backend backend) const override;

private:
    View view_;
};

class RiscvOptimizer : public IOptimizer {
public:
    struct View {
        bool vector = false;
        bool zknh = false;
    };

    explicit RiscvOptimizer(const platform::HardwareCapabilities& caps);

    std::string name() const override;
    std::vector<Backend> ladder(Operation op) const override;
    const View& view() const { return view_; }

protected:
    bool advertised(Backend backend) const override;

private:
    View view_;
};

/**
 * RISCV64 -> RISC-V, AArch64 -> ARM, X86_64 + AMD -> AMD,
 * X86_64 + Intel -> Intel, anything else -> Generic.
 */
std::unique_ptr<const IOptimizer> make_optimizer(const platform::HardwareCapabilities& caps);

}  // namespace conhal
