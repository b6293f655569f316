/**
 * Feature Verifier
 *
 * Answers "can this extension actually execute here?", separately from
 * whether the detector saw it advertised. A feature the CPU lists but the
 * OS has not enabled (AVX-512 state not saved by XSAVE, SVE disabled by the
 * hypervisor) or that the operator has masked is advertised but unusable,
 * and the optimizers fall one rung below it.
 */

#pragma once

#include "capabilities.hpp"

#include <memory>
#include <string>
#include <vector>

namespace conhal {
namespace platform {

class FeatureVerifier {
public:
    virtual ~FeatureVerifier() = default;

    virtual bool usable(Extension ext) const = 0;
    virtual std::string name() const = 0;
};

/**
 * Runtime check against the executing CPU and OS: CPUID plus XGETBV on x86,
 * getauxval(AT_HWCAP) on Linux AArch64 and RISC-V. Extensions of another
 * architecture are never usable.
 */
class HostFeatureVerifier : public FeatureVerifier {
public:
    HostFeatureVerifier();

    bool usable(Extension ext) const override { return usable_.contains(ext); }
    std::string name() const override { return "host"; }

    const ExtensionSet& usable_set() const { return usable_; }

private:
    ExtensionSet usable_;
};

/**
 * Treats everything advertised as usable. Used when capabilities come from a
 * fixed snapshot rather than the executing machine.
 */
class TrustAdvertisedVerifier : public FeatureVerifier {
public:
    bool usable(Extension) const override { return true; }
    std::string name() const override { return "trust-advertised"; }
};

/**
 * Usable iff the inner verifier agrees and the extension is not masked.
 */
class MaskedFeatureVerifier : public FeatureVerifier {
public:
    MaskedFeatureVerifier(std::shared_ptr<const FeatureVerifier> inner, ExtensionSet masked)
        : inner_(std::move(inner)), masked_(masked) {}

    bool usable(Extension ext) const override {
        return !masked_.contains(ext) && inner_->usable(ext);
    }
    std::string name() const override {
        return inner_->name() + "-masked[" + masked_.to_string() + "]";
    }

    const ExtensionSet& masked() const { return masked_; }

private:
    std::shared_ptr<const FeatureVerifier> inner_;
    ExtensionSet masked_;
};

/**
 * Parse extension names (as written in the config file). Unknown names are
 * returned through `unknown`.
 */
ExtensionSet parse_extension_list(const std::vector<std::string>& names,
                                  std::vector<std::string>* unknown = nullptr);

}  // namespace platform
}  // namespace conhal
