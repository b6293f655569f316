/**
 * ARM Optimizer
 *
 * ARMv8 crypto extensions first, then SVE where wide vectors are allowed,
 * then NEON, which every AArch64 core has in practice.
 */

#include "optimizer.hpp"

namespace conhal {

using platform::Extension;

ArmOptimizer::ArmOptimizer(const platform::HardwareCapabilities& caps) {
    view_.neon = caps.advertises(Extension::NEON);
    view_.sve = caps.advertises(Extension::SVE);
    view_.sha2 = caps.advertises(Extension::ARM_SHA2);
}

std::string ArmOptimizer::name() const {
    std::string n = "arm(";
    n += view_.neon ? "neon" : "no-neon";
    if (view_.sve) n += ",sve";
    if (view_.sha2) n += ",sha2";
    return n + ")";
}

std::vector<Backend> ArmOptimizer::ladder(Operation op) const {
    switch (op) {
        case Operation::SignatureVerification:
        case Operation::ScriptExecution:
        case Operation::DoubleSha256:
        case Operation::MerkleRoot:
        case Operation::BatchVerification:
            return {Backend::ArmCrypto, Backend::ArmSve, Backend::ArmNeon, Backend::Generic};
    }
    return {Backend::Generic};
}

bool ArmOptimizer::advertised(Backend backend) const {
    switch (backend) {
        case Backend::ArmCrypto: return view_.sha2;
        case Backend::ArmSve:    return view_.sve;
        case Backend::ArmNeon:   return view_.neon;
        case Backend::Generic:   return true;
        case Backend::RiscvVector:
        case Backend::RiscvCrypto:
        case Backend::AmdAvx2:
        case Backend::AmdShaNi:
        case Backend::IntelAvx2:
        case Backend::IntelAvx512:
        case Backend::IntelShaNi: return false;
    }
    return false;
}

}  // namespace conhal
