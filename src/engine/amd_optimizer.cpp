/**
 * AMD Optimizer
 *
 * Every Zen generation ships SHA-NI, so on real parts the crypto rung wins.
 * Zen 4 implements AVX-512 by double-pumping 256-bit units, which buys
 * nothing over AVX2 for these kernels; the ladder has no wide-vector rung.
 */

#include "optimizer.hpp"

namespace conhal {

using platform::Extension;

AmdOptimizer::AmdOptimizer(const platform::HardwareCapabilities& caps) {
    view_.avx2 = caps.advertises(Extension::AVX2);
    view_.sha_ni = caps.advertises(Extension::SHA_NI);
    view_.smt = caps.core_count != 0 && caps.thread_count > caps.core_count;
}

std::string AmdOptimizer::name() const {
    std::string n = "amd(";
    n += view_.avx2 ? "avx2" : "no-avx2";
    if (view_.sha_ni) n += ",sha_ni";
    if (view_.smt) n += ",smt";
    return n + ")";
}

std::vector<Backend> AmdOptimizer::ladder(Operation op) const {
    switch (op) {
        case Operation::SignatureVerification:
        case Operation::ScriptExecution:
        case Operation::DoubleSha256:
        case Operation::MerkleRoot:
        case Operation::BatchVerification:
            return {Backend::AmdShaNi, Backend::AmdAvx2, Backend::Generic};
    }
    return {Backend::Generic};
}

bool AmdOptimizer::advertised(Backend backend) const {
    switch (backend) {
        case Backend::AmdShaNi: return view_.sha_ni;
        case Backend::AmdAvx2:  return view_.avx2;
        case Backend::Generic:  return true;
        case Backend::RiscvVector:
        case Backend::RiscvCrypto:
        case Backend::IntelAvx2:
        case Backend::IntelAvx512:
        case Backend::IntelShaNi:
        case Backend::ArmNeon:
        case Backend::ArmSve:
        case Backend::ArmCrypto: return false;
    }
    return false;
}

}  // namespace conhal
