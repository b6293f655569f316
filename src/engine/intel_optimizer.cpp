/**
 * Intel Optimizer
 *
 * SHA-NI (Ice Lake and later client parts, Goldmont) beats any vector
 * SHA-256; AVX-512 comes next where the policy allows wide vectors, then AVX2.
 */

#include "optimizer.hpp"

namespace conhal {

using platform::Extension;

IntelOptimizer::IntelOptimizer(const platform::HardwareCapabilities& caps) {
    view_.avx = caps.advertises(Extension::AVX);
    view_.avx2 = caps.advertises(Extension::AVX2);
    view_.avx512 = caps.advertises(Extension::AVX512F);
    view_.sha_ni = caps.advertises(Extension::SHA_NI);
    view_.aes_ni = caps.advertises(Extension::AES_NI);
    view_.hyperthreading = caps.core_count != 0 && caps.thread_count > caps.core_count;
}

std::string IntelOptimizer::name() const {
    const char* avx = view_.avx512 ? "avx512" : view_.avx2 ? "avx2" : view_.avx ? "avx" : "none";
    std::string n = std::string("intel(avx=") + avx;
    if (view_.sha_ni) n += ",sha_ni";
    if (view_.aes_ni) n += ",aes_ni";
    if (view_.hyperthreading) n += ",ht";
    return n + ")";
}

std::vector<Backend> IntelOptimizer::ladder(Operation op) const {
    switch (op) {
        case Operation::SignatureVerification:
        case Operation::ScriptExecution:
        case Operation::DoubleSha256:
        case Operation::MerkleRoot:
        case Operation::BatchVerification:
            return {Backend::IntelShaNi, Backend::IntelAvx512, Backend::IntelAvx2, Backend::Generic};
    }
    return {Backend::Generic};
}

bool IntelOptimizer::advertised(Backend backend) const {
    switch (backend) {
        case Backend::IntelShaNi:  return view_.sha_ni;
        case Backend::IntelAvx512: return view_.avx512;
        case Backend::IntelAvx2:   return view_.avx2;
        case Backend::Generic:     return true;
        case Backend::RiscvVector:
        case Backend::RiscvCrypto:
        case Backend::AmdAvx2:
        case Backend::AmdShaNi:
        case Backend::ArmNeon:
        case Backend::ArmSve:
        case Backend::ArmCrypto:   return false;
    }
    return false;
}

}  // namespace conhal
