/**
 * RISC-V Optimizer
 *
 * Zknh scalar SHA-256 instructions, then the V extension.
 */

#include "optimizer.hpp"

namespace conhal {

using platform::Extension;

RiscvOptimizer::RiscvOptimizer(const platform::HardwareCapabilities& caps) {
    view_.vector = caps.advertises(Extension::RVV);
    view_.zknh = caps.advertises(Extension::ZKNH);
}

std::string RiscvOptimizer::name() const {
    std::string n = "riscv(";
    n += view_.vector ? "v" : "no-v";
    if (view_.zknh) n += ",zknh";
    return n + ")";
}

std::vector<Backend> RiscvOptimizer::ladder(Operation op) const {
    switch (op) {
        case Operation::SignatureVerification:
        case Operation::ScriptExecution:
        case Operation::DoubleSha256:
        case Operation::MerkleRoot:
        case Operation::BatchVerification:
            return {Backend::RiscvCrypto, Backend::RiscvVector, Backend::Generic};
    }
    return {Backend::Generic};
}

bool RiscvOptimizer::advertised(Backend backend) const {
    switch (backend) {
        case Backend::RiscvCrypto: return view_.zknh;
        case Backend::RiscvVector: return view_.vector;
        case Backend::Generic:     return true;
        case Backend::AmdAvx2:
        case Backend::AmdShaNi:
        case Backend::IntelAvx2:
        case Backend::IntelAvx512:
        case Backend::IntelShaNi:
        case Backend::ArmNeon:
        case Backend::ArmSve:
        case Backend::ArmCrypto:   return false;
    }
    return false;
}

}  // namespace conhal
