/**
 * Backend descriptor table
 */

#include "backend.hpp"

namespace conhal {

namespace {

using platform::Architecture;
using platform::Extension;
using crypto::HashEngineKind;

const BackendDescriptor GENERIC      {Backend::Generic,     "Generic",     Architecture::Other,   std::nullopt,        RungKind::Generic,    HashEngineKind::Reference, 0};
const BackendDescriptor RISCV_VECTOR {Backend::RiscvVector, "RiscvVector", Architecture::RISCV64, Extension::RVV,      RungKind::Vector,     HashEngineKind::Lanes4,    4};
const BackendDescriptor RISCV_CRYPTO {Backend::RiscvCrypto, "RiscvCrypto", Architecture::RISCV64, Extension::ZKNH,     RungKind::Crypto,     HashEngineKind::Hardware,  4};
const BackendDescriptor AMD_AVX2     {Backend::AmdAvx2,     "AmdAvx2",     Architecture::X86_64,  Extension::AVX2,     RungKind::Vector,     HashEngineKind::Lanes8,    4};
const BackendDescriptor AMD_SHANI    {Backend::AmdShaNi,    "AmdShaNi",    Architecture::X86_64,  Extension::SHA_NI,   RungKind::Crypto,     HashEngineKind::Hardware,  5};
const BackendDescriptor INTEL_AVX2   {Backend::IntelAvx2,   "IntelAvx2",   Architecture::X86_64,  Extension::AVX2,     RungKind::Vector,     HashEngineKind::Lanes8,    4};
const BackendDescriptor INTEL_AVX512 {Backend::IntelAvx512, "IntelAvx512", Architecture::X86_64,  Extension::AVX512F,  RungKind::WideVector, HashEngineKind::Lanes16,   5};
const BackendDescriptor INTEL_SHANI  {Backend::IntelShaNi,  "IntelShaNi",  Architecture::X86_64,  Extension::SHA_NI,   RungKind::Crypto,     HashEngineKind::Hardware,  5};
const BackendDescriptor ARM_NEON     {Backend::ArmNeon,     "ArmNeon",     Architecture::AArch64, Extension::NEON,     RungKind::Vector,     HashEngineKind::Lanes4,    4};
const BackendDescriptor ARM_SVE      {Backend::ArmSve,      "ArmSve",      Architecture::AArch64, Extension::SVE,      RungKind::WideVector, HashEngineKind::Lanes8,    5};
const BackendDescriptor ARM_CRYPTO   {Backend::ArmCrypto,   "ArmCrypto",   Architecture::AArch64, Extension::ARM_SHA2, RungKind::Crypto,     HashEngineKind::Hardware,  5};

}  // namespace

const BackendDescriptor& descriptor(Backend backend) {
    switch (backend) {
        case Backend::Generic:     return GENERIC;
        case Backend::RiscvVector: return RISCV_VECTOR;
        case Backend::RiscvCrypto: return RISCV_CRYPTO;
        case Backend::AmdAvx2:     return AMD_AVX2;
        case Backend::AmdShaNi:    return AMD_SHANI;
        case Backend::IntelAvx2:   return INTEL_AVX2;
        case Backend::IntelAvx512: return INTEL_AVX512;
        case Backend::IntelShaNi:  return INTEL_SHANI;
        case Backend::ArmNeon:     return ARM_NEON;
        case Backend::ArmSve:      return ARM_SVE;
        case Backend::ArmCrypto:   return ARM_CRYPTO;
    }
    return GENERIC;
}

const char* to_string(Backend backend) {
    return descriptor(backend).name;
}

std::optional<Backend> parse_backend(std::string_view name) {
    for (Backend b : ALL_BACKENDS) {
        if (name == descriptor(b).name) return b;
    }
    return std::nullopt;
}

}  // namespace conhal
