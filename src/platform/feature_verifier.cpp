/**
 * Feature Verifier implementation
 */

#include "feature_verifier.hpp"

#if defined(CONHAL_ARCH_X86_64)
#include <cpuid.h>
#endif

#if defined(__linux__) && (defined(CONHAL_ARCH_AARCH64) || defined(CONHAL_ARCH_RISCV64))
#include <sys/auxv.h>
#endif

namespace conhal {
namespace platform {

namespace {

#if defined(CONHAL_ARCH_X86_64)
uint64_t read_xcr0() {
    uint32_t lo = 0, hi = 0;
    __asm__ volatile("xgetbv" : "=a"(lo), "=d"(hi) : "c"(0));
    return (uint64_t(hi) << 32) | lo;
}

ExtensionSet runtime_extensions() {
    ExtensionSet set;
    unsigned eax = 0, ebx = 0, ecx = 0, edx = 0;
    if (!__get_cpuid(0, &eax, &ebx, &ecx, &edx)) return set;
    unsigned max_leaf = eax;

    __get_cpuid(1, &eax, &ebx, &ecx, &edx);
    bool osxsave = ecx & (1u << 27);
    uint64_t xcr0 = osxsave ? read_xcr0() : 0;
    bool os_avx = (xcr0 & 0x6) == 0x6;          // XMM and YMM state
    bool os_avx512 = (xcr0 & 0xE6) == 0xE6;     // plus opmask and ZMM state

    if (ecx & (1u << 20)) set.insert(Extension::SSE42);
    if (ecx & (1u << 25)) set.insert(Extension::AES_NI);
    if ((ecx & (1u << 28)) && os_avx) set.insert(Extension::AVX);

    if (max_leaf >= 7) {
        __get_cpuid_count(7, 0, &eax, &ebx, &ecx, &edx);
        if ((ebx & (1u << 5)) && os_avx) set.insert(Extension::AVX2);
        if (ebx & (1u << 8)) set.insert(Extension::BMI2);
        if ((ebx & (1u << 16)) && os_avx512) set.insert(Extension::AVX512F);
        if ((ebx & (1u << 30)) && os_avx512) set.insert(Extension::AVX512BW);
        if (ebx & (1u << 29)) set.insert(Extension::SHA_NI);
    }
    return set;
}
#elif defined(__linux__) && defined(CONHAL_ARCH_AARCH64)
ExtensionSet runtime_extensions() {
    ExtensionSet set;
    unsigned long hwcap = getauxval(AT_HWCAP);
    unsigned long hwcap2 = getauxval(AT_HWCAP2);
    if (hwcap & (1ul << 1))  set.insert(Extension::NEON);
    if (hwcap & (1ul << 3))  set.insert(Extension::ARM_AES);
    if (hwcap & (1ul << 6))  set.insert(Extension::ARM_SHA2);
    if (hwcap & (1ul << 22)) set.insert(Extension::SVE);
    if (hwcap2 & (1ul << 1)) set.insert(Extension::SVE2);
    return set;
}
#elif defined(__linux__) && defined(CONHAL_ARCH_RISCV64)
ExtensionSet runtime_extensions() {
    ExtensionSet set;
    unsigned long hwcap = getauxval(AT_HWCAP);
    if (hwcap & (1ul << ('v' - 'a'))) set.insert(Extension::RVV);
    // Scalar crypto and bitmanip are not in AT_HWCAP; the kernel only lists
    // them in /proc/cpuinfo when enabled, so trust the detector for those.
    set.insert(Extension::ZBB);
    set.insert(Extension::ZKNH);
    set.insert(Extension::ZVKNHB);
    return set;
}
#else
ExtensionSet runtime_extensions() {
    return ExtensionSet();
}
#endif

}  // namespace

HostFeatureVerifier::HostFeatureVerifier() : usable_(runtime_extensions()) {}

ExtensionSet parse_extension_list(const std::vector<std::string>& names,
                                  std::vector<std::string>* unknown) {
    ExtensionSet set;
    for (const auto& name : names) {
        if (auto ext = parse_extension(name)) {
            set.insert(*ext);
        } else if (unknown) {
            unknown->push_back(name);
        }
    }
    return set;
}

}  // namespace platform
}  // namespace conhal
