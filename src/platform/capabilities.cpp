/**
 * Hardware Capabilities helpers
 */

#include "capabilities.hpp"

#include <cctype>
#include <sstream>

namespace conhal {
namespace platform {

const char* to_string(Architecture arch) {
    switch (arch) {
        case Architecture::X86_64:  return "x86_64";
        case Architecture::AArch64: return "aarch64";
        case Architecture::RISCV64: return "riscv64";
        case Architecture::Other:   return "other";
    }
    return "other";
}

const char* to_string(Vendor vendor) {
    switch (vendor) {
        case Vendor::Intel: return "Intel";
        case Vendor::AMD:   return "AMD";
        case Vendor::ARM:   return "ARM";
        case Vendor::RISCV: return "RISC-V";
        case Vendor::Other: return "Other";
    }
    return "Other";
}

const char* to_string(Extension ext) {
    switch (ext) {
        case Extension::SSE42:    return "sse4.2";
        case Extension::AVX:      return "avx";
        case Extension::AVX2:     return "avx2";
        case Extension::AVX512F:  return "avx512f";
        case Extension::AVX512BW: return "avx512bw";
        case Extension::BMI2:     return "bmi2";
        case Extension::SHA_NI:   return "sha_ni";
        case Extension::AES_NI:   return "aes_ni";
        case Extension::NEON:     return "neon";
        case Extension::SVE:      return "sve";
        case Extension::SVE2:     return "sve2";
        case Extension::ARM_SHA2: return "sha2";
        case Extension::ARM_AES:  return "aes";
        case Extension::RVV:      return "v";
        case Extension::ZBB:      return "zbb";
        case Extension::ZKNH:     return "zknh";
        case Extension::ZVKNHB:   return "zvknhb";
    }
    return "?";
}

std::optional<Extension> parse_extension(std::string_view name) {
    std::string lower;
    for (char c : name) lower += char(std::tolower(static_cast<unsigned char>(c)));
    for (Extension e : ALL_EXTENSIONS) {
        if (lower == to_string(e)) return e;
    }
    return std::nullopt;
}

Architecture extension_architecture(Extension ext) {
    switch (ext) {
        case Extension::SSE42:
        case Extension::AVX:
        case Extension::AVX2:
        case Extension::AVX512F:
        case Extension::AVX512BW:
        case Extension::BMI2:
        case Extension::SHA_NI:
        case Extension::AES_NI:
            return Architecture::X86_64;
        case Extension::NEON:
        case Extension::SVE:
        case Extension::SVE2:
        case Extension::ARM_SHA2:
        case Extension::ARM_AES:
            return Architecture::AArch64;
        case Extension::RVV:
        case Extension::ZBB:
        case Extension::ZKNH:
        case Extension::ZVKNHB:
            return Architecture::RISCV64;
    }
    return Architecture::Other;
}

bool is_crypto_extension(Extension ext) {
    switch (ext) {
        case Extension::SHA_NI:
        case Extension::AES_NI:
        case Extension::ARM_SHA2:
        case Extension::ARM_AES:
        case Extension::ZKNH:
        case Extension::ZVKNHB:
            return true;
        case Extension::SSE42:
        case Extension::AVX:
        case Extension::AVX2:
        case Extension::AVX512F:
        case Extension::AVX512BW:
        case Extension::BMI2:
        case Extension::NEON:
        case Extension::SVE:
        case Extension::SVE2:
        case Extension::RVV:
        case Extension::ZBB:
            return false;
    }
    return false;
}

void split_extensions(const ExtensionSet& all, ExtensionSet& vector, ExtensionSet& crypto) {
    for (Extension e : all.list()) {
        if (is_crypto_extension(e)) {
            crypto.insert(e);
        } else {
            vector.insert(e);
        }
    }
}

std::string ExtensionSet::to_string() const {
    std::string out;
    for (Extension e : list()) {
        if (!out.empty()) out += ",";
        out += platform::to_string(e);
    }
    return out;
}

HardwareCapabilities HardwareCapabilities::without(Extension ext) const {
    HardwareCapabilities copy = *this;
    if (copy.vector_extensions) copy.vector_extensions->erase(ext);
    if (copy.crypto_extensions) copy.crypto_extensions->erase(ext);
    return copy;
}

std::string HardwareCapabilities::summary() const {
    auto set_str = [](const std::optional<ExtensionSet>& s) -> std::string {
        return s ? "[" + s->to_string() + "]" : "unknown";
    };

    std::stringstream ss;
    ss << to_string(architecture) << " " << to_string(vendor)
       << " \"" << model << "\""
       << " cores=" << core_count << " threads=" << thread_count
       << " vector=" << set_str(vector_extensions)
       << " crypto=" << set_str(crypto_extensions);
    if (!caches.empty()) {
        ss << " caches=";
        for (size_t i = 0; i < caches.size(); i++) {
            const auto& c = caches[i];
            ss << (i ? "," : "") << "L" << c.level << c.kind.substr(0, 1) << ":" << c.size_kb << "K";
        }
    }
    if (memory_channels) ss << " mem_channels=" << *memory_channels;
    if (!accelerators.empty()) ss << " accelerators=" << accelerators.size();
    return ss.str();
}

}  // namespace platform
}  // namespace conhal
