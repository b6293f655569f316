/**
 * conhal Hardware Capabilities
 *
 * Immutable snapshot of what the host advertises: architecture, vendor,
 * SIMD/crypto extensions, cache hierarchy, memory channels and attached
 * accelerators. Produced by the Detector, consumed by the optimizers.
 *
 * Absent knowledge is explicit: an extension set that could not be
 * determined is std::nullopt, never an empty set pretending to be an answer.
 */

#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conhal {
namespace platform {

// Compile-time target
#if defined(__x86_64__) || defined(_M_X64)
    #define CONHAL_ARCH_X86_64 1
    #define CONHAL_ARCH_NAME "x86_64"
#elif defined(__aarch64__)
    #define CONHAL_ARCH_AARCH64 1
    #define CONHAL_ARCH_NAME "aarch64"
#elif defined(__riscv) && __riscv_xlen == 64
    #define CONHAL_ARCH_RISCV64 1
    #define CONHAL_ARCH_NAME "riscv64"
#else
    #define CONHAL_ARCH_OTHER 1
    #define CONHAL_ARCH_NAME "other"
#endif

enum class Architecture : uint8_t {
    X86_64,
    AArch64,
    RISCV64,
    Other
};

enum class Vendor : uint8_t {
    Intel,
    AMD,
    ARM,
    RISCV,
    Other
};

/**
 * Instruction set extensions relevant to the accelerated kernels.
 */
enum class Extension : uint32_t {
    // x86
    SSE42    = 1u << 0,
    AVX      = 1u << 1,
    AVX2     = 1u << 2,
    AVX512F  = 1u << 3,
    AVX512BW = 1u << 4,
    BMI2     = 1u << 5,
    SHA_NI   = 1u << 6,
    AES_NI   = 1u << 7,
    // ARM
    NEON     = 1u << 8,
    SVE      = 1u << 9,
    SVE2     = 1u << 10,
    ARM_SHA2 = 1u << 11,
    ARM_AES  = 1u << 12,
    // RISC-V
    RVV      = 1u << 13,
    ZBB      = 1u << 14,
    ZKNH     = 1u << 15,
    ZVKNHB   = 1u << 16,
};

inline constexpr std::array<Extension, 17> ALL_EXTENSIONS = {
    Extension::SSE42, Extension::AVX, Extension::AVX2, Extension::AVX512F,
    Extension::AVX512BW, Extension::BMI2, Extension::SHA_NI, Extension::AES_NI,
    Extension::NEON, Extension::SVE, Extension::SVE2, Extension::ARM_SHA2,
    Extension::ARM_AES, Extension::RVV, Extension::ZBB, Extension::ZKNH,
    Extension::ZVKNHB,
};

const char* to_string(Architecture arch);
const char* to_string(Vendor vendor);
const char* to_string(Extension ext);

// Accepts the names produced by to_string(Extension), case-insensitive
std::optional<Extension> parse_extension(std::string_view name);

Architecture extension_architecture(Extension ext);
bool is_crypto_extension(Extension ext);

/**
 * Set of extensions (bitmask)
 */
class ExtensionSet {
public:
    ExtensionSet() = default;
    ExtensionSet(std::initializer_list<Extension> exts) {
        for (Extension e : exts) insert(e);
    }

    void insert(Extension e) { bits_ |= static_cast<uint32_t>(e); }
    void erase(Extension e) { bits_ &= ~static_cast<uint32_t>(e); }
    bool contains(Extension e) const { return (bits_ & static_cast<uint32_t>(e)) != 0; }
    bool empty() const { return bits_ == 0; }
    uint32_t bits() const { return bits_; }

    std::vector<Extension> list() const {
        std::vector<Extension> out;
        for (Extension e : ALL_EXTENSIONS) {
            if (contains(e)) out.push_back(e);
        }
        return out;
    }

    // Comma separated names, "" for the empty set
    std::string to_string() const;

    ExtensionSet operator|(const ExtensionSet& o) const {
        ExtensionSet r;
        r.bits_ = bits_ | o.bits_;
        return r;
    }

    bool operator==(const ExtensionSet& o) const { return bits_ == o.bits_; }
    bool operator!=(const ExtensionSet& o) const { return bits_ != o.bits_; }

private:
    uint32_t bits_ = 0;
};

/**
 * One level of the cache hierarchy (from sysfs or CPUID leaf 4).
 */
struct CacheLevel {
    int level = 0;              // 1, 2, 3
    std::string kind;           // "Data", "Instruction", "Unified"
    uint32_t size_kb = 0;
    uint32_t line_size = 0;
    uint32_t shared_by = 0;     // Logical CPUs sharing this cache, 0 = unknown

    bool operator==(const CacheLevel&) const = default;
};

/**
 * Non-CPU compute device visible to the host (GPU, NPU).
 */
struct Accelerator {
    std::string kind;           // "gpu", "npu"
    std::string vendor_id;      // PCI vendor id, e.g. "0x10de"
    std::string name;           // Device node name, e.g. "card0"

    bool operator==(const Accelerator&) const = default;
};

struct HardwareCapabilities {
    Architecture architecture = Architecture::Other;
    Vendor vendor = Vendor::Other;
    std::string vendor_string;
    std::string model = "unknown";
    uint32_t core_count = 0;        // 0 = unknown
    uint32_t thread_count = 0;      // 0 = unknown

    std::optional<ExtensionSet> vector_extensions;
    std::optional<ExtensionSet> crypto_extensions;

    std::vector<CacheLevel> caches;
    std::optional<uint32_t> memory_channels;
    std::vector<Accelerator> accelerators;

    /**
     * True if the extension appears in either set. An undetermined set
     * advertises nothing.
     */
    bool advertises(Extension ext) const {
        return (vector_extensions && vector_extensions->contains(ext)) ||
               (crypto_extensions && crypto_extensions->contains(ext));
    }

    ExtensionSet advertised() const {
        ExtensionSet all;
        if (vector_extensions) all = all | *vector_extensions;
        if (crypto_extensions) all = all | *crypto_extensions;
        return all;
    }

    // Copy with `ext` removed from whichever set holds it
    HardwareCapabilities without(Extension ext) const;

    /**
     * The all-absent snapshot returned when detection fails outright.
     */
    static HardwareCapabilities minimal() { return HardwareCapabilities{}; }

    std::string summary() const;

    bool operator==(const HardwareCapabilities&) const = default;
};

/**
 * Split a flat extension set into the vector and crypto halves.
 */
void split_extensions(const ExtensionSet& all, ExtensionSet& vector, ExtensionSet& crypto);

}  // namespace platform
}  // namespace conhal
