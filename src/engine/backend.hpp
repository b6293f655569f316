/**
 * conhal Backends
 *
 * Every execution strategy the engine can hand out. A backend is a
 * combination of kernels (hash engine, EC multiplier) plus the extension the
 * host must support before an optimizer may select it. All backends compute
 * identical results; they differ only in speed.
 */

#pragma once

#include "../crypto/hash_engine.hpp"
#include "../platform/capabilities.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace conhal {

enum class Backend : uint8_t {
    Generic,
    RiscvVector,
    RiscvCrypto,
    AmdAvx2,
    AmdShaNi,
    IntelAvx2,
    IntelAvx512,
    IntelShaNi,
    ArmNeon,
    ArmSve,
    ArmCrypto
};

inline constexpr std::array<Backend, 11> ALL_BACKENDS = {
    Backend::Generic,
    Backend::RiscvVector, Backend::RiscvCrypto,
    Backend::AmdAvx2, Backend::AmdShaNi,
    Backend::IntelAvx2, Backend::IntelAvx512, Backend::IntelShaNi,
    Backend::ArmNeon, Backend::ArmSve, Backend::ArmCrypto,
};

/**
 * Rung class, used by the selection policy.
 */
enum class RungKind : uint8_t {
    Generic,
    Vector,
    WideVector,     // AVX-512, SVE: gated by allow_wide_vectors
    Crypto          // SHA extensions: gated by allow_crypto_extensions
};

struct BackendDescriptor {
    Backend backend;
    const char* name;
    platform::Architecture architecture;            // Other = runs anywhere
    std::optional<platform::Extension> required;    // nullopt for Generic
    RungKind rung;
    crypto::HashEngineKind hash;
    unsigned ec_window;                              // 0 = double-and-add
};

const BackendDescriptor& descriptor(Backend backend);
const char* to_string(Backend backend);
std::optional<Backend> parse_backend(std::string_view name);

}  // namespace conhal
