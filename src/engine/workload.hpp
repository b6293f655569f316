/**
 * conhal Workload Profile
 *
 * What the operator tells the engine about the load it is about to carry,
 * and the SelectionPolicy it reduces to. A profile only shapes future path
 * selection; paths already handed out keep running as they are.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace conhal {

enum class Priority : uint8_t { Critical, High, Normal, Low };
enum class MemoryTarget : uint8_t { Minimal, Balanced, Performance };
enum class PowerTarget : uint8_t { Efficient, Balanced, Performance };

inline const char* to_string(Priority p) {
    switch (p) {
        case Priority::Critical: return "critical";
        case Priority::High:     return "high";
        case Priority::Normal:   return "normal";
        case Priority::Low:      return "low";
    }
    return "?";
}

inline const char* to_string(MemoryTarget m) {
    switch (m) {
        case MemoryTarget::Minimal:     return "minimal";
        case MemoryTarget::Balanced:    return "balanced";
        case MemoryTarget::Performance: return "performance";
    }
    return "?";
}

inline const char* to_string(PowerTarget p) {
    switch (p) {
        case PowerTarget::Efficient:   return "efficient";
        case PowerTarget::Balanced:    return "balanced";
        case PowerTarget::Performance: return "performance";
    }
    return "?";
}

inline std::optional<Priority> parse_priority(std::string_view s) {
    for (Priority p : {Priority::Critical, Priority::High, Priority::Normal, Priority::Low}) {
        if (s == to_string(p)) return p;
    }
    return std::nullopt;
}

inline std::optional<MemoryTarget> parse_memory_target(std::string_view s) {
    for (MemoryTarget m : {MemoryTarget::Minimal, MemoryTarget::Balanced, MemoryTarget::Performance}) {
        if (s == to_string(m)) return m;
    }
    return std::nullopt;
}

inline std::optional<PowerTarget> parse_power_target(std::string_view s) {
    for (PowerTarget p : {PowerTarget::Efficient, PowerTarget::Balanced, PowerTarget::Performance}) {
        if (s == to_string(p)) return p;
    }
    return std::nullopt;
}

struct WorkloadProfile {
    uint64_t transaction_volume = 0;
    Priority priority = Priority::Normal;
    MemoryTarget memory_target = MemoryTarget::Balanced;
    PowerTarget power_target = PowerTarget::Balanced;
    std::map<std::string, double> custom_parameters;

    bool operator==(const WorkloadProfile&) const = default;
};

/**
 * Which rung classes the optimizers may consider. Default-constructed it
 * allows everything (the untuned engine).
 */
struct SelectionPolicy {
    bool allow_wide_vectors = true;
    bool allow_crypto_extensions = true;

    /**
     * Wide vectors (AVX-512, SVE) are skipped when running for efficiency or
     * in minimal memory, unless the work is critical. Crypto extensions stay
     * on unless custom_parameters["crypto_extensions"] is 0.
     */
    static SelectionPolicy from_profile(const WorkloadProfile& profile) {
        SelectionPolicy policy;
        bool constrained = profile.power_target == PowerTarget::Efficient ||
                           profile.memory_target == MemoryTarget::Minimal;
        policy.allow_wide_vectors = profile.priority == Priority::Critical || !constrained;

        auto it = profile.custom_parameters.find("crypto_extensions");
        policy.allow_crypto_extensions = it == profile.custom_parameters.end() || it->second != 0.0;
        return policy;
    }

    bool operator==(const SelectionPolicy&) const = default;
};

}  // namespace conhal
