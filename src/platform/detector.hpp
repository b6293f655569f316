/**
 * conhal Capability Detector
 *
 * CapabilityProbe is the single seam between the engine and the host:
 * HostProbe reads the real machine, StaticProbe replays a fixed snapshot,
 * and tests supply their own (including ones that throw).
 *
 * Detector::detect() never fails. A probe that throws yields
 * HardwareCapabilities::minimal() and a DetectionUncertain log entry.
 */

#pragma once

#include "capabilities.hpp"

#include <string>
#include <string_view>

namespace conhal {
namespace platform {

class CapabilityProbe {
public:
    virtual ~CapabilityProbe() = default;

    virtual HardwareCapabilities probe() const = 0;
    virtual std::string name() const = 0;
};

/**
 * Reads /proc/cpuinfo, sysfs (caches, EDAC memory controllers, DRM cards)
 * and /dev/accel. On the compile target's own architecture it also asks the
 * CPU directly (CPUID, getauxval) when cpuinfo is unreadable.
 *
 * `root` prefixes every filesystem path, so tests can point the probe at a
 * fabricated tree.
 */
class HostProbe : public CapabilityProbe {
public:
    explicit HostProbe(std::string root = "", bool query_cpu = true)
        : root_(std::move(root)), query_cpu_(query_cpu) {}

    HardwareCapabilities probe() const override;
    std::string name() const override { return "host"; }

private:
    std::string path(const std::string& p) const { return root_ + p; }

    void probe_caches(HardwareCapabilities& caps) const;
    void probe_memory(HardwareCapabilities& caps) const;
    void probe_accelerators(HardwareCapabilities& caps) const;

    std::string root_;
    bool query_cpu_;
};

class StaticProbe : public CapabilityProbe {
public:
    explicit StaticProbe(HardwareCapabilities caps) : caps_(std::move(caps)) {}

    HardwareCapabilities probe() const override { return caps_; }
    std::string name() const override { return "static"; }

private:
    HardwareCapabilities caps_;
};

/**
 * Fields recovered from /proc/cpuinfo text.
 */
struct CpuinfoFields {
    std::string vendor_string;
    std::string model;
    uint32_t logical_cpus = 0;
    uint32_t physical_cores = 0;    // 0 = not reported
    bool features_seen = false;     // a flags/Features/isa line was present
    ExtensionSet extensions;
};

CpuinfoFields parse_cpuinfo(std::string_view text, Architecture arch);

// "0-3,8,10-11" -> 7
uint32_t count_cpu_list(std::string_view list);

Architecture host_architecture();
Vendor vendor_from_string(std::string_view vendor_string, Architecture arch);

class Detector {
public:
    static HardwareCapabilities detect(const CapabilityProbe& probe);
    static HardwareCapabilities detect_host();
};

}  // namespace platform
}  // namespace conhal
