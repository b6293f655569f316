/**
 * Capability Detector implementation
 *
 * Linux sources:
 *   /proc/cpuinfo                               vendor, model, flags/Features/isa
 *   /sys/devices/system/cpu/cpu0/cache/index*   cache hierarchy
 *   /sys/devices/system/edac/mc/mc*             populated memory channels
 *   /sys/class/drm/card*, /dev/accel/accel*     GPUs and NPUs
 */

#include "detector.hpp"
#include "../core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#if defined(CONHAL_ARCH_X86_64)
#include <cpuid.h>
#endif

#if defined(__linux__) && (defined(CONHAL_ARCH_AARCH64) || defined(CONHAL_ARCH_RISCV64))
#include <sys/auxv.h>
#endif

namespace conhal {
namespace platform {

namespace fs = std::filesystem;

namespace {

std::string trim(std::string_view s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    std::stringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return true;
}

bool read_line(const std::string& path, std::string& out) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    std::getline(file, out);
    out = trim(out);
    return true;
}

std::vector<std::string> split_ws(std::string_view s) {
    std::vector<std::string> out;
    std::stringstream ss{std::string(s)};
    std::string tok;
    while (ss >> tok) out.push_back(tok);
    return out;
}

void add_x86_flag(ExtensionSet& set, const std::string& flag) {
    static const std::pair<const char*, Extension> map[] = {
        {"sse4_2", Extension::SSE42},
        {"avx", Extension::AVX},
        {"avx2", Extension::AVX2},
        {"avx512f", Extension::AVX512F},
        {"avx512bw", Extension::AVX512BW},
        {"bmi2", Extension::BMI2},
        {"sha_ni", Extension::SHA_NI},
        {"aes", Extension::AES_NI},
    };
    for (const auto& [name, ext] : map) {
        if (flag == name) set.insert(ext);
    }
}

void add_arm_feature(ExtensionSet& set, const std::string& feature) {
    static const std::pair<const char*, Extension> map[] = {
        {"asimd", Extension::NEON},
        {"sve", Extension::SVE},
        {"sve2", Extension::SVE2},
        {"sha2", Extension::ARM_SHA2},
        {"aes", Extension::ARM_AES},
    };
    for (const auto& [name, ext] : map) {
        if (feature == name) set.insert(ext);
    }
}

// "rv64imafdcv_zicsr_zbb_zknh" -> single-letter base plus '_' separated extensions
void add_riscv_isa(ExtensionSet& set, const std::string& isa) {
    std::string lower;
    for (char c : isa) lower += char(std::tolower(static_cast<unsigned char>(c)));
    if (lower.rfind("rv64", 0) != 0 && lower.rfind("rv32", 0) != 0) return;

    size_t us = lower.find('_');
    std::string base = lower.substr(4, us == std::string::npos ? std::string::npos : us - 4);
    if (base.find('v') != std::string::npos) set.insert(Extension::RVV);

    while (us != std::string::npos) {
        size_t next = lower.find('_', us + 1);
        std::string ext = lower.substr(us + 1, next == std::string::npos ? std::string::npos : next - us - 1);
        if (ext == "zbb") set.insert(Extension::ZBB);
        else if (ext == "zknh") set.insert(Extension::ZKNH);
        else if (ext == "zvknhb") set.insert(Extension::ZVKNHB);
        else if (ext == "zk" || ext == "zkn") set.insert(Extension::ZKNH);
        us = next;
    }
}

#if defined(CONHAL_ARCH_X86_64)
bool query_cpuid(CpuinfoFields& out) {
    unsigned eax = 0, ebx = 0, ecx = 0, edx = 0;
    if (!__get_cpuid(0, &eax, &ebx, &ecx, &edx)) return false;
    unsigned max_leaf = eax;

    char vendor[13] = {};
    std::memcpy(vendor, &ebx, 4);
    std::memcpy(vendor + 4, &edx, 4);
    std::memcpy(vendor + 8, &ecx, 4);
    out.vendor_string = vendor;

    unsigned ext_max = __get_cpuid_max(0x80000000, nullptr);
    if (ext_max >= 0x80000004) {
        char brand[49] = {};
        for (unsigned i = 0; i < 3; i++) {
            __get_cpuid(0x80000002 + i, &eax, &ebx, &ecx, &edx);
            std::memcpy(brand + i * 16, &eax, 4);
            std::memcpy(brand + i * 16 + 4, &ebx, 4);
            std::memcpy(brand + i * 16 + 8, &ecx, 4);
            std::memcpy(brand + i * 16 + 12, &edx, 4);
        }
        out.model = trim(brand);
    }

    __get_cpuid(1, &eax, &ebx, &ecx, &edx);
    if (ecx & (1u << 20)) out.extensions.insert(Extension::SSE42);
    if (ecx & (1u << 25)) out.extensions.insert(Extension::AES_NI);
    if (ecx & (1u << 28)) out.extensions.insert(Extension::AVX);

    if (max_leaf >= 7) {
        __get_cpuid_count(7, 0, &eax, &ebx, &ecx, &edx);
        if (ebx & (1u << 5))  out.extensions.insert(Extension::AVX2);
        if (ebx & (1u << 8))  out.extensions.insert(Extension::BMI2);
        if (ebx & (1u << 16)) out.extensions.insert(Extension::AVX512F);
        if (ebx & (1u << 29)) out.extensions.insert(Extension::SHA_NI);
        if (ebx & (1u << 30)) out.extensions.insert(Extension::AVX512BW);
    }
    out.features_seen = true;
    return true;
}
#elif defined(__linux__) && defined(CONHAL_ARCH_AARCH64)
bool query_cpuid(CpuinfoFields& out) {
    unsigned long hwcap = getauxval(AT_HWCAP);
    unsigned long hwcap2 = getauxval(AT_HWCAP2);
    if (hwcap & (1ul << 1))  out.extensions.insert(Extension::NEON);      // HWCAP_ASIMD
    if (hwcap & (1ul << 3))  out.extensions.insert(Extension::ARM_AES);   // HWCAP_AES
    if (hwcap & (1ul << 6))  out.extensions.insert(Extension::ARM_SHA2);  // HWCAP_SHA2
    if (hwcap & (1ul << 22)) out.extensions.insert(Extension::SVE);       // HWCAP_SVE
    if (hwcap2 & (1ul << 1)) out.extensions.insert(Extension::SVE2);      // HWCAP2_SVE2
    out.features_seen = true;
    return true;
}
#elif defined(__linux__) && defined(CONHAL_ARCH_RISCV64)
bool query_cpuid(CpuinfoFields& out) {
    unsigned long hwcap = getauxval(AT_HWCAP);
    if (hwcap & (1ul << ('v' - 'a'))) out.extensions.insert(Extension::RVV);
    out.features_seen = true;
    return true;
}
#else
bool query_cpuid(CpuinfoFields&) {
    return false;
}
#endif

}  // namespace

// -----------------------------------------------------------------------------
// Parsing helpers
// -----------------------------------------------------------------------------

Architecture host_architecture() {
#if defined(CONHAL_ARCH_X86_64)
    return Architecture::X86_64;
#elif defined(CONHAL_ARCH_AARCH64)
    return Architecture::AArch64;
#elif defined(CONHAL_ARCH_RISCV64)
    return Architecture::RISCV64;
#else
    return Architecture::Other;
#endif
}

Vendor vendor_from_string(std::string_view vendor_string, Architecture arch) {
    if (vendor_string == "GenuineIntel") return Vendor::Intel;
    if (vendor_string == "AuthenticAMD" || vendor_string == "HygonGenuine") return Vendor::AMD;
    if (arch == Architecture::AArch64) return Vendor::ARM;
    if (arch == Architecture::RISCV64) return Vendor::RISCV;
    return Vendor::Other;
}

uint32_t count_cpu_list(std::string_view list) {
    uint32_t count = 0;
    std::stringstream ss{std::string(list)};
    std::string part;
    while (std::getline(ss, part, ',')) {
        part = trim(part);
        if (part.empty()) continue;
        size_t dash = part.find('-');
        try {
            if (dash == std::string::npos) {
                std::stoul(part);
                count++;
            } else {
                unsigned long lo = std::stoul(part.substr(0, dash));
                unsigned long hi = std::stoul(part.substr(dash + 1));
                if (hi >= lo) count += uint32_t(hi - lo + 1);
            }
        } catch (const std::logic_error&) {
            return 0;
        }
    }
    return count;
}

CpuinfoFields parse_cpuinfo(std::string_view text, Architecture arch) {
    CpuinfoFields out;
    std::set<std::string> physical_ids;
    uint32_t cores_per_package = 0;
    std::string cpu_part;

    std::stringstream ss{std::string(text)};
    std::string line;
    while (std::getline(ss, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = trim(std::string_view(line).substr(0, colon));
        std::string value = trim(std::string_view(line).substr(colon + 1));

        if (key == "processor") {
            out.logical_cpus++;
        } else if (key == "vendor_id" || key == "CPU implementer" || key == "mvendorid") {
            if (out.vendor_string.empty()) out.vendor_string = value;
        } else if (key == "model name" || key == "uarch") {
            if (out.model.empty()) out.model = value;
        } else if (key == "CPU part") {
            if (cpu_part.empty()) cpu_part = value;
        } else if (key == "physical id") {
            physical_ids.insert(value);
        } else if (key == "cpu cores") {
            try {
                cores_per_package = uint32_t(std::stoul(value));
            } catch (const std::logic_error&) {
                cores_per_package = 0;
            }
        } else if (key == "flags" && arch == Architecture::X86_64) {
            out.features_seen = true;
            for (const auto& f : split_ws(value)) add_x86_flag(out.extensions, f);
        } else if (key == "Features" && arch == Architecture::AArch64) {
            out.features_seen = true;
            for (const auto& f : split_ws(value)) add_arm_feature(out.extensions, f);
        } else if (key == "isa" && arch == Architecture::RISCV64) {
            out.features_seen = true;
            add_riscv_isa(out.extensions, value);
        }
    }

    if (out.model.empty() && !cpu_part.empty()) out.model = "CPU part " + cpu_part;
    if (cores_per_package) {
        out.physical_cores = cores_per_package * uint32_t(std::max<size_t>(1, physical_ids.size()));
    }
    return out;
}

// -----------------------------------------------------------------------------
// HostProbe
// -----------------------------------------------------------------------------

HardwareCapabilities HostProbe::probe() const {
    HardwareCapabilities caps;
    caps.architecture = host_architecture();

    CpuinfoFields fields;
    std::string text;
    if (read_file(path("/proc/cpuinfo"), text)) {
        fields = parse_cpuinfo(text, caps.architecture);
    }

    if (!fields.features_seen && query_cpu_ && root_.empty()) {
        CpuinfoFields direct;
        if (query_cpuid(direct)) {
            fields.extensions = direct.extensions;
            fields.features_seen = true;
            if (fields.vendor_string.empty()) fields.vendor_string = direct.vendor_string;
            if (fields.model.empty()) fields.model = direct.model;
        }
    }

    caps.vendor_string = fields.vendor_string;
    caps.vendor = vendor_from_string(fields.vendor_string, caps.architecture);
    if (!fields.model.empty()) caps.model = fields.model;

    caps.thread_count = fields.logical_cpus;
    if (caps.thread_count == 0 && root_.empty()) {
        caps.thread_count = std::thread::hardware_concurrency();
    }
    caps.core_count = fields.physical_cores ? fields.physical_cores : caps.thread_count;

    if (fields.features_seen) {
        ExtensionSet vec, crypto;
        split_extensions(fields.extensions, vec, crypto);
        caps.vector_extensions = vec;
        caps.crypto_extensions = crypto;
    }

    probe_caches(caps);
    probe_memory(caps);
    probe_accelerators(caps);
    return caps;
}

void HostProbe::probe_caches(HardwareCapabilities& caps) const {
    const std::string base = path("/sys/devices/system/cpu/cpu0/cache/");

    for (int idx = 0; idx < 16; ++idx) {
        std::string index_path = base + "index" + std::to_string(idx) + "/";

        std::string value;
        if (!read_line(index_path + "level", value)) break;

        CacheLevel cache;
        try {
            cache.level = std::stoi(value);
            if (read_line(index_path + "type", value)) cache.kind = value;
            if (read_line(index_path + "size", value) && !value.empty()) {
                uint32_t mult = 1;
                char suffix = value.back();
                if (suffix == 'K') value.pop_back();
                else if (suffix == 'M') { value.pop_back(); mult = 1024; }
                cache.size_kb = uint32_t(std::stoul(value)) * mult;
            }
            if (read_line(index_path + "coherency_line_size", value)) {
                cache.line_size = uint32_t(std::stoul(value));
            }
        } catch (const std::logic_error& e) {
            LOG_WARN(std::string("DetectionUncertain: unreadable cache index") +
                     std::to_string(idx) + ": " + e.what());
            continue;
        }
        if (read_line(index_path + "shared_cpu_list", value)) {
            cache.shared_by = count_cpu_list(value);
        }
        caps.caches.push_back(cache);
    }
}

void HostProbe::probe_memory(HardwareCapabilities& caps) const {
    std::error_code ec;
    fs::path edac = path("/sys/devices/system/edac/mc");
    if (!fs::is_directory(edac, ec)) return;

    uint32_t channels = 0;
    for (const auto& mc : fs::directory_iterator(edac, ec)) {
        if (mc.path().filename().string().rfind("mc", 0) != 0) continue;
        uint32_t dimms = 0, csrows = 0;
        std::error_code inner;
        for (const auto& entry : fs::directory_iterator(mc.path(), inner)) {
            std::string name = entry.path().filename().string();
            if (name.rfind("dimm", 0) == 0) dimms++;
            else if (name.rfind("csrow", 0) == 0) csrows++;
        }
        channels += dimms ? dimms : csrows;
    }
    if (channels > 0) caps.memory_channels = channels;
}

void HostProbe::probe_accelerators(HardwareCapabilities& caps) const {
    std::error_code ec;

    fs::path drm = path("/sys/class/drm");
    if (fs::is_directory(drm, ec)) {
        std::vector<Accelerator> gpus;
        for (const auto& entry : fs::directory_iterator(drm, ec)) {
            std::string name = entry.path().filename().string();
            // card0 yes, card0-HDMI-A-1 (a connector) no
            if (name.rfind("card", 0) != 0 || name.find('-') != std::string::npos) continue;
            Accelerator acc;
            acc.kind = "gpu";
            acc.name = name;
            read_line((entry.path() / "device" / "vendor").string(), acc.vendor_id);
            gpus.push_back(acc);
        }
        std::sort(gpus.begin(), gpus.end(),
                  [](const Accelerator& a, const Accelerator& b) { return a.name < b.name; });
        caps.accelerators.insert(caps.accelerators.end(), gpus.begin(), gpus.end());
    }

    fs::path accel = path("/dev/accel");
    if (fs::is_directory(accel, ec)) {
        std::vector<Accelerator> npus;
        for (const auto& entry : fs::directory_iterator(accel, ec)) {
            std::string name = entry.path().filename().string();
            if (name.rfind("accel", 0) != 0) continue;
            npus.push_back(Accelerator{"npu", "", name});
        }
        std::sort(npus.begin(), npus.end(),
                  [](const Accelerator& a, const Accelerator& b) { return a.name < b.name; });
        caps.accelerators.insert(caps.accelerators.end(), npus.begin(), npus.end());
    }
}

// -----------------------------------------------------------------------------
// Detector
// -----------------------------------------------------------------------------

HardwareCapabilities Detector::detect(const CapabilityProbe& probe) {
    HardwareCapabilities caps;
    try {
        caps = probe.probe();
    } catch (const std::exception& e) {
        LOG_WARN(std::string("DetectionUncertain: probe '") + probe.name() +
                 "' failed (" + e.what() + "), using minimal capabilities");
        return HardwareCapabilities::minimal();
    } catch (...) {
        LOG_WARN(std::string("DetectionUncertain: probe '") + probe.name() +
                 "' failed with a non-standard exception, using minimal capabilities");
        return HardwareCapabilities::minimal();
    }

    if (!caps.vector_extensions) {
        LOG_WARN("DetectionUncertain: vector extensions could not be determined");
    }
    if (!caps.crypto_extensions) {
        LOG_WARN("DetectionUncertain: crypto extensions could not be determined");
    }

    Logger::instance().log_detection(
        to_string(caps.architecture), to_string(caps.vendor),
        caps.vector_extensions ? caps.vector_extensions->to_string() : "?",
        caps.crypto_extensions ? caps.crypto_extensions->to_string() : "?");
    return caps;
}

HardwareCapabilities Detector::detect_host() {
    HostProbe probe;
    return detect(probe);
}

}  // namespace platform
}  // namespace conhal
