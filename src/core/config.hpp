/**
 * conhal Configuration
 *
 * Operator settings for the execution engine.
 * Config file: ~/.conhal/config (or $CONHAL_CONFIG), key=value per line.
 */

#pragma once

#include "errors.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace conhal {

struct EngineConfig {
    // Extensions the operator declares unusable even if advertised (e.g. "avx512f,sha_ni")
    std::vector<std::string> masked_extensions;

    std::string log_dir;

    // Benchmark and fuzzing defaults
    uint32_t benchmark_iterations = 200;
    uint32_t benchmark_warmup = 10;
    uint32_t fuzz_iterations = 256;
    uint64_t fuzz_seed = 0x5eed;

    // Default workload applied by ExecutionEngine::from_config ("" = untuned)
    std::string priority;
    std::string memory_target;
    std::string power_target;

    /**
     * Get config file path.
     */
    static std::string get_config_path() {
        if (const char* env = std::getenv("CONHAL_CONFIG")) return env;
        const char* home_env = std::getenv("HOME");
        std::string home = home_env ? home_env : ".";
        return home + "/.conhal/config";
    }

    /**
     * Load config from file. Returns false if the file does not exist.
     * Bad values are reported through `status` and leave the default in place.
     */
    bool load(const std::string& path = "", Result* status = nullptr) {
        std::ifstream file(path.empty() ? get_config_path() : path);
        if (!file.is_open()) {
            return false;  // No config file yet
        }
        Result r = parse(file);
        if (status) *status = r;
        return true;
    }

    /**
     * Parse key=value lines. Returns the first error encountered; parsing
     * continues past it so later keys still apply.
     */
    Result parse(std::istream& in) {
        Result first = Result::success();
        auto fail = [&first](const std::string& msg) {
            if (first.ok()) first = Result::error(ErrorCode::ConfigError, msg);
        };

        std::string line;
        int line_no = 0;
        while (std::getline(in, line)) {
            line_no++;
            if (line.empty() || line[0] == '#') continue;

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                fail("line " + std::to_string(line_no) + ": expected key=value");
                continue;
            }

            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));

            if (key == "masked_extensions") {
                masked_extensions = split_list(value);
            } else if (key == "log_dir") {
                log_dir = value;
            } else if (key == "benchmark_iterations") {
                uint32_t n = 0;
                if (parse_uint(value, n) && n != 0) benchmark_iterations = n;
                else fail("benchmark_iterations: invalid value '" + value + "'");
            } else if (key == "benchmark_warmup") {
                if (!parse_uint(value, benchmark_warmup))
                    fail("benchmark_warmup: invalid value '" + value + "'");
            } else if (key == "fuzz_iterations") {
                if (!parse_uint(value, fuzz_iterations))
                    fail("fuzz_iterations: invalid value '" + value + "'");
            } else if (key == "fuzz_seed") {
                if (!parse_uint(value, fuzz_seed))
                    fail("fuzz_seed: invalid value '" + value + "'");
            } else if (key == "priority") {
                if (one_of(value, {"critical", "high", "normal", "low"})) priority = value;
                else fail("priority: unknown value '" + value + "'");
            } else if (key == "memory_target") {
                if (one_of(value, {"minimal", "balanced", "performance"})) memory_target = value;
                else fail("memory_target: unknown value '" + value + "'");
            } else if (key == "power_target") {
                if (one_of(value, {"efficient", "balanced", "performance"})) power_target = value;
                else fail("power_target: unknown value '" + value + "'");
            } else {
                fail("unknown key '" + key + "'");
            }
        }
        return first;
    }

    /**
     * Save config to file.
     */
    bool save(const std::string& path = "") const {
        std::filesystem::path target = path.empty() ? get_config_path() : path;

        std::error_code ec;
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path(), ec);
            if (ec) {
                std::cerr << "[!] Failed to create config directory: " << ec.message() << "\n";
                return false;
            }
        }

        std::ofstream file(target);
        if (!file.is_open()) {
            std::cerr << "[!] Failed to open config file for writing: " << target << "\n";
            return false;
        }

        file << "# conhal configuration\n";
        file << "\n";
        file << "# Extensions treated as unusable even when the CPU advertises them\n";
        file << "masked_extensions=";
        for (size_t i = 0; i < masked_extensions.size(); i++) {
            file << (i ? "," : "") << masked_extensions[i];
        }
        file << "\n";
        if (!log_dir.empty()) file << "log_dir=" << log_dir << "\n";
        file << "\n";
        file << "benchmark_iterations=" << benchmark_iterations << "\n";
        file << "benchmark_warmup=" << benchmark_warmup << "\n";
        file << "fuzz_iterations=" << fuzz_iterations << "\n";
        file << "fuzz_seed=" << fuzz_seed << "\n";
        if (!priority.empty()) file << "priority=" << priority << "\n";
        if (!memory_target.empty()) file << "memory_target=" << memory_target << "\n";
        if (!power_target.empty()) file << "power_target=" << power_target << "\n";

        return file.good();
    }

private:
    static std::string trim(const std::string& s) {
        size_t b = s.find_first_not_of(" \t\r");
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(" \t\r");
        return s.substr(b, e - b + 1);
    }

    static std::vector<std::string> split_list(const std::string& value) {
        std::vector<std::string> out;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (!item.empty()) out.push_back(item);
        }
        return out;
    }

    template <typename T>
    static bool parse_uint(const std::string& value, T& out) {
        if (value.empty() || value[0] == '-') return false;
        try {
            size_t used = 0;
            unsigned long long v = std::stoull(value, &used, 0);
            if (used != value.size()) return false;
            if (static_cast<unsigned long long>(static_cast<T>(v)) != v) return false;
            out = static_cast<T>(v);
            return true;
        } catch (const std::logic_error&) {
            return false;
        }
    }

    static bool one_of(const std::string& v, std::initializer_list<const char*> allowed) {
        for (const char* a : allowed) {
            if (v == a) return true;
        }
        return false;
    }
};

}  // namespace conhal
