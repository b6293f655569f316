/**
 * conhal Logger
 *
 * File-based logging for detection, backend selection and degradation events.
 * Logs to ~/.conhal/conhal.log (or $CONHAL_LOG_DIR) with timestamps and rotation.
 * Until init() succeeds every message is dropped, so the library stays silent
 * unless the host application opts in.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>

namespace conhal {

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERR,    // Named ERR to avoid Windows ERROR macro conflict
        FATAL
    };

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    bool init(const std::string& log_dir = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) return true;

        std::string dir = log_dir;
        if (dir.empty()) {
            if (const char* env = std::getenv("CONHAL_LOG_DIR")) {
                dir = env;
            } else if (const char* home = std::getenv("HOME")) {
                dir = std::string(home) + "/.conhal";
            } else {
                dir = ".";
            }
        }

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) return false;

        log_path_ = dir + "/conhal.log";

        // Rotate log if too large (> 10MB). Rotation failure leaves the old file in place.
        if (std::filesystem::exists(log_path_, ec) &&
            std::filesystem::file_size(log_path_, ec) > 10 * 1024 * 1024 && !ec) {
            std::string backup = log_path_ + ".old";
            std::filesystem::remove(backup, ec);
            std::filesystem::rename(log_path_, backup, ec);
        }

        log_file_.open(log_path_, std::ios::app);
        if (!log_file_.is_open()) {
            return false;
        }

        // Write directly, we already hold the mutex
        log_file_ << timestamp() << " [INFO ] === conhal logger started ===\n";
        log_file_.flush();

        initialized_ = true;
        return true;
    }

    void set_min_level(Level level) { min_level_ = level; }

    void log(Level level, const std::string& message) {
        if (!initialized_ || level < min_level_.load()) return;

        std::lock_guard<std::mutex> lock(mutex_);
        log_file_ << timestamp() << " [" << level_str(level) << "] " << message << "\n";
        log_file_.flush();
    }

    void log_detection(const std::string& architecture, const std::string& vendor,
                       const std::string& vector_exts, const std::string& crypto_exts) {
        std::stringstream ss;
        ss << "DETECT: Arch=" << architecture
           << ", Vendor=" << vendor
           << ", Vector=[" << vector_exts << "]"
           << ", Crypto=[" << crypto_exts << "]";
        log(Level::INFO, ss.str());
    }

    void log_selection(const std::string& operation, const std::string& backend,
                       const std::string& optimizer) {
        std::stringstream ss;
        ss << "SELECT: Op=" << operation << ", Backend=" << backend
           << ", Optimizer=" << optimizer;
        log(Level::DEBUG, ss.str());
    }

    void log_degradation(const std::string& operation, const std::string& from,
                         const std::string& to, const std::string& extension) {
        std::stringstream ss;
        ss << "DEGRADED: Op=" << operation << ", " << from << " -> " << to
           << " (" << extension << " advertised but not usable)";
        log(Level::WARN, ss.str());
    }

    void log_tuning(uint64_t volume, const std::string& priority,
                    bool allow_wide, bool allow_crypto) {
        std::stringstream ss;
        ss << "TUNE: Volume=" << volume << ", Priority=" << priority
           << ", WideVectors=" << (allow_wide ? "on" : "off")
           << ", CryptoExt=" << (allow_crypto ? "on" : "off");
        log(Level::INFO, ss.str());
    }

    void log_equivalence(const std::string& operation, const std::string& backend,
                         size_t cases, size_t divergences) {
        std::stringstream ss;
        ss << "EQUIVALENCE: Op=" << operation << ", Backend=" << backend
           << ", Cases=" << cases << ", Divergences=" << divergences;
        log(divergences == 0 ? Level::INFO : Level::ERR, ss.str());
    }

    void log_error(const std::string& error_msg) {
        log(Level::ERR, "ERROR: " + error_msg);
    }

    std::string get_log_path() const { return log_path_; }

    ~Logger() {
        if (initialized_) {
            log(Level::INFO, "=== conhal logger stopped ===");
            log_file_.close();
        }
    }

private:
    Logger() : initialized_(false), min_level_(Level::DEBUG) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);

        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* level_str(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERR:   return "ERROR";
            case Level::FATAL: return "FATAL";
        }
        return "?????";
    }

    std::atomic<bool> initialized_;
    std::atomic<Level> min_level_;
    std::string log_path_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_INFO(msg)  conhal::Logger::instance().log(conhal::Logger::Level::INFO, msg)
#define LOG_WARN(msg)  conhal::Logger::instance().log(conhal::Logger::Level::WARN, msg)
#define LOG_ERROR(msg) conhal::Logger::instance().log(conhal::Logger::Level::ERR, msg)
#define LOG_DEBUG(msg) conhal::Logger::instance().log(conhal::Logger::Level::DEBUG, msg)

}  // namespace conhal
