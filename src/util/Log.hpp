#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace meshirc::util {

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

// Process-wide log sink. Lines look like
//   2026-10-17 12:00:00 - INFO - [tag] message
// Warnings and errors go to stderr, everything else to stdout.
class Log {
public:
    static void set_level(LogLevel level) noexcept { level_.store(level); }
    static LogLevel level() noexcept { return level_.load(); }
    static bool enabled(LogLevel level) noexcept { return level >= level_.load(); }

    static void write(LogLevel level, std::string_view tag, const std::string& msg) {
        if (!enabled(level)) return;

        std::ostringstream line;
        line << timestamp_() << " - " << name_of(level) << " - [" << tag << "] " << msg << '\n';

        std::lock_guard<std::mutex> lk(mu_);
        std::ostream& out = level >= LogLevel::Warning ? std::cerr : std::cout;
        out << line.str();
        out.flush();
    }

    static const char* name_of(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARNING";
            case LogLevel::Error:   return "ERROR";
        }
        return "LOG";
    }

private:
    static std::string timestamp_() {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);
        std::ostringstream os;
        os << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return os.str();
    }

    static inline std::atomic<LogLevel> level_{LogLevel::Info};
    static inline std::mutex mu_;
};

// Collects one line with operator<< and writes it on destruction.
class LogLine {
public:
    LogLine(LogLevel level, std::string_view tag)
        : level_(level), tag_(tag), active_(Log::enabled(level)) {}

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    ~LogLine() {
        if (active_) Log::write(level_, tag_, buf_.str());
    }

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (active_) buf_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string tag_;
    bool active_;
    std::ostringstream buf_;
};

inline LogLine log_debug(std::string_view tag)   { return LogLine(LogLevel::Debug, tag); }
inline LogLine log_info(std::string_view tag)    { return LogLine(LogLevel::Info, tag); }
inline LogLine log_warning(std::string_view tag) { return LogLine(LogLevel::Warning, tag); }
inline LogLine log_error(std::string_view tag)   { return LogLine(LogLevel::Error, tag); }

} // namespace meshirc::util
