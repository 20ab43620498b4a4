#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <string>

namespace vbi {

// Leveled logger writing "[vbi LEVEL] message" lines to stderr.
// Materialization workers share one Logger, so every line is formatted
// first and emitted with a single write. At debug level each line also
// carries the seconds elapsed since the logger was created.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo)
        : level_(level), start_(std::chrono::steady_clock::now()) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl("ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        if (level_ < kWarn) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        if (level_ < kInfo) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        if (level_ < kDebug) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    std::chrono::steady_clock::time_point start_;

    void log_impl(const char* tag, const char* fmt, va_list ap) const {
        std::string line = "[vbi ";
        line += tag;
        if (level_ >= kDebug) {
            double secs = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start_).count();
            char stamp[32];
            std::snprintf(stamp, sizeof(stamp), " %.3fs", secs);
            line += stamp;
        }
        line += "] ";

        va_list ap2;
        va_copy(ap2, ap);
        char buf[512];
        int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
        if (n >= 0 && static_cast<size_t>(n) < sizeof(buf)) {
            line.append(buf, static_cast<size_t>(n));
        } else if (n > 0) {
            std::string big(static_cast<size_t>(n) + 1, '\0');
            std::vsnprintf(&big[0], big.size(), fmt, ap2);
            line.append(big.data(), static_cast<size_t>(n));
        }
        va_end(ap2);

        line += '\n';
        std::fwrite(line.data(), 1, line.size(), stderr);
    }
};

} // namespace vbi
