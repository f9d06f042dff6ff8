#pragma once

#include <cstdarg>
#include <cstdio>

namespace seqreport {

// printf-style logger writing to stderr. Thread-safe if fprintf is thread-safe.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo) : level_(level) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }
    bool enabled(Level level) const { return level <= level_; }

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        vlog(kError, fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        vlog(kWarn, fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        vlog(kInfo, fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        vlog(kDebug, fmt, ap);
        va_end(ap);
    }

private:
    Level level_;

    void vlog(Level level, const char* fmt, va_list ap) const {
        static const char* const kTags[] = {"ERROR", "WARN", "INFO", "DEBUG"};
        if (!enabled(level)) return;
        std::fprintf(stderr, "[%s] ", kTags[level]);
        std::vfprintf(stderr, fmt, ap);
        std::fprintf(stderr, "\n");
    }
};

} // namespace seqreport
