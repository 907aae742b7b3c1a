#pragma once

#include <cstdio>
#include <cstdarg>
#include <string>
#include <utility>

namespace ednakmer {

// Leveled logger writing to stderr: "[LEVEL] component: message".
// Thread-safe if fprintf is thread-safe.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::string component = {})
        : level_(level), component_(std::move(component)) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    const std::string& component() const { return component_; }

    // Same level, different component tag.
    Logger with_component(const std::string& component) const {
        return Logger(level_, component);
    }

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
    std::string component_;

    static const char* tag(Level level) {
        switch (level) {
            case kError: return "ERROR";
            case kWarn:  return "WARN";
            case kInfo:  return "INFO";
            case kDebug: return "DEBUG";
        }
        return "INFO";
    }

    void vlog(Level level, const char* fmt, va_list ap) const {
        if (level > level_) return;
        if (component_.empty()) {
            std::fprintf(stderr, "[%s] ", tag(level));
        } else {
            std::fprintf(stderr, "[%s] %s: ", tag(level), component_.c_str());
        }
        std::vfprintf(stderr, fmt, ap);
        std::fprintf(stderr, "\n");
    }
};

} // namespace ednakmer
