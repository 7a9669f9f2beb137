#pragma once
#include <cstdio>
#include <atomic>
#include <cstdarg>
#include <mutex>
#include <optional>
#include <string>

namespace termlink {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_.load(); }
    // nullptr restores stderr
    void set_output(FILE* out);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    FILE* out_ = nullptr;
    const char* level_str(LogLevel lvl);
};

std::optional<LogLevel> parse_log_level(const std::string& s);

} // namespace termlink
