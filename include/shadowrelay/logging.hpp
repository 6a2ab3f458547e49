#pragma once
#include <cstdio>
#include <cstdarg>
#include <atomic>
#include <mutex>
#include <string>

namespace shadowrelay {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

bool parse_log_level(const std::string& s, LogLevel& out);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    void set_stream(std::FILE* out);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::FILE* out_ = stderr;
    const char* level_str(LogLevel lvl);
};

} // namespace shadowrelay
