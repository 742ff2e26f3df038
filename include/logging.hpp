
#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace qrcast {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    // Append to path instead of stderr; the terminal display owns stdout.
    bool open_file(const std::string& path);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    ~Logger();
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    FILE* out_ = nullptr;
    const char* level_str(LogLevel lvl);
};

} // namespace qrcast
