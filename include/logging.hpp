#pragma once
#include <atomic>
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace lanxfer {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR, OFF };

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    // tag names the subsystem, e.g. "parser" or "server".
    void log(LogLevel lvl, const char* tag, const char* fmt, ...);

    static bool parse_level(const std::string& s, LogLevel& out);
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    const char* level_str(LogLevel lvl);
};

} // namespace lanxfer
