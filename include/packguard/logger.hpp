#pragma once

#include "packguard/result.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace packguard {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

std::optional<LogLevel> ParseLogLevel(std::string_view name);
const char* LogLevelName(LogLevel lvl);

// Process-wide logger. Lines go to stderr unless a log file was opened.
class Logger {
public:
    static Logger& Instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Appends to path from now on. The console progress line is left alone
    // while a file is the destination.
    Result SetOutputFile(const std::string& path);
    void ResetOutput();

    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
    ~Logger();

    void CloseFileLocked();

    mutable std::mutex mu_;
    LogLevel level_ = LogLevel::Info;
    std::FILE* file_ = nullptr;
};

#define LogDebug(...) ::packguard::Logger::Instance().LogWithSource(::packguard::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::packguard::Logger::Instance().LogWithSource(::packguard::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::packguard::Logger::Instance().LogWithSource(::packguard::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::packguard::Logger::Instance().LogWithSource(::packguard::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace packguard
