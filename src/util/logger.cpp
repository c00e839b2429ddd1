#include "packguard/logger.hpp"
#include "packguard/progress_sinks.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>

namespace packguard {

namespace {

// "2026-01-31 12:00:00", or empty when the clock cannot be read.
std::string Timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) return {};
    char buf[32]{};
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0) return {};
    return buf;
}

const char* SourceBaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? (slash + 1) : file;
}

} // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "none")  return LogLevel::None;
    return std::nullopt;
}

const char* LogLevelName(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::None:  return "NONE";
    }
    return "LOG";
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lk(mu_);
    CloseFileLocked();
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(mu_);
    level_ = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(mu_);
    return level_;
}

Result Logger::SetOutputFile(const std::string& path) {
    std::FILE* f = std::fopen(path.c_str(), "ae");
    if (!f) {
        return Result::Fail(ErrorKind::kConfig,
                            "cannot open log file " + path + ": " + std::strerror(errno), errno);
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);

    std::lock_guard<std::mutex> lk(mu_);
    CloseFileLocked();
    file_ = f;
    return Result::Ok();
}

void Logger::ResetOutput() {
    std::lock_guard<std::mutex> lk(mu_);
    CloseFileLocked();
}

void Logger::CloseFileLocked() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    std::lock_guard<std::mutex> lk(mu_);
    if (level_ == LogLevel::None || lvl < level_) return;

    std::FILE* out = file_ ? file_ : stderr;
    if (!file_ && IsProgressLineActive()) {
        ClearProgressLine();
    }

    const std::string ts = Timestamp();
    if (!ts.empty()) std::fprintf(out, "%s ", ts.c_str());
    std::fprintf(out, "packguard[%s]", LogLevelName(lvl));
    if (const char* base = SourceBaseName(file); base && line > 0) {
        std::fprintf(out, " %s:%d", base, line);
    }
    std::fputs(": ", out);
    std::vfprintf(out, fmt, ap);
    std::fputc('\n', out);
}

} // namespace packguard
