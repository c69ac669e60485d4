#pragma once

#include <fmt/core.h>
#include <atomic>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <absl/base/no_destructor.h>

namespace rev::util {

enum class LogLevel { Debug = 0, Info, Warn, Error };

/// Parses "debug" | "info" | "warn" | "error"; anything else is Info.
LogLevel ParseLogLevel(std::string_view name);

class Logger {
public:
    Logger(const Logger&)            = delete; // non-copyable
    Logger& operator=(const Logger&) = delete; // non-copyable

    static Logger& getInstance();

    /// Redirects output to `path` (append). Until then lines go to std::cerr.
    bool open(const std::string& path);
    void close();

    void setLevel(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }

    void write(LogLevel level, std::string_view tag, std::string_view msg);

private:
    friend class absl::NoDestructor<Logger>;
    Logger() = default;

    std::mutex    mu_;
    std::ofstream file_;
    std::atomic<LogLevel> level_ {LogLevel::Info};
};

template <typename... Args>
void Log(LogLevel level, std::string_view tag, fmt::format_string<Args...> f, Args&&... args)
{
    auto& logger = Logger::getInstance();
    if (level < logger.level()) return;
    logger.write(level, tag, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void LogDebug(std::string_view tag, fmt::format_string<Args...> f, Args&&... args)
{
    Log(LogLevel::Debug, tag, f, std::forward<Args>(args)...);
}

template <typename... Args>
void LogInfo(std::string_view tag, fmt::format_string<Args...> f, Args&&... args)
{
    Log(LogLevel::Info, tag, f, std::forward<Args>(args)...);
}

template <typename... Args>
void LogWarn(std::string_view tag, fmt::format_string<Args...> f, Args&&... args)
{
    Log(LogLevel::Warn, tag, f, std::forward<Args>(args)...);
}

template <typename... Args>
void LogError(std::string_view tag, fmt::format_string<Args...> f, Args&&... args)
{
    Log(LogLevel::Error, tag, f, std::forward<Args>(args)...);
}

} // namespace rev::util
