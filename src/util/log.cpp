#include "util/log.hpp"

#include <chrono>
#include <ctime>
#include <iostream>
#include <fmt/chrono.h>

namespace rev::util {

LogLevel ParseLogLevel(std::string_view name)
{
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

static const char* levelName(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

Logger& Logger::getInstance()
{
    static absl::NoDestructor<Logger> instance;
    return *instance;
}

bool Logger::open(const std::string& path)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (file_.is_open()) file_.close();
    file_.open(path, std::ios::app);
    if (!file_) {
        std::cerr << "[Log] Cannot open log file: " << path << '\n';
        return false;
    }
    return true;
}

void Logger::close()
{
    std::lock_guard<std::mutex> lock(mu_);
    if (file_.is_open()) file_.close();
}

void Logger::write(LogLevel level, std::string_view tag, std::string_view msg)
{
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::string line = fmt::format("{:%Y-%m-%d %H:%M:%S} {:<5} [{}] {}\n",
                                   fmt::localtime(now), levelName(level), tag, msg);

    std::lock_guard<std::mutex> lock(mu_);
    if (file_.is_open()) {
        file_ << line;
        file_.flush();
    } else {
        std::cerr << line;
    }
}

} // namespace rev::util
