#include "logger.hpp"
#include "policy_types.hpp"
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace nftfw {

LogLevel Logger::current_level_ = LogLevel::Info;
LogStyle Logger::current_style_ = LogStyle::Default;

namespace {

std::mutex& outputMutex() {
    static std::mutex mutex;
    return mutex;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream out;
    out << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    out << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return out.str();
}

} // namespace

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (level == LogLevel::None || level > current_level_) {
        return;
    }

    std::string level_str;
    int priority = 6;
    // Standard output is reserved for command results such as the compiled batch
    std::ostream* output_stream = &std::cerr;

    switch (level) {
        case LogLevel::Error:
            level_str = "ERROR";
            priority = 3;
            break;
        case LogLevel::Warning:
            level_str = "WARN ";
            priority = 4;
            break;
        case LogLevel::Info:
            level_str = "INFO ";
            priority = 6;
            break;
        case LogLevel::Debug:
            level_str = "DEBUG";
            priority = 7;
            break;
        case LogLevel::None:
            return;
    }

    std::lock_guard<std::mutex> lock(outputMutex());
    if (current_style_ == LogStyle::Systemd) {
        *output_stream << "<" << priority << ">" << component << ": " << message << std::endl;
    } else {
        *output_stream << "[" << timestamp() << "] [" << level_str << "] "
                       << component << ": " << message << std::endl;
    }
}

void Logger::error(const std::string& component, const std::string& message) {
    log(LogLevel::Error, component, message);
}

void Logger::warn(const std::string& component, const std::string& message) {
    log(LogLevel::Warning, component, message);
}

void Logger::info(const std::string& component, const std::string& message) {
    log(LogLevel::Info, component, message);
}

void Logger::debug(const std::string& component, const std::string& message) {
    log(LogLevel::Debug, component, message);
}

void Logger::setLevel(LogLevel level) {
    current_level_ = level;
}

LogLevel Logger::getLevel() {
    return current_level_;
}

bool Logger::isEnabled(LogLevel level) {
    return level != LogLevel::None && level <= current_level_;
}

void Logger::setStyle(LogStyle style) {
    current_style_ = style;
}

LogStyle Logger::getStyle() {
    return current_style_;
}

void Logger::initStyleFromEnvironment() {
    const char* value = std::getenv("NFTFW_LOG_STYLE");
    if (value != nullptr && std::string(value) == "SYSTEMD") {
        current_style_ = LogStyle::Systemd;
    }
}

LogLevel Logger::levelFromString(const std::string& name) {
    std::string lower = toLower(name);

    if (lower == "none") return LogLevel::None;
    if (lower == "error") return LogLevel::Error;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "info") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;

    throw std::invalid_argument("Invalid log level: " + name +
                                " (expected none, error, warning, info or debug)");
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::None: return "none";
        case LogLevel::Error: return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
    }
    return "unknown";
}

} // namespace nftfw
