#include "gbasave/common/Logger.h"
#include <iostream>
#include <chrono>
#include <cstdarg>
#include <cstdio>

namespace GBASave::Common {

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
    }
    return "INFO";
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message) {
    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (level < m_minLevel) return;
        if (!IsCategoryEnabled(category)) return;
        callback = m_callback;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();

    if (callback) {
        callback(entry);
        return;
    }

    // Default output to stdout/stderr
    std::ostream& out = (level >= LogLevel::Error) ? std::cerr : std::cout;
    out << "[" << LogLevelName(level) << "] [" << category << "] " << message << std::endl;
}

void Logger::LogFmt(LogLevel level, const std::string& category, const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    Log(level, category, std::string(buffer));
}

void Logger::SetCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = callback;
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_categories[category] = true;
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_categories[category] = false;
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    // Categories are enabled unless explicitly disabled.
    auto it = m_categories.find(category);
    if (it != m_categories.end()) {
        return it->second;
    }
    return true;
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_minLevel = level;
}

LogLevel Logger::GetLevel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_minLevel;
}

} // namespace GBASave::Common
