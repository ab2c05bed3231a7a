#pragma once

#include "gbasave/common/Logger.h"
#include <cstdarg>
#include <cstdio>
#include <string>
#include <utility>

namespace GBASave::Common {

// Binds printf-style logging to one category. Codec classes that keep
// state across calls (documents, live readers) derive from this; free
// functions log through Logger::Instance() directly.
class Loggable {
public:
    explicit Loggable(std::string category) : m_category(std::move(category)) {}
    virtual ~Loggable() = default;

    const std::string& LogCategory() const { return m_category; }

protected:
    void LogDebug(const char* fmt, ...) const {
        va_list args;
        va_start(args, fmt);
        Emit(LogLevel::Debug, fmt, args);
        va_end(args);
    }

    void LogInfo(const char* fmt, ...) const {
        va_list args;
        va_start(args, fmt);
        Emit(LogLevel::Info, fmt, args);
        va_end(args);
    }

    void LogWarn(const char* fmt, ...) const {
        va_list args;
        va_start(args, fmt);
        Emit(LogLevel::Warning, fmt, args);
        va_end(args);
    }

    void LogError(const char* fmt, ...) const {
        va_list args;
        va_start(args, fmt);
        Emit(LogLevel::Error, fmt, args);
        va_end(args);
    }

private:
    void Emit(LogLevel level, const char* fmt, va_list args) const {
        Logger& logger = Logger::Instance();
        if (level < logger.GetLevel()) return;
        char buffer[1024];
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        logger.Log(level, m_category, buffer);
    }

    std::string m_category;
};

} // namespace GBASave::Common
