// Minimal console logger with a level filter and a replaceable sink.
#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace Engine {

enum class LogLevel { Debug, Info, Warning, Error };

class Logger {
public:
    // Receives the fully formatted line (without trailing newline).
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static void log(LogLevel level, std::string_view message);

    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();
    static bool enabled(LogLevel level);

    // Passing an empty sink restores stdout/stderr output.
    static void setSink(Sink sink);

    // Accepts debug|info|warn|warning|error (case-insensitive); false if unknown.
    static bool parseLevel(std::string_view text, LogLevel& out);
};

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Engine
