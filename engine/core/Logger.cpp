#include "Logger.h"

#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace Engine {

namespace {
std::mutex gLogMutex;
LogLevel gMinLevel = LogLevel::Info;
Logger::Sink gSink;

std::string_view toLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
        default:
            return "ERROR";
    }
}
}  // namespace

void Logger::log(LogLevel level, std::string_view message) {
    using namespace std::chrono;

    if (!enabled(level)) return;

    const auto now = system_clock::now();
    const auto t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream oss;
    oss << '[' << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count() << "] ["
        << toLabel(level) << "] " << message;

    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gSink) {
        gSink(level, oss.str());
        return;
    }
    std::ostream& out = level >= LogLevel::Warning ? std::cerr : std::cout;
    out << oss.str() << '\n';
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    gMinLevel = level;
}

LogLevel Logger::minLevel() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    return gMinLevel;
}

bool Logger::enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(minLevel());
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    gSink = std::move(sink);
}

bool Logger::parseLevel(std::string_view text, LogLevel& out) {
    std::string v;
    v.reserve(text.size());
    for (char c : text) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "debug") {
        out = LogLevel::Debug;
    } else if (v == "info") {
        out = LogLevel::Info;
    } else if (v == "warn" || v == "warning") {
        out = LogLevel::Warning;
    } else if (v == "error") {
        out = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

}  // namespace Engine
