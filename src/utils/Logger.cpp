#include "utils/Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace cogarch {
namespace log {

namespace {
Level g_min_level = Level::Info;
std::ostream* g_sink = nullptr;

std::ostream& sink() {
    return g_sink ? *g_sink : std::cout;
}
} // namespace

const char* levelToString(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error: return "ERROR";
    }
    return "UNKNOWN";
}

void setLevel(Level level) {
    g_min_level = level;
}

Level getLevel() {
    return g_min_level;
}

void setSink(std::ostream* stream) {
    g_sink = stream;
}

std::string formatTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&now_c, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

LogLine::LogLine(Level level)
    : level_(level),
      enabled_(static_cast<int>(level) >= static_cast<int>(g_min_level)) {}

LogLine::LogLine(LogLine&& other) noexcept
    : level_(other.level_),
      enabled_(other.enabled_),
      buffer_(std::move(other.buffer_)) {
    other.enabled_ = false;
}

LogLine::~LogLine() {
    if (!enabled_) {
        return;
    }
    sink() << formatTimestamp() << " - " << levelToString(level_)
           << " - " << buffer_.str() << std::endl;
}

} // namespace log
} // namespace cogarch
