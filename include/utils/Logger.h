#pragma once

#include <iosfwd>
#include <sstream>
#include <string>

namespace cogarch {
namespace log {

enum class Level {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

const char* levelToString(Level level);

void setLevel(Level level);
Level getLevel();

/**
 * @brief Redirect log output (defaults to std::cout)
 *
 * Passing nullptr restores standard output.
 */
void setSink(std::ostream* sink);

/**
 * @brief One log record, emitted when the line goes out of scope
 *
 * Formats as "YYYY-MM-DD HH:MM:SS - LEVEL - message".
 */
class LogLine {
public:
    explicit LogLine(Level level);
    LogLine(LogLine&& other) noexcept;
    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;
    ~LogLine();

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) {
            buffer_ << value;
        }
        return *this;
    }

private:
    Level level_;
    bool enabled_;
    std::ostringstream buffer_;
};

inline LogLine debug() { return LogLine(Level::Debug); }
inline LogLine info() { return LogLine(Level::Info); }
inline LogLine warning() { return LogLine(Level::Warning); }
inline LogLine error() { return LogLine(Level::Error); }

std::string formatTimestamp();

} // namespace log
} // namespace cogarch
