#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace commitcheck {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Initial level comes from COMMITCHECK_LOG (name or 0..3), default warn.
 * Error and warn lines go to the error stream, info and debug to the
 * output stream. Both streams can be swapped (tests capture them).
 */
class Logger {
public:
    static Logger& instance();

    /// Parse "error|warn|info|debug" or "0".."3"
    static std::optional<LogLevel> parseLevel(const std::string& text);

    void setLevel(LogLevel level);
    LogLevel level() const;
    void setStreams(std::ostream& out, std::ostream& err);
    void resetStreams();

    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    void write(LogLevel lvl, const char* tag, const std::string& msg) const;

    LogLevel currentLevel;
    std::ostream* outStream;
    std::ostream* errStream;
};

}
