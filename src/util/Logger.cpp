#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace commitcheck {

static LogLevel envLogLevel() {
    const char* env = std::getenv("COMMITCHECK_LOG");
    if (!env) return LogLevel::Warn;
    auto parsed = Logger::parseLevel(env);
    return parsed ? *parsed : LogLevel::Warn;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) {
    if (text == "debug" || text == "3") return LogLevel::Debug;
    if (text == "info" || text == "2") return LogLevel::Info;
    if (text == "warn" || text == "1") return LogLevel::Warn;
    if (text == "error" || text == "0") return LogLevel::Error;
    return std::nullopt;
}

Logger::Logger() : currentLevel(envLogLevel()), outStream(&std::cout), errStream(&std::cerr) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::setStreams(std::ostream& out, std::ostream& err) {
    outStream = &out;
    errStream = &err;
}

void Logger::resetStreams() {
    outStream = &std::cout;
    errStream = &std::cerr;
}

void Logger::write(LogLevel lvl, const char* tag, const std::string& msg) const {
    if (currentLevel < lvl) return;
    std::ostream& os = lvl <= LogLevel::Warn ? *errStream : *outStream;
    os << tag << msg << "\n";
}

void Logger::error(const std::string& msg) const { write(LogLevel::Error, "[error] ", msg); }
void Logger::warn(const std::string& msg) const { write(LogLevel::Warn, "[warn ] ", msg); }
void Logger::info(const std::string& msg) const { write(LogLevel::Info, "[info ] ", msg); }
void Logger::debug(const std::string& msg) const { write(LogLevel::Debug, "[debug] ", msg); }

}
