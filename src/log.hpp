#pragma once

#include <string>

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

const char* to_string(LogLevel level);

// Line-oriented logger on stderr.
// Debug/Info lines are dropped unless verbose output was requested.
class Logger
{
public:
    static void setVerbose(bool verbose);
    static bool verbose();

    static void log(LogLevel level, const std::string& message);

    static void debug(const std::string& message) { log(LogLevel::Debug, message); }
    static void info(const std::string& message)  { log(LogLevel::Info, message); }
    static void warn(const std::string& message)  { log(LogLevel::Warn, message); }
    static void error(const std::string& message) { log(LogLevel::Error, message); }

private:
    static bool& verboseFlag();
};
