#include "log.hpp"

#include <iostream>

const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warning";
    case LogLevel::Error:
        return "error";
    }
    return "unknown";
}

bool& Logger::verboseFlag()
{
    static bool flag = false;
    return flag;
}

void Logger::setVerbose(bool verbose)
{
    verboseFlag() = verbose;
}

bool Logger::verbose()
{
    return verboseFlag();
}

void Logger::log(LogLevel level, const std::string& message)
{
    if ((level == LogLevel::Debug || level == LogLevel::Info) && !verboseFlag())
        return;

    if (level == LogLevel::Warn || level == LogLevel::Error)
        std::cerr << to_string(level) << ": " << message << "\n";
    else
        std::cerr << message << "\n";
}
