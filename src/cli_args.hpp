#pragma once

#include <string>

#include "export_config.hpp"

enum class ParseResult
{
    Run,
    Help,
    Error
};

void PrintUsage(const char* program);

// Fills options from argv. On Error, errorOut says what was wrong.
ParseResult ParseCommandLine(int argc, const char* const* argv,
                             ExportOptions& options, std::string& errorOut);
