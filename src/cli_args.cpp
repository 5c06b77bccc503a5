#include "cli_args.hpp"

#include <iostream>
#include <stdexcept>

void PrintUsage(const char* program)
{
    std::cout << "Usage: " << program << " [DEST] [options]\n"
              << "\n"
              << "Read the Signal directory and output attachments and chat files to DEST\n"
              << "(default: ./output).\n"
              << "\n"
              << "Options:\n"
              << "  -s, --source PATH   Path to Signal source and database\n"
              << "  -c, --chats NAMES   Comma-separated chat names to include (contact or group names)\n"
              << "      --list-chats    List all available chats/conversations and then quit\n"
              << "      --old PATH      Path to previous export to merge with\n"
              << "  -o, --overwrite     Overwrite existing output\n"
              << "  -v, --verbose       Enable verbose output logging\n"
              << "  -m, --manual        Decrypt the database with the sqlcipher CLI\n"
              << "      --page-size N   Messages per HTML page (default 100)\n"
              << "  -h, --help          Show this message\n"
              << "\n"
              << "Default Signal directories:\n"
              << "  Linux:   ~/.config/Signal\n"
              << "  macOS:   ~/Library/Application Support/Signal\n"
              << "  Windows: ~/AppData/Roaming/Signal\n";
}

ParseResult ParseCommandLine(int argc, const char* const* argv,
                             ExportOptions& options, std::string& errorOut)
{
    bool haveDest = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];

        auto value = [&](std::string& out) -> bool
        {
            if (i + 1 >= argc)
            {
                errorOut = "Option " + arg + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string v;
        if (arg == "-h" || arg == "--help")
        {
            return ParseResult::Help;
        }
        else if (arg == "-s" || arg == "--source")
        {
            if (!value(v)) return ParseResult::Error;
            options.source = ExpandUser(v);
        }
        else if (arg == "-c" || arg == "--chats")
        {
            if (!value(v)) return ParseResult::Error;
            options.chats = SplitChatList(v);
        }
        else if (arg == "--list-chats")
        {
            options.listChats = true;
        }
        else if (arg == "--old")
        {
            if (!value(v)) return ParseResult::Error;
            options.old = ExpandUser(v);
        }
        else if (arg == "-o" || arg == "--overwrite")
        {
            options.overwrite = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "-m" || arg == "--manual")
        {
            options.mode = DecryptMode::Manual;
        }
        else if (arg == "--page-size")
        {
            if (!value(v)) return ParseResult::Error;
            try
            {
                long long n = std::stoll(v);
                if (n <= 0)
                    throw std::out_of_range("page size");
                options.msgsPerPage = static_cast<std::size_t>(n);
            }
            catch (const std::exception&)
            {
                errorOut = "Invalid page size: " + v;
                return ParseResult::Error;
            }
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            errorOut = "Unknown option: " + arg;
            return ParseResult::Error;
        }
        else if (!haveDest)
        {
            options.dest = ExpandUser(arg);
            haveDest = true;
        }
        else
        {
            errorOut = "Unexpected argument: " + arg;
            return ParseResult::Error;
        }
    }

    if (options.chats && options.chats->empty())
        options.chats.reset();

    errorOut.clear();
    return ParseResult::Run;
}
