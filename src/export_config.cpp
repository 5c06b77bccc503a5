// Locating the Signal Desktop data directory and reading its config.json.

#include "export_config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "log.hpp"

namespace fs = std::filesystem;
using json   = nlohmann::json;

const char* const SIGNAL_KEY_FIELDS[4] = {
    "key",
    "encryptionKey",
    "safeStorageKey",
    "encrypted_key"
};

static std::optional<fs::path> homeDirectory()
{
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home || !*home)
        return std::nullopt;
    return fs::path(home);
}

bool DefaultSignalSource(fs::path& out, std::string& errorOut)
{
    std::optional<fs::path> home = homeDirectory();
    if (!home)
    {
        errorOut = "Could not determine the home directory. "
                   "Please specify the Signal location using --source PATH";
        return false;
    }

#if defined(__linux__)
    out = *home / ".config" / "Signal";
#elif defined(__APPLE__)
    out = *home / "Library" / "Application Support" / "Signal";
#elif defined(_WIN32)
    out = *home / "AppData" / "Roaming" / "Signal";
#else
    errorOut = "Unsupported platform. Please manually specify Signal location using --source PATH. "
               "The directory should contain 'sql/db.sqlite' and 'config.json'";
    return false;
#endif

    errorOut.clear();
    return true;
}

SignalPaths ResolveSignalPaths(const fs::path& root)
{
    SignalPaths paths;
    paths.root        = root;
    paths.config      = root / "config.json";
    paths.database    = root / "sql" / "db.sqlite";
    paths.attachments = root / "attachments.noindex";
    return paths;
}

static std::string readFileToString(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw std::runtime_error("Could not open file: " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool ReadSignalKey(const fs::path& configPath,
                   std::string&    keyOut,
                   std::string&    fieldOut,
                   std::string&    errorOut)
{
    if (!fs::is_regular_file(configPath))
    {
        errorOut = "Signal config file not found: " + configPath.string() +
                   "\n  1. Ensure Signal Desktop is installed and has been run at least once"
                   "\n  2. Use --source to specify the correct Signal directory"
                   "\n  3. Check that the path contains 'config.json' and 'sql/db.sqlite'";
        return false;
    }

    json config;
    try
    {
        config = json::parse(readFileToString(configPath));
    }
    catch (const json::parse_error& ex)
    {
        errorOut = "Failed to parse config file as JSON: " + std::string(ex.what()) +
                   "\nConfig file: " + configPath.string() +
                   "\nThe config.json file appears to be corrupted";
        return false;
    }
    catch (const std::exception& ex)
    {
        errorOut = "Unexpected error reading config file: " + std::string(ex.what()) +
                   "\nConfig file: " + configPath.string();
        return false;
    }

    if (!config.is_object())
    {
        errorOut = "Config file is not a JSON object: " + configPath.string();
        return false;
    }

    for (const char* field : SIGNAL_KEY_FIELDS)
    {
        auto it = config.find(field);
        if (it == config.end())
            continue;

        if (!it->is_string())
        {
            errorOut = std::string("Encryption key field '") + field + "' is not a string";
            return false;
        }

        keyOut   = it->get<std::string>();
        fieldOut = field;
        Logger::info(std::string("Found encryption key using field: '") + field + "'");

        if (keyOut.size() < 32)
        {
            Logger::warn("Encryption key seems unusually short or invalid (length: " +
                         std::to_string(keyOut.size()) + ")");
            Logger::warn("This may cause decryption to fail");
        }

        errorOut.clear();
        return true;
    }

    std::string available;
    for (auto it = config.begin(); it != config.end(); ++it)
    {
        if (!available.empty())
            available += ", ";
        available += "'" + it.key() + "'";
    }

    errorOut = "Could not find encryption key in config.json"
               "\nConfig file: " + configPath.string() +
               "\nAvailable fields: [" + available + "]"
               "\nThis may indicate:"
               "\n  1. Signal has changed its config file format"
               "\n  2. Your Signal installation is corrupted"
               "\n  3. You need to update this tool";
    return false;
}

std::vector<std::string> SplitChatList(const std::string& csv)
{
    std::vector<std::string> out;
    std::string item;
    std::istringstream ss(csv);
    while (std::getline(ss, item, ','))
    {
        if (!item.empty())
            out.push_back(item);
    }
    return out;
}

fs::path ExpandUser(const fs::path& p)
{
    const std::string s = p.string();
    if (s.empty() || s[0] != '~')
        return p;
    if (s.size() > 1 && s[1] != '/' && s[1] != '\\')
        return p;

    std::optional<fs::path> home = homeDirectory();
    if (!home)
        return p;
    if (s.size() <= 2)
        return *home;
    return *home / s.substr(2);
}
