#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

enum class DecryptMode
{
    Auto,    // direct in-process decryption, external tool on failure
    Manual   // external tool only
};

// Everything the command line can ask for.
struct ExportOptions
{
    std::filesystem::path                 dest = "output";
    std::optional<std::filesystem::path>  source;
    std::optional<std::vector<std::string>> chats;
    bool                                  listChats = false;
    std::optional<std::filesystem::path>  old;
    bool                                  overwrite = false;
    bool                                  verbose   = false;
    DecryptMode                           mode      = DecryptMode::Auto;
    std::size_t                           msgsPerPage = 100;
};

// Files inside a Signal Desktop data directory.
struct SignalPaths
{
    std::filesystem::path root;
    std::filesystem::path config;       // root/config.json
    std::filesystem::path database;     // root/sql/db.sqlite
    std::filesystem::path attachments;  // root/attachments.noindex
};

// Field names that have held the database key over time, highest priority first.
extern const char* const SIGNAL_KEY_FIELDS[4];

// Platform default for the Signal Desktop directory.
// Returns false (and fills errorOut) when the platform or home directory is unknown.
bool DefaultSignalSource(std::filesystem::path& out, std::string& errorOut);

SignalPaths ResolveSignalPaths(const std::filesystem::path& root);

// Reads the SQLCipher key out of config.json.
// On success keyOut holds the key and fieldOut the field it came from.
bool ReadSignalKey(const std::filesystem::path& configPath,
                   std::string&                 keyOut,
                   std::string&                 fieldOut,
                   std::string&                 errorOut);

// Splits "a,b,c" into names; empty segments are dropped.
std::vector<std::string> SplitChatList(const std::string& csv);

// Expands a leading "~" using $HOME.
std::filesystem::path ExpandUser(const std::filesystem::path& p);
