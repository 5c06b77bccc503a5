// Getting a readable handle on Signal's SQLCipher database.
//
// Direct mode keys the connection in-process. If the linked SQLite has no
// cipher support, or the key is wrong, the canary query fails and the
// caller escalates to the sqlcipher CLI, which writes a plaintext copy.

#include "db_decrypt.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <csignal>
#include <sys/wait.h>
#include <unistd.h>
#endif

#include "log.hpp"

namespace fs = std::filesystem;

// ---------------------------
// DecryptedDatabase
// ---------------------------

DecryptedDatabase::DecryptedDatabase(std::unique_ptr<SqliteDb> db, fs::path plaintextCopy)
    : m_db(std::move(db)),
      m_plaintextCopy(std::move(plaintextCopy))
{
}

DecryptedDatabase::~DecryptedDatabase()
{
    // Close before unlinking so no handle keeps the plaintext alive.
    m_db.reset();
    if (!m_plaintextCopy.empty())
    {
        std::error_code ec;
        fs::remove(m_plaintextCopy, ec);
        if (ec)
            Logger::warn("Could not remove decrypted copy " + m_plaintextCopy.string() + ": " + ec.message());
        else
            Logger::info("Removed decrypted copy " + m_plaintextCopy.string());
    }
}

// ---------------------------
// Helpers
// ---------------------------

bool IsHexKey(const std::string& key)
{
    if (key.empty())
        return false;
    for (char c : key)
    {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

std::string CipherPragmaScript(const std::string& key)
{
    // Pragmas cannot take bound parameters, hence the IsHexKey gate in callers.
    std::ostringstream oss;
    oss << "PRAGMA key = \"x'" << key << "'\";\n"
        << "PRAGMA cipher_page_size = " << SIGNAL_CIPHER_PAGE_SIZE << ";\n"
        << "PRAGMA kdf_iter = " << SIGNAL_KDF_ITER << ";\n"
        << "PRAGMA cipher_hmac_algorithm = " << SIGNAL_HMAC_ALGORITHM << ";\n"
        << "PRAGMA cipher_kdf_algorithm = " << SIGNAL_KDF_ALGORITHM << ";\n";
    return oss.str();
}

static void requireHexKey(const std::string& key)
{
    if (key.empty())
        throw std::runtime_error("No database key was supplied");
    if (!IsHexKey(key))
        throw std::runtime_error("Database key is not a hexadecimal string");
}

static void runCanaryQuery(SqliteDb& db)
{
    SqliteStmt stmt(db.db, "SELECT count(*) FROM sqlite_master");
    stmt.step("running the canary query");
}

static bool isExecutableFile(const fs::path& p)
{
    std::error_code ec;
    if (!fs::is_regular_file(p, ec))
        return false;
#ifdef _WIN32
    return true;
#else
    return ::access(p.c_str(), X_OK) == 0;
#endif
}

std::optional<fs::path> FindExecutableOnPath(const std::string& name,
                                             const std::optional<std::string>& searchPath)
{
    std::string pathList;
    if (searchPath)
    {
        pathList = *searchPath;
    }
    else
    {
        const char* env = std::getenv("PATH");
        if (env)
            pathList = env;
    }

#ifdef _WIN32
    const char separator = ';';
    const std::vector<std::string> suffixes = {".exe", ".cmd", ".bat", ""};
#else
    const char separator = ':';
    const std::vector<std::string> suffixes = {""};
#endif

    std::string dir;
    std::istringstream ss(pathList);
    while (std::getline(ss, dir, separator))
    {
        if (dir.empty())
            continue;
        for (const auto& suffix : suffixes)
        {
            fs::path candidate = fs::path(dir) / (name + suffix);
            if (isExecutableFile(candidate))
                return candidate;
        }
    }
    return std::nullopt;
}

static std::string quoteShellArg(const std::string& arg)
{
#ifdef _WIN32
    std::string out = "\"";
    for (char c : arg)
    {
        if (c == '"')
            out += "\\\"";
        else
            out.push_back(c);
    }
    out += "\"";
    return out;
#else
    std::string out = "'";
    for (char c : arg)
    {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out += "'";
    return out;
#endif
}

static std::string quoteSqlString(const std::string& value)
{
    std::string out = "'";
    for (char c : value)
    {
        out.push_back(c);
        if (c == '\'')
            out.push_back('\'');
    }
    out += "'";
    return out;
}

static std::string installHint()
{
#if defined(__APPLE__)
    return "  macOS: brew install sqlcipher";
#elif defined(_WIN32)
    return "  Windows: Download from https://www.zetetic.net/sqlcipher/";
#else
    return "  Linux: sudo apt install sqlcipher (or equivalent for your distro)";
#endif
}

// Feeds `script` to the command's stdin; returns the command's exit status.
static int runWithStdin(const std::string& command, const std::string& script)
{
#ifdef _WIN32
    FILE* pipe = _popen(command.c_str(), "w");
#else
    // A tool that exits early must not take this process down with SIGPIPE.
    struct SigpipeGuard
    {
        void (*previous)(int) = std::signal(SIGPIPE, SIG_IGN);
        ~SigpipeGuard() { std::signal(SIGPIPE, previous); }
    } sigpipeGuard;

    FILE* pipe = popen(command.c_str(), "w");
#endif
    if (!pipe)
    {
        throw std::runtime_error("Failed to run command: " + command);
    }

    std::size_t written = std::fwrite(script.data(), 1, script.size(), pipe);

#ifdef _WIN32
    int status = _pclose(pipe);
    int exitCode = status;
#else
    int status = pclose(pipe);
    int exitCode = -1;
    if (status != -1 && WIFEXITED(status))
        exitCode = WEXITSTATUS(status);
#endif

    if (written != script.size() && exitCode == 0)
    {
        throw std::runtime_error("Could not write decryption script to: " + command);
    }
    return exitCode;
}

// ---------------------------
// DirectDecryptStrategy
// ---------------------------

std::unique_ptr<DecryptedDatabase> DirectDecryptStrategy::open(const fs::path& dbFile,
                                                               const std::string& key)
{
    requireHexKey(key);

    auto db = std::make_unique<SqliteDb>(dbFile.string(), SQLITE_OPEN_READONLY);
    db->exec(CipherPragmaScript(key));

    // A wrong key (or no cipher support) only shows up on the first real read.
    runCanaryQuery(*db);

    return std::make_unique<DecryptedDatabase>(std::move(db));
}

// ---------------------------
// ExternalToolDecryptStrategy
// ---------------------------

ExternalToolDecryptStrategy::ExternalToolDecryptStrategy(std::string toolName,
                                                         std::optional<std::string> searchPath)
    : m_toolName(std::move(toolName)),
      m_searchPath(std::move(searchPath))
{
}

std::unique_ptr<DecryptedDatabase> ExternalToolDecryptStrategy::open(const fs::path& dbFile,
                                                                     const std::string& key)
{
    std::optional<fs::path> tool = FindExecutableOnPath(m_toolName, m_searchPath);
    if (!tool)
    {
        throw std::runtime_error(
            m_toolName + " CLI not found!\n"
            "Manual decryption requires the sqlcipher command-line tool.\n"
            "Installation instructions:\n" + installHint() + "\n"
            "Alternatively, try running without the --manual flag");
    }

    requireHexKey(key);

    const fs::path decrypted = dbFile.parent_path() / DECRYPTED_DB_NAME;

    // Removes the plaintext copy unless ownership passes to the handle.
    struct Cleanup
    {
        fs::path path;
        ~Cleanup()
        {
            if (!path.empty())
            {
                std::error_code ec;
                fs::remove(path, ec);
            }
        }
    } cleanup{decrypted};

    std::error_code ec;
    if (fs::exists(decrypted, ec))
    {
        Logger::info("Removing stale decrypted copy " + decrypted.string());
        fs::remove(decrypted);
    }

    Logger::info("Using manual decryption via " + tool->string() + "...");

    std::string script = CipherPragmaScript(key);
    script += "ATTACH DATABASE " + quoteSqlString(decrypted.string()) + " AS plaintext KEY '';\n";
    script += "SELECT sqlcipher_export('plaintext');\n";
    script += "DETACH DATABASE plaintext;\n";

    std::string command = quoteShellArg(tool->string()) + " " + quoteShellArg(dbFile.string());
#ifdef _WIN32
    command += " >NUL";
#else
    command += " >/dev/null";
#endif

    int rc = runWithStdin(command, script);
    if (rc != 0)
    {
        throw std::runtime_error(
            "Manual decryption failed (exit status " + std::to_string(rc) + ").\n"
            "This could mean:\n"
            "  1. The database key is incorrect\n"
            "  2. The database file is corrupted\n"
            "  3. Signal Desktop version changed the encryption format");
    }

    if (!fs::is_regular_file(decrypted))
    {
        throw std::runtime_error("Manual decryption produced no output file: " + decrypted.string());
    }

    auto db = std::make_unique<SqliteDb>(decrypted.string(), SQLITE_OPEN_READONLY);
    runCanaryQuery(*db);

    cleanup.path.clear();
    return std::make_unique<DecryptedDatabase>(std::move(db), decrypted);
}

// ---------------------------
// Escalation
// ---------------------------

std::unique_ptr<DecryptedDatabase> OpenSignalDatabase(const fs::path&    dbFile,
                                                      const std::string& key,
                                                      DecryptMode        mode,
                                                      DecryptStrategy&   direct,
                                                      DecryptStrategy&   fallback,
                                                      std::string&       errorOut)
{
    if (mode == DecryptMode::Auto)
    {
        try
        {
            auto db = direct.open(dbFile, key);
            Logger::info(std::string("Database opened using ") + direct.name() + " decryption");
            errorOut.clear();
            return db;
        }
        catch (const std::exception& ex)
        {
            Logger::warn(std::string("Automatic decryption failed: ") + ex.what());
            Logger::warn("Falling back to manual decryption mode...");
        }
    }

    try
    {
        auto db = fallback.open(dbFile, key);
        Logger::info(std::string("Database opened using ") + fallback.name() + " decryption");
        errorOut.clear();
        return db;
    }
    catch (const std::exception& ex)
    {
        errorOut = ex.what();
        return nullptr;
    }
}
