#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "export_config.hpp"
#include "sqlite_db.hpp"

// Cipher parameters Signal Desktop encrypts its database with.
constexpr int         SIGNAL_CIPHER_PAGE_SIZE = 4096;
constexpr int         SIGNAL_KDF_ITER         = 64000;
constexpr const char* SIGNAL_HMAC_ALGORITHM   = "HMAC_SHA512";
constexpr const char* SIGNAL_KDF_ALGORITHM    = "PBKDF2_HMAC_SHA512";

// Name of the plaintext sibling written by the external tool.
constexpr const char* DECRYPTED_DB_NAME = "db-decrypt.sqlite";

// An open, queryable, decrypted database.
// If the handle was produced from a plaintext copy on disk, the copy is
// deleted when the handle goes away.
class DecryptedDatabase
{
public:
    explicit DecryptedDatabase(std::unique_ptr<SqliteDb> db,
                               std::filesystem::path     plaintextCopy = {});
    ~DecryptedDatabase();

    DecryptedDatabase(const DecryptedDatabase&)            = delete;
    DecryptedDatabase& operator=(const DecryptedDatabase&) = delete;

    sqlite3* handle() const { return m_db->db; }
    SqliteDb& db() { return *m_db; }

    // Empty when the database was decrypted in-process.
    const std::filesystem::path& plaintextCopy() const { return m_plaintextCopy; }

private:
    std::unique_ptr<SqliteDb> m_db;
    std::filesystem::path     m_plaintextCopy;
};

// One way of getting from the encrypted file to a DecryptedDatabase.
class DecryptStrategy
{
public:
    virtual ~DecryptStrategy() = default;

    virtual const char* name() const = 0;

    // Throws std::runtime_error when the database cannot be decrypted.
    virtual std::unique_ptr<DecryptedDatabase> open(const std::filesystem::path& dbFile,
                                                    const std::string&           key) = 0;
};

// Keys the connection with the SQLCipher pragmas and verifies it with a
// canary query against sqlite_master.
class DirectDecryptStrategy : public DecryptStrategy
{
public:
    const char* name() const override { return "direct"; }

    std::unique_ptr<DecryptedDatabase> open(const std::filesystem::path& dbFile,
                                            const std::string&           key) override;
};

// Runs the sqlcipher command-line tool to export a plaintext copy next to
// the database, then opens that copy.
class ExternalToolDecryptStrategy : public DecryptStrategy
{
public:
    // searchPath overrides $PATH when looking for the tool.
    explicit ExternalToolDecryptStrategy(std::string                toolName   = "sqlcipher",
                                         std::optional<std::string> searchPath = std::nullopt);

    const char* name() const override { return "external tool"; }

    std::unique_ptr<DecryptedDatabase> open(const std::filesystem::path& dbFile,
                                            const std::string&           key) override;

private:
    std::string                m_toolName;
    std::optional<std::string> m_searchPath;
};

// True when key is a non-empty string of hex digits.
bool IsHexKey(const std::string& key);

// "PRAGMA key = ...;" followed by the four cipher pragmas, newline separated.
std::string CipherPragmaScript(const std::string& key);

// Looks up an executable in a PATH-style list (defaults to $PATH).
std::optional<std::filesystem::path> FindExecutableOnPath(const std::string&                name,
                                                          const std::optional<std::string>& searchPath = std::nullopt);

// Opens the database using `direct`, escalating once to `fallback` when the
// direct attempt fails. Manual mode goes to `fallback` straight away.
// Returns nullptr and fills errorOut when nothing worked.
std::unique_ptr<DecryptedDatabase> OpenSignalDatabase(const std::filesystem::path& dbFile,
                                                      const std::string&           key,
                                                      DecryptMode                  mode,
                                                      DecryptStrategy&             direct,
                                                      DecryptStrategy&             fallback,
                                                      std::string&                 errorOut);
