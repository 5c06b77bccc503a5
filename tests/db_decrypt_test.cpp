#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "db_decrypt.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;

static const std::string HEX_KEY(64, 'a');

// Strategy double that records how often it was asked to open.
class FakeStrategy : public DecryptStrategy
{
public:
    FakeStrategy(const char* label, bool succeed, fs::path dbPath = {})
        : m_label(label), m_succeed(succeed), m_dbPath(std::move(dbPath))
    {
    }

    const char* name() const override { return m_label; }

    std::unique_ptr<DecryptedDatabase> open(const fs::path&, const std::string&) override
    {
        ++calls;
        if (!m_succeed)
            throw std::runtime_error(std::string(m_label) + " failed");
        auto db = std::make_unique<SqliteDb>(m_dbPath.string(), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        return std::make_unique<DecryptedDatabase>(std::move(db));
    }

    int calls = 0;

private:
    const char* m_label;
    bool        m_succeed;
    fs::path    m_dbPath;
};

TEST(DbDecryptTest, DirectSuccessSkipsFallback)
{
    // A working direct open never touches the external tool.
    TempDir dir;
    FakeStrategy direct("direct", true, dir / "a.sqlite");
    FakeStrategy fallback("fallback", true, dir / "b.sqlite");
    std::string error;

    auto db = OpenSignalDatabase(dir / "db.sqlite", HEX_KEY, DecryptMode::Auto, direct, fallback, error);
    ASSERT_NE(db, nullptr) << error;
    EXPECT_EQ(direct.calls, 1);
    EXPECT_EQ(fallback.calls, 0);
}

TEST(DbDecryptTest, DirectFailureEscalatesOnce)
{
    // A failed canary leads to exactly one fallback attempt.
    TempDir dir;
    FakeStrategy direct("direct", false);
    FakeStrategy fallback("fallback", true, dir / "b.sqlite");
    std::string error;

    auto db = OpenSignalDatabase(dir / "db.sqlite", HEX_KEY, DecryptMode::Auto, direct, fallback, error);
    ASSERT_NE(db, nullptr) << error;
    EXPECT_EQ(direct.calls, 1);
    EXPECT_EQ(fallback.calls, 1);
}

TEST(DbDecryptTest, BothFailingIsFatal)
{
    // No retry loop: one direct try, one fallback try, then an error.
    TempDir dir;
    FakeStrategy direct("direct", false);
    FakeStrategy fallback("fallback", false);
    std::string error;

    auto db = OpenSignalDatabase(dir / "db.sqlite", HEX_KEY, DecryptMode::Auto, direct, fallback, error);
    EXPECT_EQ(db, nullptr);
    EXPECT_EQ(direct.calls, 1);
    EXPECT_EQ(fallback.calls, 1);
    EXPECT_EQ(error, "fallback failed");
}

TEST(DbDecryptTest, ManualModeGoesStraightToFallback)
{
    // Manual mode does not try in-process decryption.
    TempDir dir;
    FakeStrategy direct("direct", true, dir / "a.sqlite");
    FakeStrategy fallback("fallback", true, dir / "b.sqlite");
    std::string error;

    auto db = OpenSignalDatabase(dir / "db.sqlite", HEX_KEY, DecryptMode::Manual, direct, fallback, error);
    ASSERT_NE(db, nullptr) << error;
    EXPECT_EQ(direct.calls, 0);
    EXPECT_EQ(fallback.calls, 1);
}

TEST(DbDecryptTest, DirectStrategyRejectsBadInput)
{
    // Missing keys, non-hex keys and missing files all throw.
    TempDir dir;
    DirectDecryptStrategy direct;
    EXPECT_THROW(direct.open(dir / "db.sqlite", ""), std::runtime_error);
    EXPECT_THROW(direct.open(dir / "db.sqlite", "not-hex\"; DROP"), std::runtime_error);
    EXPECT_THROW(direct.open(dir / "missing.sqlite", HEX_KEY), std::runtime_error);
}

TEST(DbDecryptTest, KeyValidationAndPragmas)
{
    // The cipher script carries the key and Signal's four parameters.
    EXPECT_TRUE(IsHexKey("0123456789abcdefABCDEF"));
    EXPECT_FALSE(IsHexKey(""));
    EXPECT_FALSE(IsHexKey("xyz"));

    const std::string script = CipherPragmaScript("beef");
    EXPECT_NE(script.find("PRAGMA key = \"x'beef'\";"), std::string::npos);
    EXPECT_NE(script.find("cipher_page_size = 4096"), std::string::npos);
    EXPECT_NE(script.find("kdf_iter = 64000"), std::string::npos);
    EXPECT_NE(script.find("cipher_hmac_algorithm = HMAC_SHA512"), std::string::npos);
    EXPECT_NE(script.find("cipher_kdf_algorithm = PBKDF2_HMAC_SHA512"), std::string::npos);
}

TEST(DbDecryptTest, DecryptedDatabaseRemovesPlaintextCopy)
{
    // The plaintext copy is deleted together with the handle.
    TempDir dir;
    const fs::path copy = dir / DECRYPTED_DB_NAME;
    {
        auto db = std::make_unique<SqliteDb>(copy.string(), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        db->exec("CREATE TABLE t (x INTEGER);");
        DecryptedDatabase handle(std::move(db), copy);
        EXPECT_TRUE(fs::exists(copy));
    }
    EXPECT_FALSE(fs::exists(copy));
}

TEST(DbDecryptTest, MissingToolFailsFast)
{
    // Without the tool on the search path nothing is written.
    TempDir dir;
    WriteFile(dir / "db.sqlite", "encrypted");
    ExternalToolDecryptStrategy external("sqlcipher", (dir / "empty-bin").string());

    try
    {
        external.open(dir / "db.sqlite", HEX_KEY);
        FAIL() << "expected the missing tool to be reported";
    }
    catch (const std::runtime_error& ex)
    {
        EXPECT_NE(std::string(ex.what()).find("CLI not found"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(dir / DECRYPTED_DB_NAME));
}

#ifndef _WIN32

static void writeFakeTool(const fs::path& path, const std::string& body)
{
    WriteFile(path, "#!/bin/sh\ncat >/dev/null\n" + body);
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
}

TEST(DbDecryptTest, FindExecutableOnPathSearchesEntries)
{
    // The first executable match along the list is returned.
    TempDir dir;
    writeFakeTool(dir / "bin2/sqlcipher", "exit 0\n");
    WriteFile(dir / "bin1/sqlcipher", "not executable");
    fs::permissions(dir / "bin1/sqlcipher", fs::perms::owner_read, fs::perm_options::replace);

    const std::string searchPath = (dir / "bin1").string() + ":" + (dir / "bin2").string();
    auto found = FindExecutableOnPath("sqlcipher", searchPath);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, dir / "bin2/sqlcipher");
    EXPECT_FALSE(FindExecutableOnPath("nope", searchPath).has_value());
}

TEST(DbDecryptTest, ToolFailureIsFatalAndCleansUp)
{
    // A non-zero exit is an error; stale plaintext is gone either way.
    TempDir dir;
    WriteFile(dir / "db.sqlite", "encrypted");
    WriteFile(dir / DECRYPTED_DB_NAME, "stale plaintext");
    writeFakeTool(dir / "bin/sqlcipher", "exit 3\n");

    ExternalToolDecryptStrategy external("sqlcipher", (dir / "bin").string());
    try
    {
        external.open(dir / "db.sqlite", HEX_KEY);
        FAIL() << "expected the tool failure to be reported";
    }
    catch (const std::runtime_error& ex)
    {
        EXPECT_NE(std::string(ex.what()).find("Manual decryption failed"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(dir / DECRYPTED_DB_NAME));
}

TEST(DbDecryptTest, ToolOutputIsOpenedThenRemoved)
{
    // The exported copy is readable while the handle lives, deleted after.
    TempDir dir;
    WriteFile(dir / "db.sqlite", "encrypted");
    {
        SqliteDb plain((dir / "plain.sqlite").string(), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        plain.exec("CREATE TABLE conversations (id TEXT);");
    }

    const fs::path copy = dir / DECRYPTED_DB_NAME;
    writeFakeTool(dir / "bin/sqlcipher",
                  "cp '" + (dir / "plain.sqlite").string() + "' '" + copy.string() + "'\nexit 0\n");

    ExternalToolDecryptStrategy external("sqlcipher", (dir / "bin").string());
    {
        auto db = external.open(dir / "db.sqlite", HEX_KEY);
        ASSERT_NE(db, nullptr);
        EXPECT_EQ(db->plaintextCopy(), copy);
        EXPECT_TRUE(fs::exists(copy));

        SqliteStmt stmt(db->handle(), "SELECT count(*) FROM conversations");
        EXPECT_TRUE(stmt.step("counting"));
    }
    EXPECT_FALSE(fs::exists(copy));
}

#endif
