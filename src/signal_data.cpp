// Reads Signal's conversations and messages tables into memory.

#include "signal_data.hpp"

#include <algorithm>
#include <cstdint>
#include <set>
#include <sstream>
#include <stdexcept>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include "log.hpp"
#include "sqlite_db.hpp"

using json = nlohmann::json;

// "?, ?, ?" with n placeholders.
static std::string placeholders(std::size_t n)
{
    std::string out;
    for (std::size_t i = 0; i < n; ++i)
    {
        if (i > 0)
            out += ", ";
        out += "?";
    }
    return out;
}

static std::vector<std::string> splitWhitespace(const std::string& s)
{
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token)
        out.push_back(token);
    return out;
}

static std::string resolveMemberName(SqliteStmt& lookup, const std::string& memberId)
{
    lookup.reset();
    lookup.bindText(1, memberId);

    std::string resolved = memberId;
    if (lookup.step("resolving group members"))
    {
        std::optional<std::string> name    = lookup.columnText(0);
        std::optional<std::string> profile = lookup.columnText(1);
        if (name)
            resolved = *name;
        else if (profile)
            resolved = *profile;
    }
    return resolved;
}

static void loadContacts(sqlite3*                                       db,
                         const std::optional<std::vector<std::string>>& chats,
                         SignalData&                                    out)
{
    const bool filtered = chats && !chats->empty();

    std::string sql = "SELECT type, id, e164, name, profileName, members FROM conversations";
    if (filtered)
    {
        const std::string ph = placeholders(chats->size());
        sql += " WHERE name IN (" + ph + ") OR profileName IN (" + ph + ")";
    }

    SqliteStmt stmt(db, sql);
    if (filtered)
    {
        int index = 1;
        for (int pass = 0; pass < 2; ++pass)
        {
            for (const auto& chat : *chats)
                stmt.bindText(index++, chat);
        }
    }

    SqliteStmt memberLookup(db, "SELECT name, profileName FROM conversations WHERE id = ?");

    while (stmt.step("reading conversations"))
    {
        std::optional<std::string> type    = stmt.columnText(0);
        std::optional<std::string> id      = stmt.columnText(1);
        std::optional<std::string> members = stmt.columnText(5);

        if (!id)
        {
            Logger::warn("Skipping conversation row without an id");
            continue;
        }

        Contact contact;
        contact.id          = *id;
        contact.number      = stmt.columnText(2);
        contact.name        = stmt.columnText(3);
        contact.profileName = stmt.columnText(4);
        contact.isGroup     = type && *type == "group";

        if (!contact.name)
            contact.name = contact.profileName;
        if (!contact.name)
            contact.name = contact.number;

        Logger::info("\tLoading SQL results for: " + contact.name.value_or("None"));

        if (contact.isGroup)
        {
            if (!members)
            {
                Logger::info("\tEmpty group.");
            }
            else
            {
                for (const auto& memberId : splitWhitespace(*members))
                    contact.members.push_back(resolveMemberName(memberLookup, memberId));
            }
        }

        out.conversations[contact.id];
        out.contacts[contact.id] = std::move(contact);
    }
}

static void loadMessages(sqlite3* db, SignalData& out)
{
    SqliteStmt stmt(db, "SELECT json, conversationId FROM messages ORDER BY sent_at, rowid");

    std::size_t loaded  = 0;
    std::size_t orphans = 0;

    while (stmt.step("reading messages"))
    {
        std::optional<std::string> raw = stmt.columnText(0);
        std::optional<std::string> cid = stmt.columnText(1);

        if (!cid || cid->empty())
            continue;

        auto it = out.conversations.find(*cid);
        if (it == out.conversations.end())
        {
            ++orphans;
            continue;
        }

        if (!raw)
        {
            Logger::info("\t\tMessage without JSON in conversation " + *cid);
            continue;
        }

        Message msg = json::parse(*raw, nullptr, false);
        if (msg.is_discarded() || !msg.is_object())
        {
            Logger::warn("Skipping message with unparseable JSON in conversation " + *cid);
            continue;
        }

        it->second.push_back(std::move(msg));
        ++loaded;
    }

    Logger::info("Loaded " + std::to_string(loaded) + " messages (" +
                 std::to_string(orphans) + " without a known conversation)");
}

bool LoadSignalData(sqlite3*                                       db,
                    const std::optional<std::vector<std::string>>& chats,
                    SignalData&                                    out,
                    std::string&                                   errorOut)
{
    try
    {
        out.contacts.clear();
        out.conversations.clear();

        loadContacts(db, chats, out);
        loadMessages(db, out);

        errorOut.clear();
        return true;
    }
    catch (const std::exception& ex)
    {
        errorOut = std::string("Failed to query database: ") + ex.what() +
                   "\nThis usually means the database decryption failed."
                   "\nPossible solutions:"
                   "\n  1. Ensure Signal Desktop is closed"
                   "\n  2. Try running with the --manual flag"
                   "\n  3. Verify the database file exists and is not corrupted";
        out.contacts.clear();
        out.conversations.clear();
        return false;
    }
}

std::vector<std::string> ListChatNames(const ContactMap& contacts)
{
    std::vector<std::string> names;
    for (const auto& entry : contacts)
    {
        if (entry.second.name)
            names.push_back(*entry.second.name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string SanitizeName(const std::string& name)
{
    const auto*   bytes  = reinterpret_cast<const uint8_t*>(name.data());
    const int32_t length = static_cast<int32_t>(name.size());

    std::string out;
    out.reserve(name.size());

    int32_t i = 0;
    while (i < length)
    {
        const int32_t start = i;
        UChar32       c     = 0;
        U8_NEXT(bytes, i, length, c);

        // Invalid UTF-8 decodes to a negative value and is dropped.
        if (c < 0)
            continue;
        if (U_GET_GC_MASK(c) & (U_GC_L_MASK | U_GC_N_MASK))
            out.append(name, static_cast<std::size_t>(start), static_cast<std::size_t>(i - start));
    }
    return out;
}

// ---------------------------
// ExportLayout
// ---------------------------

void ExportLayout::assign(const std::string& contactId, const std::string& dirName)
{
    m_dirById[contactId] = dirName;
}

const std::string& ExportLayout::dirFor(const std::string& contactId) const
{
    auto it = m_dirById.find(contactId);
    if (it == m_dirById.end())
        throw std::out_of_range("No export directory for contact: " + contactId);
    return it->second;
}

bool ExportLayout::contains(const std::string& contactId) const
{
    return m_dirById.count(contactId) != 0;
}

ExportLayout SanitizeContactNames(ContactMap& contacts)
{
    ExportLayout          layout;
    std::set<std::string> taken;

    // ContactMap is ordered by id, so suffixes are stable between runs.
    for (auto& entry : contacts)
    {
        Contact& contact = entry.second;

        std::string label;
        if (contact.name)
            label = SanitizeName(*contact.name);
        else if (contact.number)
            label = SanitizeName(*contact.number);
        if (label.empty())
            label = "None";

        contact.name = label;

        std::string dir = label;
        for (int n = 2; taken.count(dir); ++n)
            dir = label + std::to_string(n);

        if (dir != label)
            Logger::warn("Export name '" + label + "' is already used; writing " + contact.id + " to '" + dir + "'");

        taken.insert(dir);
        layout.assign(contact.id, dir);
    }

    return layout;
}
