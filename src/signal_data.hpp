#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

// One row of Signal's conversations table.
struct Contact
{
    std::string id;

    // Display name; falls back to the profile name, then the phone number.
    // After SanitizeContactNames it holds the filesystem-safe form.
    std::optional<std::string> name;

    // Phone number (e164) or other identifier.
    std::optional<std::string> number;

    std::optional<std::string> profileName;

    bool isGroup = false;

    // Resolved display names of the group members (groups only).
    std::vector<std::string> members;
};

// A message is kept as the JSON blob Signal stores: timestamp, sent_at,
// body, type, source, conversationId, attachments[{path, fileName, ...}].
using Message = nlohmann::json;

using ContactMap      = std::map<std::string, Contact>;
using ConversationMap = std::map<std::string, std::vector<Message>>;

struct SignalData
{
    ContactMap      contacts;
    // Every key has a matching entry in contacts. Messages are in send order.
    ConversationMap conversations;
};

// Loads contacts and messages from an open (decrypted) Signal database.
// chats: optional allow-list matched exactly against name or profileName.
bool LoadSignalData(sqlite3*                                       db,
                    const std::optional<std::vector<std::string>>& chats,
                    SignalData&                                    out,
                    std::string&                                   errorOut);

// Sorted display names of every contact that has one.
std::vector<std::string> ListChatNames(const ContactMap& contacts);

// Keeps Unicode letters and numbers (general categories L and N) of a
// UTF-8 string; everything else, including invalid bytes, is dropped.
std::string SanitizeName(const std::string& name);

// Maps each contact id to the directory its export lives in.
// Names are labels; this index is what file I/O goes through.
class ExportLayout
{
public:
    void assign(const std::string& contactId, const std::string& dirName);

    // Throws std::out_of_range for an unknown contact id.
    const std::string& dirFor(const std::string& contactId) const;

    bool contains(const std::string& contactId) const;
    std::size_t size() const { return m_dirById.size(); }

private:
    std::map<std::string, std::string> m_dirById;
};

// Replaces every contact name with its sanitized form (name, else number,
// else "None") and assigns each contact a unique directory name, adding a
// numeric suffix ("Alice2", "Alice3", ...) when sanitized names collide.
ExportLayout SanitizeContactNames(ContactMap& contacts);
