#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>

#include "signal_data.hpp"

// Sender shown when a message cannot be attributed to anyone.
constexpr const char* UNKNOWN_SENDER = "No-Sender";

// Epoch milliseconds from msg[field] when it is a number.
std::optional<long long> MessageTimeField(const Message& msg, const char* field);

// "{date}_{index:02}_{fileName}" with spaces -> '_' and '/' -> '-'.
std::string RenamedAttachmentName(const std::string& date, std::size_t index, const std::string& fileName);

// Returns candidate, or candidate with "-2", "-3", ... before its extension
// when the name is already in `used`. The returned name is added to `used`.
std::string UniqueAttachmentName(const std::string& candidate, std::set<std::string>& used);

// Copies every attachment into <dest>/<dir>/media under its renamed name and
// writes the new name back into the message. Missing or malformed
// attachments are logged and skipped.
// Returns false only when a destination directory cannot be created.
bool CopyAttachments(const std::filesystem::path& attachmentsRoot,
                     const std::filesystem::path& dest,
                     SignalData&                  data,
                     const ExportLayout&          layout,
                     std::string&                 errorOut);

// "Me", the matching contact's name, or UNKNOWN_SENDER.
std::string ResolveSender(const Message&    msg,
                          const Contact&    conversation,
                          const ContactMap& contacts);

// One logical transcript line, ending in '\n'.
std::string RenderMessageLine(const Message&    msg,
                              const Contact&    conversation,
                              const ContactMap& contacts);

// Appends each conversation's messages to <dest>/<dir>/index.md.
bool WriteTranscripts(const std::filesystem::path& dest,
                      const SignalData&            data,
                      const ExportLayout&          layout,
                      std::string&                 errorOut);
