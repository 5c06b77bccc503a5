#pragma once

#include <filesystem>
#include <string>
#include <vector>

// Transcript line grammar, format version 1.
//
//   line     = prefix " " body "\n"
//   prefix   = "[" date ["," ] " " time "]" " " sender ":"
//   date     = DIGIT{4} "-" DIGIT{2} "-" DIGIT{2}
//   time     = DIGIT{2} ":" DIGIT{2}
//   sender   = any text without ":"
//
// A physical line that does not start with a prefix continues the body of
// the previous logical line. The only escape applied when writing is the
// removal of backticks from bodies, so a body line that happens to look
// like a prefix starts a new logical line when read back.
constexpr int TRANSCRIPT_FORMAT_VERSION = 1;

constexpr const char* TRANSCRIPT_FILE_NAME = "index.md";
constexpr const char* MEDIA_DIR_NAME       = "media";

// One reconstructed message. date + sender + body is the exact text the
// line had in the file.
struct LogicalLine
{
    std::string date;    // "[2024-01-01 10:00]"
    std::string sender;  // " Me:"  (leading space and trailing colon kept)
    std::string body;    // " hi  \n" plus any continuation lines

    std::string text() const { return date + sender + body; }
};

// If `line` starts with a prefix, returns true and sets the offsets one past
// the closing bracket and one past the sender's colon.
bool MatchLinePrefix(const std::string& line, std::size_t& dateEnd, std::size_t& senderEnd);

// Groups physical lines (each normally ending in '\n') into logical lines.
// A continuation with no logical line before it is logged and dropped.
std::vector<LogicalLine> ParseTranscriptLines(const std::vector<std::string>& physicalLines);

// Reads a file as physical lines, each keeping its trailing '\n'.
// Throws std::runtime_error when the file cannot be opened.
std::vector<std::string> ReadPhysicalLines(const std::filesystem::path& path);

// Local-time rendering of an epoch-milliseconds timestamp with strftime fmt.
std::string FormatTimestamp(long long epochMs, const char* fmt);

// "[date] sender: body\n"
std::string FormatTranscriptLine(const std::string& date,
                                 const std::string& sender,
                                 const std::string& body);

std::string StripBackticks(const std::string& body);

// png, jpg, jpeg, gif, tif, tiff
bool IsImageFileName(const std::string& fileName);

// "[name](./media/name)" with spaces in the target written as %20, prefixed
// with "!" for images.
std::string AttachmentReference(const std::string& fileName);
