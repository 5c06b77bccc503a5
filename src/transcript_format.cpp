#include "transcript_format.hpp"

#include <cctype>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "log.hpp"

namespace fs = std::filesystem;

static bool digitsAt(const std::string& s, std::size_t pos, std::size_t count)
{
    if (pos + count > s.size())
        return false;
    for (std::size_t i = pos; i < pos + count; ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(s[i])))
            return false;
    }
    return true;
}

static bool charAt(const std::string& s, std::size_t pos, char c)
{
    return pos < s.size() && s[pos] == c;
}

bool MatchLinePrefix(const std::string& line, std::size_t& dateEnd, std::size_t& senderEnd)
{
    // [YYYY-MM-DD
    std::size_t pos = 0;
    if (!charAt(line, pos, '['))      return false;
    if (!digitsAt(line, pos + 1, 4))  return false;
    if (!charAt(line, pos + 5, '-'))  return false;
    if (!digitsAt(line, pos + 6, 2))  return false;
    if (!charAt(line, pos + 8, '-'))  return false;
    if (!digitsAt(line, pos + 9, 2))  return false;
    pos += 11;

    // optional legacy comma
    if (charAt(line, pos, ','))
        ++pos;

    //  HH:MM]
    if (!charAt(line, pos, ' '))      return false;
    if (!digitsAt(line, pos + 1, 2))  return false;
    if (!charAt(line, pos + 3, ':'))  return false;
    if (!digitsAt(line, pos + 4, 2))  return false;
    if (!charAt(line, pos + 6, ']'))  return false;
    pos += 7;

    // sender up to the first colon on this physical line
    std::size_t colon = line.find(':', pos);
    std::size_t eol   = line.find('\n', pos);
    if (colon == std::string::npos || (eol != std::string::npos && eol < colon))
        return false;

    dateEnd   = pos;
    senderEnd = colon + 1;
    return true;
}

std::vector<LogicalLine> ParseTranscriptLines(const std::vector<std::string>& physicalLines)
{
    std::vector<LogicalLine> msgs;
    for (const auto& li : physicalLines)
    {
        std::size_t dateEnd   = 0;
        std::size_t senderEnd = 0;
        if (MatchLinePrefix(li, dateEnd, senderEnd))
        {
            LogicalLine line;
            line.date   = li.substr(0, dateEnd);
            line.sender = li.substr(dateEnd, senderEnd - dateEnd);
            line.body   = li.substr(senderEnd);
            msgs.push_back(std::move(line));
        }
        else if (!msgs.empty())
        {
            msgs.back().body += li;
        }
        else
        {
            Logger::warn("Skipping malformed line (no previous message): " + li.substr(0, 50) + "...");
        }
    }
    return msgs;
}

std::vector<std::string> ReadPhysicalLines(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw std::runtime_error("Could not open file: " + path.string());
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
    {
        if (!in.eof())
            line.push_back('\n');
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string FormatTimestamp(long long epochMs, const char* fmt)
{
    std::time_t secs = static_cast<std::time_t>(epochMs / 1000);
    if (epochMs < 0 && epochMs % 1000 != 0)
        --secs;

    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &secs);
#else
    localtime_r(&secs, &tm);
#endif

    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::string FormatTranscriptLine(const std::string& date,
                                 const std::string& sender,
                                 const std::string& body)
{
    std::string out;
    out.reserve(date.size() + sender.size() + body.size() + 6);
    out += "[";
    out += date;
    out += "] ";
    out += sender;
    out += ": ";
    out += body;
    out += "\n";
    return out;
}

std::string StripBackticks(const std::string& body)
{
    std::string out;
    out.reserve(body.size());
    for (char c : body)
    {
        if (c != '`')
            out.push_back(c);
    }
    return out;
}

bool IsImageFileName(const std::string& fileName)
{
    std::string ext = fs::path(fileName).extension().string();
    if (ext.size() < 2)
        return false;
    ext = ext.substr(1);
    return ext == "png" || ext == "jpg" || ext == "jpeg" ||
           ext == "gif" || ext == "tif" || ext == "tiff";
}

std::string AttachmentReference(const std::string& fileName)
{
    std::string target = std::string("./") + MEDIA_DIR_NAME + "/";
    for (char c : fileName)
    {
        if (c == ' ')
            target += "%20";
        else
            target.push_back(c);
    }

    std::string out;
    if (IsImageFileName(fileName))
        out += "!";
    out += "[" + fileName + "](" + target + ")";
    return out;
}
