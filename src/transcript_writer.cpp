// Turns loaded conversations into <contact>/index.md + <contact>/media/.

#include "transcript_writer.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "log.hpp"
#include "transcript_format.hpp"

namespace fs = std::filesystem;

std::optional<long long> MessageTimeField(const Message& msg, const char* field)
{
    auto it = msg.find(field);
    if (it == msg.end() || !it->is_number())
        return std::nullopt;
    if (it->is_number_float())
        return static_cast<long long>(it->get<double>());
    return it->get<long long>();
}

static std::optional<std::string> stringField(const nlohmann::json& obj, const char* field)
{
    auto it = obj.find(field);
    if (it == obj.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

std::string RenamedAttachmentName(const std::string& date, std::size_t index, const std::string& fileName)
{
    std::ostringstream oss;
    oss << date << "_" << std::setw(2) << std::setfill('0') << index << "_" << fileName;

    std::string out = oss.str();
    for (char& c : out)
    {
        if (c == ' ')
            c = '_';
        else if (c == '/')
            c = '-';
    }
    return out;
}

std::string UniqueAttachmentName(const std::string& candidate, std::set<std::string>& used)
{
    if (used.insert(candidate).second)
        return candidate;

    const fs::path    p    = candidate;
    const std::string stem = p.stem().string();
    const std::string ext  = p.extension().string();
    for (int n = 2;; ++n)
    {
        std::string name = stem + "-" + std::to_string(n) + ext;
        if (used.insert(name).second)
            return name;
    }
}

// Signal on Windows sometimes stores backslashes in attachment paths.
static fs::path normalizeAttachmentPath(const std::string& path)
{
    std::string out = path;
    for (char& c : out)
    {
        if (c == '\\')
            c = '/';
    }
    return fs::path(out);
}

static void copyPreservingTime(const fs::path& from, const fs::path& to)
{
    fs::copy_file(from, to, fs::copy_options::overwrite_existing);

    std::error_code ec;
    auto mtime = fs::last_write_time(from, ec);
    if (!ec)
        fs::last_write_time(to, mtime, ec);
}

static void copyMessageAttachments(const fs::path&        attachmentsRoot,
                                   const fs::path&        mediaDir,
                                   const std::string&     name,
                                   std::set<std::string>& usedNames,
                                   Message&               msg)
{
    auto atts = msg.find("attachments");
    if (atts == msg.end() || !atts->is_array())
    {
        Logger::debug("\t\tNo attachments for a message: " + name);
        return;
    }
    if (atts->empty())
        return;

    std::optional<long long> ts = MessageTimeField(msg, "timestamp");
    if (!ts)
        ts = MessageTimeField(msg, "sent_at");
    if (!ts)
    {
        Logger::info("\t\tAttachments on a message without timestamp skipped: " + name);
        return;
    }

    const std::string date = FormatTimestamp(*ts, "%Y-%m-%d");

    std::size_t index = 0;
    for (auto& att : *atts)
    {
        const std::size_t i = index++;

        if (!att.is_object())
        {
            Logger::info("\t\tBroken attachment:\t" + name);
            continue;
        }

        std::optional<std::string> fileName = stringField(att, "fileName");
        if (!fileName)
        {
            Logger::info("\t\tBroken attachment:\t" + name + "\tNone");
            continue;
        }

        const std::string renamed = UniqueAttachmentName(RenamedAttachmentName(date, i, *fileName), usedNames);
        att["fileName"] = renamed;

        std::optional<std::string> path = stringField(att, "path");
        if (!path)
        {
            Logger::info("\t\tBroken attachment:\t" + name + "\t" + renamed);
            continue;
        }

        const fs::path source = attachmentsRoot / normalizeAttachmentPath(*path);
        std::error_code ec;
        if (!fs::is_regular_file(source, ec))
        {
            Logger::info("\t\tAttachment not found:\t" + name + " " + renamed);
            continue;
        }

        try
        {
            copyPreservingTime(source, mediaDir / renamed);
        }
        catch (const fs::filesystem_error& ex)
        {
            Logger::warn("Could not copy attachment " + source.string() + ": " + ex.what());
        }
    }
}

bool CopyAttachments(const fs::path&     attachmentsRoot,
                     const fs::path&     dest,
                     SignalData&         data,
                     const ExportLayout& layout,
                     std::string&        errorOut)
{
    try
    {
        for (auto& [key, messages] : data.conversations)
        {
            const std::string& name = layout.dirFor(key);
            Logger::info("\tCopying attachments for: " + name);

            const fs::path mediaDir = dest / name / MEDIA_DIR_NAME;
            fs::create_directories(mediaDir);

            std::set<std::string> usedNames;
            for (auto& msg : messages)
                copyMessageAttachments(attachmentsRoot, mediaDir, name, usedNames, msg);
        }

        errorOut.clear();
        return true;
    }
    catch (const std::exception& ex)
    {
        errorOut = std::string("Failed to prepare export directory: ") + ex.what();
        return false;
    }
}

std::string ResolveSender(const Message&    msg,
                          const Contact&    conversation,
                          const ContactMap& contacts)
{
    if (stringField(msg, "type").value_or("") == "outgoing")
        return "Me";

    if (conversation.isGroup)
    {
        // Several contacts can share a number; the last one in id order wins.
        std::string sender = UNKNOWN_SENDER;
        std::optional<std::string> source = stringField(msg, "source");
        if (source)
        {
            for (const auto& entry : contacts)
            {
                const Contact& c = entry.second;
                if (c.number && *c.number == *source && c.name)
                    sender = *c.name;
            }
        }
        return sender;
    }

    return conversation.name.value_or(UNKNOWN_SENDER);
}

std::string RenderMessageLine(const Message&    msg,
                              const Contact&    conversation,
                              const ContactMap& contacts)
{
    std::optional<long long> ts = MessageTimeField(msg, "timestamp");
    if (!ts)
        ts = MessageTimeField(msg, "sent_at");

    std::string date;
    if (ts)
    {
        date = FormatTimestamp(*ts, "%Y-%m-%d %H:%M");
    }
    else
    {
        Logger::info("\t\tNo timestamp or sent_at; date set to 1970");
        date = "1970-01-01 00:00";
    }

    std::string body = StripBackticks(stringField(msg, "body").value_or(""));
    body += "  ";

    auto atts = msg.find("attachments");
    if (atts != msg.end() && atts->is_array())
    {
        for (const auto& att : *atts)
        {
            std::string fileName = "None";
            if (att.is_object())
                fileName = stringField(att, "fileName").value_or("None");
            body += AttachmentReference(fileName) + "  ";
        }
    }

    std::string sender = ResolveSender(msg, conversation, contacts);
    if (sender == UNKNOWN_SENDER && stringField(msg, "type").value_or("") != "outgoing")
        Logger::debug("\t\tNo sender:\t\t" + date);

    return FormatTranscriptLine(date, sender, body);
}

bool WriteTranscripts(const fs::path&     dest,
                      const SignalData&   data,
                      const ExportLayout& layout,
                      std::string&        errorOut)
{
    try
    {
        for (const auto& [key, messages] : data.conversations)
        {
            auto contact = data.contacts.find(key);
            if (contact == data.contacts.end())
                continue;

            const std::string& name = layout.dirFor(key);
            Logger::info("\tDoing markdown for: " + name);

            const fs::path dir = dest / name;
            fs::create_directories(dir);

            const fs::path mdPath = dir / TRANSCRIPT_FILE_NAME;
            std::ofstream mdfile(mdPath, std::ios::binary | std::ios::app);
            if (!mdfile)
            {
                errorOut = "Failed to open output file: " + mdPath.string();
                return false;
            }

            for (const auto& msg : messages)
                mdfile << RenderMessageLine(msg, contact->second, data.contacts);

            if (!mdfile)
            {
                errorOut = "Failed to write output file: " + mdPath.string();
                return false;
            }
        }

        errorOut.clear();
        return true;
    }
    catch (const std::exception& ex)
    {
        errorOut = ex.what();
        return false;
    }
}
