// Folding a previous export into a fresh one without losing anything.

#include "export_merge.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

#include "log.hpp"

namespace fs = std::filesystem;

std::vector<std::string> MergeLogicalLines(const std::vector<LogicalLine>& oldLines,
                                           const std::vector<LogicalLine>& newLines)
{
    std::vector<std::string>        merged;
    std::unordered_set<std::string> seen;
    merged.reserve(oldLines.size() + newLines.size());

    auto add = [&](const LogicalLine& line)
    {
        // A final line without '\n' would otherwise fuse with the next one.
        std::string text = line.text();
        if (text.empty() || text.back() != '\n')
            text.push_back('\n');
        if (seen.insert(text).second)
            merged.push_back(std::move(text));
    };

    for (const auto& line : oldLines)
        add(line);
    for (const auto& line : newLines)
        add(line);

    return merged;
}

void MergeAttachments(const fs::path& mediaNew, const fs::path& mediaOld)
{
    std::error_code ec;
    if (!fs::exists(mediaOld, ec))
    {
        Logger::info("\t\tNo old media directory to merge");
        return;
    }
    if (!fs::is_directory(mediaOld, ec))
    {
        Logger::warn("Old media path is not a directory: " + mediaOld.string());
        return;
    }

    try
    {
        fs::create_directories(mediaNew);

        for (const auto& entry : fs::directory_iterator(mediaOld))
        {
            if (!entry.is_regular_file())
                continue;

            const fs::path target = mediaNew / entry.path().filename();
            if (fs::exists(target))
            {
                Logger::debug("\t\tSkipping existing file: " + entry.path().filename().string());
                continue;
            }

            fs::copy_file(entry.path(), target);
            fs::last_write_time(target, fs::last_write_time(entry.path()));
        }
    }
    catch (const fs::filesystem_error& ex)
    {
        Logger::warn(std::string("Error merging attachments: ") + ex.what());
    }
}

static void writeLines(const fs::path& path, const std::vector<std::string>& lines)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw std::runtime_error("Failed to open output file: " + path.string());
    }
    for (const auto& line : lines)
        out << line;
    if (!out)
    {
        throw std::runtime_error("Failed to write output file: " + path.string());
    }
}

void MergeChat(const fs::path& pathNew, const fs::path& pathOld)
{
    std::error_code ec;
    if (!fs::exists(pathOld, ec))
    {
        Logger::info("\t\tOld chat file not found: " + pathOld.filename().string());
        return;
    }
    if (!fs::exists(pathNew, ec))
    {
        Logger::warn("New chat file not found: " + pathNew.filename().string());
        return;
    }

    try
    {
        const std::vector<std::string> oldRaw = ReadPhysicalLines(pathOld);
        const std::vector<std::string> newRaw = ReadPhysicalLines(pathNew);

        if (oldRaw.empty() && newRaw.empty())
        {
            Logger::warn("Both chat files are empty: " + pathNew.filename().string());
            return;
        }
        if (oldRaw.empty())
        {
            Logger::info("\t\tOld chat file is empty");
            return;
        }
        if (newRaw.empty())
        {
            Logger::info("\t\tNew chat file is empty, using old only");
            writeLines(pathNew, oldRaw);
            return;
        }

        Logger::info("\t\tFirst line old:\t" + oldRaw.front().substr(0, 30));
        Logger::info("\t\tLast line old:\t" + oldRaw.back().substr(0, 30));
        Logger::info("\t\tFirst line new:\t" + newRaw.front().substr(0, 30));
        Logger::info("\t\tLast line new:\t" + newRaw.back().substr(0, 30));

        const std::vector<LogicalLine> oldMsgs = ParseTranscriptLines(oldRaw);
        const std::vector<LogicalLine> newMsgs = ParseTranscriptLines(newRaw);

        if (oldMsgs.empty() && newMsgs.empty())
        {
            Logger::warn("No messages found in either file");
            return;
        }

        const std::vector<std::string> merged = MergeLogicalLines(oldMsgs, newMsgs);

        Logger::info("\t\tMerged " + std::to_string(oldMsgs.size()) + " old + " +
                     std::to_string(newMsgs.size()) + " new = " +
                     std::to_string(merged.size()) + " total messages");

        writeLines(pathNew, merged);
    }
    catch (const std::exception& ex)
    {
        Logger::error(std::string("Error merging chat: ") + ex.what());
        Logger::error("Old file: " + pathOld.string());
        Logger::error("New file: " + pathNew.string());
    }
}

bool MergeWithOld(const fs::path& dest,
                  const fs::path& old,
                  MergeSummary&   summary,
                  std::string&    errorOut)
{
    summary = MergeSummary{};

    std::error_code ec;
    if (!fs::exists(old, ec))
    {
        errorOut = "Old export directory not found: " + old.string() + "\nCannot perform merge operation";
        return false;
    }
    if (!fs::is_directory(old, ec))
    {
        errorOut = "Old export path is not a directory: " + old.string();
        return false;
    }
    if (!fs::is_directory(dest, ec))
    {
        errorOut = "New export directory not found: " + dest.string() + "\nCannot perform merge operation";
        return false;
    }

    Logger::info("Merging old export from: " + old.string());
    Logger::info("Into new export at: " + dest.string());

    try
    {
        for (const auto& sub : fs::directory_iterator(dest))
        {
            if (!sub.is_directory())
                continue;

            const std::string name   = sub.path().filename().string();
            const fs::path    dirOld = old / name;

            if (fs::is_directory(dirOld, ec))
            {
                Logger::info("\tMerging conversation: " + name);
                MergeAttachments(sub.path() / MEDIA_DIR_NAME, dirOld / MEDIA_DIR_NAME);
                MergeChat(sub.path() / TRANSCRIPT_FILE_NAME, dirOld / TRANSCRIPT_FILE_NAME);
                ++summary.merged;
            }
            else
            {
                Logger::info("\tSkipping " + name + " (not in old export)");
                ++summary.skipped;
            }
        }

        for (const auto& sub : fs::directory_iterator(old))
        {
            if (!sub.is_directory())
                continue;

            const std::string name = sub.path().filename().string();
            if (!fs::is_directory(dest / name, ec))
            {
                Logger::info("\tSkipping " + name + " (only in old export, not merged)");
                ++summary.oldOnly;
            }
        }
    }
    catch (const fs::filesystem_error& ex)
    {
        errorOut = std::string("Failed to read export directory: ") + ex.what();
        return false;
    }

    Logger::info("Merge complete: " + std::to_string(summary.merged) + " conversations merged, " +
                 std::to_string(summary.skipped) + " skipped, " +
                 std::to_string(summary.oldOnly) + " only in old export");

    errorOut.clear();
    return true;
}
