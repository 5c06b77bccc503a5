#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "transcript_format.hpp"

struct MergeSummary
{
    std::size_t merged  = 0;
    std::size_t skipped = 0;   // new conversations with no old counterpart
    std::size_t oldOnly = 0;   // old conversations with no new directory, left alone
};

// Old lines first, then new lines, dropping any line whose full text was
// already seen. Order within each input is kept. Every returned line ends
// in '\n'.
std::vector<std::string> MergeLogicalLines(const std::vector<LogicalLine>& oldLines,
                                           const std::vector<LogicalLine>& newLines);

// Copies files from mediaOld that mediaNew lacks (by name). Existing files
// in mediaNew are never touched. Problems are logged, never thrown.
void MergeAttachments(const std::filesystem::path& mediaNew,
                      const std::filesystem::path& mediaOld);

// Rewrites pathNew with the deduplicated union of both transcripts.
// Missing files are logged as skips.
void MergeChat(const std::filesystem::path& pathNew,
               const std::filesystem::path& pathOld);

// Enriches every conversation directory of `dest` with what the matching
// directory of `old` has. Returns false only when either export root is
// missing or not a directory.
bool MergeWithOld(const std::filesystem::path& dest,
                  const std::filesystem::path& old,
                  MergeSummary&                summary,
                  std::string&                 errorOut);
