#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "transcript_format.hpp"

constexpr std::size_t DEFAULT_MSGS_PER_PAGE = 100;
constexpr const char* HTML_FILE_NAME       = "index.html";
constexpr const char* STYLESHEET_NAME      = "style.css";

std::string HtmlEscape(const std::string& text);

// Markdown to HTML: paragraphs with hard line breaks (two trailing spaces),
// ATX headings, bullet and ordered lists, blockquotes, fenced code, rules,
// and inline images, links, `code`, *em* and **strong**.
std::string MarkdownToHtml(const std::string& markdown);

// Wraps bare http(s) URLs found in text (outside tags, anchors and code) in
// <a href='...' target='_blank'>. Quotes in the URL are escaped.
std::string LinkifyBareUrls(const std::string& html);

// Replaces <img> with the lightbox figure, and links to .m4a / .mp4 files
// with <audio> / <video> players.
std::string EmbedMedia(const std::string& html);

// One message as a <div class='msg'> block.
std::string RenderMessageHtml(const LogicalLine& line);

// Full page for one conversation, msgsPerPage messages per <div class=page>.
std::string RenderConversationHtml(const std::string&              title,
                                   const std::vector<LogicalLine>& lines,
                                   std::size_t                     msgsPerPage);

// Copies the stylesheet to <dest>/style.css and writes <dir>/index.html for
// every subdirectory of dest from its index.md.
bool CreateHtml(const std::filesystem::path& dest,
                const std::filesystem::path& stylesheet,
                std::size_t                  msgsPerPage,
                std::string&                 errorOut);
