// Static, paginated HTML rendering of the index.md transcripts.

#include "html_pages.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

#include "log.hpp"

namespace fs = std::filesystem;

static const char* const VIDEO_TEMPLATE =
    "<video controls>\n"
    "    <source src=\"{src}\" type=\"video/mp4\">\n"
    "    </source>\n"
    "</video>";

static const char* const AUDIO_TEMPLATE =
    "<audio controls>\n"
    "<source src=\"{src}\" type=\"audio/mp4\">\n"
    "</audio>";

static const char* const FIGURE_TEMPLATE =
    "<figure>\n"
    "    <label for=\"{alt}\">\n"
    "        <img load=\"lazy\" src=\"{src}\" alt=\"{alt}\">\n"
    "    </label>\n"
    "    <input class=\"modal-state\" id=\"{alt}\" type=\"checkbox\">\n"
    "    <div class=\"modal\">\n"
    "        <label for=\"{alt}\">\n"
    "            <div class=\"modal-content\">\n"
    "                <img class=\"modal-photo\" loading=\"lazy\" src=\"{src}\" alt=\"{alt}\">\n"
    "            </div>\n"
    "        </label>\n"
    "    </div>\n"
    "</figure>";

static std::string replaceAll(std::string s, const std::string& from, const std::string& to)
{
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos)
    {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

static bool startsWith(const std::string& s, std::size_t pos, const char* prefix)
{
    return s.compare(pos, std::char_traits<char>::length(prefix), prefix) == 0;
}

std::string HtmlEscape(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        switch (c)
        {
        case '&': out += "&amp;";  break;
        case '<': out += "&lt;";   break;
        case '>': out += "&gt;";   break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&#39;";  break;
        default:  out.push_back(c); break;
        }
    }
    return out;
}

// ---------------------------
// Markdown
// ---------------------------

// Parses "[text](target)" starting at s[pos] == '['.
static bool parseBracketLink(const std::string& s, std::size_t pos,
                             std::string& text, std::string& target, std::size_t& end)
{
    std::size_t close = s.find(']', pos + 1);
    if (close == std::string::npos || close + 1 >= s.size() || s[close + 1] != '(')
        return false;
    std::size_t paren = s.find(')', close + 2);
    if (paren == std::string::npos)
        return false;

    text   = s.substr(pos + 1, close - pos - 1);
    target = s.substr(close + 2, paren - close - 2);
    end    = paren + 1;
    return true;
}

static std::string renderInline(const std::string& s)
{
    std::string out;
    std::size_t i = 0;
    while (i < s.size())
    {
        std::string text, target;
        std::size_t end = 0;

        if (s[i] == '`')
        {
            std::size_t close = s.find('`', i + 1);
            if (close != std::string::npos)
            {
                out += "<code>" + HtmlEscape(s.substr(i + 1, close - i - 1)) + "</code>";
                i = close + 1;
                continue;
            }
        }

        if (s[i] == '!' && i + 1 < s.size() && s[i + 1] == '[' &&
            parseBracketLink(s, i + 1, text, target, end))
        {
            out += "<img alt=\"" + HtmlEscape(text) + "\" src=\"" + HtmlEscape(target) + "\" />";
            i = end;
            continue;
        }

        if (s[i] == '[' && parseBracketLink(s, i, text, target, end))
        {
            out += "<a href=\"" + HtmlEscape(target) + "\">" + renderInline(text) + "</a>";
            i = end;
            continue;
        }

        if (startsWith(s, i, "**"))
        {
            std::size_t close = s.find("**", i + 2);
            if (close != std::string::npos && close > i + 2)
            {
                out += "<strong>" + renderInline(s.substr(i + 2, close - i - 2)) + "</strong>";
                i = close + 2;
                continue;
            }
        }

        if (s[i] == '*' && i + 1 < s.size() && s[i + 1] != ' ')
        {
            std::size_t close = s.find('*', i + 1);
            if (close != std::string::npos && close > i + 1 && s[close - 1] != ' ')
            {
                out += "<em>" + renderInline(s.substr(i + 1, close - i - 1)) + "</em>";
                i = close + 1;
                continue;
            }
        }

        out += HtmlEscape(std::string(1, s[i]));
        ++i;
    }
    return out;
}

static bool isBlank(const std::string& line)
{
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

static std::string trimSpaces(const std::string& s)
{
    std::size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos)
        return "";
    std::size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// Inline content of consecutive lines; two trailing spaces make a <br />.
static std::string renderLines(const std::vector<std::string>& lines)
{
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const std::string& line = lines[i];
        const bool hardBreak = line.size() >= 2 && line.compare(line.size() - 2, 2, "  ") == 0;

        out += renderInline(trimSpaces(line));
        if (i + 1 < lines.size())
            out += hardBreak ? "<br />\n" : "\n";
    }
    return out;
}

static std::string renderParagraph(const std::vector<std::string>& lines)
{
    return "<p>" + renderLines(lines) + "</p>";
}

// The line without up to three leading spaces. Deeper indentation never
// starts a block, so it yields an empty string.
static std::string blockText(const std::string& line)
{
    std::size_t n = 0;
    while (n < line.size() && n < 4 && line[n] == ' ')
        ++n;
    return n > 3 ? std::string() : line.substr(n);
}

static bool isFence(const std::string& text)
{
    return text.compare(0, 3, "```") == 0 || text.compare(0, 3, "~~~") == 0;
}

static bool isRule(const std::string& text)
{
    char mark  = 0;
    int  count = 0;
    for (char c : text)
    {
        if (c == ' ' || c == '\t')
            continue;
        if ((c != '-' && c != '*' && c != '_') || (mark && c != mark))
            return false;
        mark = c;
        ++count;
    }
    return count >= 3;
}

// "# Title", up to six '#', optional closing '#' run.
static bool parseHeading(const std::string& text, int& level, std::string& content)
{
    std::size_t n = 0;
    while (n < text.size() && text[n] == '#')
        ++n;
    if (n == 0 || n > 6)
        return false;
    if (n < text.size() && text[n] != ' ' && text[n] != '\t')
        return false;

    std::string rest = trimSpaces(text.substr(n));
    std::size_t keep = rest.find_last_not_of('#');
    if (keep == std::string::npos)
        rest.clear();
    else if (keep + 1 < rest.size() && (rest[keep] == ' ' || rest[keep] == '\t'))
        rest = trimSpaces(rest.substr(0, keep));

    level   = static_cast<int>(n);
    content = rest;
    return true;
}

static bool parseQuote(const std::string& text, std::string& content)
{
    if (text.empty() || text[0] != '>')
        return false;
    content = text.substr(1);
    if (!content.empty() && content[0] == ' ')
        content.erase(0, 1);
    return true;
}

// "- item", "* item", "+ item", "1. item" or "1) item".
static bool parseListItem(const std::string& text, bool& ordered, long& start, std::string& content)
{
    if (!text.empty() && (text[0] == '-' || text[0] == '*' || text[0] == '+') &&
        (text.size() == 1 || text[1] == ' ' || text[1] == '\t'))
    {
        ordered = false;
        start   = 1;
        content = text.size() > 1 ? text.substr(2) : "";
        return true;
    }

    std::size_t n = 0;
    while (n < text.size() && n < 9 && std::isdigit(static_cast<unsigned char>(text[n])))
        ++n;
    if (n > 0 && n < text.size() && (text[n] == '.' || text[n] == ')') &&
        (n + 1 == text.size() || text[n + 1] == ' ' || text[n + 1] == '\t'))
    {
        ordered = true;
        start   = std::stol(text.substr(0, n));
        content = n + 1 < text.size() ? text.substr(n + 2) : "";
        return true;
    }
    return false;
}

static bool startsBlock(const std::string& line)
{
    const std::string text = blockText(line);
    int         level   = 0;
    bool        ordered = false;
    long        start   = 0;
    std::string content;
    return isFence(text) || parseHeading(text, level, content) || isRule(text) ||
           parseQuote(text, content) || parseListItem(text, ordered, start, content);
}

// Consumes the items of one tight list beginning at lines[i].
static std::string renderList(const std::vector<std::string>& lines, std::size_t& i)
{
    bool        ordered = false;
    long        start   = 1;
    std::string content;
    parseListItem(blockText(lines[i]), ordered, start, content);

    std::vector<std::vector<std::string>> items;
    while (i < lines.size())
    {
        const std::string text = blockText(lines[i]);
        bool        itemOrdered = false;
        long        itemStart   = 0;
        std::string itemText;
        if (!isRule(text) && parseListItem(text, itemOrdered, itemStart, itemText) && itemOrdered == ordered)
        {
            items.push_back({itemText});
            ++i;
            continue;
        }
        if (items.empty() || isBlank(lines[i]) || startsBlock(lines[i]))
            break;

        // Lazy continuation of the current item.
        items.back().push_back(lines[i]);
        ++i;
    }

    std::ostringstream out;
    if (!ordered)
        out << "<ul>\n";
    else if (start != 1)
        out << "<ol start=\"" << start << "\">\n";
    else
        out << "<ol>\n";
    for (const auto& item : items)
        out << "<li>" << renderLines(item) << "</li>\n";
    out << (ordered ? "</ol>" : "</ul>");
    return out.str();
}

std::string MarkdownToHtml(const std::string& markdown)
{
    std::vector<std::string> lines;
    {
        std::istringstream in(markdown);
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            lines.push_back(line);
        }
    }

    std::vector<std::string> blocks;
    std::vector<std::string> paragraph;
    auto flush = [&]()
    {
        if (!paragraph.empty())
        {
            blocks.push_back(renderParagraph(paragraph));
            paragraph.clear();
        }
    };

    std::size_t i = 0;
    while (i < lines.size())
    {
        const std::string text = blockText(lines[i]);
        int         level   = 0;
        bool        ordered = false;
        long        start   = 0;
        std::string content;

        if (isBlank(lines[i]))
        {
            flush();
            ++i;
        }
        else if (isFence(text))
        {
            flush();
            const std::string fence = text.substr(0, 3);
            std::string code;
            for (++i; i < lines.size() && blockText(lines[i]).compare(0, 3, fence) != 0; ++i)
                code += lines[i] + "\n";
            if (i < lines.size())
                ++i;
            blocks.push_back("<pre><code>" + HtmlEscape(code) + "</code></pre>");
        }
        else if (parseHeading(text, level, content))
        {
            flush();
            const std::string tag = "h" + std::to_string(level);
            blocks.push_back("<" + tag + ">" + renderInline(content) + "</" + tag + ">");
            ++i;
        }
        else if (isRule(text))
        {
            flush();
            blocks.push_back("<hr />");
            ++i;
        }
        else if (parseQuote(text, content))
        {
            flush();
            std::string inner;
            while (i < lines.size() && parseQuote(blockText(lines[i]), content))
            {
                inner += content + "\n";
                ++i;
            }
            blocks.push_back("<blockquote>\n" + MarkdownToHtml(inner) + "\n</blockquote>");
        }
        else if (parseListItem(text, ordered, start, content) &&
                 (paragraph.empty() || (!trimSpaces(content).empty() && (!ordered || start == 1))))
        {
            // Inside a paragraph only a non-empty bullet or a list starting at 1 begins a list.
            flush();
            blocks.push_back(renderList(lines, i));
        }
        else
        {
            paragraph.push_back(lines[i]);
            ++i;
        }
    }
    flush();

    std::string out;
    for (std::size_t b = 0; b < blocks.size(); ++b)
    {
        if (b > 0)
            out += "\n";
        out += blocks[b];
    }
    return out;
}

// ---------------------------
// Post-processing
// ---------------------------

static std::string quoteSafe(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        if (c == '\'')
            out += "&#39;";
        else if (c == '"')
            out += "&quot;";
        else
            out.push_back(c);
    }
    return out;
}

std::string LinkifyBareUrls(const std::string& html)
{
    std::string out;
    out.reserve(html.size());

    int skipDepth = 0;
    std::size_t i = 0;
    while (i < html.size())
    {
        if (html[i] == '<')
        {
            std::size_t close = html.find('>', i);
            if (close == std::string::npos)
                close = html.size() - 1;
            const std::string tag = html.substr(i, close - i + 1);
            if (startsWith(tag, 0, "<a ") || tag == "<a>" || tag == "<code>")
                ++skipDepth;
            else if ((tag == "</a>" || tag == "</code>") && skipDepth > 0)
                --skipDepth;
            out += tag;
            i = close + 1;
            continue;
        }

        if (skipDepth == 0 && (startsWith(html, i, "http://") || startsWith(html, i, "https://")))
        {
            std::size_t end = i;
            while (end < html.size() && html[end] != '<' &&
                   !std::isspace(static_cast<unsigned char>(html[end])))
                ++end;
            // Text is already escaped; only quotes could still end the attribute.
            const std::string url = quoteSafe(html.substr(i, end - i));
            out += "<a href='" + url + "' target='_blank'>" + url + "</a>";
            i = end;
            continue;
        }

        out.push_back(html[i]);
        ++i;
    }
    return out;
}

static std::string attributeValue(const std::string& tag, const char* name)
{
    const std::string key = std::string(name) + "=\"";
    std::size_t pos = tag.find(key);
    if (pos == std::string::npos)
        return "";
    pos += key.size();
    std::size_t end = tag.find('"', pos);
    if (end == std::string::npos)
        return "";
    return tag.substr(pos, end - pos);
}

std::string EmbedMedia(const std::string& html)
{
    std::string out;
    out.reserve(html.size());

    std::size_t i = 0;
    while (i < html.size())
    {
        if (startsWith(html, i, "<img "))
        {
            std::size_t close = html.find('>', i);
            if (close != std::string::npos)
            {
                const std::string tag = html.substr(i, close - i + 1);
                const std::string src = attributeValue(tag, "src");
                if (!src.empty())
                {
                    std::string fig = replaceAll(FIGURE_TEMPLATE, "{src}", src);
                    out += replaceAll(fig, "{alt}", attributeValue(tag, "alt"));
                    i = close + 1;
                    continue;
                }
            }
        }

        if (startsWith(html, i, "<a href=\""))
        {
            std::size_t close = html.find('>', i);
            std::size_t endA  = html.find("</a>", i);
            if (close != std::string::npos && endA != std::string::npos)
            {
                const std::string href = attributeValue(html.substr(i, close - i + 1), "href");
                const char* tmpl = nullptr;
                if (href.find(".m4a") != std::string::npos)
                    tmpl = AUDIO_TEMPLATE;
                else if (href.find(".mp4") != std::string::npos)
                    tmpl = VIDEO_TEMPLATE;

                if (tmpl)
                {
                    out += replaceAll(tmpl, "{src}", href);
                    i = endA + 4;
                    continue;
                }
            }
        }

        out.push_back(html[i]);
        ++i;
    }
    return out;
}

// ---------------------------
// Pages
// ---------------------------

std::string RenderMessageHtml(const LogicalLine& line)
{
    // "[2024-01-01 10:00]" -> "2024-01-01", "10:00"
    std::string stamp = line.date.size() >= 2 ? line.date.substr(1, line.date.size() - 2) : line.date;
    stamp = replaceAll(stamp, ",", "");
    std::string date = stamp;
    std::string time;
    std::size_t space = stamp.find(' ');
    if (space != std::string::npos)
    {
        date = stamp.substr(0, space);
        time = stamp.substr(space + 1);
    }

    // " Me:" -> "Me"
    std::string sender = line.sender;
    if (sender.size() >= 2)
        sender = sender.substr(1, sender.size() - 2);

    const std::string body = EmbedMedia(LinkifyBareUrls(MarkdownToHtml(line.body)));
    const char* cls = (sender == "Me") ? "msg me" : "msg";

    std::ostringstream oss;
    oss << "<div class='" << cls << "'><span class=date>" << date << "</span>"
        << "<span class=time>" << time << "</span> "
        << "<span class=sender>" << HtmlEscape(sender) << "</span>"
        << "<span class=body>" << body << "</span></div>\n";
    return oss.str();
}

static std::string navigation(std::size_t page, std::size_t lastPage)
{
    std::ostringstream nav;
    nav << "<nav><div class=prev>";
    if (page > 0)
        nav << "<a href='#pg" << (page - 1) << "'>PREV</a>";
    else
        nav << "&nbsp;";
    nav << "</div><div class=next>";
    if (page < lastPage)
        nav << "<a href='#pg" << (page + 1) << "'>NEXT</a>";
    else
        nav << "&nbsp;";
    nav << "</div></nav>\n";
    return nav.str();
}

std::string RenderConversationHtml(const std::string&              title,
                                   const std::vector<LogicalLine>& lines,
                                   std::size_t                     msgsPerPage)
{
    if (msgsPerPage == 0)
        msgsPerPage = DEFAULT_MSGS_PER_PAGE;

    std::ostringstream html;
    html << "<!doctype html>"
            "<html lang='en'><head>"
            "<meta charset='utf-8'>"
            "<title>" << HtmlEscape(title) << "</title>"
            "<link rel=stylesheet href='../" << STYLESHEET_NAME << "'>"
            "</head>"
            "<body>"
            "<style>"
            "img.emoji {"
            "height: 1em;"
            "width: 1em;"
            "margin: 0 .05em 0 .1em;"
            "vertical-align: -0.1em;"
            "}"
            "</style>"
            "<script src='https://cdn.jsdelivr.net/npm/twemoji@14.0.2/dist/twemoji.min.js?11.2'></script>"
            "<script>window.onload = function () { twemoji.parse(document.body);}</script>\n";

    const std::size_t lastPage = lines.empty() ? 0 : (lines.size() - 1) / msgsPerPage;

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i % msgsPerPage == 0)
        {
            const std::size_t page = i / msgsPerPage;
            if (page > 0)
                html << "</div>\n";
            html << navigation(page, lastPage);
            html << "<div class=page id=pg" << page << ">\n";
        }
        html << RenderMessageHtml(lines[i]);
    }
    if (!lines.empty())
        html << "</div>\n";

    html << "<script>if (!document.location.hash){"
            "document.location.hash = 'pg0';}</script>\n"
            "</body></html>\n";
    return html.str();
}

static void copyStylesheet(const fs::path& stylesheet, const fs::path& dest)
{
    const fs::path target = dest / STYLESHEET_NAME;
    std::error_code ec;
    if (!stylesheet.empty() && fs::is_regular_file(stylesheet, ec))
    {
        fs::copy_file(stylesheet, target, fs::copy_options::overwrite_existing);
        return;
    }

    Logger::warn("Stylesheet not found: " + stylesheet.string());
    Logger::warn("HTML files will be created without styling.");
    Logger::warn("You can add a stylesheet manually at: " + target.string());
}

bool CreateHtml(const fs::path& dest,
                const fs::path& stylesheet,
                std::size_t     msgsPerPage,
                std::string&    errorOut)
{
    try
    {
        copyStylesheet(stylesheet, dest);

        for (const auto& sub : fs::directory_iterator(dest))
        {
            if (!sub.is_directory())
                continue;

            const std::string name = sub.path().filename().string();
            Logger::info("\tDoing html for " + name);

            const fs::path mdPath = sub.path() / TRANSCRIPT_FILE_NAME;
            if (!fs::exists(mdPath))
            {
                std::ofstream touch(mdPath, std::ios::binary | std::ios::app);
            }

            const std::vector<LogicalLine> lines = ParseTranscriptLines(ReadPhysicalLines(mdPath));

            const fs::path htmlPath = sub.path() / HTML_FILE_NAME;
            std::ofstream htfile(htmlPath, std::ios::binary | std::ios::trunc);
            if (!htfile)
            {
                errorOut = "Failed to open output file: " + htmlPath.string();
                return false;
            }
            htfile << RenderConversationHtml(name, lines, msgsPerPage);
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
