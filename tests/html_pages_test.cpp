#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "html_pages.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;

static std::size_t countOf(const std::string& haystack, const std::string& needle)
{
    std::size_t n = 0;
    for (std::size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1))
        ++n;
    return n;
}

static LogicalLine line(const std::string& stamp, const std::string& sender, const std::string& body)
{
    return LogicalLine{"[" + stamp + "]", " " + sender + ":", " " + body + "  \n"};
}

TEST(HtmlPagesTest, MarkdownParagraphsAndBreaks)
{
    // Two trailing spaces become <br />, text is escaped.
    EXPECT_EQ(MarkdownToHtml(" hi  \n"), "<p>hi</p>");
    EXPECT_EQ(MarkdownToHtml(" first  \nsecond\n"), "<p>first<br />\nsecond</p>");
    EXPECT_EQ(MarkdownToHtml("a\n\nb\n"), "<p>a</p>\n<p>b</p>");
    EXPECT_EQ(MarkdownToHtml("1 < 2 & 3"), "<p>1 &lt; 2 &amp; 3</p>");
    EXPECT_EQ(MarkdownToHtml("**bold** and *it*"), "<p><strong>bold</strong> and <em>it</em></p>");
}

TEST(HtmlPagesTest, MarkdownBlocks)
{
    // Headings, lists and quotes become real block elements.
    EXPECT_EQ(MarkdownToHtml("# Shopping\n- milk\n- eggs\n> quoted"),
              "<h1>Shopping</h1>\n"
              "<ul>\n<li>milk</li>\n<li>eggs</li>\n</ul>\n"
              "<blockquote>\n<p>quoted</p>\n</blockquote>");
    EXPECT_EQ(MarkdownToHtml("### Plan ###"), "<h3>Plan</h3>");
    EXPECT_EQ(MarkdownToHtml("1. one\n2. two"), "<ol>\n<li>one</li>\n<li>two</li>\n</ol>");
    EXPECT_EQ(MarkdownToHtml("3. three"), "<ol start=\"3\">\n<li>three</li>\n</ol>");
    EXPECT_EQ(MarkdownToHtml("---"), "<hr />");
}

TEST(HtmlPagesTest, MarkdownBlocksInsideTranscriptBodies)
{
    // A body keeps its leading space and trailing break; lists still interrupt it.
    EXPECT_EQ(MarkdownToHtml(" Buy:  \n- milk\n- eggs  \n"),
              "<p>Buy:</p>\n<ul>\n<li>milk</li>\n<li>eggs</li>\n</ul>");
    EXPECT_EQ(MarkdownToHtml(" #hashtag  \n"), "<p>#hashtag</p>");
    EXPECT_EQ(MarkdownToHtml(" in 2024. we went\n"), "<p>in 2024. we went</p>");
    EXPECT_EQ(MarkdownToHtml("see\n2. not a list"), "<p>see\n2. not a list</p>");
}

TEST(HtmlPagesTest, MarkdownCode)
{
    // Code spans and fenced blocks are escaped, not interpreted.
    EXPECT_EQ(MarkdownToHtml("run `a < b` now"), "<p>run <code>a &lt; b</code> now</p>");
    EXPECT_EQ(MarkdownToHtml("```\n# not a heading\n*x*\n```"),
              "<pre><code># not a heading\n*x*\n</code></pre>");
    EXPECT_EQ(LinkifyBareUrls("<p><code>https://x.org</code></p>"), "<p><code>https://x.org</code></p>");
}

TEST(HtmlPagesTest, MarkdownImagesAndLinks)
{
    // Attachment references turn into <img> and <a>.
    EXPECT_EQ(MarkdownToHtml("![a.png](./media/a.png)"),
              "<p><img alt=\"a.png\" src=\"./media/a.png\" /></p>");
    EXPECT_EQ(MarkdownToHtml("[doc.pdf](./media/doc.pdf)"),
              "<p><a href=\"./media/doc.pdf\">doc.pdf</a></p>");
}

TEST(HtmlPagesTest, BareUrlsBecomeLinks)
{
    // URLs in text are linked; existing anchors are left alone.
    EXPECT_EQ(LinkifyBareUrls("<p>see https://x.org/a?b=1 now</p>"),
              "<p>see <a href='https://x.org/a?b=1' target='_blank'>https://x.org/a?b=1</a> now</p>");

    const std::string anchored = "<p><a href=\"http://x.org\">http://x.org</a></p>";
    EXPECT_EQ(LinkifyBareUrls(anchored), anchored);
}

TEST(HtmlPagesTest, QuotesInUrlsCannotBreakOutOfTheAttribute)
{
    // A quote in a message URL stays inside href.
    const std::string html = LinkifyBareUrls(MarkdownToHtml("https://x.io/a'onmouseover='alert(1)"));
    EXPECT_EQ(html.find("'onmouseover"), std::string::npos);
    EXPECT_NE(html.find("<a href='https://x.io/a&#39;onmouseover=&#39;alert(1)' target='_blank'>"),
              std::string::npos);

    const std::string raw = LinkifyBareUrls("<p>https://x.io/\"q'</p>");
    EXPECT_NE(raw.find("href='https://x.io/&quot;q&#39;'"), std::string::npos);
    EXPECT_EQ(HtmlEscape("it's"), "it&#39;s");
}

TEST(HtmlPagesTest, MediaIsEmbedded)
{
    // Images get the lightbox, voice notes and videos get players.
    const std::string fig = EmbedMedia("<p><img alt=\"a.png\" src=\"./media/a.png\" /></p>");
    EXPECT_NE(fig.find("<figure>"), std::string::npos);
    EXPECT_EQ(countOf(fig, "src=\"./media/a.png\""), 2u);
    EXPECT_NE(fig.find("id=\"a.png\""), std::string::npos);

    const std::string audio = EmbedMedia("<p><a href=\"./media/v.m4a\">v.m4a</a></p>");
    EXPECT_EQ(audio, "<p><audio controls>\n<source src=\"./media/v.m4a\" type=\"audio/mp4\">\n</audio></p>");

    const std::string video = EmbedMedia("<p><a href=\"./media/c.mp4\">c.mp4</a></p>");
    EXPECT_NE(video.find("<video controls>"), std::string::npos);
    EXPECT_EQ(video.find("<a "), std::string::npos);

    const std::string plain = "<p><a href=\"./media/doc.pdf\">doc.pdf</a></p>";
    EXPECT_EQ(EmbedMedia(plain), plain);
}

TEST(HtmlPagesTest, MessageMarkup)
{
    // Date, time and sender are split out; own messages get the "me" class.
    const std::string mine = RenderMessageHtml(line("2024-01-01 10:00", "Me", "hi"));
    EXPECT_NE(mine.find("<div class='msg me'>"), std::string::npos);
    EXPECT_NE(mine.find("<span class=date>2024-01-01</span>"), std::string::npos);
    EXPECT_NE(mine.find("<span class=time>10:00</span>"), std::string::npos);
    EXPECT_NE(mine.find("<span class=sender>Me</span>"), std::string::npos);
    EXPECT_NE(mine.find("<span class=body><p>hi</p></span>"), std::string::npos);

    const std::string legacy = RenderMessageHtml(line("2024-01-01, 10:00", "Alice", "yo"));
    EXPECT_NE(legacy.find("<div class='msg'>"), std::string::npos);
    EXPECT_NE(legacy.find("<span class=date>2024-01-01</span>"), std::string::npos);
}

TEST(HtmlPagesTest, PaginationLinksPages)
{
    // Five messages at two per page make three linked pages.
    std::vector<LogicalLine> lines;
    for (int i = 0; i < 5; ++i)
        lines.push_back(line("2024-01-01 10:0" + std::to_string(i), "A", "m" + std::to_string(i)));

    const std::string html = RenderConversationHtml("Alice", lines, 2);
    EXPECT_EQ(countOf(html, "<div class=page id=pg"), 3u);
    EXPECT_EQ(countOf(html, "<nav>"), 3u);
    EXPECT_NE(html.find("<a href='#pg1'>NEXT</a>"), std::string::npos);
    EXPECT_NE(html.find("<a href='#pg0'>PREV</a>"), std::string::npos);
    EXPECT_EQ(html.find("#pg3"), std::string::npos);
    EXPECT_EQ(countOf(html, "<div class='msg'>"), 5u);
    EXPECT_NE(html.find("<title>Alice</title>"), std::string::npos);
    EXPECT_NE(html.find("twemoji"), std::string::npos);
}

TEST(HtmlPagesTest, ExactMultipleHasNoDanglingNextLink)
{
    // Four messages at two per page is two pages, the second has no NEXT.
    std::vector<LogicalLine> lines(4, line("2024-01-01 10:00", "A", "x"));
    const std::string html = RenderConversationHtml("A", lines, 2);
    EXPECT_EQ(countOf(html, "<div class=page id=pg"), 2u);
    EXPECT_EQ(html.find("#pg2"), std::string::npos);
}

TEST(HtmlPagesTest, CreateHtmlWritesEveryConversation)
{
    // Each subdirectory gets index.html, even without an index.md.
    TempDir dir;
    WriteFile(dir / "out/Alice/index.md", "[2024-01-01 10:00] Alice: hi  \n");
    fs::create_directories(dir / "out/Empty");
    WriteFile(dir / "style.css", "body {}");

    std::string error;
    ASSERT_TRUE(CreateHtml(dir / "out", dir / "style.css", DEFAULT_MSGS_PER_PAGE, error)) << error;

    EXPECT_EQ(ReadFile(dir / "out/style.css"), "body {}");
    EXPECT_NE(ReadFile(dir / "out/Alice/index.html").find("<p>hi</p>"), std::string::npos);
    EXPECT_TRUE(fs::exists(dir / "out/Empty/index.md"));
    EXPECT_TRUE(fs::exists(dir / "out/Empty/index.html"));
}

TEST(HtmlPagesTest, MissingStylesheetIsNotFatal)
{
    // Pages are still written without a stylesheet.
    TempDir dir;
    WriteFile(dir / "out/Bob/index.md", "[2024-01-01 10:00] Bob: hey  \n");

    std::string error;
    ASSERT_TRUE(CreateHtml(dir / "out", dir / "nope.css", DEFAULT_MSGS_PER_PAGE, error)) << error;
    EXPECT_FALSE(fs::exists(dir / "out/style.css"));
    EXPECT_TRUE(fs::exists(dir / "out/Bob/index.html"));
}
