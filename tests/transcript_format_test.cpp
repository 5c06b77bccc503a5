#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "test_util.hpp"
#include "transcript_format.hpp"

TEST(TranscriptFormatTest, PrefixMatchSplitsDateAndSender)
{
    // The bracketed stamp and the sender up to the first colon are the prefix.
    const std::string line = "[2024-01-01 10:00] Me: hi: there  \n";
    std::size_t dateEnd = 0, senderEnd = 0;
    ASSERT_TRUE(MatchLinePrefix(line, dateEnd, senderEnd));
    EXPECT_EQ(line.substr(0, dateEnd), "[2024-01-01 10:00]");
    EXPECT_EQ(line.substr(dateEnd, senderEnd - dateEnd), " Me:");
    EXPECT_EQ(line.substr(senderEnd), " hi: there  \n");
}

TEST(TranscriptFormatTest, PrefixRejectsNonTranscriptText)
{
    // Lines without a full stamp or without a sender colon are continuations.
    std::size_t a = 0, b = 0;
    EXPECT_FALSE(MatchLinePrefix("garbage text\n", a, b));
    EXPECT_FALSE(MatchLinePrefix("[2024-1-01 10:00] Me: x\n", a, b));
    EXPECT_FALSE(MatchLinePrefix("[2024-01-01 10:00] no colon here\n", a, b));
    EXPECT_FALSE(MatchLinePrefix("[2024-01-01 10:00]", a, b));
    EXPECT_TRUE(MatchLinePrefix("[2024-01-01, 10:00] Old: legacy\n", a, b));
}

TEST(TranscriptFormatTest, ContinuationLinesJoinPreviousMessage)
{
    // Body text spanning several physical lines stays one logical line.
    std::vector<std::string> raw = {
        "[2024-01-01 10:00] Alice: first  \n",
        "second line\n",
        "\n",
        "[2024-01-01 10:05] Me: reply  \n",
    };
    auto msgs = ParseTranscriptLines(raw);
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0].date, "[2024-01-01 10:00]");
    EXPECT_EQ(msgs[0].sender, " Alice:");
    EXPECT_EQ(msgs[0].body, " first  \nsecond line\n\n");
    EXPECT_EQ(msgs[1].sender, " Me:");
}

TEST(TranscriptFormatTest, MalformedLeadingLineIsDropped)
{
    // Text before the first message has nowhere to go and is discarded.
    auto msgs = ParseTranscriptLines({"garbage text\n"});
    EXPECT_TRUE(msgs.empty());

    msgs = ParseTranscriptLines({"garbage text\n", "[2024-01-02 11:00] Me: bye  \n"});
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].text(), "[2024-01-02 11:00] Me: bye  \n");
}

TEST(TranscriptFormatTest, ParsingIsLossless)
{
    // Joining the parsed lines reproduces the file byte for byte.
    const std::string file =
        "[2024-01-01 10:00] Alice: hello  \n"
        "  indented continuation\n"
        "[2024-01-01 10:01] Me: ![a.png](./media/a.png)  \n"
        "[2024-01-02 09:30] Bob: no trailing newline";

    TempDir dir;
    WriteFile(dir / "index.md", file);

    std::string rebuilt;
    for (const auto& line : ParseTranscriptLines(ReadPhysicalLines(dir / "index.md")))
        rebuilt += line.text();
    EXPECT_EQ(rebuilt, file);
}

TEST(TranscriptFormatTest, FormattedLineParsesBack)
{
    // The writer's output is accepted by the parser as one logical line.
    const std::string line = FormatTranscriptLine("2024-03-04 05:06", "Bob", "multi\nline  ");
    auto msgs = ParseTranscriptLines({"[2024-03-04 05:06] Bob: multi\n", "line  \n"});
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].text(), line);
}

TEST(TranscriptFormatTest, TimestampRendersInLocalTime)
{
    // Epoch milliseconds are rendered with the strftime pattern.
    UseUtcTimezone();
    EXPECT_EQ(FormatTimestamp(1704103200000LL, "%Y-%m-%d %H:%M"), "2024-01-01 10:00");
    EXPECT_EQ(FormatTimestamp(0, "%Y-%m-%d"), "1970-01-01");
}

TEST(TranscriptFormatTest, BackticksAreStripped)
{
    // Backticks would turn into code spans in Markdown.
    EXPECT_EQ(StripBackticks("`code`"), "code");
    EXPECT_EQ(StripBackticks("a ``b`` c"), "a b c");
}

TEST(TranscriptFormatTest, AttachmentReferenceMarksImages)
{
    // Images get the "!" prefix, spaces in the link target become %20.
    EXPECT_EQ(AttachmentReference("2024-01-01_00_cat.jpg"),
              "![2024-01-01_00_cat.jpg](./media/2024-01-01_00_cat.jpg)");
    EXPECT_EQ(AttachmentReference("voice note.m4a"),
              "[voice note.m4a](./media/voice%20note.m4a)");
    EXPECT_FALSE(IsImageFileName("noext"));
    EXPECT_TRUE(IsImageFileName("scan.tiff"));
    EXPECT_FALSE(IsImageFileName("movie.mp4"));
}
