// =============================================================================
// Segmenter Tests
// =============================================================================

#include <gtest/gtest.h>
#include "summary/Segmenter.hpp"

#include <string>
#include <vector>

using namespace summary;

TEST(SegmenterTest, SplitsOnSentencePunctuation) {
    auto units = segment_text(
        "First sentence here. Second sentence here! Third one here? Fourth line without end");

    ASSERT_EQ(units.size(), 4u);
    EXPECT_EQ(units[0].text, "First sentence here.");
    EXPECT_EQ(units[1].text, "Second sentence here!");
    EXPECT_EQ(units[2].text, "Third one here?");
    EXPECT_EQ(units[3].text, "Fourth line without end");
    for (size_t i = 0; i < units.size(); ++i) {
        EXPECT_EQ(units[i].index, i);
        EXPECT_FALSE(units[i].is_code);
    }
}

TEST(SegmenterTest, SplitsOnBlankLinesOnly) {
    auto blocks = segment_text("Line without punctuation\n\nAnother block of text");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].text, "Line without punctuation");
    EXPECT_EQ(blocks[1].text, "Another block of text");

    auto single = segment_text("Line one continues\nright here on line two");
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0].text, "Line one continues\nright here on line two");
}

TEST(SegmenterTest, DropsShortFragments) {
    auto units = segment_text("Ok. This one is long enough.");
    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].text, "This one is long enough.");
    EXPECT_EQ(units[0].index, 0u);

    EXPECT_TRUE(segment_text("Tenletters").empty());
    EXPECT_EQ(segment_text("Elevenchars").size(), 1u);
    EXPECT_TRUE(segment_text("").empty());
}

TEST(SegmenterTest, CodeFenceIsOneAtomicUnit) {
    const std::string code = "```\n=SUM(A1:A10). Then more.\n\n=AVERAGE(B1:B10)\n```";
    auto units = segment_text("Here is the formula you need.\n\n" + code + "\n\nThat should do it for now.");

    ASSERT_EQ(units.size(), 3u);
    EXPECT_FALSE(units[0].is_code);
    EXPECT_TRUE(units[1].is_code);
    EXPECT_EQ(units[1].text, code);
    EXPECT_EQ(units[2].text, "That should do it for now.");
}

TEST(SegmenterTest, ShortCodeBlockInsideSentenceSurvives) {
    auto units = segment_text("Use ```=A1*2``` in column B for doubling values.");

    ASSERT_EQ(units.size(), 2u);
    EXPECT_TRUE(units[0].is_code);
    EXPECT_EQ(units[0].text, "```=A1*2```");
    EXPECT_EQ(units[1].text, "in column B for doubling values.");
}

TEST(SegmenterTest, UnterminatedFenceIsStillCode) {
    auto units = segment_text("Here is some text.\n```\nno closing fence here");

    ASSERT_EQ(units.size(), 2u);
    EXPECT_FALSE(units[0].is_code);
    EXPECT_TRUE(units[1].is_code);
    EXPECT_EQ(units[1].text, "```\nno closing fence here");
}

TEST(SegmenterTest, UnterminatedFenceSentenceIsCode) {
    auto units = segment_text("Run this first. ```python\nimport os. x = 1");

    ASSERT_EQ(units.size(), 2u);
    EXPECT_FALSE(units[0].is_code);
    EXPECT_TRUE(units[1].is_code);
    EXPECT_EQ(units[1].text, "```python\nimport os.");
}

TEST(SegmenterTest, LiteralMarkerTextIsNotTreatedAsCode) {
    auto units = segment_text("The marker __CODE_BLOCK_7__ appears in this text.");

    ASSERT_EQ(units.size(), 1u);
    EXPECT_FALSE(units[0].is_code);
    EXPECT_EQ(units[0].text, "The marker __CODE_BLOCK_7__ appears in this text.");
}

TEST(SegmenterTest, IsCodeText) {
    EXPECT_TRUE(is_code_text("```python\nprint(1)\n```"));
    EXPECT_FALSE(is_code_text("plain text"));
    EXPECT_FALSE(is_code_text(" ```"));
}
