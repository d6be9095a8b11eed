// =============================================================================
// Normalizer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "capture/Normalizer.hpp"

#include <string>

using namespace capture;

TEST(CellRefTest, AcceptsSingleCellsAndRanges) {
    EXPECT_TRUE(is_cell_ref("A1"));
    EXPECT_TRUE(is_cell_ref("BC12"));
    EXPECT_TRUE(is_cell_ref("A1:C10"));
}

TEST(CellRefTest, RejectsMalformedReferences) {
    EXPECT_FALSE(is_cell_ref(""));
    EXPECT_FALSE(is_cell_ref("A"));
    EXPECT_FALSE(is_cell_ref("12"));
    EXPECT_FALSE(is_cell_ref("1A"));
    EXPECT_FALSE(is_cell_ref("a1"));
    EXPECT_FALSE(is_cell_ref("A1:"));
    EXPECT_FALSE(is_cell_ref("A1:B"));
}

TEST(CleanTextTest, StripsTrailingSelectionNotice) {
    EXPECT_EQ(clean_text("Total revenue is 42\nA1 selected"), "Total revenue is 42");
    EXPECT_EQ(clean_text("Sum the column\n\n\nB2:C10 selected"), "Sum the column");
}

TEST(CleanTextTest, KeepsTextThatOnlyLooksSimilar) {
    // no newline before the reference
    EXPECT_EQ(clean_text("Cell A1 selected"), "Cell A1 selected");
    // not a cell reference
    EXPECT_EQ(clean_text("Rows\nall selected"), "Rows\nall selected");
    // lower-case reference
    EXPECT_EQ(clean_text("Rows\na1 selected"), "Rows\na1 selected");
    // notice not at the end
    EXPECT_EQ(clean_text("Before\nA1 selected\nafter"), "Before\nA1 selected\nafter");
}

TEST(CleanTextTest, TrimsWhitespace) {
    EXPECT_EQ(clean_text("  \n hello world \t\n"), "hello world");
}

TEST(NormalizeFragmentTest, RejectsEmptyResult) {
    std::string out = "untouched";
    EXPECT_FALSE(normalize_fragment("   \n\t ", out));
    EXPECT_FALSE(normalize_fragment("\nA1 selected", out));
    EXPECT_EQ(out, "untouched");
}

TEST(NormalizeFragmentTest, KeepsShortTextByDefault) {
    std::string out;
    ASSERT_TRUE(normalize_fragment("Hi", out));
    EXPECT_EQ(out, "Hi");
}

TEST(NormalizeFragmentTest, DropsUiNoiseWhenAsked) {
    NormalizerConfig cfg;
    cfg.drop_ui_noise = true;

    std::string out;
    EXPECT_FALSE(normalize_fragment("Copy", out, cfg));
    EXPECT_FALSE(normalize_fragment("New chat", out, cfg));
    EXPECT_FALSE(normalize_fragment("short one", out, cfg));
    EXPECT_FALSE(normalize_fragment("Spreadsheeting", out, cfg));
    EXPECT_FALSE(normalize_fragment("AB12:AC400 selected", out, cfg));

    ASSERT_TRUE(normalize_fragment("What is the total revenue?", out, cfg));
    EXPECT_EQ(out, "What is the total revenue?");
}
