#include "kindle2md/highlight_metadata.h"

#include <gtest/gtest.h>

using namespace kindle2md;

TEST(HighlightMetadataTest, ExtractsPageAndLocation)
{
    const std::string heading = "Highlight (Yellow) - Page 12 · Location 340";
    EXPECT_EQ(extractPage(heading), "12");
    EXPECT_EQ(extractLocation(heading), "340");
}

TEST(HighlightMetadataTest, KeepsRangesVerbatim)
{
    EXPECT_EQ(extractLocation("Highlight - Location 1203-1205"), "1203-1205");
    EXPECT_EQ(extractPage("Highlight - Page 123-125"), "123-125");
}

TEST(HighlightMetadataTest, KeywordsAreCaseInsensitive)
{
    EXPECT_EQ(extractLocation("NOTE - LOCATION 50"), "50");
    EXPECT_EQ(extractPage("highlight - page 7"), "7");
}

TEST(HighlightMetadataTest, MissingFieldsAreEmpty)
{
    const HighlightMetadata metadata = extractMetadata("Bookmark");
    EXPECT_TRUE(metadata.color.empty());
    EXPECT_TRUE(metadata.page.empty());
    EXPECT_TRUE(metadata.location.empty());
    EXPECT_TRUE(extractPage("Page xii").empty());
}

TEST(HighlightMetadataTest, ColorUsesReferenceCapitalization)
{
    EXPECT_EQ(extractColor("Highlight (yellow) - Location 3"), "Yellow");
    EXPECT_EQ(extractColor("Highlight (BLUE)"), "Blue");
    EXPECT_EQ(extractColor("Highlight( orange ) - Page 3"), "Orange");
}

TEST(HighlightMetadataTest, ColorNeedsParentheses)
{
    EXPECT_TRUE(extractColor("Highlight Pink - Page 3").empty());
    EXPECT_TRUE(extractColor("Highlight (Purple)").empty());
}

TEST(HighlightMetadataTest, ExtractMetadataCombinesAllFields)
{
    const HighlightMetadata metadata = extractMetadata("Highlight (green) - Page 4 · Location 60-61");
    EXPECT_EQ(metadata.color, "Green");
    EXPECT_EQ(metadata.page, "4");
    EXPECT_EQ(metadata.location, "60-61");
}

TEST(HighlightMetadataTest, NoteHeadingNeedsWordBoundary)
{
    EXPECT_TRUE(isNoteHeading("Note - Location 50"));
    EXPECT_TRUE(isNoteHeading("NOTE"));
    EXPECT_TRUE(isNoteHeading("note: Page 3"));
    EXPECT_FALSE(isNoteHeading("Notebook - Location 50"));
    EXPECT_FALSE(isNoteHeading("Highlight (Yellow) - Note"));
    EXPECT_FALSE(isNoteHeading("No"));
}
