#include "kindle2md/markup_scanner.h"

#include <gtest/gtest.h>

using namespace kindle2md;

TEST(MarkupTagTest, ReadsNameAndAttributes)
{
    const std::string html = "<DIV Class='noteHeading' data-x=1 hidden id=\"a b\">";
    detail::MarkupTag tag;
    ASSERT_TRUE(detail::readTag(html, 0, tag));
    EXPECT_EQ(tag.name, "div");
    EXPECT_FALSE(tag.closing);
    EXPECT_EQ(tag.attribute("class"), "noteHeading");
    EXPECT_EQ(tag.attribute("data-x"), "1");
    EXPECT_TRUE(tag.hasAttribute("hidden"));
    EXPECT_EQ(tag.attribute("id"), "a b");
    EXPECT_EQ(tag.end, html.size());
    EXPECT_TRUE(tag.classIsOneOf({"noteheading"}));
}

TEST(MarkupTagTest, RejectsNonTags)
{
    detail::MarkupTag tag;
    EXPECT_FALSE(detail::readTag("< div>", 0, tag));
    EXPECT_FALSE(detail::readTag("<!-- c -->", 0, tag));
    EXPECT_FALSE(detail::readTag("<div class='x'", 0, tag));
    ASSERT_TRUE(detail::readTag("</div >", 0, tag));
    EXPECT_TRUE(tag.closing);
}

TEST(MarkupTagTest, FindsClosingTagCaseInsensitively)
{
    const std::string html = "<div>a</divider></DIV>b";
    std::string::size_type closeEnd = 0;
    const std::string::size_type close = detail::findClosingTag(html, 5, "div", closeEnd);
    EXPECT_EQ(close, html.find("</DIV>"));
    EXPECT_EQ(closeEnd, html.find('b', close));
}

TEST(MarkupTagTest, ElementContentStopsAtOwnClosingTag)
{
    const std::string html = "<h3 class='kp-notebook-title'>The <i>Title</i></h3><div>x</div>";
    std::string content;
    ASSERT_TRUE(detail::findElementContent(html, "", [](const detail::MarkupTag &tag) { return tag.classIsOneOf({"kp-notebook-title"}); }, content));
    EXPECT_EQ(content, "The <i>Title</i>");
}

TEST(MarkupTagTest, ClosingTagFinderReusesMatchUntilPassed)
{
    const std::string html = "<div>a</div><div>b</DIV >";
    detail::ClosingTagFinder finder(html, "div");
    std::string::size_type closeEnd = 0;
    EXPECT_EQ(finder.find(0, closeEnd), 6u);
    EXPECT_EQ(closeEnd, 12u);
    EXPECT_EQ(finder.find(3, closeEnd), 6u);
    EXPECT_EQ(closeEnd, 12u);
    EXPECT_EQ(finder.find(12, closeEnd), 18u);
    EXPECT_EQ(closeEnd, html.size());
    EXPECT_EQ(finder.find(html.size(), closeEnd), std::string::npos);
    EXPECT_EQ(finder.find(html.size(), closeEnd), std::string::npos);
}

TEST(MarkupTagTest, NoOpeningTagWithoutClosingBracket)
{
    detail::MarkupTag tag;
    EXPECT_FALSE(detail::findOpeningTag("<<<div class='x' <p", 0, "", tag));
    EXPECT_FALSE(detail::findOpeningTag("<<a<p>", 0, "p", tag));
    ASSERT_TRUE(detail::findOpeningTag("<<a<p>", 0, "", tag));
    EXPECT_EQ(tag.name, "a");
    EXPECT_EQ(tag.begin, 1u);
    EXPECT_EQ(tag.end, 6u);
}

TEST(ScanNoteBlocksTest, YieldsPairsInDocumentOrder)
{
    const std::string html =
        "<div class='noteHeading'>Highlight (<span class='highlight_yellow'>yellow</span>) - Location 10</div>\n"
        "<div class='noteText'>First</div>\n"
        "<div class=\"noteHeading\">Note - Location 10</div>  <div class=\"noteText\">Second</div>";
    const std::vector<NoteBlock> blocks = scanNoteBlocks(html);
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].heading, "Highlight (<span class='highlight_yellow'>yellow</span>) - Location 10");
    EXPECT_EQ(blocks[0].body, "First");
    EXPECT_EQ(blocks[1].heading, "Note - Location 10");
    EXPECT_EQ(blocks[1].body, "Second");
}

TEST(ScanNoteBlocksTest, SkipsHeadingWithoutAdjacentBody)
{
    const std::string html =
        "<div class='noteHeading'>Orphan heading</div><p>gap</p><div class='noteText'>Lost</div>"
        "<div class='noteHeading'>Highlight - Page 2</div><div class='noteText'>Kept</div>";
    const std::vector<NoteBlock> blocks = scanNoteBlocks(html);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].heading, "Highlight - Page 2");
    EXPECT_EQ(blocks[0].body, "Kept");
}

TEST(ScanNoteBlocksTest, BodyStopsAtFirstClosingDiv)
{
    const std::string html = "<div class='noteHeading'>H</div><div class='noteText'>one</div>two</div>";
    const std::vector<NoteBlock> blocks = scanNoteBlocks(html);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].body, "one");
}

TEST(ScanNoteBlocksTest, IgnoresOtherClassesAndUnclosedBlocks)
{
    EXPECT_TRUE(scanNoteBlocks("<div class='sectionHeading'>Chapter</div><div class='noteText'>x</div>").empty());
    EXPECT_TRUE(scanNoteBlocks("<div class='noteHeading'>H</div><div class='noteText'>never closed").empty());
    EXPECT_TRUE(scanNoteBlocks("plain text with no markup").empty());
}
