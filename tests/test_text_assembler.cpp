//
// Unit tests for text assembly
//

#include <gtest/gtest.h>
#include "text_assembler.hpp"

TEST(TextAssembler, JoinsPagesFromStartPage)
{
    std::vector<std::string> pages = {"cover", "contents", "page three", "page four"};
    EXPECT_EQ(assemble_document_text(pages, 3), "page three\npage four");
}

TEST(TextAssembler, FirstPageKeepsEverything)
{
    std::vector<std::string> pages = {"a", "b"};
    EXPECT_EQ(assemble_document_text(pages, 1), "a\nb");
    EXPECT_EQ(assemble_document_text(pages, 0), "a\nb");
    EXPECT_EQ(assemble_document_text(pages, -4), "a\nb");
}

TEST(TextAssembler, SkipsEmptyPages)
{
    std::vector<std::string> pages = {"a", "", "c"};
    EXPECT_EQ(assemble_document_text(pages, 1), "a\nc");
}

TEST(TextAssembler, StartPastTheEnd)
{
    std::vector<std::string> pages = {"a", "b"};
    EXPECT_EQ(assemble_document_text(pages, 3), "");
    EXPECT_EQ(assemble_document_text({}, 1), "");
}

TEST(TextAssembler, DefaultStartPageSkipsFrontMatter)
{
    std::vector<std::string> pages(PDF_SPLITTER_DEFAULT_START_PAGE - 1, "front");
    pages.push_back("body");
    EXPECT_EQ(assemble_document_text(pages), "body");
}
