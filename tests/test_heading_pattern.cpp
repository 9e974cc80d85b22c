//
// Unit tests for heading patterns
//

#include <gtest/gtest.h>
#include "heading_pattern.hpp"

TEST(HeadingPattern, RelaxTitle_WhitespaceRunsBecomeOptional)
{
    EXPECT_EQ(relax_title("Basic  terms\n of\tuse"), "Basic\\s*terms\\s*of\\s*use");
}

TEST(HeadingPattern, RelaxTitle_EscapesMetacharacters)
{
    EXPECT_EQ(relax_title("Cost (net) 1.5+"), "Cost\\s*\\(net\\)\\s*1\\.5\\+");
}

TEST(HeadingPattern, RelaxTitle_EmptyTitle)
{
    EXPECT_EQ(relax_title(""), "");
}

TEST(HeadingPattern, Chapter_MatchesAcrossLineBreaks)
{
    Heading_Pattern pattern = Heading_Pattern::chapter("2", "General ledger accounts");
    std::string text = "intro\nГлава 2\nGeneral ledger\naccounts\nbody";

    std::optional<Heading_Match> match = pattern.find(text);
    ASSERT_TRUE(match);
    EXPECT_EQ(text.substr(match->start, match->end - match->start), "Глава 2\nGeneral ledger\naccounts");
}

TEST(HeadingPattern, Chapter_IsCaseInsensitiveForTitle)
{
    Heading_Pattern pattern = Heading_Pattern::chapter("1", "Introduction");
    std::string text = "Глава 1 INTRODUCTION";

    std::optional<Heading_Match> match = pattern.find(text);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->start, 0u);
    EXPECT_EQ(match->end, text.length());
}

TEST(HeadingPattern, Chapter_CustomMarker)
{
    Heading_Pattern pattern = Heading_Pattern::chapter("4", "Reports", "Chapter");
    std::optional<Heading_Match> match = pattern.find("see chapter 4 reports");
    ASSERT_TRUE(match);
    EXPECT_EQ(match->start, 4u);
}

TEST(HeadingPattern, Chapter_EmptyTitleMatchesMarkerAndNumber)
{
    Heading_Pattern pattern = Heading_Pattern::chapter("3", "");
    std::string text = "xx Глава 3 yy";

    std::optional<Heading_Match> match = pattern.find(text);
    ASSERT_TRUE(match);
    EXPECT_EQ(text.substr(match->start, match->end - match->start), "Глава 3 ");
}

TEST(HeadingPattern, Section_OnlyMatchesAtLineStart)
{
    Heading_Pattern pattern = Heading_Pattern::section("1", "First");
    std::string text = "see 1 First here\n1 First\nbody";

    std::optional<Heading_Match> match = pattern.find(text);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->start, text.find("\n1 First") + 1);
    EXPECT_EQ(text.substr(match->start, match->end - match->start), "1 First");
}

TEST(HeadingPattern, Section_MatchesAtTextStart)
{
    Heading_Pattern pattern = Heading_Pattern::section("1", "First");
    std::optional<Heading_Match> match = pattern.find("1 First\nbody");
    ASSERT_TRUE(match);
    EXPECT_EQ(match->start, 0u);
    EXPECT_EQ(match->end, 7u);
}

TEST(HeadingPattern, Subsection_DotIsLiteral)
{
    Heading_Pattern pattern = Heading_Pattern::section("2.1", "Setup");
    EXPECT_FALSE(pattern.find("201 Setup"));
    EXPECT_TRUE(pattern.find("2.1 Setup"));
}

TEST(HeadingPattern, Find_FromOffsetSkipsEarlierOccurrences)
{
    Heading_Pattern pattern = Heading_Pattern::section("1", "Intro");
    std::string text = "1 Intro\nabc\n1 Intro\nxyz";

    std::optional<Heading_Match> match = pattern.find(text, 3);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->start, 12u);
}

TEST(HeadingPattern, Find_FromOffsetDoesNotTreatMidLineAsLineStart)
{
    Heading_Pattern pattern = Heading_Pattern::section("1", "Intro");
    std::string text = "ab1 Intro";

    EXPECT_FALSE(pattern.find(text, 2));
}

TEST(HeadingPattern, Find_FromOffsetRightAfterLineBreak)
{
    Heading_Pattern pattern = Heading_Pattern::section("1", "Intro");
    std::string text = "header\n1 Intro";

    std::optional<Heading_Match> match = pattern.find(text, 7);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->start, 7u);
}

TEST(HeadingPattern, Find_NoMatch)
{
    Heading_Pattern pattern = Heading_Pattern::section("9", "Missing");
    EXPECT_FALSE(pattern.find("1 Intro\n2 Other"));
    EXPECT_FALSE(pattern.find(""));
}

TEST(HeadingPattern, Chapter_UppercaseCyrillicMarker)
{
    Heading_Pattern pattern = Heading_Pattern::chapter("1", "Introduction");
    std::string text = "noise ГЛАВА 1 Introduction core";

    std::optional<Heading_Match> match = pattern.find(text);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->start, text.find("ГЛАВА"));
    EXPECT_EQ(text.substr(match->end), " core");
}

TEST(HeadingPattern, Chapter_UppercaseCyrillicTitle)
{
    Heading_Pattern pattern = Heading_Pattern::chapter("1", "Введение");
    std::string text = "Глава 1 ВВЕДЕНИЕ core";

    std::optional<Heading_Match> match = pattern.find(text);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->start, 0u);
    EXPECT_EQ(text.substr(match->end), " core");
}

TEST(HeadingPattern, Section_LowercaseCyrillicTitleInText)
{
    Heading_Pattern pattern = Heading_Pattern::section("2.1", "Учет Активов");
    std::string text = "intro\n2.1 учет активов\nbody";

    std::optional<Heading_Match> match = pattern.find(text);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->start, 6u);
    EXPECT_EQ(text.substr(match->end), "\nbody");
}

TEST(HeadingPattern, RelaxTitle_NoBreakSpaceIsWhitespace)
{
    EXPECT_EQ(relax_title("Общие\xC2\xA0сведения"), "Общие\\s*сведения");

    Heading_Pattern pattern = Heading_Pattern::section("1", "Общие\xC2\xA0сведения");
    EXPECT_TRUE(pattern.find("1 Общие сведения"));
}
