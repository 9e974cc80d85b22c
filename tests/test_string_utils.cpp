//
// Unit tests for string utilities
//

#include <gtest/gtest.h>
#include "string_utils.hpp"

TEST(StringUtils, TrimCopy_AsciiWhitespace)
{
    EXPECT_EQ(trim_copy("  a b \n\t"), "a b");
    EXPECT_EQ(trim_copy(" \n "), "");
}

TEST(StringUtils, TrimCopy_NoBreakSpace)
{
    EXPECT_EQ(trim_copy("\xC2\xA0 Введение\xC2\xA0"), "Введение");
}

TEST(StringUtils, IsBlank_NoBreakSpace)
{
    EXPECT_TRUE(is_blank("\xC2\xA0\n \xC2\xA0"));
    EXPECT_FALSE(is_blank("\xC2\xA0x"));
    // a lone lead byte is not whitespace
    EXPECT_FALSE(is_blank("\xC2"));
}

TEST(StringUtils, IsBlank_Range)
{
    std::string s = "ab \xC2\xA0 cd";
    EXPECT_TRUE(is_blank(s, 2, 6));
    EXPECT_FALSE(is_blank(s, 1, 6));
    EXPECT_FALSE(is_blank(s, 2, 4));  // cuts the no-break space in half
}

TEST(StringUtils, UnicodeToUTF8)
{
    EXPECT_EQ(UnicodeToUTF8('A'), "A");
    EXPECT_EQ(UnicodeToUTF8(0x0413), "Г");
    EXPECT_EQ(UnicodeToUTF8(0xA0), "\xC2\xA0");
    EXPECT_EQ(UnicodeToUTF8(0xD800), "\xEF\xBF\xBD");
}
