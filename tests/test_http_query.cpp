//
// Unit tests for http query decoding
//

#include <gtest/gtest.h>
#include "http_server.hpp"

TEST(HttpQuery, UrlDecode)
{
    std::string out;
    EXPECT_TRUE(url_decode("%2Fdata%2Fbook.pdf", out));
    EXPECT_EQ(out, "/data/book.pdf");
    EXPECT_TRUE(url_decode("my+book.pdf", out));
    EXPECT_EQ(out, "my book.pdf");
}

TEST(HttpQuery, UrlDecodeRejectsTruncatedEscape)
{
    std::string out;
    EXPECT_FALSE(url_decode("book%2", out));
    EXPECT_FALSE(url_decode("book%zz", out));
    EXPECT_FALSE(url_decode("book%4z", out));
    EXPECT_FALSE(url_decode("book% 4", out));
    EXPECT_FALSE(url_decode("book%-1", out));
}

TEST(HttpQuery, ParseQuery)
{
    std::map<std::string, std::string> params = parse_query("/?path=%2Ftmp%2Fa.pdf&start=13&warnings=1");
    EXPECT_EQ(params.size(), 3u);
    EXPECT_EQ(params["path"], "%2Ftmp%2Fa.pdf");
    EXPECT_EQ(params["start"], "13");
    EXPECT_EQ(params["warnings"], "1");
}

TEST(HttpQuery, ParseQueryWithoutParameters)
{
    EXPECT_TRUE(parse_query("/").empty());
}
