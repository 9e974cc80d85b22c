//
// Unit tests for the json form of a split outline
//

#include <gtest/gtest.h>
#include "outline_builder.hpp"
#include "outline_json.hpp"
#include "text_splitter.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

namespace {

PDF_Outline split_sample() {
    PDF_Outline outline = build_outline({
        {1, "Глава 2 Отчеты", 1},
        {2, "3 Third", 1},
        {3, "3.1 Sub", 1},
        {2, "1 First", 2},
    }).outline;
    split_text(outline, "Глава 2 Отчеты\nintro\n3 Third\nthird\n3.1 Sub\nsub\n1 First\nfirst");
    return outline;
}

}

TEST(OutlineJson, KeepsOutlineOrderAndShape)
{
    nlohmann::ordered_json json = outline_to_json(split_sample());

    ASSERT_TRUE(json.contains("2"));
    const nlohmann::ordered_json& chapter = json["2"];
    EXPECT_EQ(chapter["title"], "Отчеты");
    EXPECT_EQ(chapter["text"], "\nintro\n");

    std::vector<std::string> keys;
    for (auto it = chapter["sections"].begin(); it != chapter["sections"].end(); ++it) {
        keys.push_back(it.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"3", "1"}));

    EXPECT_EQ(chapter["sections"]["3"]["subsections"]["3.1"]["title"], "Sub");
    EXPECT_EQ(chapter["sections"]["3"]["subsections"]["3.1"]["text"], "\nsub\n");
    EXPECT_TRUE(chapter["sections"]["1"]["subsections"].is_object());
    EXPECT_TRUE(chapter["sections"]["1"]["subsections"].empty());
}

TEST(OutlineJson, FormatKeepsUtf8Unescaped)
{
    std::string formatted = format_outline_tree(split_sample());
    EXPECT_NE(formatted.find("\"Отчеты\""), std::string::npos);
    EXPECT_NE(formatted.find("\n    \"2\""), std::string::npos);
}

TEST(OutlineJson, EmptyOutlineIsEmptyObject)
{
    EXPECT_EQ(format_outline_tree(PDF_Outline(), -1), "{}");
}

TEST(OutlineJson, Warnings)
{
    Split_Warnings warnings = {{Split_Warning::KIND::UNMATCHED_HEADING, "1.2", "no match"}};
    nlohmann::ordered_json json = warnings_to_json(warnings);
    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0]["kind"], "unmatched heading");
    EXPECT_EQ(json[0]["number"], "1.2");
    EXPECT_EQ(json[0]["message"], "no match");
}

TEST(OutlineJson, SaveJsonWritesFile)
{
    std::string path = ::testing::TempDir() + "pdf_splitter_outline.json";
    save_json(outline_to_json(split_sample()), path);

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    nlohmann::ordered_json json = nlohmann::ordered_json::parse(content.str());
    EXPECT_EQ(json["2"]["sections"]["1"]["text"], "\nfirst");
    std::remove(path.c_str());
}

TEST(OutlineJson, SaveJsonThrowsOnBadPath)
{
    EXPECT_THROW(save_json(nlohmann::ordered_json::object(), "/nonexistent-dir/out.json"), std::runtime_error);
}
