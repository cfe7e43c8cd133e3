#include <gtest/gtest.h>
#include <engram/memory/text_analysis.hpp>

using namespace engram;

TEST(TextAnalysisTest, TokenizeKeepsOffsetsAndLowercase) {
    std::vector<Token> t = tokenize("Don't stop, TechCorp!");
    ASSERT_EQ(3u, t.size());
    EXPECT_EQ("Dont", t[0].text);
    EXPECT_EQ("stop", t[1].lower);
    EXPECT_EQ("techcorp", t[2].lower);
    EXPECT_EQ(12u, t[2].offset);
}

TEST(TextAnalysisTest, StopWords) {
    EXPECT_TRUE(is_stop_word("the"));
    EXPECT_TRUE(is_stop_word("my"));
    EXPECT_FALSE(is_stop_word("engineer"));
    EXPECT_FALSE(is_stop_word("now"));
}

TEST(TextAnalysisTest, ExtractNumbers) {
    std::set<std::string> n = extract_numbers("I completed 3 courses, scored 2.50 and own an mp3 player and a 3d printer");
    EXPECT_EQ(2u, n.size());
    EXPECT_TRUE(n.count("3"));
    EXPECT_TRUE(n.count("2.5"));
    EXPECT_TRUE(extract_numbers("no digits here").empty());
}

TEST(TextAnalysisTest, ContainsPhraseMatchesWholeWords) {
    EXPECT_TRUE(contains_phrase("I now work at TechCorp", "now"));
    EXPECT_TRUE(contains_phrase("I NO LONGER work there", "no longer"));
    EXPECT_FALSE(contains_phrase("I know the answer", "now"));
    EXPECT_FALSE(contains_phrase("snowfall", "now"));
    EXPECT_FALSE(contains_phrase("no way longer", "no longer"));
}

TEST(TextAnalysisTest, JaccardIgnoresCase) {
    std::vector<std::string> a;
    a.push_back("AI");
    a.push_back("learning");
    std::vector<std::string> b;
    b.push_back("ai");
    b.push_back("model");
    b.push_back("courses");

    EXPECT_DOUBLE_EQ(0.25, jaccard(a, b));
    EXPECT_DOUBLE_EQ(0.0, jaccard(std::vector<std::string>(), std::vector<std::string>()));

    std::vector<std::string> common = intersection(a, b);
    ASSERT_EQ(1u, common.size());
    EXPECT_EQ("ai", common[0]);
}
