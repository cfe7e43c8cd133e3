#include <gtest/gtest.h>
#include <engram/memory/chunker.hpp>

using namespace engram;

namespace {

TextChunker make_chunker(int max_chars) {
    ChunkingConfig c;
    c.max_chars = max_chars;
    return TextChunker(c);
}

} // namespace

TEST(ChunkerTest, EmptyTextHasNoChunks) {
    EXPECT_TRUE(make_chunker(500).chunk("").empty());
    EXPECT_TRUE(make_chunker(500).chunk("  \n\n \t ").empty());
}

TEST(ChunkerTest, ShortTextIsOneChunk) {
    std::vector<std::string> chunks = make_chunker(500).chunk("  I work as a Software Engineer at TechCorp  ");
    ASSERT_EQ(1u, chunks.size());
    EXPECT_EQ("I work as a Software Engineer at TechCorp", chunks[0]);
}

TEST(ChunkerTest, SplitsSentences) {
    std::vector<std::string> s = TextChunker::split_sentences("First one. Second one! Third? v1.2 stays whole.");
    ASSERT_EQ(4u, s.size());
    EXPECT_EQ("First one.", s[0]);
    EXPECT_EQ("Second one!", s[1]);
    EXPECT_EQ("Third?", s[2]);
    EXPECT_EQ("v1.2 stays whole.", s[3]);
}

TEST(ChunkerTest, SplitsParagraphsOnBlankLines) {
    std::vector<std::string> p = TextChunker::split_paragraphs("one\nwrapped line\r\n\r\n  \ntwo");
    ASSERT_EQ(2u, p.size());
    EXPECT_EQ("one wrapped line", p[0]);
    EXPECT_EQ("two", p[1]);
}

TEST(ChunkerTest, PacksSentencesUpToLimit) {
    // Each sentence is 19 characters
    std::string text = "Alpha beta gamma 1. Alpha beta gamma 2. Alpha beta gamma 3.";
    std::vector<std::string> chunks = make_chunker(40).chunk(text);
    ASSERT_EQ(2u, chunks.size());
    EXPECT_EQ("Alpha beta gamma 1. Alpha beta gamma 2.", chunks[0]);
    EXPECT_EQ("Alpha beta gamma 3.", chunks[1]);
}

TEST(ChunkerTest, KeepsParagraphBreakInsideChunk) {
    std::vector<std::string> chunks = make_chunker(500).chunk("First paragraph.\n\nSecond paragraph.");
    ASSERT_EQ(1u, chunks.size());
    EXPECT_EQ("First paragraph.\n\nSecond paragraph.", chunks[0]);
}

TEST(ChunkerTest, LongSentenceSplitsOnWhitespace) {
    std::string sentence;
    for (int i = 0; i < 30; ++i) {
        sentence += "word" + std::to_string(i) + " ";
    }
    std::vector<std::string> chunks = make_chunker(50).chunk(sentence);
    ASSERT_GT(chunks.size(), 1u);

    std::string rejoined;
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_LE(chunks[i].size(), 50u);
        EXPECT_NE(' ', chunks[i][0]);
        if (!rejoined.empty()) rejoined += " ";
        rejoined += chunks[i];
    }
    EXPECT_EQ(sentence.substr(0, sentence.size() - 1), rejoined);
}

TEST(ChunkerTest, OverlongWordIsCutAtLimit) {
    std::string word(80, 'x');
    std::vector<std::string> chunks = make_chunker(30).chunk("short " + word + " tail");
    ASSERT_EQ(4u, chunks.size());
    EXPECT_EQ("short", chunks[0]);
    EXPECT_EQ(std::string(30, 'x'), chunks[1]);
    EXPECT_EQ(std::string(30, 'x'), chunks[2]);
    EXPECT_EQ(std::string(20, 'x') + " tail", chunks[3]);
}

TEST(ChunkerTest, HugeTokenNeverExceedsLimit) {
    std::string text = "Note: " + std::string(200000, 'A') + " end.";
    std::vector<std::string> chunks = make_chunker(500).chunk(text);
    ASSERT_GT(chunks.size(), 400u);

    size_t total = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_LE(chunks[i].size(), 500u);
        total += chunks[i].size();
    }
    EXPECT_GE(total, 200000u);
}
