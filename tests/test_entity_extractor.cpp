#include <gtest/gtest.h>
#include <engram/providers/entity_extractor.hpp>
#include <algorithm>

using namespace engram;

namespace {

bool has_entity(const EntityMap& e, const std::string& category, const std::string& value) {
    EntityMap::const_iterator it = e.find(category);
    return it != e.end() && it->second.count(value) > 0;
}

bool has_keyword(const std::vector<std::string>& k, const std::string& word) {
    return std::find(k.begin(), k.end(), word) != k.end();
}

} // namespace

TEST(EntityExtractorTest, ContactEntities) {
    PatternEntityExtractor extractor;
    EntityMap e = extractor.extract_entities(
        "Mail Jane.Doe@Example.com, see https://example.com/page. or call (555) 123-4567.");

    EXPECT_TRUE(has_entity(e, entity_category::EMAIL, "jane.doe@example.com"));
    EXPECT_TRUE(has_entity(e, entity_category::URL, "https://example.com/page"));
    EXPECT_TRUE(has_entity(e, entity_category::PHONE, "5551234567"));
}

TEST(EntityExtractorTest, ClassifiesCapitalisedPhrases) {
    PatternEntityExtractor extractor;
    EntityMap e = extractor.extract_entities(
        "I work as a Software Engineer at TechCorp near Oak Street with Dr Smith");

    EXPECT_TRUE(has_entity(e, entity_category::ORGANIZATION, "TechCorp"));
    EXPECT_TRUE(has_entity(e, entity_category::LOCATION, "Oak Street"));
    EXPECT_TRUE(has_entity(e, entity_category::PERSON, "Dr Smith"));
}

TEST(EntityExtractorTest, KeywordsRankedByFrequency) {
    PatternEntityExtractor extractor;
    std::vector<std::string> k = extractor.extract_keywords(
        "I am learning AI and machine learning fundamentals");

    ASSERT_FALSE(k.empty());
    EXPECT_EQ("learning", k[0]);
    EXPECT_TRUE(has_keyword(k, "ai"));
    EXPECT_TRUE(has_keyword(k, "machine"));
    EXPECT_FALSE(has_keyword(k, "and"));
    EXPECT_FALSE(has_keyword(k, "am"));
}

TEST(EntityExtractorTest, KeywordLimit) {
    PatternEntityExtractor extractor(3);
    std::vector<std::string> k = extractor.extract_keywords(
        "alpha bravo charlie delta echo foxtrot golf hotel");
    ASSERT_EQ(3u, k.size());
    EXPECT_EQ("alpha", k[0]);
}

TEST(EntityExtractorTest, EmptyTextIsValid) {
    PatternEntityExtractor extractor;
    ExtractionResult r = extractor.extract("");
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(r.entities.empty());
    EXPECT_TRUE(r.keywords.empty());
}

TEST(EntityExtractorTest, HugeTokenDoesNotBreakExtraction) {
    PatternEntityExtractor extractor;
    std::string text = "Mail bob@example.com about Oak Street. " + std::string(200000, 'A') + " end.";
    ExtractionResult r = extractor.extract(text);

    ASSERT_TRUE(r.success) << r.error;
    EXPECT_TRUE(has_entity(r.entities, entity_category::EMAIL, "bob@example.com"));
    EXPECT_TRUE(has_entity(r.entities, entity_category::LOCATION, "Oak Street"));
}
