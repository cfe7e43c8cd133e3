#include <gtest/gtest.h>
#include <engram/core/json.hpp>
#include <stdexcept>

using engram::Json;

TEST(JsonTest, ParsesNestedDocument) {
    Json j = Json::parse("{\"name\":\"engram\",\"search\":{\"half_life_days\":90,\"weights\":[0.7,0.3]},\"on\":true}");
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ("engram", j["name"].as_string());
    EXPECT_EQ(90, j["search"]["half_life_days"].as_int());
    ASSERT_EQ(2u, j["search"]["weights"].size());
    EXPECT_DOUBLE_EQ(0.3, j["search"]["weights"][1].as_number());
    EXPECT_TRUE(j["on"].as_bool());
}

TEST(JsonTest, MissingKeysYieldNull) {
    Json j = Json::parse("{\"a\":1}");
    EXPECT_TRUE(j["missing"].is_null());
    EXPECT_TRUE(j["missing"]["deeper"].is_null());
    EXPECT_TRUE(j["a"][3].is_null());
    EXPECT_EQ("fallback", j.get_string("missing", "fallback"));
}

TEST(JsonTest, FindPathWalksDottedKeys) {
    Json j = Json::parse("{\"tiering\":{\"hot_age_days\":30}}");
    const Json* node = j.find_path("tiering.hot_age_days");
    ASSERT_TRUE(node != NULL);
    EXPECT_EQ(30, node->as_int());
    EXPECT_TRUE(j.find_path("tiering.enabled") == NULL);
    EXPECT_TRUE(j.find_path("tiering.hot_age_days.x") == NULL);
}

TEST(JsonTest, DecodesEscapesAndSurrogatePairs) {
    Json j = Json::parse("\"line\\nbreak \\\"quoted\\\" \\u00e9 \\ud83d\\ude00\"");
    EXPECT_EQ("line\nbreak \"quoted\" \xC3\xA9 \xF0\x9F\x98\x80", j.as_string());
}

TEST(JsonTest, RejectsMalformedInput) {
    EXPECT_THROW(Json::parse("{\"a\":}"), std::runtime_error);
    EXPECT_THROW(Json::parse("[1,2"), std::runtime_error);
    EXPECT_THROW(Json::parse("{\"a\":1} trailing"), std::runtime_error);
    EXPECT_THROW(Json::parse(""), std::runtime_error);
}

TEST(JsonTest, DumpIsParseable) {
    Json j = Json::object();
    j.set("id", "m-1");
    j.set("count", static_cast<int64_t>(3));
    j.set("score", 0.25);
    j.set("tags", Json::from_strings(std::vector<std::string>(2, "x")));

    Json back = Json::parse(j.dump());
    EXPECT_EQ("m-1", back["id"].as_string());
    EXPECT_EQ(3, back["count"].as_int());
    EXPECT_DOUBLE_EQ(0.25, back["score"].as_number());
    EXPECT_EQ(2u, back["tags"].to_strings().size());

    Json pretty = Json::parse(j.dump(2));
    EXPECT_EQ("m-1", pretty["id"].as_string());
}

TEST(JsonTest, IntegralNumbersDumpWithoutFraction) {
    EXPECT_EQ("42", Json(42).dump());
    EXPECT_EQ("null", Json().dump());
    EXPECT_EQ("[]", Json::array().dump());
}
