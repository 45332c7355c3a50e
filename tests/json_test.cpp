#include "statbench/json.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using statbench::Json;
using statbench::JsonArray;
using statbench::JsonObject;

TEST(JsonTest, ParsesNestedDocument) {
    const Json doc = Json::parse(R"({"id": "q1", "score": 0.5, "tags": ["a", "b"], "ok": true, "none": null})");
    ASSERT_TRUE(doc.is_object());
    const auto& obj = doc.as_object();
    EXPECT_EQ(statbench::find_string(obj, "id").value(), "q1");
    EXPECT_DOUBLE_EQ(statbench::find_number(obj, "score").value(), 0.5);
    EXPECT_TRUE(statbench::find_bool(obj, "ok").value());
    ASSERT_NE(statbench::find_member(obj, "none"), nullptr);
    EXPECT_TRUE(statbench::find_member(obj, "none")->is_null());
    EXPECT_EQ(statbench::find_member(obj, "tags")->as_array().size(), 2u);
    EXPECT_EQ(statbench::find_member(obj, "missing"), nullptr);
}

TEST(JsonTest, LookupHelpersIgnoreWrongTypes) {
    const Json doc = Json::parse(R"({"n": "12", "s": 12})");
    EXPECT_FALSE(statbench::find_number(doc.as_object(), "n").has_value());
    EXPECT_FALSE(statbench::find_string(doc.as_object(), "s").has_value());
}

TEST(JsonTest, DumpEscapesControlCharacters) {
    const Json value(std::string("line1\nline2 \"quoted\" \\ tab\t"));
    EXPECT_EQ(value.dump(), R"("line1\nline2 \"quoted\" \\ tab\t")");
    const Json parsed = Json::parse(value.dump());
    EXPECT_EQ(parsed.as_string(), value.as_string());
}

TEST(JsonTest, DumpObjectKeepsKeyOrder) {
    JsonObject obj;
    obj["b"] = Json(2);
    obj["a"] = Json(JsonArray{Json(true), Json(nullptr)});
    EXPECT_EQ(Json(obj).dump(), R"({"a":[true,null],"b":2})");
}

TEST(JsonTest, RejectsMalformedInput) {
    EXPECT_THROW(Json::parse("{\"a\": }"), std::runtime_error);
    EXPECT_THROW(Json::parse("[1, 2"), std::runtime_error);
    EXPECT_THROW(Json::parse(""), std::runtime_error);
}

TEST(JsonTest, SurrogatePairDecodesToFourByteUtf8) {
    EXPECT_EQ(Json::parse(R"("\ud83d\ude00")").as_string(), "\xF0\x9F\x98\x80");
    EXPECT_EQ(Json::parse(R"("a\u00e9\u4e2d")").as_string(), "a\xC3\xA9\xE4\xB8\xAD");
}

TEST(JsonTest, LoneSurrogatesBecomeReplacementCharacter) {
    const std::string replacement = "\xEF\xBF\xBD";
    EXPECT_EQ(Json::parse(R"("\ud83d")").as_string(), replacement);
    EXPECT_EQ(Json::parse(R"("\ude00x")").as_string(), replacement + "x");
    EXPECT_EQ(Json::parse(R"("\ud83d\u0041")").as_string(), replacement + "A");
}

TEST(JsonTest, NumbersRoundTripExactly) {
    for (double value : {0.1, 1.0 / 3.0, 0.8499999999999999, 123456789.12345678, -2.5e-300, 64.0}) {
        const Json parsed = Json::parse(Json(value).dump());
        EXPECT_EQ(parsed.as_number(), value);
    }
    EXPECT_EQ(Json(0.1).dump(), "0.1");
    EXPECT_EQ(Json(64).dump(), "64");
}
