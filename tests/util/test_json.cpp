// ZEUS - JSON Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>

#include "zeus/util/json.h"

#include <stdexcept>

namespace zeus {
namespace util {
namespace {

class JSONTest : public ::testing::Test {};

TEST_F(JSONTest, ParseScalars) {
    EXPECT_TRUE(JSONValue::Parse("null").IsNull());
    EXPECT_TRUE(JSONValue::Parse("true").GetBool());
    EXPECT_EQ(JSONValue::Parse("-42").GetInt(), -42);
    EXPECT_DOUBLE_EQ(JSONValue::Parse("2.5e3").GetDouble(), 2500.0);
    EXPECT_EQ(JSONValue::Parse("\"a\\nb\\u0041\"").GetString(), "a\nbA");
}

TEST_F(JSONTest, IntegersStayIntegral) {
    JSONValue v = JSONValue::Parse("4294967295");
    EXPECT_TRUE(v.IsInt());
    EXPECT_EQ(v.GetInt(), 4294967295LL);
    EXPECT_DOUBLE_EQ(v.GetDouble(), 4294967295.0);
}

TEST_F(JSONTest, ParseObjectAndArray) {
    JSONValue v = JSONValue::Parse(R"({"weights": {"alice": 0.75, "bob": 0.25}, "epoch": 3, "ids": [1, 2]})");
    ASSERT_TRUE(v.IsObject());
    EXPECT_EQ(v["epoch"].GetInt(), 3);
    EXPECT_DOUBLE_EQ(v["weights"]["alice"].GetDouble(), 0.75);
    ASSERT_TRUE(v["ids"].IsArray());
    EXPECT_EQ(v["ids"].Size(), 2u);
    EXPECT_EQ(v["ids"][size_t{1}].GetInt(), 2);
}

TEST_F(JSONTest, MissingMembersReadAsNull) {
    const JSONValue v = JSONValue::Parse(R"({"a": 1})");
    EXPECT_TRUE(v["missing"].IsNull());
    EXPECT_EQ(v.Find("missing"), nullptr);
    EXPECT_NE(v.Find("a"), nullptr);
    EXPECT_FALSE(v.HasKey("b"));
}

TEST_F(JSONTest, TypeMismatchReturnsDefault) {
    JSONValue v("text");
    EXPECT_EQ(v.GetInt(7), 7);
    EXPECT_FALSE(v.GetBool(false));
    EXPECT_TRUE(JSONValue(5).GetString().empty());
}

TEST_F(JSONTest, RejectsMalformedDocuments) {
    EXPECT_FALSE(JSONValue::TryParse("").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{\"a\": }").has_value());
    EXPECT_FALSE(JSONValue::TryParse("[1, 2").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{} trailing").has_value());
    EXPECT_FALSE(JSONValue::TryParse("}{").has_value());
    EXPECT_THROW(JSONValue::Parse("{"), std::runtime_error);
}

TEST_F(JSONTest, BuildAndSerialize) {
    JSONValue v;
    v["status"] = "no_solution";
    v["challenge_id"] = "abc";
    v["nonce"] = static_cast<uint64_t>(0xdeadbeef);
    EXPECT_EQ(v.ToJSON(), R"({"challenge_id":"abc","nonce":3735928559,"status":"no_solution"})");
}

TEST_F(JSONTest, EscapesControlCharacters) {
    JSONValue v(std::string("a\"b\\c\x01"));
    EXPECT_EQ(v.ToJSON(), "\"a\\\"b\\\\c\\u0001\"");
}

TEST_F(JSONTest, RoundTripThroughText) {
    JSONValue::Array ids{JSONValue(1), JSONValue("two"), JSONValue(nullptr)};
    JSONValue v;
    v["ids"] = JSONValue(ids);
    v["ratio"] = 0.1;
    v["ok"] = true;
    
    JSONValue back = JSONValue::Parse(v.ToJSON(true));
    EXPECT_EQ(back.ToJSON(), v.ToJSON());
    EXPECT_DOUBLE_EQ(back["ratio"].GetDouble(), 0.1);
}

TEST_F(JSONTest, QuoteHelper) {
    EXPECT_EQ(JSONQuote("tab\there"), "\"tab\\there\"");
}

} // namespace
} // namespace util
} // namespace zeus
