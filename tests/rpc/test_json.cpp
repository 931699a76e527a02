// CHAINSYNC - JSON Value Tests
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <gtest/gtest.h>

#include "chainsync/core/errors.h"
#include "chainsync/rpc/json.h"

namespace chainsync {
namespace rpc {
namespace test {

// ============================================================================
// Construction and Access
// ============================================================================

TEST(JSONValueTest, Types) {
    EXPECT_TRUE(JSONValue().IsNull());
    EXPECT_TRUE(JSONValue(true).IsBool());
    EXPECT_TRUE(JSONValue(42).IsInt());
    EXPECT_TRUE(JSONValue(int64_t(1) << 40).IsInt());
    EXPECT_TRUE(JSONValue(1.5).IsDouble());
    EXPECT_TRUE(JSONValue("txid").IsString());
    EXPECT_TRUE(JSONValue(JSONValue::Array{}).IsArray());
    EXPECT_TRUE(JSONValue(JSONValue::Object{}).IsObject());
}

TEST(JSONValueTest, NumericGettersConvert) {
    EXPECT_EQ(JSONValue(2.9).GetInt(), 2);
    EXPECT_DOUBLE_EQ(JSONValue(7).GetDouble(), 7.0);
    EXPECT_EQ(JSONValue("x").GetInt(-1), -1);
    EXPECT_EQ(JSONValue(5).GetString("dflt"), "dflt");
}

TEST(JSONValueTest, ObjectAccess) {
    JSONValue v;
    v["confirmations"] = 3;
    v["hex"] = "00ff";

    EXPECT_TRUE(v.IsObject());
    EXPECT_TRUE(v.HasKey("hex"));
    EXPECT_EQ(v["confirmations"].GetInt(), 3);
    EXPECT_EQ(v.Size(), 2u);

    const JSONValue& cv = v;
    EXPECT_TRUE(cv["missing"].IsNull());
    EXPECT_TRUE(cv["hex"]["nested"].IsNull());

    EXPECT_TRUE(v.Erase("hex"));
    EXPECT_FALSE(v.Erase("hex"));
}

TEST(JSONValueTest, ArrayAccess) {
    JSONValue arr;
    arr.Push("a");
    arr.Push(JSONValue(2));
    EXPECT_TRUE(arr.IsArray());
    EXPECT_EQ(arr.Size(), 2u);

    const JSONValue& carr = arr;
    EXPECT_EQ(carr[0].GetString(), "a");
    EXPECT_TRUE(carr[5].IsNull());
    EXPECT_TRUE(JSONValue(3).GetArray().empty());
}

TEST(JSONValueTest, EqualityKeepsIntAndDoubleApart) {
    EXPECT_EQ(JSONValue(1), JSONValue(int64_t(1)));
    EXPECT_NE(JSONValue(1), JSONValue(1.0));
    EXPECT_EQ(JSONValue::Parse(R"({"a":[1,2]})"), JSONValue::Parse(R"({ "a" : [ 1, 2 ] })"));
}

// ============================================================================
// Serialization
// ============================================================================

TEST(JSONValueTest, ToJSONCompact) {
    JSONValue v;
    v["result"] = JSONValue();
    v["error"] = JSONValue();
    v["id"] = "1-ab";
    EXPECT_EQ(v.ToJSON(), R"({"error":null,"id":"1-ab","result":null})");
}

TEST(JSONValueTest, ToJSONEscapes) {
    JSONValue v(std::string("quote\" slash\\ nl\n ctl\x01"));
    EXPECT_EQ(v.ToJSON(), R"("quote\" slash\\ nl\n ctl\u0001")");
}

TEST(JSONValueTest, PrettyPrintParsesBack) {
    JSONValue v = JSONValue::Parse(R"({"vout":[{"n":0,"value":0.5}],"size":110})");
    std::string pretty = v.ToJSON(true);
    EXPECT_NE(pretty.find('\n'), std::string::npos);
    EXPECT_EQ(JSONValue::Parse(pretty), v);
}

// ============================================================================
// Parsing
// ============================================================================

TEST(JSONValueTest, ParseNodeReply) {
    auto v = JSONValue::Parse(
        R"({"result":{"confirmations":2,"value":1.25,"hex":"0200"},"error":null,"id":"7"})");
    EXPECT_TRUE(v["error"].IsNull());
    EXPECT_EQ(v["id"].GetString(), "7");
    EXPECT_TRUE(v["result"]["confirmations"].IsInt());
    EXPECT_TRUE(v["result"]["value"].IsDouble());
    EXPECT_DOUBLE_EQ(v["result"]["value"].GetDouble(), 1.25);
}

TEST(JSONValueTest, ParseNumbers) {
    EXPECT_EQ(JSONValue::Parse("-17").GetInt(), -17);
    EXPECT_TRUE(JSONValue::Parse("1e3").IsDouble());
    EXPECT_DOUBLE_EQ(JSONValue::Parse("2.5E-1").GetDouble(), 0.25);
    // Beyond int64 degrades to double
    EXPECT_TRUE(JSONValue::Parse("99999999999999999999").IsDouble());
}

TEST(JSONValueTest, ParseEscapes) {
    auto v = JSONValue::Parse(R"("a\tbA\/")");
    EXPECT_EQ(v.GetString(), "a\tbA/");
}

TEST(JSONValueTest, ParseRejectsMalformed) {
    EXPECT_FALSE(JSONValue::TryParse("").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{").has_value());
    EXPECT_FALSE(JSONValue::TryParse(R"({"a":1,})").has_value());
    EXPECT_FALSE(JSONValue::TryParse("[1 2]").has_value());
    EXPECT_FALSE(JSONValue::TryParse("nul").has_value());
    EXPECT_FALSE(JSONValue::TryParse(R"("\x")").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{} extra").has_value());
    EXPECT_THROW(JSONValue::Parse("not json"), ProtocolError);
}

} // namespace test
} // namespace rpc
} // namespace chainsync
