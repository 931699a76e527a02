// CHAINSYNC - Node RPC Framing Tests
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <gtest/gtest.h>

#include "chainsync/rpc/protocol.h"
#include "chainsync/util/time.h"

#include <cctype>
#include <set>

namespace chainsync {
namespace rpc {
namespace test {

// ============================================================================
// Outbound Tests
// ============================================================================

TEST(ProtocolTest, RequestIdFormat) {
    util::EnableMockTime();
    util::SetMockTime(1700000000123);

    std::string id = GenerateRequestId();
    util::DisableMockTime();

    ASSERT_EQ(id.size(), std::string("1700000000123-").size() + 8);
    EXPECT_EQ(id.substr(0, 14), "1700000000123-");
    for (char c : id.substr(14)) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << id;
    }
}

TEST(ProtocolTest, RequestIdsDiffer) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(GenerateRequestId());
    }
    EXPECT_GT(ids.size(), 95u);
}

TEST(ProtocolTest, RequestPayload) {
    JSONValue params;
    params.Push("abcd");
    params.Push(true);

    auto payload = JSONValue::Parse(BuildRequestPayload("getrawtransaction", params, "9-00"));
    EXPECT_EQ(payload["jsonrpc"].GetString(), "1.0");
    EXPECT_EQ(payload["id"].GetString(), "9-00");
    EXPECT_EQ(payload["method"].GetString(), "getrawtransaction");
    ASSERT_EQ(payload["params"].Size(), 2u);
    EXPECT_TRUE(payload["params"][1].GetBool());
}

TEST(ProtocolTest, NonArrayParamsBecomeEmptyArray) {
    auto payload = JSONValue::Parse(BuildRequestPayload("getblockcount", JSONValue(), "1"));
    EXPECT_TRUE(payload["params"].IsArray());
    EXPECT_EQ(payload["params"].Size(), 0u);
}

TEST(ProtocolTest, Base64) {
    EXPECT_EQ(Base64Encode(""), "");
    EXPECT_EQ(Base64Encode("f"), "Zg==");
    EXPECT_EQ(Base64Encode("fo"), "Zm8=");
    EXPECT_EQ(Base64Encode("foo"), "Zm9v");
    EXPECT_EQ(Base64Encode("user:pass"), "dXNlcjpwYXNz");
}

TEST(ProtocolTest, HttpRequest) {
    HttpCredentials creds{"127.0.0.1", 18443, "user", "pass"};
    std::string body = R"({"method":"ping"})";
    std::string req = BuildHttpRequest(creds, body);

    EXPECT_EQ(req.compare(0, 16, "POST / HTTP/1.1\r"), 0);
    EXPECT_NE(req.find("Host: 127.0.0.1:18443\r\n"), std::string::npos);
    EXPECT_NE(req.find("Authorization: Basic dXNlcjpwYXNz\r\n"), std::string::npos);
    EXPECT_NE(req.find("Content-Length: " + std::to_string(body.size()) + "\r\n"),
              std::string::npos);
    EXPECT_NE(req.find("Connection: keep-alive\r\n"), std::string::npos);
    EXPECT_EQ(req.substr(req.size() - body.size()), body);
}

TEST(ProtocolTest, SubscriptionMethods) {
    EXPECT_TRUE(IsSubscriptionMethod("blockchain.scripthash.subscribe"));
    EXPECT_FALSE(IsSubscriptionMethod("subscribe"));
    EXPECT_FALSE(IsSubscriptionMethod("getblock"));
}

// ============================================================================
// Inbound Framing Tests
// ============================================================================

class ResponseStreamTest : public ::testing::Test {
protected:
    static std::string Response(const std::string& body, int status = 200) {
        return "HTTP/1.1 " + std::to_string(status) + " OK\r\n"
               "Content-Type: application/json\r\n"
               "Content-Length: " + std::to_string(body.size()) + "\r\n"
               "\r\n" + body;
    }

    ResponseStream stream_;
};

TEST_F(ResponseStreamTest, SingleResponse) {
    auto lines = stream_.Feed(Response("{\"id\":\"1\"}\n"));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(lines[0].isStatus);
    EXPECT_EQ(lines[0].statusCode, 200);
    EXPECT_FALSE(lines[1].isStatus);
    EXPECT_EQ(lines[1].text, "{\"id\":\"1\"}");
    EXPECT_EQ(stream_.Buffered(), 0u);
}

TEST_F(ResponseStreamTest, SplitAcrossReads) {
    std::string raw = Response("{\"id\":\"2\",\"result\":5}\n");
    std::vector<InboundLine> all;
    for (size_t i = 0; i < raw.size(); i += 7) {
        auto lines = stream_.Feed(raw.substr(i, 7));
        all.insert(all.end(), lines.begin(), lines.end());
    }
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1].text, "{\"id\":\"2\",\"result\":5}");
}

TEST_F(ResponseStreamTest, MergedResponses) {
    auto lines = stream_.Feed(Response("{\"id\":\"a\"}\n") + Response("{\"id\":\"b\"}\n"));
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[1].text, "{\"id\":\"a\"}");
    EXPECT_TRUE(lines[2].isStatus);
    EXPECT_EQ(lines[3].text, "{\"id\":\"b\"}");
}

TEST_F(ResponseStreamTest, BodyWithSeveralLines) {
    auto lines = stream_.Feed(Response("{\"id\":\"x\"}\r\n\n{\"id\":\"y\"}\n"));
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1].text, "{\"id\":\"x\"}");
    EXPECT_EQ(lines[2].text, "{\"id\":\"y\"}");
}

TEST_F(ResponseStreamTest, BodyWithoutTrailingNewline) {
    auto lines = stream_.Feed(Response("{\"id\":\"z\"}"));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1].text, "{\"id\":\"z\"}");
}

TEST_F(ResponseStreamTest, ErrorStatusSurfaced) {
    auto lines = stream_.Feed(Response("{\"error\":{}}\n", 401));
    ASSERT_FALSE(lines.empty());
    EXPECT_TRUE(lines[0].isStatus);
    EXPECT_EQ(lines[0].statusCode, 401);
}

TEST_F(ResponseStreamTest, BareLinesPassThrough) {
    auto lines = stream_.Feed("{\"id\":\"p\"}\n\n{\"id\":\"q\"}\n{\"partial");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1].text, "{\"id\":\"q\"}");
    EXPECT_EQ(stream_.Buffered(), std::string("{\"partial").size());
}

TEST_F(ResponseStreamTest, ResetDropsPartialState) {
    std::string raw = Response("{\"id\":\"r\"}\n");
    stream_.Feed(raw.substr(0, raw.size() - 4));
    stream_.Reset();
    EXPECT_EQ(stream_.Buffered(), 0u);

    auto lines = stream_.Feed("{\"id\":\"s\"}\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "{\"id\":\"s\"}");
}

} // namespace test
} // namespace rpc
} // namespace chainsync
