#include <gtest/gtest.h>
#include "capwire/codec.hpp"
#include "capwire/error.hpp"

using namespace capwire;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "ping");
}

TEST(CodecParse, ValidRequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"req-7","method":"tools/list"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<std::string>(req.id), "req-7");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParse, ValidResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":42,"result":{"tools":[]}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_EQ(std::get<int64_t>(resp.id), 42);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->contains("tools"));
}

TEST(CodecParse, ErrorResponseKeepsKind) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-32602,"message":"Missing required parameter 'url'","data":{"kind":"missing_parameter"}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ(resp.error->kind(), "missing_parameter");
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "notifications/initialized");
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), FrameParseError);
}

TEST(CodecParse, MissingJsonrpc) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":"ping"})"), FrameParseError);
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), FrameParseError);
}

TEST(CodecParse, NullId) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})"), FrameParseError);
}

TEST(CodecParse, NonStringMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":5})"), FrameParseError);
}

TEST(CodecParse, ResponseWithoutResultOrError) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1})"), FrameParseError);
}

TEST(CodecParse, NeitherIdNorMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0"})"), FrameParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), FrameParseError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), FrameParseError);
}

TEST(CodecParse, ParseErrorIsMalformedCorrelationError) {
    try {
        (void)Codec::parse("nope");
        FAIL() << "expected FrameParseError";
    } catch (const CorrelationError& e) {
        EXPECT_EQ(e.kind(), CorrelationError::Kind::Malformed);
    }
}

TEST(CodecParse, NestedParams) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"fetch","arguments":{"url":"https://example.com","retries":3,"ratio":0.5,"tags":["a","b"],"dry":false,"extra":null}}})");
    auto& req = std::get<JsonRpcRequest>(msg);
    const auto& args = req.params->at("arguments");
    EXPECT_EQ(args.at("url"), "https://example.com");
    EXPECT_TRUE(args.at("retries").is_number_integer());
    EXPECT_DOUBLE_EQ(args.at("ratio").get<double>(), 0.5);
    EXPECT_EQ(args.at("tags").size(), 2u);
    EXPECT_FALSE(args.at("dry").get<bool>());
    EXPECT_TRUE(args.at("extra").is_null());
}

// ---- Serialize tests ----

TEST(CodecSerialize, RequestRoundTrip) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{9}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "echo"}, {"arguments", {{"text", "héllo\nworld"}}}};

    auto parsed = Codec::parse(Codec::serialize(req));
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(parsed));
    EXPECT_EQ(std::get<JsonRpcRequest>(parsed), req);
}

TEST(CodecSerialize, ErrorResponseRoundTrip) {
    JsonRpcResponse resp;
    resp.id = RequestId{std::string("abc")};
    resp.error = make_error(error::PermissionDenied, error_kind::PermissionDenied, "denied",
                            nlohmann::json{{"subject_id", "bob"}});

    auto parsed = Codec::parse(Codec::serialize(resp));
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(parsed));
    EXPECT_EQ(std::get<JsonRpcResponse>(parsed), resp);
}

TEST(CodecSerialize, SingleLine) {
    JsonRpcNotification notif;
    notif.method = "notifications/message";
    notif.params = nlohmann::json{{"text", "line one\nline two"}};
    auto out = Codec::serialize(notif);
    EXPECT_EQ(out.find('\n'), std::string::npos);
}

TEST(CodecSerialize, SuccessWithoutResultStillHasResult) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{1}};
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_TRUE(j.contains("result"));
    EXPECT_FALSE(j.contains("error"));
}

// ---- Id recovery ----

TEST(CodecRecoverId, FromMalformedRequest) {
    auto id = Codec::recover_id(R"({"jsonrpc":"1.0","id":17,"method":"ping"})");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(std::get<int64_t>(*id), 17);
}

TEST(CodecRecoverId, StringId) {
    auto id = Codec::recover_id(R"({"id":"x-1","method":"ping"})");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(std::get<std::string>(*id), "x-1");
}

TEST(CodecRecoverId, NothingToRecover) {
    EXPECT_FALSE(Codec::recover_id("{broken").has_value());
    EXPECT_FALSE(Codec::recover_id(R"({"id":3})").has_value());
    EXPECT_FALSE(Codec::recover_id(R"({"id":null,"method":"ping"})").has_value());
}

TEST(CodecParse, LargeMessage) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < 200; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Description for tool " + std::to_string(i)},
            {"inputSchema", {{"type", "object"}, {"properties", nlohmann::json::object()}}}
        });
    }
    nlohmann::json response = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}}}};
    auto msg = Codec::parse(response.dump());
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    EXPECT_EQ(std::get<JsonRpcResponse>(msg).result->at("tools").size(), 200u);
}
