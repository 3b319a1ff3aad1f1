#include <gtest/gtest.h>
#include "capwire/json_rpc.hpp"
#include "capwire/error.hpp"

using namespace capwire;

TEST(JsonRpc, RequestIdToString) {
    EXPECT_EQ(to_string(RequestId{int64_t{12}}), "12");
    EXPECT_EQ(to_string(RequestId{std::string("12")}), "\"12\"");
}

TEST(JsonRpc, RequestIdFromJson) {
    RequestId id;
    from_json(nlohmann::json(5), id);
    EXPECT_EQ(std::get<int64_t>(id), 5);
    from_json(nlohmann::json("five"), id);
    EXPECT_EQ(std::get<std::string>(id), "five");
    EXPECT_THROW(from_json(nlohmann::json(true), id), std::invalid_argument);
}

TEST(JsonRpc, RequestToJson) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{3}};
    req.method = "prompts/get";
    req.params = nlohmann::json{{"name", "summary"}};

    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j.at("jsonrpc"), "2.0");
    EXPECT_EQ(j.at("id"), 3);
    EXPECT_EQ(j.at("method"), "prompts/get");
    EXPECT_EQ(j.at("params").at("name"), "summary");
}

TEST(JsonRpc, RequestWithoutParamsOmitsField) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "ping";
    nlohmann::json j;
    to_json(j, req);
    EXPECT_FALSE(j.contains("params"));
}

TEST(JsonRpc, ErrorResponseOmitsResult) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{1}};
    resp.result = nlohmann::json::object();
    resp.error = JsonRpcError{error::InternalError, "boom", std::nullopt};

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_TRUE(j.contains("error"));
    EXPECT_FALSE(j.contains("result"));
    EXPECT_FALSE(j.at("error").contains("data"));
}

TEST(JsonRpc, MakeErrorCarriesKind) {
    auto e = make_error(error::MethodNotFound, error_kind::MethodNotFound, "Unknown tool: nope");
    EXPECT_EQ(e.code, -32601);
    EXPECT_EQ(e.message, "Unknown tool: nope");
    EXPECT_EQ(e.kind(), "method_not_found");
}

TEST(JsonRpc, MakeErrorMergesExtraData) {
    auto e = make_error(error::RateLimited, error_kind::RateLimited, "slow down",
                        nlohmann::json{{"limit", 10}, {"kind", "ignored"}});
    ASSERT_TRUE(e.data.has_value());
    EXPECT_EQ(e.data->at("limit"), 10);
    EXPECT_EQ(e.kind(), "rate_limited");
}

TEST(JsonRpc, KindOfErrorWithoutData) {
    JsonRpcError e{error::InternalError, "x", std::nullopt};
    EXPECT_EQ(e.kind(), "");
    e.data = nlohmann::json("not an object");
    EXPECT_EQ(e.kind(), "");
}

TEST(JsonRpc, NotificationFromJson) {
    auto j = nlohmann::json::parse(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":4}})");
    JsonRpcNotification n;
    from_json(j, n);
    EXPECT_EQ(n.method, "notifications/cancelled");
    EXPECT_EQ(n.params->at("requestId"), 4);
}

TEST(JsonRpc, MessageVariantToJson) {
    JsonRpcMessage msg = JsonRpcNotification{"notifications/initialized", std::nullopt};
    nlohmann::json j;
    to_json(j, msg);
    EXPECT_EQ(j.at("method"), "notifications/initialized");
    EXPECT_FALSE(j.contains("id"));
}
