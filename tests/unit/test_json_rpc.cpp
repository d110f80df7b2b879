#include <gtest/gtest.h>
#include "toolwire/json_rpc.hpp"
#include <nlohmann/json.hpp>

using namespace toolwire;

TEST(JsonRpcRequest, ConstructAndSerialize) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/list";
    req.params = nlohmann::json{{"cursor", "abc"}};

    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "tools/list");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["params"]["cursor"], "abc");
}

TEST(JsonRpcRequest, StringId) {
    JsonRpcRequest req;
    req.id = RequestId{std::string{"my-id"}};
    req.method = "ping";

    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["id"], "my-id");
    EXPECT_FALSE(j.contains("params"));
}

TEST(JsonRpcResponse, Success) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{42}}, nlohmann::json{{"ok", true}});

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 42);
    EXPECT_EQ(j["result"]["ok"], true);
    EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpcResponse, Failure) {
    auto resp = JsonRpcResponse::failure(RequestId{int64_t{1}},
                                         JsonRpcError{-32601, "Method not found", std::nullopt});
    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_EQ(j["error"]["message"], "Method not found");
    EXPECT_FALSE(j["error"].contains("data"));
    EXPECT_FALSE(j.contains("result"));
}

TEST(JsonRpcResponse, FailureWithoutIdSerializesNull) {
    auto resp = JsonRpcResponse::failure(std::nullopt,
                                         JsonRpcError{-32700, "Parse error", nlohmann::json{{"at", 3}}});
    nlohmann::json j;
    to_json(j, resp);
    ASSERT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["data"]["at"], 3);
}

TEST(JsonRpcResponse, EmptyResultSerializesObject) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{9}};
    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["result"], nlohmann::json::object());
}

TEST(JsonRpcNotification, Serialize) {
    JsonRpcNotification notif;
    notif.method = "notifications/progress";
    notif.params = nlohmann::json{{"progress", 1}};

    nlohmann::json j;
    to_json(j, notif);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "notifications/progress");
    EXPECT_FALSE(j.contains("id"));
}

TEST(JsonRpcMessage, VariantSerializesActiveMember) {
    JsonRpcMessage msg = JsonRpcNotification{"exit", std::nullopt};
    nlohmann::json j;
    to_json(j, msg);
    EXPECT_EQ(j["method"], "exit");
}

TEST(RequestId, IntAndStringToJson) {
    nlohmann::json a;
    to_json(a, RequestId{int64_t{123}});
    EXPECT_EQ(a, 123);

    nlohmann::json b;
    to_json(b, RequestId{std::string{"hello"}});
    EXPECT_EQ(b, "hello");
}

TEST(RequestId, FromJson) {
    RequestId id;
    from_json(nlohmann::json(42), id);
    ASSERT_TRUE(std::holds_alternative<int64_t>(id));
    EXPECT_EQ(std::get<int64_t>(id), 42);

    from_json(nlohmann::json("my-request"), id);
    ASSERT_TRUE(std::holds_alternative<std::string>(id));
    EXPECT_EQ(std::get<std::string>(id), "my-request");
}

TEST(RequestId, FromJsonRejectsNullAndFloat) {
    RequestId id;
    EXPECT_THROW(from_json(nlohmann::json(nullptr), id), std::invalid_argument);
    EXPECT_THROW(from_json(nlohmann::json(1.5), id), std::invalid_argument);
}

TEST(RequestId, FromJsonRejectsUnsignedBeyondInt64) {
    RequestId id;
    EXPECT_THROW(from_json(nlohmann::json(uint64_t{18446744073709551615ULL}), id), std::out_of_range);
    from_json(nlohmann::json(uint64_t{9223372036854775807ULL}), id);
    EXPECT_EQ(std::get<int64_t>(id), INT64_MAX);
}

TEST(RequestId, ToStringDistinguishesKinds) {
    EXPECT_EQ(to_string(RequestId{int64_t{7}}), "7");
    EXPECT_EQ(to_string(RequestId{std::string{"7"}}), "\"7\"");
}

TEST(JsonRpcError, Equality) {
    JsonRpcError e1{-32601, "Not found", std::nullopt};
    JsonRpcError e2{-32601, "Not found", std::nullopt};
    JsonRpcError e3{-32600, "Invalid", std::nullopt};
    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}
