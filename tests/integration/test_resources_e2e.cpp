#include <gtest/gtest.h>
#include "toolwire/server.hpp"
#include "toolwire/error.hpp"
#include "support/pipe_peer.hpp"

using namespace toolwire;
using toolwire::testing::PipePeer;

namespace {

void register_resources(Server& server) {
    server.add_resource(
        ResourceDefinition{"config://app", "app-config", std::nullopt, "Application settings",
                           "application/json"},
        [](const std::string& uri, const UriVariables&, RequestContext&) {
            return std::vector<ResourceContent>{
                ResourceContent{uri, "application/json", R"({"debug":false})", std::nullopt}};
        });

    server.add_resource_template(
        ResourceTemplate{"db://{schema}/tables/{table}", "table", std::nullopt, std::nullopt,
                         "text/plain"},
        [](const std::string& uri, const UriVariables& vars, RequestContext&) {
            return std::vector<ResourceContent>{ResourceContent{
                uri, "text/plain", vars.at("schema") + "." + vars.at("table"), std::nullopt}};
        });
}

} // namespace

TEST(ResourcesE2E, ListAndTemplates) {
    Server server;
    register_resources(server);
    PipePeer peer(server);
    auto init = peer.handshake();
    EXPECT_TRUE(init["capabilities"].contains("resources"));
    EXPECT_FALSE(init["capabilities"]["resources"].contains("subscribe"));

    peer.request(1, "resources/list");
    auto list = peer.response_for(1);
    ASSERT_TRUE(list.has_value());
    ASSERT_EQ((*list)["result"]["resources"].size(), 1u);
    EXPECT_EQ((*list)["result"]["resources"][0]["uri"], "config://app");
    EXPECT_EQ((*list)["result"]["resources"][0]["mimeType"], "application/json");

    peer.request(2, "resources/templates/list");
    auto templates = peer.response_for(2);
    ASSERT_TRUE(templates.has_value());
    ASSERT_EQ((*templates)["result"]["resourceTemplates"].size(), 1u);
    EXPECT_EQ((*templates)["result"]["resourceTemplates"][0]["uriTemplate"],
              "db://{schema}/tables/{table}");
}

TEST(ResourcesE2E, ReadStaticAndTemplated) {
    Server server;
    register_resources(server);
    PipePeer peer(server);
    peer.handshake();

    peer.request(1, "resources/read", {{"uri", "config://app"}});
    auto fixed = peer.response_for(1);
    ASSERT_TRUE(fixed.has_value());
    EXPECT_EQ((*fixed)["result"]["contents"][0]["text"], R"({"debug":false})");

    peer.request(2, "resources/read", {{"uri", "db://public/tables/users"}});
    auto templated = peer.response_for(2);
    ASSERT_TRUE(templated.has_value());
    EXPECT_EQ((*templated)["result"]["contents"][0]["uri"], "db://public/tables/users");
    EXPECT_EQ((*templated)["result"]["contents"][0]["text"], "public.users");
}

TEST(ResourcesE2E, UnknownUriIsNotFound) {
    Server server;
    register_resources(server);
    PipePeer peer(server);
    peer.handshake();

    peer.request(1, "resources/read", {{"uri", "db://public/views/x/y"}});
    auto resp = peer.response_for(1);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["error"]["code"], error::ResourceNotFound);
    EXPECT_EQ((*resp)["error"]["data"]["uri"], "db://public/views/x/y");

    peer.request(2, "resources/read", nlohmann::json::object());
    auto missing = peer.response_for(2);
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ((*missing)["error"]["code"], error::InvalidParams);
}
