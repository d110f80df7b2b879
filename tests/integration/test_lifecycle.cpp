#include <gtest/gtest.h>
#include "toolwire/server.hpp"
#include "toolwire/error.hpp"
#include "support/pipe_peer.hpp"

using namespace toolwire;
using toolwire::testing::PipePeer;

namespace {

Server::Options lifecycle_options() {
    Server::Options opts;
    opts.server_info = {"lifecycle-server", std::nullopt, "1.0"};
    opts.instructions = "Call echo.";
    return opts;
}

void add_echo(Server& server) {
    ToolDefinition td;
    td.name = "echo";
    server.add_tool(td, [](const nlohmann::json& args, RequestContext&) {
        return CallToolResult::text(args.dump());
    });
}

} // namespace

TEST(Lifecycle, FullHandshake) {
    Server server{lifecycle_options()};
    add_echo(server);
    PipePeer peer(server);

    auto result = peer.handshake({{"roots", {{"listChanged", true}}}, {"futureThing", true}});
    EXPECT_EQ(result["protocolVersion"], "2025-06-18");
    EXPECT_EQ(result["serverInfo"]["name"], "lifecycle-server");
    EXPECT_EQ(result["instructions"], "Call echo.");
    EXPECT_TRUE(result["capabilities"].contains("tools"));
    EXPECT_TRUE(result["capabilities"].contains("logging"));
    EXPECT_FALSE(result["capabilities"].contains("resources"));
    EXPECT_EQ(server.state(), SessionState::Ready);

    peer.request(1, "ping");
    auto pong = peer.response_for(1);
    ASSERT_TRUE(pong.has_value());
    EXPECT_EQ((*pong)["result"], nlohmann::json::object());

    peer.close_input();
    EXPECT_EQ(peer.exit_status(), 0);
    EXPECT_EQ(server.state(), SessionState::Closed);
}

TEST(Lifecycle, RequestsBeforeInitializeAreRejected) {
    Server server{lifecycle_options()};
    add_echo(server);
    PipePeer peer(server);

    peer.request(1, "tools/list");
    auto resp = peer.response_for(1);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["error"]["code"], error::ServerNotInitialized);
    EXPECT_EQ(server.state(), SessionState::Uninitialized);

    // initialize still works afterwards
    peer.request(2, "initialize", {{"protocolVersion", "2025-06-18"}, {"capabilities", nlohmann::json::object()}});
    auto init = peer.response_for(2);
    ASSERT_TRUE(init.has_value());
    EXPECT_TRUE(init->contains("result"));
    EXPECT_EQ(server.state(), SessionState::Negotiating);

    // Still not Ready until the initialized notification.
    peer.request(3, "ping");
    auto early = peer.response_for(3);
    ASSERT_TRUE(early.has_value());
    EXPECT_EQ((*early)["error"]["code"], error::ServerNotInitialized);

    peer.notify("notifications/initialized");
    peer.request(4, "ping");
    auto ok = peer.response_for(4);
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE(ok->contains("result"));
}

TEST(Lifecycle, LegacyInitializedNotification) {
    Server server{lifecycle_options()};
    PipePeer peer(server);

    peer.request(1, "initialize", {{"protocolVersion", "2024-11-05"}});
    auto init = peer.response_for(1);
    ASSERT_TRUE(init.has_value());
    EXPECT_EQ((*init)["result"]["protocolVersion"], "2024-11-05");

    peer.notify("initialized");
    peer.request(2, "ping");
    auto pong = peer.response_for(2);
    ASSERT_TRUE(pong.has_value());
    EXPECT_TRUE(pong->contains("result"));
}

TEST(Lifecycle, SecondInitializeIsInvalid) {
    Server server{lifecycle_options()};
    PipePeer peer(server);
    peer.handshake();

    peer.request(1, "initialize", {{"protocolVersion", "2025-06-18"}});
    auto resp = peer.response_for(1);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["error"]["code"], error::InvalidRequest);
    EXPECT_EQ(server.state(), SessionState::Ready);
}

TEST(Lifecycle, BadInitializeParams) {
    Server server{lifecycle_options()};
    PipePeer peer(server);

    peer.request(1, "initialize", {{"capabilities", nlohmann::json::object()}});
    auto resp = peer.response_for(1);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["error"]["code"], error::InvalidParams);
    EXPECT_EQ(server.state(), SessionState::Uninitialized);
}

TEST(Lifecycle, MalformedMessagesKeepSessionAlive) {
    Server server{lifecycle_options()};
    PipePeer peer(server);
    peer.handshake();

    peer.send_raw("{not json}\n");
    auto parse = peer.next();
    ASSERT_TRUE(parse.has_value());
    EXPECT_TRUE((*parse)["id"].is_null());
    EXPECT_EQ((*parse)["error"]["code"], error::ParseError);

    peer.send({{"jsonrpc", "1.0"}, {"id", 7}, {"method", "ping"}});
    auto invalid = peer.next();
    ASSERT_TRUE(invalid.has_value());
    EXPECT_EQ((*invalid)["id"], 7);
    EXPECT_EQ((*invalid)["error"]["code"], error::InvalidRequest);

    peer.send_raw("[{\"jsonrpc\":\"2.0\",\"id\":8,\"method\":\"ping\"}]\n");
    auto batch = peer.next();
    ASSERT_TRUE(batch.has_value());
    EXPECT_EQ((*batch)["error"]["code"], error::InvalidRequest);

    // Beyond int64 the id cannot be echoed faithfully, so it is not echoed at all.
    peer.send_raw("{\"jsonrpc\":\"2.0\",\"id\":18446744073709551615,\"method\":\"ping\"}\n");
    auto wide = peer.next();
    ASSERT_TRUE(wide.has_value());
    EXPECT_TRUE((*wide)["id"].is_null());
    EXPECT_EQ((*wide)["error"]["code"], error::InvalidRequest);

    peer.request(9, "no/such/method");
    auto unknown = peer.response_for(9);
    ASSERT_TRUE(unknown.has_value());
    EXPECT_EQ((*unknown)["error"]["code"], error::MethodNotFound);

    // Unknown notifications are ignored silently.
    peer.notify("notifications/whatever");
    peer.request(10, "ping");
    auto pong = peer.next();
    ASSERT_TRUE(pong.has_value());
    EXPECT_EQ((*pong)["id"], 10);
}

TEST(Lifecycle, UnadvertisedCapabilityIsRefused) {
    Server server{lifecycle_options()};
    add_echo(server);
    PipePeer peer(server);
    peer.handshake();

    peer.request(1, "resources/list");
    auto resp = peer.response_for(1);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["error"]["code"], error::InvalidRequest);
}

TEST(Lifecycle, ServeOnlyOnce) {
    Server server{lifecycle_options()};
    {
        PipePeer peer(server);
        peer.close_input();
        EXPECT_EQ(peer.exit_status(), 0);
    }
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    EXPECT_THROW(server.serve(std::make_unique<StreamTransport>(fds[0], fds[1])), Error);
    ::close(fds[0]);
    ::close(fds[1]);
}
