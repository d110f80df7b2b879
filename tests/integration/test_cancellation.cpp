#include <gtest/gtest.h>
#include "toolwire/server.hpp"
#include "toolwire/error.hpp"
#include "support/pipe_peer.hpp"
#include <atomic>
#include <chrono>

using namespace toolwire;
using toolwire::testing::PipePeer;
using namespace std::chrono_literals;

namespace {

struct Observed {
    std::atomic<int> started{0};
    std::atomic<int> saw_cancel{0};
};

void register_slow(Server& server, std::shared_ptr<Observed> seen) {
    ToolDefinition td;
    td.name = "slow";
    server.add_tool(td, [seen](const nlohmann::json&, RequestContext& ctx) {
        ++seen->started;
        if (ctx.token().wait_for(10s)) {
            ++seen->saw_cancel;
            // Output after cancellation is dropped by the dispatcher.
            ctx.notify("notifications/progress", nlohmann::json{{"progress", 1}});
            throw CancelledError();
        }
        return CallToolResult::text("finished");
    });
}

bool wait_until(const std::atomic<int>& counter, int value) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (counter.load() < value) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

TEST(Cancellation, CancelledNotification) {
    auto seen = std::make_shared<Observed>();
    Server server;
    register_slow(server, seen);
    PipePeer peer(server);
    peer.handshake();

    peer.request(1, "tools/call", {{"name", "slow"}});
    ASSERT_TRUE(wait_until(seen->started, 1));
    peer.notify("notifications/cancelled", {{"requestId", 1}, {"reason", "user pressed stop"}});

    auto resp = peer.next();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["id"], 1);
    EXPECT_EQ((*resp)["error"]["code"], error::RequestCancelled);
    EXPECT_EQ((*resp)["error"]["data"]["reason"], "user pressed stop");
    EXPECT_TRUE(wait_until(seen->saw_cancel, 1));

    // Nothing else arrives for the cancelled request.
    peer.request(2, "ping");
    auto next = peer.next();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ((*next)["id"], 2);
}

TEST(Cancellation, LegacyCancelRequest) {
    auto seen = std::make_shared<Observed>();
    Server server;
    register_slow(server, seen);
    PipePeer peer(server);
    peer.handshake();

    peer.send({{"jsonrpc", "2.0"}, {"id", "req-a"}, {"method", "tools/call"},
               {"params", {{"name", "slow"}}}});
    ASSERT_TRUE(wait_until(seen->started, 1));
    peer.notify("$/cancelRequest", {{"id", "req-a"}});

    auto resp = peer.next();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["id"], "req-a");
    EXPECT_EQ((*resp)["error"]["code"], error::RequestCancelled);
}

TEST(Cancellation, UnknownAndCompletedIdsAreIgnored) {
    auto seen = std::make_shared<Observed>();
    Server server;
    register_slow(server, seen);
    PipePeer peer(server);
    peer.handshake();

    peer.request(1, "ping");
    ASSERT_TRUE(peer.response_for(1).has_value());

    peer.notify("notifications/cancelled", {{"requestId", 1}});
    peer.notify("notifications/cancelled", {{"requestId", 999}});
    peer.notify("notifications/cancelled", {{"reason", "no id"}});

    peer.request(2, "ping");
    auto next = peer.next();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ((*next)["id"], 2);
    EXPECT_TRUE(next->contains("result"));
}

TEST(Cancellation, OnlyTheTargetIsCancelled) {
    auto seen = std::make_shared<Observed>();
    Server server;
    register_slow(server, seen);
    PipePeer peer(server);
    peer.handshake();

    peer.request(1, "tools/call", {{"name", "slow"}});
    peer.request(2, "tools/call", {{"name", "slow"}});
    ASSERT_TRUE(wait_until(seen->started, 2));

    peer.notify("notifications/cancelled", {{"requestId", 2}});
    auto resp = peer.next();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["id"], 2);
    EXPECT_EQ((*resp)["error"]["code"], error::RequestCancelled);

    peer.notify("notifications/cancelled", {{"requestId", 1}});
    auto other = peer.next();
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ((*other)["id"], 1);
}
