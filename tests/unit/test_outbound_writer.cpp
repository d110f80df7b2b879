#include <gtest/gtest.h>
#include "toolwire/outbound_writer.hpp"
#include "support/fake_transport.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace toolwire;
using toolwire::testing::FakeTransport;

namespace {

JsonRpcMessage numbered(int64_t n) {
    return JsonRpcResponse::success(RequestId{n}, nlohmann::json{{"n", n}});
}

} // namespace

TEST(OutboundWriter, WritesInEnqueueOrder) {
    FakeTransport transport;
    OutboundWriter writer(transport);
    writer.start();

    for (int64_t i = 0; i < 100; ++i) {
        ASSERT_TRUE(writer.enqueue(numbered(i)));
    }
    writer.close();

    auto msgs = transport.messages();
    ASSERT_EQ(msgs.size(), 100u);
    for (int64_t i = 0; i < 100; ++i) {
        EXPECT_EQ(msgs[static_cast<size_t>(i)]["id"], i);
    }
    EXPECT_EQ(writer.frames_written(), 100u);
    EXPECT_FALSE(writer.failed());
}

TEST(OutboundWriter, OneFramePerMessageAcrossThreads) {
    FakeTransport transport;
    OutboundWriter writer(transport);
    writer.start();

    std::vector<std::thread> producers;
    for (int t = 0; t < 8; ++t) {
        producers.emplace_back([&writer, t] {
            for (int i = 0; i < 50; ++i) {
                writer.enqueue(JsonRpcNotification{"test/tick", nlohmann::json{{"t", t}, {"i", i}}});
            }
        });
    }
    for (auto& p : producers) p.join();
    writer.close();

    auto frames = transport.frames();
    ASSERT_EQ(frames.size(), 400u);
    // Each producer's own messages keep their relative order.
    std::vector<int> next(8, 0);
    for (const auto& f : frames) {
        auto j = nlohmann::json::parse(f);
        int t = j["params"]["t"];
        EXPECT_EQ(j["params"]["i"].get<int>(), next[static_cast<size_t>(t)]++);
    }
}

TEST(OutboundWriter, RejectsAfterClose) {
    FakeTransport transport;
    OutboundWriter writer(transport);
    EXPECT_FALSE(writer.enqueue(numbered(1)));  // not started
    writer.start();
    writer.close();
    EXPECT_FALSE(writer.enqueue(numbered(2)));
    EXPECT_TRUE(transport.frames().empty());
}

TEST(OutboundWriter, WriteFailureIsReported) {
    FakeTransport transport;
    transport.fail_writes();
    OutboundWriter writer(transport);
    std::atomic<int> errors{0};
    writer.start([&errors](const TransportError&) { ++errors; });

    writer.enqueue(numbered(1));
    writer.close();

    EXPECT_TRUE(writer.failed());
    EXPECT_EQ(errors.load(), 1);
    EXPECT_FALSE(writer.enqueue(numbered(2)));
}

TEST(OutboundWriter, AbortWithoutStartIsSafe) {
    FakeTransport transport;
    OutboundWriter writer(transport);
    writer.abort();
    writer.abort();
    EXPECT_EQ(writer.frames_written(), 0u);
}
