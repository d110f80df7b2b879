#pragma once
#include "toolwire/codec.hpp"
#include "toolwire/error.hpp"
#include "toolwire/transport/transport.hpp"
#include <chrono>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolwire::testing {

/// In-memory transport that records every written frame.
class FakeTransport : public ITransport {
public:
    void start(FrameCallback) override {}

    void write_frame(std::string_view payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes_) throw TransportError("Write error: broken pipe");
        frames_.emplace_back(payload);
        cv_.notify_all();
    }

    void shutdown() override { shut_down_ = true; }
    bool is_connected() const override { return !shut_down_; }

    void fail_writes() {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = true;
    }

    /// Wait until at least `count` frames were written.
    bool wait_for_frames(std::size_t count,
                         std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return frames_.size() >= count; });
    }

    std::vector<nlohmann::json> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> out;
        for (const auto& f : frames_) out.push_back(nlohmann::json::parse(f));
        return out;
    }

    std::vector<std::string> frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

    bool was_shut_down() const { return shut_down_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> frames_;
    bool fail_writes_ = false;
    std::atomic<bool> shut_down_{false};
};

} // namespace toolwire::testing
