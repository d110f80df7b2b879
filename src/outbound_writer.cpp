#include "toolwire/outbound_writer.hpp"
#include "toolwire/codec.hpp"
#include "toolwire/logging.hpp"

namespace toolwire {

OutboundWriter::OutboundWriter(ITransport& transport)
    : transport_(transport) {
}

OutboundWriter::~OutboundWriter() {
    abort();
}

void OutboundWriter::start(ErrorCallback on_error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable() || stopping_) return;
    on_error_ = std::move(on_error);
    accepting_ = true;
    thread_ = std::thread([this] { write_loop(); });
}

bool OutboundWriter::enqueue(JsonRpcMessage msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) return false;
        queue_.push_back(std::move(msg));
    }
    cv_.notify_one();
    return true;
}

void OutboundWriter::close() {
    stop(false);
}

void OutboundWriter::abort() {
    stop(true);
}

void OutboundWriter::stop(bool discard) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = false;
        stopping_ = true;
        if (discard && !queue_.empty()) {
            logging::logger()->debug("writer: discarding {} queued message(s)", queue_.size());
            queue_.clear();
        }
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void OutboundWriter::write_loop() {
    while (true) {
        JsonRpcMessage msg;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || stopping_; });
            if (queue_.empty()) return;
            msg = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            transport_.write_frame(Codec::serialize(msg));
            ++frames_written_;
        } catch (const TransportError& e) {
            logging::logger()->error("writer: {}", e.what());
            failed_ = true;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                accepting_ = false;
                queue_.clear();
            }
            if (on_error_) on_error_(e);
            return;
        }
    }
}

} // namespace toolwire
