#include <mcp_bridge/bridge/response_channel.hpp>

namespace mcp_bridge {

void ResponseChannel::Push(Frame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (done_ || cancelled_) {
            return;
        }
        done_ = frame.IsFinal();
        items_.push_back(Result<Frame, Error>::Ok(std::move(frame)));
    }
    cv_.notify_all();
}

void ResponseChannel::Fail(Error error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (done_ || cancelled_) {
            return;
        }
        done_ = true;
        items_.push_back(Result<Frame, Error>::Err(std::move(error)));
    }
    cv_.notify_all();
}

void ResponseChannel::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        items_.clear();
    }
    cv_.notify_all();
}

std::optional<Result<Frame, Error>> ResponseChannel::Next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return cancelled_ || !items_.empty(); });
    if (items_.empty()) {
        return std::nullopt;
    }
    auto item = std::move(items_.front());
    items_.pop_front();
    ++delivered_;
    return item;
}

bool ResponseChannel::IsDone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
}

bool ResponseChannel::IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

size_t ResponseChannel::Delivered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
}

} // namespace mcp_bridge
