#include <mcp_bridge/bridge/lifecycle_watch.hpp>

namespace mcp_bridge {

LifecycleWatch::LifecycleWatch(std::string backend_filter)
    : filter_(std::move(backend_filter)) {}

std::optional<LifecycleEvent> LifecycleWatch::Next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); });
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

bool LifecycleWatch::Publish(const LifecycleEvent& event) {
    if (!filter_.empty() && filter_ != event.backend) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        events_.push_back(event);
    }
    cv_.notify_one();
    return true;
}

void LifecycleWatch::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool LifecycleWatch::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace mcp_bridge
