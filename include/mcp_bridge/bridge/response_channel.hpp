#pragma once

#include <mcp_bridge/bridge/frame.hpp>
#include <mcp_bridge/core/result.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// ResponseChannel: delivery target of one pending request.
//
// The multiplexer pushes frames in arrival order; the waiting HTTP worker
// pops them with Next(). The channel is done after a final frame or an
// error. After Cancel() queued items are dropped and pushes are ignored.
// ---------------------------------------------------------------------------
class ResponseChannel {
public:
    void Push(Frame frame);
    void Fail(Error error);
    void Cancel();

    // Next frame or terminal error; nullopt when nothing arrived within
    // `timeout`, or when the channel is cancelled or already drained.
    [[nodiscard]] std::optional<Result<Frame, Error>> Next(std::chrono::milliseconds timeout);

    [[nodiscard]] bool IsDone() const;
    [[nodiscard]] bool IsCancelled() const;
    [[nodiscard]] size_t Delivered() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Result<Frame, Error>> items_;
    bool done_ = false;
    bool cancelled_ = false;
    size_t delivered_ = 0;
};

} // namespace mcp_bridge
