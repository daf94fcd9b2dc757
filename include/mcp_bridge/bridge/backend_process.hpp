#pragma once

#include <mcp_bridge/bridge/frame.hpp>
#include <mcp_bridge/bridge/frame_codec.hpp>
#include <mcp_bridge/config/app_config.hpp>
#include <mcp_bridge/core/result.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace mcp_bridge {

// Id of the initialize request sent during the startup handshake.
inline constexpr const char* kHandshakeRequestId = "mcp-bridge-init";

struct ProcessExit {
    int exit_code = -1;   // -1 when terminated by a signal
    int term_signal = 0;
    std::string stderr_tail;

    [[nodiscard]] std::string Describe() const;
};

struct BackendProcessOptions {
    std::chrono::milliseconds startup_timeout{30000};
    // How long a backend without handshake must survive to count as started.
    std::chrono::milliseconds startup_probe{150};
    size_t max_line_bytes = kDefaultMaxLineBytes;
    size_t stderr_tail_lines = 20;
};

// ---------------------------------------------------------------------------
// BackendProcess: one running child speaking JSON-RPC lines over its pipes.
//
// Threads (all owned and joined by this object):
//   writer   drains the submit queue into stdin; the only stdin writer
//   reader   decodes stdout with one PipeDecoder; the only stdout reader
//   stderr   logs each stderr line and keeps a short tail
//   waiter   reaps the child and reports the exit once stdout hit EOF
//
// Malformed stdout lines are logged and skipped here; only well-formed
// frames reach FrameCallback. FrameCallback runs on the reader thread,
// ExitCallback on the waiter thread; neither may destroy this object.
// ---------------------------------------------------------------------------
class BackendProcess {
public:
    using FrameCallback = std::function<void(Frame)>;
    using ExitCallback = std::function<void(const ProcessExit&)>;

    // Spawn the child, complete the MCP handshake (when the descriptor asks
    // for it) and start the I/O threads. Fails with LaunchError.
    static Result<std::unique_ptr<BackendProcess>, Error> Launch(
        const BackendDescriptor& descriptor,
        const BackendProcessOptions& options,
        FrameCallback on_frame,
        ExitCallback on_exit);

    ~BackendProcess();

    BackendProcess(const BackendProcess&) = delete;
    BackendProcess& operator=(const BackendProcess&) = delete;
    BackendProcess(BackendProcess&&) = delete;
    BackendProcess& operator=(BackendProcess&&) = delete;

    // Queue one encoded line for stdin. Returns immediately.
    [[nodiscard]] Result<void, Error> Submit(std::string line);

    // Close stdin, SIGTERM the process group, wait up to `grace`, then
    // SIGKILL. Blocks until the child is reaped.
    void Terminate(std::chrono::milliseconds grace);

    [[nodiscard]] bool IsRunning() const noexcept { return !exited_.load(); }
    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] std::string StderrTail() const;

private:
    BackendProcess(std::string name, pid_t pid, int stdin_fd, int stdout_fd,
                   int stderr_fd, const BackendProcessOptions& options,
                   FrameCallback on_frame, ExitCallback on_exit);

    Result<void, Error> Handshake(std::chrono::milliseconds timeout);
    Result<void, Error> ProbeStartup(std::chrono::milliseconds probe);
    Error StartupFailure(const std::string& message);
    void StartIoThreads();

    void WriterLoop();
    void ReaderLoop();
    void StderrLoop();
    void WaiterLoop();

    void AppendStderr(std::string_view chunk);
    void Deliver(std::vector<Result<Frame, Error>> results);

    std::string name_;
    std::string component_;
    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    BackendProcessOptions options_;
    FrameCallback on_frame_;
    ExitCallback on_exit_;

    PipeDecoder decoder_;
    std::vector<Frame> early_frames_;

    // Writer queue.
    std::mutex write_mutex_;
    std::condition_variable write_cv_;
    std::deque<std::string> write_queue_;
    bool close_stdin_ = false;
    bool writer_failed_ = false;

    // Exit bookkeeping.
    mutable std::mutex exit_mutex_;
    std::condition_variable exit_cv_;
    std::atomic<bool> exited_{false};
    bool stdout_eof_ = false;
    bool stderr_eof_ = false;
    bool reaped_before_threads_ = false;
    ProcessExit exit_;

    mutable std::mutex stderr_mutex_;
    std::deque<std::string> stderr_tail_;
    std::string stderr_partial_;

    std::atomic<bool> stopping_{false};
    std::thread writer_;
    std::thread reader_;
    std::thread stderr_reader_;
    std::thread waiter_;
};

} // namespace mcp_bridge
