#include <mcp_bridge/bridge/backend_process.hpp>

#include <mcp_bridge/bridge/backend_state.hpp>
#include <mcp_bridge/core/command_line.hpp>
#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/core/version.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <optional>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_bridge {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr size_t kReadChunk = 64 * 1024;

// Reported by the child through the exec-status pipe.
enum ChildStage : int {
    kStageChdir = 1,
    kStageExec = 2,
};

struct ChildReport {
    int stage;
    int err;
};

// Owns one file descriptor until released.
class ScopedFd {
public:
    ScopedFd() = default;
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { Reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    [[nodiscard]] int Get() const noexcept { return fd_; }
    int Release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void Reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct PipePair {
    ScopedFd read;
    ScopedFd write;
};

bool OpenPipe(PipePair& pair) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    pair.read.Reset(fds[0]);
    pair.write.Reset(fds[1]);
    return true;
}

bool SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void IgnoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

std::string ErrnoText(int err) {
    return std::strerror(err);
}

bool IsExecutableFile(const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(path.c_str(), X_OK) == 0;
}

// PATH lookup done in the parent so a missing executable is reported before
// anything is forked.
std::optional<std::string> ResolveExecutable(const std::string& command,
                                             const std::string& search_path,
                                             const std::optional<std::string>& cwd) {
    if (command.find('/') != std::string::npos) {
        std::string probe = command;
        if (command[0] != '/' && cwd.has_value()) {
            probe = *cwd + "/" + command;
        }
        if (IsExecutableFile(probe)) {
            return command;
        }
        return std::nullopt;
    }

    size_t start = 0;
    while (start <= search_path.size()) {
        auto colon = search_path.find(':', start);
        auto dir = search_path.substr(start, colon == std::string::npos
                                                 ? std::string::npos
                                                 : colon - start);
        if (dir.empty()) dir = ".";
        auto candidate = dir + "/" + command;
        if (IsExecutableFile(candidate)) {
            return candidate;
        }
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    return std::nullopt;
}

std::map<std::string, std::string> MergedEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string_view::npos) continue;
        merged[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }
    return merged;
}

pid_t WaitPid(pid_t pid, int* status, int flags) {
    pid_t r;
    do {
        r = ::waitpid(pid, status, flags);
    } while (r < 0 && errno == EINTR);
    return r;
}

void SignalGroup(pid_t pid, int sig) {
    if (::kill(-pid, sig) != 0) {
        ::kill(pid, sig);
    }
}

// Write the whole buffer to a non-blocking fd. Fails on a broken pipe, on
// `stop`, or when `deadline` passes.
bool WriteAll(int fd, std::string_view data, const std::atomic<bool>& stop,
              TimePoint deadline, std::string& error) {
    while (!data.empty()) {
        if (stop.load()) {
            error = "stopping";
            return false;
        }
        ssize_t n = ::write(fd, data.data(), data.size());
        if (n > 0) {
            data.remove_prefix(static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (Clock::now() >= deadline) {
                error = "write timed out";
                return false;
            }
            pollfd pfd{fd, POLLOUT, 0};
            ::poll(&pfd, 1, kPollIntervalMs);
            continue;
        }
        error = ErrnoText(errno);
        return false;
    }
    return true;
}

ProcessExit ExitFromStatus(int status) {
    ProcessExit exit;
    if (WIFEXITED(status)) {
        exit.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit.term_signal = WTERMSIG(status);
    }
    return exit;
}

} // anonymous namespace

std::string ProcessExit::Describe() const {
    if (term_signal != 0) {
        return "killed by signal " + std::to_string(term_signal) + " (" +
               ::strsignal(term_signal) + ")";
    }
    return "exit code " + std::to_string(exit_code);
}

// ---------------------------------------------------------------------------
// Launch
// ---------------------------------------------------------------------------
Result<std::unique_ptr<BackendProcess>, Error> BackendProcess::Launch(
    const BackendDescriptor& descriptor,
    const BackendProcessOptions& options,
    FrameCallback on_frame,
    ExitCallback on_exit) {
    using R = Result<std::unique_ptr<BackendProcess>, Error>;
    auto launch_error = [&descriptor](const std::string& message) {
        return R::Err(Error::Make(ErrorCategory::LaunchError, "BackendProcess::Launch",
                                  descriptor.name, message));
    };

    IgnoreSigpipeOnce();

    const auto env = MergedEnvironment(descriptor.env);
    auto path_it = env.find("PATH");
    const std::string search_path =
        path_it != env.end() ? path_it->second : "/usr/local/bin:/usr/bin:/bin";

    auto exec_path = ResolveExecutable(descriptor.command, search_path,
                                       descriptor.working_directory);
    if (!exec_path.has_value()) {
        return launch_error("Executable not found: " + descriptor.command);
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> arg_storage;
    arg_storage.push_back(descriptor.command);
    arg_storage.insert(arg_storage.end(), descriptor.args.begin(), descriptor.args.end());
    std::vector<char*> argv;
    for (auto& arg : arg_storage) argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (const auto& [key, value] : env) env_storage.push_back(key + "=" + value);
    std::vector<char*> envp;
    for (auto& entry : env_storage) envp.push_back(entry.data());
    envp.push_back(nullptr);

    const char* cwd = descriptor.working_directory ? descriptor.working_directory->c_str()
                                                   : nullptr;

    PipePair in, out, err, status;
    if (!OpenPipe(in) || !OpenPipe(out) || !OpenPipe(err) || !OpenPipe(status)) {
        return launch_error("pipe() failed: " + ErrnoText(errno));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        return launch_error("fork() failed: " + ErrnoText(errno));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::setpgid(0, 0);
        std::signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        ::dup2(in.read.Get(), STDIN_FILENO);
        ::dup2(out.write.Get(), STDOUT_FILENO);
        ::dup2(err.write.Get(), STDERR_FILENO);

        ChildReport report{kStageChdir, 0};
        if (cwd != nullptr && ::chdir(cwd) != 0) {
            report.err = errno;
            (void)!::write(status.write.Get(), &report, sizeof(report));
            ::_exit(127);
        }
        ::execve(exec_path->c_str(), argv.data(), envp.data());
        report = ChildReport{kStageExec, errno};
        (void)!::write(status.write.Get(), &report, sizeof(report));
        ::_exit(127);
    }

    ::setpgid(pid, pid);  // also done by the child; whichever runs first wins

    in.read.Reset();
    out.write.Reset();
    err.write.Reset();
    status.write.Reset();

    ChildReport report{};
    ssize_t n;
    do {
        n = ::read(status.read.Get(), &report, sizeof(report));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(report))) {
        int ignored = 0;
        WaitPid(pid, &ignored, 0);
        if (report.stage == kStageChdir) {
            return launch_error("Cannot enter working directory " +
                                descriptor.working_directory.value_or("") + ": " +
                                ErrnoText(report.err));
        }
        return launch_error("exec " + *exec_path + " failed: " + ErrnoText(report.err));
    }

    SetNonBlocking(in.write.Get());
    SetNonBlocking(out.read.Get());
    SetNonBlocking(err.read.Get());

    std::unique_ptr<BackendProcess> process(new BackendProcess(
        descriptor.name, pid, in.write.Release(), out.read.Release(), err.read.Release(),
        options, std::move(on_frame), std::move(on_exit)));

    LogInfo(process->component_, "Spawned pid " + std::to_string(pid) + ": " +
                                     JoinCommandLine(arg_storage));

    process->stderr_reader_ = std::thread(&BackendProcess::StderrLoop, process.get());

    auto started = descriptor.handshake ? process->Handshake(options.startup_timeout)
                                        : process->ProbeStartup(options.startup_probe);
    if (started.IsErr()) {
        return R::Err(std::move(started).Error());
    }

    process->StartIoThreads();
    return R::Ok(std::move(process));
}

BackendProcess::BackendProcess(std::string name, pid_t pid, int stdin_fd, int stdout_fd,
                               int stderr_fd, const BackendProcessOptions& options,
                               FrameCallback on_frame, ExitCallback on_exit)
    : name_(std::move(name)),
      component_("backend:" + name_),
      pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      options_(options),
      on_frame_(std::move(on_frame)),
      on_exit_(std::move(on_exit)),
      decoder_(options.max_line_bytes) {}

BackendProcess::~BackendProcess() {
    if (waiter_.joinable()) {
        if (!exited_.load()) {
            Terminate(std::chrono::milliseconds(500));
        }
    } else if (!reaped_before_threads_) {
        SignalGroup(pid_, SIGKILL);
        int ignored = 0;
        WaitPid(pid_, &ignored, 0);
    }

    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        stopping_ = true;
    }
    exit_cv_.notify_all();
    write_cv_.notify_all();

    for (auto* t : {&writer_, &reader_, &stderr_reader_, &waiter_}) {
        if (t->joinable()) t->join();
    }

    for (int fd : {stdin_fd_, stdout_fd_, stderr_fd_}) {
        if (fd >= 0) ::close(fd);
    }
}

// ---------------------------------------------------------------------------
// Startup
// ---------------------------------------------------------------------------
Result<void, Error> BackendProcess::Handshake(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;

    const auto init = Frame::Request(
        kHandshakeRequestId, "initialize",
        {{"protocolVersion", kProtocolVersion},
         {"capabilities", nlohmann::json::object()},
         {"clientInfo", {{"name", "mcp-bridge"}, {"version", kVersion}}}});

    std::string write_error;
    if (!WriteAll(stdin_fd_, EncodePipe(init), stopping_, deadline, write_error)) {
        return Result<void, Error>::Err(
            StartupFailure("Could not send initialize request: " + write_error));
    }

    std::vector<char> buf(kReadChunk);
    bool answered = false;
    while (!answered) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) {
            return Result<void, Error>::Err(StartupFailure(
                "No initialize response within " + std::to_string(timeout.count()) + " ms"));
        }

        pollfd pfd{stdout_fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(
                                     remaining.count(), kPollIntervalMs)));
        if (rc < 0 && errno != EINTR) {
            return Result<void, Error>::Err(StartupFailure("poll() failed: " + ErrnoText(errno)));
        }
        if (rc <= 0) continue;

        ssize_t n = ::read(stdout_fd_, buf.data(), buf.size());
        if (n == 0) {
            return Result<void, Error>::Err(StartupFailure("Backend exited during startup"));
        }
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return Result<void, Error>::Err(StartupFailure("read() failed: " + ErrnoText(errno)));
        }

        std::optional<std::string> rejection;
        for (auto& result : decoder_.Feed(std::string_view(buf.data(), static_cast<size_t>(n)))) {
            if (result.IsErr()) {
                LogWarn(component_, "Skipping startup line: " + result.Error().message);
                continue;
            }
            auto frame = std::move(result).Value();
            if (answered) {
                early_frames_.push_back(std::move(frame));
                continue;
            }
            if ((frame.kind == FrameKind::Response || frame.kind == FrameKind::Error) &&
                frame.CorrelationKey() == std::optional<std::string>(kHandshakeRequestId)) {
                answered = true;
                if (frame.kind == FrameKind::Error) {
                    rejection = frame.payload.is_object()
                                    ? frame.payload.value("message", frame.payload.dump())
                                    : frame.payload.dump();
                } else if (frame.payload.is_object() && frame.payload.contains("serverInfo")) {
                    LogInfo(component_, "Initialized: " + frame.payload["serverInfo"].dump());
                }
                continue;
            }
            LogDebug(component_, std::string("Ignoring ") + FrameKindName(frame.kind) +
                                     " before initialize response");
        }
        if (rejection.has_value()) {
            return Result<void, Error>::Err(StartupFailure("initialize rejected: " + *rejection));
        }
    }

    if (!WriteAll(stdin_fd_, EncodePipe(Frame::Notification("notifications/initialized")),
                  stopping_, deadline, write_error)) {
        return Result<void, Error>::Err(
            StartupFailure("Could not send initialized notification: " + write_error));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> BackendProcess::ProbeStartup(std::chrono::milliseconds probe) {
    const auto deadline = Clock::now() + probe;
    while (Clock::now() < deadline) {
        int status = 0;
        if (WaitPid(pid_, &status, WNOHANG) == pid_) {
            reaped_before_threads_ = true;
            exited_ = true;
            auto exit = ExitFromStatus(status);
            return Result<void, Error>::Err(
                StartupFailure("Backend exited immediately (" + exit.Describe() + ")"));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(25));
    }
    return Result<void, Error>::Ok();
}

Error BackendProcess::StartupFailure(const std::string& message) {
    std::string full = message;
    if (!reaped_before_threads_) {
        int status = 0;
        pid_t r = WaitPid(pid_, &status, WNOHANG);
        if (r == 0) {
            SignalGroup(pid_, SIGKILL);
            r = WaitPid(pid_, &status, 0);
        } else if (r == pid_) {
            full += " (" + ExitFromStatus(status).Describe() + ")";
        }
        reaped_before_threads_ = true;
        exited_ = true;
    }

    {
        std::unique_lock<std::mutex> lock(exit_mutex_);
        exit_cv_.wait_for(lock, std::chrono::milliseconds(250), [this] { return stderr_eof_; });
    }

    LogError(component_, full);
    auto tail = StderrTail();
    return Error::Make(ErrorCategory::LaunchError, "BackendProcess::Launch", name_, full,
                       tail.empty() ? std::nullopt : std::optional<std::string>(tail));
}

void BackendProcess::StartIoThreads() {
    writer_ = std::thread(&BackendProcess::WriterLoop, this);
    reader_ = std::thread(&BackendProcess::ReaderLoop, this);
    waiter_ = std::thread(&BackendProcess::WaiterLoop, this);
}

// ---------------------------------------------------------------------------
// Submit / Terminate
// ---------------------------------------------------------------------------
Result<void, Error> BackendProcess::Submit(std::string line) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (exited_.load() || writer_failed_ || close_stdin_ || stopping_.load()) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::BackendDisconnected, "BackendProcess::Submit", name_,
                "Backend is not accepting input"));
        }
        write_queue_.push_back(std::move(line));
    }
    write_cv_.notify_one();
    return Result<void, Error>::Ok();
}

void BackendProcess::Terminate(std::chrono::milliseconds grace) {
    if (!waiter_.joinable()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        close_stdin_ = true;
    }
    write_cv_.notify_all();

    auto wait_for_exit = [this](std::chrono::milliseconds limit) {
        std::unique_lock<std::mutex> lock(exit_mutex_);
        return exit_cv_.wait_for(lock, limit, [this] { return exited_.load(); });
    };

    if (exited_.load()) {
        return;
    }
    SignalGroup(pid_, SIGTERM);
    if (wait_for_exit(grace)) {
        return;
    }
    LogWarn(component_, "No exit within " + std::to_string(grace.count()) +
                            " ms of SIGTERM; sending SIGKILL");
    SignalGroup(pid_, SIGKILL);
    wait_for_exit(std::chrono::seconds(5));
}

std::string BackendProcess::StderrTail() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    std::string out;
    for (const auto& line : stderr_tail_) {
        if (!out.empty()) out += '\n';
        out += line;
    }
    return out;
}

// ---------------------------------------------------------------------------
// I/O threads
// ---------------------------------------------------------------------------
void BackendProcess::WriterLoop() {
    while (true) {
        std::string line;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return stopping_.load() || close_stdin_ || !write_queue_.empty();
            });
            if (stopping_.load() || write_queue_.empty()) {
                break;
            }
            line = std::move(write_queue_.front());
            write_queue_.pop_front();
        }

        std::string error;
        if (!WriteAll(stdin_fd_, line, stopping_, TimePoint::max(), error)) {
            std::lock_guard<std::mutex> lock(write_mutex_);
            writer_failed_ = true;
            if (!write_queue_.empty()) {
                LogWarn(component_, "Dropping " + std::to_string(write_queue_.size()) +
                                        " queued frame(s)");
            }
            write_queue_.clear();
            LogWarn(component_, "stdin write failed: " + error);
            break;
        }
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

void BackendProcess::ReaderLoop() {
    if (!early_frames_.empty()) {
        for (auto& frame : early_frames_) {
            on_frame_(std::move(frame));
        }
        early_frames_.clear();
    }

    std::vector<char> buf(kReadChunk);
    while (!stopping_.load()) {
        pollfd pfd{stdout_fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LogError(component_, "poll(stdout) failed: " + ErrnoText(errno));
            break;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(stdout_fd_, buf.data(), buf.size());
        if (n > 0) {
            Deliver(decoder_.Feed(std::string_view(buf.data(), static_cast<size_t>(n))));
            continue;
        }
        if (n == 0) break;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
        LogWarn(component_, "read(stdout) failed: " + ErrnoText(errno));
        break;
    }
    Deliver(decoder_.Finish());

    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        stdout_eof_ = true;
    }
    exit_cv_.notify_all();
}

void BackendProcess::StderrLoop() {
    std::vector<char> buf(4096);
    while (!stopping_.load()) {
        pollfd pfd{stderr_fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(stderr_fd_, buf.data(), buf.size());
        if (n > 0) {
            AppendStderr(std::string_view(buf.data(), static_cast<size_t>(n)));
            continue;
        }
        if (n == 0) break;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
        break;
    }
    AppendStderr("\n");  // flush a trailing partial line

    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        stderr_eof_ = true;
    }
    exit_cv_.notify_all();
}

void BackendProcess::WaiterLoop() {
    int status = 0;
    pid_t r = WaitPid(pid_, &status, 0);
    ProcessExit exit = r == pid_ ? ExitFromStatus(status) : ProcessExit{};

    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        exited_ = true;
    }
    exit_cv_.notify_all();
    write_cv_.notify_all();

    // Frames written just before the exit must be routed before the exit is.
    {
        std::unique_lock<std::mutex> lock(exit_mutex_);
        exit_cv_.wait_for(lock, std::chrono::seconds(1),
                          [this] { return stdout_eof_ || stopping_.load(); });
    }

    exit.stderr_tail = StderrTail();
    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        exit_ = exit;
    }

    if (exit.exit_code == 0) {
        LogInfo(component_, "Process " + std::to_string(pid_) + " exited: " + exit.Describe());
    } else {
        LogWarn(component_, "Process " + std::to_string(pid_) + " exited: " + exit.Describe());
    }
    if (on_exit_) {
        on_exit_(exit);
    }
}

void BackendProcess::AppendStderr(std::string_view chunk) {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    stderr_partial_.append(chunk.data(), chunk.size());

    size_t start = 0;
    while (true) {
        auto newline = stderr_partial_.find('\n', start);
        if (newline == std::string::npos) break;
        auto line = stderr_partial_.substr(start, newline - start);
        start = newline + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        LogInfo(component_, "stderr: " + line);
        stderr_tail_.push_back(std::move(line));
        while (stderr_tail_.size() > options_.stderr_tail_lines) {
            stderr_tail_.pop_front();
        }
    }
    stderr_partial_.erase(0, start);
}

void BackendProcess::Deliver(std::vector<Result<Frame, Error>> results) {
    for (auto& result : results) {
        if (result.IsErr()) {
            LogWarn(component_, "Dropping line (" + result.Error().CategoryName() + "): " +
                                    result.Error().message);
            continue;
        }
        on_frame_(std::move(result).Value());
    }
}

} // namespace mcp_bridge
