#include "bridge/stdio_bridge.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace webaudit::bridge {

using core::errors::AuditError;
using core::errors::ErrorKind;
using nlohmann::json;
namespace rpc = protocol::rpc;

namespace {

constexpr std::size_t kStderrTailLimit = 4096;
constexpr int kPollSliceMs = 50;
constexpr int kTerminateGraceMs = 500;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

// Reads whatever is available without blocking. Returns false once the pipe hit EOF.
bool drain_pipe(const int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

std::string with_stderr_hint(std::string message, const std::string& tail) {
    if (tail.empty()) {
        return message;
    }
    std::string last = tail;
    const auto pos = last.find_last_not_of("\r\n");
    if (pos != std::string::npos) {
        last.erase(pos + 1);
    }
    const auto line_start = last.find_last_of('\n');
    if (line_start != std::string::npos) {
        last = last.substr(line_start + 1);
    }
    return message + " (backend stderr: " + last + ")";
}

}  // namespace

StdioBridge::StdioBridge(core::config::BackendSettings settings,
                         std::shared_ptr<std::atomic_bool> cancel_token)
    : settings_(std::move(settings)), cancel_token_(std::move(cancel_token)) {}

StdioBridge::~StdioBridge() {
    close();
}

core::errors::Result<bool> StdioBridge::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_) {
        return true;
    }
    ignore_sigpipe_once();

    auto spawned = spawn();
    if (core::errors::is_error(spawned)) {
        release();
        return core::errors::get_error(spawned);
    }

    auto handshake_result = handshake();
    if (core::errors::is_error(handshake_result)) {
        auto err = core::errors::get_error(handshake_result);
        release();
        if (err.kind != ErrorKind::Cancelled) {
            err = AuditError{ErrorKind::Connection,
                             "Handshake with tool backend failed: " + err.message,
                             "handshake_failed"};
        }
        return err;
    }

    open_ = true;
    ++epoch_;
    LOG_DEBUG("StdioBridge: channel open (pid " + std::to_string(pid_) + ", epoch " +
              std::to_string(epoch_) + ")");
    return true;
}

core::errors::Result<bool> StdioBridge::spawn() {
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
        for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return AuditError{ErrorKind::Internal, "Failed to create backend pipes.",
                          "pipe_creation_failed"};
    }

    std::vector<std::string> argv_storage;
    argv_storage.push_back(settings_.command);
    for (const auto& arg : settings_.args) {
        argv_storage.push_back(arg);
    }
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return AuditError{ErrorKind::Internal, "Failed to fork tool backend.",
                          "fork_failed"};
    }

    if (pid == 0) {
        // dup2 clears close-on-exec on the standard descriptors
        static_cast<void>(dup2(in_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(out_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(err_pipe[1], STDERR_FILENO));
        // The CLI blocks SIGINT/SIGTERM for its signal watcher; the backend must not inherit that
        sigset_t unblock;
        sigemptyset(&unblock);
        static_cast<void>(sigprocmask(SIG_SETMASK, &unblock, nullptr));
        execvp(argv[0], argv.data());
        const int exec_errno = errno;
        static_cast<void>(::write(status_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    read_buffer_.clear();
    stderr_tail_.clear();
    next_id_ = 1;

    // The status pipe closes silently on a successful exec.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        return AuditError{ErrorKind::Connection,
                          "Failed to start tool backend '" + settings_.command +
                              "': " + std::strerror(exec_errno),
                          "backend_spawn_failed",
                          "Check the backend command and that it is on PATH."};
    }

    set_nonblocking(stdout_fd_);
    set_nonblocking(stderr_fd_);
    LOG_INFO("StdioBridge: spawned tool backend '" + settings_.command + "' (pid " +
             std::to_string(pid_) + ")");
    return true;
}

core::errors::Result<bool> StdioBridge::handshake() {
    json params;
    params["protocolVersion"] = settings_.protocol_version;
    params["capabilities"] = json::object();
    params["clientInfo"] = {{"name", settings_.client_name},
                            {"version", settings_.client_version}};

    auto acknowledged = exchange(rpc::kMethodInitialize, params, settings_.startup_timeout_ms);
    if (core::errors::is_error(acknowledged)) {
        return core::errors::get_error(acknowledged);
    }
    return write_line(rpc::make_notification(rpc::kMethodInitialized).dump());
}

core::errors::Result<json> StdioBridge::send(const std::string& method, const json& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        return AuditError{ErrorKind::Protocol, "Tool backend channel is not open.",
                          "channel_not_open"};
    }
    return exchange(method, params, settings_.request_timeout_ms);
}

core::errors::Result<json> StdioBridge::exchange(const std::string& method,
                                                 const json& params,
                                                 const std::uint32_t timeout_ms) {
    const std::int64_t id = next_id_++;
    LOG_DEBUG("StdioBridge: -> " + method + " (id " + std::to_string(id) + ")");

    auto written = write_line(rpc::make_request(id, method, params).dump());
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        auto line = read_line(remaining > 0 ? static_cast<std::uint32_t>(remaining) : 0);
        if (core::errors::is_error(line)) {
            auto err = core::errors::get_error(line);
            if (err.kind == ErrorKind::Timeout) {
                err.message = "No response to " + method + " within " +
                              std::to_string(timeout_ms) + " ms.";
            }
            return err;
        }

        auto decoded = rpc::decode_line(core::errors::get_value(line));
        if (core::errors::is_error(decoded)) {
            return core::errors::get_error(decoded);
        }
        const auto& message = core::errors::get_value(decoded);

        if (message.is_notification()) {
            LOG_DEBUG("StdioBridge: skipping notification " + message.method.value());
            continue;
        }
        if (message.method.has_value()) {
            auto rejected = reject_server_request(message);
            if (core::errors::is_error(rejected)) {
                return core::errors::get_error(rejected);
            }
            continue;
        }
        if (message.id.has_value() && message.id.value() < id) {
            // Late answer to a request that already timed out.
            LOG_WARN("StdioBridge: discarding stale response (id " +
                     std::to_string(message.id.value()) + ") while waiting for id " +
                     std::to_string(id));
            continue;
        }
        LOG_DEBUG("StdioBridge: <- response (id " + std::to_string(id) + ")");
        return rpc::extract_result(message, id);
    }
}

core::errors::Result<bool> StdioBridge::reject_server_request(
    const rpc::IncomingMessage& message) {
    LOG_WARN("StdioBridge: backend sent unsupported request " + message.method.value());
    json reply;
    reply["jsonrpc"] = rpc::kProtocolTag;
    reply["id"] = message.id.value();
    reply["error"] = {{"code", -32601}, {"message", "Method not supported by client"}};
    return write_line(reply.dump());
}

core::errors::Result<bool> StdioBridge::write_line(const std::string& line) {
    const std::string framed = line + "\n";
    std::size_t offset = 0;
    while (offset < framed.size()) {
        const ssize_t n = ::write(stdin_fd_, framed.data() + offset, framed.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return AuditError{ErrorKind::Protocol,
                          with_stderr_hint("Failed to write to tool backend: " +
                                               std::string(std::strerror(errno)),
                                           stderr_tail_),
                          "channel_write_failed"};
    }
    return true;
}

core::errors::Result<std::string> StdioBridge::read_line(const std::uint32_t timeout_ms) {
    const auto started = std::chrono::steady_clock::now();
    bool stdout_open = stdout_fd_ >= 0;

    while (true) {
        const auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.find_first_not_of(" \t") == std::string::npos) {
                continue;
            }
            return line;
        }

        if (!stdout_open) {
            if (!read_buffer_.empty()) {
                std::string line;
                line.swap(read_buffer_);
                return line;
            }
            return AuditError{ErrorKind::Protocol,
                              with_stderr_hint("No response from tool backend: channel closed.",
                                               stderr_tail_),
                              "no_response"};
        }

        if (cancel_token_ && cancel_token_->load()) {
            return AuditError{ErrorKind::Cancelled, "Run cancelled while waiting for backend.",
                              "cancelled"};
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (elapsed >= static_cast<std::int64_t>(timeout_ms)) {
            return AuditError{ErrorKind::Timeout, "Timed out waiting for tool backend.",
                              "request_timeout"};
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds].fd = stdout_fd_;
        fds[nfds].events = POLLIN;
        ++nfds;
        if (stderr_fd_ >= 0) {
            fds[nfds].fd = stderr_fd_;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        static_cast<void>(poll(fds, nfds, kPollSliceMs));

        drain_stderr();
        if (!drain_pipe(stdout_fd_, read_buffer_)) {
            stdout_open = false;
            close_fd(stdout_fd_);
            LOG_DEBUG("StdioBridge: backend closed its standard output");
        }
    }
}

void StdioBridge::drain_stderr() {
    if (stderr_fd_ < 0) {
        return;
    }
    if (!drain_pipe(stderr_fd_, stderr_tail_)) {
        close_fd(stderr_fd_);
    }
    if (stderr_tail_.size() > kStderrTailLimit) {
        stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailLimit);
    }
}

void StdioBridge::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    release();
}

void StdioBridge::release() {
    const bool was_open = open_;
    open_ = false;
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    read_buffer_.clear();

    if (pid_ <= 0) {
        return;
    }

    int status = 0;
    static_cast<void>(kill(pid_, SIGTERM));
    bool reaped = false;
    for (int waited_ms = 0; waited_ms < kTerminateGraceMs; waited_ms += 10) {
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reaped = true;
            break;
        }
        usleep(10 * 1000);
    }
    if (!reaped) {
        static_cast<void>(kill(pid_, SIGKILL));
        static_cast<void>(waitpid(pid_, &status, 0));
    }
    if (was_open) {
        LOG_DEBUG("StdioBridge: tool backend (pid " + std::to_string(pid_) + ") stopped");
    }
    pid_ = -1;
}

bool StdioBridge::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::uint64_t StdioBridge::session_epoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
}

std::string StdioBridge::stderr_tail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stderr_tail_;
}

}  // namespace webaudit::bridge
