#pragma once
#include "transport.hpp"
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace capwire {

/// Newline-delimited frames over a pair of pipe file descriptors, usually
/// the stdin/stdout of a child process.
///
/// A default-constructed instance is unattached: send() and receive() throw
/// TransportError{NotReady} and is_connected() is false.
class StreamTransport : public ITransport {
public:
    StreamTransport();

    /// Adopt already-open descriptors; both are closed by this transport.
    /// Pass the child's pid to get liveness tracking, kill() and reaping.
    StreamTransport(int read_fd, int write_fd, pid_t child = -1);

    ~StreamTransport() override;

    StreamTransport(const StreamTransport&) = delete;
    StreamTransport& operator=(const StreamTransport&) = delete;

    /// Start `command` (resolved through PATH) with its stdin/stdout wired
    /// to this transport. Throws TransportError{ConnectionFailed} when the
    /// process cannot be started.
    [[nodiscard]] static std::unique_ptr<StreamTransport> spawn(
        const std::string& command, const std::vector<std::string>& args = {});

    /// Use this process's own stdin/stdout. The descriptors are not closed.
    [[nodiscard]] static std::unique_ptr<StreamTransport> current_process();

    void send(const std::string& frame) override;
    std::optional<std::string> receive() override;

    /// Closes the child's stdin, waits up to the close grace period for it
    /// to exit, then kills and reaps it.
    void close() override;

    bool is_connected() const override;
    std::string_view transport_type() const override { return "stdio"; }
    TransportStats stats() const override;

    /// Send SIGKILL to the child and reap it. Throws TransportError{NotReady}
    /// when there is no child process.
    void kill();

    [[nodiscard]] pid_t pid() const noexcept { return child_; }

    void set_close_grace(std::chrono::milliseconds grace) { close_grace_ = grace; }

private:
    void attach(int read_fd, int write_fd, pid_t child, bool owns_fds);
    bool reap(bool block) const;
    std::optional<std::string> take_line();

    int read_fd_{-1};
    int write_fd_{-1};
    bool owns_fds_{false};
    bool attached_{false};
    pid_t child_{-1};
    std::chrono::milliseconds close_grace_{500};

    mutable std::atomic<bool> connected_{false};
    std::atomic<bool> closed_{false};
    bool eof_{false};

    int wakeup_pipe_[2]{-1, -1};  // written by close() to interrupt poll()

    std::string buffer_;          // receive-side only
    std::mutex write_mutex_;
    mutable std::mutex child_mutex_;
    mutable bool reaped_{false};

    StatsRecorder stats_;
};

} // namespace capwire
