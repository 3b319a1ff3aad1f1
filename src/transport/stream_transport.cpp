#include "capwire/transport/stream_transport.hpp"
#include "capwire/error.hpp"
#include "capwire/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

namespace capwire {

namespace {

void ignore_sigpipe() {
    // A write to a pipe whose reader exited must surface as EPIPE.
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void make_pipe(int fds[2]) {
    if (::pipe(fds) < 0) {
        throw TransportError(TransportError::Kind::Io,
                             std::string("pipe() failed: ") + std::strerror(errno));
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

StreamTransport::StreamTransport() = default;

StreamTransport::StreamTransport(int read_fd, int write_fd, pid_t child) {
    attach(read_fd, write_fd, child, true);
}

StreamTransport::~StreamTransport() {
    close();
    if (owns_fds_) close_fd(read_fd_);
    close_fd(wakeup_pipe_[0]);
    close_fd(wakeup_pipe_[1]);
}

void StreamTransport::attach(int read_fd, int write_fd, pid_t child, bool owns_fds) {
    ignore_sigpipe();
    make_pipe(wakeup_pipe_);
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    read_fd_ = read_fd;
    write_fd_ = write_fd;
    child_ = child;
    owns_fds_ = owns_fds;
    attached_ = true;
    connected_ = true;
    stats_.mark_connected();
}

std::unique_ptr<StreamTransport> StreamTransport::spawn(const std::string& command,
                                                        const std::vector<std::string>& args) {
    int to_child[2], from_child[2], exec_status[2];
    make_pipe(to_child);
    make_pipe(from_child);
    make_pipe(exec_status);

    // argv is built before fork(); only async-signal-safe calls follow in the child.
    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(command);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {to_child[0], to_child[1], from_child[0], from_child[1],
                       exec_status[0], exec_status[1]}) {
            ::close(fd);
        }
        throw TransportError(TransportError::Kind::ConnectionFailed,
                             std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::dup2(to_child[0], STDIN_FILENO);
        ::dup2(from_child[1], STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_status[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(to_child[0]);
    ::close(from_child[1]);
    ::close(exec_status[1]);

    // The status pipe is close-on-exec: EOF means exec succeeded.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_status[0]);

    if (n > 0) {
        ::close(to_child[1]);
        ::close(from_child[0]);
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw TransportError(TransportError::Kind::ConnectionFailed,
                             "Failed to spawn '" + command + "': " + std::strerror(child_errno));
    }

    logger()->debug("spawned '{}' as pid {}", command, pid);
    return std::make_unique<StreamTransport>(from_child[0], to_child[1], pid);
}

std::unique_ptr<StreamTransport> StreamTransport::current_process() {
    auto transport = std::make_unique<StreamTransport>();
    transport->attach(STDIN_FILENO, STDOUT_FILENO, -1, false);
    return transport;
}

void StreamTransport::send(const std::string& frame) {
    if (!attached_) {
        throw TransportError(TransportError::Kind::NotReady, "Stream transport is not attached");
    }
    if (closed_) {
        throw TransportError(TransportError::Kind::Disconnected, "Stream transport is closed");
    }

    std::string line = frame;
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_fd_ < 0) {
        throw TransportError(TransportError::Kind::Disconnected, "Stream transport is closed");
    }
    const char* data = line.data();
    size_t remaining = line.size();
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE) {
                connected_ = false;
                throw TransportError(TransportError::Kind::Disconnected, "Peer closed the pipe");
            }
            throw TransportError(TransportError::Kind::Io,
                                 std::string("write() failed: ") + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    stats_.record_sent(frame.size());
}

std::optional<std::string> StreamTransport::take_line() {
    while (true) {
        size_t nl = buffer_.find('\n');
        if (nl == std::string::npos) return std::nullopt;

        std::string line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        return line;
    }
}

std::optional<std::string> StreamTransport::receive() {
    if (!attached_) {
        throw TransportError(TransportError::Kind::NotReady, "Stream transport is not attached");
    }

    char chunk[4096];
    while (true) {
        if (auto line = take_line()) {
            stats_.record_received(line->size());
            return line;
        }
        if (closed_) return std::nullopt;
        if (eof_) {
            // Deliver an unterminated trailing line once, then report EOF.
            if (buffer_.empty()) return std::nullopt;
            std::string rest = std::move(buffer_);
            buffer_.clear();
            if (rest.back() == '\r') rest.pop_back();
            if (rest.empty()) return std::nullopt;
            stats_.record_received(rest.size());
            return rest;
        }

        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw TransportError(TransportError::Kind::Io,
                                 std::string("poll() failed: ") + std::strerror(errno));
        }
        if (fds[1].revents & POLLIN) return std::nullopt;
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw TransportError(TransportError::Kind::Io,
                                 std::string("read() failed: ") + std::strerror(errno));
        }
        if (n == 0) {
            eof_ = true;
            connected_ = false;
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

bool StreamTransport::reap(bool block) const {
    if (child_ <= 0 || reaped_) return true;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(child_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == child_ || (r < 0 && errno == ECHILD)) {
        reaped_ = true;
        return true;
    }
    return false;
}

void StreamTransport::close() {
    if (closed_.exchange(true)) return;
    connected_ = false;
    if (!attached_) return;

    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t ignored = ::write(wakeup_pipe_[1], &b, 1);
        (void)ignored;
    }
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (owns_fds_) close_fd(write_fd_);
        else write_fd_ = -1;
    }

    std::lock_guard<std::mutex> lock(child_mutex_);
    if (child_ <= 0 || reaped_) return;
    auto deadline = std::chrono::steady_clock::now() + close_grace_;
    while (!reap(false)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            logger()->debug("pid {} did not exit within grace period, killing", child_);
            ::kill(child_, SIGKILL);
            reap(true);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool StreamTransport::is_connected() const {
    if (!connected_) return false;
    std::lock_guard<std::mutex> lock(child_mutex_);
    if (child_ > 0 && reap(false)) {
        connected_ = false;
    }
    return connected_;
}

TransportStats StreamTransport::stats() const {
    return stats_.snapshot();
}

void StreamTransport::kill() {
    if (child_ <= 0) {
        throw TransportError(TransportError::Kind::NotReady, "No child process to kill");
    }
    std::lock_guard<std::mutex> lock(child_mutex_);
    if (!reaped_) {
        ::kill(child_, SIGKILL);
        reap(true);
    }
    connected_ = false;
}

} // namespace capwire
