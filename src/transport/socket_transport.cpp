#include "triggerware/transport/socket_transport.hpp"
#include "triggerware/codec.hpp"
#include "triggerware/error.hpp"
#include "triggerware/log.hpp"
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace triggerware {

namespace {

constexpr size_t kReadChunk = 64 * 1024;

void report(const ErrorCallback& on_error, std::exception_ptr ex) {
    if (on_error) on_error(std::move(ex));
}

} // anonymous namespace

SocketTransport::SocketTransport(int fd) : fd_(fd) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw TwTransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

std::unique_ptr<SocketTransport> SocketTransport::connect(const std::string& host,
                                                          uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        throw TwTransportError("Cannot resolve " + host + ": " + ::gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

    int last_errno = 0;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            int one = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            log::logger()->info("connected to {}:{}", host, port);
            return std::make_unique<SocketTransport>(fd);
        }
        last_errno = errno;
        ::close(fd);
    }
    throw TwTransportError("Cannot connect to " + host + ":" + service + ": " +
                           std::strerror(last_errno));
}

SocketTransport::~SocketTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (fd_ >= 0) ::close(fd_);
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void SocketTransport::start(FrameCallback on_frame, ErrorCallback on_error) {
    // Shut down before it ever started
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    connected_ = true;

    writer_thread_ = std::thread([this]() { write_loop(); });
    read_loop(on_frame, on_error);

    // The stream is over either way; nothing more can be sent.
    shutdown_requested_ = true;
    connected_ = false;
    running_ = false;
    write_cv_.notify_all();
}

void SocketTransport::read_loop(const FrameCallback& on_frame, const ErrorCallback& on_error) {
    std::vector<char> chunk(kReadChunk);

    while (running_) {
        struct pollfd fds[2];
        fds[0].fd = fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report(on_error, std::make_exception_ptr(
                TwTransportError(std::string("poll failed: ") + std::strerror(errno))));
            break;
        }

        // shutdown() was called
        if (fds[1].revents & POLLIN) break;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL))) continue;

        ssize_t n = ::recv(fd_, chunk.data(), chunk.size(), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            report(on_error, std::make_exception_ptr(
                TwTransportError(std::string("Read error: ") + std::strerror(errno))));
            // Unblock a writer stuck on a dead peer.
            ::shutdown(fd_, SHUT_RDWR);
            break;
        }
        if (n == 0) {
            log::logger()->info("peer closed the connection");
            ::shutdown(fd_, SHUT_RDWR);
            break;
        }

        parser_.feed(chunk.data(), static_cast<size_t>(n));

        while (true) {
            std::optional<nlohmann::json> value;
            try {
                value = parser_.next();
            } catch (const TwParseError&) {
                report(on_error, std::current_exception());
                continue;
            }
            if (!value) break;
            on_frame(std::move(*value));
        }
    }
}

void SocketTransport::write_loop() {
    while (true) {
        std::string msg_to_write;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || !running_;
            });

            if (!running_ && write_queue_.empty()) break;
            msg_to_write = std::move(write_queue_.front());
            write_queue_.pop();
        }

        // Newline is inter-value whitespace; it also keeps traces readable.
        msg_to_write += '\n';
        const char* data = msg_to_write.data();
        size_t remaining = msg_to_write.size();

        while (remaining > 0) {
            ssize_t written = ::send(fd_, data, remaining, MSG_NOSIGNAL);
            if (written < 0) {
                if (errno == EINTR) continue;
                log::logger()->error("write failed: {}", std::strerror(errno));
                shutdown_requested_ = true;
                connected_ = false;
                wake_reader();
                return;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void SocketTransport::send(const JsonRpcMessage& msg) {
    // Messages queued before start() are drained once write_loop() runs.
    if (shutdown_requested_.load()) {
        throw TwTransportError("Transport shut down");
    }
    std::string serialized = Codec::serialize(msg);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(serialized));
    }
    write_cv_.notify_one();
}

void SocketTransport::shutdown() {
    shutdown_requested_ = true;
    running_ = false;
    connected_ = false;
    write_cv_.notify_all();
    // Also covers a start() racing with this call: the pending byte makes
    // its first poll() return at once.
    wake_reader();
}

void SocketTransport::wake_reader() {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        // A full pipe already holds a pending wakeup.
        (void)!::write(wakeup_pipe_[1], &b, 1);
    }
}

bool SocketTransport::is_connected() const {
    return connected_;
}

} // namespace triggerware
