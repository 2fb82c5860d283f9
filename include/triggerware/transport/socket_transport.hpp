#pragma once
#include "transport.hpp"
#include "../frame_parser.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace triggerware {

/// SocketTransport exchanges whitespace-separated JSON values over one
/// connected stream socket. Reading happens on whichever thread calls
/// start(); writing goes through a queue drained by an internal writer
/// thread, so send() never waits on the peer.
class SocketTransport : public ITransport {
public:
    /// Adopt an already connected socket (TCP, or one end of a socketpair in
    /// tests). The transport closes it on destruction.
    explicit SocketTransport(int fd);

    /// Resolve host and open a TCP connection.
    /// Throws TwTransportError if no address accepts the connection.
    [[nodiscard]] static std::unique_ptr<SocketTransport> connect(const std::string& host,
                                                                  uint16_t port);

    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    void start(FrameCallback on_frame, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const FrameCallback& on_frame, const ErrorCallback& on_error);
    void write_loop();
    void wake_reader();

    int fd_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in read_loop
    FrameParser parser_;
};

} // namespace triggerware
