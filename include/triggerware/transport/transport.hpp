#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace triggerware {

/// Callback for each complete JSON value read off the stream
using FrameCallback = std::function<void(nlohmann::json)>;
/// Callback for a per-message failure (undecodable bytes) or the fatal
/// error that ends the stream
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract byte-stream transport
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run the receive loop on the calling thread. Returns once the peer
    /// closes the stream, a read fails, or shutdown() is called.
    virtual void start(FrameCallback on_frame,
                       ErrorCallback on_error = nullptr) = 0;

    /// Queue a message for the peer. Never blocks on the network.
    /// Throws TwTransportError after shutdown.
    virtual void send(const JsonRpcMessage& msg) = 0;

    /// Stop both directions; makes a running start() return.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace triggerware
