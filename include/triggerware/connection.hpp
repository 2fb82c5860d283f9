#pragma once
#include "json_rpc.hpp"
#include "dispatch_table.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace triggerware {

/// A JSON-RPC peer over one ITransport: outbound calls and notifications,
/// plus the server's calls and notifications back into the client.
///
/// Threads: one reader runs the transport's receive loop and routes replies
/// straight to their waiting callers. Inbound calls and notifications are
/// queued to a single dispatch thread and handled there in wire order. A
/// handler may therefore issue a blocking call(): the reader keeps routing
/// replies while the dispatch thread waits. Later notifications queue up
/// behind a handler that is blocked this way.
///
/// Closing, explicit or because the stream ended, is final: pending calls
/// fail with TwTransportError and so does every later call().
class Connection {
public:
    struct Options {
        /// Client-side deadline for call(). Unset means wait until the reply
        /// arrives or the connection closes.
        std::optional<std::chrono::milliseconds> call_timeout;
    };

    /// Takes ownership of the transport and starts the reader and dispatch
    /// threads.
    explicit Connection(std::unique_ptr<ITransport> transport);
    Connection(std::unique_ptr<ITransport> transport, Options opts);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Send a request and block until its reply.
    /// Returns the reply's "result". Throws TwProtocolError carrying the
    /// peer's code when the reply is an error, TwTransportError when the
    /// connection closes first or the reply has neither result nor error,
    /// TwTimeoutError when Options::call_timeout expires.
    nlohmann::json call(const std::string& method, nlohmann::json params);

    /// Send a notification; returns without waiting for anything.
    void notify(const std::string& method, nlohmann::json params);

    /// Register handlers for an inbound method name.
    void add_method(const std::string& name, MethodHandler handler);
    bool remove_method(const std::string& name);
    [[nodiscard]] bool has_method(const std::string& name) const;

    /// Allocate a method name unique on this connection (see NameAllocator).
    [[nodiscard]] std::string allocate_name(const std::string& prefix);

    /// Shut the transport down and fail every pending call. Safe to call
    /// more than once and from a handler.
    void close();

    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] size_t pending_calls() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace triggerware
