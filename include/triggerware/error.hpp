#pragma once
#include <stdexcept>
#include <string>

namespace triggerware {

namespace error {
    constexpr int ParseError     = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams  = -32602;
    constexpr int InternalError  = -32603;
    // Raised locally on connection loss or a malformed reply.
    constexpr int ServerError    = -32000;
} // namespace error

class TwError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Bytes that do not decode as JSON.
class TwParseError : public TwError {
public:
    using TwError::TwError;
};

/// A JSON-RPC error object, either received from the peer or raised locally.
class TwProtocolError : public TwError {
public:
    int code;
    TwProtocolError(int code, const std::string& msg)
        : TwError(msg), code(code) {}
};

/// Connection closed or lost, or the peer sent an unusable reply.
class TwTransportError : public TwProtocolError {
public:
    explicit TwTransportError(const std::string& msg)
        : TwProtocolError(error::ServerError, msg) {}
};

class TwTimeoutError : public TwError {
public:
    using TwError::TwError;
};

// ---- Domain errors ----

class TwClientError : public TwError {
public:
    using TwError::TwError;
};

class InvalidQueryError : public TwClientError {
public:
    using TwClientError::TwClientError;
};

class PreparedQueryError : public TwClientError {
public:
    using TwClientError::TwClientError;
};

class PolledQueryError : public TwClientError {
public:
    using TwClientError::TwClientError;
};

class SubscriptionError : public TwClientError {
public:
    using TwClientError::TwClientError;
};

/// Call from inside a catch handler for TwProtocolError. Connection loss and
/// internal errors are rethrown unchanged; anything else becomes E.
template <typename E>
[[noreturn]] void rethrow_as(const TwProtocolError& e, const std::string& context = {}) {
    if (e.code == error::ServerError || e.code == error::InternalError) throw;
    throw E(context.empty() ? std::string(e.what()) : context + ": " + e.what());
}

} // namespace triggerware
