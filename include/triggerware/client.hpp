#pragma once
#include "types.hpp"
#include "version.hpp"
#include "connection.hpp"
#include "result_set.hpp"
#include "transport/transport.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace triggerware {

/// Connection to a Triggerware server plus the handful of requests every
/// server supports. Queries, polled queries and subscriptions are built on
/// top of a client and keep a reference to it, so the client must outlive
/// them.
class TriggerwareClient {
public:
    struct Options {
        std::string host = "localhost";
        uint16_t port = DEFAULT_PORT;
        /// Rows per next-resultset-batch call when a cursor is not given one
        std::optional<int64_t> default_fetch_size;
        /// Server-side time limit in seconds when a cursor is not given one
        std::optional<double> default_timeout;
        /// Client-side deadline for every call (see Connection::Options)
        std::optional<std::chrono::milliseconds> call_timeout;
        /// Applied to the library logger when set
        std::optional<spdlog::level::level_enum> log_level;
    };

    /// Open a TCP connection to opts.host:opts.port.
    explicit TriggerwareClient(Options opts);

    /// Run over an already established transport; host and port are unused.
    TriggerwareClient(std::unique_ptr<ITransport> transport, Options opts);

    ~TriggerwareClient();

    TriggerwareClient(const TriggerwareClient&) = delete;
    TriggerwareClient& operator=(const TriggerwareClient&) = delete;

    [[nodiscard]] Connection& connection() { return *connection_; }
    [[nodiscard]] const Options& options() const { return opts_; }

    /// Validate and execute a query; same as building a View and executing it.
    [[nodiscard]] ResultSet execute_query(const Query& query,
                                          const std::optional<QueryRestriction>& restriction = std::nullopt);

    /// Throws InvalidQueryError if the server rejects the query.
    void validate_query(const Query& query);

    /// The connectors the server currently offers, grouped by use case.
    [[nodiscard]] std::vector<RelDataGroup> get_rel_data();

    /// Record a handle the server assigned to an object of this client.
    void register_handle(int64_t handle);
    [[nodiscard]] std::vector<int64_t> handles() const;

    void close();
    [[nodiscard]] bool is_connected() const;

private:
    Options opts_;
    std::unique_ptr<Connection> connection_;

    mutable std::mutex handles_mutex_;
    std::vector<int64_t> handles_;
};

} // namespace triggerware
