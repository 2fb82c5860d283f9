#include "triggerware/connection.hpp"
#include "triggerware/codec.hpp"
#include "triggerware/correlation_table.hpp"
#include "triggerware/error.hpp"
#include "triggerware/log.hpp"
#include "triggerware/name_allocator.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace triggerware {

struct Connection::Impl {
    Options opts;
    std::unique_ptr<ITransport> transport;
    CorrelationTable correlation;
    DispatchTable dispatch_table;
    NameAllocator names;

    std::thread reader_thread;
    std::atomic<bool> closed{false};

    // Reason reported to callers when the reader stops on its own.
    std::mutex reason_mutex;
    std::string close_reason{"Connection closed by server"};

    // Inbound calls and notifications waiting for the dispatch thread
    std::mutex inbound_mutex;
    std::condition_variable inbound_cv;
    std::deque<JsonRpcMessage> inbound;
    bool stop_dispatch{false};
    std::thread dispatch_thread;

    Impl(std::unique_ptr<ITransport> t, Options o)
        : opts(std::move(o)), transport(std::move(t)) {}

    void on_frame(nlohmann::json frame) {
        JsonRpcMessage msg;
        try {
            msg = Codec::to_message(frame);
        } catch (const TwProtocolError& e) {
            log::logger()->warn("discarding message: {}", e.what());
            // A reply with a bad envelope still names its caller; fail that
            // call instead of leaving it blocked.
            if (frame.is_object() && !frame.contains("method")) {
                auto id = frame.find("id");
                if (id != frame.end() && id->is_number_integer()) {
                    correlation.fail(id->get<int64_t>(),
                                     std::make_exception_ptr(TwProtocolError(e.code, e.what())));
                }
            }
            return;
        }

        if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
            const auto* id = std::get_if<int64_t>(&resp->id);
            if (id == nullptr || !correlation.complete(*id, std::move(*resp))) {
                log::logger()->debug("dropping reply with no waiting call: {}", frame.dump());
            }
            return;
        }

        {
            std::lock_guard<std::mutex> lock(inbound_mutex);
            inbound.push_back(std::move(msg));
        }
        inbound_cv.notify_one();
    }

    void on_transport_error(std::exception_ptr ex) {
        try {
            std::rethrow_exception(ex);
        } catch (const TwParseError& e) {
            log::logger()->warn("undecodable message skipped: {}", e.what());
        } catch (const TwTransportError& e) {
            log::logger()->error("connection failed: {}", e.what());
            std::lock_guard<std::mutex> lock(reason_mutex);
            close_reason = std::string("Connection lost: ") + e.what();
        } catch (const std::exception& e) {
            log::logger()->error("transport error: {}", e.what());
        }
    }

    void dispatch_loop() {
        while (true) {
            JsonRpcMessage msg;
            {
                std::unique_lock<std::mutex> lock(inbound_mutex);
                inbound_cv.wait(lock, [this] { return !inbound.empty() || stop_dispatch; });
                // Notifications that arrived before the close are still delivered.
                if (inbound.empty()) break;
                msg = std::move(inbound.front());
                inbound.pop_front();
            }

            auto response = dispatch_table.dispatch(msg);
            if (!response) continue;
            try {
                transport->send(*response);
            } catch (const TwTransportError& e) {
                log::logger()->debug("reply to inbound call not sent: {}", e.what());
            }
        }
    }

    void finish(const std::string& reason) {
        closed = true;
        correlation.close(reason);
        {
            std::lock_guard<std::mutex> lock(inbound_mutex);
            stop_dispatch = true;
        }
        inbound_cv.notify_all();
    }

    void start() {
        dispatch_thread = std::thread([this]() { dispatch_loop(); });
        reader_thread = std::thread([this]() {
            try {
                transport->start(
                    [this](nlohmann::json frame) { on_frame(std::move(frame)); },
                    [this](std::exception_ptr ex) { on_transport_error(std::move(ex)); });
            } catch (const std::exception& e) {
                log::logger()->error("receive loop aborted: {}", e.what());
                std::lock_guard<std::mutex> lock(reason_mutex);
                close_reason = std::string("Connection lost: ") + e.what();
            }
            std::string reason;
            {
                std::lock_guard<std::mutex> lock(reason_mutex);
                reason = close_reason;
            }
            if (!closed) log::logger()->info("{}", reason);
            finish(reason);
        });
    }

    void join_threads() {
        auto self = std::this_thread::get_id();
        if (reader_thread.joinable() && reader_thread.get_id() != self) reader_thread.join();
        if (dispatch_thread.joinable() && dispatch_thread.get_id() != self) dispatch_thread.join();
    }
};

Connection::Connection(std::unique_ptr<ITransport> transport)
    : Connection(std::move(transport), Options{}) {}

Connection::Connection(std::unique_ptr<ITransport> transport, Options opts)
    : impl_(std::make_unique<Impl>(std::move(transport), std::move(opts))) {
    if (!impl_->transport) {
        throw TwTransportError("No transport");
    }
    impl_->start();
}

Connection::~Connection() {
    close();
}

nlohmann::json Connection::call(const std::string& method, nlohmann::json params) {
    auto [id, fut] = impl_->correlation.open(method);

    JsonRpcRequest req;
    req.id = RequestId{id};
    req.method = method;
    req.params = std::move(params);
    try {
        impl_->transport->send(req);
    } catch (const TwTransportError&) {
        impl_->correlation.abandon(id);
        throw;
    }

    if (impl_->opts.call_timeout &&
        fut.wait_for(*impl_->opts.call_timeout) == std::future_status::timeout) {
        impl_->correlation.abandon(id);
        throw TwTimeoutError("Call timed out: " + method);
    }

    JsonRpcResponse resp = fut.get();
    if (resp.error) {
        throw TwProtocolError(resp.error->code, resp.error->message);
    }
    if (!resp.result) {
        throw TwTransportError("Server sent an invalid response to '" + method + "'");
    }
    return std::move(*resp.result);
}

void Connection::notify(const std::string& method, nlohmann::json params) {
    if (impl_->closed) {
        throw TwTransportError("Connection closed");
    }
    JsonRpcNotification notif;
    notif.method = method;
    notif.params = std::move(params);
    impl_->transport->send(notif);
}

void Connection::add_method(const std::string& name, MethodHandler handler) {
    impl_->dispatch_table.add_method(name, std::move(handler));
}

bool Connection::remove_method(const std::string& name) {
    return impl_->dispatch_table.remove_method(name);
}

bool Connection::has_method(const std::string& name) const {
    return impl_->dispatch_table.has_method(name);
}

std::string Connection::allocate_name(const std::string& prefix) {
    return impl_->names.allocate(prefix);
}

void Connection::close() {
    if (!impl_) return;
    bool was_closed = impl_->closed.exchange(true);
    impl_->transport->shutdown();
    impl_->finish("Connection closed");
    impl_->join_threads();
    if (!was_closed) log::logger()->info("connection closed");
}

bool Connection::is_closed() const {
    return impl_->closed;
}

size_t Connection::pending_calls() const {
    return impl_->correlation.pending_count();
}

} // namespace triggerware
