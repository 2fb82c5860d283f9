#include <gtest/gtest.h>
#include "triggerware/connection.hpp"
#include "triggerware/error.hpp"
#include "support/fake_server.hpp"
#include <chrono>
#include <future>
#include <mutex>
#include <vector>

using namespace triggerware;
using triggerware::test::FakeServer;
using triggerware::test::eventually;
using namespace std::chrono_literals;

TEST(Connection, CallReturnsResult) {
    FakeServer server;
    server.on("echo", [](const nlohmann::json& params) { return params; });
    server.start();
    Connection conn(server.client_transport());

    auto result = conn.call("echo", {{"value", 3}});
    EXPECT_EQ(result["value"], 3);

    auto req = server.requests("echo").front();
    EXPECT_EQ(req["jsonrpc"], "2.0");
    EXPECT_EQ(req["id"], 0);
}

TEST(Connection, RepliesAreMatchedByIdInAnyOrder) {
    FakeServer server;
    server.start();
    Connection conn(server.client_transport());

    auto a = std::async(std::launch::async, [&conn] {
        return conn.call("a", nlohmann::json::object());
    });
    ASSERT_TRUE(server.wait_for_request("a").has_value());
    auto b = std::async(std::launch::async, [&conn] {
        return conn.call("b", nlohmann::json::object());
    });
    ASSERT_TRUE(server.wait_for_request("b").has_value());

    EXPECT_EQ(server.requests("a").front()["id"], 0);
    EXPECT_EQ(server.requests("b").front()["id"], 1);

    server.reply(1, "B");
    ASSERT_EQ(b.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(b.get(), "B");
    EXPECT_EQ(a.wait_for(50ms), std::future_status::timeout);
    EXPECT_EQ(conn.pending_calls(), 1u);

    server.reply(0, "A");
    EXPECT_EQ(a.get(), "A");
}

TEST(Connection, ErrorReplyCarriesCodeAndMessage) {
    FakeServer server;
    server.on_error("execute-query", error::InvalidParams, "bad query");
    server.start();
    Connection conn(server.client_transport());

    try {
        (void)conn.call("execute-query", nlohmann::json::object());
        FAIL() << "expected TwProtocolError";
    } catch (const TwProtocolError& e) {
        EXPECT_EQ(e.code, error::InvalidParams);
        EXPECT_STREQ(e.what(), "bad query");
    }
}

TEST(Connection, ReplyWithoutResultOrErrorIsInvalidResponse) {
    FakeServer server;
    server.start();
    Connection conn(server.client_transport());

    auto pending = std::async(std::launch::async, [&conn] {
        return conn.call("m", nlohmann::json::object());
    });
    ASSERT_TRUE(server.wait_for_request("m").has_value());
    server.send({{"jsonrpc", "2.0"}, {"id", 0}});

    try {
        (void)pending.get();
        FAIL() << "expected TwTransportError";
    } catch (const TwTransportError& e) {
        EXPECT_EQ(e.code, error::ServerError);
    }
}

TEST(Connection, ReplyWithWrongVersionFailsOnlyThatCall) {
    FakeServer server;
    server.start();
    Connection conn(server.client_transport());

    auto bad = std::async(std::launch::async, [&conn] {
        return conn.call("bad", nlohmann::json::object());
    });
    ASSERT_TRUE(server.wait_for_request("bad").has_value());
    server.send({{"jsonrpc", "1.0"}, {"id", 0}, {"result", 1}});

    try {
        (void)bad.get();
        FAIL() << "expected TwProtocolError";
    } catch (const TwProtocolError& e) {
        EXPECT_EQ(e.code, error::InvalidRequest);
    }

    server.respond("good", 2);
    EXPECT_EQ(conn.call("good", nlohmann::json::object()), 2);
    EXPECT_FALSE(conn.is_closed());
}

TEST(Connection, InboundCallToUnknownMethodGetsMethodNotFound) {
    FakeServer server;
    server.start();
    Connection conn(server.client_transport());

    server.send({{"jsonrpc", "2.0"}, {"id", "srv-1"}, {"method", "nobody"}, {"params", {}}});
    auto resp = server.wait_for_response("srv-1");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["id"], "srv-1");
    EXPECT_EQ((*resp)["error"]["code"], error::MethodNotFound);
    EXPECT_FALSE(resp->contains("result"));
}

TEST(Connection, InboundCallRunsExecuteHandler) {
    FakeServer server;
    server.start();
    Connection conn(server.client_transport());
    conn.add_method("double", {[](const nlohmann::json& p) -> HandlerResult {
        return p.at("n").get<int>() * 2;
    }, nullptr});

    server.send({{"jsonrpc", "2.0"}, {"id", 77}, {"method", "double"}, {"params", {{"n", 21}}}});
    auto resp = server.wait_for_response(77);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["result"], 42);
}

TEST(Connection, UnknownNotificationProducesNoOutput) {
    FakeServer server;
    server.start();
    Connection conn(server.client_transport());
    conn.add_method("ping", {[](const nlohmann::json&) -> HandlerResult { return "pong"; }, nullptr});

    server.notify("nobody", {{"x", 1}});
    // Inbound messages are handled in order: once ping is answered the
    // notification has been dealt with.
    server.send({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}});
    ASSERT_TRUE(server.wait_for_response(1).has_value());

    EXPECT_EQ(server.messages().size(), 1u);
    EXPECT_FALSE(conn.is_closed());
}

TEST(Connection, NotificationsAreDeliveredInWireOrder) {
    FakeServer server;
    server.start();
    Connection conn(server.client_transport());

    std::mutex mutex;
    std::vector<int> seen;
    conn.add_method("seq", {nullptr, [&](const nlohmann::json& p) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(p.at("n").get<int>());
    }});

    for (int i = 0; i < 50; ++i) server.notify("seq", {{"n", i}});

    ASSERT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return seen.size() == 50;
    }));
    for (int i = 0; i < 50; ++i) EXPECT_EQ(seen[i], i);
}

TEST(Connection, HandlerMayIssueBlockingCall) {
    FakeServer server;
    server.respond("lookup", nlohmann::json{{"value", 42}});
    server.start();
    Connection conn(server.client_transport());

    conn.add_method("ask", {[&conn](const nlohmann::json& p) -> HandlerResult {
        return conn.call("lookup", p);
    }, nullptr});

    server.send({{"jsonrpc", "2.0"}, {"id", 100}, {"method", "ask"}, {"params", {{"key", "k"}}}});
    auto resp = server.wait_for_response(100);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["result"]["value"], 42);
    EXPECT_EQ(server.requests("lookup").front()["params"]["key"], "k");
}

TEST(Connection, NotifySendsNoId) {
    FakeServer server;
    server.start();
    Connection conn(server.client_transport());

    conn.notify("hello", {{"a", 1}});
    auto msg = server.wait_for_request("hello");
    ASSERT_TRUE(msg.has_value());
    EXPECT_FALSE(msg->contains("id"));
    EXPECT_EQ((*msg)["params"]["a"], 1);
}

TEST(Connection, PeerCloseFailsPendingCalls) {
    FakeServer server;
    server.start();
    Connection conn(server.client_transport());

    auto a = std::async(std::launch::async, [&conn] {
        return conn.call("a", nlohmann::json::object());
    });
    auto b = std::async(std::launch::async, [&conn] {
        return conn.call("b", nlohmann::json::object());
    });
    ASSERT_TRUE(server.wait_for_request("a").has_value());
    ASSERT_TRUE(server.wait_for_request("b").has_value());

    server.close();

    EXPECT_THROW((void)a.get(), TwTransportError);
    EXPECT_THROW((void)b.get(), TwTransportError);
    EXPECT_TRUE(eventually([&] { return conn.is_closed(); }));
    EXPECT_THROW((void)conn.call("c", nlohmann::json::object()), TwTransportError);
    EXPECT_THROW(conn.notify("n", nlohmann::json::object()), TwTransportError);
}

TEST(Connection, LocalCloseFailsPendingCallsAndIsFinal) {
    FakeServer server;
    server.start();
    Connection conn(server.client_transport());

    auto a = std::async(std::launch::async, [&conn] {
        return conn.call("a", nlohmann::json::object());
    });
    ASSERT_TRUE(server.wait_for_request("a").has_value());

    conn.close();
    conn.close();
    EXPECT_THROW((void)a.get(), TwTransportError);
    EXPECT_TRUE(conn.is_closed());
    EXPECT_THROW((void)conn.call("b", nlohmann::json::object()), TwTransportError);
}

TEST(Connection, CallTimeoutAbandonsTheCall) {
    FakeServer server;
    server.respond("ping", "pong");
    server.start();
    Connection::Options opts;
    opts.call_timeout = std::chrono::milliseconds(50);
    Connection conn(server.client_transport(), opts);

    EXPECT_THROW((void)conn.call("never", nlohmann::json::object()), TwTimeoutError);
    EXPECT_EQ(conn.pending_calls(), 0u);

    // A late reply to the abandoned id is dropped.
    server.reply(0, "late");
    EXPECT_EQ(conn.call("ping", nlohmann::json::object()), "pong");
    EXPECT_FALSE(conn.is_closed());
}

TEST(Connection, MethodNamesAreUniquePerConnection) {
    FakeServer server;
    server.start();
    Connection conn(server.client_transport());
    EXPECT_EQ(conn.allocate_name("poll"), "poll0");
    EXPECT_EQ(conn.allocate_name("poll"), "poll1");
    EXPECT_EQ(conn.allocate_name("sub"), "sub0");
}
