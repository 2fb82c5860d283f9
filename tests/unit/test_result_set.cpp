#include <gtest/gtest.h>
#include "triggerware/result_set.hpp"
#include "triggerware/error.hpp"
#include "support/fake_server.hpp"

using namespace triggerware;
using triggerware::test::FakeServer;
using triggerware::test::connect_client;

namespace {

nlohmann::json batch(nlohmann::json tuples, bool exhausted) {
    return {{"batch", {{"tuples", std::move(tuples)}, {"exhausted", exhausted}}}};
}

} // anonymous namespace

TEST(ResultSet, WithoutHandleOnlyServesInitialBatch) {
    FakeServer server;
    auto client = connect_client(server);

    ResultSet rs(*client, batch(nlohmann::json::parse("[[1],[2]]"), false));
    EXPECT_TRUE(rs.exhausted());
    EXPECT_FALSE(rs.handle().has_value());
    EXPECT_EQ(rs.cached_rows(), 2u);

    auto rows = rs.pull(5);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0][0], 1);
    EXPECT_EQ(rows[1][0], 2);
    EXPECT_FALSE(rs.next().has_value());
    EXPECT_EQ(server.count("next-resultset-batch"), 0u);
}

TEST(ResultSet, EmptyExecutionResult) {
    FakeServer server;
    auto client = connect_client(server);

    ResultSet rs(*client, nlohmann::json::object());
    EXPECT_TRUE(rs.exhausted());
    EXPECT_TRUE(rs.signature().is_array());
    EXPECT_TRUE(rs.pull(3).empty());
}

TEST(ResultSet, NonObjectResultRejected) {
    FakeServer server;
    auto client = connect_client(server);
    EXPECT_THROW((void)ResultSet(*client, nlohmann::json::array()), TwTransportError);
}

TEST(ResultSet, FetchesNextBatchOnDemand) {
    FakeServer server;
    server.respond("next-resultset-batch", batch(nlohmann::json::parse("[[2],[3]]"), true));
    auto client = connect_client(server);

    auto initial = batch(nlohmann::json::parse("[[1]]"), false);
    initial["handle"] = 4;
    initial["signature"] = nlohmann::json::array({{{"attribute", "x"}, {"type", "integer"}}});
    ResultSet rs(*client, initial);
    EXPECT_FALSE(rs.exhausted());
    EXPECT_EQ(rs.signature().size(), 1u);

    auto first = rs.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ((*first)[0], 1);
    EXPECT_EQ(server.count("next-resultset-batch"), 0u);

    auto rest = rs.pull(10);
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[1][0], 3);
    EXPECT_TRUE(rs.exhausted());
    EXPECT_EQ(server.count("next-resultset-batch"), 1u);

    auto req = server.requests("next-resultset-batch").front();
    EXPECT_EQ(req["params"][0], 4);
    EXPECT_TRUE(req["params"][1].is_null());
    EXPECT_TRUE(req["params"][2].is_null());
}

TEST(ResultSet, InitialBatchMayAlreadyBeExhausted) {
    FakeServer server;
    auto client = connect_client(server);

    auto initial = batch(nlohmann::json::parse("[[1]]"), true);
    initial["handle"] = 5;
    ResultSet rs(*client, initial);
    EXPECT_TRUE(rs.exhausted());
    EXPECT_EQ(rs.pull(3).size(), 1u);
    EXPECT_FALSE(rs.next().has_value());
    EXPECT_EQ(server.count("next-resultset-batch"), 0u);
}

TEST(ResultSet, ExhaustedCursorMakesNoFurtherCalls) {
    FakeServer server;
    server.respond("next-resultset-batch", batch(nlohmann::json::parse("[[9]]"), true));
    auto client = connect_client(server);

    auto initial = batch(nlohmann::json::array(), false);
    initial["handle"] = 1;
    ResultSet rs(*client, initial);
    EXPECT_EQ(rs.pull(5).size(), 1u);
    EXPECT_TRUE(rs.exhausted());

    EXPECT_TRUE(rs.pull(5).empty());
    EXPECT_FALSE(rs.next().has_value());
    EXPECT_TRUE(rs.exhausted());
    EXPECT_EQ(server.count("next-resultset-batch"), 1u);
}

TEST(ResultSet, EmptyBatchEndsSequence) {
    FakeServer server;
    server.respond("next-resultset-batch", batch(nlohmann::json::array(), false));
    auto client = connect_client(server);

    auto initial = batch(nlohmann::json::array(), false);
    initial["handle"] = 2;
    ResultSet rs(*client, initial);
    EXPECT_FALSE(rs.next().has_value());
    EXPECT_EQ(server.count("next-resultset-batch"), 1u);
}

TEST(ResultSet, ExplicitLimitsAreSent) {
    FakeServer server;
    server.respond("next-resultset-batch", batch(nlohmann::json::parse("[[1]]"), true));
    auto client = connect_client(server);

    auto initial = batch(nlohmann::json::array(), false);
    initial["handle"] = 6;
    ResultSet rs(*client, initial, int64_t{25}, 1.5);
    (void)rs.next();

    auto req = server.requests("next-resultset-batch").front();
    EXPECT_EQ(req["params"], nlohmann::json::array({6, 25, 1.5}));
}

TEST(ResultSet, ClientDefaultsApplyWhenUnset) {
    FakeServer server;
    server.respond("next-resultset-batch", batch(nlohmann::json::parse("[[1]]"), true));
    TriggerwareClient::Options opts;
    opts.default_fetch_size = 100;
    opts.default_timeout = 2.0;
    auto client = connect_client(server, opts);

    auto initial = batch(nlohmann::json::array(), false);
    initial["handle"] = 8;
    ResultSet rs(*client, initial);
    EXPECT_EQ(rs.row_limit(), int64_t{100});
    (void)rs.next();

    auto req = server.requests("next-resultset-batch").front();
    EXPECT_EQ(req["params"][1], 100);
    EXPECT_DOUBLE_EQ(req["params"][2].get<double>(), 2.0);
}

TEST(ResultSet, MalformedBatchIsTransportError) {
    FakeServer server;
    server.respond("next-resultset-batch", nlohmann::json{{"rows", 1}});
    auto client = connect_client(server);

    auto initial = batch(nlohmann::json::array(), false);
    initial["handle"] = 3;
    ResultSet rs(*client, initial);
    EXPECT_THROW((void)rs.next(), TwTransportError);
}

TEST(ResultSet, ServerErrorPropagates) {
    FakeServer server;
    server.on_error("next-resultset-batch", -32602, "unknown handle");
    auto client = connect_client(server);

    auto initial = batch(nlohmann::json::array(), false);
    initial["handle"] = 3;
    ResultSet rs(*client, initial);
    try {
        (void)rs.next();
        FAIL() << "expected TwProtocolError";
    } catch (const TwProtocolError& e) {
        EXPECT_EQ(e.code, -32602);
        EXPECT_STREQ(e.what(), "unknown handle");
    }
}
