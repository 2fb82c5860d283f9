#include <gtest/gtest.h>
#include "triggerware/codec.hpp"
#include "triggerware/error.hpp"

using namespace triggerware;

// ---- Decode tests ----

TEST(CodecDecode, Object) {
    auto j = Codec::decode(R"({"handle":3,"batch":{"tuples":[[1,"a",2.5,true,null]],"exhausted":false}})");
    EXPECT_EQ(j["handle"], 3);
    auto& row = j["batch"]["tuples"][0];
    EXPECT_EQ(row[0], 1);
    EXPECT_EQ(row[1], "a");
    EXPECT_DOUBLE_EQ(row[2].get<double>(), 2.5);
    EXPECT_EQ(row[3], true);
    EXPECT_TRUE(row[4].is_null());
    EXPECT_EQ(j["batch"]["exhausted"], false);
}

TEST(CodecDecode, IntegersStayIntegers) {
    auto j = Codec::decode(R"([1991, -4, 1.0])");
    EXPECT_TRUE(j[0].is_number_integer());
    EXPECT_TRUE(j[1].is_number_integer());
    EXPECT_TRUE(j[2].is_number_float());
}

TEST(CodecDecode, ScalarDocuments) {
    EXPECT_EQ(Codec::decode("42"), 42);
    EXPECT_EQ(Codec::decode(R"("text")"), "text");
    EXPECT_EQ(Codec::decode("true"), true);
    EXPECT_TRUE(Codec::decode("null").is_null());
}

TEST(CodecDecode, InvalidJson) {
    EXPECT_THROW((void)Codec::decode("{invalid json"), TwParseError);
}

TEST(CodecDecode, EmptyInput) {
    EXPECT_THROW((void)Codec::decode(""), TwParseError);
}

TEST(CodecDecode, TrailingContent) {
    EXPECT_THROW((void)Codec::decode(R"({"a":1} x)"), TwParseError);
}

// ---- Classification tests ----

TEST(CodecParse, Request) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":5,"method":"sub0","params":{"tuple":[1]}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 5);
    EXPECT_EQ(req.method, "sub0");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ((*req.params)["tuple"][0], 1);
}

TEST(CodecParse, RequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"abc","method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<std::string>(std::get<JsonRpcRequest>(msg).id), "abc");
}

TEST(CodecParse, Notification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"poll0","params":{"delta":{}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "poll0");
}

TEST(CodecParse, NullIdIsNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"poll0"})");
    EXPECT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
}

TEST(CodecParse, ResultResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":0,"result":{"handle":1}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_FALSE(resp.error.has_value());
    EXPECT_EQ((*resp.result)["handle"], 1);
}

TEST(CodecParse, ErrorResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"nope"}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
    EXPECT_EQ(resp.error->message, "nope");
}

TEST(CodecParse, ResponseWithNeitherResultNorErrorStillClassified) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":2})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_FALSE(resp.result.has_value());
    EXPECT_FALSE(resp.error.has_value());
}

TEST(CodecParse, MissingVersion) {
    try {
        (void)Codec::parse(R"({"id":1,"method":"ping"})");
        FAIL() << "expected TwProtocolError";
    } catch (const TwProtocolError& e) {
        EXPECT_EQ(e.code, error::InvalidRequest);
    }
}

TEST(CodecParse, WrongVersion) {
    EXPECT_THROW((void)Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), TwProtocolError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW((void)Codec::parse("[1,2,3]"), TwProtocolError);
}

TEST(CodecParse, NeitherIdNorMethod) {
    EXPECT_THROW((void)Codec::parse(R"({"jsonrpc":"2.0","result":1})"), TwProtocolError);
}

TEST(CodecParse, MalformedErrorObject) {
    EXPECT_THROW((void)Codec::parse(R"({"jsonrpc":"2.0","id":1,"error":"bad"})"), TwProtocolError);
}

TEST(CodecParse, InvalidJsonIsParseError) {
    EXPECT_THROW((void)Codec::parse("{"), TwParseError);
}

// ---- Serialize tests ----

TEST(CodecSerialize, RequestIsCompact) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{0}};
    req.method = "execute-query";
    req.params = nlohmann::json{{"query", "q"}};
    auto text = Codec::serialize(req);
    EXPECT_EQ(text.find('\n'), std::string::npos);
    auto back = nlohmann::json::parse(text);
    EXPECT_EQ(back["jsonrpc"], "2.0");
    EXPECT_EQ(back["id"], 0);
    EXPECT_EQ(back["method"], "execute-query");
    EXPECT_EQ(back["params"]["query"], "q");
}
