#include <gtest/gtest.h>
#include "mcp/MethodDispatcher.h"
#include <atomic>
#include <stdexcept>
#include <thread>

namespace {
Response echo(const Request& request) {
    return Response::success(request.params.value_or(nullptr), request.responseId());
}
} // namespace

class MethodDispatcherTest : public ::testing::Test {
protected:
    MethodDispatcher dispatcher;
};

TEST_F(MethodDispatcherTest, UnregisteredMethodKeepsRequestId) {
    Response response = dispatcher.process(Request("missing", std::nullopt, JsonRpcId(7)));
    ASSERT_TRUE(response.isError());
    EXPECT_EQ(response.getError().code, static_cast<int>(ErrorCode::MethodNotFound));
    EXPECT_EQ(response.getId(), JsonRpcId(7));
}

TEST_F(MethodDispatcherTest, InvalidRequestIsRejectedBeforeLookup) {
    dispatcher.registerMethod("echo", echo);
    Request request("echo", nlohmann::json{{"a", 1}}, JsonRpcId("x"));
    request.jsonrpc = "1.0";

    Response response = dispatcher.process(request);
    ASSERT_TRUE(response.isError());
    EXPECT_EQ(response.getError().code, -32600);
    EXPECT_EQ(response.getId(), JsonRpcId("x"));

    Response noId = dispatcher.process(Request(""));
    EXPECT_EQ(noId.getError().code, -32600);
    EXPECT_TRUE(noId.getId().isNull());
}

TEST_F(MethodDispatcherTest, HandlerResponseIsReturnedVerbatim) {
    dispatcher.registerMethod("fixed", [](const Request&) {
        return Response::success("from handler", JsonRpcId(99));
    });
    Response response = dispatcher.process(Request("fixed", std::nullopt, JsonRpcId(1)));
    EXPECT_EQ(response, Response::success("from handler", JsonRpcId(99)));
}

TEST_F(MethodDispatcherTest, RegisterReplacesAndDeregisterReports) {
    dispatcher.registerMethod("m", [](const Request& r) { return Response::success(1, r.responseId()); });
    dispatcher.registerMethod("m", [](const Request& r) { return Response::success(2, r.responseId()); });
    EXPECT_EQ(dispatcher.process(Request("m", std::nullopt, JsonRpcId(1))).getResult(), 2);
    EXPECT_EQ(dispatcher.listMethods(), std::vector<std::string>{"m"});

    EXPECT_TRUE(dispatcher.deregisterMethod("m"));
    EXPECT_FALSE(dispatcher.deregisterMethod("m"));
    EXPECT_FALSE(dispatcher.hasMethod("m"));
    EXPECT_EQ(dispatcher.process(Request("m", std::nullopt, JsonRpcId(1))).getError().code, -32601);
}

TEST_F(MethodDispatcherTest, HandlerExceptionBecomesInternalError) {
    dispatcher.registerMethod("boom", [](const Request&) -> Response {
        throw std::runtime_error("kaboom");
    });
    Response response = dispatcher.process(Request("boom", std::nullopt, JsonRpcId(4)));
    ASSERT_TRUE(response.isError());
    EXPECT_EQ(response.getError().code, -32603);
    EXPECT_EQ(response.getId(), JsonRpcId(4));
}

TEST_F(MethodDispatcherTest, NonStandardThrowBecomesInternalError) {
    dispatcher.registerMethod("boom", [](const Request&) -> Response { throw 42; });
    Response response = Response::methodNotFound(JsonRpcId::null());
    ASSERT_NO_THROW(response = dispatcher.process(Request("boom", std::nullopt, JsonRpcId(5))));
    ASSERT_TRUE(response.isError());
    EXPECT_EQ(response.getError().code, -32603);
    EXPECT_EQ(response.getId(), JsonRpcId(5));
}

TEST_F(MethodDispatcherTest, HandlerMayMutateRegistry) {
    dispatcher.registerMethod("install", [this](const Request& r) {
        dispatcher.registerMethod("installed", echo);
        return Response::success(true, r.responseId());
    });
    EXPECT_TRUE(dispatcher.process(Request("install", std::nullopt, JsonRpcId(1))).isSuccess());
    EXPECT_TRUE(dispatcher.hasMethod("installed"));
}

TEST_F(MethodDispatcherTest, ProcessJsonMapsParseFailures) {
    auto malformed = nlohmann::json::parse(dispatcher.processJson("{\"jsonrpc\": \"2.0\", "));
    EXPECT_EQ(malformed["error"]["code"], -32700);
    EXPECT_TRUE(malformed["id"].is_null());

    auto notRequest = nlohmann::json::parse(dispatcher.processJson("[1, 2, 3]"));
    EXPECT_EQ(notRequest["error"]["code"], -32700);

    auto noMethod = nlohmann::json::parse(dispatcher.processJson(R"({"jsonrpc":"2.0","id":1})"));
    EXPECT_EQ(noMethod["error"]["code"], -32700);
}

TEST_F(MethodDispatcherTest, ProcessJsonRoundTrip) {
    dispatcher.registerMethod("echo", echo);
    auto out = nlohmann::json::parse(
        dispatcher.processJson(R"({"jsonrpc":"2.0","method":"echo","params":{"x":[1,2]},"id":"r1"})"));
    EXPECT_EQ(out["jsonrpc"], "2.0");
    EXPECT_EQ(out["id"], "r1");
    EXPECT_EQ(out["result"]["x"][1], 2);
}

TEST_F(MethodDispatcherTest, NotificationStillGetsResponse) {
    dispatcher.registerMethod("echo", echo);
    auto out = nlohmann::json::parse(dispatcher.processJson(R"({"jsonrpc":"2.0","method":"echo"})"));
    EXPECT_TRUE(out["id"].is_null());
    EXPECT_TRUE(out["result"].is_null());
}

TEST_F(MethodDispatcherTest, UnserializableResultBecomesInternalError) {
    dispatcher.registerMethod("bad_utf8", [](const Request& r) {
        return Response::success(std::string("\xff\xfe"), r.responseId());
    });
    auto out = nlohmann::json::parse(dispatcher.processJson(R"({"jsonrpc":"2.0","method":"bad_utf8","id":5})"));
    EXPECT_EQ(out["error"]["code"], -32603);
    EXPECT_EQ(out["id"], 5);
}

TEST_F(MethodDispatcherTest, ConcurrentDispatchAndRegistration) {
    dispatcher.registerMethod("echo", echo);
    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 200; ++i) {
                auto r = dispatcher.process(Request("echo", nlohmann::json(i), JsonRpcId(i)));
                if (r.isSuccess() && r.getResult() == i) ok++;
                if (i % 50 == 0) {
                    dispatcher.registerMethod("extra" + std::to_string(t), echo);
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(ok.load(), 800);
    EXPECT_EQ(dispatcher.listMethods().size(), 5u);
}
