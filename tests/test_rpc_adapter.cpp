//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_rpc_adapter.cpp
// Purpose: GoogleTests for the end-to-end JSON-RPC pipeline (validate, route, build)
//==========================================================================================================

#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <stop_token>
#include <string>

#include "mcpgate/RpcAdapter.h"
#include "mcpgate/ToolRegistry.h"

using namespace mcpgate;

namespace {

std::future<CallToolResult> ready(CallToolResult r) {
    std::promise<CallToolResult> p;
    p.set_value(std::move(r));
    return p.get_future();
}

//==========================================================================================================
// AdapterFixture
// Purpose: Registry with a "search" tool returning one text item, wrapped by an RpcAdapter.
//==========================================================================================================
class AdapterFixture : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<ToolRegistry>(Implementation{"fixture", "0.0.1"});
        registry->RegisterTool(Tool{"search", "Search", MakeObjectSchema({{"q", "string"}})},
            [](const JSONValue& args, std::stop_token) {
                CallToolResult r;
                const JSONValue* q = args.Find("q");
                r.content.push_back(MakeTextContent(q != nullptr && q->IsString() ? std::get<std::string>(q->value) : ""));
                return ready(std::move(r));
            });
        adapter = std::make_unique<RpcAdapter>(registry->Describe(), registry);
    }

    JSONValue post(const std::string& body, const std::string& contentType = "application/json") {
        return ParseJSON(adapter->HandleToJson(contentType, body));
    }

    static int code(const JSONValue& resp) {
        return static_cast<int>(std::get<int64_t>(resp.Find("error")->Find("code")->value));
    }

    std::shared_ptr<ToolRegistry> registry;
    std::unique_ptr<RpcAdapter> adapter;
};

} // namespace

TEST_F(AdapterFixture, InitializeScenario) {
    JSONValue resp = post(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
    EXPECT_EQ(std::get<std::string>(resp.Find("jsonrpc")->value), "2.0");
    EXPECT_EQ(std::get<int64_t>(resp.Find("id")->value), 1);
    ASSERT_NE(resp.Find("result"), nullptr);
    EXPECT_EQ(resp.Find("error"), nullptr);
    EXPECT_NE(resp.Find("result")->Find("protocolVersion"), nullptr);
}

TEST_F(AdapterFixture, ToolsCallScenario) {
    JSONValue resp = post(R"({"jsonrpc":"2.0","id":"a","method":"tools/call","params":{"name":"search","arguments":{"q":"hi"}}})");
    EXPECT_EQ(std::get<std::string>(resp.Find("id")->value), "a");
    const JSONValue* result = resp.Find("result");
    ASSERT_NE(result, nullptr);
    const auto& content = std::get<JSONValue::Array>(result->Find("content")->value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(std::get<std::string>(content[0]->Find("text")->value), "hi");
    EXPECT_FALSE(std::get<bool>(result->Find("isError")->value));
}

TEST_F(AdapterFixture, SyntacticallyInvalidBodiesYieldParseErrorWithIdZero) {
    const char* bodies[] = {"{", "{\"jsonrpc\":\"2.0\",\"id\":7", "\x01\x02", "[1,]", "{\"a\":tru}",
                            "{\"jsonrpc\":\"2.0\",\"id\":\"\xff\xfe\",\"method\":\"nope\"}"};
    for (const char* body : bodies) {
        JSONValue resp = post(body);
        EXPECT_EQ(code(resp), JSONRPCErrorCodes::ParseError) << body;
        EXPECT_EQ(std::get<int64_t>(resp.Find("id")->value), 0) << body;
    }
}

TEST_F(AdapterFixture, EnvelopeViolationsYieldInvalidRequest) {
    const char* bodies[] = {
        R"({"id":1,"method":"initialize"})",
        R"({"jsonrpc":"2.0","id":1,"method":3})",
        R"({"jsonrpc":"2.0","id":null,"method":"initialize"})",
        R"([{"jsonrpc":"2.0","id":1,"method":"initialize"}])",
    };
    for (const char* body : bodies) {
        EXPECT_EQ(code(post(body)), JSONRPCErrorCodes::InvalidRequest) << body;
    }
    // Rejected ids are echoed so the client can correlate
    JSONValue resp = post(R"({"jsonrpc":"1.0","id":"corr","method":"initialize"})");
    EXPECT_EQ(std::get<std::string>(resp.Find("id")->value), "corr");
    // A null id cannot be echoed
    JSONValue nullId = post(R"({"jsonrpc":"2.0","id":null,"method":"initialize"})");
    EXPECT_EQ(std::get<int64_t>(nullId.Find("id")->value), 0);
}

TEST_F(AdapterFixture, WrongContentTypeIsInvalidRequestWithIdZero) {
    JSONValue resp = post(R"({"jsonrpc":"2.0","id":5,"method":"initialize"})", "text/plain");
    EXPECT_EQ(code(resp), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(std::get<int64_t>(resp.Find("id")->value), 0);
}

TEST_F(AdapterFixture, UnknownMethodEchoesRequestId) {
    JSONValue resp = post(R"({"jsonrpc":"2.0","id":42,"method":"resources/list"})");
    EXPECT_EQ(code(resp), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(std::get<int64_t>(resp.Find("id")->value), 42);
}

TEST_F(AdapterFixture, ToolsListOrderIsStableAcrossCalls) {
    registry->RegisterTool(Tool{"b", "second"}, [](const JSONValue&, std::stop_token) { return ready({}); });
    registry->RegisterTool(Tool{"a", "third"}, [](const JSONValue&, std::stop_token) { return ready({}); });
    const std::string body = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";
    const std::string first = adapter->HandleToJson("application/json", body);
    EXPECT_EQ(first, adapter->HandleToJson("application/json", body));

    JSONValue resp = ParseJSON(first);
    const auto& tools = std::get<JSONValue::Array>(resp.Find("result")->Find("tools")->value);
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(std::get<std::string>(tools[0]->Find("name")->value), "search");
    EXPECT_EQ(std::get<std::string>(tools[1]->Find("name")->value), "b");
    EXPECT_EQ(std::get<std::string>(tools[2]->Find("name")->value), "a");
}

TEST_F(AdapterFixture, UnregisteredToolIsDelegatedAndStillWellFormed) {
    JSONValue resp = post(R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"x"}})");
    EXPECT_EQ(std::get<int64_t>(resp.Find("id")->value), 9);
    ASSERT_EQ(resp.Find("error"), nullptr);
    const JSONValue* result = resp.Find("result");
    ASSERT_NE(result, nullptr);
    EXPECT_TRUE(std::get<bool>(result->Find("isError")->value));
    const auto& content = std::get<JSONValue::Array>(result->Find("content")->value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(std::get<std::string>(content[0]->Find("text")->value), "Unknown tool: x");
}

TEST_F(AdapterFixture, ToolsCallWithoutParamsIsInvalidParams) {
    JSONValue resp = post(R"({"jsonrpc":"2.0","id":2,"method":"tools/call"})");
    EXPECT_EQ(code(resp), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(std::get<int64_t>(resp.Find("id")->value), 2);
}

TEST(RpcAdapter, ProtocolModeTurnsToolFailureIntoInternalError) {
    auto registry = std::make_shared<ToolRegistry>(Implementation{"r", "1"});
    RpcAdapter adapter(registry->Describe(), registry, ToolErrorMode::Protocol);
    JSONValue resp = ParseJSON(adapter.HandleToJson("application/json",
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"missing"}})"));
    ASSERT_EQ(resp.Find("result"), nullptr);
    EXPECT_EQ(std::get<int64_t>(resp.Find("error")->Find("code")->value), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(std::get<std::string>(resp.Find("error")->Find("message")->value), "Unknown tool: missing");
}

TEST(RpcAdapter, HandshakeNotificationAnnouncesInitialize) {
    auto registry = std::make_shared<ToolRegistry>(Implementation{"hs", "2.0.0"});
    RpcAdapter adapter(registry->Describe(), registry);
    JSONValue note = ParseJSON(adapter.HandshakeNotification().Serialize());
    EXPECT_EQ(note.Find("id"), nullptr);
    EXPECT_EQ(std::get<std::string>(note.Find("method")->value), "initialize");
    const JSONValue* params = note.Find("params");
    ASSERT_NE(params, nullptr);
    EXPECT_EQ(std::get<std::string>(params->Find("protocolVersion")->value), PROTOCOL_VERSION);
    EXPECT_NE(params->Find("capabilities")->Find("tools"), nullptr);
    EXPECT_EQ(std::get<std::string>(params->Find("serverInfo")->Find("name")->value), "hs");
}

TEST(RpcAdapter, ToolThrowingNonStandardValueYieldsInternalError) {
    auto registry = std::make_shared<ToolRegistry>(Implementation{"r", "1"});
    registry->RegisterTool(Tool{"explode", "Throws an int", MakeObjectSchema({})},
        [](const JSONValue&, std::stop_token) -> std::future<CallToolResult> { throw 42; });
    RpcAdapter adapter(registry->Describe(), registry);
    std::string out;
    ASSERT_NO_THROW(out = adapter.HandleToJson("application/json",
        R"({"jsonrpc":"2.0","id":"boom","method":"tools/call","params":{"name":"explode"}})"));
    JSONValue resp = ParseJSON(out);
    EXPECT_EQ(std::get<std::string>(resp.Find("id")->value), "boom");
    EXPECT_EQ(std::get<int64_t>(resp.Find("error")->Find("code")->value), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(std::get<std::string>(resp.Find("error")->Find("message")->value), "Internal error");
}
