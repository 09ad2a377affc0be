//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_parser.cpp
// Purpose: GoogleTests for the strict JSON codec and JSON-RPC message serialization
//==========================================================================================================

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

#include "mcpgate/JSONRPCTypes.h"

using namespace mcpgate;

TEST(JSONParser, ParsesScalarsAndContainers) {
    JSONValue v = ParseJSON(" {\"a\":1,\"b\":[true,false,null],\"c\":\"x\",\"d\":-2.5e1} ");
    ASSERT_TRUE(v.IsObject());
    ASSERT_NE(v.Find("a"), nullptr);
    EXPECT_EQ(std::get<int64_t>(v.Find("a")->value), 1);
    const auto& arr = std::get<JSONValue::Array>(v.Find("b")->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_TRUE(std::get<bool>(arr[0]->value));
    EXPECT_FALSE(std::get<bool>(arr[1]->value));
    EXPECT_TRUE(arr[2]->IsNull());
    EXPECT_EQ(std::get<std::string>(v.Find("c")->value), "x");
    EXPECT_DOUBLE_EQ(std::get<double>(v.Find("d")->value), -25.0);
}

TEST(JSONParser, IntegerOverflowFallsBackToDouble) {
    JSONValue v = ParseJSON("123456789012345678901234567890");
    ASSERT_TRUE(std::holds_alternative<double>(v.value));
    EXPECT_GT(std::get<double>(v.value), 1e29);
}

TEST(JSONParser, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON("\"a\\n\\t\\\"\\u00e9\\ud83d\\ude00\"");
    EXPECT_EQ(std::get<std::string>(v.value), "a\n\t\"\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(JSONParser, LoneSurrogateBecomesReplacementCharacter) {
    JSONValue v = ParseJSON("\"\\ud800x\"");
    EXPECT_EQ(std::get<std::string>(v.value), "\xEF\xBF\xBDx");
}

TEST(JSONParser, RejectsMalformedDocuments) {
    const char* bad[] = {
        "",
        "{",
        "{\"a\":1,}",
        "[1 2]",
        "tru",
        "nul",
        "01",
        "1.",
        "-",
        "\"unterminated",
        "\"ctrl\x01\"",
        "{} trailing",
        "{\"a\" 1}",
        "'single'",
        "\"\xff\xfe\"",
        "\"\xc3\x28\"",
        "\"\xc0\xaf\"",
        "\"\xed\xa0\x80\"",
        "\"\xe2\x82\"",
        "\"\xf4\x90\x80\x80\"",
        "{\"\x80\":1}",
    };
    for (const char* text : bad) {
        EXPECT_THROW(ParseJSON(text), JSONParseError) << "input: " << text;
    }
}

TEST(JSONParser, KeepsValidUtf8AndReportsTheBadSequence) {
    const std::string text = "\"caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80\"";
    JSONValue v = ParseJSON(text);
    EXPECT_EQ(std::get<std::string>(v.value), text.substr(1, text.size() - 2));
    EXPECT_EQ(SerializeJSON(v), text);

    try {
        ParseJSON("[\"ok\",\"\xe2\x28\xa1\"]");
        FAIL() << "expected JSONParseError";
    } catch (const JSONParseError& e) {
        EXPECT_EQ(e.offset(), 7u);
    }
}

TEST(JSONSerializer, ReplacesBytesThatAreNotUtf8) {
    EXPECT_EQ(SerializeJSON(JSONValue(std::string("a\xff" "b"))), "\"a\\ufffdb\"");
    EXPECT_EQ(SerializeJSON(JSONValue(std::string("\xe2\x82"))), "\"\\ufffd\\ufffd\"");
    EXPECT_EQ(SerializeJSON(JSONValue(std::string("\xc3\xa9"))), "\"\xc3\xa9\"");
}

TEST(JSONParser, ParseErrorReportsOffset) {
    try {
        ParseJSON("[1,2,x]");
        FAIL() << "expected JSONParseError";
    } catch (const JSONParseError& e) {
        EXPECT_EQ(e.offset(), 5u);
    }
}

TEST(JSONParser, NestingDepthIsLimited) {
    std::string ok(200, '[');
    ok += std::string(200, ']');
    EXPECT_NO_THROW(ParseJSON(ok));

    std::string deep(300, '[');
    deep += std::string(300, ']');
    EXPECT_THROW(ParseJSON(deep), JSONParseError);
}

TEST(JSONSerializer, EscapesStringsAndKeys) {
    JSONValue::Object obj;
    obj["k\"ey"] = std::make_shared<JSONValue>(std::string("line\nbreak\x01"));
    EXPECT_EQ(SerializeJSON(JSONValue(obj)), "{\"k\\\"ey\":\"line\\nbreak\\u0001\"}");
}

TEST(JSONSerializer, DoublesKeepADecimalPointAndNonFiniteIsNull) {
    EXPECT_EQ(SerializeJSON(JSONValue(2.0)), "2.0");
    EXPECT_EQ(SerializeJSON(JSONValue(0.5)), "0.5");
    EXPECT_EQ(SerializeJSON(JSONValue(std::numeric_limits<double>::infinity())), "null");
    EXPECT_EQ(SerializeJSON(JSONValue(std::nan(""))), "null");
}

TEST(JSONRPCMessages, ResponseSerializesWithFixedKeyOrder) {
    JSONValue::Object result;
    result["ok"] = std::make_shared<JSONValue>(true);
    JSONRPCResponse ok(JSONValue(int64_t{7}), JSONValue(result));
    EXPECT_EQ(ok.Serialize(), "{\"jsonrpc\":\"2.0\",\"id\":7,\"result\":{\"ok\":true}}");

    auto err = CreateErrorResponse(JSONValue("a"), JSONRPCErrorCodes::MethodNotFound, "Method not found");
    // Envelope keys are ordered; members of the error object are not
    const std::string wire = err->Serialize();
    EXPECT_EQ(wire.rfind("{\"jsonrpc\":\"2.0\",\"id\":\"a\",\"error\":{", 0), 0u) << wire;
    JSONValue error = *ParseJSON(wire).Find("error");
    EXPECT_EQ(std::get<int64_t>(error.Find("code")->value), -32601);
    EXPECT_EQ(std::get<std::string>(error.Find("message")->value), "Method not found");
}

TEST(JSONRPCMessages, NotificationHasNoId) {
    JSONRPCNotification n("initialize", JSONValue(JSONValue::Object{}));
    EXPECT_EQ(n.Serialize(), "{\"jsonrpc\":\"2.0\",\"method\":\"initialize\",\"params\":{}}");
}
