//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_envelope_validator.cpp
// Purpose: GoogleTests for ordered envelope validation and id recovery
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcpgate/EnvelopeValidator.h"

using namespace mcpgate;

namespace {
constexpr const char* kJson = "application/json";

int errorCode(const EnvelopeValidation& v) {
    return v.error.has_value() ? v.error->code : 0;
}
} // namespace

TEST(EnvelopeValidator, AcceptsWellFormedRequest) {
    auto v = ValidateEnvelope(kJson, R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
    ASSERT_TRUE(v.ok());
    EXPECT_FALSE(v.error.has_value());
    EXPECT_EQ(v.request->method, "initialize");
    EXPECT_EQ(std::get<int64_t>(v.request->id.value), 1);
    EXPECT_FALSE(v.request->params.has_value());
}

TEST(EnvelopeValidator, ContentTypeIsCheckedFirst) {
    // Garbage body, but the content type decides first
    auto v = ValidateEnvelope("text/plain", "not json");
    ASSERT_FALSE(v.ok());
    EXPECT_EQ(errorCode(v), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(v.error->message, errors::Messages::WrongContentType);
    EXPECT_TRUE(v.recoveredId.IsNull());

    EXPECT_EQ(errorCode(ValidateEnvelope("", "{}")), JSONRPCErrorCodes::InvalidRequest);
}

TEST(EnvelopeValidator, ContentTypeMatchIsCaseInsensitiveWithParameters) {
    EXPECT_TRUE(IsJsonContentType("application/json"));
    EXPECT_TRUE(IsJsonContentType("Application/JSON; charset=utf-8"));
    EXPECT_FALSE(IsJsonContentType("application/xml"));
    EXPECT_FALSE(IsJsonContentType(""));
}

TEST(EnvelopeValidator, UnparseableBodyIsParseErrorWithoutId) {
    const char* bodies[] = {"", "{", "{\"jsonrpc\":\"2.0\",\"id\":5,", "garbage", "{\"id\":1} x"};
    for (const char* body : bodies) {
        auto v = ValidateEnvelope(kJson, body);
        EXPECT_EQ(errorCode(v), JSONRPCErrorCodes::ParseError) << body;
        EXPECT_TRUE(v.recoveredId.IsNull()) << body;
    }
}

TEST(EnvelopeValidator, NonObjectDocumentIsInvalidRequest) {
    const char* bodies[] = {"[]", "[{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"x\"}]", "42", "\"s\"", "null"};
    for (const char* body : bodies) {
        auto v = ValidateEnvelope(kJson, body);
        EXPECT_EQ(errorCode(v), JSONRPCErrorCodes::InvalidRequest) << body;
        EXPECT_EQ(v.error->message, errors::Messages::NotAnObject);
        EXPECT_TRUE(v.recoveredId.IsNull());
    }
}

TEST(EnvelopeValidator, MissingOrWrongVersionEchoesRawId) {
    auto missing = ValidateEnvelope(kJson, R"({"id":"abc","method":"initialize"})");
    EXPECT_EQ(errorCode(missing), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(std::get<std::string>(missing.recoveredId.value), "abc");

    auto wrong = ValidateEnvelope(kJson, R"({"jsonrpc":"1.0","id":9,"method":"initialize"})");
    EXPECT_EQ(errorCode(wrong), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(std::get<int64_t>(wrong.recoveredId.value), 9);

    auto numeric = ValidateEnvelope(kJson, R"({"jsonrpc":2.0,"id":9,"method":"initialize"})");
    EXPECT_EQ(errorCode(numeric), JSONRPCErrorCodes::InvalidRequest);
}

TEST(EnvelopeValidator, NullOrMissingIdIsInvalidRequest) {
    auto nullId = ValidateEnvelope(kJson, R"({"jsonrpc":"2.0","id":null,"method":"initialize"})");
    EXPECT_EQ(errorCode(nullId), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_TRUE(nullId.recoveredId.IsNull());

    auto noId = ValidateEnvelope(kJson, R"({"jsonrpc":"2.0","method":"initialize"})");
    EXPECT_EQ(errorCode(noId), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_TRUE(noId.recoveredId.IsNull());
}

TEST(EnvelopeValidator, WrongTypedIdIsRejectedButPassedThrough) {
    auto v = ValidateEnvelope(kJson, R"({"jsonrpc":"2.0","id":{"k":1},"method":"initialize"})");
    EXPECT_EQ(errorCode(v), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_TRUE(v.recoveredId.IsObject());

    auto boolId = ValidateEnvelope(kJson, R"({"jsonrpc":"2.0","id":true,"method":"initialize"})");
    EXPECT_EQ(errorCode(boolId), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_TRUE(std::get<bool>(boolId.recoveredId.value));
}

TEST(EnvelopeValidator, NonStringMethodIsInvalidRequestWithId) {
    const char* bodies[] = {
        R"({"jsonrpc":"2.0","id":4,"method":7})",
        R"({"jsonrpc":"2.0","id":4,"method":null})",
        R"({"jsonrpc":"2.0","id":4})",
    };
    for (const char* body : bodies) {
        auto v = ValidateEnvelope(kJson, body);
        EXPECT_EQ(errorCode(v), JSONRPCErrorCodes::InvalidRequest) << body;
        EXPECT_EQ(v.error->message, errors::Messages::InvalidEnvelope);
        EXPECT_EQ(std::get<int64_t>(v.recoveredId.value), 4);
    }
}

TEST(EnvelopeValidator, ParamsAreNotCheckedHere) {
    auto arrayParams = ValidateEnvelope(kJson, R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":[1]})");
    ASSERT_TRUE(arrayParams.ok());
    ASSERT_TRUE(arrayParams.request->params.has_value());
    EXPECT_TRUE(arrayParams.request->params->IsArray());

    auto nullParams = ValidateEnvelope(kJson, R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":null})");
    ASSERT_TRUE(nullParams.ok());
    EXPECT_FALSE(nullParams.request->params.has_value());
}
