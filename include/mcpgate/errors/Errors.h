//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures and JSON-RPC error mapping helpers for the gateway
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpgate/JSONRPCTypes.h"

namespace mcpgate {
namespace errors {

// Categorization of the JSON-RPC error codes the gateway emits.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Unknown
};

// Typed error representation carried from validation/dispatch to the response builder.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Fixed messages; clients match on the code, these are for humans.
namespace Messages {
    constexpr const char* WrongContentType = "Content-Type must be application/json";
    constexpr const char* ParseFailure = "Could not parse JSON body";
    constexpr const char* NotAnObject = "Request body must be a JSON object";
    constexpr const char* InvalidEnvelope = "Invalid JSON-RPC request";
    constexpr const char* MethodNotFound = "Method not found";
    constexpr const char* ParamsNotObject = "params must be an object";
    constexpr const char* NameRequired = "params.name is required";
    constexpr const char* ArgumentsNotObject = "params.arguments must be an object";
    constexpr const char* InternalFailure = "Internal error";
}

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        default: return ErrorCategory::Unknown;
    }
}

// Build an McpError with its category derived from the code.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Create a JSONValue error object from a typed McpError; data is omitted when absent.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace mcpgate
