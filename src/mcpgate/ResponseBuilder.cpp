//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseBuilder.cpp
// Purpose: Response envelope construction
//==========================================================================================================

#include "mcpgate/ResponseBuilder.h"

namespace mcpgate {

JSONRPCId ResolveResponseId(const JSONRPCId& recovered) {
    if (recovered.IsNull()) {
        return JSONRPCId(static_cast<int64_t>(0));
    }
    return recovered;
}

std::unique_ptr<JSONRPCResponse> BuildSuccessResponse(const JSONRPCId& id, JSONValue result) {
    return std::make_unique<JSONRPCResponse>(ResolveResponseId(id), std::move(result));
}

std::unique_ptr<JSONRPCResponse> BuildErrorResponse(const JSONRPCId& id, const errors::McpError& err) {
    return errors::makeErrorResponse(ResolveResponseId(id), err);
}

} // namespace mcpgate
