//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseBuilder.h
// Purpose: Wraps handler results and short-circuit errors into JSON-RPC response envelopes
//==========================================================================================================

#pragma once

#include <memory>

#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/errors/Errors.h"

namespace mcpgate {

//==========================================================================================================
// ResolveResponseId
// Purpose: Picks the id to echo. A null id (nothing recovered from the request) becomes 0;
//          anything else is echoed verbatim.
//==========================================================================================================
JSONRPCId ResolveResponseId(const JSONRPCId& recovered);

//==========================================================================================================
// BuildSuccessResponse
// Purpose: Response envelope with result set and error omitted.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> BuildSuccessResponse(const JSONRPCId& id, JSONValue result);

//==========================================================================================================
// BuildErrorResponse
// Purpose: Response envelope with error {code, message, data?} set and result omitted.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> BuildErrorResponse(const JSONRPCId& id, const errors::McpError& err);

} // namespace mcpgate
