//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeValidator.h
// Purpose: Turns a raw HTTP request body into a validated JSON-RPC request or a typed rejection
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/errors/Errors.h"

namespace mcpgate {

//==========================================================================================================
// EnvelopeValidation
// Purpose: Outcome of ValidateEnvelope.
// Fields:
//   request: Set when the envelope is valid; params is left as sent (null params count as absent).
//   error: Set when the envelope was rejected.
//   recoveredId: Best id found in the payload (raw, any JSON type); null when none was found.
//==========================================================================================================
struct EnvelopeValidation {
    std::optional<JSONRPCRequest> request;
    std::optional<errors::McpError> error;
    JSONRPCId recoveredId;

    bool ok() const { return request.has_value(); }
};

//==========================================================================================================
// IsJsonContentType
// Purpose: True when the Content-Type header value declares application/json (case-insensitive,
//          media type parameters such as charset allowed).
//==========================================================================================================
bool IsJsonContentType(std::string_view contentType);

//==========================================================================================================
// ValidateEnvelope
// Purpose: Runs the envelope checks in order, stopping at the first failure:
//   1. JSON content type, else Invalid Request (no id).
//   2. Body parses as JSON, else Parse Error (no id).
//   3. Document is an object, else Invalid Request (no id).
//   4. jsonrpc == "2.0", id present and a string or integer, method a string,
//      else Invalid Request echoing whatever id was present.
// Never throws.
//==========================================================================================================
EnvelopeValidation ValidateEnvelope(std::string_view contentType, const std::string& body);

} // namespace mcpgate
