//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeValidator.cpp
// Purpose: Ordered envelope checks for incoming JSON-RPC requests
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "logging/Logger.h"
#include "mcpgate/EnvelopeValidator.h"

namespace mcpgate {

namespace {

EnvelopeValidation reject(int code, const char* message, JSONRPCId id = JSONRPCId{}) {
    EnvelopeValidation v;
    v.error = errors::makeError(code, message);
    v.recoveredId = std::move(id);
    return v;
}

} // namespace

bool IsJsonContentType(std::string_view contentType) {
    std::string lowered(contentType);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("application/json") != std::string::npos;
}

EnvelopeValidation ValidateEnvelope(std::string_view contentType, const std::string& body) {
    if (!IsJsonContentType(contentType)) {
        LOG_DEBUG("Envelope rejected: content type '{}'", std::string(contentType));
        return reject(JSONRPCErrorCodes::InvalidRequest, errors::Messages::WrongContentType);
    }

    JSONValue doc;
    try {
        doc = ParseJSON(body);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("Envelope rejected: {}", e.what());
        return reject(JSONRPCErrorCodes::ParseError, errors::Messages::ParseFailure);
    }

    if (!doc.IsObject()) {
        return reject(JSONRPCErrorCodes::InvalidRequest, errors::Messages::NotAnObject);
    }

    JSONRPCId rawId;
    if (const JSONValue* id = doc.Find("id")) {
        rawId = *id;
    }

    const JSONValue* version = doc.Find("jsonrpc");
    if (version == nullptr || !version->IsString() ||
        std::get<std::string>(version->value) != JSONRPC_VERSION) {
        return reject(JSONRPCErrorCodes::InvalidRequest, errors::Messages::InvalidEnvelope, rawId);
    }
    if (!rawId.IsString() && !rawId.IsInteger()) {
        return reject(JSONRPCErrorCodes::InvalidRequest, errors::Messages::InvalidEnvelope, rawId);
    }
    const JSONValue* method = doc.Find("method");
    if (method == nullptr || !method->IsString()) {
        return reject(JSONRPCErrorCodes::InvalidRequest, errors::Messages::InvalidEnvelope, rawId);
    }

    EnvelopeValidation v;
    v.recoveredId = rawId;
    JSONRPCRequest request(rawId, std::get<std::string>(method->value));
    if (const JSONValue* params = doc.Find("params")) {
        if (!params->IsNull()) {
            request.params = *params;
        }
    }
    v.request = std::move(request);
    return v;
}

} // namespace mcpgate
