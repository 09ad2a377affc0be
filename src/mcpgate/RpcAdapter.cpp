//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RpcAdapter.cpp
// Purpose: JSON-RPC pipeline implementation
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpgate/EnvelopeValidator.h"
#include "mcpgate/ResponseBuilder.h"
#include "mcpgate/RpcAdapter.h"

namespace mcpgate {

RpcAdapter::RpcAdapter(CapabilityDescriptor descriptor,
                       std::shared_ptr<IToolInvoker> invoker,
                       ToolErrorMode toolErrors)
    : descriptor_(std::move(descriptor)),
      router_(MakeDefaultMethodRouter(descriptor_, std::move(invoker), toolErrors)) {}

RpcAdapter::~RpcAdapter() = default;

std::unique_ptr<JSONRPCResponse> RpcAdapter::Handle(std::string_view contentType, const std::string& body) {
    EnvelopeValidation v = ValidateEnvelope(contentType, body);
    if (!v.ok()) {
        return BuildErrorResponse(v.recoveredId, v.error.value());
    }
    const JSONRPCRequest& request = v.request.value();
    LOG_DEBUG("Dispatching {} (id={})", request.method, SerializeJSON(request.id));
    try {
        auto response = router_->route(request);
        if (!response) {
            return BuildErrorResponse(request.id,
                errors::makeError(JSONRPCErrorCodes::InternalError, "Null response from handler"));
        }
        return response;
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatch of {} failed: {}", request.method, e.what());
        return BuildErrorResponse(request.id, errors::makeError(JSONRPCErrorCodes::InternalError, e.what()));
    } catch (...) {
        LOG_ERROR("Dispatch of {} failed with a non-standard exception", request.method);
        return BuildErrorResponse(request.id,
            errors::makeError(JSONRPCErrorCodes::InternalError, errors::Messages::InternalFailure));
    }
}

std::string RpcAdapter::HandleToJson(std::string_view contentType, const std::string& body) {
    return Handle(contentType, body)->Serialize();
}

JSONRPCNotification RpcAdapter::HandshakeNotification() const {
    JSONValue::Object serverInfo;
    serverInfo["name"] = std::make_shared<JSONValue>(descriptor_.serverInfo.name);
    serverInfo["version"] = std::make_shared<JSONValue>(descriptor_.serverInfo.version);

    JSONValue::Object params;
    params["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
    params["capabilities"] = std::make_shared<JSONValue>(SerializeServerCapabilities(descriptor_.capabilities));
    params["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfo));
    return JSONRPCNotification(Methods::Initialize, JSONValue(std::move(params)));
}

} // namespace mcpgate
