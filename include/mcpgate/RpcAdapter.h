//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RpcAdapter.h
// Purpose: Single-shot JSON-RPC pipeline (validate, route, build) shared by every POST endpoint
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/MethodRouter.h"
#include "mcpgate/Protocol.h"
#include "mcpgate/ToolInvoker.h"

namespace mcpgate {

//==========================================================================================================
// RpcAdapter
// Purpose: Owns the read-only capability descriptor and the method router. Holds no per-request
//          state; Handle() may be called concurrently from any number of connections.
//==========================================================================================================
class RpcAdapter {
public:
    RpcAdapter(CapabilityDescriptor descriptor,
               std::shared_ptr<IToolInvoker> invoker,
               ToolErrorMode toolErrors = ToolErrorMode::Result);
    ~RpcAdapter();

    RpcAdapter(const RpcAdapter&) = delete;
    RpcAdapter& operator=(const RpcAdapter&) = delete;

    //==========================================================================================================
    // Handles one POSTed body.
    // Args:
    //   contentType: Value of the request's Content-Type header (may be empty).
    //   body: Raw request body.
    // Returns:
    //   Exactly one response envelope; never throws for request content.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> Handle(std::string_view contentType, const std::string& body);

    // Handle() followed by Serialize().
    std::string HandleToJson(std::string_view contentType, const std::string& body);

    // Frame announced at the start of a legacy stream: notification "initialize" with
    // {"protocolVersion", "capabilities", "serverInfo"}.
    JSONRPCNotification HandshakeNotification() const;

    const CapabilityDescriptor& Descriptor() const { return descriptor_; }

private:
    CapabilityDescriptor descriptor_;
    std::unique_ptr<IMethodRouter> router_;
};

} // namespace mcpgate
