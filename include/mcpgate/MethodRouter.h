//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodRouter.h
// Purpose: Interface for mapping a validated JSON-RPC request to its capability handler
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/Protocol.h"
#include "mcpgate/ToolInvoker.h"

namespace mcpgate {

class IMethodRouter {
public:
    using MethodHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;

    virtual ~IMethodRouter() = default;

    // Dispatches a validated request. Always returns a response carrying the request id:
    // unknown methods yield Method Not Found, handler exceptions yield Internal Error.
    virtual std::unique_ptr<JSONRPCResponse> route(const JSONRPCRequest& request) = 0;
};

//==========================================================================================================
// MakeDefaultMethodRouter
// Purpose: Router serving initialize, tools/list and tools/call.
// Args:
//   descriptor: Capability descriptor computed once at startup; copied and never mutated.
//   invoker: Tool-registry collaborator; must be non-null.
//   toolErrors: Handling of ToolExecutionError raised by the collaborator.
//==========================================================================================================
std::unique_ptr<IMethodRouter> MakeDefaultMethodRouter(CapabilityDescriptor descriptor,
                                                       std::shared_ptr<IToolInvoker> invoker,
                                                       ToolErrorMode toolErrors = ToolErrorMode::Result);

} // namespace mcpgate
