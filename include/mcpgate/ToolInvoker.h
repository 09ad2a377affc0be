//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.h
// Purpose: Interface to the tool-registry collaborator that owns the tool set and its execution
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "mcpgate/Protocol.h"

namespace mcpgate {

//==========================================================================================================
// ToolExecutionError
// Purpose: Raised by a collaborator when a tool invocation fails at the tool level (unknown tool,
//          tool raised). How it reaches the client is decided by the adapter's ToolErrorMode.
//==========================================================================================================
class ToolExecutionError : public std::runtime_error {
public:
    explicit ToolExecutionError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// ToolErrorMode
// Purpose: How a ToolExecutionError reaches the client.
//   Result:   success envelope, isError=true, one text content item with the failure message (default).
//   Protocol: error envelope with Internal Error (-32603) and the failure message.
//==========================================================================================================
enum class ToolErrorMode {
    Protocol,
    Result
};

//==========================================================================================================
// IToolInvoker
// Purpose: What the protocol adapter needs from the tool registry. Implementations may impose
//          their own concurrency discipline; the adapter only waits for the result of each call.
//==========================================================================================================
class IToolInvoker {
public:
    virtual ~IToolInvoker() = default;

    //==========================================================================================================
    // Returns the current tool descriptors in registry-defined order.
    //==========================================================================================================
    virtual std::vector<Tool> ListTools() = 0;

    //==========================================================================================================
    // Invokes a tool.
    // Args:
    //   name: Tool name as sent by the client (may be unknown to the registry).
    //   arguments: JSON object of tool arguments.
    // Returns:
    //   Content items and the collaborator's own error flag.
    // Throws:
    //   ToolExecutionError for tool-level failures; any other exception is a collaborator fault.
    //==========================================================================================================
    virtual CallToolResult CallTool(const std::string& name, const JSONValue& arguments) = 0;
};

} // namespace mcpgate
