//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: In-memory tool registry used by the gateway executable and tests
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcpgate/Protocol.h"
#include "mcpgate/ToolInvoker.h"

namespace mcpgate {

//==========================================================================================================
// ToolRegistry
// Purpose: Ordered set of tools with handlers. Tool calls are serialized under one mutex so
//          handlers never run concurrently.
// Notes:
//   - Listing order is registration order; re-registering a name replaces the entry in place.
//   - Unknown tool names raise ToolExecutionError("Unknown tool: <name>").
//   - Handlers receive a stop_token that is triggered by RequestStop() (process shutdown).
//==========================================================================================================
class ToolRegistry : public IToolInvoker {
public:
    using ToolHandler = std::function<std::future<CallToolResult>(const JSONValue& arguments, std::stop_token st)>;

    //==========================================================================================================
    // Args:
    //   serverInfo: Identity reported by initialize.
    //   instructions: Optional instructions text reported by initialize.
    //==========================================================================================================
    explicit ToolRegistry(Implementation serverInfo, std::optional<std::string> instructions = std::nullopt);

    void RegisterTool(const Tool& tool, ToolHandler handler);
    bool UnregisterTool(const std::string& name);

    //==========================================================================================================
    // Produces the capability descriptor for this registry (tools capability, listChanged=false).
    // Intended to be called once at startup; the result is handed to the adapter by value.
    //==========================================================================================================
    CapabilityDescriptor Describe() const;

    // Signals the stop_token passed to running and future handlers.
    void RequestStop();

    // IToolInvoker
    std::vector<Tool> ListTools() override;
    CallToolResult CallTool(const std::string& name, const JSONValue& arguments) override;

private:
    struct Entry {
        Tool tool;
        ToolHandler handler;
    };

    Implementation serverInfo_;
    std::optional<std::string> instructions_;
    mutable std::mutex registryMutex_;
    std::mutex callMutex_;
    std::vector<Entry> entries_;
    std::stop_source stopSource_;
};

} // namespace mcpgate
