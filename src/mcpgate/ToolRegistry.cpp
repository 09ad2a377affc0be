//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: In-memory tool registry implementation
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "mcpgate/ToolRegistry.h"

namespace mcpgate {

ToolRegistry::ToolRegistry(Implementation serverInfo, std::optional<std::string> instructions)
    : serverInfo_(std::move(serverInfo)), instructions_(std::move(instructions)) {}

void ToolRegistry::RegisterTool(const Tool& tool, ToolHandler handler) {
    LOG_DEBUG("Registering tool: {}", tool.name);
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.tool.name == tool.name; });
    if (it != entries_.end()) {
        it->tool = tool;
        it->handler = std::move(handler);
        return;
    }
    entries_.push_back(Entry{tool, std::move(handler)});
}

bool ToolRegistry::UnregisterTool(const std::string& name) {
    LOG_DEBUG("Unregistering tool: {}", name);
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.tool.name == name; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

CapabilityDescriptor ToolRegistry::Describe() const {
    CapabilityDescriptor d;
    d.serverInfo = serverInfo_;
    d.capabilities.tools = ToolsCapability{};
    d.instructions = instructions_;
    return d;
}

void ToolRegistry::RequestStop() {
    stopSource_.request_stop();
}

std::vector<Tool> ToolRegistry::ListTools() {
    std::lock_guard<std::mutex> lock(registryMutex_);
    std::vector<Tool> tools;
    tools.reserve(entries_.size());
    for (const auto& e : entries_) {
        tools.push_back(e.tool);
    }
    return tools;
}

CallToolResult ToolRegistry::CallTool(const std::string& name, const JSONValue& arguments) {
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e) { return e.tool.name == name; });
        if (it != entries_.end()) {
            handler = it->handler;
        }
    }
    if (!handler) {
        throw ToolExecutionError("Unknown tool: " + name);
    }

    std::lock_guard<std::mutex> serialize(callMutex_);
    LOG_DEBUG("Calling tool: {}", name);
    auto fut = handler(arguments, stopSource_.get_token());
    return fut.get();
}

} // namespace mcpgate
