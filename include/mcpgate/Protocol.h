//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, constants and their plain-data (JSON) forms
//==========================================================================================================

#pragma once

#include "mcpgate/JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace mcpgate {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version negotiated by initialize and announced by the legacy stream handshake
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
};

//==========================================================================================================
// CapabilityDescriptor
// Purpose: What initialize reports. Computed once at startup by the tool collaborator and
//          handed to the adapter by value; never mutated afterwards.
// Fields:
//   serverInfo: Server identity (name, version).
//   capabilities: Advertised capabilities.
//   instructions: Optional free-text usage instructions; omitted from the result when absent.
//==========================================================================================================
struct CapabilityDescriptor {
    Implementation serverInfo;
    ServerCapabilities capabilities;
    std::optional<std::string> instructions;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters
    std::optional<std::string> title;
    std::optional<JSONValue> annotations;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

// Result of a tools/call as produced by the collaborator; content items are plain JSON data.
struct CallToolResult {
    std::vector<JSONValue> content;
    bool isError = false;
};

/////////////////////////////////////// Plain-data forms /////////////////////////////////////////
// {"listChanged":..} objects per present capability; empty optional parts are omitted.
JSONValue SerializeServerCapabilities(const ServerCapabilities& caps);

// {"name","description","inputSchema", "title"?, "annotations"?}; a null inputSchema becomes
// {"type":"object","properties":{}}.
JSONValue SerializeTool(const Tool& tool);

// {"type":"text","text":text}
JSONValue MakeTextContent(const std::string& text);

// Builds an object schema from property name -> JSON type name, all properties required.
JSONValue MakeObjectSchema(const std::vector<std::pair<std::string, std::string>>& properties);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
}

} // namespace mcpgate
