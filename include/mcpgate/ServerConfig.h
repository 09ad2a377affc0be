//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Immutable gateway configuration assembled once at process entry
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcpgate/ToolInvoker.h"

namespace mcpgate {

//==========================================================================================================
// ConfigError
// Purpose: Raised for invalid configuration values (environment or command line).
//==========================================================================================================
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// A static auth-discovery path that answers 404 {"error":"not implemented"}.
struct AuthStubRoute {
    std::string path;
    bool allowGet{true};
    bool allowPost{false};
};

//==========================================================================================================
// DiscoveryConfig
// Purpose: Literal bodies of the static routes. Owned by configuration, not by protocol logic.
//==========================================================================================================
struct DiscoveryConfig {
    std::string serviceName{"mcpgate"};
    std::string primaryPath{"/mcp"};
    std::string legacyPath{"/sse"};
    // protocolVersion announced by /.well-known/mcp.json
    std::string discoveryProtocolVersion{"2024-11-05"};
    std::string streamableGetText{"MCP streamable HTTP endpoint. Use POST with application/json."};
    std::string streamUnavailableText{"SSE is not available on this endpoint. Use POST with JSON-RPC 2.0."};
    std::vector<AuthStubRoute> authStubs{
        {"/.well-known/openid-configuration", true, false},
        {"/.well-known/oauth-authorization-server", true, false},
        {"/.well-known/oauth-protected-resource", true, false},
        {"/.well-known/oauth-protected-resource/sse", true, false},
        {"/register", false, true},
        {"/token", true, true},
        {"/authorize", true, true},
    };
};

// Upper bound for ServerConfig::ioThreads.
constexpr unsigned int kMaxIoThreads = 256;

//==========================================================================================================
// ServerConfig
// Fields:
//   host/port: Listen address; port 0 binds an ephemeral port.
//   scheme: "http" or "https" (TLS 1.3 only); https requires certFile and keyFile (PEM).
//   legacySse: When true, GET on the legacy path opens the push stream.
//   keepAliveInterval: Period between keep-alive comments on a legacy stream.
//   ioThreads: Number of threads running the I/O context (1..kMaxIoThreads).
//   maxBodyBytes: Requests with larger bodies are answered with 413.
//   toolErrors: Handling of ToolExecutionError (see ToolErrorMode).
//   corsOrigin: Access-Control-Allow-Origin value; empty disables CORS headers.
//   logLevel/logFile/logColor/logStderr: Logger settings applied by the executable.
//   showHelp: --help was given.
//==========================================================================================================
struct ServerConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{3333};
    std::string scheme{"http"};
    std::string certFile;
    std::string keyFile;
    bool legacySse{true};
    std::chrono::milliseconds keepAliveInterval{10000};
    unsigned int ioThreads{4};
    std::size_t maxBodyBytes{1024 * 1024};
    ToolErrorMode toolErrors{ToolErrorMode::Result};
    std::string corsOrigin{"*"};
    std::string logLevel{"INFO"};
    std::string logFile;
    bool logColor{false};
    bool logStderr{false};
    bool showHelp{false};
    DiscoveryConfig discovery;
};

// Environment lookup; returns nullopt for unset variables. Empty values are passed through.
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

//==========================================================================================================
// LoadServerConfig
// Purpose: Builds the configuration. Precedence: defaults < environment < command line.
// Args:
//   args: Command-line arguments excluding the program name.
//   env: Environment lookup (the process environment in production).
// Throws:
//   ConfigError on invalid values.
//==========================================================================================================
ServerConfig LoadServerConfig(const std::vector<std::string>& args, const EnvLookup& env);

// Process entry overload using the real environment.
ServerConfig LoadServerConfig(int argc, char** argv);

//==========================================================================================================
// ApplyListenUri
// Purpose: Applies "http://host:port" or "https://host:port?cert=<pem>&key=<pem>" to cfg.
//          IPv6 hosts use the [addr]:port form. A missing scheme means http; a missing port
//          keeps the current one; unknown query parameters are ignored.
// Throws:
//   ConfigError on an unknown scheme or invalid port.
//==========================================================================================================
void ApplyListenUri(ServerConfig& cfg, const std::string& uri);

// Checks cross-field constraints (https needs cert/key, positive keep-alive and thread count).
void ValidateServerConfig(const ServerConfig& cfg);

// Parses a decimal port in [0, 65535].
std::uint16_t ParsePort(const std::string& text);

ToolErrorMode ParseToolErrorMode(const std::string& text);

// Usage text printed for --help.
std::string UsageText(const std::string& programName);

} // namespace mcpgate
