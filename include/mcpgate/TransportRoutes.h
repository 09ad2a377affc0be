//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportRoutes.h
// Purpose: HTTP route table for the gateway: endpoint groups, their GET strategies and static routes
//==========================================================================================================

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/http/verb.hpp>

#include "mcpgate/ServerConfig.h"

namespace mcpgate {

//==========================================================================================================
// GetBehavior
// Purpose: What GET does on an endpoint group. POST is the same single-shot RPC call everywhere.
//   DescribeOrRejectStream: 405 when the client asks for text/event-stream, else a text descriptor.
//   OpenStream: opens the legacy push stream (handshake frame, then keep-alives).
//==========================================================================================================
enum class GetBehavior {
    DescribeOrRejectStream,
    OpenStream
};

struct EndpointGroup {
    std::string path;
    GetBehavior onGet{GetBehavior::DescribeOrRejectStream};
};

// The primary group (/mcp) and the legacy group (/sse); the legacy group streams only when
// cfg.legacySse is set.
std::vector<EndpointGroup> MakeEndpointGroups(const ServerConfig& cfg);

enum class RouteAction {
    Rpc,
    OpenStream,
    StreamHeaders,
    StreamUnavailable,
    DescribeEndpoint,
    Redirect,
    Root,
    McpDiscovery,
    AuthStub,
    Preflight,
    MethodNotAllowed,
    NotFound
};

//==========================================================================================================
// RouteDecision
// Fields:
//   action: What the server does with the request.
//   location: Redirect target (Redirect only).
//   allow: Methods accepted by the matched path (Allow header for 405 and preflight).
//   headOnly: HEAD request; send the GET headers without a body.
//==========================================================================================================
struct RouteDecision {
    RouteAction action{RouteAction::NotFound};
    std::string location;
    std::string allow;
    bool headOnly{false};
};

class RouteTable {
public:
    explicit RouteTable(const ServerConfig& cfg);

    //==========================================================================================================
    // Resolves a request line to a route decision. The query string is ignored.
    // Args:
    //   method: HTTP verb.
    //   target: Request target as received.
    //   accept: Value of the Accept header (may be empty).
    //==========================================================================================================
    RouteDecision Resolve(boost::beast::http::verb method, std::string_view target, std::string_view accept) const;

    const std::vector<EndpointGroup>& Groups() const { return groups_; }

private:
    std::vector<EndpointGroup> groups_;
    DiscoveryConfig discovery_;
};

// True when the Accept header asks for text/event-stream (case-insensitive).
bool AcceptsEventStream(std::string_view accept);

// Target without its query string.
std::string StripQuery(std::string_view target);

// {"name":<service>,"status":"ok","protocolVersion":..,"mcpEndpoint":<primary path>}
std::string RootDescriptorJson(const DiscoveryConfig& discovery);

// {"name":<service>,"protocolVersion":..,"transport":{"type":"http","endpoint":<primary path>}}
std::string McpDiscoveryJson(const DiscoveryConfig& discovery);

constexpr const char* kNotImplementedBody = "{\"error\":\"not implemented\"}";
constexpr const char* kNotFoundBody = "{\"error\":\"Not found\"}";
constexpr const char* kBodyTooLargeBody = "{\"error\":\"Request body too large\"}";

} // namespace mcpgate
