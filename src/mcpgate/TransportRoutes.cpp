//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportRoutes.cpp
// Purpose: Route resolution for endpoint groups and static discovery routes
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/TransportRoutes.h"

namespace mcpgate {

namespace http = boost::beast::http;

namespace {

constexpr const char* kGroupMethods = "GET, POST, HEAD, OPTIONS";
constexpr const char* kRedirectMethods = "GET, HEAD, OPTIONS";
constexpr const char* kRootMethods = "GET, POST, HEAD, OPTIONS";
constexpr const char* kGetOnlyMethods = "GET, HEAD, OPTIONS";

RouteDecision decide(RouteAction action, const char* allow, bool headOnly = false) {
    RouteDecision d;
    d.action = action;
    d.allow = allow;
    d.headOnly = headOnly;
    return d;
}

std::string authStubAllow(const AuthStubRoute& stub) {
    std::string allow;
    auto add = [&](const char* m) {
        if (!allow.empty()) {
            allow += ", ";
        }
        allow += m;
    };
    if (stub.allowGet) {
        add("GET");
        add("HEAD");
    }
    if (stub.allowPost) {
        add("POST");
    }
    add("OPTIONS");
    return allow;
}

} // namespace

std::vector<EndpointGroup> MakeEndpointGroups(const ServerConfig& cfg) {
    std::vector<EndpointGroup> groups;
    groups.push_back(EndpointGroup{cfg.discovery.primaryPath, GetBehavior::DescribeOrRejectStream});
    groups.push_back(EndpointGroup{cfg.discovery.legacyPath,
                                   cfg.legacySse ? GetBehavior::OpenStream : GetBehavior::DescribeOrRejectStream});
    return groups;
}

RouteTable::RouteTable(const ServerConfig& cfg)
    : groups_(MakeEndpointGroups(cfg)), discovery_(cfg.discovery) {}

RouteDecision RouteTable::Resolve(http::verb method, std::string_view target, std::string_view accept) const {
    const std::string path = StripQuery(target);
    const bool isHead = method == http::verb::head;
    const bool isGetLike = method == http::verb::get || isHead;

    for (const auto& group : groups_) {
        if (path == group.path) {
            if (method == http::verb::post) {
                return decide(RouteAction::Rpc, kGroupMethods);
            }
            if (method == http::verb::options) {
                return decide(RouteAction::Preflight, kGroupMethods);
            }
            if (!isGetLike) {
                return decide(RouteAction::MethodNotAllowed, kGroupMethods);
            }
            if (group.onGet == GetBehavior::OpenStream) {
                return decide(isHead ? RouteAction::StreamHeaders : RouteAction::OpenStream, kGroupMethods, isHead);
            }
            if (AcceptsEventStream(accept)) {
                return decide(RouteAction::StreamUnavailable, kGroupMethods, isHead);
            }
            return decide(RouteAction::DescribeEndpoint, kGroupMethods, isHead);
        }
        if (path == group.path + "/") {
            if (method == http::verb::options) {
                return decide(RouteAction::Preflight, kRedirectMethods);
            }
            if (!isGetLike) {
                return decide(RouteAction::MethodNotAllowed, kRedirectMethods);
            }
            RouteDecision d = decide(RouteAction::Redirect, kRedirectMethods, isHead);
            d.location = group.path;
            return d;
        }
    }

    if (path == "/") {
        if (method == http::verb::options) {
            return decide(RouteAction::Preflight, kRootMethods);
        }
        if (isGetLike || method == http::verb::post) {
            return decide(RouteAction::Root, kRootMethods, isHead);
        }
        return decide(RouteAction::MethodNotAllowed, kRootMethods);
    }

    if (path == "/.well-known/mcp.json") {
        if (method == http::verb::options) {
            return decide(RouteAction::Preflight, kGetOnlyMethods);
        }
        if (isGetLike) {
            return decide(RouteAction::McpDiscovery, kGetOnlyMethods, isHead);
        }
        return decide(RouteAction::MethodNotAllowed, kGetOnlyMethods);
    }

    for (const auto& stub : discovery_.authStubs) {
        if (path != stub.path) {
            continue;
        }
        RouteDecision d;
        d.allow = authStubAllow(stub);
        if (method == http::verb::options) {
            d.action = RouteAction::Preflight;
        } else if ((isGetLike && stub.allowGet) || (method == http::verb::post && stub.allowPost)) {
            d.action = RouteAction::AuthStub;
            d.headOnly = isHead;
        } else {
            d.action = RouteAction::MethodNotAllowed;
        }
        return d;
    }

    return decide(RouteAction::NotFound, "", isHead);
}

bool AcceptsEventStream(std::string_view accept) {
    std::string lowered(accept);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("text/event-stream") != std::string::npos;
}

std::string StripQuery(std::string_view target) {
    auto q = target.find('?');
    return std::string(q == std::string_view::npos ? target : target.substr(0, q));
}

std::string RootDescriptorJson(const DiscoveryConfig& discovery) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(discovery.serviceName);
    obj["status"] = std::make_shared<JSONValue>("ok");
    obj["protocolVersion"] = std::make_shared<JSONValue>(discovery.discoveryProtocolVersion);
    obj["mcpEndpoint"] = std::make_shared<JSONValue>(discovery.primaryPath);
    return SerializeJSON(JSONValue(std::move(obj)));
}

std::string McpDiscoveryJson(const DiscoveryConfig& discovery) {
    JSONValue::Object transport;
    transport["type"] = std::make_shared<JSONValue>("http");
    transport["endpoint"] = std::make_shared<JSONValue>(discovery.primaryPath);

    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(discovery.serviceName);
    obj["protocolVersion"] = std::make_shared<JSONValue>(discovery.discoveryProtocolVersion);
    obj["transport"] = std::make_shared<JSONValue>(std::move(transport));
    return SerializeJSON(JSONValue(std::move(obj)));
}

} // namespace mcpgate
