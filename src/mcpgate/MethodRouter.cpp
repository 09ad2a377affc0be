//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodRouter.cpp
// Purpose: Default method router and the initialize / tools/list / tools/call handlers
//==========================================================================================================

#include <stdexcept>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcpgate/MethodRouter.h"
#include "mcpgate/ResponseBuilder.h"

namespace mcpgate {

namespace {

JSONValue serializeCallToolResult(const CallToolResult& r) {
    JSONValue::Array content;
    for (const auto& item : r.content) {
        content.push_back(std::make_shared<JSONValue>(item));
    }
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    obj["isError"] = std::make_shared<JSONValue>(r.isError);
    return JSONValue(std::move(obj));
}

class MethodRouter : public IMethodRouter {
public:
    MethodRouter(CapabilityDescriptor descriptor, std::shared_ptr<IToolInvoker> invoker, ToolErrorMode toolErrors)
        : descriptor_(std::move(descriptor)), invoker_(std::move(invoker)), toolErrors_(toolErrors) {
        if (!invoker_) {
            throw std::invalid_argument("MethodRouter requires a tool invoker");
        }
        handlers_[Methods::Initialize] = [this](const JSONRPCRequest& req) { return handleInitialize(req); };
        handlers_[Methods::ListTools] = [this](const JSONRPCRequest& req) { return handleToolsList(req); };
        handlers_[Methods::CallTool] = [this](const JSONRPCRequest& req) { return handleToolsCall(req); };
    }

    std::unique_ptr<JSONRPCResponse> route(const JSONRPCRequest& request) override {
        auto it = handlers_.find(request.method);
        if (it == handlers_.end()) {
            LOG_DEBUG("Method not found: {}", request.method);
            return BuildErrorResponse(request.id,
                errors::makeError(JSONRPCErrorCodes::MethodNotFound, errors::Messages::MethodNotFound));
        }
        try {
            return it->second(request);
        } catch (const std::exception& e) {
            LOG_ERROR("Handler for {} failed: {}", request.method, e.what());
            return BuildErrorResponse(request.id,
                errors::makeError(JSONRPCErrorCodes::InternalError, e.what()));
        } catch (...) {
            LOG_ERROR("Handler for {} failed with a non-standard exception", request.method);
            return BuildErrorResponse(request.id,
                errors::makeError(JSONRPCErrorCodes::InternalError, errors::Messages::InternalFailure));
        }
    }

private:
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& request) {
        JSONValue::Object serverInfo;
        serverInfo["name"] = std::make_shared<JSONValue>(descriptor_.serverInfo.name);
        serverInfo["version"] = std::make_shared<JSONValue>(descriptor_.serverInfo.version);

        JSONValue::Object result;
        result["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
        result["capabilities"] = std::make_shared<JSONValue>(SerializeServerCapabilities(descriptor_.capabilities));
        result["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfo));
        if (descriptor_.instructions.has_value()) {
            result["instructions"] = std::make_shared<JSONValue>(descriptor_.instructions.value());
        }
        return BuildSuccessResponse(request.id, JSONValue(std::move(result)));
    }

    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& request) {
        JSONValue::Array tools;
        for (const auto& tool : invoker_->ListTools()) {
            tools.push_back(std::make_shared<JSONValue>(SerializeTool(tool)));
        }
        JSONValue::Object result;
        result["tools"] = std::make_shared<JSONValue>(std::move(tools));
        return BuildSuccessResponse(request.id, JSONValue(std::move(result)));
    }

    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& request) {
        const JSONValue params = request.params.value_or(JSONValue(JSONValue::Object{}));
        if (!params.IsObject()) {
            return invalidParams(request, errors::Messages::ParamsNotObject);
        }
        const JSONValue* name = params.Find("name");
        if (name == nullptr || !name->IsString()) {
            return invalidParams(request, errors::Messages::NameRequired);
        }
        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* args = params.Find("arguments")) {
            if (!args->IsNull()) {
                if (!args->IsObject()) {
                    return invalidParams(request, errors::Messages::ArgumentsNotObject);
                }
                arguments = *args;
            }
        }

        const std::string& toolName = std::get<std::string>(name->value);
        CallToolResult outcome;
        try {
            outcome = invoker_->CallTool(toolName, arguments);
        } catch (const ToolExecutionError& e) {
            LOG_WARN("Tool {} failed: {}", toolName, e.what());
            if (toolErrors_ == ToolErrorMode::Protocol) {
                return BuildErrorResponse(request.id,
                    errors::makeError(JSONRPCErrorCodes::InternalError, e.what()));
            }
            outcome.content.clear();
            outcome.content.push_back(MakeTextContent(e.what()));
            outcome.isError = true;
        }
        return BuildSuccessResponse(request.id, serializeCallToolResult(outcome));
    }

    std::unique_ptr<JSONRPCResponse> invalidParams(const JSONRPCRequest& request, const char* message) {
        return BuildErrorResponse(request.id, errors::makeError(JSONRPCErrorCodes::InvalidParams, message));
    }

    CapabilityDescriptor descriptor_;
    std::shared_ptr<IToolInvoker> invoker_;
    ToolErrorMode toolErrors_;
    std::unordered_map<std::string, MethodHandler> handlers_;
};

} // namespace

std::unique_ptr<IMethodRouter> MakeDefaultMethodRouter(CapabilityDescriptor descriptor,
                                                       std::shared_ptr<IToolInvoker> invoker,
                                                       ToolErrorMode toolErrors) {
    return std::make_unique<MethodRouter>(std::move(descriptor), std::move(invoker), toolErrors);
}

} // namespace mcpgate
