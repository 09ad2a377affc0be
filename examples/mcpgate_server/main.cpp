//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcpgate HTTP gateway with demonstration tools
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "mcpgate/HTTPServer.hpp"
#include "mcpgate/Protocol.h"
#include "mcpgate/RpcAdapter.h"
#include "mcpgate/ServerConfig.h"
#include "mcpgate/ToolRegistry.h"
#include "mcpgate/version.h"

using namespace mcpgate;

static std::atomic<bool> gRunning{true};

static void handleSig(int) {
    gRunning.store(false);
}

static void configureLogging(const ServerConfig& cfg) {
    Logger::setLogLevelFromString(cfg.logLevel);
    Logger::setUseStderr(cfg.logStderr);
    Logger::setColorEnabled(cfg.logColor);
    if (!cfg.logFile.empty()) {
        Logger::setLogFile(cfg.logFile);
    }
}

//==========================================================================================================
// Reads a required string argument for the demo tools.
// Throws:
//   ToolExecutionError when the argument is missing or not a string.
//==========================================================================================================
static std::string requireString(const JSONValue& args, const char* tool, const char* key) {
    const JSONValue* v = args.Find(key);
    if (v == nullptr || !v->IsString()) {
        throw ToolExecutionError(std::string(tool) + " requires a string '" + key + "' argument");
    }
    return std::get<std::string>(v->value);
}

static void registerDemoTools(ToolRegistry& registry) {
    Tool echo{"echo", "Echo a message", MakeObjectSchema({{"message", "string"}})};
    registry.RegisterTool(echo, [](const JSONValue& args, std::stop_token st) -> std::future<CallToolResult> {
        (void)st;
        return std::async(std::launch::async, [args]() {
            CallToolResult r;
            r.content.push_back(MakeTextContent(requireString(args, "echo", "message")));
            return r;
        });
    });

    Tool reverse{"reverse", "Reverse a string", MakeObjectSchema({{"text", "string"}})};
    reverse.title = "Reverse text";
    registry.RegisterTool(reverse, [](const JSONValue& args, std::stop_token st) -> std::future<CallToolResult> {
        return std::async(std::launch::async, [args, st]() {
            std::string text = requireString(args, "reverse", "text");
            if (st.stop_requested()) {
                throw ToolExecutionError("reverse cancelled: server is shutting down");
            }
            std::reverse(text.begin(), text.end());
            CallToolResult r;
            r.content.push_back(MakeTextContent(text));
            return r;
        });
    });
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    const std::string program = (argc > 0 && argv[0] != nullptr) ? argv[0] : "mcpgate_server";

    ServerConfig cfg;
    try {
        cfg = LoadServerConfig(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << program << ": " << e.what() << "\n" << UsageText(program);
        return 2;
    }
    if (cfg.showHelp) {
        std::cout << UsageText(program);
        return 0;
    }
    configureLogging(cfg);

    ::signal(SIGTERM, handleSig);
    ::signal(SIGINT, handleSig);

    auto registry = std::make_shared<ToolRegistry>(
        Implementation{cfg.discovery.serviceName, getVersionString()},
        std::string("Call tools/list to discover the available tools, then tools/call to run one."));
    registerDemoTools(*registry);

    // The descriptor is computed once here and never changes for the life of the process.
    auto adapter = std::make_shared<RpcAdapter>(registry->Describe(), registry, cfg.toolErrors);
    HTTPServer server(cfg, adapter);
    try {
        server.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed to start: {}", e.what());
        return 1;
    }

    std::cout << "mcpgate " << getVersionString() << " listening on " << cfg.scheme << "://" << cfg.host << ":"
              << server.LocalPort() << cfg.discovery.primaryPath << std::endl;

    while (gRunning.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Shutting down");
    registry->RequestStop();
    server.Stop().get();
    return 0;
}
