//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS gateway server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "mcpgate/RpcAdapter.h"
#include "mcpgate/ServerConfig.h"

namespace mcpgate {

//==========================================================================================================
// HTTPServer
// Purpose: Serves both endpoint groups over one listener. POST on either group runs the RPC pipeline;
//          GET follows the group's strategy (descriptor, 405, or the legacy push stream). Each
//          connection carries one request, except a legacy stream which lives until the client leaves.
//==========================================================================================================
class HTTPServer {
public:
    using ErrorHandler = std::function<void(const std::string&)>;

    //==========================================================================================================
    // Args:
    //   cfg: Configuration; copied, never mutated.
    //   adapter: RPC pipeline shared by all connections; must be non-null.
    //==========================================================================================================
    HTTPServer(const ServerConfig& cfg, std::shared_ptr<RpcAdapter> adapter);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    //==========================================================================================================
    // Binds the listener and starts the I/O threads.
    // Returns:
    //   Future that becomes ready once the listener is bound; it holds the exception when binding
    //   (or TLS setup) failed.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes the listener, stops the I/O context and joins the I/O threads.
    // Open legacy streams are dropped. Safe to call more than once.
    //==========================================================================================================
    std::future<void> Stop();

    //==========================================================================================================
    // Sets the handler for transport faults (accept, socket and TLS errors). Faults are logged either way.
    // May be called at any time, also while running. The handler may run on an I/O thread and must not
    // call Stop() from there.
    //==========================================================================================================
    void SetErrorHandler(ErrorHandler handler);

    // Port actually bound (useful when configured with port 0); 0 before Start().
    std::uint16_t LocalPort() const;

    // Number of legacy streams currently open.
    std::size_t ActiveStreamCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpgate
