//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Configuration loading from defaults, environment and command line
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <sstream>

#include "env/EnvVars.h"
#include "mcpgate/ServerConfig.h"

namespace mcpgate {

namespace {

void trim(std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

unsigned long long parseUnsigned(const std::string& text, const char* what) {
    unsigned long long v = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw ConfigError(std::format("Invalid {}: '{}'", what, text));
    }
    return v;
}

bool parseBool(const std::string& text, const char* what) {
    const std::string v = toLower(text);
    if (IsTruthy(v)) {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    throw ConfigError(std::format("Invalid {}: '{}'", what, text));
}

std::string checkLogLevel(const std::string& text) {
    const std::string v = toLower(text);
    if (v == "debug" || v == "info" || v == "warn" || v == "warning" || v == "error" || v == "fatal") {
        return text;
    }
    throw ConfigError(std::format("Invalid log level: '{}'", text));
}

std::optional<std::string> nonEmpty(const EnvLookup& env, const char* name) {
    auto v = env(name);
    if (!v.has_value() || v->empty()) {
        return std::nullopt;
    }
    return v;
}

void applyEnvironment(ServerConfig& cfg, const EnvLookup& env) {
    if (auto v = nonEmpty(env, "HOST")) cfg.host = *v;
    if (auto v = nonEmpty(env, "PORT")) cfg.port = ParsePort(*v);
    if (auto v = nonEmpty(env, "MCPGATE_SCHEME")) cfg.scheme = toLower(*v);
    if (auto v = nonEmpty(env, "MCPGATE_CERT")) cfg.certFile = *v;
    if (auto v = nonEmpty(env, "MCPGATE_KEY")) cfg.keyFile = *v;
    if (auto v = nonEmpty(env, "MCPGATE_LEGACY_SSE")) cfg.legacySse = parseBool(*v, "MCPGATE_LEGACY_SSE");
    if (auto v = nonEmpty(env, "MCPGATE_KEEPALIVE_MS")) {
        cfg.keepAliveInterval = std::chrono::milliseconds(parseUnsigned(*v, "MCPGATE_KEEPALIVE_MS"));
    }
    if (auto v = nonEmpty(env, "MCPGATE_IO_THREADS")) {
        const unsigned long long threads = parseUnsigned(*v, "MCPGATE_IO_THREADS");
        if (threads > kMaxIoThreads) {
            throw ConfigError(std::format("Invalid MCPGATE_IO_THREADS: '{}' (at most {})", *v, kMaxIoThreads));
        }
        cfg.ioThreads = static_cast<unsigned int>(threads);
    }
    if (auto v = nonEmpty(env, "MCPGATE_MAX_BODY_BYTES")) {
        cfg.maxBodyBytes = static_cast<std::size_t>(parseUnsigned(*v, "MCPGATE_MAX_BODY_BYTES"));
    }
    if (auto v = nonEmpty(env, "MCPGATE_TOOL_ERRORS")) cfg.toolErrors = ParseToolErrorMode(*v);
    // An empty origin is meaningful here: it disables CORS headers.
    if (auto v = env("MCPGATE_CORS_ORIGIN")) cfg.corsOrigin = *v;
    if (auto v = nonEmpty(env, "MCPGATE_SERVICE_NAME")) cfg.discovery.serviceName = *v;
    if (auto v = nonEmpty(env, "MCPGATE_LOG_LEVEL")) cfg.logLevel = checkLogLevel(*v);
    if (auto v = nonEmpty(env, "MCPGATE_LOG_FILE")) cfg.logFile = *v;
    if (auto v = nonEmpty(env, "MCPGATE_LOG_COLOR")) cfg.logColor = parseBool(*v, "MCPGATE_LOG_COLOR");
    if (auto v = nonEmpty(env, "MCPGATE_LOG_STDERR")) cfg.logStderr = parseBool(*v, "MCPGATE_LOG_STDERR");
}

void applyArguments(ServerConfig& cfg, const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0) {
            throw ConfigError(std::format("Unexpected argument: '{}'", arg));
        }
        std::string key = arg;
        std::optional<std::string> inlineValue;
        std::size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            key = arg.substr(0, eq);
            inlineValue = arg.substr(eq + 1);
        }

        if (key == "--help") {
            cfg.showHelp = true;
            continue;
        }
        if (key == "--legacy-sse") {
            cfg.legacySse = inlineValue ? parseBool(*inlineValue, "--legacy-sse") : true;
            continue;
        }

        // Remaining options take a value, either inline or as the next argument.
        auto value = [&]() -> std::string {
            if (inlineValue) {
                return *inlineValue;
            }
            if (i + 1 >= args.size()) {
                throw ConfigError(std::format("Missing value for {}", key));
            }
            return args[++i];
        };

        if (key == "--host") {
            cfg.host = value();
        } else if (key == "--port") {
            cfg.port = ParsePort(value());
        } else if (key == "--listen") {
            ApplyListenUri(cfg, value());
        } else if (key == "--keepalive-ms") {
            cfg.keepAliveInterval = std::chrono::milliseconds(parseUnsigned(value(), "--keepalive-ms"));
        } else if (key == "--tool-errors") {
            cfg.toolErrors = ParseToolErrorMode(value());
        } else if (key == "--log-level") {
            cfg.logLevel = checkLogLevel(value());
        } else {
            throw ConfigError(std::format("Unknown option: {}", key));
        }
    }
}

} // namespace

std::uint16_t ParsePort(const std::string& text) {
    std::string t = text;
    trim(t);
    bool allDigits = !t.empty() && std::all_of(t.begin(), t.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (!allDigits) {
        throw ConfigError(std::format("Invalid port (non-numeric): '{}'", text));
    }
    if (t.size() > 5 || parseUnsigned(t, "port") > 65535ull) {
        throw ConfigError(std::format("Invalid port (out of range): '{}'", text));
    }
    return static_cast<std::uint16_t>(parseUnsigned(t, "port"));
}

ToolErrorMode ParseToolErrorMode(const std::string& text) {
    const std::string v = toLower(text);
    if (v == "protocol") {
        return ToolErrorMode::Protocol;
    }
    if (v == "result") {
        return ToolErrorMode::Result;
    }
    throw ConfigError(std::format("Invalid tool error mode: '{}' (expected protocol or result)", text));
}

void ApplyListenUri(ServerConfig& cfg, const std::string& uri) {
    std::string rest = uri;
    trim(rest);

    std::string scheme = "http";
    auto schemeEnd = rest.find("://");
    if (schemeEnd != std::string::npos) {
        scheme = toLower(rest.substr(0, schemeEnd));
        rest = rest.substr(schemeEnd + 3);
    }
    if (scheme != "http" && scheme != "https") {
        throw ConfigError(std::format("Unsupported scheme in listen URI: '{}'", uri));
    }

    std::string query;
    auto qpos = rest.find('?');
    if (qpos != std::string::npos) {
        query = rest.substr(qpos + 1);
        rest = rest.substr(0, qpos);
    }
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    std::string host;
    std::string port;
    if (!rest.empty() && rest.front() == '[') {
        auto rb = rest.find(']');
        if (rb == std::string::npos) {
            throw ConfigError(std::format("Invalid IPv6 host in listen URI: '{}'", uri));
        }
        host = rest.substr(1, rb - 1);
        if (rb + 1 < rest.size() && rest[rb + 1] == ':') {
            port = rest.substr(rb + 2);
        }
    } else {
        auto colon = rest.rfind(':');
        if (colon != std::string::npos) {
            host = rest.substr(0, colon);
            port = rest.substr(colon + 1);
        } else {
            host = rest;
        }
    }

    cfg.scheme = scheme;
    if (!host.empty()) {
        cfg.host = host;
    }
    if (!port.empty()) {
        cfg.port = ParsePort(port);
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") {
                cfg.certFile = val;
            } else if (key == "key") {
                cfg.keyFile = val;
            }
        }
    }
}

void ValidateServerConfig(const ServerConfig& cfg) {
    if (cfg.scheme != "http" && cfg.scheme != "https") {
        throw ConfigError(std::format("Invalid scheme: '{}' (expected http or https)", cfg.scheme));
    }
    if (cfg.scheme == "https" && (cfg.certFile.empty() || cfg.keyFile.empty())) {
        throw ConfigError("https requires both a certificate and a private key (PEM)");
    }
    if (cfg.host.empty()) {
        throw ConfigError("Listen host must not be empty");
    }
    if (cfg.keepAliveInterval.count() <= 0) {
        throw ConfigError("Keep-alive interval must be positive");
    }
    if (cfg.ioThreads == 0) {
        throw ConfigError("I/O thread count must be positive");
    }
    if (cfg.ioThreads > kMaxIoThreads) {
        throw ConfigError(std::format("I/O thread count must not exceed {}", kMaxIoThreads));
    }
    if (cfg.maxBodyBytes == 0) {
        throw ConfigError("Maximum body size must be positive");
    }
}

ServerConfig LoadServerConfig(const std::vector<std::string>& args, const EnvLookup& env) {
    ServerConfig cfg;
    applyEnvironment(cfg, env);
    applyArguments(cfg, args);
    if (!cfg.showHelp) {
        ValidateServerConfig(cfg);
    }
    return cfg;
}

ServerConfig LoadServerConfig(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr) {
            args.emplace_back(argv[i]);
        }
    }
    return LoadServerConfig(args, [](const char* name) { return GetEnv(name); });
}

std::string UsageText(const std::string& programName) {
    std::ostringstream oss;
    oss << "Usage: " << programName << " [options]\n"
        << "  --host H              Listen host (env HOST, default 0.0.0.0)\n"
        << "  --port P              Listen port (env PORT, default 3333)\n"
        << "  --listen URI          http://host:port or https://host:port?cert=<pem>&key=<pem>\n"
        << "  --legacy-sse[=0|1]    Serve the legacy push stream on /sse (env MCPGATE_LEGACY_SSE, default 1)\n"
        << "  --keepalive-ms N      Legacy stream keep-alive period (env MCPGATE_KEEPALIVE_MS, default 10000)\n"
        << "  --tool-errors MODE    protocol|result (env MCPGATE_TOOL_ERRORS, default result)\n"
        << "  --log-level L         debug|info|warn|error (env MCPGATE_LOG_LEVEL, default info)\n"
        << "  --help                Show this text\n";
    return oss.str();
}

} // namespace mcpgate
