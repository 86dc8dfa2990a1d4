#pragma once

#include "framing.hpp"
#include "mcp_types.hpp"

#include <cstddef>
#include <string>

namespace mcp {

/**
 * Server settings, filled from the command line at startup.
 */
struct ServerConfig {
    std::string protocol_version = kProtocolVersion;
    Implementation server_info{"mcp_stdio", MCP_STDIO_VERSION_STRING};
    std::string instructions;
    size_t worker_count = 4;
    // requests waiting for a worker before the read loop stops reading; 0 is unbounded
    size_t max_queued_requests = 256;
    FramingMode framing = FramingMode::content_length;
    // file:// resources are served only from below this directory; empty disables them
    std::string resource_root;
};

/**
 * Shared, read-only state handed to every method handler.
 * Handlers run concurrently and must not mutate it.
 */
struct ServerContext {
    ServerConfig config;
};

/**
 * Client settings.
 */
struct ClientConfig {
    std::string protocol_version = kProtocolVersion;
    Implementation client_info{"mcp_stdio_client", MCP_STDIO_VERSION_STRING};
    ClientCapabilities capabilities;
    FramingMode framing = FramingMode::content_length;
    // 0 waits forever
    int default_timeout_ms = 30000;
};

} // namespace mcp
