#pragma once

#include <string>
#include "collaborators.hpp"

// JSON-RPC server side of the tool broker link. The broker is the client here:
// it sends initialize, tools/list and tools/call, and we answer.
class McpServer {
public:
    static const char* PROTOCOL_VERSION;
    static const char* SERVER_NAME;
    static const char* SERVER_VERSION;

    explicit McpServer(ToolExecutor& tools);

    // Returns true when `reply` holds a message to send back.
    bool handle(const std::string& text, std::string& reply);

    // Cleared on every new connection.
    void reset() { handshake_complete_ = false; }
    bool isHandshakeComplete() const { return handshake_complete_; }

private:
    ToolExecutor& tools_;
    bool handshake_complete_;
};
