#ifndef MCPC_MCP_CLIENT_HPP
#define MCPC_MCP_CLIENT_HPP

// MCP client facade: sequences the protocol-level exchanges
// (initialize handshake, tools/list, tools/call, shutdown) on top of the
// correlation engine.

#include <nlohmann/json.hpp>
#include <memory>
#include <string>

#include "client/call_outcome.hpp"
#include "client/client_options.hpp"
#include "client/correlation_engine.hpp"
#include "protocol/mcp_types.hpp"
#include "transport/transport.hpp"

namespace mcp_client {

// Result of listing tools.
struct ListToolsOutcome {
    bool success = false;
    mcp_types::ListToolsResult listing;
    CallError error;
};

// Result of calling a tool. A tool that ran and reported failure is still a
// successful call; see tool_result.is_error.
struct CallToolOutcome {
    bool success = false;
    mcp_types::CallToolResult tool_result;
    CallError error;
};

class McpClient {
public:
    // Starts the dispatcher on transport right away.
    explicit McpClient(std::shared_ptr<transport::Transport> transport,
                       const ClientOptions &options = ClientOptions());

    McpClient(const McpClient &) = delete;
    McpClient &operator=(const McpClient &) = delete;

    // initialize request, then the notifications/initialized notification.
    // On success the server's result is kept in server_info().
    CallOutcome initialize();

    // One page of tools/list. An empty cursor requests the first page.
    ListToolsOutcome list_tools(const std::string &cursor = "");

    // Every page of tools/list, following next_cursor.
    ListToolsOutcome list_all_tools();

    CallToolOutcome call_tool(const std::string &tool_name, const json &arguments);

    // Arbitrary request, with the configured timeout.
    CallOutcome request(const std::string &method, const json &params);

    CallOutcome notify(const std::string &method, const json &params);

    // shutdown request, exit notification, transport close. The close is
    // attempted whatever happened to the request; when both fail the two
    // errors are merged into one.
    CallOutcome shutdown();

    const json &server_info() const { return server_info_; }

    CorrelationEngine &engine() { return engine_; }

private:
    ClientOptions options_;
    CorrelationEngine engine_;
    json server_info_;
};

} // namespace mcp_client

#endif // MCPC_MCP_CLIENT_HPP
