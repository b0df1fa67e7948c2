#include "client/mcp_client.hpp"
#include "utils/debug_log.hpp"

#include <utility>

namespace mcp_client {

McpClient::McpClient(std::shared_ptr<transport::Transport> transport, const ClientOptions &options)
    : options_(options), engine_(std::move(transport)) {
}

CallOutcome McpClient::initialize() {
    json params = mcp_types::build_initialize_params(options_.protocol_version,
                                                     options_.client_name,
                                                     options_.client_version);
    CallOutcome outcome = engine_.call("initialize", params, options_.request_timeout_milliseconds);
    if (!outcome.success) {
        return outcome;
    }
    server_info_ = outcome.result;

    CallOutcome notify_outcome = engine_.notify("notifications/initialized", nullptr);
    if (!notify_outcome.success) {
        return notify_outcome;
    }
    return outcome;
}

ListToolsOutcome McpClient::list_tools(const std::string &cursor) {
    ListToolsOutcome outcome;

    json params;
    if (!cursor.empty()) {
        params["cursor"] = cursor;
    }

    CallOutcome call_outcome = engine_.call("tools/list", params, options_.request_timeout_milliseconds);
    if (!call_outcome.success) {
        outcome.error = call_outcome.error;
        return outcome;
    }

    std::string parse_error;
    if (!mcp_types::parse_list_tools_result(call_outcome.result, outcome.listing, parse_error)) {
        outcome.error.kind = ErrorKind::ProtocolError;
        outcome.error.message = "Failed to parse list_tools result: " + parse_error;
        return outcome;
    }

    outcome.success = true;
    return outcome;
}

ListToolsOutcome McpClient::list_all_tools() {
    ListToolsOutcome combined;
    std::string cursor;

    while (true) {
        ListToolsOutcome page = list_tools(cursor);
        if (!page.success) {
            return page;
        }

        for (auto &tool : page.listing.tools) {
            combined.listing.tools.push_back(std::move(tool));
        }

        if (!page.listing.next_cursor.has_value() || page.listing.next_cursor->empty()) {
            break;
        }
        if (*page.listing.next_cursor == cursor) {
            combined.error.kind = ErrorKind::ProtocolError;
            combined.error.message = "tools/list returned the same cursor twice: " + cursor;
            return combined;
        }
        cursor = *page.listing.next_cursor;
    }

    combined.success = true;
    return combined;
}

CallToolOutcome McpClient::call_tool(const std::string &tool_name, const json &arguments) {
    CallToolOutcome outcome;

    json params = mcp_types::build_call_tool_params(tool_name, arguments);
    CallOutcome call_outcome = engine_.call("tools/call", params, options_.request_timeout_milliseconds);
    if (!call_outcome.success) {
        outcome.error = call_outcome.error;
        return outcome;
    }

    std::string parse_error;
    if (!mcp_types::parse_call_tool_result(call_outcome.result, outcome.tool_result, parse_error)) {
        outcome.error.kind = ErrorKind::ProtocolError;
        outcome.error.message = "Failed to parse call_tool result: " + parse_error;
        return outcome;
    }

    outcome.success = true;
    return outcome;
}

CallOutcome McpClient::request(const std::string &method, const json &params) {
    return engine_.call(method, params, options_.request_timeout_milliseconds);
}

CallOutcome McpClient::notify(const std::string &method, const json &params) {
    return engine_.notify(method, params);
}

CallOutcome McpClient::shutdown() {
    CallOutcome shutdown_outcome = engine_.call("shutdown", nullptr, options_.request_timeout_milliseconds);

    CallOutcome exit_outcome = engine_.notify("exit", nullptr);
    if (!exit_outcome.success) {
        debug_log::log("exit notification not sent: " + exit_outcome.error.message);
    }

    transport::TransportResult close_result = engine_.stop();

    if (!shutdown_outcome.success) {
        if (!close_result.success) {
            // The close failure is the one that leaves something behind, so it sets the kind.
            return make_failure(ErrorKind::TransportError,
                                "MCP shutdown request failed: " + describe(shutdown_outcome.error) +
                                "; transport close failed: " + close_result.error_message);
        }
        return shutdown_outcome;
    }

    if (!close_result.success) {
        return make_failure(ErrorKind::TransportError, close_result.error_message);
    }

    CallOutcome outcome;
    outcome.success = true;
    outcome.result = shutdown_outcome.result;
    return outcome;
}

} // namespace mcp_client
