// mcpc – MCP client
// Entry point: spawns an MCP server over stdio, performs the initialize
// handshake, lists tools or calls one, and shuts the server down.
//
// Results go to stdout. Logs go to stderr, next to the server's own stderr.

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "app/command_line.hpp"
#include "client/client_options.hpp"
#include "client/mcp_client.hpp"
#include "protocol/json_rpc.hpp"
#include "transport/stdio_process_transport.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

static void print_tools(const mcp_types::ListToolsResult &listing, bool raw_output) {
    if (raw_output) {
        json tools_array = json::array();
        for (const auto &tool : listing.tools) {
            json tool_entry;
            tool_entry["name"] = tool.name;
            if (tool.description.has_value()) {
                tool_entry["description"] = *tool.description;
            }
            tool_entry["input_schema"] = tool.input_schema;
            tools_array.push_back(tool_entry);
        }
        std::cout << tools_array.dump(2) << std::endl;
        return;
    }

    for (const auto &tool : listing.tools) {
        std::cout << tool.name;
        if (tool.description.has_value() && !tool.description->empty()) {
            std::cout << " - " << *tool.description;
        }
        std::cout << std::endl;
    }
}

// Runs the session. Returns the process exit code.
static int run_session(mcp_client::McpClient &client, const command_line::CommandLine &parsed) {
    mcp_client::CallOutcome initialize_outcome = client.initialize();
    if (!initialize_outcome.success) {
        debug_log::log_message("Initialization failed: " + mcp_client::describe(initialize_outcome.error));
        return 1;
    }
    debug_log::log("Server info: " + client.server_info().dump());

    if (parsed.tool_name.empty()) {
        mcp_client::ListToolsOutcome list_outcome = client.list_all_tools();
        if (!list_outcome.success) {
            debug_log::log_message("tools/list failed: " + mcp_client::describe(list_outcome.error));
            return 1;
        }
        print_tools(list_outcome.listing, parsed.raw_output);
        return 0;
    }

    if (parsed.raw_output) {
        // Raw mode skips payload validation and prints what the server sent.
        json params = mcp_types::build_call_tool_params(parsed.tool_name, parsed.tool_arguments);
        mcp_client::CallOutcome call_outcome = client.request("tools/call", params);
        if (!call_outcome.success) {
            debug_log::log_message("tools/call failed: " + mcp_client::describe(call_outcome.error));
            return 1;
        }
        std::cout << call_outcome.result.dump(2) << std::endl;
        return 0;
    }

    mcp_client::CallToolOutcome call_outcome = client.call_tool(parsed.tool_name, parsed.tool_arguments);
    if (!call_outcome.success) {
        debug_log::log_message("tools/call failed: " + mcp_client::describe(call_outcome.error));
        return 1;
    }
    std::cout << call_outcome.tool_result.as_text() << std::endl;
    return call_outcome.tool_result.is_error ? 1 : 0;
}

int main(int argc, char **argv) {
    std::vector<std::string> arguments(argv + 1, argv + argc);
    command_line::ParseResult parse_result = command_line::parse(arguments);
    if (!parse_result.success) {
        std::cerr << "mcpc: " << parse_result.error_message << "\n\n" << command_line::usage();
        return 2;
    }
    const command_line::CommandLine &parsed = parse_result.command_line;
    if (parsed.show_help) {
        std::cout << command_line::usage();
        return 0;
    }

    mcp_client::ClientOptions options;
    mcp_client::load_options_from_environment(options);
    if (parsed.timeout_milliseconds.has_value()) {
        options.request_timeout_milliseconds = *parsed.timeout_milliseconds;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    transport::StdioSpawnResult spawn_result = transport::StdioProcessTransport::spawn(
        parsed.server_command, parsed.server_arguments, options.close_grace_milliseconds);
    if (!spawn_result.success) {
        debug_log::log_message(spawn_result.error_message);
        return 1;
    }

    mcp_client::McpClient client(spawn_result.transport, options);

    // A signal cannot touch the client from the handler itself; this watcher
    // stops the engine instead, which fails any blocked call with Disconnected.
    std::atomic<bool> session_finished{false};
    std::thread signal_watcher([&client, &session_finished]() {
        while (!session_finished) {
            if (shutdown_requested) {
                debug_log::log_message("Interrupted, stopping MCP session.");
                transport::TransportResult close_result = client.engine().stop();
                if (!close_result.success) {
                    debug_log::log_message("Transport close failed: " + close_result.error_message);
                }
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    int exit_code = run_session(client, parsed);

    mcp_client::CallOutcome shutdown_outcome = client.shutdown();
    if (!shutdown_outcome.success && !shutdown_requested) {
        // Many servers do not implement shutdown; the close still went through.
        bool shutdown_unsupported = (shutdown_outcome.error.kind == mcp_client::ErrorKind::RpcError &&
                                     shutdown_outcome.error.code == json_rpc::METHOD_NOT_FOUND);
        if (shutdown_unsupported) {
            debug_log::log("Server does not implement shutdown: " + shutdown_outcome.error.message);
        } else {
            debug_log::log_message("Shutdown failed: " + mcp_client::describe(shutdown_outcome.error));
            if (exit_code == 0) {
                exit_code = 1;
            }
        }
    }

    session_finished = true;
    signal_watcher.join();

    if (shutdown_requested) {
        return 130;
    }
    return exit_code;
}
