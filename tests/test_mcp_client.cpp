// Tests for the MCP client facade: handshake sequence, tool listing with
// pagination, tool calls, and the shutdown sequence with its error merging.
// A scripted in-memory server answers each request synchronously.

#include "client/mcp_client.hpp"
#include "protocol/json_rpc.hpp"
#include "scripted_transport.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace test_mcp_client {

using json = nlohmann::json;
using mcp_client::CallOutcome;
using mcp_client::ErrorKind;
using mcp_client::McpClient;
using test_support::ScriptedTransport;
using test_support::report;

// Fake server: answers known methods with canned results, unknown ones with -32601.
static std::vector<std::string> answer_like_a_server(const json &sent_message) {
    std::vector<std::string> replies;
    if (!sent_message.contains("id")) {
        return replies;
    }

    const json &request_id = sent_message["id"];
    std::string method = sent_message["method"].get<std::string>();
    json params = sent_message.contains("params") ? sent_message["params"] : json::object();

    if (method == "initialize") {
        json result;
        result["protocolVersion"] = params["protocolVersion"];
        result["capabilities"]["tools"] = json::object();
        result["serverInfo"] = {{"name", "scripted-server"}, {"version", "1.0.0"}};
        replies.push_back(json_rpc::build_response(request_id, result).dump());
    } else if (method == "tools/list") {
        // Two pages: the first page points at cursor "page-2".
        json result;
        if (params.contains("cursor") && params["cursor"] == "page-2") {
            result["tools"] = json::array({{{"name", "reverse"}, {"inputSchema", {{"type", "object"}}}}});
        } else {
            result["tools"] = json::array({{{"name", "echo"}, {"description", "Echo text"}, {"input_schema", json::object()}}});
            result["next_cursor"] = "page-2";
        }
        replies.push_back(json_rpc::build_response(request_id, result).dump());
    } else if (method == "tools/call") {
        json result;
        if (params["name"] == "echo") {
            result["content"] = json::array({
                {{"type", "text"}, {"text", params["arguments"]["text"]}},
                {{"type", "image"}, {"data", "aGVsbG8="}, {"mime_type", "image/png"}},
                {{"type", "embedded_resource"}, {"resource", {{"uri", "file:///tmp/x"}}}},
            });
            result["is_error"] = false;
        } else if (params["name"] == "broken") {
            result["content"] = "not an array";
        } else {
            result["content"] = json::array({{{"type", "text"}, {"text", "no such tool"}}});
            result["isError"] = true;
        }
        replies.push_back(json_rpc::build_response(request_id, result).dump());
    } else if (method == "shutdown") {
        replies.push_back(json_rpc::build_response(request_id, nullptr).dump());
    } else {
        replies.push_back(json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                                         "Unknown method: " + method).dump());
    }
    return replies;
}

static std::shared_ptr<ScriptedTransport> make_server_transport() {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->set_responder(answer_like_a_server);
    return transport;
}

// Test: initialize sends the handshake request, then the initialized notification.
static bool test_initialize_handshake() {
    auto transport = make_server_transport();
    mcp_client::ClientOptions options;
    options.client_name = "handshake-test";
    McpClient client(transport, options);

    CallOutcome outcome = client.initialize();
    std::vector<json> sent = transport->sent_messages();

    bool success = outcome.success && sent.size() == 2 &&
                   sent[0]["method"] == "initialize" && sent[0]["id"] == 1 &&
                   sent[0]["params"]["protocolVersion"] == mcp_client::DEFAULT_PROTOCOL_VERSION &&
                   sent[0]["params"]["clientInfo"]["name"] == "handshake-test" &&
                   sent[0]["params"]["capabilities"].is_object() &&
                   sent[1]["method"] == "notifications/initialized" && !sent[1].contains("id") &&
                   client.server_info()["serverInfo"]["name"] == "scripted-server";
    return report(success, "Initialize: request, then notifications/initialized; server info kept");
}

// Test: list_tools reads one page; list_all_tools follows the cursor.
static bool test_list_tools_and_pagination() {
    auto transport = make_server_transport();
    McpClient client(transport);

    mcp_client::ListToolsOutcome first_page = client.list_tools();
    bool first_page_ok = first_page.success && first_page.listing.tools.size() == 1 &&
                         first_page.listing.tools[0].name == "echo" &&
                         first_page.listing.tools[0].description.value_or("") == "Echo text" &&
                         first_page.listing.next_cursor.value_or("") == "page-2" &&
                         !transport->sent_messages()[0].contains("params");

    mcp_client::ListToolsOutcome all_pages = client.list_all_tools();
    bool all_pages_ok = all_pages.success && all_pages.listing.tools.size() == 2 &&
                        all_pages.listing.tools[1].name == "reverse" &&
                        all_pages.listing.tools[1].input_schema["type"] == "object" &&
                        !all_pages.listing.next_cursor.has_value();

    bool success = first_page_ok && all_pages_ok;
    return report(success, "List tools: single page and cursor pagination");
}

// Test: call_tool parses every content variant and renders text.
static bool test_call_tool_content() {
    auto transport = make_server_transport();
    McpClient client(transport);

    json arguments;
    arguments["text"] = "hello";
    mcp_client::CallToolOutcome outcome = client.call_tool("echo", arguments);

    json sent_params = transport->sent_messages()[0]["params"];
    bool success = outcome.success && outcome.tool_result.content.size() == 3 &&
                   !outcome.tool_result.is_error &&
                   outcome.tool_result.content[1].type == mcp_types::ContentType::Image &&
                   outcome.tool_result.content[1].mime_type == "image/png" &&
                   outcome.tool_result.as_text() ==
                       "hello\n[Image Content from MCP Tool]\n[Embedded Resource from MCP Tool]" &&
                   sent_params["name"] == "echo" && sent_params["arguments"]["text"] == "hello";
    return report(success, "Call tool: text, image and resource content parsed", outcome.tool_result.as_text());
}

// Test: a tool-level failure is a successful call with is_error set; bad shapes are ProtocolError.
static bool test_call_tool_errors() {
    auto transport = make_server_transport();
    McpClient client(transport);

    mcp_client::CallToolOutcome tool_failure = client.call_tool("unknown_tool", nullptr);
    mcp_client::CallToolOutcome broken = client.call_tool("broken", json::object());

    bool success = tool_failure.success && tool_failure.tool_result.is_error &&
                   tool_failure.tool_result.as_text() == "no such tool" &&
                   !broken.success && broken.error.kind == ErrorKind::ProtocolError;
    return report(success, "Call tool: isError passed through, malformed result is ProtocolError",
                  mcp_client::describe(broken.error));
}

// Test: shutdown sends shutdown, then exit, then closes the transport.
static bool test_shutdown_sequence() {
    auto transport = make_server_transport();
    McpClient client(transport);

    CallOutcome outcome = client.shutdown();
    std::vector<json> sent = transport->sent_messages();

    bool success = outcome.success && sent.size() == 2 &&
                   sent[0]["method"] == "shutdown" && sent[0].contains("id") &&
                   sent[1]["method"] == "exit" && !sent[1].contains("id") &&
                   transport->close_calls() == 1 && !client.engine().is_running();

    CallOutcome after_shutdown = client.request("tools/list", nullptr);
    success = success && after_shutdown.error.kind == ErrorKind::Disconnected;
    return report(success, "Shutdown: shutdown, exit, close; later calls fail with Disconnected");
}

// Test: when only the shutdown request fails, that error is reported as is.
static bool test_shutdown_reports_call_failure() {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->set_responder([](const json &sent_message) {
        std::vector<std::string> replies;
        if (sent_message.contains("id")) {
            replies.push_back(json_rpc::build_error_response(sent_message["id"], json_rpc::METHOD_NOT_FOUND,
                                                             "Unknown method: shutdown").dump());
        }
        return replies;
    });
    McpClient client(transport);

    CallOutcome outcome = client.shutdown();
    bool success = !outcome.success && outcome.error.kind == ErrorKind::RpcError &&
                   outcome.error.code == json_rpc::METHOD_NOT_FOUND && transport->close_calls() == 1;
    return report(success, "Shutdown: call failure alone is reported, close still attempted");
}

// Test: when only the close fails, the close error is reported.
static bool test_shutdown_reports_close_failure() {
    auto transport = make_server_transport();
    transport->set_close_error("child refused to die");
    McpClient client(transport);

    CallOutcome outcome = client.shutdown();
    bool success = !outcome.success && outcome.error.kind == ErrorKind::TransportError &&
                   outcome.error.message == "child refused to die";
    return report(success, "Shutdown: close failure alone is reported", outcome.error.message);
}

// Test: when both fail, one error carries both messages.
static bool test_shutdown_merges_both_failures() {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->set_fail_sends(true);
    transport->set_close_error("child refused to die");
    McpClient client(transport);

    CallOutcome outcome = client.shutdown();
    const std::string &message = outcome.error.message;
    bool success = !outcome.success &&
                   message.find("MCP shutdown request failed:") == 0 &&
                   message.find("simulated send failure") != std::string::npos &&
                   message.find("transport close failed: child refused to die") != std::string::npos;
    return report(success, "Shutdown: both failures merged into one error", message);
}

// Test: an initialize failure is returned and no initialized notification follows.
static bool test_initialize_failure_stops_handshake() {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->set_responder([](const json &sent_message) {
        std::vector<std::string> replies;
        if (sent_message.contains("id")) {
            replies.push_back(json_rpc::build_error_response(sent_message["id"], json_rpc::INVALID_PARAMS,
                                                             "unsupported protocol version").dump());
        }
        return replies;
    });
    McpClient client(transport);

    CallOutcome outcome = client.initialize();
    bool success = !outcome.success && outcome.error.kind == ErrorKind::RpcError &&
                   outcome.error.code == json_rpc::INVALID_PARAMS &&
                   transport->sent_frames().size() == 1 && client.server_info().is_null();
    return report(success, "Initialize: RPC error returned, no initialized notification sent");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_initialize_handshake();
    all_passed &= test_list_tools_and_pagination();
    all_passed &= test_call_tool_content();
    all_passed &= test_call_tool_errors();
    all_passed &= test_shutdown_sequence();
    all_passed &= test_shutdown_reports_call_failure();
    all_passed &= test_shutdown_reports_close_failure();
    all_passed &= test_shutdown_merges_both_failures();
    all_passed &= test_initialize_failure_stops_handshake();
    return all_passed;
}

} // namespace test_mcp_client
