// Tests for MCP payload parsing and rendering.

#include "protocol/mcp_types.hpp"
#include "scripted_transport.hpp"

#include <string>

namespace test_mcp_types {

using json = nlohmann::json;
using test_support::report;

// Test: tool listings parse under both naming conventions.
static bool test_list_tools_naming_variants() {
    json snake_case = json::parse(R"({
        "tools": [{"name": "echo", "description": "Echo text", "input_schema": {"type": "object"}}],
        "next_cursor": "c2"
    })");
    json camel_case = json::parse(R"({
        "tools": [{"name": "sum", "inputSchema": {"type": "object", "required": ["a"]}}],
        "nextCursor": "c3"
    })");

    mcp_types::ListToolsResult snake_result;
    mcp_types::ListToolsResult camel_result;
    std::string error_message;
    bool snake_ok = mcp_types::parse_list_tools_result(snake_case, snake_result, error_message);
    bool camel_ok = mcp_types::parse_list_tools_result(camel_case, camel_result, error_message);

    bool success = snake_ok && camel_ok &&
                   snake_result.tools.size() == 1 && snake_result.tools[0].name == "echo" &&
                   snake_result.tools[0].input_schema["type"] == "object" &&
                   snake_result.next_cursor.value_or("") == "c2" &&
                   camel_result.tools[0].name == "sum" && !camel_result.tools[0].description.has_value() &&
                   camel_result.tools[0].input_schema["required"][0] == "a" &&
                   camel_result.next_cursor.value_or("") == "c3";
    return report(success, "tools/list: snake_case and camelCase members", error_message);
}

// Test: a listing without a tools array, or with a nameless tool, is rejected.
static bool test_list_tools_rejects_bad_shapes() {
    mcp_types::ListToolsResult output;
    std::string missing_tools_error;
    std::string nameless_error;
    bool missing_tools = mcp_types::parse_list_tools_result(json::object(), output, missing_tools_error);
    bool nameless = mcp_types::parse_list_tools_result(json::parse(R"({"tools":[{"description":"x"}]})"),
                                                       output, nameless_error);
    bool empty_listing = mcp_types::parse_list_tools_result(json::parse(R"({"tools":[]})"), output,
                                                            missing_tools_error);

    bool success = !missing_tools && !nameless && nameless_error.find("name") != std::string::npos &&
                   empty_listing && output.tools.empty() && !output.next_cursor.has_value();
    return report(success, "tools/list: missing tools or names rejected, empty list accepted", nameless_error);
}

// Test: content variants, the resource alias and both is_error spellings.
static bool test_call_result_content_variants() {
    json result = json::parse(R"({
        "content": [
            {"type": "text", "text": "first"},
            {"type": "image", "data": "AAAA", "mimeType": "image/jpeg"},
            {"type": "resource", "resource": {"uri": "file:///etc/hosts", "text": "127.0.0.1"}},
            {"type": "text", "text": "last"}
        ],
        "isError": true
    })");

    mcp_types::CallToolResult output;
    std::string error_message;
    bool parsed = mcp_types::parse_call_tool_result(result, output, error_message);

    bool success = parsed && output.is_error && output.content.size() == 4 &&
                   output.content[1].type == mcp_types::ContentType::Image &&
                   output.content[1].data == "AAAA" && output.content[1].mime_type == "image/jpeg" &&
                   output.content[2].type == mcp_types::ContentType::EmbeddedResource &&
                   output.content[2].resource["uri"] == "file:///etc/hosts" &&
                   output.as_text() == "first\n[Image Content from MCP Tool]\n[Embedded Resource from MCP Tool]\nlast";
    return report(success, "tools/call: content variants parsed and rendered", error_message);
}

// Test: unknown content types and incomplete items fail the whole result.
static bool test_call_result_rejects_bad_content() {
    mcp_types::CallToolResult output;
    std::string unknown_error;
    std::string image_error;
    bool unknown = mcp_types::parse_call_tool_result(
        json::parse(R"({"content":[{"type":"audio","data":"x"}]})"), output, unknown_error);
    bool image_without_mime = mcp_types::parse_call_tool_result(
        json::parse(R"({"content":[{"type":"image","data":"x"}]})"), output, image_error);

    bool success = !unknown && unknown_error.find("audio") != std::string::npos && !image_without_mime;
    return report(success, "tools/call: unknown or incomplete content rejected", unknown_error);
}

// Test: as_text trims surrounding whitespace and is empty for empty content.
static bool test_as_text_trimming() {
    mcp_types::CallToolResult padded;
    mcp_types::Content text_item;
    text_item.text = "  \n spaced out \n\n";
    padded.content.push_back(text_item);

    mcp_types::CallToolResult empty;
    bool success = padded.as_text() == "spaced out" && empty.as_text().empty();
    return report(success, "as_text: trimmed, empty content renders as empty string", padded.as_text());
}

// Test: request params for initialize and tools/call.
static bool test_build_params() {
    json initialize = mcp_types::build_initialize_params("2024-11-05", "mcpc", "0.1.0");
    json call_without_arguments = mcp_types::build_call_tool_params("echo", nullptr);
    json call_with_arguments = mcp_types::build_call_tool_params("echo", json{{"text", "hi"}});

    bool success = initialize["protocolVersion"] == "2024-11-05" &&
                   initialize["capabilities"] == json::object() &&
                   initialize["clientInfo"]["name"] == "mcpc" && initialize["clientInfo"]["version"] == "0.1.0" &&
                   call_without_arguments["arguments"] == json::object() &&
                   call_with_arguments["name"] == "echo" && call_with_arguments["arguments"]["text"] == "hi";
    return report(success, "Params: initialize and tools/call, null arguments sent as {}");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_list_tools_naming_variants();
    all_passed &= test_list_tools_rejects_bad_shapes();
    all_passed &= test_call_result_content_variants();
    all_passed &= test_call_result_rejects_bad_content();
    all_passed &= test_as_text_trimming();
    all_passed &= test_build_params();
    return all_passed;
}

} // namespace test_mcp_types
