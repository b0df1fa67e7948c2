#ifndef MCPC_MCP_TYPES_HPP
#define MCPC_MCP_TYPES_HPP

// MCP payload types carried inside JSON-RPC results and params:
// tool definitions, tools/list results, tools/call results and their content.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcp_types {

using json = nlohmann::json;

// Description of a tool offered by the server, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::optional<std::string> description;
    json input_schema; // JSON Schema object, null if the server sent none
};

// Result payload of tools/list.
struct ListToolsResult {
    std::vector<ToolDefinition> tools;
    std::optional<std::string> next_cursor;
};

enum class ContentType {
    Text,
    Image,
    EmbeddedResource
};

// One item of a tools/call result. Which members are meaningful depends on type:
// Text -> text, Image -> data + mime_type, EmbeddedResource -> resource.
struct Content {
    ContentType type = ContentType::Text;
    std::string text;
    std::string data;
    std::string mime_type;
    json resource;
};

// Result payload of tools/call.
struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;

    // Text items verbatim, one per line; images and resources as placeholders.
    std::string as_text() const;
};

// Params for initialize.
json build_initialize_params(const std::string &protocol_version,
                             const std::string &client_name,
                             const std::string &client_version);

// Params for tools/call. A null arguments value is sent as an empty object.
json build_call_tool_params(const std::string &tool_name, const json &arguments);

// Parse a tools/list result. Accepts snake_case and camelCase member names.
bool parse_list_tools_result(const json &result, ListToolsResult &output, std::string &error_message);

// Parse a tools/call result. Accepts snake_case and camelCase member names.
bool parse_call_tool_result(const json &result, CallToolResult &output, std::string &error_message);

} // namespace mcp_types

#endif // MCPC_MCP_TYPES_HPP
