#include "protocol/mcp_types.hpp"

namespace mcp_types {

// Look up a member under its snake_case name, falling back to camelCase.
// Returns nullptr when neither is present.
static const json *find_member(const json &object, const char *snake_name, const char *camel_name) {
    auto iterator = object.find(snake_name);
    if (iterator != object.end()) {
        return &*iterator;
    }
    iterator = object.find(camel_name);
    if (iterator != object.end()) {
        return &*iterator;
    }
    return nullptr;
}

static bool read_string(const json &object, const char *name, std::string &output) {
    auto iterator = object.find(name);
    if (iterator == object.end() || !iterator->is_string()) {
        return false;
    }
    output = iterator->get<std::string>();
    return true;
}

static bool parse_tool_definition(const json &entry, ToolDefinition &output, std::string &error_message) {
    if (!entry.is_object()) {
        error_message = "tool entry is not an object";
        return false;
    }
    if (!read_string(entry, "name", output.name)) {
        error_message = "tool entry is missing a string 'name'";
        return false;
    }

    auto description_iterator = entry.find("description");
    if (description_iterator != entry.end() && !description_iterator->is_null()) {
        if (!description_iterator->is_string()) {
            error_message = "tool '" + output.name + "' has a non-string description";
            return false;
        }
        output.description = description_iterator->get<std::string>();
    }

    const json *input_schema = find_member(entry, "input_schema", "inputSchema");
    if (input_schema != nullptr) {
        output.input_schema = *input_schema;
    }
    return true;
}

static bool parse_content(const json &entry, Content &output, std::string &error_message) {
    if (!entry.is_object()) {
        error_message = "content item is not an object";
        return false;
    }

    std::string type;
    if (!read_string(entry, "type", type)) {
        error_message = "content item is missing a string 'type'";
        return false;
    }

    if (type == "text") {
        output.type = ContentType::Text;
        if (!read_string(entry, "text", output.text)) {
            error_message = "text content is missing a string 'text'";
            return false;
        }
        return true;
    }

    if (type == "image") {
        output.type = ContentType::Image;
        const json *mime_type = find_member(entry, "mime_type", "mimeType");
        if (!read_string(entry, "data", output.data) || mime_type == nullptr || !mime_type->is_string()) {
            error_message = "image content requires string 'data' and 'mime_type'";
            return false;
        }
        output.mime_type = mime_type->get<std::string>();
        return true;
    }

    if (type == "embedded_resource" || type == "resource") {
        output.type = ContentType::EmbeddedResource;
        auto resource_iterator = entry.find("resource");
        if (resource_iterator != entry.end()) {
            output.resource = *resource_iterator;
        }
        return true;
    }

    error_message = "unknown content type '" + type + "'";
    return false;
}

std::string CallToolResult::as_text() const {
    std::string text_output;
    for (const auto &item : content) {
        switch (item.type) {
        case ContentType::Text:
            text_output += item.text;
            text_output += '\n';
            break;
        case ContentType::Image:
            text_output += "[Image Content from MCP Tool]\n";
            break;
        case ContentType::EmbeddedResource:
            text_output += "[Embedded Resource from MCP Tool]\n";
            break;
        }
    }

    const char *whitespace = " \t\r\n";
    auto first = text_output.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    auto last = text_output.find_last_not_of(whitespace);
    return text_output.substr(first, last - first + 1);
}

json build_initialize_params(const std::string &protocol_version,
                             const std::string &client_name,
                             const std::string &client_version) {
    json client_info;
    client_info["name"] = client_name;
    client_info["version"] = client_version;

    json params;
    params["protocolVersion"] = protocol_version;
    params["capabilities"] = json::object();
    params["clientInfo"] = client_info;
    return params;
}

json build_call_tool_params(const std::string &tool_name, const json &arguments) {
    json params;
    params["name"] = tool_name;
    params["arguments"] = arguments.is_null() ? json::object() : arguments;
    return params;
}

bool parse_list_tools_result(const json &result, ListToolsResult &output, std::string &error_message) {
    output = ListToolsResult();

    if (!result.is_object()) {
        error_message = "tools/list result is not an object";
        return false;
    }
    auto tools_iterator = result.find("tools");
    if (tools_iterator == result.end() || !tools_iterator->is_array()) {
        error_message = "tools/list result is missing a 'tools' array";
        return false;
    }

    for (const auto &entry : *tools_iterator) {
        ToolDefinition definition;
        if (!parse_tool_definition(entry, definition, error_message)) {
            return false;
        }
        output.tools.push_back(definition);
    }

    const json *next_cursor = find_member(result, "next_cursor", "nextCursor");
    if (next_cursor != nullptr && next_cursor->is_string()) {
        output.next_cursor = next_cursor->get<std::string>();
    }
    return true;
}

bool parse_call_tool_result(const json &result, CallToolResult &output, std::string &error_message) {
    output = CallToolResult();

    if (!result.is_object()) {
        error_message = "tools/call result is not an object";
        return false;
    }
    auto content_iterator = result.find("content");
    if (content_iterator == result.end() || !content_iterator->is_array()) {
        error_message = "tools/call result is missing a 'content' array";
        return false;
    }

    for (const auto &entry : *content_iterator) {
        Content item;
        if (!parse_content(entry, item, error_message)) {
            return false;
        }
        output.content.push_back(item);
    }

    const json *is_error = find_member(result, "is_error", "isError");
    if (is_error != nullptr && is_error->is_boolean()) {
        output.is_error = is_error->get<bool>();
    }
    return true;
}

} // namespace mcp_types
