#include "app/command_line.hpp"
#include "client/client_options.hpp"

namespace command_line {

static ParseResult fail(const std::string &message) {
    ParseResult result;
    result.error_message = message;
    return result;
}

ParseResult parse(const std::vector<std::string> &arguments) {
    ParseResult result;
    CommandLine &parsed = result.command_line;

    size_t index = 0;
    for (; index < arguments.size(); index++) {
        const std::string &argument = arguments[index];
        if (argument.empty() || argument[0] != '-') {
            break;
        }

        if (argument == "--help" || argument == "-h") {
            parsed.show_help = true;
            result.success = true;
            return result;
        }
        if (argument == "--raw") {
            parsed.raw_output = true;
            continue;
        }

        if (argument != "--call" && argument != "--arguments" && argument != "--timeout-ms") {
            return fail("Unknown option: " + argument);
        }
        if (index + 1 >= arguments.size()) {
            return fail("Missing value for " + argument);
        }
        const std::string &value = arguments[++index];

        if (argument == "--call") {
            parsed.tool_name = value;
        } else if (argument == "--arguments") {
            try {
                parsed.tool_arguments = json::parse(value);
            } catch (const json::parse_error &error) {
                return fail("Invalid JSON for --arguments: " + std::string(error.what()));
            }
            if (!parsed.tool_arguments.is_object()) {
                return fail("--arguments must be a JSON object");
            }
        } else {
            int timeout_milliseconds = 0;
            if (!mcp_client::parse_milliseconds(value, timeout_milliseconds)) {
                return fail("Invalid number for --timeout-ms: " + value);
            }
            parsed.timeout_milliseconds = timeout_milliseconds;
        }
    }

    if (index >= arguments.size()) {
        return fail("Missing server command");
    }

    parsed.server_command = arguments[index];
    parsed.server_arguments.assign(arguments.begin() + static_cast<long>(index) + 1, arguments.end());
    result.success = true;
    return result;
}

std::string usage() {
    return "Usage: mcpc [options] <server-command> [server-args...]\n"
           "\n"
           "Starts an MCP server over stdio, performs the initialize handshake,\n"
           "lists its tools (default) or calls one, then shuts the server down.\n"
           "\n"
           "Options:\n"
           "  --call NAME        call tool NAME instead of listing tools\n"
           "  --arguments JSON   tool arguments as a JSON object (default {})\n"
           "  --timeout-ms N     per-request timeout, 0 waits forever\n"
           "  --raw              print raw JSON results\n"
           "  -h, --help         show this help\n"
           "\n"
           "Environment:\n"
           "  MCPC_DEBUG=1               verbose logging on stderr\n"
           "  MCPC_REQUEST_TIMEOUT_MS    default for --timeout-ms\n"
           "  MCPC_CLOSE_GRACE_MS        time the server gets to exit on close\n";
}

} // namespace command_line
