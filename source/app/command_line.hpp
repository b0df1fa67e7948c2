#ifndef MCPC_COMMAND_LINE_HPP
#define MCPC_COMMAND_LINE_HPP

// Command-line parsing for the mcpc tool.
//
//   mcpc [--call NAME] [--arguments JSON] [--timeout-ms N] [--raw] <server-command> [server-args...]
//
// Options end at the first non-option argument; it and everything after it
// form the server command line.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace command_line {

using json = nlohmann::json;

struct CommandLine {
    std::string server_command;
    std::vector<std::string> server_arguments;
    std::string tool_name;          // empty: list tools instead of calling one
    json tool_arguments = json::object();
    std::optional<int> timeout_milliseconds;
    bool raw_output = false;
    bool show_help = false;
};

struct ParseResult {
    bool success = false;
    CommandLine command_line;
    std::string error_message;
};

ParseResult parse(const std::vector<std::string> &arguments);

// Usage text for --help and usage errors.
std::string usage();

} // namespace command_line

#endif // MCPC_COMMAND_LINE_HPP
