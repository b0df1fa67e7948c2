#include "client/client_options.hpp"
#include "utils/debug_log.hpp"

#include <cstdlib>
#include <stdexcept>

namespace mcp_client {

bool parse_milliseconds(const std::string &text, int &output) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        output = std::stoi(text);
    } catch (const std::out_of_range &) {
        return false;
    }
    return true;
}

static void apply_environment_value(const char *variable_name, int &field) {
    const char *value = std::getenv(variable_name);
    if (value == nullptr || value[0] == '\0') {
        return;
    }

    int parsed_value = 0;
    if (!parse_milliseconds(value, parsed_value)) {
        debug_log::log_message(std::string("Ignoring invalid ") + variable_name + "=" + value);
        return;
    }
    field = parsed_value;
}

void load_options_from_environment(ClientOptions &options) {
    apply_environment_value("MCPC_REQUEST_TIMEOUT_MS", options.request_timeout_milliseconds);
    apply_environment_value("MCPC_CLOSE_GRACE_MS", options.close_grace_milliseconds);
}

} // namespace mcp_client
