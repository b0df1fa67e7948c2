#ifndef MCPC_CLIENT_OPTIONS_HPP
#define MCPC_CLIENT_OPTIONS_HPP

// Client configuration: identity sent in the initialize handshake, protocol
// version, and timing knobs. Defaults can be overridden from the environment.

#include <string>

namespace mcp_client {

// Protocol version we announce.
static const char DEFAULT_PROTOCOL_VERSION[] = "2024-11-05";

// Client info.
static const char DEFAULT_CLIENT_NAME[] = "mcpc";
static const char DEFAULT_CLIENT_VERSION[] = "0.1.0";

struct ClientOptions {
    std::string client_name = DEFAULT_CLIENT_NAME;
    std::string client_version = DEFAULT_CLIENT_VERSION;
    std::string protocol_version = DEFAULT_PROTOCOL_VERSION;

    // Per-request timeout. 0 waits for the response without bound.
    int request_timeout_milliseconds = 0;

    // How long a stdio server gets to exit after its stdin is closed.
    int close_grace_milliseconds = 500;
};

// Apply MCPC_REQUEST_TIMEOUT_MS and MCPC_CLOSE_GRACE_MS on top of options.
// Unset, empty, negative or non-numeric values leave the field unchanged.
void load_options_from_environment(ClientOptions &options);

// Parse a non-negative decimal integer. Returns false on anything else.
bool parse_milliseconds(const std::string &text, int &output);

} // namespace mcp_client

#endif // MCPC_CLIENT_OPTIONS_HPP
