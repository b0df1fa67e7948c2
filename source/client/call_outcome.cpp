#include "client/call_outcome.hpp"

namespace mcp_client {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None: return "None";
    case ErrorKind::TransportError: return "TransportError";
    case ErrorKind::Disconnected: return "Disconnected";
    case ErrorKind::MalformedFrame: return "MalformedFrame";
    case ErrorKind::RpcError: return "RpcError";
    case ErrorKind::ProtocolError: return "ProtocolError";
    case ErrorKind::Timeout: return "Timeout";
    }
    return "Unknown";
}

std::string describe(const CallError &error) {
    if (error.kind == ErrorKind::RpcError) {
        return "MCP Error " + std::to_string(error.code) + ": " + error.message;
    }
    return std::string(error_kind_name(error.kind)) + ": " + error.message;
}

CallOutcome make_failure(ErrorKind kind, const std::string &message) {
    CallOutcome outcome;
    outcome.success = false;
    outcome.error.kind = kind;
    outcome.error.message = message;
    return outcome;
}

} // namespace mcp_client
