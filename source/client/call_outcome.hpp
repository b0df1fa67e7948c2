#ifndef MCPC_CALL_OUTCOME_HPP
#define MCPC_CALL_OUTCOME_HPP

// Outcome types returned by the correlation engine and the client facade.
// Failures are reported as values, never thrown.

#include <nlohmann/json.hpp>
#include <string>

namespace mcp_client {

using json = nlohmann::json;

enum class ErrorKind {
    None,
    TransportError, // send/receive/spawn/close failure
    Disconnected,   // dispatcher stopped while the call was pending, or before it started
    MalformedFrame, // an inbound frame could not be decoded
    RpcError,       // the server answered with an error object
    ProtocolError,  // the answer had an unexpected shape
    Timeout         // no answer within the caller's timeout
};

struct CallError {
    ErrorKind kind = ErrorKind::None;
    int code = 0;        // RpcError only
    std::string message;
    json data;           // RpcError only, null when absent
};

// Result of call() / notify(). result is the raw JSON-RPC result member.
struct CallOutcome {
    bool success = false;
    json result;
    CallError error;
};

// Human readable name of an error kind, e.g. "Disconnected".
const char *error_kind_name(ErrorKind kind);

// One-line description, e.g. "MCP Error -32601: method not found".
std::string describe(const CallError &error);

CallOutcome make_failure(ErrorKind kind, const std::string &message);

} // namespace mcp_client

#endif // MCPC_CALL_OUTCOME_HPP
