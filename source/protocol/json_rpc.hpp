#ifndef MCPC_JSON_RPC_HPP
#define MCPC_JSON_RPC_HPP

// JSON-RPC 2.0 envelope codec for MCP protocol communication.
// Uses nlohmann/json for parsing and serialization.
// Stateless: encodes outbound requests/notifications to frames and decodes
// inbound frames into envelopes. Knows nothing about payload schemas.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

static const char JSONRPC_VERSION[] = "2.0";

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// What an inbound message is, judged by its method and id members.
enum class MessageKind {
    Request,      // method + id
    Notification, // method, no id
    Response      // no method
};

// The error member of a response.
struct ErrorObject {
    int code = 0;
    std::string message;
    json data; // null when absent
};

// A decoded inbound message. Members that were absent on the wire are left
// null / empty and flagged by the has_* fields.
struct Envelope {
    MessageKind kind = MessageKind::Response;
    bool has_id = false;
    json id;
    std::string method;
    json params;
    bool has_result = false;
    json result;
    bool has_error = false;
    json error;
};

// Result of decoding one frame.
struct DecodeResult {
    bool success = false;
    Envelope envelope;
    std::string error_message;
};

// Build a request object. params is omitted when null or empty.
json build_request(std::int64_t request_id, const std::string &method, const json &params);

// Build a notification object (no id). params is omitted when null or empty.
json build_notification(const std::string &method, const json &params);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data.
json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data);

// Serialize a message to a single-line frame. Invalid UTF-8 in strings is
// replaced with U+FFFD instead of failing.
std::string encode_message(const json &message);

// Convenience: build_request + encode_message.
std::string encode_request(std::int64_t request_id, const std::string &method, const json &params);

// Convenience: build_notification + encode_message.
std::string encode_notification(const std::string &method, const json &params);

// Decode one inbound frame. Fails only when the frame is not a JSON object or
// its method member is not a string; payload shape is left to the caller.
DecodeResult decode_message(const std::string &frame);

// Read code/message/data out of an error member. Returns false when the value
// is not an object with an integer code (within int range) and a string message.
bool parse_error_object(const json &error_value, ErrorObject &output);

// Extract an integer id. Returns false for string, null, or missing ids, and
// for integers outside the int64 range.
bool get_integer_id(const json &id, std::int64_t &output);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Check if a message is a notification (no id field).
bool is_notification(const json &message);

} // namespace json_rpc

#endif // MCPC_JSON_RPC_HPP
