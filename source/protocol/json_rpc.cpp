#include "protocol/json_rpc.hpp"

#include <cstdint>
#include <limits>

namespace json_rpc {

static bool has_payload(const json &params) {
    return !params.is_null() && !params.empty();
}

json build_request(std::int64_t request_id, const std::string &method, const json &params) {
    json request;
    request["jsonrpc"] = JSONRPC_VERSION;
    request["id"] = request_id;
    request["method"] = method;
    if (has_payload(params)) {
        request["params"] = params;
    }
    return request;
}

json build_notification(const std::string &method, const json &params) {
    json notification;
    notification["jsonrpc"] = JSONRPC_VERSION;
    notification["method"] = method;
    if (has_payload(params)) {
        notification["params"] = params;
    }
    return notification;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    response["error"]["data"] = error_data;
    return response;
}

std::string encode_message(const json &message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_request(std::int64_t request_id, const std::string &method, const json &params) {
    return encode_message(build_request(request_id, method, params));
}

std::string encode_notification(const std::string &method, const json &params) {
    return encode_message(build_notification(method, params));
}

DecodeResult decode_message(const std::string &frame) {
    DecodeResult result;

    json message;
    try {
        message = json::parse(frame);
    } catch (const json::parse_error &error) {
        result.error_message = "Failed to parse MCP message: " + std::string(error.what());
        return result;
    }

    if (!message.is_object()) {
        result.error_message = "MCP message is not a JSON object: " + frame;
        return result;
    }

    Envelope &envelope = result.envelope;
    if (message.contains("method")) {
        if (!message["method"].is_string()) {
            result.error_message = "MCP message has a non-string method: " + frame;
            return result;
        }
        envelope.method = message["method"].get<std::string>();
        envelope.kind = is_notification(message) ? MessageKind::Notification : MessageKind::Request;
    } else {
        envelope.kind = MessageKind::Response;
    }

    envelope.has_id = !is_notification(message);
    envelope.id = get_id(message);

    if (message.contains("params")) {
        envelope.params = message["params"];
    }
    if (message.contains("result")) {
        envelope.has_result = true;
        envelope.result = message["result"];
    }
    if (message.contains("error")) {
        envelope.has_error = true;
        envelope.error = message["error"];
    }

    result.success = true;
    return result;
}

bool parse_error_object(const json &error_value, ErrorObject &output) {
    if (!error_value.is_object()) {
        return false;
    }
    if (!error_value.contains("code") || !error_value["code"].is_number_integer()) {
        return false;
    }
    if (!error_value.contains("message") || !error_value["message"].is_string()) {
        return false;
    }

    // Codes outside the int range would be truncated; treat them as malformed.
    const json &code = error_value["code"];
    if (code.is_number_unsigned()) {
        if (code.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return false;
        }
    } else {
        std::int64_t signed_code = code.get<std::int64_t>();
        if (signed_code < std::numeric_limits<int>::min() || signed_code > std::numeric_limits<int>::max()) {
            return false;
        }
    }

    output.code = code.get<int>();
    output.message = error_value["message"].get<std::string>();
    if (error_value.contains("data")) {
        output.data = error_value["data"];
    }
    return true;
}

bool get_integer_id(const json &id, std::int64_t &output) {
    if (!id.is_number_integer()) {
        return false;
    }
    if (id.is_number_unsigned() &&
        id.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return false;
    }
    output = id.get<std::int64_t>();
    return true;
}

json get_id(const json &message) {
    if (message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

bool is_notification(const json &message) {
    return !message.contains("id");
}

} // namespace json_rpc
