#include "client/correlation_engine.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <utility>

namespace mcp_client {

CorrelationEngine::CorrelationEngine(std::shared_ptr<transport::Transport> transport)
    : transport_(std::move(transport)) {
    dispatcher_thread_ = std::thread(&CorrelationEngine::run_dispatch_loop, this);
}

CorrelationEngine::~CorrelationEngine() {
    transport::TransportResult close_result = stop();
    if (!close_result.success) {
        debug_log::log_message("Transport close failed: " + close_result.error_message);
    }
}

CallOutcome CorrelationEngine::call(const std::string &method, const json &params, int timeout_milliseconds) {
    std::int64_t request_id = next_request_id_.fetch_add(1);

    std::future<CallOutcome> response_future;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (stopped_) {
            return make_failure(ErrorKind::Disconnected,
                                "MCP client is disconnected: " + stop_error_.message);
        }
        std::promise<CallOutcome> response_promise;
        response_future = response_promise.get_future();
        pending_requests_.emplace(request_id, std::move(response_promise));
    }

    debug_log::log("-> request id=" + std::to_string(request_id) + " method=" + method);

    transport::TransportResult send_result =
        transport_->send_frame(json_rpc::encode_request(request_id, method, params));
    if (!send_result.success) {
        // No response can arrive for a request that never left.
        remove_pending(request_id);
        return make_failure(ErrorKind::TransportError, send_result.error_message);
    }

    if (timeout_milliseconds > 0) {
        std::future_status status = response_future.wait_for(std::chrono::milliseconds(timeout_milliseconds));
        // Losing the removal race means the dispatcher already took the entry
        // and is about to resolve it; fall through and collect that answer.
        if (status == std::future_status::timeout && remove_pending(request_id)) {
            return make_failure(ErrorKind::Timeout,
                                "Timed out waiting for MCP response to method: " + method +
                                " (id=" + std::to_string(request_id) + ")");
        }
    }

    try {
        return response_future.get();
    } catch (const std::future_error &error) {
        return make_failure(ErrorKind::Disconnected,
                            "Failed to receive response from MCP server: " + std::string(error.what()));
    }
}

CallOutcome CorrelationEngine::notify(const std::string &method, const json &params) {
    debug_log::log("-> notification method=" + method);

    transport::TransportResult send_result = transport_->send_frame(json_rpc::encode_notification(method, params));
    if (!send_result.success) {
        return make_failure(ErrorKind::TransportError, send_result.error_message);
    }

    CallOutcome outcome;
    outcome.success = true;
    return outcome;
}

transport::TransportResult CorrelationEngine::stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (stop_requested_) {
        return close_result_;
    }
    stop_requested_ = true;

    // Closing the transport unblocks receive_frame(), which ends the loop.
    close_result_ = transport_->close();
    if (dispatcher_thread_.joinable()) {
        dispatcher_thread_.join();
    }
    return close_result_;
}

bool CorrelationEngine::is_running() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return !stopped_;
}

size_t CorrelationEngine::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_requests_.size();
}

CallError CorrelationEngine::stop_error() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return stop_error_;
}

void CorrelationEngine::run_dispatch_loop() {
    debug_log::log("Dispatcher started.");

    CallError stop_error;
    while (true) {
        transport::ReceiveResult received = transport_->receive_frame();
        if (!received.success) {
            if (received.end_of_stream) {
                stop_error.kind = ErrorKind::Disconnected;
                stop_error.message = received.error_message;
                debug_log::log("Dispatcher reached end of stream: " + received.error_message);
            } else {
                stop_error.kind = ErrorKind::TransportError;
                stop_error.message = received.error_message;
                debug_log::log_message("MCP client transport error: " + received.error_message);
            }
            break;
        }

        if (!route_frame(received.frame, stop_error)) {
            break;
        }
    }

    drain_pending(stop_error);
    debug_log::log("Dispatcher stopped: " + describe(stop_error));
}

bool CorrelationEngine::route_frame(const std::string &frame, CallError &stop_error) {
    json_rpc::DecodeResult decoded = json_rpc::decode_message(frame);
    if (!decoded.success) {
        // Framing can no longer be trusted after a corrupt frame.
        stop_error.kind = ErrorKind::MalformedFrame;
        stop_error.message = decoded.error_message;
        debug_log::log_message("Ending MCP session on malformed frame: " + decoded.error_message);
        return false;
    }

    const json_rpc::Envelope &envelope = decoded.envelope;
    switch (envelope.kind) {
    case json_rpc::MessageKind::Response:
        resolve_response(envelope);
        break;
    case json_rpc::MessageKind::Notification:
        debug_log::log("<- notification method=" + envelope.method + " (ignored)");
        break;
    case json_rpc::MessageKind::Request:
        answer_server_request(envelope);
        break;
    }
    return true;
}

void CorrelationEngine::resolve_response(const json_rpc::Envelope &envelope) {
    std::int64_t request_id = 0;
    if (!json_rpc::get_integer_id(envelope.id, request_id)) {
        debug_log::log("<- response with non-integer id " + envelope.id.dump() + " discarded");
        return;
    }

    std::promise<CallOutcome> response_promise;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto pending_iterator = pending_requests_.find(request_id);
        if (pending_iterator == pending_requests_.end()) {
            // Caller timed out, or a duplicate of an answered id.
            debug_log::log("<- response id=" + std::to_string(request_id) + " has no waiter, discarded");
            return;
        }
        response_promise = std::move(pending_iterator->second);
        pending_requests_.erase(pending_iterator);
    }

    debug_log::log("<- response id=" + std::to_string(request_id));

    CallOutcome outcome;
    if (envelope.has_result && !envelope.has_error) {
        outcome.success = true;
        outcome.result = envelope.result;
    } else if (envelope.has_error && !envelope.has_result) {
        json_rpc::ErrorObject error_object;
        if (json_rpc::parse_error_object(envelope.error, error_object)) {
            outcome.error.kind = ErrorKind::RpcError;
            outcome.error.code = error_object.code;
            outcome.error.message = error_object.message;
            outcome.error.data = error_object.data;
        } else {
            outcome = make_failure(ErrorKind::ProtocolError,
                                   "Response error member is malformed: " + envelope.error.dump());
        }
    } else if (envelope.has_error) {
        outcome = make_failure(ErrorKind::ProtocolError, "Response carries both result and error");
    } else {
        outcome = make_failure(ErrorKind::ProtocolError, "Response carries neither result nor error");
    }

    response_promise.set_value(outcome);
}

void CorrelationEngine::answer_server_request(const json_rpc::Envelope &envelope) {
    debug_log::log("<- server request method=" + envelope.method + ", answering method not found");

    json response = json_rpc::build_error_response(envelope.id, json_rpc::METHOD_NOT_FOUND,
                                                   "Method not found: " + envelope.method);
    transport::TransportResult send_result = transport_->send_frame(json_rpc::encode_message(response));
    if (!send_result.success) {
        debug_log::log_message("Failed to answer server request: " + send_result.error_message);
    }
}

bool CorrelationEngine::remove_pending(std::int64_t request_id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_requests_.erase(request_id) > 0;
}

void CorrelationEngine::drain_pending(const CallError &stop_error) {
    std::map<std::int64_t, std::promise<CallOutcome>> drained_requests;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        stopped_ = true;
        stop_error_ = stop_error;
        drained_requests.swap(pending_requests_);
    }

    if (!drained_requests.empty()) {
        debug_log::log("Failing " + std::to_string(drained_requests.size()) + " pending request(s).");
    }
    for (auto &entry : drained_requests) {
        entry.second.set_value(make_failure(ErrorKind::Disconnected,
                                            "Failed to receive response from MCP server: " + stop_error.message));
    }
}

} // namespace mcp_client
