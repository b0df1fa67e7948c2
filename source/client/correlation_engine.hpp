#ifndef MCPC_CORRELATION_ENGINE_HPP
#define MCPC_CORRELATION_ENGINE_HPP

// Request/response correlation over a shared transport.
//
// Every call() gets a fresh integer id and a pending entry (a promise) in the
// registry before its request is sent. A single dispatcher thread, started by
// the constructor, drains inbound frames and resolves the entry whose id a
// response carries. Responses may arrive in any order; matching is by id only.
//
// When the dispatcher stops (end of stream, I/O error, malformed frame, or
// stop()) every pending entry is resolved with Disconnected and all later
// calls fail fast with Disconnected.

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "client/call_outcome.hpp"
#include "protocol/json_rpc.hpp"
#include "transport/transport.hpp"

namespace mcp_client {

class CorrelationEngine {
public:
    explicit CorrelationEngine(std::shared_ptr<transport::Transport> transport);

    // Runs stop().
    ~CorrelationEngine();

    CorrelationEngine(const CorrelationEngine &) = delete;
    CorrelationEngine &operator=(const CorrelationEngine &) = delete;

    // Send a request and block until its response arrives.
    // timeout_milliseconds <= 0 waits without bound; otherwise an expired wait
    // removes the pending entry and fails with Timeout.
    CallOutcome call(const std::string &method, const json &params, int timeout_milliseconds = 0);

    // Send a notification. Nothing is awaited; only a send failure is reported.
    CallOutcome notify(const std::string &method, const json &params);

    // Close the transport and wait for the dispatcher to exit. Idempotent.
    // Returns the transport's close result.
    transport::TransportResult stop();

    bool is_running() const;

    // Number of requests still waiting for a response.
    size_t pending_count() const;

    // Why the dispatcher stopped: kind None while running, Disconnected after
    // an orderly end of stream, TransportError or MalformedFrame otherwise.
    CallError stop_error() const;

private:
    void run_dispatch_loop();

    // Handle one inbound frame. Returns false when the session must end.
    bool route_frame(const std::string &frame, CallError &stop_error);

    void resolve_response(const json_rpc::Envelope &envelope);
    void answer_server_request(const json_rpc::Envelope &envelope);

    // Remove a pending entry without resolving it. Returns false if it was
    // already gone (resolved or drained).
    bool remove_pending(std::int64_t request_id);

    // Mark the engine stopped and resolve every pending entry with Disconnected.
    void drain_pending(const CallError &stop_error);

    std::shared_ptr<transport::Transport> transport_;

    // Independent of pending_mutex_; ids are never allocated under the registry lock.
    std::atomic<std::int64_t> next_request_id_{1};

    mutable std::mutex pending_mutex_;
    std::map<std::int64_t, std::promise<CallOutcome>> pending_requests_;
    bool stopped_ = false;
    CallError stop_error_;

    std::mutex stop_mutex_;
    bool stop_requested_ = false;
    transport::TransportResult close_result_;

    std::thread dispatcher_thread_;
};

} // namespace mcp_client

#endif // MCPC_CORRELATION_ENGINE_HPP
