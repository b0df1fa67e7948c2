#ifndef MCPC_TRANSPORT_HPP
#define MCPC_TRANSPORT_HPP

// Transport capability consumed by the correlation engine.
// A transport moves whole frames (one serialized JSON-RPC message each) over
// some duplex byte channel. The engine never looks below the frame level, so
// any framed channel can be plugged in: a child process's stdio, a socket,
// an in-memory queue in tests.

#include <string>

namespace transport {

// Result of a send or close operation.
struct TransportResult {
    bool success = false;
    std::string error_message;
};

// Result of waiting for the next inbound frame.
// On failure, end_of_stream distinguishes an orderly close by the peer (or by
// close()) from an I/O error.
struct ReceiveResult {
    bool success = false;
    std::string frame;
    bool end_of_stream = false;
    std::string error_message;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Write one complete frame. Safe to call from several threads at once;
    // frames are never interleaved.
    virtual TransportResult send_frame(const std::string &frame) = 0;

    // Block until one complete frame is available, the stream ends, or the
    // transport is closed. Only one thread (the dispatcher) may call this.
    virtual ReceiveResult receive_frame() = 0;

    // Best-effort shutdown. Idempotent and bounded in time. Unblocks a
    // pending receive_frame().
    virtual TransportResult close() = 0;
};

} // namespace transport

#endif // MCPC_TRANSPORT_HPP
