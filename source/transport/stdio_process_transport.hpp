#ifndef MCPC_STDIO_PROCESS_TRANSPORT_HPP
#define MCPC_STDIO_PROCESS_TRANSPORT_HPP

// Transport over the standard streams of a spawned MCP server process.
// Frames are newline-delimited JSON texts: one message per line on the
// child's stdin (outbound) and stdout (inbound). The child's stderr is
// passed through to ours untouched.

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "transport/transport.hpp"

namespace transport {

class StdioProcessTransport;

// Result of spawning the server process.
struct StdioSpawnResult {
    bool success = false;
    std::shared_ptr<StdioProcessTransport> transport;
    std::string error_message;
};

class StdioProcessTransport : public Transport {
public:
    // How long receive_frame() blocks in poll before re-checking for close().
    static constexpr int kReceivePollMilliseconds = 50;

    // Longest line receive_frame() buffers before giving up on the stream.
    static constexpr size_t kMaxFrameBytes = 16 * 1024 * 1024;

    // Spawn command (searched on PATH) with arguments. close_grace_milliseconds
    // is how long close() waits for the child to exit on its own after its
    // stdin is closed, before terminating it.
    static StdioSpawnResult spawn(const std::string &command,
                                  const std::vector<std::string> &arguments,
                                  int close_grace_milliseconds = 500);

    ~StdioProcessTransport() override;

    StdioProcessTransport(const StdioProcessTransport &) = delete;
    StdioProcessTransport &operator=(const StdioProcessTransport &) = delete;

    TransportResult send_frame(const std::string &frame) override;
    ReceiveResult receive_frame() override;
    TransportResult close() override;

    int process_id() const { return process_id_; }

private:
    StdioProcessTransport(int process_id, int stdin_descriptor, int stdout_descriptor,
                          int close_grace_milliseconds);

    // Pops the next complete line from receive_buffer_ into frame.
    bool take_buffered_frame(std::string &frame);

    int process_id_;
    int close_grace_milliseconds_;

    std::timed_mutex writer_mutex_;
    int stdin_descriptor_;

    std::mutex reader_mutex_;
    int stdout_descriptor_;
    std::string receive_buffer_;
    size_t scanned_bytes_ = 0; // prefix of receive_buffer_ known to hold no newline

    std::atomic<bool> closing_{false};
    std::mutex close_mutex_;
    bool closed_ = false;
    TransportResult close_result_;
};

} // namespace transport

#endif // MCPC_STDIO_PROCESS_TRANSPORT_HPP
