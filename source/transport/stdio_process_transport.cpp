#include "transport/stdio_process_transport.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <chrono>

namespace transport {

// How long to wait after SIGTERM before escalating to SIGKILL.
static constexpr int kTerminateGraceMilliseconds = 200;

static bool is_blank(const std::string &line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

StdioSpawnResult StdioProcessTransport::spawn(const std::string &command,
                                              const std::vector<std::string> &arguments,
                                              int close_grace_milliseconds) {
    StdioSpawnResult result;

    if (command.empty()) {
        result.error_message = "Failed to spawn MCP server process: empty command";
        return result;
    }

    platform::ignore_broken_pipe_signal();

    platform::SpawnResult spawn_result = platform::spawn_process_with_pipes(command, arguments);
    if (!spawn_result.success) {
        result.error_message = "Failed to spawn MCP server process: " + spawn_result.error_message;
        return result;
    }

    debug_log::log("Spawned MCP server '" + command + "' pid=" + std::to_string(spawn_result.process_id));

    result.transport.reset(new StdioProcessTransport(spawn_result.process_id,
                                                     spawn_result.stdin_descriptor,
                                                     spawn_result.stdout_descriptor,
                                                     close_grace_milliseconds));
    result.success = true;
    return result;
}

StdioProcessTransport::StdioProcessTransport(int process_id, int stdin_descriptor, int stdout_descriptor,
                                             int close_grace_milliseconds)
    : process_id_(process_id), close_grace_milliseconds_(close_grace_milliseconds),
      stdin_descriptor_(stdin_descriptor), stdout_descriptor_(stdout_descriptor) {
}

StdioProcessTransport::~StdioProcessTransport() {
    TransportResult close_result = close();
    if (!close_result.success) {
        debug_log::log_message("Transport close during destruction failed: " + close_result.error_message);
    }
}

TransportResult StdioProcessTransport::send_frame(const std::string &frame) {
    TransportResult result;

    std::lock_guard<std::timed_mutex> lock(writer_mutex_);
    if (closing_) {
        result.error_message = "Transport is closed";
        return result;
    }

    // One frame per line. Serialized JSON never contains a raw newline.
    std::string line = frame + "\n";
    std::string error_message;
    if (!platform::write_all(stdin_descriptor_, line, error_message)) {
        result.error_message = "Failed to send message to MCP server: " + error_message;
        return result;
    }

    result.success = true;
    return result;
}

bool StdioProcessTransport::take_buffered_frame(std::string &frame) {
    while (true) {
        auto newline_position = receive_buffer_.find('\n', scanned_bytes_);
        if (newline_position == std::string::npos) {
            scanned_bytes_ = receive_buffer_.size();
            return false;
        }

        std::string line = receive_buffer_.substr(0, newline_position);
        receive_buffer_.erase(0, newline_position + 1);
        scanned_bytes_ = 0;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_blank(line)) {
            continue;
        }

        frame = line;
        return true;
    }
}

ReceiveResult StdioProcessTransport::receive_frame() {
    ReceiveResult result;

    std::lock_guard<std::mutex> lock(reader_mutex_);

    while (true) {
        if (take_buffered_frame(result.frame)) {
            result.success = true;
            return result;
        }

        if (receive_buffer_.size() > kMaxFrameBytes) {
            result.error_message = "MCP server sent a line longer than " + std::to_string(kMaxFrameBytes) +
                                   " bytes without a newline";
            receive_buffer_.clear();
            scanned_bytes_ = 0;
            return result;
        }

        if (closing_) {
            result.end_of_stream = true;
            result.error_message = "Transport is closed";
            return result;
        }

        std::string error_message;
        platform::ReadStatus status = platform::read_available(stdout_descriptor_, kReceivePollMilliseconds,
                                                               receive_buffer_, error_message);
        switch (status) {
        case platform::ReadStatus::Data:
        case platform::ReadStatus::Timeout:
            break;

        case platform::ReadStatus::EndOfStream:
            // A final line without its newline still counts as a frame.
            if (!is_blank(receive_buffer_)) {
                result.frame = receive_buffer_;
                receive_buffer_.clear();
                scanned_bytes_ = 0;
                result.success = true;
                return result;
            }
            receive_buffer_.clear();
            scanned_bytes_ = 0;
            result.end_of_stream = true;
            result.error_message = "MCP server closed connection (EOF)";
            return result;

        case platform::ReadStatus::Error:
            result.error_message = "Failed to read from MCP server: " + error_message;
            return result;
        }
    }
}

TransportResult StdioProcessTransport::close() {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    if (closed_) {
        return close_result_;
    }

    closing_ = true;
    debug_log::log("Closing stdio transport, pid=" + std::to_string(process_id_));

    // A writer blocked on a full pipe holds the lock; in that case skip the
    // graceful path and terminate the child, which fails the write with EPIPE.
    std::unique_lock<std::timed_mutex> writer_lock(writer_mutex_, std::defer_lock);
    bool exited = false;
    if (writer_lock.try_lock_for(std::chrono::milliseconds(close_grace_milliseconds_))) {
        platform::close_descriptor(stdin_descriptor_);
        exited = platform::wait_for_process_exit(process_id_, close_grace_milliseconds_);
    }

    if (!exited) {
        debug_log::log("MCP server did not exit within grace period, sending SIGTERM.");
        platform::kill_process(process_id_);
        exited = platform::wait_for_process_exit(process_id_, kTerminateGraceMilliseconds);
    }

    if (!exited) {
        debug_log::log("MCP server ignored SIGTERM, sending SIGKILL.");
        if (!platform::force_kill_process(process_id_)) {
            close_result_.error_message = "Failed to terminate MCP server process " + std::to_string(process_id_);
        }
    }

    if (!writer_lock.owns_lock()) {
        writer_lock.lock();
        platform::close_descriptor(stdin_descriptor_);
    }
    writer_lock.unlock();

    // The reader re-checks closing_ at least every kReceivePollMilliseconds.
    {
        std::lock_guard<std::mutex> reader_lock(reader_mutex_);
        platform::close_descriptor(stdout_descriptor_);
    }

    close_result_.success = close_result_.error_message.empty();
    closed_ = true;
    debug_log::log("Stdio transport closed.");
    return close_result_;
}

} // namespace transport
