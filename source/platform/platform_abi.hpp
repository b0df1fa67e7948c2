#ifndef MCPC_PLATFORM_ABI_HPP
#define MCPC_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process with piped standard streams.
// stdin_descriptor is the write end of the child's stdin,
// stdout_descriptor is the read end of the child's stdout.
// The child's stderr is left connected to ours.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_descriptor = -1;
    int stdout_descriptor = -1;
    std::string error_message;
};

// Outcome of a single bounded read attempt.
enum class ReadStatus {
    Data,
    Timeout,
    EndOfStream,
    Error
};

// Spawn a child process. executable may be a bare name (searched on PATH).
// SIGPIPE is reset to its default disposition in the child.
SpawnResult spawn_process_with_pipes(const std::string &executable,
                                     const std::vector<std::string> &arguments);

// Writing to a pipe whose reader exited must fail with EPIPE instead of
// terminating us. Safe to call more than once.
void ignore_broken_pipe_signal();

// Write the whole buffer, retrying on partial writes and EINTR.
bool write_all(int descriptor, const std::string &data, std::string &error_message);

// Wait up to timeout_milliseconds for input, then read what is available
// and append it to output.
ReadStatus read_available(int descriptor, int timeout_milliseconds,
                          std::string &output, std::string &error_message);

// Close a descriptor and reset it to -1. No-op for -1.
void close_descriptor(int &descriptor);

// Poll until the process exits (and reap it), up to timeout_milliseconds.
// Returns true if the process is gone.
bool wait_for_process_exit(int process_id, int timeout_milliseconds);

// Ask a process to terminate (SIGTERM).
bool kill_process(int process_id);

// Kill a process unconditionally (SIGKILL) and reap it.
bool force_kill_process(int process_id);

} // namespace platform

#endif // MCPC_PLATFORM_ABI_HPP
