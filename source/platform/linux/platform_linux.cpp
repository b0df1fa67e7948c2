#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

extern char **environ;

namespace platform {

SpawnResult spawn_process_with_pipes(const std::string &executable,
                                     const std::vector<std::string> &arguments) {
    SpawnResult result;

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }

    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    // O_CLOEXEC keeps our ends out of this and any other child; dup2 in the
    // child clears the flag on the copies it installs as 0 and 1.
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) == -1) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        close_descriptor(stdin_pipe[0]);
        close_descriptor(stdin_pipe[1]);
        return result;
    }

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, stdin_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);

    // We ignore SIGPIPE ourselves and ignored dispositions survive exec;
    // the server gets the default disposition back.
    posix_spawnattr_t spawn_attributes;
    posix_spawnattr_init(&spawn_attributes);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    posix_spawnattr_setsigdefault(&spawn_attributes, &default_signals);
    posix_spawnattr_setflags(&spawn_attributes, POSIX_SPAWN_SETSIGDEF);

    pid_t child_pid = 0;
    int spawn_status = posix_spawnp(&child_pid, executable.c_str(),
                                    &file_actions, &spawn_attributes,
                                    argv_pointers.data(), environ);
    posix_spawnattr_destroy(&spawn_attributes);
    posix_spawn_file_actions_destroy(&file_actions);

    // The child's ends are ours to close either way.
    close_descriptor(stdin_pipe[0]);
    close_descriptor(stdout_pipe[1]);

    if (spawn_status != 0) {
        close_descriptor(stdin_pipe[1]);
        close_descriptor(stdout_pipe[0]);
        result.error_message = "posix_spawn failed for '" + executable + "': " +
                               std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_descriptor = stdin_pipe[1];
    result.stdout_descriptor = stdout_pipe[0];
    return result;
}

void ignore_broken_pipe_signal() {
    signal(SIGPIPE, SIG_IGN);
}

bool write_all(int descriptor, const std::string &data, std::string &error_message) {
    if (descriptor < 0) {
        error_message = "write on closed descriptor";
        return false;
    }

    size_t total_written = 0;
    while (total_written < data.size()) {
        ssize_t written = write(descriptor, data.data() + total_written, data.size() - total_written);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_message = "write failed: " + std::string(strerror(errno));
            return false;
        }
        total_written += static_cast<size_t>(written);
    }
    return true;
}

ReadStatus read_available(int descriptor, int timeout_milliseconds,
                          std::string &output, std::string &error_message) {
    if (descriptor < 0) {
        error_message = "read on closed descriptor";
        return ReadStatus::Error;
    }

    struct pollfd poll_descriptor;
    poll_descriptor.fd = descriptor;
    poll_descriptor.events = POLLIN;
    poll_descriptor.revents = 0;

    int poll_result = poll(&poll_descriptor, 1, timeout_milliseconds);
    if (poll_result == 0) {
        return ReadStatus::Timeout;
    }
    if (poll_result < 0) {
        if (errno == EINTR) {
            return ReadStatus::Timeout;
        }
        error_message = "poll failed: " + std::string(strerror(errno));
        return ReadStatus::Error;
    }

    // POLLHUP without POLLIN still reads as 0 bytes below, reported as end of stream.
    char buffer[4096];
    ssize_t bytes_read = read(descriptor, buffer, sizeof(buffer));
    if (bytes_read < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return ReadStatus::Timeout;
        }
        error_message = "read failed: " + std::string(strerror(errno));
        return ReadStatus::Error;
    }
    if (bytes_read == 0) {
        return ReadStatus::EndOfStream;
    }

    output.append(buffer, static_cast<size_t>(bytes_read));
    return ReadStatus::Data;
}

void close_descriptor(int &descriptor) {
    if (descriptor >= 0) {
        close(descriptor);
        descriptor = -1;
    }
}

bool wait_for_process_exit(int process_id, int timeout_milliseconds) {
    if (process_id <= 0) {
        return true;
    }

    int poll_interval_milliseconds = 10;
    auto start_time = std::chrono::steady_clock::now();

    while (true) {
        int status = 0;
        pid_t wait_result = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
        if (wait_result == static_cast<pid_t>(process_id)) {
            return true;
        }
        if (wait_result < 0 && errno == ECHILD) {
            // Already reaped, or not our child.
            return true;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_milliseconds) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_milliseconds));
    }
}

bool kill_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    int kill_result = kill(static_cast<pid_t>(process_id), SIGTERM);
    return (kill_result == 0);
}

bool force_kill_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    if (kill(static_cast<pid_t>(process_id), SIGKILL) != 0 && errno != ESRCH) {
        return false;
    }
    int status = 0;
    while (waitpid(static_cast<pid_t>(process_id), &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }
    return true;
}

} // namespace platform
