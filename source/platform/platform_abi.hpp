#ifndef TOOLWIRE_PLATFORM_ABI_HPP
#define TOOLWIRE_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstddef>
#include <string>
#include <sys/types.h>
#include <vector>

namespace platform {

// Result of spawning a child process with its stdin/stdout connected to pipes.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_write_fd = -1;   // parent writes requests here
    int stdout_read_fd = -1;   // parent reads responses here
    std::string error_message;
};

// Spawn a child process with the given executable path and arguments.
// The child's stdin and stdout are pipes owned by the parent; stderr is inherited.
SpawnResult spawn_with_pipes(const std::string &executable_path,
                             const std::vector<std::string> &arguments);

// Resolve an executable: paths containing '/' are checked directly, bare
// names are searched on PATH. Returns empty string if not found.
std::string find_executable(const std::string &name);

// Write the whole buffer, retrying on partial writes and EINTR.
// Returns false on any other error (e.g. EPIPE when the reader is gone).
bool write_all(int file_descriptor, const std::string &data);

// Blocking read of up to capacity bytes. Returns bytes read, 0 on EOF, -1 on error.
ssize_t read_some(int file_descriptor, char *buffer, size_t capacity);

// Wait until file_descriptor is readable (or at end-of-input). Returns 1 when
// readable, 0 on timeout, -1 on error (errno is kept, EINTR included).
int wait_readable(int file_descriptor, int timeout_milliseconds);

// Single read(2) without retrying on EINTR, so a caller blocked on input can
// notice a signal. Returns bytes read, 0 on EOF, -1 on error (errno is kept).
ssize_t read_once(int file_descriptor, char *buffer, size_t capacity);

// Close a file descriptor if it is valid and reset it to -1.
void close_descriptor(int &file_descriptor);

// Wait (poll) until the process exits, up to timeout_milliseconds.
// Returns true if it exited (and was reaped), false if still running.
bool wait_for_exit(int process_id, int timeout_milliseconds);

// Same, also reporting the exit code (128 + signal number if it was killed).
bool wait_for_exit(int process_id, int timeout_milliseconds, int &exit_code);

// Send SIGTERM (or SIGKILL when force is set) to a process.
bool kill_process(int process_id, bool force = false);

// Ignore SIGPIPE so writes to a dead child fail with EPIPE instead of killing us.
void ignore_broken_pipe_signal();

} // namespace platform

#endif // TOOLWIRE_PLATFORM_ABI_HPP
