#include "platform/platform_abi.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace platform {

namespace {

bool is_executable_file(const std::string &path) {
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

} // namespace

std::string find_executable(const std::string &name) {
    if (name.empty()) {
        return "";
    }
    if (name.find('/') != std::string::npos) {
        return is_executable_file(name) ? name : "";
    }

    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            directory = ".";
        }
        std::string full_path = directory + "/" + name;
        if (is_executable_file(full_path)) {
            return full_path;
        }
    }
    return "";
}

SpawnResult spawn_with_pipes(const std::string &executable_path,
                             const std::vector<std::string> &arguments) {
    SpawnResult result;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe2 (stdin) failed: " + std::string(strerror(errno));
        return result;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe2 (stdout) failed: " + std::string(strerror(errno));
        close_descriptor(stdin_pipe[0]);
        close_descriptor(stdin_pipe[1]);
        return result;
    }

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
    // We need mutable copies of strings for posix_spawn.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    // dup2 clears close-on-exec on the child's 0 and 1; the original pipe
    // ends are closed on exec.
    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, stdin_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(),
                                   &file_actions, nullptr,
                                   argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);

    // The child owns these ends now.
    close_descriptor(stdin_pipe[0]);
    close_descriptor(stdout_pipe[1]);

    if (spawn_status != 0) {
        close_descriptor(stdin_pipe[1]);
        close_descriptor(stdout_pipe[0]);
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_write_fd = stdin_pipe[1];
    result.stdout_read_fd = stdout_pipe[0];
    return result;
}

bool write_all(int file_descriptor, const std::string &data) {
    if (file_descriptor < 0) {
        return false;
    }
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = write(file_descriptor, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

ssize_t read_some(int file_descriptor, char *buffer, size_t capacity) {
    while (true) {
        ssize_t count = read(file_descriptor, buffer, capacity);
        if (count < 0 && errno == EINTR) {
            continue;
        }
        return count;
    }
}

int wait_readable(int file_descriptor, int timeout_milliseconds) {
    struct pollfd descriptor;
    descriptor.fd = file_descriptor;
    descriptor.events = POLLIN;
    descriptor.revents = 0;
    int ready = poll(&descriptor, 1, timeout_milliseconds);
    if (ready <= 0) {
        return ready;
    }
    return 1;
}

ssize_t read_once(int file_descriptor, char *buffer, size_t capacity) {
    return read(file_descriptor, buffer, capacity);
}

void close_descriptor(int &file_descriptor) {
    if (file_descriptor >= 0) {
        close(file_descriptor);
        file_descriptor = -1;
    }
}

bool wait_for_exit(int process_id, int timeout_milliseconds) {
    int exit_code = 0;
    return wait_for_exit(process_id, timeout_milliseconds, exit_code);
}

bool wait_for_exit(int process_id, int timeout_milliseconds, int &exit_code) {
    exit_code = -1;
    if (process_id <= 0) {
        return true;
    }
    const int poll_interval_milliseconds = 20;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);

    while (true) {
        int status = 0;
        pid_t waited = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
        if (waited == static_cast<pid_t>(process_id)) {
            if (WIFEXITED(status)) {
                exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_code = 128 + WTERMSIG(status);
            }
            return true;
        }
        if (waited < 0 && errno != EINTR) {
            // ECHILD: already reaped or not our child.
            return errno == ECHILD;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_milliseconds));
    }
}

bool kill_process(int process_id, bool force) {
    if (process_id <= 0) {
        return false;
    }
    int kill_result = kill(static_cast<pid_t>(process_id), force ? SIGKILL : SIGTERM);
    return (kill_result == 0);
}

void ignore_broken_pipe_signal() {
    static std::once_flag once;
    std::call_once(once, []() {
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        sigaction(SIGPIPE, &action, nullptr);
    });
}

} // namespace platform
