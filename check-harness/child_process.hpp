#ifndef CHECK_HARNESS_CHILD_PROCESS_HPP
#define CHECK_HARNESS_CHILD_PROCESS_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

#include "output_buffer.hpp"

namespace ch {

enum class ProcessState {
    Running,
    Exited,
    Killed,
};

struct SpawnParams {
    std::vector<std::string> argv;                   // argv[0] is looked up on PATH
    std::string working_directory;                   // empty means inherit
    std::map<std::string, std::string> environment;  // merged over our own environment
};

/**
 * Build a NULL-terminated argv-style array suitable for exec* calls.
 * - If args is empty, returns an empty vector (callers should handle that).
 * - If args is non-empty, returns {args[0].c_str(), ..., args[n-1].c_str(), nullptr}.
 * Note: The returned pointers are valid only as long as the original strings live.
 */
std::vector<const char*> build_exec_argv(const std::vector<std::string>& args);

// Returns "KEY=VALUE" entries for the current environment with overrides applied.
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides);

/**
 * One child process attached to a pseudo-terminal.
 *
 * The child's stdin, stdout and stderr are the PTY slave, so everything it
 * writes arrives in one ordered stream. A background reader thread drains the
 * master side into output() and reaps the child, moving the state from
 * Running to Exited or Killed. The destructor kills, reaps and joins.
 */
class ChildProcess {
public:
    // Throws SpawnError if the PTY cannot be set up or the command cannot be executed.
    explicit ChildProcess(const SpawnParams& params);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Sends text followed by a newline. Throws ClosedChannelError once the child is gone.
    void write(const std::string& text);

    // Sends the terminal's end-of-file character. Throws ClosedChannelError once the child is gone.
    void send_eof();

    // SIGKILL to the child's process group, then reap. No-op if already terminated.
    void kill();

    // Returns the exit code, or throws TimeoutError. Never changes the state itself.
    int wait_exit(std::chrono::milliseconds timeout);

    ProcessState state() const;
    bool running();
    std::optional<int> exit_code() const;
    pid_t pid() const { return pid_; }

    OutputBuffer& output() { return output_; }
    const OutputBuffer& output() const { return output_; }

private:
    void reader_loop();
    void write_all(const char* data, size_t len);
    bool try_reap_locked(int options);

    pid_t pid_ = -1;
    int master_fd_ = -1;
    int wake_fds_[2] = {-1, -1};
    OutputBuffer output_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    ProcessState state_ = ProcessState::Running;
    int exit_code_ = -1;
    bool kill_requested_ = false;

    std::atomic<bool> stop_{false};
    std::thread reader_;
};

} // namespace ch

#endif // CHECK_HARNESS_CHILD_PROCESS_HPP
