#include "child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <system_error>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/wait.h>

#include "check_harness_sys.hpp"
#include "failure.hpp"

extern char** environ;

namespace ch {
namespace {
// How often the reader wakes up to reap a child while nothing is readable.
constexpr int kReapIntervalMs = 20;

// The PTY reports end-of-file slightly before the child becomes reapable.
constexpr auto kExitSettle = std::chrono::milliseconds(200);

// Sent by the child over the exec pipe when it cannot start.
struct ExecFailure {
  int stage;
  int err;
};

enum ExecStage : int {
  kStageAttach = 1,
  kStageChdir = 2,
  kStageExec = 3,
};

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}
} // namespace

std::vector<const char*> build_exec_argv(const std::vector<std::string>& args) {
  std::vector<const char*> out;
  if (!args.empty()) {
    out.reserve(args.size() + 1);
    for (const auto& s : args) {
      out.push_back(s.c_str());
    }
    out.push_back(nullptr);
  }
  return out;
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
  std::map<std::string, std::string> merged;
  for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
    std::string entry(*e);
    size_t eq = entry.find('=');
    if (eq == std::string::npos) continue;
    merged[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  for (const auto& kv : overrides) {
    merged[kv.first] = kv.second;
  }

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& kv : merged) {
    out.push_back(kv.first + "=" + kv.second);
  }
  return out;
}

ChildProcess::ChildProcess(const SpawnParams& params) {
  if (params.argv.empty() || params.argv[0].empty()) {
    throw SpawnError("cannot run an empty command");
  }

  // Everything the child needs is prepared before fork().
  const std::vector<const char*> argv = build_exec_argv(params.argv);
  const std::vector<std::string> env_strings = build_environment(params.environment);
  std::vector<const char*> envp = build_exec_argv(env_strings);
  if (envp.empty()) {
    envp.push_back(nullptr);
  }
  const char* workdir = params.working_directory.empty() ? nullptr : params.working_directory.c_str();

  int slave_fd = -1;
  int exec_fds[2] = {-1, -1};
  auto fail = [&](const std::string& what, int err) {
    close_fd(slave_fd);
    close_fd(exec_fds[0]);
    close_fd(exec_fds[1]);
    close_fd(wake_fds_[0]);
    close_fd(wake_fds_[1]);
    close_fd(master_fd_);
    return SpawnError(what + ": " + std::strerror(err));
  };

  // 1) Open master PTY
  master_fd_ = posix_openpt(O_RDWR | O_NOCTTY);
  if (master_fd_ < 0) {
    throw fail("posix_openpt failed", errno);
  }
  if (fcntl(master_fd_, F_SETFD, FD_CLOEXEC) != 0) {
    throw fail("fcntl(FD_CLOEXEC) failed", errno);
  }
  if (grantpt(master_fd_) != 0 || unlockpt(master_fd_) != 0) {
    throw fail("grantpt/unlockpt failed", errno);
  }

  // 2) Open the slave here so setup errors surface before fork()
  const char* slave_name = ptsname(master_fd_);
  if (!slave_name) {
    throw fail("ptsname failed", errno);
  }
  slave_fd = ::open(slave_name, O_RDWR | O_NOCTTY | O_CLOEXEC);
  if (slave_fd < 0) {
    throw fail("failed to open slave PTY", errno);
  }

  // The output stream must hold exactly what the child wrote: no echo of our
  // input and no \n -> \r\n translation.
  struct termios tio;
  if (tcgetattr(slave_fd, &tio) != 0) {
    throw fail("tcgetattr failed", errno);
  }
  tio.c_lflag &= ~static_cast<tcflag_t>(ECHO | ECHOE | ECHOK | ECHONL);
  tio.c_oflag &= ~static_cast<tcflag_t>(ONLCR);
  if (tcsetattr(slave_fd, TCSANOW, &tio) != 0) {
    throw fail("tcsetattr failed", errno);
  }

  if (pipe2(exec_fds, O_CLOEXEC) != 0) {
    throw fail("pipe2 failed", errno);
  }
  if (pipe2(wake_fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
    throw fail("pipe2 failed", errno);
  }

  // 3) Fork to create child
  pid_ = fork();
  if (pid_ < 0) {
    throw fail("fork failed", errno);
  }

  if (pid_ == 0) {
    // Child: only async-signal-safe calls until exec.
    auto report = [&](int stage) {
      ExecFailure failure{stage, errno};
      (void)::write(exec_fds[1], &failure, sizeof(failure));
      _exit(127);
    };

    ::close(exec_fds[0]);
    setsid(); // new session, so the PTY can become our controlling terminal
    if (ioctl(slave_fd, TIOCSCTTY, 0) != 0) {
      report(kStageAttach);
    }
    if (dup2(slave_fd, STDIN_FILENO) < 0 || dup2(slave_fd, STDOUT_FILENO) < 0 ||
        dup2(slave_fd, STDERR_FILENO) < 0) {
      report(kStageAttach);
    }
    if (slave_fd > STDERR_FILENO) {
      ::close(slave_fd);
    }
    signal(SIGPIPE, SIG_DFL);

    if (workdir != nullptr && chdir(workdir) != 0) {
      report(kStageChdir);
    }
    execvpe(argv[0], const_cast<char* const*>(argv.data()), const_cast<char* const*>(envp.data()));
    report(kStageExec);
  }

  // Parent
  close_fd(slave_fd);
  close_fd(exec_fds[1]);

  ExecFailure failure{0, 0};
  ssize_t n;
  do {
    n = ::read(exec_fds[0], &failure, sizeof(failure));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_fds[0]);

  if (n == static_cast<ssize_t>(sizeof(failure))) {
    // exec never happened; collect the child before reporting.
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    pid_ = -1;
    std::string what = "failed to attach " + params.argv[0] + " to a PTY";
    if (failure.stage == kStageChdir) {
      what = "cannot change directory to " + params.working_directory;
    } else if (failure.stage == kStageExec) {
      what = "cannot execute " + params.argv[0];
    }
    throw fail(what, failure.err);
  }

  try {
    reader_ = std::thread(&ChildProcess::reader_loop, this);
  } catch (const std::system_error& e) {
    kill();
    throw fail(std::string("cannot start output reader: ") + e.what(), e.code().value());
  }
}

ChildProcess::~ChildProcess() {
  kill();
  stop_ = true;
  if (wake_fds_[1] >= 0) {
    const char b = 'w';
    (void)::write(wake_fds_[1], &b, 1);
  }
  if (reader_.joinable()) {
    reader_.join();
  }
  close_fd(master_fd_);
  close_fd(wake_fds_[0]);
  close_fd(wake_fds_[1]);
}

void ChildProcess::reader_loop() {
  bool eof = false;
  char buf[1024];

  while (!stop_.load()) {
    struct pollfd fds[2];
    fds[0] = pollfd{wake_fds_[0], POLLIN, 0};
    fds[1] = pollfd{master_fd_, POLLIN, 0};
    const nfds_t nfds = eof ? 1 : 2;

    int ret = sys::poll(fds, nfds, kReapIntervalMs);
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "check-harness: poll failed for pid " << pid_ << ": " << std::strerror(errno) << "\n";
      if (!eof) {
        eof = true;
        output_.close();
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(kReapIntervalMs));
    }

    if (ret > 0 && (fds[0].revents & POLLIN)) {
      char drain[64];
      while (::read(wake_fds_[0], drain, sizeof(drain)) > 0) {
      }
    }

    // Data from child -> buffer
    if (ret > 0 && !eof && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
      ssize_t n = ::read(master_fd_, buf, sizeof(buf));
      if (n > 0) {
        output_.append(buf, static_cast<size_t>(n));
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        // Linux reports EIO once every slave descriptor is closed.
        eof = true;
        output_.close();
      }
    }

    bool done = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ == ProcessState::Running) {
        try_reap_locked(WNOHANG);
      }
      done = eof && state_ != ProcessState::Running;
    }
    if (done) {
      break;
    }
  }
}

bool ChildProcess::try_reap_locked(int options) {
  int status = 0;
  pid_t r;
  do {
    r = waitpid(pid_, &status, options);
  } while (r < 0 && errno == EINTR);

  if (r == 0) {
    return false;
  }
  if (r < 0) {
    // Someone else reaped our child (e.g. a SIGCHLD handler calling waitpid(-1)).
    std::cerr << "check-harness: waitpid(" << pid_ << ") failed: " << std::strerror(errno) << "\n";
    exit_code_ = -1;
    state_ = kill_requested_ ? ProcessState::Killed : ProcessState::Exited;
  } else if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
    state_ = ProcessState::Exited;
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
    state_ = kill_requested_ ? ProcessState::Killed : ProcessState::Exited;
  } else {
    return false;
  }
  state_cv_.notify_all();
  return true;
}

void ChildProcess::write_all(const char* data, size_t len) {
  while (len > 0) {
    ssize_t w = ::write(master_fd_, data, len);
    if (w < 0) {
      if (errno == EINTR) continue;
      throw ClosedChannelError(std::string("cannot write to process: ") + std::strerror(errno));
    }
    data += w;
    len -= static_cast<size_t>(w);
  }
}

void ChildProcess::write(const std::string& text) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ProcessState::Running) {
      throw ClosedChannelError("process " + std::to_string(pid_) + " has already terminated");
    }
  }
  const std::string line = text + "\n";
  write_all(line.data(), line.size());
}

void ChildProcess::send_eof() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ProcessState::Running) {
      throw ClosedChannelError("process " + std::to_string(pid_) + " has already terminated");
    }
  }
  char eof_char = 0x04;
  struct termios tio;
  if (tcgetattr(master_fd_, &tio) == 0 && tio.c_cc[VEOF] != _POSIX_VDISABLE) {
    eof_char = static_cast<char>(tio.c_cc[VEOF]);
  }
  write_all(&eof_char, 1);
}

void ChildProcess::kill() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != ProcessState::Running || pid_ <= 0) {
    return;
  }
  kill_requested_ = true;
  // The child is a session leader, so its pid is also its process group id.
  // Until we reap it the pid cannot be reused, even if it already exited.
  (void)::kill(-pid_, SIGKILL);
  (void)::kill(pid_, SIGKILL);
  try_reap_locked(0);
}

int ChildProcess::wait_exit(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!state_cv_.wait_for(lock, timeout, [this] { return state_ != ProcessState::Running; })) {
    throw TimeoutError("process " + std::to_string(pid_) + " did not exit within " +
                       std::to_string(timeout.count()) + "ms");
  }
  return exit_code_;
}

ProcessState ChildProcess::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool ChildProcess::running() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (state_ == ProcessState::Running) {
    try_reap_locked(WNOHANG);
  }
  if (state_ == ProcessState::Running && output_.closed()) {
    state_cv_.wait_for(lock, kExitSettle, [this] { return state_ != ProcessState::Running; });
  }
  return state_ == ProcessState::Running;
}

std::optional<int> ChildProcess::exit_code() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == ProcessState::Running) {
    return std::nullopt;
  }
  return exit_code_;
}

} // namespace ch
