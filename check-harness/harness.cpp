#include "harness.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <sys/stat.h>

#include "check.hpp"
#include "escape.hpp"

namespace ch {
namespace {
std::string read_stream(std::istream& in) {
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

// Lines with line endings unified and trailing whitespace removed, without
// trailing blank lines.
std::vector<std::string> normalized_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::string line;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
      c = '\n';
    }
    if (c == '\n') {
      lines.push_back(line);
      line.clear();
    } else {
      line.push_back(c);
    }
  }
  lines.push_back(line);

  for (auto& l : lines) {
    size_t end = l.find_last_not_of(" \t\f\v");
    l.erase(end == std::string::npos ? 0 : end + 1);
  }
  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }
  return lines;
}

Process start(const std::vector<std::string>& argv, const std::string& command,
              const RunOptions& options) {
  log("running " + command + "...");
  SpawnParams params;
  params.argv = argv;
  params.working_directory = options.working_directory;
  params.environment = options.environment;
  try {
    return Process(std::make_unique<ChildProcess>(params), command);
  } catch (const SpawnError& e) {
    throw Failure("could not run " + command + ": " + e.what());
  }
}
} // namespace

Timeouts& default_timeouts() {
  static Timeouts timeouts;
  return timeouts;
}

Process::Process(std::unique_ptr<ChildProcess> child, std::string command)
    : child_(std::move(child)), command_(std::move(command)) {}

Process& Process::input(const std::string& line, bool prompt,
                        std::optional<std::chrono::milliseconds> timeout) {
  if (prompt && !child_->output().has_pending_output(timeout.value_or(default_timeouts().input))) {
    throw Failure("expected prompt for input, found none");
  }
  log("sending input " + raw(line) + "...");
  try {
    child_->write(line);
  } catch (const ClosedChannelError&) {
    throw Failure("expected program to accept input \"" + raw(line) + "\", but it has exited",
                  FailurePayload{std::nullopt, child_->output().unconsumed(), child_->exit_code()});
  }
  return *this;
}

Process& Process::input_eof() {
  log("sending EOF...");
  try {
    child_->send_eof();
  } catch (const ClosedChannelError&) {
    throw Failure("expected program to accept EOF, but it has exited",
                  FailurePayload{std::nullopt, child_->output().unconsumed(), child_->exit_code()});
  }
  return *this;
}

std::string Process::output(std::optional<std::chrono::milliseconds> timeout) {
  std::string text = child_->output().await_output(timeout.value_or(default_timeouts().output));
  log("received output \"" + raw(text) + "\"");
  return text;
}

Process& Process::output(const std::string& expected, MatchMode mode,
                         std::optional<std::chrono::milliseconds> timeout) {
  log("checking for output \"" + raw(expected) + "\"...");
  child_->output().match(expected, mode, timeout.value_or(default_timeouts().output));
  return *this;
}

Process& Process::output(std::istream& reference, MatchMode mode,
                         std::optional<std::chrono::milliseconds> timeout) {
  if (!reference) {
    throw Failure("could not read expected output");
  }
  return output(read_stream(reference), mode, timeout);
}

Process& Process::output_eof(std::optional<std::chrono::milliseconds> timeout) {
  log("checking for EOF...");
  child_->output().await_eof(timeout.value_or(default_timeouts().output));
  return *this;
}

int Process::exit(std::optional<std::chrono::milliseconds> timeout) {
  log("checking that program exited...");
  try {
    return child_->wait_exit(timeout.value_or(default_timeouts().exit));
  } catch (const TimeoutError&) {
    throw Failure("timed out while waiting for program to exit",
                  FailurePayload{std::nullopt, child_->output().unconsumed(), std::nullopt});
  }
}

Process& Process::exit(int code, std::optional<std::chrono::milliseconds> timeout) {
  log("checking that program exited with status " + std::to_string(code) + "...");
  int actual = 0;
  try {
    actual = child_->wait_exit(timeout.value_or(default_timeouts().exit));
  } catch (const TimeoutError&) {
    throw Failure("timed out while waiting for program to exit",
                  FailurePayload{std::to_string(code), child_->output().unconsumed(), std::nullopt});
  }
  if (actual != code) {
    throw Failure("expected exit code " + std::to_string(code) + ", not " + std::to_string(actual),
                  FailurePayload{std::to_string(code), std::to_string(actual), actual});
  }
  return *this;
}

Process& Process::kill() {
  child_->kill();
  return *this;
}

Process& Process::reject(std::optional<std::chrono::milliseconds> timeout) {
  log("checking that input was rejected...");
  if (child_->output().has_pending_output(timeout.value_or(default_timeouts().reject))) {
    throw Failure("expected program to reject input, but it did not",
                  FailurePayload{std::nullopt, child_->output().unconsumed(), child_->exit_code()});
  }
  return *this;
}

bool Process::running() {
  return child_->running();
}

Process run(const std::vector<std::string>& argv, const RunOptions& options) {
  std::string command;
  for (const auto& arg : argv) {
    if (!command.empty()) command += " ";
    command += arg;
  }
  return start(argv, command, options);
}

Process run(const std::string& command, const RunOptions& options) {
  return start({"/bin/sh", "-c", command}, command, options);
}

void exists(const std::string& path) {
  log("checking that " + path + " exists...");
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    throw Failure(path + " not found");
  }
}

bool diff(const std::string& path_a, const std::string& path_b) {
  std::ifstream a(path_a, std::ios::binary);
  std::ifstream b(path_b, std::ios::binary);
  if (!a.is_open() || !b.is_open()) {
    log("could not open " + (a.is_open() ? path_b : path_a) + " for comparison");
    return true;
  }
  return normalized_lines(read_stream(a)) != normalized_lines(read_stream(b));
}

} // namespace ch
