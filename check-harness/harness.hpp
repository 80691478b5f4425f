#ifndef CHECK_HARNESS_HARNESS_HPP
#define CHECK_HARNESS_HARNESS_HPP

#include <chrono>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "child_process.hpp"
#include "failure.hpp"
#include "output_buffer.hpp"

namespace ch {

// Default bounds for the waiting operations. Adjustable process-wide
// (check-harness --timeout changes input, output and exit).
struct Timeouts {
    std::chrono::milliseconds input{3000};
    std::chrono::milliseconds output{3000};
    std::chrono::milliseconds exit{5000};
    std::chrono::milliseconds reject{1000};
};

Timeouts& default_timeouts();

struct RunOptions {
    std::string working_directory;
    std::map<std::string, std::string> environment;
};

/**
 * A running program under test plus the assertions a check makes about it.
 *
 * Named after the streams they assert on: input() sends to stdin, output()
 * matches stdout (stdin/stdout are macros in <cstdio>). Assertions throw
 * Failure; those that do not return a value return *this so calls chain:
 *
 *   ch::run("./greet").input("World", true).output("hello, World\n").exit(0);
 *
 * Destroying a Process kills and reaps the program.
 */
class Process {
public:
    Process(std::unique_ptr<ChildProcess> child, std::string command);

    Process(Process&&) noexcept = default;
    Process& operator=(Process&&) noexcept = default;

    // Sends line plus a newline. With prompt, first requires some output to be pending.
    Process& input(const std::string& line, bool prompt = false,
                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Sends end-of-file.
    Process& input_eof();

    // Drains and returns whatever output is pending; empty if none arrives.
    std::string output(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    Process& output(const std::string& expected, MatchMode mode = MatchMode::Regex,
                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Expected text is read from a stream, e.g. an std::ifstream of a reference file.
    Process& output(std::istream& reference, MatchMode mode = MatchMode::Regex,
                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Requires the program to finish its output.
    Process& output_eof(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Waits for the program to exit and returns its exit code.
    int exit(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    Process& exit(int code, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    Process& kill();

    // Requires that no new output appears within the timeout.
    Process& reject(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    bool running();
    const std::string& command() const { return command_; }
    ChildProcess& child() { return *child_; }

private:
    std::unique_ptr<ChildProcess> child_;
    std::string command_;
};

// Runs command through /bin/sh -c.
Process run(const std::string& command, const RunOptions& options = {});

// Executes argv directly; argv[0] is looked up on PATH.
Process run(const std::vector<std::string>& argv, const RunOptions& options = {});

// Throws Failure("<path> not found") unless path exists.
void exists(const std::string& path);

// True if the files differ, ignoring line endings, trailing whitespace and
// trailing blank lines. An unreadable file counts as different.
bool diff(const std::string& path_a, const std::string& path_b);

} // namespace ch

#endif // CHECK_HARNESS_HARNESS_HPP
