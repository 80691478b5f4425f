#ifndef CHECK_HARNESS_HPP
#define CHECK_HARNESS_HPP

#include <istream>
#include <string>
#include <vector>

// Structure to hold parsed command-line arguments
struct Config {
    std::string script_path;
    std::string working_directory; // empty means stay in the current directory
    bool show_log = false;         // print the check log after the status line
    bool verbose = false;          // echo log lines to stderr as they happen (implies show_log)
    double timeout_seconds = 0;    // 0 keeps the harness defaults
    bool valid = true; // Was parsing successful?
    std::string error_message; // Error message if parsing failed
};

// Parses command-line arguments.
// Returns a Config struct. If parsing fails, config.valid will be false
// and config.error_message will contain details.
Config parse_arguments(int argc, char* argv[]);

enum class Directive {
    Run,
    Stdin,
    Prompt,
    Eof,
    Stdout,
    Literal,
    StdoutFile,
    StdoutEof,
    Drain,
    Exit,
    Kill,
    Reject,
    Exists,
    Same,
};

struct Step {
    Directive directive;
    std::string argument;  // escapes already decoded
    std::string argument2; // second path for Same
    int line = 0;
};

struct Script {
    std::vector<Step> steps;
    bool valid = true;
    std::string error_message;
};

// Parses a check script, one directive per line.
Script parse_script(std::istream& in);

// Runs the steps against a fresh process. Throws ch::Failure on the first
// failed assertion; the process is reaped before this returns or throws.
void execute_script(const Script& script);

#endif // CHECK_HARNESS_HPP
