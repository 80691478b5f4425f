#include "check-harness.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <unistd.h>

#include "check.hpp"
#include "escape.hpp"
#include "harness.hpp"

namespace {
std::string usage(const std::string& program) {
  return "Usage: " + program + " [--log] [--verbose] [--timeout SECONDS] [--dir DIR] <script>\n"
    "  <script>            Check script, one directive per line\n"
    "  --log               Print the check log after the result\n"
    "  --verbose           Echo log lines to stderr as they happen (implies --log)\n"
    "  --timeout SECONDS   Default wait for prompts, output and exit\n"
    "  --dir DIR           Change into DIR before running the script\n";
}

// One day; anything longer is a typo and would overflow the millisecond count.
constexpr double kMaxTimeoutSeconds = 86400;

bool parse_timeout(const std::string& value, double& out) {
  size_t used = 0;
  try {
    out = std::stod(value, &used);
  } catch (const std::exception&) {
    return false;
  }
  if (used != value.size() || !std::isfinite(out) || out <= 0 || out > kMaxTimeoutSeconds) {
    return false;
  }
  // Must still be a real wait once rounded to milliseconds.
  return std::llround(out * 1000) > 0;
}

bool parse_exit_code(const std::string& value) {
  if (value.empty()) return false;
  size_t start = (value[0] == '-') ? 1 : 0;
  if (start == value.size() || value.size() - start > 9) return false;
  return value.find_first_not_of("0123456789", start) == std::string::npos;
}

bool needs_process(Directive d) {
  return d != Directive::Run && d != Directive::Exists && d != Directive::Same;
}
} // namespace

Config parse_arguments(int argc, char* argv[]) {
  Config config;

  if (argc <= 1) {
    config.valid = false;
    config.error_message = usage(argc > 0 ? argv[0] : "check-harness");
    return config;
  }

  bool in_positional = false;

  auto parse_kv = [](const std::string& s, const std::string& key) -> std::string {
    std::string prefix = key + "=";
    if (s.rfind(prefix, 0) == 0) {
      return s.substr(prefix.size());
    }
    return {};
  };

  auto set_timeout = [&config](const std::string& v) {
    if (!parse_timeout(v, config.timeout_seconds)) {
      config.valid = false;
      config.error_message = "Invalid value for --timeout: " + v + "\n";
    }
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (!in_positional && !arg.empty() && arg[0] == '-') {
      if (arg == "--") {
        in_positional = true;
        continue;
      }
      if (arg == "--log") {
        config.show_log = true;
        continue;
      }
      if (arg == "--verbose") {
        config.verbose = true;
        config.show_log = true;
        continue;
      }
      // Support --flag=value form
      std::string v;
      if ((v = parse_kv(arg, "--timeout")).size()) {
        set_timeout(v);
        if (!config.valid) return config;
        continue;
      }
      if ((v = parse_kv(arg, "--dir")).size()) {
        config.working_directory = v;
        continue;
      }
      // Support --flag value form (consume next)
      if (arg == "--timeout" || arg == "--dir") {
        if (i + 1 >= argc) {
          config.valid = false;
          config.error_message = "Missing value for " + arg + "\n";
          return config;
        }
        std::string val = argv[++i];
        if (arg == "--timeout") {
          set_timeout(val);
          if (!config.valid) return config;
        } else {
          config.working_directory = val;
        }
        continue;
      }
      // Unknown flag
      config.valid = false;
      config.error_message = "Unknown flag: " + arg + "\n";
      return config;
    }

    if (!config.script_path.empty()) {
      config.valid = false;
      config.error_message = "Unexpected argument: " + arg + "\n";
      return config;
    }
    if (arg.empty()) {
      config.valid = false;
      config.error_message = "Script path cannot be empty.\n";
      return config;
    }
    config.script_path = arg;
  }

  if (config.script_path.empty()) {
    config.valid = false;
    config.error_message = usage(argv[0]);
    return config;
  }

  return config;
}

Script parse_script(std::istream& in) {
  static const std::map<std::string, Directive> directives = {
    {"run", Directive::Run},
    {"stdin", Directive::Stdin},
    {"prompt", Directive::Prompt},
    {"eof", Directive::Eof},
    {"stdout", Directive::Stdout},
    {"literal", Directive::Literal},
    {"stdout-file", Directive::StdoutFile},
    {"stdout-eof", Directive::StdoutEof},
    {"drain", Directive::Drain},
    {"exit", Directive::Exit},
    {"kill", Directive::Kill},
    {"reject", Directive::Reject},
    {"exists", Directive::Exists},
    {"same", Directive::Same},
  };

  Script script;
  auto fail = [&script](int line, const std::string& message) {
    script.valid = false;
    script.error_message = "line " + std::to_string(line) + ": " + message + "\n";
    script.steps.clear();
    return script;
  };

  std::string text;
  int line = 0;
  bool have_run = false;
  while (std::getline(in, text)) {
    ++line;
    if (!text.empty() && text.back() == '\r') text.pop_back();
    if (text.empty() || text[0] == '#') continue;

    const size_t space = text.find(' ');
    const std::string name = text.substr(0, space);
    const bool has_argument = space != std::string::npos;
    const std::string encoded = has_argument ? text.substr(space + 1) : std::string();

    auto it = directives.find(name);
    if (it == directives.end()) {
      return fail(line, "unknown directive '" + name + "'");
    }

    Step step;
    step.directive = it->second;
    step.line = line;

    switch (step.directive) {
      case Directive::Eof:
      case Directive::StdoutEof:
      case Directive::Drain:
      case Directive::Kill:
      case Directive::Reject:
        if (!encoded.empty()) {
          return fail(line, "'" + name + "' takes no argument");
        }
        break;
      case Directive::Exit:
        if (!encoded.empty() && !parse_exit_code(encoded)) {
          return fail(line, "invalid exit code '" + encoded + "'");
        }
        step.argument = encoded;
        break;
      default: {
        // Stdin may legitimately send an empty line; everything else needs text.
        if (!has_argument || (encoded.empty() && step.directive != Directive::Stdin &&
                              step.directive != Directive::Prompt)) {
          return fail(line, "'" + name + "' needs an argument");
        }
        auto decoded = ch::unescape(encoded, step.directive == Directive::Stdout);
        if (!decoded.first) {
          return fail(line, "invalid escape sequence in '" + encoded + "'");
        }
        step.argument = decoded.second;
        if (step.directive == Directive::Same) {
          const size_t split = step.argument.find(' ');
          if (split == std::string::npos || split == 0 || split + 1 >= step.argument.size()) {
            return fail(line, "'same' needs two paths");
          }
          step.argument2 = step.argument.substr(split + 1);
          step.argument.erase(split);
        }
        break;
      }
    }

    if (needs_process(step.directive) && !have_run) {
      return fail(line, "'" + name + "' needs a running program; add a 'run' line first");
    }
    if (step.directive == Directive::Run) {
      have_run = true;
    }
    script.steps.push_back(step);
  }

  return script;
}

void execute_script(const Script& script) {
  std::optional<ch::Process> process;
  auto current = [&process](const Step& step) -> ch::Process& {
    if (!process) {
      throw std::logic_error("line " + std::to_string(step.line) + " has no program to act on");
    }
    return *process;
  };

  for (const auto& step : script.steps) {
    switch (step.directive) {
      case Directive::Run:
        process.reset();
        process.emplace(ch::run(step.argument));
        break;
      case Directive::Stdin:
        current(step).input(step.argument);
        break;
      case Directive::Prompt:
        current(step).input(step.argument, true);
        break;
      case Directive::Eof:
        current(step).input_eof();
        break;
      case Directive::Stdout:
        current(step).output(step.argument);
        break;
      case Directive::Literal:
        current(step).output(step.argument, ch::MatchMode::Literal);
        break;
      case Directive::StdoutFile: {
        std::ifstream reference(step.argument, std::ios::binary);
        if (!reference.is_open()) {
          throw ch::Failure("could not open " + step.argument);
        }
        current(step).output(reference, ch::MatchMode::Literal);
        break;
      }
      case Directive::StdoutEof:
        current(step).output_eof();
        break;
      case Directive::Drain:
        current(step).output();
        break;
      case Directive::Exit:
        if (step.argument.empty()) {
          int code = current(step).exit();
          ch::log("program exited with status " + std::to_string(code));
        } else {
          current(step).exit(std::stoi(step.argument));
        }
        break;
      case Directive::Kill:
        current(step).kill();
        break;
      case Directive::Reject:
        current(step).reject();
        break;
      case Directive::Exists:
        ch::exists(step.argument);
        break;
      case Directive::Same:
        ch::log("comparing " + step.argument + " with " + step.argument2 + "...");
        if (ch::diff(step.argument, step.argument2)) {
          throw ch::Failure(step.argument + " and " + step.argument2 + " differ");
        }
        break;
    }
  }
}

#ifndef BUILD_CHECK_HARNESS_AS_LIB
int main(int argc, char* argv[]) {
  Config config = parse_arguments(argc, argv);
  if (!config.valid) {
    std::cerr << "Check Harness - Drives a program through a scripted interactive check\n\n"
              << config.error_message;
    return 2;
  }

  std::ifstream script_file(config.script_path);
  if (!script_file.is_open()) {
    std::cerr << "check-harness: cannot open script " << config.script_path << "\n";
    return 2;
  }
  Script script = parse_script(script_file);
  if (!script.valid) {
    std::cerr << "check-harness: " << config.script_path << ": " << script.error_message;
    return 2;
  }

  if (!config.working_directory.empty() && chdir(config.working_directory.c_str()) != 0) {
    std::cerr << "check-harness: cannot change directory to " << config.working_directory << "\n";
    return 2;
  }

  if (config.timeout_seconds > 0) {
    const auto t = std::chrono::milliseconds(std::llround(config.timeout_seconds * 1000));
    ch::default_timeouts().input = t;
    ch::default_timeouts().output = t;
    ch::default_timeouts().exit = t;
  }

  ch::CheckResult result = ch::run_check(config.script_path, [&script] { execute_script(script); },
                                         config.verbose);
  if (result.passed) {
    std::cout << "PASS " << result.name << "\n";
  } else {
    std::cout << "FAIL " << result.name << ": " << result.failure->what() << "\n";
  }

  if (config.show_log) {
    for (const auto& line : result.log) {
      std::cout << "  " << line << "\n";
    }
    if (result.failure) {
      const ch::FailurePayload& payload = result.failure->payload();
      if (payload.expected) std::cout << "  expected: " << ch::raw(*payload.expected) << "\n";
      if (payload.actual) std::cout << "  actual: " << ch::raw(*payload.actual) << "\n";
      if (payload.exit_code) std::cout << "  exit code: " << *payload.exit_code << "\n";
    }
  }
  return result.passed ? 0 : 1;
}
#endif // BUILD_CHECK_HARNESS_AS_LIB
