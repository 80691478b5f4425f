#include "check.hpp"

#include <iostream>

namespace ch {
namespace {
thread_local CheckLog* current_log = nullptr;
} // namespace

void log(const std::string& line) {
  if (current_log != nullptr) {
    current_log->add(line);
  }
}

CheckLog::CheckLog(bool echo) : echo_(echo), previous_(current_log) {
  current_log = this;
}

CheckLog::~CheckLog() {
  current_log = previous_;
}

void CheckLog::add(const std::string& line) {
  lines_.push_back(line);
  if (echo_) {
    std::cerr << "check-harness: " << line << "\n";
  }
}

CheckResult run_check(const std::string& name, const std::function<void()>& body, bool echo) {
  CheckResult result;
  result.name = name;

  CheckLog check_log(echo);
  try {
    body();
    result.passed = true;
  } catch (const Failure& failure) {
    result.failure = failure;
  } catch (const std::exception& e) {
    result.failure = Failure(std::string("check raised an unexpected error: ") + e.what());
    std::cerr << "check-harness: check " << name << " raised: " << e.what() << "\n";
  }
  result.log = check_log.lines();
  return result;
}

} // namespace ch
