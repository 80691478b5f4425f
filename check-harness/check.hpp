#ifndef CHECK_HARNESS_CHECK_HPP
#define CHECK_HARNESS_CHECK_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "failure.hpp"

namespace ch {

// Appends a line to the log of the check currently running on this thread.
// Outside of a check this does nothing.
void log(const std::string& line);

/**
 * Collects the log lines of one check. While alive it is the current log for
 * the constructing thread; the previous one is restored on destruction.
 * With echo enabled every line is also written to stderr as it is recorded.
 */
class CheckLog {
public:
    explicit CheckLog(bool echo = false);
    ~CheckLog();

    CheckLog(const CheckLog&) = delete;
    CheckLog& operator=(const CheckLog&) = delete;

    void add(const std::string& line);
    const std::vector<std::string>& lines() const { return lines_; }

private:
    std::vector<std::string> lines_;
    bool echo_;
    CheckLog* previous_;
};

struct CheckResult {
    std::string name;
    bool passed = false;
    std::vector<std::string> log;
    std::optional<Failure> failure;
};

// Runs one check body. A Failure or any other std::exception fails only this
// check; any process the body spawned has been reaped by the time this returns.
CheckResult run_check(const std::string& name, const std::function<void()>& body, bool echo = false);

} // namespace ch

#endif // CHECK_HARNESS_CHECK_HPP
