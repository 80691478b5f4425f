#ifndef CHECK_HARNESS_FAILURE_HPP
#define CHECK_HARNESS_FAILURE_HPP

#include <optional>
#include <stdexcept>
#include <string>

namespace ch {

// Structured details attached to a failed assertion.
struct FailurePayload {
    std::optional<std::string> expected;
    std::optional<std::string> actual;
    std::optional<int> exit_code;
};

/**
 * The single failure signal raised by every assertion in the harness.
 * what() is the human-readable rationale; payload() carries the structured
 * expected/actual values for whoever records the check result.
 */
class Failure : public std::runtime_error {
public:
    explicit Failure(const std::string& rationale, FailurePayload payload = {});

    const FailurePayload& payload() const noexcept { return payload_; }

private:
    FailurePayload payload_;
};

// Builds the failure raised when observed output cannot satisfy an expectation.
Failure mismatch(const std::string& expected, const std::string& actual);

// Internal error types. The facade converts these into Failure.
class SpawnError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ClosedChannelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ch

#endif // CHECK_HARNESS_FAILURE_HPP
