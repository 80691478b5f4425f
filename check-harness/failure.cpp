#include "failure.hpp"

#include <utility>

#include "escape.hpp"

namespace ch {

Failure::Failure(const std::string& rationale, FailurePayload payload)
    : std::runtime_error(rationale), payload_(std::move(payload)) {}

Failure mismatch(const std::string& expected, const std::string& actual) {
  std::string rationale = "expected \"" + raw(expected) + "\", not \"" + raw(actual) + "\"";
  if (actual.empty()) {
    rationale = "expected \"" + raw(expected) + "\", but the program produced no more output";
  }
  return Failure(rationale, FailurePayload{expected, actual, std::nullopt});
}

} // namespace ch
