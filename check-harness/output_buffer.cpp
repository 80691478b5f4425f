#include "output_buffer.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/regex.hpp>

#include "escape.hpp"
#include "failure.hpp"

namespace ch {

void OutputBuffer::append(const char* data, size_t len) {
  if (len == 0) return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.append(data, len);
  }
  cv_.notify_all();
}

void OutputBuffer::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool OutputBuffer::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t OutputBuffer::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_.size();
}

size_t OutputBuffer::cursor() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cursor_;
}

std::string OutputBuffer::contents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_;
}

std::string OutputBuffer::unconsumed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_.substr(cursor_);
}

std::string OutputBuffer::take_unconsumed_locked() {
  std::string out = data_.substr(cursor_);
  cursor_ = data_.size();
  return out;
}

std::string OutputBuffer::await_output(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return data_.size() > cursor_ || closed_; });
  return take_unconsumed_locked();
}

std::string OutputBuffer::match(const std::string& expectation, MatchMode mode,
                                std::chrono::milliseconds timeout) {
  boost::regex pattern;
  if (mode == MatchMode::Regex) {
    try {
      pattern = boost::regex(expectation, boost::regex::ECMAScript);
    } catch (const boost::regex_error& e) {
      throw Failure("invalid regular expression \"" + raw(expectation) + "\": " + e.what(),
                    FailurePayload{expectation, std::nullopt, std::nullopt});
    }
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock<std::mutex> lock(mutex_);
  size_t attempted_size = 0;
  bool attempted_closed = false;

  for (;;) {
    attempted_size = data_.size();
    attempted_closed = closed_;
    const size_t available = data_.size() - cursor_;

    if (mode == MatchMode::Literal) {
      const size_t n = std::min(available, expectation.size());
      if (data_.compare(cursor_, n, expectation, 0, n) != 0) {
        throw mismatch(expectation, data_.substr(cursor_));
      }
      if (available >= expectation.size()) {
        std::string matched = data_.substr(cursor_, expectation.size());
        cursor_ += expectation.size();
        return matched;
      }
    } else {
      // Anchored at the cursor. $ also matches before any newline, and . never
      // crosses one, so a pattern describes the next line of output.
      boost::smatch m;
      const auto begin = data_.cbegin() + static_cast<std::ptrdiff_t>(cursor_);
      bool found = false;
      try {
        found = boost::regex_search(begin, data_.cend(), m, pattern,
                                    boost::match_continuous | boost::match_not_dot_newline);
      } catch (const std::runtime_error& e) {
        // Raised when matching exceeds the engine's complexity or memory bounds.
        throw Failure("could not match \"" + raw(expectation) + "\": " + e.what(),
                      FailurePayload{expectation, data_.substr(cursor_), std::nullopt});
      }
      if (found) {
        std::string matched = m.str(0);
        cursor_ += matched.size();
        return matched;
      }
    }

    if (closed_) {
      throw mismatch(expectation, data_.substr(cursor_));
    }

    const bool changed = cv_.wait_until(lock, deadline, [&] {
      return data_.size() != attempted_size || closed_ != attempted_closed;
    });
    if (!changed) {
      throw Failure("did not find \"" + raw(expectation) + "\"",
                    FailurePayload{expectation, data_.substr(cursor_), std::nullopt});
    }
  }
}

bool OutputBuffer::has_pending_output(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return data_.size() > cursor_ || closed_; });
  return data_.size() > cursor_;
}

std::string OutputBuffer::await_eof(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this] { return closed_; })) {
    throw Failure("did not find EOF",
                  FailurePayload{std::string("EOF"), data_.substr(cursor_), std::nullopt});
  }
  return take_unconsumed_locked();
}

} // namespace ch
