#ifndef CHECK_HARNESS_OUTPUT_BUFFER_HPP
#define CHECK_HARNESS_OUTPUT_BUFFER_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>

namespace ch {

enum class MatchMode {
    Regex,
    Literal,
};

/**
 * Everything a child has written so far, plus a read cursor marking how much
 * of it earlier assertions have consumed.
 *
 * The reader thread calls append() and close(); the check thread calls the
 * waiting operations. Bytes before the cursor are never matched again, bytes
 * after it stay available for failure diagnostics.
 */
class OutputBuffer {
public:
    void append(const char* data, size_t len);

    // No more bytes will arrive (the channel reached end-of-file).
    void close();

    bool closed() const;
    size_t size() const;
    size_t cursor() const;
    std::string contents() const;
    std::string unconsumed() const;

    // Waits until unconsumed output exists, the channel closes or the timeout
    // elapses, then consumes and returns whatever is unconsumed.
    std::string await_output(std::chrono::milliseconds timeout);

    // Matches expectation at the cursor and consumes the matched span.
    // Regex patterns use ECMAScript syntax; ^ and $ match at line boundaries.
    // Throws Failure on timeout, on end-of-file without a match, when literal
    // output has already diverged, or for an invalid pattern.
    std::string match(const std::string& expectation, MatchMode mode,
                      std::chrono::milliseconds timeout);

    // True once any unconsumed byte is present; never moves the cursor.
    bool has_pending_output(std::chrono::milliseconds timeout);

    // Waits for end-of-file and consumes everything before it.
    // Throws Failure on timeout.
    std::string await_eof(std::chrono::milliseconds timeout);

private:
    std::string take_unconsumed_locked();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string data_;
    size_t cursor_ = 0;
    bool closed_ = false;
};

} // namespace ch

#endif // CHECK_HARNESS_OUTPUT_BUFFER_HPP
