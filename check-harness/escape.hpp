#ifndef CHECK_HARNESS_ESCAPE_HPP
#define CHECK_HARNESS_ESCAPE_HPP

#include <iostream> // For std::ostream
#include <string>
#include <utility>

namespace ch {

// Writes one byte the way it would appear in a C string literal:
// printable bytes as-is, common control characters as \n \r \t,
// backslash doubled, anything else as \xHH.
void print_escaped_byte(unsigned char c, std::ostream& out);

// Renders arbitrary program output for log lines and failure messages.
std::string raw(const std::string& text);

// Decodes \n \r \t \\ and \xHH. Returns pair<ok, decoded>; ok=false on a
// dangling backslash, a malformed \x sequence, or an unknown escape unless
// keep_unknown is set, in which case it is copied through as written (regex
// arguments keep \d, \. and friends).
std::pair<bool, std::string> unescape(const std::string& text, bool keep_unknown = false);

} // namespace ch

#endif // CHECK_HARNESS_ESCAPE_HPP
