#include "escape.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace ch {

void print_escaped_byte(unsigned char c, std::ostream& out) {
  if (c == '\\') {
    out << "\\\\";
  } else if (c == '\n') {
    out << "\\n";
  } else if (c == '\r') {
    out << "\\r";
  } else if (c == '\t') {
    out << "\\t";
  } else if (isprint(c)) {
    out << c;
  } else {
    out << "\\x" << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(c) << std::dec;
  }
}

std::string raw(const std::string& text) {
  std::ostringstream oss;
  for (char c : text) {
    print_escaped_byte(static_cast<unsigned char>(c), oss);
  }
  return oss.str();
}

std::pair<bool, std::string> unescape(const std::string& text, bool keep_unknown) {
  auto hex_value = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };

  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '\\') {
      out.push_back(text[i]);
      continue;
    }
    if (i + 1 >= text.size()) {
      return {false, {}};
    }
    char e = text[++i];
    switch (e) {
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case '\\': out.push_back('\\'); break;
      case 'x': {
        if (i + 2 >= text.size()) {
          return {false, {}};
        }
        int hi = hex_value(text[i + 1]);
        int lo = hex_value(text[i + 2]);
        if (hi < 0 || lo < 0) {
          return {false, {}};
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        break;
      }
      default:
        if (!keep_unknown) {
          return {false, {}};
        }
        out.push_back('\\');
        out.push_back(e);
        break;
    }
  }
  return {true, out};
}

} // namespace ch
