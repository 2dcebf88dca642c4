#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace chatsan::core {

// Deterministic, locale-independent string helpers. Non-ASCII bytes are never
// reinterpreted; UTF-8 sequences pass through untouched.

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

inline std::string trim(const std::string_view input) {
  std::size_t begin = 0;
  std::size_t end = input.size();
  while (begin < end && is_ascii_space(input[begin])) {
    ++begin;
  }
  while (end > begin && is_ascii_space(input[end - 1])) {
    --end;
  }
  return std::string(input.substr(begin, end - begin));
}

inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }
  return result;
}

inline std::string join(const std::vector<std::string>& parts, const std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

// utf8_prefix returns at most max_code_points code points of a valid UTF-8 string.
// Never splits a multi-byte sequence.
inline std::string utf8_prefix(const std::string_view input, const std::size_t max_code_points) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < input.size()) {
    if (count == max_code_points) {
      break;
    }
    ++pos;
    // Skip continuation bytes (10xxxxxx).
    while (pos < input.size() && (static_cast<unsigned char>(input[pos]) & 0xC0u) == 0x80u) {
      ++pos;
    }
    ++count;
  }
  return std::string(input.substr(0, pos));
}

inline std::size_t utf8_length(const std::string_view input) {
  std::size_t count = 0;
  for (const char ch : input) {
    if ((static_cast<unsigned char>(ch) & 0xC0u) != 0x80u) {
      ++count;
    }
  }
  return count;
}

// clean_filename makes a chat name safe for use as a file name component.
// - ASCII letters, digits and '_' are kept; non-ASCII bytes are kept as-is
// - runs of spaces and '-' collapse to a single '_'
// - everything else is dropped
// - leading/trailing '_' are trimmed; an empty result becomes "chat"
inline std::string clean_filename(const std::string_view name) {
  std::string out;
  out.reserve(name.size());
  bool pending_separator = false;
  for (const char ch : name) {
    const auto byte = static_cast<unsigned char>(ch);
    const bool keep = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                      (ch >= '0' && ch <= '9') || ch == '_' || byte >= 0x80u;
    if (ch == ' ' || ch == '-' || ch == '\t') {
      pending_separator = true;
      continue;
    }
    if (!keep) {
      continue;
    }
    if (pending_separator && !out.empty()) {
      out.push_back('_');
    }
    pending_separator = false;
    out.push_back(ch);
  }

  std::size_t begin = 0;
  std::size_t end = out.size();
  while (begin < end && out[begin] == '_') {
    ++begin;
  }
  while (end > begin && out[end - 1] == '_') {
    --end;
  }
  out = out.substr(begin, end - begin);
  return out.empty() ? std::string("chat") : out;
}

}  // namespace chatsan::core
