#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace StringUtils {

inline bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string Trim(std::string_view s) {
  size_t start = 0;
  while (start < s.size() && IsSpace(s[start]))
    ++start;
  size_t end = s.size();
  while (end > start && IsSpace(s[end - 1]))
    --end;
  return std::string(s.substr(start, end - start));
}

// ASCII upper-casing; bytes of multi-byte UTF-8 sequences are left alone.
inline std::string ToUpperCopy(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

// Number of code points in a UTF-8 string. Continuation bytes are not
// counted, so malformed input still yields a usable length.
inline size_t Utf8Length(std::string_view s) {
  size_t count = 0;
  for (unsigned char c : s)
    if ((c & 0xC0) != 0x80)
      ++count;
  return count;
}

// Byte offset of the code point with the given index, or s.size() when the
// index is past the end.
inline size_t Utf8Offset(std::string_view s, size_t codePoint) {
  size_t seen = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80)
      continue;
    if (seen == codePoint)
      return i;
    ++seen;
  }
  return s.size();
}

// Code point based substring, mirroring std::string::substr.
inline std::string Utf8Substr(std::string_view s, size_t first,
                              size_t count = std::string::npos) {
  const size_t begin = Utf8Offset(s, first);
  if (count == std::string::npos)
    return std::string(s.substr(begin));
  const size_t end = Utf8Offset(s, first + count);
  return std::string(s.substr(begin, end - begin));
}

} // namespace StringUtils
