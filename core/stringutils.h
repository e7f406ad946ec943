#pragma once

#include <cctype>
#include <charconv>
#include <cmath>
#include <string>
#include <string_view>

namespace StringUtils {

inline std::string_view Trim(std::string_view s) {
  auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!s.empty() && isSpace(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && isSpace(s.back()))
    s.remove_suffix(1);
  return s;
}

// Parses a plain finite decimal number. Surrounding whitespace is accepted,
// any other trailing characters (units such as "px") make the parse fail, and
// so do "nan" and "inf".
inline bool TryParseDouble(std::string_view text, double &out) {
  std::string_view trimmed = Trim(text);
  if (trimmed.empty())
    return false;
  const char *begin = trimmed.data();
  const char *end = trimmed.data() + trimmed.size();
  if (*begin == '+' && end - begin > 1)
    ++begin;
  double value = 0.0;
  auto result = std::from_chars(begin, end, value);
  if (result.ec != std::errc{} || result.ptr != end || !std::isfinite(value))
    return false;
  out = value;
  return true;
}

inline bool TryParseFloat(std::string_view text, float &out) {
  double value = 0.0;
  if (!TryParseDouble(text, value))
    return false;
  out = static_cast<float>(value);
  return true;
}

inline std::string ReplaceAll(std::string text, std::string_view from,
                              std::string_view to) {
  if (from.empty())
    return text;
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

} // namespace StringUtils
