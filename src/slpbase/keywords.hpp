#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace slp::util {

// ascii only; option values and environment settings never carry other letters
inline std::string lower_ascii(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    out.push_back(ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch - 'A' + 'a') : ch);
  }
  return out;
}

inline std::string_view trim_space(std::string_view value) {
  constexpr std::string_view blanks = " \t\r\n";
  const size_t first = value.find_first_not_of(blanks);
  if (first == std::string_view::npos) {
    return {};
  }
  return value.substr(first, value.find_last_not_of(blanks) - first + 1);
}

// case-insensitive lookup of a trimmed keyword; the first matching spelling wins
template <typename value_type>
std::optional<value_type> match_keyword(
    std::string_view text, std::initializer_list<std::pair<std::string_view, value_type>> keywords
) {
  const std::string key = lower_ascii(trim_space(text));
  for (const auto& [spelling, value] : keywords) {
    if (key == spelling) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace slp::util
