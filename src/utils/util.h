/** LICENSE TEMPLATE */
#pragma once
#include <common/typedefs.h>

// stdlib
#include <algorithm>
#include <charconv>
#include <concepts>
#include <string>
#include <string_view>
#include <vector>

namespace dapsync {

constexpr bool
IsAsciiSpace(char ch) noexcept
{
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

constexpr std::string_view
Trim(std::string_view str) noexcept
{
  while (!str.empty() && IsAsciiSpace(str.front())) {
    str.remove_prefix(1);
  }
  while (!str.empty() && IsAsciiSpace(str.back())) {
    str.remove_suffix(1);
  }
  return str;
}

// Split `str` on `delimiter`. Pieces are trimmed and empty pieces are dropped, so "pc, ,rip" yields {pc, rip}.
inline std::vector<std::string>
SplitTrimmed(std::string_view str, char delimiter) noexcept
{
  std::vector<std::string> result;
  while (!str.empty()) {
    const auto pos = str.find(delimiter);
    const auto piece = Trim(str.substr(0, pos));
    if (!piece.empty()) {
      result.emplace_back(piece);
    }
    if (pos == std::string_view::npos) {
      break;
    }
    str.remove_prefix(pos + 1);
  }
  return result;
}

template <std::integral Value>
constexpr Option<Value>
ToIntegral(std::string_view s, int base = 10) noexcept
{
  Value value{};
  const auto res = std::from_chars(s.data(), s.data() + s.size(), value, base);
  if (res.ec == std::errc{} && res.ptr == s.data() + s.size()) {
    return value;
  }
  return std::nullopt;
}

} // namespace dapsync
