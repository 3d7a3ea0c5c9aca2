/** LICENSE TEMPLATE */
#include "address.h"

namespace dapsync::sync {

static constexpr bool
IsHexDigit(char c) noexcept
{
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

std::string_view
CanonicalAddress(std::string_view address) noexcept
{
  if (address.size() < 3 || address[0] != '0' || (address[1] != 'x' && address[1] != 'X') ||
      !IsHexDigit(address[2])) {
    return address;
  }

  auto end = 3u;
  while (end < address.size() && IsHexDigit(address[end])) {
    ++end;
  }
  return address.substr(0, end);
}

} // namespace dapsync::sync
