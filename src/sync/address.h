/** LICENSE TEMPLATE */
#pragma once

// std
#include <string_view>

namespace dapsync::sync {

// Returns the leading `0x<hex digits>` of `address`, dropping any annotation that follows it, e.g.
// "0x401020 <main+16>" -> "0x401020". An uppercase "0X" prefix is accepted too and kept as written. Input without
// such a prefix is returned unchanged.
std::string_view CanonicalAddress(std::string_view address) noexcept;

} // namespace dapsync::sync
