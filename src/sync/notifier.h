/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <common/typedefs.h>

// std
#include <string_view>

namespace dapsync::sync {

enum class Severity : u8
{
  Info,
  Warning,
  Error
};

// Where user-visible messages go. The DAP proxy turns them into `output` events.
class UserNotifier
{
public:
  virtual ~UserNotifier() noexcept = default;
  virtual void Notify(Severity severity, std::string_view message) noexcept = 0;
};

} // namespace dapsync::sync
