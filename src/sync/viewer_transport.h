/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <common/typedefs.h>

// std
#include <expected>
#include <functional>
#include <string>

namespace dapsync::sync {

struct ViewerEndpoint
{
  std::string mHost;
  u16 mPort;

  bool operator==(const ViewerEndpoint &) const = default;
};

struct TransportError
{
  enum class Kind : u8
  {
    Connect,
    Send,
    Receive,
    MalformedResponse
  };

  Kind mKind;
  std::string mMessage;
  int mErrno{ 0 };
};

// The HTTP status code of the viewer's response, or why there is none.
using TransportResult = std::expected<u16, TransportError>;

class ViewerTransport
{
public:
  virtual ~ViewerTransport() noexcept = default;
  // Send one goto request for `address`. `onComplete` is called exactly once, never from inside this call, and
  // always on the control thread.
  virtual void PostGoto(const ViewerEndpoint &endpoint, std::string address,
                        std::function<void(TransportResult)> onComplete) noexcept = 0;
};

} // namespace dapsync::sync
