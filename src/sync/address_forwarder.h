/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <sync/viewer_transport.h>

// std
#include <functional>
#include <string_view>

namespace dapsync::sync {

// One forward attempt per call. No retries in here; that is RetryScheduler's job.
class AddressForwarder
{
  ViewerTransport &mTransport;
  ViewerEndpoint mEndpoint;

public:
  AddressForwarder(ViewerTransport &transport, ViewerEndpoint endpoint) noexcept;

  void SetEndpoint(ViewerEndpoint endpoint) noexcept;
  const ViewerEndpoint &Endpoint() const noexcept;

  // Strips annotations from `address` and sends it. `onResult(true)` iff the viewer answered with a 2xx status.
  // Connection failures, non-2xx responses and malformed responses are all `false`.
  void Forward(std::string_view address, std::function<void(bool)> onResult) noexcept;

  static bool IsSuccess(const TransportResult &result) noexcept;
};

} // namespace dapsync::sync
