/** LICENSE TEMPLATE */
#include "address_forwarder.h"

// dapsync
#include <sync/address.h>
#include <utils/logger.h>

namespace dapsync::sync {

AddressForwarder::AddressForwarder(ViewerTransport &transport, ViewerEndpoint endpoint) noexcept
    : mTransport(transport), mEndpoint(std::move(endpoint))
{
}

void
AddressForwarder::SetEndpoint(ViewerEndpoint endpoint) noexcept
{
  mEndpoint = std::move(endpoint);
}

const ViewerEndpoint &
AddressForwarder::Endpoint() const noexcept
{
  return mEndpoint;
}

/* static */
bool
AddressForwarder::IsSuccess(const TransportResult &result) noexcept
{
  return result.has_value() && *result >= 200 && *result < 300;
}

void
AddressForwarder::Forward(std::string_view address, std::function<void(bool)> onResult) noexcept
{
  std::string canonical{ CanonicalAddress(address) };
  DBGLOG(transport, "forwarding {} to {}:{}", canonical, mEndpoint.mHost, mEndpoint.mPort);
  mTransport.PostGoto(
    mEndpoint, canonical, [canonical, onResult = std::move(onResult)](TransportResult result) {
      if (result) {
        DBGLOG(transport, "goto {} answered with status {}", canonical, *result);
      } else {
        DBGLOG(transport, "goto {} failed: {} (errno {})", canonical, result.error().mMessage,
          result.error().mErrno);
      }
      onResult(IsSuccess(result));
    });
}

} // namespace dapsync::sync
