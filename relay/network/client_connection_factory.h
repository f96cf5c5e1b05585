#pragma once

#include "relay/common/pure.h"
#include "relay/network/connection.h"

#include "absl/strings/string_view.h"

namespace Relay {
namespace Network {

// The factory to create a client connection. This factory hides the details of the transport
// (plain TCP or TLS) used to reach the remote address.
class ClientConnectionFactory {
public:
  virtual ~ClientConnectionFactory() = default;

  /**
   * @param address The target remote address in "host:port" form.
   * @return Network::ClientConnectionPtr The created connection, not connected yet, or nullptr
   * if no transport to the address is available.
   */
  virtual ClientConnectionPtr createClientConnection(absl::string_view address) PURE;
};

} // namespace Network
} // namespace Relay
