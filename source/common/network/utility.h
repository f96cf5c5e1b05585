#pragma once

#include "relay/network/connection.h"

#include "absl/strings/string_view.h"

namespace Relay {
namespace Network {

/**
 * Common network utility routines.
 */
class Utility {
public:
  /**
   * @return a printable name for a connection event.
   */
  static absl::string_view connectionEventToString(ConnectionEvent event);
};

} // namespace Network
} // namespace Relay
