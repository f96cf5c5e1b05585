#include "source/common/network/utility.h"

namespace Relay {
namespace Network {

absl::string_view Utility::connectionEventToString(ConnectionEvent event) {
  switch (event) {
  case ConnectionEvent::RemoteClose:
    return "RemoteClose";
  case ConnectionEvent::LocalClose:
    return "LocalClose";
  case ConnectionEvent::Connected:
    return "Connected";
  case ConnectionEvent::ConnectTimeout:
    return "ConnectTimeout";
  case ConnectionEvent::ConnectFailed:
    return "ConnectFailed";
  }

  return "";
}

} // namespace Network
} // namespace Relay
