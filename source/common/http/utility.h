#pragma once

#include <string>

#include "relay/http/codec.h"
#include "relay/http/protocol.h"

namespace Relay {
namespace Http {
namespace Utility {

/**
 * Get the protocol string of a protocol, e.g. "HTTP/2".
 */
const std::string& getProtocolString(const Protocol p);

/**
 * Convert a stream reset reason to a human readable string.
 */
const std::string resetReasonToString(const StreamResetReason reset_reason);

/**
 * Convert a goaway error code to a human readable string.
 */
absl::string_view goAwayErrorCodeToString(const GoAwayErrorCode error_code);

} // namespace Utility
} // namespace Http
} // namespace Relay
