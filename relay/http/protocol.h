#pragma once

#include <cstddef>
#include <cstdint>

namespace Relay {
namespace Http {

/**
 * Possible HTTP connection/request protocols.
 */
enum class Protocol : uint8_t { Http10, Http11, Http2, Http3 };
const size_t NumProtocols = 4;

} // namespace Http
} // namespace Relay
