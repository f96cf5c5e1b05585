#pragma once

namespace Relay {
/**
 * Friendly name for a pure virtual routine.
 */
#define PURE = 0
} // namespace Relay
