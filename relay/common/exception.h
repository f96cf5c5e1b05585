#pragma once

#include <stdexcept>
#include <string>

#include "absl/status/status.h"

namespace Relay {

/**
 * Base class for all relay exceptions.
 */
class RelayException : public std::runtime_error {
public:
  RelayException(const std::string& message) : std::runtime_error(message) {}
};

#define throwRelayExceptionOrPanic(x) throw ::Relay::RelayException(x)

#define THROW_IF_NOT_OK_REF(status)                                                                \
  do {                                                                                             \
    if (!(status).ok()) {                                                                          \
      throwRelayExceptionOrPanic(std::string((status).message()));                                 \
    }                                                                                              \
  } while (0)

// Simple macro to handle bridging functions which return absl::StatusOr, and
// functions which throw errors.
#define THROW_IF_NOT_OK(status_fn)                                                                 \
  do {                                                                                             \
    const absl::Status status = (status_fn);                                                       \
    THROW_IF_NOT_OK_REF(status);                                                                   \
  } while (0)

} // namespace Relay
