#pragma once

#include <memory>

#include "relay/common/pure.h"

namespace Relay {
namespace Network {

using os_fd_t = int;

/**
 * IoHandle: an abstract interface for the raw byte transport underneath a connection. The
 * multiplexer builds its framing layer directly on top of it.
 */
class IoHandle {
public:
  virtual ~IoHandle() = default;

  /**
   * NOTE: Must NOT be used for new use cases!
   *
   * This is most likely not the function you are looking for. IoHandle is an abstraction over
   * the descriptor and callers should not reach through it.
   */
  virtual os_fd_t fdDoNotUse() const PURE;

  /**
   * @return bool whether the handle is still open.
   */
  virtual bool isOpen() const PURE;
};

using IoHandlePtr = std::unique_ptr<IoHandle>;

} // namespace Network
} // namespace Relay
